/*******************************************************************************
 * Copyright (c) 2024  xiedeacc.com.
 * All rights reserved.
 *******************************************************************************/

#include "src/impl/comparator.h"

#include <cstring>

#include "fmt/core.h"
#include "glog/logging.h"
#include "src/util/util.h"

namespace bytecmp {
namespace impl {

using common::ByteEvent;

Comparator::Comparator(const std::string& first_name,
                       const std::string& second_name,
                       const common::ReportMode mode, std::ostream* out)
    : names_{first_name, second_name}, mode_(mode), out_(out) {}

void Comparator::Advance(uint8_t first_value) {
  ++cursor_.char_number;
  if (first_value == '\n') {
    ++cursor_.line_number;
  }
}

StepOutcome Comparator::Step(const ByteEvent& first, const ByteEvent& second) {
  // read errors are fatal in every mode, quiet included
  if (first.type == common::Event_ERROR || second.type == common::Event_ERROR) {
    const auto& name = first.type == common::Event_ERROR ? names_[0] : names_[1];
    const auto err = first.type == common::Event_ERROR ? first.err : second.err;
    LOG(ERROR) << "read error on " << name << ": " << std::strerror(err);
    return Step_ERROR;
  }

  if (first.type == common::Event_END && second.type == common::Event_END) {
    return cursor_.diff_count > 0 ? Step_DIFFER : Step_EQUAL;
  }

  if (first.type == common::Event_BYTE && second.type == common::Event_BYTE &&
      first.value == second.value) {
    Advance(first.value);
    return Step_CONTINUE;
  }

  ++cursor_.diff_count;
  return OnDifference(first, second);
}

StepOutcome Comparator::OnDifference(const ByteEvent& first,
                                     const ByteEvent& second) {
  switch (mode_) {
    case common::Report_QUIET:
      return Step_DIFFER;

    case common::Report_LINE:
      *out_ << fmt::format("{} {} differ: char {} line {}\n", names_[0],
                           names_[1], cursor_.char_number,
                           cursor_.line_number);
      return Step_DIFFER;

    case common::Report_LONG:
      if (first.type == common::Event_END) {
        *out_ << "EOF on " << names_[0] << "\n";
        return Step_DIFFER;
      }
      if (second.type == common::Event_END) {
        *out_ << "EOF on " << names_[1] << "\n";
        return Step_DIFFER;
      }
      *out_ << fmt::format("{:8d} {} {}\n", cursor_.char_number,
                           util::Util::ToOctStr(first.value),
                           util::Util::ToOctStr(second.value));
      Advance(first.value);
      return Step_CONTINUE;

    default:
      *out_ << fmt::format("{} {} differ: char {}\n", names_[0], names_[1],
                           cursor_.char_number);
      return Step_DIFFER;
  }
}

common::CompareResult Comparator::Run(common::ByteChannel* first,
                                      common::ByteChannel* second) {
  ByteEvent a;
  ByteEvent b;
  while (true) {
    // a channel closed without a terminal event counts as drained
    if (!first->WaitPopFront(&a)) {
      a = ByteEvent::End();
    }
    if (!second->WaitPopFront(&b)) {
      b = ByteEvent::End();
    }

    switch (Step(a, b)) {
      case Step_CONTINUE:
        continue;
      case Step_EQUAL:
        return common::Result_EQUAL;
      case Step_DIFFER:
        out_->flush();
        return common::Result_DIFFER;
      default:
        out_->flush();
        return common::Result_ERROR;
    }
  }
}

}  // namespace impl
}  // namespace bytecmp

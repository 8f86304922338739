/*******************************************************************************
 * Copyright (c) 2024  xiedeacc.com.
 * All rights reserved.
 *******************************************************************************/

#ifndef BYTECMP_IMPL_COMPARATOR_H
#define BYTECMP_IMPL_COMPARATOR_H

#include <cstdint>
#include <ostream>
#include <string>

#include "src/common/defs.h"

namespace bytecmp {
namespace impl {

struct Cursor final {
  int64_t char_number = 1;
  int64_t line_number = 1;  // counts newlines of the first source only
  int64_t diff_count = 0;
};

enum StepOutcome {
  Step_CONTINUE = 0,
  Step_EQUAL,
  Step_DIFFER,
  Step_ERROR,
};

// Walks two byte channels in lockstep. Step() decides one pair, Run() pulls
// pairs until Step() reaches a terminal outcome.
class Comparator final {
 public:
  Comparator(const std::string& first_name, const std::string& second_name,
             const common::ReportMode mode, std::ostream* out);

  StepOutcome Step(const common::ByteEvent& first,
                   const common::ByteEvent& second);

  common::CompareResult Run(common::ByteChannel* first,
                            common::ByteChannel* second);

  const Cursor& GetCursor() const { return cursor_; }

 private:
  StepOutcome OnDifference(const common::ByteEvent& first,
                           const common::ByteEvent& second);
  void Advance(uint8_t first_value);

  const std::string names_[2];
  const common::ReportMode mode_;
  std::ostream* out_;
  Cursor cursor_;
};

}  // namespace impl
}  // namespace bytecmp

#endif  // BYTECMP_IMPL_COMPARATOR_H

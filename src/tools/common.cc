/*******************************************************************************
 * Copyright (c) 2024  xiedeacc.com.
 * All rights reserved.
 *******************************************************************************/

#include "src/tools/common.h"

#include "glog/logging.h"
#include "src/util/util.h"

namespace bytecmp {
namespace tools {

common::ReportMode Common::ResolveReportMode(const bool silent,
                                             const bool line,
                                             const bool long_format) {
  if (silent) {
    return common::Report_QUIET;
  }
  if (line) {
    return common::Report_LINE;
  }
  if (long_format) {
    return common::Report_LONG;
  }
  return common::Report_DEFAULT;
}

int32_t Common::ParseArgs(const std::vector<std::string> &args,
                          const common::ReportMode mode,
                          common::CompareOptions *options) {
  if (args.size() < 2 || args.size() > 4) {
    LOG(ERROR) << "expected two filenames (and one to two optional offsets), "
                  "got "
               << args.size();
    return Err_Usage_arg_count;
  }

  options->names[0] = args[0];
  options->names[1] = args[1];
  options->offsets[0] = 0;
  options->offsets[1] = 0;
  options->mode = mode;

  for (size_t i = 2; i < args.size(); ++i) {
    if (!util::Util::ParseOffset(args[i], &options->offsets[i - 2])) {
      LOG(ERROR) << "bad offset" << i - 1 << ": " << args[i];
      return Err_Usage_bad_offset;
    }
  }
  return Err_Success;
}

}  // namespace tools
}  // namespace bytecmp

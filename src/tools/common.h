/*******************************************************************************
 * Copyright (c) 2024  xiedeacc.com.
 * All rights reserved.
 *******************************************************************************/

#ifndef BYTECMP_TOOLS_COMMON_H
#define BYTECMP_TOOLS_COMMON_H

#include <string>
#include <vector>

#include "src/common/defs.h"

namespace bytecmp {
namespace tools {

class Common {
 public:
  // priority: quiet, line, long, default
  static common::ReportMode ResolveReportMode(const bool silent,
                                              const bool line,
                                              const bool long_format);

  // args are the positional tokens: source1 source2 [offset1 [offset2]]
  static int32_t ParseArgs(const std::vector<std::string> &args,
                           const common::ReportMode mode,
                           common::CompareOptions *options);
};

}  // namespace tools
}  // namespace bytecmp

#endif  // BYTECMP_TOOLS_COMMON_H

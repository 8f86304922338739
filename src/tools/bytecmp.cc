/*******************************************************************************
 * Copyright (c) 2024  xiedeacc.com.
 * All rights reserved.
 *******************************************************************************/

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "folly/init/Init.h"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "src/impl/compare_manager.h"
#include "src/tools/common.h"
#include "src/util/config_manager.h"
#include "src/util/thread_pool.h"

DEFINE_bool(l, false,
            "print the byte number (decimal) and the differing bytes (octal) "
            "for each difference");
DEFINE_bool(L, false, "print the line number of the first differing byte");
DEFINE_bool(s, false,
            "print nothing for differing files, but set the exit status");
DEFINE_string(config, "", "optional json config file");

namespace {

// reader tasks blocked on an interactive source are abandoned, not joined
[[noreturn]] void Exit(int code) {
  google::FlushLogFiles(google::GLOG_INFO);
  std::cerr.flush();
  std::_Exit(code);
}

}  // namespace

int main(int argc, char **argv) {
  gflags::SetUsageMessage(
      "bytecmp [-l | -L | -s] file1 file2 [offset1 [offset2]]\n"
      "  offsets that begin with 0x are hexadecimal, with 0 octal, otherwise "
      "decimal; file - means standard input");
  FLAGS_logtostderr = true;
  FLAGS_minloglevel = google::GLOG_ERROR;

  folly::Init init(&argc, &argv, true);
  LOG(INFO) << "CommandLine: " << gflags::GetArgv();

  std::vector<std::string> args(argv + 1, argv + argc);
  const auto mode =
      bytecmp::tools::Common::ResolveReportMode(FLAGS_s, FLAGS_L, FLAGS_l);

  bytecmp::common::CompareOptions options;
  if (bytecmp::tools::Common::ParseArgs(args, mode, &options) != Err_Success) {
    Exit(bytecmp::common::EXIT_TROUBLE);
  }

  if (!bytecmp::util::ConfigManager::Instance()->Init(FLAGS_config)) {
    Exit(bytecmp::common::EXIT_TROUBLE);
  }
  bytecmp::util::ThreadPool::Instance()->Init();

  bytecmp::impl::CompareManager manager(options, &std::cerr);
  if (manager.Init() != Err_Success) {
    Exit(bytecmp::common::EXIT_TROUBLE);
  }

  Exit(bytecmp::common::ToExitCode(manager.Run()));
}

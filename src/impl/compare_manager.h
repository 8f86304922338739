/*******************************************************************************
 * Copyright (c) 2024  xiedeacc.com.
 * All rights reserved.
 *******************************************************************************/

#ifndef BYTECMP_IMPL_COMPARE_MANAGER_H
#define BYTECMP_IMPL_COMPARE_MANAGER_H

#include <future>
#include <memory>
#include <ostream>
#include <vector>

#include "src/common/defs.h"
#include "src/impl/comparator.h"
#include "src/impl/stream_reader.h"

namespace bytecmp {
namespace impl {

// Owns one comparison run: opens both sources, posts a StreamReader per
// source onto the ThreadPool and drives the Comparator on the calling thread.
class CompareManager final {
 public:
  CompareManager(const common::CompareOptions& options, std::ostream* out);
  ~CompareManager() { Stop(); }

  int32_t Init();

  common::CompareResult Run();

  // closes both channels and waits for the readers to return
  void Stop();

  std::vector<int32_t> ReaderResults();

 private:
  const common::CompareOptions options_;
  std::unique_ptr<StreamReader> readers_[2];
  std::vector<std::future<int32_t>> futures_;
  std::vector<int32_t> reader_results_;
  Comparator comparator_;
};

}  // namespace impl
}  // namespace bytecmp

#endif  // BYTECMP_IMPL_COMPARE_MANAGER_H

/*******************************************************************************
 * Copyright (c) 2024  xiedeacc.com.
 * All rights reserved.
 *******************************************************************************/

#include "src/impl/compare_manager.h"

#include <functional>

#include "glog/logging.h"
#include "src/util/config_manager.h"
#include "src/util/thread_pool.h"

namespace bytecmp {
namespace impl {

CompareManager::CompareManager(const common::CompareOptions& options,
                               std::ostream* out)
    : options_(options),
      comparator_(options.names[0], options.names[1], options.mode, out) {}

int32_t CompareManager::Init() {
  auto config = util::ConfigManager::Instance();
  for (int i = 0; i < 2; ++i) {
    readers_[i] = std::make_unique<StreamReader>(
        options_.names[i], options_.offsets[i], config->ChannelCapacity(),
        config->ReadBufferSize());
    auto ret = readers_[i]->Open();
    if (ret != Err_Success) {
      readers_[i].reset();
      return ret;
    }
  }
  LOG(INFO) << "compare " << options_.ToString();
  return Err_Success;
}

common::CompareResult CompareManager::Run() {
  if (!readers_[0] || !readers_[1]) {
    LOG(ERROR) << "sources not opened";
    return common::Result_ERROR;
  }

  auto pool = util::ThreadPool::Instance();
  if (!pool->Running()) {
    pool->Init();
  }

  for (int i = 0; i < 2; ++i) {
    std::packaged_task<int32_t()> task(
        std::bind(&StreamReader::Run, readers_[i].get()));
    futures_.emplace_back(task.get_future());
    pool->Post(task);
  }

  auto result =
      comparator_.Run(readers_[0]->Channel(), readers_[1]->Channel());
  const auto& cursor = comparator_.GetCursor();
  LOG(INFO) << "compare finished, result: " << result
            << ", char: " << cursor.char_number
            << ", line: " << cursor.line_number
            << ", differences: " << cursor.diff_count;

  // readers may still be blocked on a full channel
  for (auto& reader : readers_) {
    reader->Cancel();
  }
  return result;
}

void CompareManager::Stop() {
  for (auto& reader : readers_) {
    if (reader) {
      reader->Cancel();
    }
  }
  for (auto& f : futures_) {
    reader_results_.emplace_back(f.get());
  }
  futures_.clear();
}

std::vector<int32_t> CompareManager::ReaderResults() {
  Stop();
  return reader_results_;
}

}  // namespace impl
}  // namespace bytecmp

/*******************************************************************************
 * Copyright (c) 2024  xiedeacc.com.
 * All rights reserved.
 *******************************************************************************/

#ifndef BYTECMP_UTIL_THREAD_POOL_H
#define BYTECMP_UTIL_THREAD_POOL_H

#include <atomic>
#include <future>
#include <memory>
#include <utility>

#include "boost/asio/post.hpp"
#include "boost/asio/thread_pool.hpp"
#include "folly/Singleton.h"

namespace bytecmp {
namespace util {

class ThreadPool final {
 private:
  friend class folly::Singleton<ThreadPool>;
  ThreadPool() : terminated(true) {}

 public:
  static std::shared_ptr<ThreadPool> Instance();

  ~ThreadPool() { Stop(); }

  // thread count comes from ConfigManager
  bool Init();

  bool Running() { return pool_ && !terminated.load(); }

  // waits for every posted task, a task blocked reading an interactive
  // source keeps the caller waiting
  void Stop();

  void Post(std::packaged_task<int32_t()>& task) {  // NOLINT
    boost::asio::post(*pool_.get(), std::move(task));
  }

 private:
  std::shared_ptr<boost::asio::thread_pool> pool_;
  std::atomic_bool terminated;
};

}  // namespace util
}  // namespace bytecmp

#endif  // BYTECMP_UTIL_THREAD_POOL_H

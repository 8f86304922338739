/*******************************************************************************
 * Copyright (c) 2024  xiedeacc.com.
 * All rights reserved.
 *******************************************************************************/

#include "src/util/thread_pool.h"

#include "glog/logging.h"
#include "src/util/config_manager.h"

namespace bytecmp {
namespace util {

static folly::Singleton<ThreadPool> thread_pool;

std::shared_ptr<ThreadPool> ThreadPool::Instance() {
  return thread_pool.try_get();
}

bool ThreadPool::Init() {
  if (Running()) {
    LOG(INFO) << "thread pool already running";
    return true;
  }
  auto thread_num = ConfigManager::Instance()->ReaderThreads();
  LOG(INFO) << "thread pool size: " << thread_num;
  pool_ = std::make_shared<boost::asio::thread_pool>(thread_num);
  terminated.store(false);
  return true;
}

void ThreadPool::Stop() {
  if (pool_ && !terminated.load()) {
    pool_->join();
    terminated.store(true);
  }
}

}  // namespace util
}  // namespace bytecmp

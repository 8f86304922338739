/*******************************************************************************
 * Copyright (c) 2024  xiedeacc.com.
 * All rights reserved.
 *******************************************************************************/

#include "src/util/config_manager.h"

#include <algorithm>

#include "glog/logging.h"

namespace bytecmp {
namespace util {

static folly::Singleton<ConfigManager> config_manager;

std::shared_ptr<ConfigManager> ConfigManager::Instance() {
  return config_manager.try_get();
}

bool ConfigManager::Init(const std::string& base_config_path) {
  base_config_.Clear();
  if (base_config_path.empty()) {
    LOG(INFO) << "no config file, use defaults";
    return true;
  }

  std::string content;
  if (!Util::LoadSmallFile(base_config_path, &content)) {
    LOG(ERROR) << "load config error, path: " << base_config_path;
    return false;
  }

  if (!Util::JsonToMessage(content, &base_config_)) {
    LOG(ERROR) << "parse base config error, path: " << base_config_path
               << ", content: " << content;
    base_config_.Clear();
    return false;
  }
  LOG(INFO) << "base config: " << ToString();
  return true;
}

uint32_t ConfigManager::ChannelCapacity() {
  if (base_config_.channel_capacity() == 0) {
    return common::CHANNEL_CAPACITY;
  }
  return base_config_.channel_capacity();
}

uint32_t ConfigManager::ReadBufferSize() {
  if (base_config_.read_buffer_size() == 0) {
    return common::READ_BUFFER_SIZE_BYTES;
  }
  return base_config_.read_buffer_size();
}

// both readers must run at once, otherwise one blocked on a full channel
// starves the other and the comparator never gets its pair
uint32_t ConfigManager::ReaderThreads() {
  return std::max<uint32_t>(base_config_.reader_threads(),
                            common::MIN_READER_THREADS);
}

std::string ConfigManager::ToString() {
  std::string json;
  Util::MessageToJson(base_config_, &json);
  return json;
}

}  // namespace util
}  // namespace bytecmp

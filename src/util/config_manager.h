/*******************************************************************************
 * Copyright (c) 2024  xiedeacc.com.
 * All rights reserved.
 *******************************************************************************/

#ifndef BYTECMP_UTIL_CONFIG_MANAGER_H
#define BYTECMP_UTIL_CONFIG_MANAGER_H

#include <memory>
#include <string>

#include "folly/Singleton.h"
#include "src/proto/config.pb.h"
#include "src/util/util.h"

namespace bytecmp {
namespace util {

class ConfigManager {
 private:
  friend class folly::Singleton<ConfigManager>;
  ConfigManager() = default;

 public:
  static std::shared_ptr<ConfigManager> Instance();

  // empty path keeps the built-in defaults
  bool Init(const std::string& base_config_path);

  uint32_t ChannelCapacity();
  uint32_t ReadBufferSize();
  uint32_t ReaderThreads();

  std::string ToString();

 private:
  bytecmp::proto::BaseConfig base_config_;
};

}  // namespace util
}  // namespace bytecmp

#endif  // BYTECMP_UTIL_CONFIG_MANAGER_H

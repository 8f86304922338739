/*******************************************************************************
 * Copyright (c) 2024  xiedeacc.com.
 * All rights reserved.
 *******************************************************************************/

#include "src/util/config_manager.h"

#include "glog/logging.h"
#include "gtest/gtest.h"
#include "src/test/test_util.h"

namespace bytecmp {
namespace util {

TEST(ConfigManager, Defaults) {
  EXPECT_TRUE(ConfigManager::Instance()->Init(""));
  EXPECT_EQ(ConfigManager::Instance()->ChannelCapacity(),
            common::CHANNEL_CAPACITY);
  EXPECT_EQ(ConfigManager::Instance()->ReadBufferSize(),
            common::READ_BUFFER_SIZE_BYTES);
  EXPECT_EQ(ConfigManager::Instance()->ReaderThreads(),
            static_cast<uint32_t>(common::MIN_READER_THREADS));
}

TEST(ConfigManager, Init) {
  auto path = test::Util::CreateFile(
      "base_config.json",
      R"({"channel_capacity": 16, "read_buffer_size": 3, "reader_threads": 4})");
  EXPECT_TRUE(ConfigManager::Instance()->Init(path));
  LOG(INFO) << ConfigManager::Instance()->ToString();
  EXPECT_EQ(ConfigManager::Instance()->ChannelCapacity(), 16u);
  EXPECT_EQ(ConfigManager::Instance()->ReadBufferSize(), 3u);
  EXPECT_EQ(ConfigManager::Instance()->ReaderThreads(), 4u);
  EXPECT_TRUE(ConfigManager::Instance()->Init(""));
}

TEST(ConfigManager, ReaderThreadsAtLeastTwo) {
  auto path =
      test::Util::CreateFile("one_thread.json", R"({"reader_threads": 1})");
  EXPECT_TRUE(ConfigManager::Instance()->Init(path));
  EXPECT_EQ(ConfigManager::Instance()->ReaderThreads(), 2u);
  EXPECT_TRUE(ConfigManager::Instance()->Init(""));
}

TEST(ConfigManager, BadConfig) {
  EXPECT_FALSE(
      ConfigManager::Instance()->Init(test::Util::TempDir() + "/not_exists"));

  auto path = test::Util::CreateFile("bad_config.json", "{channel_capacity");
  EXPECT_FALSE(ConfigManager::Instance()->Init(path));
  EXPECT_EQ(ConfigManager::Instance()->ChannelCapacity(),
            common::CHANNEL_CAPACITY);
  EXPECT_TRUE(ConfigManager::Instance()->Init(""));
}

}  // namespace util
}  // namespace bytecmp

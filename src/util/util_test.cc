/*******************************************************************************
 * Copyright (c) 2024  xiedeacc.com.
 * All rights reserved.
 *******************************************************************************/

#include "src/util/util.h"

#include "glog/logging.h"
#include "gtest/gtest.h"
#include "src/proto/config.pb.h"
#include "src/test/test_util.h"

namespace bytecmp {
namespace util {

TEST(Util, ParseOffset) {
  int64_t offset = -1;
  EXPECT_TRUE(Util::ParseOffset("0x1A", &offset));
  EXPECT_EQ(offset, 26);
  EXPECT_TRUE(Util::ParseOffset("0X1a", &offset));
  EXPECT_EQ(offset, 26);
  EXPECT_TRUE(Util::ParseOffset("032", &offset));
  EXPECT_EQ(offset, 26);
  EXPECT_TRUE(Util::ParseOffset("26", &offset));
  EXPECT_EQ(offset, 26);
  EXPECT_TRUE(Util::ParseOffset("0", &offset));
  EXPECT_EQ(offset, 0);
  EXPECT_TRUE(Util::ParseOffset("00", &offset));
  EXPECT_EQ(offset, 0);
  EXPECT_TRUE(Util::ParseOffset("+26", &offset));
  EXPECT_EQ(offset, 26);
  EXPECT_TRUE(Util::ParseOffset("+0x1A", &offset));
  EXPECT_EQ(offset, 26);
  EXPECT_TRUE(Util::ParseOffset("+032", &offset));
  EXPECT_EQ(offset, 26);

  offset = 99;
  EXPECT_FALSE(Util::ParseOffset("", &offset));
  EXPECT_FALSE(Util::ParseOffset("08", &offset));
  EXPECT_FALSE(Util::ParseOffset("0x", &offset));
  EXPECT_FALSE(Util::ParseOffset("0xg", &offset));
  EXPECT_FALSE(Util::ParseOffset("1a", &offset));
  EXPECT_FALSE(Util::ParseOffset("-1", &offset));
  EXPECT_FALSE(Util::ParseOffset("-0", &offset));
  EXPECT_FALSE(Util::ParseOffset("+", &offset));
  EXPECT_FALSE(Util::ParseOffset("++1", &offset));
  EXPECT_FALSE(Util::ParseOffset("+-1", &offset));
  EXPECT_FALSE(Util::ParseOffset("0+1", &offset));
  EXPECT_FALSE(Util::ParseOffset("0x-1", &offset));
  EXPECT_FALSE(Util::ParseOffset(" 1", &offset));
  EXPECT_FALSE(Util::ParseOffset("99999999999999999999", &offset));
  EXPECT_EQ(offset, 99);
}

TEST(Util, ToInt) {
  int32_t value = 0;
  EXPECT_TRUE(Util::ToInt("123", &value));
  EXPECT_EQ(value, 123);
  EXPECT_TRUE(Util::ToInt("ff", &value, 16));
  EXPECT_EQ(value, 255);
  EXPECT_FALSE(Util::ToInt("12x", &value));
  EXPECT_FALSE(Util::ToInt("", &value));
}

TEST(Util, ToOctStr) {
  EXPECT_EQ(Util::ToOctStr('o'), "157");
  EXPECT_EQ(Util::ToOctStr('O'), "117");
  EXPECT_EQ(Util::ToOctStr(0), "00");
  EXPECT_EQ(Util::ToOctStr(7), "07");
  EXPECT_EQ(Util::ToOctStr(255), "377");
}

TEST(Util, StartWith) {
  EXPECT_TRUE(Util::StartWith("0x1A", "0x"));
  EXPECT_FALSE(Util::StartWith("0", "0x"));
}

TEST(Util, WriteToFile) {
  std::string path = test::Util::TempDir() + "/util_write/data";
  EXPECT_EQ(Util::WriteToFile(path, "hello"), Err_Success);
  EXPECT_EQ(Util::WriteToFile(path, " world", true), Err_Success);
  EXPECT_TRUE(Util::Exists(path));

  std::string content;
  EXPECT_TRUE(Util::LoadSmallFile(path, &content));
  EXPECT_EQ(content, "hello world");

  EXPECT_TRUE(Util::Remove(test::Util::TempDir() + "/util_write"));
  EXPECT_FALSE(Util::Exists(path));
  EXPECT_FALSE(Util::LoadSmallFile(path, &content));
}

TEST(Util, Json) {
  proto::BaseConfig config;
  EXPECT_TRUE(Util::JsonToMessage(
      R"({"channel_capacity": 16, "unknown_field": 1})", &config));
  EXPECT_EQ(config.channel_capacity(), 16u);

  std::string json;
  EXPECT_TRUE(Util::MessageToJson(config, &json));
  LOG(INFO) << json;
  EXPECT_NE(json.find("channel_capacity"), std::string::npos);

  EXPECT_FALSE(Util::JsonToMessage("{not json", &config));
}

}  // namespace util
}  // namespace bytecmp

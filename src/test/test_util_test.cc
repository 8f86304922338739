/*******************************************************************************
 * Copyright (c) 2024  xiedeacc.com.
 * All rights reserved.
 *******************************************************************************/

#include "src/test/test_util.h"

#include "gtest/gtest.h"

namespace bytecmp {
namespace test {

TEST(Util, TempDir) {
  LOG(INFO) << Util::TempDir();
  EXPECT_TRUE(util::Util::StartWith(
      std::filesystem::path(Util::TempDir()).filename().string(),
      "bytecmp_test_"));
}

TEST(Util, CreateFile) {
  std::string content("a\0b", 3);
  auto path = Util::CreateFile("test_util_create", content);
  std::string loaded;
  EXPECT_TRUE(util::Util::LoadSmallFile(path, &loaded));
  EXPECT_EQ(loaded, content);
}

}  // namespace test
}  // namespace bytecmp

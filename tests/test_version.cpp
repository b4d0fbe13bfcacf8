// Copyright 2026 The markplace Authors
// Tests for: markplace_version_string, markplace_version_major,
//            markplace_version_minor, markplace_version_patch

#include <cstdio>
#include <cstring>

#include "gtest/gtest.h"
#include "markplace/markplace.h"

TEST(VersionTest, VersionStringIsNotNull) {
  const char* ver = markplace_version_string();
  ASSERT_NE(ver, nullptr);
  EXPECT_GT(std::strlen(ver), 0u);
}

TEST(VersionTest, VersionStringMatchesMacro) {
  EXPECT_STREQ(markplace_version_string(), MARKPLACE_VERSION_STRING);
}

TEST(VersionTest, VersionStringMatchesExpected) {
  EXPECT_STREQ(markplace_version_string(), "1.0.0");
}

TEST(VersionTest, ComponentsMatchMacros) {
  EXPECT_EQ(markplace_version_major(), MARKPLACE_VERSION_MAJOR);
  EXPECT_EQ(markplace_version_minor(), MARKPLACE_VERSION_MINOR);
  EXPECT_EQ(markplace_version_patch(), MARKPLACE_VERSION_PATCH);
}

TEST(VersionTest, StringMatchesComponents) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%d.%d.%d", markplace_version_major(),
                markplace_version_minor(), markplace_version_patch());
  EXPECT_STREQ(markplace_version_string(), buf);
}

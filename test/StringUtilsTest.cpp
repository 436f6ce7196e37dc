// +-------------------------------------------------------------------------
// | Copyright (C) 2017 Yunify, Inc.
// +-------------------------------------------------------------------------
// | Licensed under the Apache License, Version 2.0 (the "License");
// | You may not use this work except in compliance with the License.
// | You may obtain a copy of the License in the LICENSE file, or at:
// |
// | http://www.apache.org/licenses/LICENSE-2.0
// |
// | Unless required by applicable law or agreed to in writing, software
// | distributed under the License is distributed on an "AS IS" BASIS,
// | WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// | See the License for the specific language governing permissions and
// | limitations under the License.
// +-------------------------------------------------------------------------

#include <string>

#include "gtest/gtest.h"

#include "base/StringUtils.h"

using std::string;

TEST(StringUtilsTest, ChangeCase) {
  EXPECT_EQ(string("lowercase"), DC::StringUtils::ToLower("LOWerCase"));
  EXPECT_EQ(string("UPPERCASE"), DC::StringUtils::ToUpper("UpperCase"));
}

TEST(StringUtilsTest, Trim) {
  string raw = "  hello world  ";
  char ch = ' ';

  EXPECT_EQ(string("  hello world"), DC::StringUtils::RTrim(raw, ch));
  EXPECT_EQ(string("hello world  "), DC::StringUtils::LTrim(raw, ch));
  EXPECT_EQ(string("hello world"), DC::StringUtils::Trim(raw, ch));
  EXPECT_EQ(string(), DC::StringUtils::Trim("    ", ch));
}

TEST(StringUtilsTest, StartsWith) {
  using DC::StringUtils::StartsWith;
  EXPECT_TRUE(StartsWith("qs://bucket/key", "qs://"));
  EXPECT_TRUE(StartsWith("qs://", "qs://"));
  EXPECT_TRUE(StartsWith("anything", ""));
  EXPECT_FALSE(StartsWith("qs:/", "qs://"));
  EXPECT_FALSE(StartsWith("gs://bucket/key", "qs://"));
}

TEST(StringUtilsTest, FormatObject) {
  using DC::StringUtils::FormatObject;
  EXPECT_EQ(string("[object=qs://b/k]"), FormatObject("qs://b/k"));
  EXPECT_EQ(string("[from=qs://a/x to=qs://b/y]"),
            FormatObject("qs://a/x", "qs://b/y"));
}

TEST(StringUtilsTest, FormatRange) {
  using DC::StringUtils::FormatRange;
  EXPECT_EQ(string("[range=0-99]"), FormatRange(0, 99));
  EXPECT_EQ(string("[range=200-]"), FormatRange(200, -1));
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}

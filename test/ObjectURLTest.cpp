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
#include <utility>

#include "gtest/gtest.h"

#include "client/ObjectURL.h"

using DC::Client::ObjectURL;
using DC::Client::ParseObjectURL;
using std::pair;
using std::string;

TEST(ObjectURLTest, Parse) {
  ObjectURL url;
  pair<bool, string> outcome = ParseObjectURL("qs://bucket/dir/obj.bin", &url);
  EXPECT_TRUE(outcome.first) << outcome.second;
  EXPECT_EQ(url.GetBucket(), string("bucket"));
  EXPECT_EQ(url.GetKey(), string("dir/obj.bin"));
  EXPECT_FALSE(url.HasGeneration());
  EXPECT_TRUE(url.IsValid());
  EXPECT_EQ(url.ToString(), string("qs://bucket/dir/obj.bin"));
}

TEST(ObjectURLTest, ParseGeneration) {
  ObjectURL url;
  EXPECT_TRUE(ParseObjectURL("qs://bucket/obj#0a1b2c", &url).first);
  EXPECT_EQ(url.GetKey(), string("obj"));
  EXPECT_TRUE(url.HasGeneration());
  EXPECT_EQ(url.GetGeneration(), string("0a1b2c"));
  EXPECT_EQ(url.ToString(), string("qs://bucket/obj#0a1b2c"));
}

TEST(ObjectURLTest, ParseInvalid) {
  ObjectURL url;
  EXPECT_FALSE(ParseObjectURL("gs://bucket/obj", &url).first);
  EXPECT_FALSE(ParseObjectURL("qs://bucket", &url).first);
  EXPECT_FALSE(ParseObjectURL("qs:///obj", &url).first);
  EXPECT_FALSE(ParseObjectURL("qs://bucket/", &url).first);
  EXPECT_FALSE(ParseObjectURL("qs://bucket/dir/", &url).first);
  EXPECT_FALSE(ParseObjectURL("qs://bucket/obj#", &url).first);
  EXPECT_FALSE(ParseObjectURL("qs://bucket/" + string(1024, 'k'), &url).first);
  EXPECT_FALSE(ParseObjectURL("qs://bucket/obj", NULL).first);
  EXPECT_FALSE(url.IsValid());
}

TEST(ObjectURLTest, WithGeneration) {
  ObjectURL url("bucket", "obj");
  ObjectURL pinned = url.WithGeneration("etag");
  EXPECT_FALSE(url.HasGeneration());
  EXPECT_EQ(pinned.GetGeneration(), string("etag"));
  EXPECT_EQ(pinned.GetBucket(), url.GetBucket());
  EXPECT_EQ(pinned.GetKey(), url.GetKey());
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}

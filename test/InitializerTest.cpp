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
#include <vector>

#include "boost/bind.hpp"
#include "gtest/gtest.h"

#include "app/Initializer.h"
#include "base/Exception.h"

namespace DC {

namespace App {

using DC::Exception::DCException;
using std::string;
using std::vector;
using ::testing::Test;

static vector<string> ran;

void Record(const string &name) { ran.push_back(name); }

void Throw() { throw DCException("step failed"); }

class InitializerTest : public Test {
 protected:
  void SetUp() {
    ran.clear();
    Initializer::RemoveInitializers();
  }

  void TestRunByPriority() {
    Initializer third(InitStep(Priority::Third, "third",
                               boost::bind(Record, string("third"))));
    Initializer first(InitStep(Priority::First, "first",
                               boost::bind(Record, string("first"))));
    Initializer second(InitStep(Priority::Second, "second",
                                boost::bind(Record, string("second"))));
    EXPECT_EQ(Initializer::GetInitializerCount(), 3u);

    Initializer::RunInitializers();
    ASSERT_EQ(ran.size(), 3u);
    EXPECT_EQ(ran[0], string("first"));
    EXPECT_EQ(ran[1], string("second"));
    EXPECT_EQ(ran[2], string("third"));
    EXPECT_EQ(Initializer::GetInitializerCount(), 0u);
  }

  void TestFailedStepStopsTheRest() {
    Initializer first(InitStep(Priority::First, "first",
                               boost::bind(Record, string("first"))));
    Initializer failed(InitStep(Priority::Second, "failed", Throw));
    Initializer last(InitStep(Priority::Fourth, "last",
                              boost::bind(Record, string("last"))));
    EXPECT_THROW(Initializer::RunInitializers(), DCException);
    ASSERT_EQ(ran.size(), 1u);
    EXPECT_EQ(ran[0], string("first"));
  }

  void TestRemove() {
    Initializer first(InitStep(Priority::First, "first",
                               boost::bind(Record, string("first"))));
    Initializer::RemoveInitializers();
    EXPECT_EQ(Initializer::GetInitializerCount(), 0u);
    Initializer::RunInitializers();
    EXPECT_TRUE(ran.empty());
  }
};

TEST_F(InitializerTest, RunByPriority) { TestRunByPriority(); }

TEST_F(InitializerTest, FailedStepStopsTheRest) {
  TestFailedStepStopsTheRest();
}

TEST_F(InitializerTest, Remove) { TestRemove(); }

}  // namespace App
}  // namespace DC

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}

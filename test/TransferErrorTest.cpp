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

#include "client/ClientError.hpp"
#include "client/TransferError.h"

using DC::Client::ClientError;
using DC::Client::GetMessageForTransferError;
using DC::Client::GoodTransferError;
using DC::Client::IsGoodTransferError;
using DC::Client::StringToTransferError;
using DC::Client::TransferError;
using DC::Client::TransferErrorToString;
using std::string;

TEST(TransferErrorTest, Names) {
  EXPECT_EQ(string("Good"), TransferErrorToString(TransferError::GOOD));
  EXPECT_EQ(string("FetchFailed"),
            TransferErrorToString(TransferError::FETCH_FAILED));
  EXPECT_EQ(string("InvalidRange"),
            TransferErrorToString(TransferError::INVALID_RANGE));
  EXPECT_EQ(TransferError::SOURCE_CHANGED,
            StringToTransferError("SourceChanged"));
  EXPECT_EQ(TransferError::UNKNOWN, StringToTransferError("NoSuchError"));
}

TEST(TransferErrorTest, NameOfEveryValue) {
  for (int i = TransferError::UNKNOWN; i <= TransferError::INVALID_RANGE;
       ++i) {
    TransferError::Value err = static_cast<TransferError::Value>(i);
    EXPECT_EQ(err, StringToTransferError(TransferErrorToString(err)));
  }
}

TEST(TransferErrorTest, Good) {
  EXPECT_TRUE(IsGoodTransferError(GoodTransferError()));
  EXPECT_FALSE(GoodTransferError().ShouldRetry());
  ClientError<TransferError::Value> err(TransferError::NOT_FOUND, "HeadObject",
                                        "qs://b/k", false);
  EXPECT_FALSE(IsGoodTransferError(err));
  EXPECT_EQ(string("NotFound, HeadObject:qs://b/k"),
            GetMessageForTransferError(err));
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}

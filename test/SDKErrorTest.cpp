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

#include "qingstor/HttpCommon.h"
#include "qingstor/QsErrors.h"

#include "client/SDKError.h"
#include "client/TransferError.h"

using DC::Client::SDKErrorToTransferError;
using DC::Client::SDKResponseCodeToInt;
using DC::Client::SDKResponseCodeToString;
using DC::Client::SDKResponseSuccess;
using DC::Client::SDKResponseToTransferError;
using DC::Client::SDKShouldRetry;
using DC::Client::TransferError;
using std::string;

TEST(SDKErrorTest, SDKError) {
  EXPECT_EQ(TransferError::GOOD, SDKErrorToTransferError(QS_ERR_NO_ERROR));
  EXPECT_EQ(TransferError::SDK_REQUEST_SEND_ERROR,
            SDKErrorToTransferError(QS_ERR_SEND_REQUEST_ERROR));
  EXPECT_EQ(TransferError::SDK_UNEXPECTED_RESPONSE,
            SDKErrorToTransferError(QS_ERR_UNEXCEPTED_RESPONSE));
}

TEST(SDKErrorTest, Response) {
  EXPECT_EQ(TransferError::NOT_FOUND,
            SDKResponseToTransferError(QS_ERR_UNEXCEPTED_RESPONSE,
                                       QingStor::Http::NOT_FOUND));
  EXPECT_EQ(TransferError::PERMISSION_DENIED,
            SDKResponseToTransferError(QS_ERR_UNEXCEPTED_RESPONSE,
                                       QingStor::Http::FORBIDDEN));
  EXPECT_EQ(TransferError::SOURCE_CHANGED,
            SDKResponseToTransferError(QS_ERR_UNEXCEPTED_RESPONSE,
                                       QingStor::Http::PRECONDITION_FAILED));
  EXPECT_EQ(TransferError::GOOD,
            SDKResponseToTransferError(QS_ERR_UNEXCEPTED_RESPONSE,
                                       QingStor::Http::PARTIAL_CONTENT));
  EXPECT_EQ(TransferError::SDK_UNEXPECTED_RESPONSE,
            SDKResponseToTransferError(QS_ERR_UNEXCEPTED_RESPONSE,
                                       QingStor::Http::CONFLICT));
}

TEST(SDKErrorTest, Retry) {
  EXPECT_TRUE(SDKShouldRetry(QS_ERR_SEND_REQUEST_ERROR,
                             QingStor::Http::REQUEST_NOT_MADE));
  EXPECT_TRUE(SDKShouldRetry(QS_ERR_UNEXCEPTED_RESPONSE,
                             QingStor::Http::SERVICE_UNAVAILABLE));
  EXPECT_TRUE(SDKShouldRetry(QS_ERR_UNEXCEPTED_RESPONSE,
                             QingStor::Http::TOO_MANY_REQUESTS));
  EXPECT_FALSE(SDKShouldRetry(QS_ERR_UNEXCEPTED_RESPONSE,
                              QingStor::Http::NOT_FOUND));
  EXPECT_FALSE(SDKShouldRetry(QS_ERR_NO_ERROR, QingStor::Http::OK));
}

TEST(SDKErrorTest, Success) {
  EXPECT_TRUE(SDKResponseSuccess(QS_ERR_NO_ERROR, QingStor::Http::OK));
  EXPECT_TRUE(SDKResponseSuccess(QS_ERR_UNEXCEPTED_RESPONSE,
                                 QingStor::Http::PARTIAL_CONTENT));
  EXPECT_FALSE(SDKResponseSuccess(QS_ERR_UNEXCEPTED_RESPONSE,
                                  QingStor::Http::INVALID_RANGE));
}

TEST(SDKErrorTest, ResponseCodeName) {
  EXPECT_EQ(404, SDKResponseCodeToInt(QingStor::Http::NOT_FOUND));
  EXPECT_EQ(string("NotFound(404)"),
            SDKResponseCodeToString(QingStor::Http::NOT_FOUND));
  EXPECT_EQ(string("PartialContent(206)"),
            SDKResponseCodeToString(QingStor::Http::PARTIAL_CONTENT));
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}

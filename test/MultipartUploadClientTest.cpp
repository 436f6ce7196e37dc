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

#include <stdint.h>

#include <string>
#include <vector>

#include "boost/make_shared.hpp"
#include "boost/shared_ptr.hpp"
#include "gtest/gtest.h"

#include "base/Exception.h"
#include "base/Logging.h"
#include "base/Utils.h"
#include "client/MultipartUploadClient.h"
#include "client/ObjectURL.h"
#include "client/RetryStrategy.h"
#include "client/TransferError.h"
#include "data/DaisyChain.h"
#include "TestClients.h"

namespace DC {

namespace Client {

using boost::shared_ptr;
using DC::Data::DaisyChain;
using DC::Data::DaisyChainConfigure;
using DC::Exception::DCException;
using std::string;
using std::vector;
using ::testing::Test;

static const char *defaultLogDir = "/tmp/daisycp.test.logs/";

class MultipartUploadClientTest : public Test {
 protected:
  static void SetUpTestCase() {
    DC::Utils::CreateDirectoryIfNotExists(defaultLogDir);
    DC::Logging::Log::Instance().Initialize(defaultLogDir);
  }

  void SetUp() {
    m_source = ObjectURL("src-bucket", "object");
    m_dest = ObjectURL("dst-bucket", "object");
    // part 300, multipart above 500, chunk 100, min part 100
    m_uploadClient = boost::make_shared<MemoryMultipartClient>(
        UploadClientConfigure(300, 500, 100, 100, 10000), RetryStrategy(3, 1));
  }

  shared_ptr<DaisyChain> MakeChain(size_t size) {
    m_content = MakeContent(size);
    m_fetchClient = boost::make_shared<MemoryFetchClient>(m_content, 100);
    return boost::make_shared<DaisyChain>(m_source, m_content.size(),
                                          m_fetchClient,
                                          DaisyChainConfigure(200, 200, 100));
  }

 protected:
  ObjectURL m_source;
  ObjectURL m_dest;
  string m_content;
  shared_ptr<MemoryFetchClient> m_fetchClient;
  shared_ptr<MemoryMultipartClient> m_uploadClient;
};

TEST_F(MultipartUploadClientTest, SmallObjectIsPut) {
  shared_ptr<DaisyChain> chain = MakeChain(250);
  uint64_t uploaded = 0;
  ClientError<TransferError::Value> err =
      m_uploadClient->UploadObject(m_dest, chain.get(), &uploaded);
  EXPECT_TRUE(IsGoodTransferError(err)) << GetMessageForTransferError(err);
  EXPECT_EQ(uploaded, 250u);
  EXPECT_EQ(m_uploadClient->GetPutCount(), 1);
  EXPECT_EQ(m_uploadClient->GetInitiateCount(), 0);
  EXPECT_EQ(m_uploadClient->GetObject(m_dest), m_content);
}

TEST_F(MultipartUploadClientTest, Multipart) {
  shared_ptr<DaisyChain> chain = MakeChain(1000);
  uint64_t uploaded = 0;
  ClientError<TransferError::Value> err =
      m_uploadClient->UploadObject(m_dest, chain.get(), &uploaded);
  EXPECT_TRUE(IsGoodTransferError(err)) << GetMessageForTransferError(err);
  EXPECT_EQ(uploaded, 1000u);
  EXPECT_EQ(m_uploadClient->GetObject(m_dest), m_content);
  EXPECT_EQ(m_uploadClient->GetPutCount(), 0);
  EXPECT_EQ(m_uploadClient->GetCompleteCount(), 1);
  EXPECT_TRUE(m_uploadClient->GetAbortedUploads().empty());

  vector<uint64_t> sizes = m_uploadClient->GetPartSizes();
  ASSERT_EQ(sizes.size(), 4u);
  EXPECT_EQ(sizes[0], 300u);
  EXPECT_EQ(sizes[3], 100u);
  EXPECT_EQ(chain->GetFetchStartCount(), 1u);
}

TEST_F(MultipartUploadClientTest, PartRetryRewindsSource) {
  shared_ptr<DaisyChain> chain = MakeChain(1000);
  m_uploadClient->FailPart(2, 1, true);
  uint64_t uploaded = 0;
  ClientError<TransferError::Value> err =
      m_uploadClient->UploadObject(m_dest, chain.get(), &uploaded);
  EXPECT_TRUE(IsGoodTransferError(err)) << GetMessageForTransferError(err);
  EXPECT_EQ(uploaded, 1000u);
  EXPECT_EQ(m_uploadClient->GetPartAttempts(2), 2);
  EXPECT_EQ(m_uploadClient->GetObject(m_dest), m_content);

  // source was at 600 when part 2 failed, reading it again starts a new
  // fetch at the part start
  EXPECT_EQ(chain->GetFetchStartCount(), 2u);
  vector<FetchRange> ranges = m_fetchClient->GetRanges();
  bool refetched = false;
  for (size_t i = 0; i < ranges.size(); ++i) {
    if (ranges[i] == FetchRange(300, 499)) {
      refetched = true;
    }
  }
  EXPECT_TRUE(refetched);
}

TEST_F(MultipartUploadClientTest, FetchFailureRetriesPart) {
  shared_ptr<DaisyChain> chain = MakeChain(1000);
  m_fetchClient->FailCall(1);  // range 200-399
  uint64_t uploaded = 0;
  ClientError<TransferError::Value> err =
      m_uploadClient->UploadObject(m_dest, chain.get(), &uploaded);
  EXPECT_TRUE(IsGoodTransferError(err)) << GetMessageForTransferError(err);
  EXPECT_EQ(m_uploadClient->GetObject(m_dest), m_content);
  // part 1 was not sent until the source delivered all of it
  EXPECT_EQ(m_uploadClient->GetPartAttempts(1), 1);
  EXPECT_EQ(chain->GetFetchStartCount(), 2u);
}

TEST_F(MultipartUploadClientTest, AbortAfterLastFailure) {
  shared_ptr<DaisyChain> chain = MakeChain(1000);
  m_uploadClient->FailPart(3, 10, true);
  uint64_t uploaded = 0;
  ClientError<TransferError::Value> err =
      m_uploadClient->UploadObject(m_dest, chain.get(), &uploaded);
  EXPECT_EQ(err.GetError(), TransferError::SDK_REQUEST_SEND_ERROR);
  EXPECT_EQ(uploaded, 0u);
  EXPECT_EQ(m_uploadClient->GetPartAttempts(3), 4);  // 1 + 3 retries
  EXPECT_EQ(m_uploadClient->GetPartAttempts(4), 0);
  EXPECT_EQ(m_uploadClient->GetCompleteCount(), 0);
  ASSERT_EQ(m_uploadClient->GetAbortedUploads().size(), 1u);
  EXPECT_EQ(m_uploadClient->GetAbortedUploads()[0], string("upload-1"));
  EXPECT_FALSE(m_uploadClient->HasObject(m_dest));
}

TEST_F(MultipartUploadClientTest, NonRetryablePartFailure) {
  shared_ptr<DaisyChain> chain = MakeChain(1000);
  m_uploadClient->FailPart(1, 1, false);
  ClientError<TransferError::Value> err =
      m_uploadClient->UploadObject(m_dest, chain.get(), NULL);
  EXPECT_EQ(err.GetError(), TransferError::PERMISSION_DENIED);
  EXPECT_EQ(m_uploadClient->GetPartAttempts(1), 1);
  EXPECT_EQ(m_uploadClient->GetAbortedUploads().size(), 1u);
}

TEST_F(MultipartUploadClientTest, InitiateRetried) {
  shared_ptr<DaisyChain> chain = MakeChain(1000);
  m_uploadClient->FailInitiate(2);
  ClientError<TransferError::Value> err =
      m_uploadClient->UploadObject(m_dest, chain.get(), NULL);
  EXPECT_TRUE(IsGoodTransferError(err)) << GetMessageForTransferError(err);
  EXPECT_EQ(m_uploadClient->GetInitiateCount(), 3);
  EXPECT_EQ(m_uploadClient->GetObject(m_dest), m_content);
}

TEST_F(MultipartUploadClientTest, InitiateFailure) {
  shared_ptr<DaisyChain> chain = MakeChain(1000);
  m_uploadClient->FailInitiate(10);
  ClientError<TransferError::Value> err =
      m_uploadClient->UploadObject(m_dest, chain.get(), NULL);
  EXPECT_FALSE(IsGoodTransferError(err));
  EXPECT_EQ(m_uploadClient->GetInitiateCount(), 4);
  EXPECT_EQ(m_uploadClient->GetPartAttempts(1), 0);
  EXPECT_TRUE(m_uploadClient->GetAbortedUploads().empty());
}

TEST_F(MultipartUploadClientTest, CompleteFailureAborts) {
  shared_ptr<DaisyChain> chain = MakeChain(1000);
  m_uploadClient->FailComplete(10);
  uint64_t uploaded = 0;
  ClientError<TransferError::Value> err =
      m_uploadClient->UploadObject(m_dest, chain.get(), &uploaded);
  EXPECT_FALSE(IsGoodTransferError(err));
  EXPECT_EQ(uploaded, 0u);
  EXPECT_EQ(m_uploadClient->GetCompleteCount(), 4);
  EXPECT_EQ(m_uploadClient->GetAbortedUploads().size(), 1u);
  EXPECT_FALSE(m_uploadClient->HasObject(m_dest));
}

TEST_F(MultipartUploadClientTest, NullSource) {
  ClientError<TransferError::Value> err =
      m_uploadClient->UploadObject(m_dest, NULL, NULL);
  EXPECT_EQ(err.GetError(), TransferError::PARAMETER_MISSING);
}

TEST_F(MultipartUploadClientTest, InvalidConfigure) {
  EXPECT_THROW(MemoryMultipartClient(UploadClientConfigure(300, 500, 0, 100,
                                                           10000),
                                     RetryStrategy(0, 1)),
               DCException);
  EXPECT_THROW(MemoryMultipartClient(UploadClientConfigure(0, 500, 100, 100,
                                                           10000),
                                     RetryStrategy(0, 1)),
               DCException);
}

}  // namespace Client
}  // namespace DC

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}

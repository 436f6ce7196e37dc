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

#include "boost/date_time/posix_time/posix_time.hpp"
#include "boost/make_shared.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/thread.hpp"
#include "gtest/gtest.h"

#include "base/Exception.h"
#include "base/Logging.h"
#include "base/Utils.h"
#include "client/ObjectURL.h"
#include "data/DaisyChain.h"
#include "data/InputSource.h"
#include "TestClients.h"

namespace DC {

namespace Data {

using boost::shared_ptr;
using DC::Client::BufferToString;
using DC::Client::FetchRange;
using DC::Client::MakeContent;
using DC::Client::MemoryFetchClient;
using DC::Client::ObjectURL;
using DC::Exception::DCException;
using DC::Exception::FetchFailedException;
using DC::Exception::InvalidRequestException;
using DC::Exception::UnsupportedOperationException;
using std::string;
using std::vector;
using ::testing::Test;

static const char *defaultLogDir = "/tmp/daisycp.test.logs/";

class DaisyChainTest : public Test {
 protected:
  static void SetUpTestCase() {
    DC::Utils::CreateDirectoryIfNotExists(defaultLogDir);
    DC::Logging::Log::Instance().Initialize(defaultLogDir);
  }

  void SetUp() {
    m_source = ObjectURL("src-bucket", "dir/object");
    m_content = MakeContent(250);
    m_fetchClient = boost::make_shared<MemoryFetchClient>(m_content, 100);
  }

  // range 100, buffer 100, chunk 100
  shared_ptr<DaisyChain> MakeChain() {
    return boost::make_shared<DaisyChain>(m_source, m_content.size(),
                                          m_fetchClient,
                                          DaisyChainConfigure(100, 100, 100));
  }

  // Read the whole object in 100 bytes chunks from the start
  void ReadAll(DaisyChain *chain) {
    EXPECT_EQ(BufferToString(chain->Read(100)), m_content.substr(0, 100));
    EXPECT_EQ(chain->Tell(), 100u);
    EXPECT_EQ(BufferToString(chain->Read(100)), m_content.substr(100, 100));
    EXPECT_EQ(chain->Tell(), 200u);
    EXPECT_EQ(BufferToString(chain->Read(100)), m_content.substr(200, 50));
    EXPECT_EQ(chain->Tell(), 250u);
  }

 protected:
  ObjectURL m_source;
  string m_content;
  shared_ptr<MemoryFetchClient> m_fetchClient;
};

TEST_F(DaisyChainTest, ReadWholeObject) {
  shared_ptr<DaisyChain> chain = MakeChain();
  EXPECT_TRUE(chain->Seekable());
  EXPECT_EQ(chain->GetSize(), 250u);
  EXPECT_EQ(chain->Tell(), 0u);

  ReadAll(chain.get());
  EXPECT_TRUE(chain->Read(100)->empty());
  EXPECT_EQ(chain->Tell(), 250u);

  vector<FetchRange> ranges = m_fetchClient->GetRanges();
  ASSERT_EQ(ranges.size(), 3u);
  EXPECT_EQ(ranges[0], FetchRange(0, 99));
  EXPECT_EQ(ranges[1], FetchRange(100, 199));
  EXPECT_EQ(ranges[2], FetchRange(200, -1));
  EXPECT_EQ(chain->GetFetchStartCount(), 1u);
}

TEST_F(DaisyChainTest, RangeEqualToSizeIsOneOpenFetch) {
  shared_ptr<DaisyChain> chain = boost::make_shared<DaisyChain>(
      m_source, m_content.size(), m_fetchClient,
      DaisyChainConfigure(250, 100, 100));
  ReadAll(chain.get());
  vector<FetchRange> ranges = m_fetchClient->GetRanges();
  ASSERT_EQ(ranges.size(), 1u);
  EXPECT_EQ(ranges[0], FetchRange(0, -1));
}

TEST_F(DaisyChainTest, RewindLastChunk) {
  shared_ptr<DaisyChain> chain = MakeChain();
  ReadAll(chain.get());

  chain->Seek(200);
  EXPECT_EQ(chain->Tell(), 200u);
  EXPECT_EQ(chain->GetBufferedBytes(), 50u);
  EXPECT_EQ(BufferToString(chain->Read(100)), m_content.substr(200, 50));
  EXPECT_EQ(chain->Tell(), 250u);
  EXPECT_EQ(chain->GetFetchStartCount(), 1u);
}

TEST_F(DaisyChainTest, RewindInMiddle) {
  shared_ptr<DaisyChain> chain = MakeChain();
  EXPECT_EQ(BufferToString(chain->Read(100)), m_content.substr(0, 100));
  EXPECT_EQ(BufferToString(chain->Read(100)), m_content.substr(100, 100));

  chain->Seek(100);
  EXPECT_EQ(BufferToString(chain->Read(100)), m_content.substr(100, 100));
  EXPECT_EQ(BufferToString(chain->Read(100)), m_content.substr(200, 50));
  EXPECT_EQ(chain->GetFetchStartCount(), 1u);
}

TEST_F(DaisyChainTest, RestartOnSeekOutOfHistory) {
  shared_ptr<DaisyChain> chain = MakeChain();
  ReadAll(chain.get());

  chain->Seek(30);
  EXPECT_EQ(chain->Tell(), 30u);
  EXPECT_EQ(chain->GetFetchStartCount(), 2u);
  EXPECT_EQ(BufferToString(chain->Read(100)), m_content.substr(30, 100));
  EXPECT_EQ(BufferToString(chain->Read(100)), m_content.substr(130, 100));
  EXPECT_EQ(BufferToString(chain->Read(100)), m_content.substr(230, 20));
  EXPECT_TRUE(chain->Read(100)->empty());

  vector<FetchRange> ranges = m_fetchClient->GetRanges();
  ASSERT_EQ(ranges.size(), 6u);
  EXPECT_EQ(ranges[3], FetchRange(30, 129));
  EXPECT_EQ(ranges[4], FetchRange(130, 229));
  EXPECT_EQ(ranges[5], FetchRange(230, -1));
}

TEST_F(DaisyChainTest, RestartForgetsLastChunk) {
  shared_ptr<DaisyChain> chain = MakeChain();
  ReadAll(chain.get());
  chain->Seek(30);
  // restart leaves no history to rewind to
  chain->Seek(0);
  EXPECT_EQ(chain->GetFetchStartCount(), 3u);
  EXPECT_EQ(BufferToString(chain->Read(100)), m_content.substr(0, 100));
}

TEST_F(DaisyChainTest, RestartWhileFetchBlocked) {
  shared_ptr<DaisyChain> chain = MakeChain();
  EXPECT_EQ(BufferToString(chain->Read(100)), m_content.substr(0, 100));
  // fetch thread is blocked on the full buffer
  chain->Seek(150);
  EXPECT_EQ(chain->Tell(), 150u);
  EXPECT_EQ(BufferToString(chain->Read(100)), m_content.substr(150, 100));
  EXPECT_TRUE(chain->Read(100)->empty());
}

TEST_F(DaisyChainTest, SeekToEnd) {
  shared_ptr<DaisyChain> chain = MakeChain();
  EXPECT_EQ(BufferToString(chain->Read(100)), m_content.substr(0, 100));

  chain->Seek(0, SeekMode::FromEnd);
  EXPECT_EQ(chain->Tell(), 250u);
  EXPECT_TRUE(chain->Read(100)->empty());
  EXPECT_TRUE(chain->Read()->empty());

  // back to where it was, the chunk is still buffered
  chain->Seek(100);
  EXPECT_EQ(chain->Tell(), 100u);
  EXPECT_EQ(BufferToString(chain->Read(100)), m_content.substr(100, 100));
  EXPECT_EQ(chain->GetFetchStartCount(), 1u);
}

TEST_F(DaisyChainTest, SeekToCurrentPosition) {
  shared_ptr<DaisyChain> chain = MakeChain();
  EXPECT_EQ(BufferToString(chain->Read(100)), m_content.substr(0, 100));
  chain->Seek(100);
  EXPECT_EQ(chain->Tell(), 100u);
  EXPECT_EQ(chain->GetFetchStartCount(), 1u);
  EXPECT_EQ(BufferToString(chain->Read(100)), m_content.substr(100, 100));
}

TEST_F(DaisyChainTest, InvalidSeek) {
  shared_ptr<DaisyChain> chain = MakeChain();
  EXPECT_THROW(chain->Seek(-1, SeekMode::FromEnd), InvalidRequestException);
  EXPECT_THROW(chain->Seek(10, SeekMode::FromCurrent),
               UnsupportedOperationException);
  EXPECT_THROW(chain->Seek(0, SeekMode::FromCurrent),
               UnsupportedOperationException);
  EXPECT_THROW(chain->Seek(-1), InvalidRequestException);
  EXPECT_THROW(chain->Seek(251), InvalidRequestException);
  EXPECT_EQ(chain->Tell(), 0u);
  EXPECT_EQ(chain->GetFetchStartCount(), 1u);
}

TEST_F(DaisyChainTest, ReadZero) {
  shared_ptr<DaisyChain> chain = MakeChain();
  EXPECT_TRUE(chain->Read(0)->empty());
  EXPECT_EQ(chain->Tell(), 0u);
  EXPECT_EQ(BufferToString(chain->Read(100)), m_content.substr(0, 100));
}

TEST_F(DaisyChainTest, ReadTooLarge) {
  shared_ptr<DaisyChain> chain = MakeChain();
  EXPECT_THROW(chain->Read(101), InvalidRequestException);
  EXPECT_THROW(chain->Read(), InvalidRequestException);
  EXPECT_EQ(chain->Tell(), 0u);
}

TEST_F(DaisyChainTest, ChunkLargerThanRead) {
  shared_ptr<DaisyChain> chain = MakeChain();
  EXPECT_THROW(chain->Read(50), InvalidRequestException);
  // chunk is consumed anyway
  EXPECT_EQ(chain->Tell(), 100u);
}

TEST_F(DaisyChainTest, BufferBound) {
  m_content = MakeContent(1000);
  m_fetchClient = boost::make_shared<MemoryFetchClient>(m_content, 10);
  DaisyChain chain(m_source, m_content.size(), m_fetchClient,
                   DaisyChainConfigure(1000, 50, 10));

  for (int i = 0; i < 200 && chain.GetBufferedBytes() < 50; ++i) {
    boost::this_thread::sleep(boost::posix_time::milliseconds(10));
  }
  boost::this_thread::sleep(boost::posix_time::milliseconds(50));
  EXPECT_GE(chain.GetBufferedBytes(), 50u);
  EXPECT_LT(chain.GetBufferedBytes(), 60u);

  string data;
  for (Buffer buf = chain.Read(10); !buf->empty(); buf = chain.Read(10)) {
    EXPECT_LT(chain.GetBufferedBytes(), 60u);
    data += BufferToString(buf);
  }
  EXPECT_EQ(data, m_content);
}

TEST_F(DaisyChainTest, DestroyWhileFetchBlocked) {
  m_content = MakeContent(1000);
  m_fetchClient = boost::make_shared<MemoryFetchClient>(m_content, 10);
  {
    DaisyChain chain(m_source, m_content.size(), m_fetchClient,
                     DaisyChainConfigure(100, 20, 10));
    EXPECT_EQ(BufferToString(chain.Read(10)), m_content.substr(0, 10));
  }
  SUCCEED();
}

TEST_F(DaisyChainTest, SecondRewindRestarts) {
  shared_ptr<DaisyChain> chain = MakeChain();
  EXPECT_EQ(BufferToString(chain->Read(100)), m_content.substr(0, 100));
  EXPECT_EQ(BufferToString(chain->Read(100)), m_content.substr(100, 100));

  // only the chunk at 100 is saved, going back to 0 needs a new fetch
  chain->Seek(0);
  EXPECT_EQ(chain->GetFetchStartCount(), 2u);
  EXPECT_EQ(chain->Tell(), 0u);
  EXPECT_EQ(BufferToString(chain->Read(100)), m_content.substr(0, 100));
  EXPECT_EQ(BufferToString(chain->Read(100)), m_content.substr(100, 100));
}

TEST_F(DaisyChainTest, EmptyObject) {
  DaisyChain chain(m_source, 0, m_fetchClient,
                   DaisyChainConfigure(100, 100, 100));
  EXPECT_TRUE(chain.Read(100)->empty());
  EXPECT_TRUE(chain.Read()->empty());
  EXPECT_EQ(chain.Tell(), 0u);
}

TEST_F(DaisyChainTest, FetchFailure) {
  m_fetchClient->FailCall(0);
  shared_ptr<DaisyChain> chain = MakeChain();
  EXPECT_THROW(chain->Read(100), FetchFailedException);
  EXPECT_EQ(chain->Tell(), 0u);

  // seek to current position restarts a failed fetch
  chain->Seek(0);
  EXPECT_EQ(chain->GetFetchStartCount(), 2u);
  ReadAll(chain.get());
}

TEST_F(DaisyChainTest, FetchThrows) {
  m_fetchClient->ThrowAtCall(1);
  shared_ptr<DaisyChain> chain = MakeChain();
  EXPECT_EQ(BufferToString(chain->Read(100)), m_content.substr(0, 100));
  EXPECT_THROW(chain->Read(100), FetchFailedException);
  EXPECT_EQ(chain->Tell(), 100u);

  chain->Seek(100);
  EXPECT_EQ(BufferToString(chain->Read(100)), m_content.substr(100, 100));
}

TEST_F(DaisyChainTest, ShortFetchIsFailure) {
  m_fetchClient->TruncateCall(0, 0);
  shared_ptr<DaisyChain> chain = boost::make_shared<DaisyChain>(
      m_source, m_content.size(), m_fetchClient,
      DaisyChainConfigure(1000, 100, 100));
  EXPECT_THROW(chain->Read(100), FetchFailedException);
  EXPECT_EQ(chain->Tell(), 0u);

  chain->Seek(0);
  EXPECT_EQ(chain->GetFetchStartCount(), 2u);
  ReadAll(chain.get());
}

TEST_F(DaisyChainTest, ShortFetchInMiddle) {
  m_fetchClient->TruncateCall(1, 50);
  shared_ptr<DaisyChain> chain = MakeChain();
  EXPECT_EQ(BufferToString(chain->Read(100)), m_content.substr(0, 100));
  EXPECT_EQ(BufferToString(chain->Read(100)), m_content.substr(100, 50));
  EXPECT_THROW(chain->Read(100), FetchFailedException);
  EXPECT_EQ(chain->Tell(), 150u);

  // nothing after the short range was queued
  vector<FetchRange> ranges = m_fetchClient->GetRanges();
  ASSERT_EQ(ranges.size(), 2u);
  EXPECT_EQ(ranges[1], FetchRange(100, 199));

  chain->Seek(150);
  EXPECT_EQ(chain->GetFetchStartCount(), 2u);
  EXPECT_EQ(BufferToString(chain->Read(100)), m_content.substr(150, 100));
  EXPECT_EQ(chain->Tell(), 250u);
  EXPECT_TRUE(chain->Read(100)->empty());
}

TEST_F(DaisyChainTest, SourceChanged) {
  m_fetchClient->SetETag("etag-2");
  DaisyChain chain(m_source.WithGeneration("etag-1"), m_content.size(),
                   m_fetchClient, DaisyChainConfigure(100, 100, 100));
  EXPECT_THROW(chain.Read(100), FetchFailedException);
}

TEST_F(DaisyChainTest, InvalidConstruction) {
  EXPECT_THROW(DaisyChain(m_source, 10, shared_ptr<MemoryFetchClient>(),
                          DaisyChainConfigure(100, 100, 100)),
               DCException);
  EXPECT_THROW(DaisyChain(m_source, 10, m_fetchClient,
                          DaisyChainConfigure(0, 100, 100)),
               DCException);
  EXPECT_THROW(DaisyChain(m_source, 10, m_fetchClient,
                          DaisyChainConfigure(100, 100, 0)),
               DCException);
}

}  // namespace Data
}  // namespace DC

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}

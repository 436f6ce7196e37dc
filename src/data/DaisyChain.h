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

#ifndef DAISYCP_DATA_DAISYCHAIN_H_
#define DAISYCP_DATA_DAISYCHAIN_H_

#include <stddef.h>
#include <stdint.h>

#include <deque>

#include "boost/noncopyable.hpp"
#include "boost/scoped_ptr.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/condition_variable.hpp"
#include "boost/thread/mutex.hpp"
#include "boost/thread/thread.hpp"

#include "client/ClientConfiguration.h"
#include "client/ObjectURL.h"
#include "client/TransferError.h"
#include "data/DownloadSink.h"
#include "data/InputSource.h"
#include "data/StreamBuf.h"

namespace DC {

namespace Client {
class FetchClient;
}  // namespace Client

namespace Data {

struct DaisyChainConfigure {
  uint64_t fetchRangeSize;     // bytes of one ranged fetch request
  uint64_t maxBufferedBytes;   // capacity of the chunk buffer
  uint64_t transferChunkSize;  // max bytes of one read

  explicit DaisyChainConfigure(
      uint64_t rangeSize =
          DC::Client::ClientConfiguration::Instance().GetFetchRangeSize(),
      uint64_t bufferSize =
          DC::Client::ClientConfiguration::Instance().GetMaxBufferedBytes(),
      uint64_t chunkSize =
          DC::Client::ClientConfiguration::Instance().GetTransferChunkSize())
      : fetchRangeSize(rangeSize),
        maxBufferedBytes(bufferSize),
        transferChunkSize(chunkSize) {}
};

//
// Bridge between a download of the source and an upload of the destination.
//
// A background thread fetches the source object in ranges of fetchRangeSize
// and queues the chunks into a bounded buffer, blocking while the buffer
// holds maxBufferedBytes or more. The upload reads the chunks in order.
//
// Only a few seek patterns are served from memory: seek to end, seek to
// current position, and seek back to the position before the last read.
// Any other seek stops the fetch thread and starts a new one at the offset.
//
class DaisyChain : public InputSource, private boost::noncopyable {
 public:
  // Start fetching from offset 0 at construction
  //
  // Throw DCException if fetch client is null or configure is invalid.
  DaisyChain(const DC::Client::ObjectURL &source, uint64_t sourceSize,
             const boost::shared_ptr<DC::Client::FetchClient> &fetchClient,
             const DaisyChainConfigure &configure = DaisyChainConfigure());

  // Stop fetch thread and wait for it to exit
  ~DaisyChain();

 public:
  // Read next chunk
  //
  // @param  : max bytes to read, no larger than transfer chunk size
  // @return : buffer, empty at end of stream or if amt is 0
  //
  // Throw InvalidRequestException if amt is larger than transfer chunk size,
  // or if the chunk available is larger than amt.
  // Throw FetchFailedException if fetch thread exited before delivering data.
  Buffer Read(size_t amt);

  // Throw InvalidRequestException except at end of stream
  Buffer Read();

  uint64_t Tell() const;

  // Seek
  //
  // @param  : offset, seek mode
  // @return : void
  //
  // FromEnd only accepts offset 0, otherwise throw InvalidRequestException.
  // FromStart accepts offset in [0, size], otherwise throw
  // InvalidRequestException. Other modes throw UnsupportedOperationException.
  void Seek(int64_t offset, SeekMode::Value mode = SeekMode::FromStart);

  bool Seekable() const { return true; }
  uint64_t GetSize() const { return m_sourceSize; }

  const DC::Client::ObjectURL &GetSource() const { return m_source; }
  const DaisyChainConfigure &GetConfigure() const { return m_configure; }

  // Bytes queued in buffer currently
  uint64_t GetBufferedBytes() const;

  // Count of fetch thread started, including the first one
  unsigned GetFetchStartCount() const;

 private:
  class ChunkWriter : public DownloadSink {
   public:
    explicit ChunkWriter(DaisyChain *chain) : m_chain(chain) {}
    void Write(const Buffer &chunk);

   private:
    DaisyChain *m_chain;
  };

  // Queue chunk, blocks while buffer is full
  void BufferChunk(const Buffer &chunk);

  // Drop all queued chunks, lock should be held
  void ClearBufferNoLock();

  // Check stop signal, clear it if set
  bool CheckAndClearStop();

  void StartFetch(uint64_t startByte);
  void StopFetch();
  // Fetch one range, end is -1 for end of object. A success that delivered
  // less than the range is a SHORT_READ error.
  DC::Client::ClientError<DC::Client::TransferError::Value> FetchOneRange(
      uint64_t start, int64_t end);
  void RunFetch(uint64_t startByte);

  void Restart(uint64_t offset);

 private:
  DC::Client::ObjectURL m_source;
  uint64_t m_sourceSize;
  boost::shared_ptr<DC::Client::FetchClient> m_fetchClient;
  DaisyChainConfigure m_configure;
  ChunkWriter m_writer;

  // Protects all the state below
  mutable boost::mutex m_lock;
  boost::condition_variable m_bufferNotFull;
  // Notified when a chunk is queued or fetch thread exits
  boost::condition_variable m_bufferNotEmpty;

  std::deque<Buffer> m_buffer;
  uint64_t m_bufferedBytes;
  uint64_t m_position;
  uint64_t m_lastPosition;
  Buffer m_lastChunk;  // chunk returned by the last read

  boost::scoped_ptr<boost::thread> m_fetchThread;
  bool m_stopFetch;
  bool m_fetchRunning;
  bool m_fetchFailed;
  uint64_t m_fetchedBytes;  // bytes queued by the current fetch thread
  DC::Client::ClientError<DC::Client::TransferError::Value> m_fetchError;
  unsigned m_fetchStartCount;
};

}  // namespace Data
}  // namespace DC

#endif  // DAISYCP_DATA_DAISYCHAIN_H_

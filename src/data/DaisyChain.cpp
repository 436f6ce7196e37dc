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

#include "data/DaisyChain.h"

#include <stddef.h>
#include <stdint.h>

#include <exception>
#include <string>
#include <vector>

#include "boost/bind.hpp"
#include "boost/exception/to_string.hpp"
#include "boost/thread/locks.hpp"

#include "base/Exception.h"
#include "base/LogMacros.h"
#include "base/StringUtils.h"
#include "client/FetchClient.h"

namespace DC {

namespace Data {

using boost::lock_guard;
using boost::mutex;
using boost::shared_ptr;
using boost::to_string;
using boost::unique_lock;
using DC::Client::ClientError;
using DC::Client::DownloadStrategy;
using DC::Client::FetchClient;
using DC::Client::GetMessageForTransferError;
using DC::Client::GoodTransferError;
using DC::Client::IsGoodTransferError;
using DC::Client::ObjectURL;
using DC::Client::TransferError;
using DC::Exception::DCException;
using DC::Exception::FetchFailedException;
using DC::Exception::InvalidRequestException;
using DC::Exception::UnsupportedOperationException;
using DC::StringUtils::FormatObject;
using DC::StringUtils::FormatRange;
using std::string;
using std::vector;

// --------------------------------------------------------------------------
void DaisyChain::ChunkWriter::Write(const Buffer &chunk) {
  m_chain->BufferChunk(chunk);
}

// --------------------------------------------------------------------------
DaisyChain::DaisyChain(const ObjectURL &source, uint64_t sourceSize,
                       const shared_ptr<FetchClient> &fetchClient,
                       const DaisyChainConfigure &configure)
    : m_source(source),
      m_sourceSize(sourceSize),
      m_fetchClient(fetchClient),
      m_configure(configure),
      m_writer(this),
      m_bufferedBytes(0),
      m_position(0),
      m_lastPosition(0),
      m_stopFetch(false),
      m_fetchRunning(false),
      m_fetchFailed(false),
      m_fetchedBytes(0),
      m_fetchStartCount(0) {
  if (!m_fetchClient) {
    throw DCException("Null fetch client for " + m_source.ToString());
  }
  if (m_configure.fetchRangeSize == 0 || m_configure.maxBufferedBytes == 0 ||
      m_configure.transferChunkSize == 0) {
    throw DCException("Invalid daisy chain configure [range=" +
                      to_string(m_configure.fetchRangeSize) + ", buffer=" +
                      to_string(m_configure.maxBufferedBytes) + ", chunk=" +
                      to_string(m_configure.transferChunkSize) + "]");
  }
  StartFetch(0);
}

// --------------------------------------------------------------------------
DaisyChain::~DaisyChain() { StopFetch(); }

// --------------------------------------------------------------------------
Buffer DaisyChain::Read(size_t amt) {
  unique_lock<mutex> lock(m_lock);
  if (m_position == m_sourceSize || amt == 0) {
    return Buffer(new vector<char>());
  }
  if (amt > m_configure.transferChunkSize) {
    throw InvalidRequestException(
        "Invalid read size " + to_string(amt) +
        " during daisy chain operation, expected <= " +
        to_string(m_configure.transferChunkSize));
  }

  while (m_buffer.empty() && m_fetchRunning) {
    m_bufferNotEmpty.wait(lock);
  }
  if (m_buffer.empty()) {
    string reason =
        m_fetchFailed ? GetMessageForTransferError(m_fetchError)
                      : "fetch ended before end of object at " +
                            to_string(m_position) + " of " +
                            to_string(m_sourceSize) + " bytes";
    throw FetchFailedException(reason + " " + FormatObject(m_source.ToString()));
  }

  Buffer chunk = m_buffer.front();
  m_buffer.pop_front();
  size_t len = chunk->size();
  m_bufferedBytes -= len;
  m_lastPosition = m_position;
  m_lastChunk = chunk;
  m_position += len;
  m_bufferNotFull.notify_all();

  if (len > amt) {
    throw InvalidRequestException(
        "Invalid read during daisy chain operation, got data of size " +
        to_string(len) + ", expected size " + to_string(amt));
  }
  return chunk;
}

// --------------------------------------------------------------------------
Buffer DaisyChain::Read() {
  {
    lock_guard<mutex> lock(m_lock);
    if (m_position == m_sourceSize) {
      return Buffer(new vector<char>());
    }
  }
  throw InvalidRequestException(
      "Invalid read with no size during daisy chain operation, expected <= " +
      to_string(m_configure.transferChunkSize));
}

// --------------------------------------------------------------------------
uint64_t DaisyChain::Tell() const {
  lock_guard<mutex> lock(m_lock);
  return m_position;
}

// --------------------------------------------------------------------------
uint64_t DaisyChain::GetBufferedBytes() const {
  lock_guard<mutex> lock(m_lock);
  return m_bufferedBytes;
}

// --------------------------------------------------------------------------
unsigned DaisyChain::GetFetchStartCount() const {
  lock_guard<mutex> lock(m_lock);
  return m_fetchStartCount;
}

// --------------------------------------------------------------------------
void DaisyChain::Seek(int64_t offset, SeekMode::Value mode) {
  if (mode == SeekMode::FromEnd) {
    if (offset != 0) {
      throw InvalidRequestException(
          "Invalid seek during daisy chain operation. Non-zero offset " +
          to_string(offset) + " from end is not supported");
    }
    lock_guard<mutex> lock(m_lock);
    m_lastPosition = m_position;
    m_lastChunk.reset();
    m_position = m_sourceSize;
    return;
  }

  if (mode != SeekMode::FromStart) {
    throw UnsupportedOperationException(
        "Daisy chain does not support seek mode " + to_string(mode));
  }

  if (offset < 0 || static_cast<uint64_t>(offset) > m_sourceSize) {
    throw InvalidRequestException("Invalid seek offset " + to_string(offset) +
                                  " during daisy chain operation, object size " +
                                  to_string(m_sourceSize));
  }

  uint64_t pos = static_cast<uint64_t>(offset);
  {
    lock_guard<mutex> lock(m_lock);
    if (pos == m_position && !m_fetchFailed) {
      return;
    } else if (pos == m_lastPosition && !m_fetchFailed) {
      m_position = m_lastPosition;
      if (m_lastChunk) {
        // seek to end and then back has no last chunk, the next read will
        // get it from the buffer
        m_bufferedBytes += m_lastChunk->size();
        m_buffer.push_front(m_lastChunk);
        m_lastChunk.reset();
        m_bufferNotEmpty.notify_all();
      }
      return;
    }
  }

  Restart(pos);
}

// --------------------------------------------------------------------------
void DaisyChain::Restart(uint64_t offset) {
  DebugInfo("Restart fetch at " + to_string(offset) + " " +
            FormatObject(m_source.ToString()));
  StopFetch();
  {
    lock_guard<mutex> lock(m_lock);
    m_position = offset;
    ClearBufferNoLock();
    // no history after restart
    m_lastPosition = offset;
    m_lastChunk.reset();
  }
  StartFetch(offset);
}

// --------------------------------------------------------------------------
void DaisyChain::BufferChunk(const Buffer &chunk) {
  if (!chunk || chunk->empty()) {
    return;
  }
  unique_lock<mutex> lock(m_lock);
  while (m_bufferedBytes >= m_configure.maxBufferedBytes && !m_stopFetch) {
    m_bufferNotFull.wait(lock);
  }
  if (m_stopFetch) {
    // fetch is going to restart, data is of no use
    return;
  }
  m_buffer.push_back(chunk);
  m_bufferedBytes += chunk->size();
  m_fetchedBytes += chunk->size();
  m_bufferNotEmpty.notify_all();
}

// --------------------------------------------------------------------------
void DaisyChain::ClearBufferNoLock() {
  m_buffer.clear();
  m_bufferedBytes = 0;
  m_bufferNotFull.notify_all();
}

// --------------------------------------------------------------------------
bool DaisyChain::CheckAndClearStop() {
  lock_guard<mutex> lock(m_lock);
  if (m_stopFetch) {
    m_stopFetch = false;
    return true;
  }
  return false;
}

// --------------------------------------------------------------------------
void DaisyChain::StartFetch(uint64_t startByte) {
  {
    lock_guard<mutex> lock(m_lock);
    m_stopFetch = false;
    m_fetchFailed = false;
    m_fetchError = GoodTransferError();
    m_fetchedBytes = 0;
    m_fetchRunning = true;
    ++m_fetchStartCount;
  }
  m_fetchThread.reset(new boost::thread(boost::bind(
      boost::type<void>(), &DaisyChain::RunFetch, this, startByte)));
}

// --------------------------------------------------------------------------
void DaisyChain::StopFetch() {
  {
    unique_lock<mutex> lock(m_lock);
    m_stopFetch = true;
    ClearBufferNoLock();
    while (m_fetchRunning) {
      m_bufferNotEmpty.wait(lock);
      ClearBufferNoLock();
    }
    m_stopFetch = false;
  }
  if (m_fetchThread) {
    m_fetchThread->join();
    m_fetchThread.reset();
  }
}

// --------------------------------------------------------------------------
ClientError<TransferError::Value> DaisyChain::FetchOneRange(uint64_t start,
                                                           int64_t end) {
  uint64_t before = 0;
  {
    lock_guard<mutex> lock(m_lock);
    before = m_fetchedBytes;
  }
  ClientError<TransferError::Value> err = m_fetchClient->GetObjectMedia(
      m_source, start, end, m_sourceSize, &m_writer, DownloadStrategy::OneShot);
  if (!IsGoodTransferError(err)) {
    return err;
  }

  uint64_t expected =
      end < 0 ? m_sourceSize - start : static_cast<uint64_t>(end) - start + 1;
  lock_guard<mutex> lock(m_lock);
  uint64_t got = m_fetchedBytes - before;
  if (got != expected && !m_stopFetch) {
    // chunks dropped on stop are not counted, so only check a live fetch
    return ClientError<TransferError::Value>(
        TransferError::SHORT_READ, "GetObjectMedia",
        "got " + to_string(got) + " of " + to_string(expected) + " bytes",
        true);
  }
  return err;
}

// --------------------------------------------------------------------------
void DaisyChain::RunFetch(uint64_t startByte) {
  uint64_t rangeSize = m_configure.fetchRangeSize;
  uint64_t start = startByte;
  ClientError<TransferError::Value> err = GoodTransferError();
  bool stopped = false;
  try {
    while (start + rangeSize < m_sourceSize) {
      if (CheckAndClearStop()) {
        stopped = true;
        break;
      }
      err = FetchOneRange(start, static_cast<int64_t>(start + rangeSize - 1));
      if (!IsGoodTransferError(err)) {
        break;
      }
      start += rangeSize;
    }
    if (!stopped && IsGoodTransferError(err)) {
      if (CheckAndClearStop()) {
        stopped = true;
      } else if (start < m_sourceSize) {
        err = FetchOneRange(start, -1);
      }
    }
  } catch (const std::exception &e) {
    err = ClientError<TransferError::Value>(
        TransferError::FETCH_FAILED, "GetObjectMedia", e.what(), false);
  }

  lock_guard<mutex> lock(m_lock);
  if (!stopped && !m_stopFetch && !IsGoodTransferError(err)) {
    m_fetchFailed = true;
    m_fetchError = err;
    Error("Fail to fetch " + FormatObject(m_source.ToString()) + " " +
          FormatRange(static_cast<int64_t>(start), -1) + " " +
          GetMessageForTransferError(err));
  }
  m_fetchRunning = false;
  m_bufferNotEmpty.notify_all();
  m_bufferNotFull.notify_all();
}

}  // namespace Data
}  // namespace DC

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

#ifndef DAISYCP_TEST_TESTCLIENTS_H_
#define DAISYCP_TEST_TESTCLIENTS_H_

#include <stddef.h>
#include <stdint.h>

#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "boost/exception/to_string.hpp"
#include "boost/thread/locks.hpp"
#include "boost/thread/mutex.hpp"

#include "client/ClientError.hpp"
#include "client/FetchClient.h"
#include "client/MultipartUploadClient.h"
#include "client/ObjectURL.h"
#include "client/RetryStrategy.h"
#include "client/TransferError.h"
#include "client/UploadClient.h"
#include "data/DownloadSink.h"
#include "data/InputSource.h"
#include "data/StreamBuf.h"

namespace DC {

namespace Client {

// Object content of given size, byte i is 'a' + i % 26
inline std::string MakeContent(size_t size) {
  std::string content(size, 'a');
  for (size_t i = 0; i < size; ++i) {
    content[i] = static_cast<char>('a' + i % 26);
  }
  return content;
}

inline std::string BufferToString(const DC::Data::Buffer &buf) {
  return buf ? std::string(buf->begin(), buf->end()) : std::string();
}

typedef std::pair<uint64_t, int64_t> FetchRange;  // start, end (-1 for eof)

//
// Fetch client serving an object from memory.
//
// Bytes of a range are written to the sink in pieces of pieceSize. Failure
// or a short but successful response can be injected for a given call,
// counted from 0.
//
class MemoryFetchClient : public FetchClient {
 public:
  MemoryFetchClient(const std::string &content, size_t pieceSize,
                    const std::string &eTag = "etag-1")
      : FetchClient(RetryStrategy(0, 1)),
        m_content(content),
        m_pieceSize(pieceSize),
        m_eTag(eTag),
        m_exists(true),
        m_failCall(-1),
        m_throwCall(-1),
        m_truncateCall(-1),
        m_truncateBytes(0),
        m_calls(0) {}

 public:
  ClientError<TransferError::Value> HeadObject(const ObjectURL &url,
                                               ObjectInfo *info) {
    boost::lock_guard<boost::mutex> lock(m_lock);
    if (!m_exists) {
      return ClientError<TransferError::Value>(
          TransferError::NOT_FOUND, "HeadObject", url.ToString(), false);
    }
    info->size = m_content.size();
    info->eTag = m_eTag;
    return GoodTransferError();
  }

  ClientError<TransferError::Value> GetObjectMedia(
      const ObjectURL &url, uint64_t startByte, int64_t endByte,
      uint64_t objectSize, DC::Data::DownloadSink *sink,
      DownloadStrategy::Value strategy) {
    uint64_t last = 0;
    {
      boost::lock_guard<boost::mutex> lock(m_lock);
      int call = m_calls++;
      m_ranges.push_back(FetchRange(startByte, endByte));
      if (url.HasGeneration() && url.GetGeneration() != m_eTag) {
        return ClientError<TransferError::Value>(
            TransferError::SOURCE_CHANGED, "GetObjectMedia", url.ToString(),
            false);
      }
      if (call == m_throwCall) {
        throw std::runtime_error("connection reset");
      }
      if (call == m_failCall) {
        return ClientError<TransferError::Value>(
            TransferError::SDK_REQUEST_SEND_ERROR, "GetObjectMedia",
            "injected failure", true);
      }
      last = endByte < 0 ? m_content.size()
                         : static_cast<uint64_t>(endByte) + 1;
      if (last > m_content.size()) {
        last = m_content.size();
      }
      if (call == m_truncateCall && startByte + m_truncateBytes < last) {
        last = startByte + m_truncateBytes;
      }
    }

    // write without holding the lock, the sink may block
    for (uint64_t pos = startByte; pos < last; pos += m_pieceSize) {
      uint64_t len = last - pos < m_pieceSize ? last - pos : m_pieceSize;
      DC::Data::Buffer piece(new std::vector<char>(
          m_content.begin() + pos, m_content.begin() + pos + len));
      sink->Write(piece);
    }
    return GoodTransferError();
  }

 public:
  std::vector<FetchRange> GetRanges() const {
    boost::lock_guard<boost::mutex> lock(m_lock);
    return m_ranges;
  }

  int GetCallCount() const {
    boost::lock_guard<boost::mutex> lock(m_lock);
    return m_calls;
  }

  void SetETag(const std::string &eTag) {
    boost::lock_guard<boost::mutex> lock(m_lock);
    m_eTag = eTag;
  }

  void SetExists(bool exists) {
    boost::lock_guard<boost::mutex> lock(m_lock);
    m_exists = exists;
  }

  void FailCall(int call) {
    boost::lock_guard<boost::mutex> lock(m_lock);
    m_failCall = call;
  }

  void ThrowAtCall(int call) {
    boost::lock_guard<boost::mutex> lock(m_lock);
    m_throwCall = call;
  }

  // Write only the first bytes of the range and still report success
  void TruncateCall(int call, uint64_t bytes) {
    boost::lock_guard<boost::mutex> lock(m_lock);
    m_truncateCall = call;
    m_truncateBytes = bytes;
  }

 private:
  std::string m_content;
  size_t m_pieceSize;
  std::string m_eTag;
  bool m_exists;
  int m_failCall;
  int m_throwCall;
  int m_truncateCall;
  uint64_t m_truncateBytes;
  int m_calls;
  std::vector<FetchRange> m_ranges;
  mutable boost::mutex m_lock;
};

//
// Upload client keeping objects in memory.
//
// Reads the source in chunks of chunkSize. With an interruption set, once
// interruptAt bytes are received the upload drops what it has after
// resumeAt and seeks the source back there, like a resumable upload which
// resumes from the offset the server has persisted.
//
class MemoryUploadClient : public UploadClient {
 public:
  explicit MemoryUploadClient(size_t chunkSize)
      : UploadClient(RetryStrategy(0, 1)),
        m_chunkSize(chunkSize),
        m_interruptAt(0),
        m_resumeAt(0),
        m_interrupted(true),
        m_failError(TransferError::GOOD) {}

 public:
  ClientError<TransferError::Value> UploadObject(
      const ObjectURL &dest, DC::Data::InputSource *source,
      uint64_t *bytesUploaded) {
    if (m_failError != TransferError::GOOD) {
      return ClientError<TransferError::Value>(m_failError, "UploadObject",
                                               dest.ToString(), false);
    }
    std::string data;
    for (;;) {
      DC::Data::Buffer chunk = source->Read(m_chunkSize);
      if (!chunk || chunk->empty()) {
        break;
      }
      data.append(chunk->begin(), chunk->end());
      if (!m_interrupted && data.size() >= m_interruptAt) {
        m_interrupted = true;
        data.resize(m_resumeAt);
        source->Seek(static_cast<int64_t>(m_resumeAt));
      }
    }
    m_objects[dest.ToString()] = data;
    if (bytesUploaded != NULL) {
      *bytesUploaded = data.size();
    }
    return GoodTransferError();
  }

 public:
  void InterruptOnce(uint64_t interruptAt, uint64_t resumeAt) {
    m_interruptAt = interruptAt;
    m_resumeAt = resumeAt;
    m_interrupted = false;
  }

  void FailWith(TransferError::Value err) { m_failError = err; }

  bool HasObject(const ObjectURL &dest) const {
    return m_objects.find(dest.ToString()) != m_objects.end();
  }

  std::string GetObject(const ObjectURL &dest) const {
    std::map<std::string, std::string>::const_iterator it =
        m_objects.find(dest.ToString());
    return it == m_objects.end() ? std::string() : it->second;
  }

 private:
  size_t m_chunkSize;
  uint64_t m_interruptAt;
  uint64_t m_resumeAt;
  bool m_interrupted;
  TransferError::Value m_failError;
  std::map<std::string, std::string> m_objects;
};

//
// Multipart upload client keeping parts in memory.
//
// Failures can be injected for the first attempts of a part, of initiate
// and of complete.
//
class MemoryMultipartClient : public MultipartUploadClient {
 public:
  MemoryMultipartClient(const UploadClientConfigure &configure,
                        RetryStrategy retryStrategy)
      : MultipartUploadClient(configure, retryStrategy),
        m_puts(0),
        m_initiates(0),
        m_completes(0),
        m_failInitiate(0),
        m_failComplete(0),
        m_failPart(0),
        m_failPartTimes(0),
        m_failPartRetryable(true),
        m_nextUploadId(1) {}

 public:
  void FailPart(int partNumber, int times, bool retryable) {
    m_failPart = partNumber;
    m_failPartTimes = times;
    m_failPartRetryable = retryable;
  }

  void FailInitiate(int times) { m_failInitiate = times; }
  void FailComplete(int times) { m_failComplete = times; }

  int GetPutCount() const { return m_puts; }
  int GetInitiateCount() const { return m_initiates; }
  int GetCompleteCount() const { return m_completes; }
  int GetPartAttempts(int partNumber) const {
    std::map<int, int>::const_iterator it = m_partAttempts.find(partNumber);
    return it == m_partAttempts.end() ? 0 : it->second;
  }
  const std::vector<std::string> &GetAbortedUploads() const {
    return m_aborted;
  }
  // sizes of the parts of the last upload, in part number order
  std::vector<uint64_t> GetPartSizes() const {
    std::vector<uint64_t> sizes;
    for (std::map<int, std::string>::const_iterator it = m_parts.begin();
         it != m_parts.end(); ++it) {
      sizes.push_back(it->second.size());
    }
    return sizes;
  }

  bool HasObject(const ObjectURL &dest) const {
    return m_objects.find(dest.ToString()) != m_objects.end();
  }

  std::string GetObject(const ObjectURL &dest) const {
    std::map<std::string, std::string>::const_iterator it =
        m_objects.find(dest.ToString());
    return it == m_objects.end() ? std::string() : it->second;
  }

 protected:
  ClientError<TransferError::Value> DoPutObject(const ObjectURL &dest,
                                                const DC::Data::Buffer &body,
                                                uint64_t size) {
    ++m_puts;
    std::string data;
    if (size > 0) {
      data.assign(body->begin(), body->begin() + size);
    }
    m_objects[dest.ToString()] = data;
    return GoodTransferError();
  }

  ClientError<TransferError::Value> DoInitiateMultipartUpload(
      const ObjectURL &dest, std::string *uploadId) {
    ++m_initiates;
    if (m_failInitiate > 0) {
      --m_failInitiate;
      return SendError("InitiateMultipartUpload", dest, true);
    }
    *uploadId = "upload-" + boost::to_string(m_nextUploadId++);
    m_parts.clear();
    return GoodTransferError();
  }

  ClientError<TransferError::Value> DoUploadPart(const ObjectURL &dest,
                                                 const std::string &uploadId,
                                                 int partNumber,
                                                 const DC::Data::Buffer &part,
                                                 uint64_t partLen) {
    ++m_partAttempts[partNumber];
    if (partNumber == m_failPart && m_failPartTimes > 0) {
      --m_failPartTimes;
      return SendError("UploadPart", dest, m_failPartRetryable);
    }
    m_parts[partNumber] = std::string(part->begin(), part->begin() + partLen);
    return GoodTransferError();
  }

  ClientError<TransferError::Value> DoCompleteMultipartUpload(
      const ObjectURL &dest, const std::string &uploadId,
      const std::vector<int> &sortedPartIds) {
    ++m_completes;
    if (m_failComplete > 0) {
      --m_failComplete;
      return SendError("CompleteMultipartUpload", dest, true);
    }
    std::string data;
    for (size_t i = 0; i < sortedPartIds.size(); ++i) {
      data += m_parts[sortedPartIds[i]];
    }
    m_objects[dest.ToString()] = data;
    return GoodTransferError();
  }

  void DoAbortMultipartUpload(const ObjectURL &dest,
                              const std::string &uploadId) {
    m_aborted.push_back(uploadId);
  }

 private:
  static ClientError<TransferError::Value> SendError(const std::string &op,
                                                     const ObjectURL &dest,
                                                     bool retryable) {
    return ClientError<TransferError::Value>(
        retryable ? TransferError::SDK_REQUEST_SEND_ERROR
                  : TransferError::PERMISSION_DENIED,
        op, dest.ToString(), retryable);
  }

 private:
  int m_puts;
  int m_initiates;
  int m_completes;
  int m_failInitiate;
  int m_failComplete;
  int m_failPart;
  int m_failPartTimes;
  bool m_failPartRetryable;
  int m_nextUploadId;
  std::map<int, int> m_partAttempts;
  std::map<int, std::string> m_parts;
  std::vector<std::string> m_aborted;
  std::map<std::string, std::string> m_objects;
};

}  // namespace Client
}  // namespace DC

#endif  // DAISYCP_TEST_TESTCLIENTS_H_

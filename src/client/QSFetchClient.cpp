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

#include "client/QSFetchClient.h"

#include <stdint.h>

#include <iostream>
#include <string>
#include <vector>

#include "boost/exception/to_string.hpp"
#include "boost/shared_ptr.hpp"

#include "qingstor/Bucket.h"

#include "base/Exception.h"
#include "base/LogMacros.h"
#include "base/StringUtils.h"
#include "client/QSClientImpl.h"
#include "client/QSClientOutcome.h"
#include "client/Utils.h"
#include "data/DownloadSink.h"
#include "data/StreamBuf.h"

namespace DC {

namespace Client {

using boost::shared_ptr;
using boost::to_string;
using DC::Client::Utils::BuildRequestRange;
using DC::Client::Utils::BuildRequestRangeStart;
using DC::Data::Buffer;
using DC::Data::DownloadSink;
using DC::Exception::DCException;
using DC::StringUtils::FormatObject;
using DC::StringUtils::FormatRange;
using QingStor::GetObjectInput;
using QingStor::GetObjectOutput;
using QingStor::HeadObjectInput;
using QingStor::HeadObjectOutput;
using std::iostream;
using std::string;
using std::vector;

// --------------------------------------------------------------------------
QSFetchClient::QSFetchClient(const shared_ptr<QSClientImpl> &impl,
                             uint64_t transferChunkSize,
                             RetryStrategy retryStrategy)
    : FetchClient(retryStrategy),
      m_impl(impl),
      m_transferChunkSize(transferChunkSize) {
  if (!m_impl) {
    throw DCException("QSFetchClient is initialized with null QSClientImpl");
  }
  if (m_transferChunkSize == 0) {
    throw DCException("QSFetchClient is initialized with zero chunk size");
  }
}

// --------------------------------------------------------------------------
ClientError<TransferError::Value> QSFetchClient::HeadObject(
    const ObjectURL &url, ObjectInfo *info) {
  HeadObjectInput input;  // dummy input
  uint16_t attempted = 0;
  HeadObjectOutcome outcome = m_impl->HeadObject(url.GetKey(), &input);
  while (!outcome.IsSuccess() &&
         GetRetryStrategy().ShouldRetry(outcome.GetError(), attempted)) {
    BackoffBeforeRetry(++attempted);
    DebugInfo("Retry head object " + FormatObject(url.ToString()));
    outcome = m_impl->HeadObject(url.GetKey(), &input);
  }

  if (!outcome.IsSuccess()) {
    return outcome.GetError();
  }
  HeadObjectOutput &res = outcome.GetResult();
  if (url.HasGeneration() && res.GetETag() != url.GetGeneration()) {
    return ClientError<TransferError::Value>(
        TransferError::SOURCE_CHANGED, "QingStorHeadObject",
        "generation " + url.GetGeneration() + " not match " + res.GetETag(),
        false);
  }
  if (info != NULL) {
    info->size = static_cast<uint64_t>(res.GetContentLength());
    info->eTag = res.GetETag();
  }
  return GoodTransferError();
}

// --------------------------------------------------------------------------
ClientError<TransferError::Value> QSFetchClient::GetObjectMedia(
    const ObjectURL &url, uint64_t startByte, int64_t endByte,
    uint64_t objectSize, DownloadSink *sink, DownloadStrategy::Value strategy) {
  if (sink == NULL) {
    return ClientError<TransferError::Value>(
        TransferError::PARAMETER_MISSING, "GetObjectMedia",
        "Null download sink " + FormatObject(url.ToString()), false);
  }
  uint64_t stopByte =
      endByte < 0 ? objectSize : static_cast<uint64_t>(endByte) + 1;
  if (startByte >= stopByte) {
    // nothing to fetch, e.g. an empty object
    return GoodTransferError();
  }

  uint64_t nextByte = startByte;
  uint16_t attempted = 0;
  while (true) {
    uint64_t reqStart = nextByte;
    ClientError<TransferError::Value> err =
        FetchRange(url, reqStart, endByte, sink, &nextByte);
    if (IsGoodTransferError(err)) {
      return err;
    }

    // a one shot fetch can not resume once bytes are written into sink
    bool canRetry =
        strategy == DownloadStrategy::Resumable || nextByte == startByte;
    if (!canRetry || !GetRetryStrategy().ShouldRetry(err, attempted)) {
      return err;
    }
    if (nextByte > reqStart) {
      attempted = 0;  // made progress
    }
    BackoffBeforeRetry(++attempted);
    DebugInfo("Retry fetch " + FormatObject(url.ToString()) + " " +
              FormatRange(static_cast<int64_t>(nextByte), endByte));
  }
}

// --------------------------------------------------------------------------
ClientError<TransferError::Value> QSFetchClient::FetchRange(
    const ObjectURL &url, uint64_t startByte, int64_t endByte,
    DownloadSink *sink, uint64_t *nextByte) {
  GetObjectInput input;
  input.SetRange(endByte < 0
                     ? BuildRequestRangeStart(startByte)
                     : BuildRequestRange(startByte,
                                         static_cast<uint64_t>(endByte)));
  if (url.HasGeneration()) {
    input.SetIfMatch(url.GetGeneration());
  }

  GetObjectOutcome outcome = m_impl->GetObject(url.GetKey(), &input);
  if (!outcome.IsSuccess()) {
    return outcome.GetError();
  }

  GetObjectOutput &res = outcome.GetResult();
  if (url.HasGeneration() && res.GetETag() != url.GetGeneration()) {
    return ClientError<TransferError::Value>(
        TransferError::SOURCE_CHANGED, "QingStorGetObject",
        "generation " + url.GetGeneration() + " not match " + res.GetETag(),
        false);
  }

  uint64_t expected = static_cast<uint64_t>(res.GetContentLength());
  uint64_t received = 0;
  iostream *body = res.GetBody();
  if (body != NULL) {
    body->seekg(0, std::ios_base::beg);
    while (received < expected && body->good()) {
      uint64_t len = expected - received < m_transferChunkSize
                         ? expected - received
                         : m_transferChunkSize;
      Buffer chunk(new vector<char>(len));
      body->read(&(*chunk)[0], static_cast<std::streamsize>(len));
      std::streamsize got = body->gcount();
      if (got <= 0) {
        break;
      }
      chunk->resize(static_cast<size_t>(got));
      sink->Write(chunk);
      received += static_cast<uint64_t>(got);
      *nextByte += static_cast<uint64_t>(got);
    }
  }

  if (received < expected) {
    return ClientError<TransferError::Value>(
        TransferError::SHORT_READ, "QingStorGetObject",
        "received " + to_string(received) + " of " + to_string(expected) +
            " bytes " + FormatRange(static_cast<int64_t>(startByte), endByte),
        true);
  }
  return GoodTransferError();
}

}  // namespace Client
}  // namespace DC

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

#include "client/MultipartUploadClient.h"

#include <stdint.h>

#include <string>
#include <vector>

#include "boost/exception/to_string.hpp"
#include "boost/foreach.hpp"

#include "base/Exception.h"
#include "base/LogMacros.h"
#include "base/StringUtils.h"
#include "client/SourceReader.h"
#include "client/Utils.h"
#include "data/InputSource.h"

namespace DC {

namespace Client {

using boost::to_string;
using DC::Client::Utils::AdjustPartSize;
using DC::Client::Utils::CutParts;
using DC::Client::Utils::PartRange;
using DC::Data::Buffer;
using DC::Data::InputSource;
using DC::Exception::DCException;
using DC::StringUtils::FormatObject;
using std::string;
using std::vector;

// --------------------------------------------------------------------------
MultipartUploadClient::MultipartUploadClient(
    const UploadClientConfigure &configure, RetryStrategy retryStrategy)
    : UploadClient(retryStrategy), m_configure(configure) {
  if (m_configure.transferChunkSize == 0) {
    throw DCException("Upload client is initialized with zero chunk size");
  }
  if (m_configure.partSize == 0) {
    throw DCException("Upload client is initialized with zero part size");
  }
}

// --------------------------------------------------------------------------
ClientError<TransferError::Value> MultipartUploadClient::UploadObject(
    const ObjectURL &dest, InputSource *source, uint64_t *bytesUploaded) {
  if (source == NULL) {
    return ClientError<TransferError::Value>(
        TransferError::PARAMETER_MISSING, "UploadObject",
        "Null source " + FormatObject(dest.ToString()), false);
  }
  if (bytesUploaded != NULL) {
    *bytesUploaded = 0;
  }

  uint64_t start = source->Tell();
  uint64_t size = source->GetSize() - start;
  SourceReader reader(source, m_configure.transferChunkSize);
  if (size <= m_configure.multipartThreshold) {
    return PutObject(dest, &reader, start, size, bytesUploaded);
  } else {
    return MultipartUpload(dest, &reader, start, size, bytesUploaded);
  }
}

// --------------------------------------------------------------------------
ClientError<TransferError::Value> MultipartUploadClient::PutObject(
    const ObjectURL &dest, SourceReader *reader, uint64_t start, uint64_t size,
    uint64_t *bytesUploaded) {
  uint16_t attempted = 0;
  while (true) {
    if (attempted > 0) {
      reader->Rewind(start);
    }
    Buffer body;
    ClientError<TransferError::Value> err = reader->ReadExactly(size, &body);
    if (IsGoodTransferError(err)) {
      err = DoPutObject(dest, body, size);
      if (IsGoodTransferError(err)) {
        if (bytesUploaded != NULL) {
          *bytesUploaded = size;
        }
        return err;
      }
    }

    if (!GetRetryStrategy().ShouldRetry(err, attempted)) {
      return err;
    }
    BackoffBeforeRetry(++attempted);
    DebugInfo("Retry put object " + FormatObject(dest.ToString()) + " " +
              GetMessageForTransferError(err));
  }
}

// --------------------------------------------------------------------------
ClientError<TransferError::Value> MultipartUploadClient::MultipartUpload(
    const ObjectURL &dest, SourceReader *reader, uint64_t start, uint64_t size,
    uint64_t *bytesUploaded) {
  uint64_t partSize =
      AdjustPartSize(size, m_configure.partSize, m_configure.maxPartCount);
  if (partSize != m_configure.partSize) {
    Warning("Enlarge part size to " + to_string(partSize) +
            " bytes to upload " + FormatObject(dest.ToString()) + " in " +
            to_string(m_configure.maxPartCount) + " parts");
  }

  string uploadId;
  uint16_t attempted = 0;
  ClientError<TransferError::Value> err =
      DoInitiateMultipartUpload(dest, &uploadId);
  while (!IsGoodTransferError(err) &&
         GetRetryStrategy().ShouldRetry(err, attempted)) {
    BackoffBeforeRetry(++attempted);
    err = DoInitiateMultipartUpload(dest, &uploadId);
  }
  if (!IsGoodTransferError(err)) {
    return err;
  }

  vector<PartRange> parts =
      CutParts(start, size, partSize, m_configure.minPartSize);
  vector<int> partIds;
  uint64_t uploaded = 0;
  try {
    int partNumber = 1;
    BOOST_FOREACH (const PartRange &part, parts) {
      err = UploadPart(dest, uploadId, partNumber, reader, part.first,
                       part.second);
      if (!IsGoodTransferError(err)) {
        Error("Fail to upload part " + to_string(partNumber) + " " +
              FormatObject(dest.ToString()) + " " +
              GetMessageForTransferError(err));
        DoAbortMultipartUpload(dest, uploadId);
        return err;
      }
      partIds.push_back(partNumber);
      uploaded += part.second;
      ++partNumber;
    }
  } catch (const DCException &) {
    DoAbortMultipartUpload(dest, uploadId);
    throw;
  }

  attempted = 0;
  err = DoCompleteMultipartUpload(dest, uploadId, partIds);
  while (!IsGoodTransferError(err) &&
         GetRetryStrategy().ShouldRetry(err, attempted)) {
    BackoffBeforeRetry(++attempted);
    err = DoCompleteMultipartUpload(dest, uploadId, partIds);
  }
  if (!IsGoodTransferError(err)) {
    Error("Fail to complete multipart upload " + uploadId + " " +
          FormatObject(dest.ToString()) + " " +
          GetMessageForTransferError(err));
    DoAbortMultipartUpload(dest, uploadId);
    return err;
  }
  if (bytesUploaded != NULL) {
    *bytesUploaded = uploaded;
  }
  return err;
}

// --------------------------------------------------------------------------
ClientError<TransferError::Value> MultipartUploadClient::UploadPart(
    const ObjectURL &dest, const string &uploadId, int partNumber,
    SourceReader *reader, uint64_t offset, uint64_t len) {
  ClientError<TransferError::Value> err = GoodTransferError();
  uint16_t attempted = 0;
  while (true) {
    if (attempted > 0 || reader->Tell() != offset) {
      reader->Rewind(offset);
    }
    Buffer body;
    err = reader->ReadExactly(len, &body);
    if (IsGoodTransferError(err)) {
      err = DoUploadPart(dest, uploadId, partNumber, body, len);
    }
    if (IsGoodTransferError(err) ||
        !GetRetryStrategy().ShouldRetry(err, attempted)) {
      return err;
    }
    BackoffBeforeRetry(++attempted);
    DebugInfo("Retry part " + to_string(partNumber) + " " +
              FormatObject(dest.ToString()) + " " +
              GetMessageForTransferError(err));
  }
}

}  // namespace Client
}  // namespace DC

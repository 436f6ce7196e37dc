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

#include "client/QSUploadClient.h"

#include <stdint.h>

#include <string>
#include <vector>

#include "boost/exception/to_string.hpp"
#include "boost/foreach.hpp"
#include "boost/shared_ptr.hpp"

#include "qingstor/Bucket.h"
#include "qingstor/types/ObjectPartType.h"

#include "base/Exception.h"
#include "base/LogMacros.h"
#include "client/QSClientImpl.h"
#include "client/QSClientOutcome.h"
#include "configure/Default.h"
#include "data/IOStream.h"

namespace DC {

namespace Client {

using boost::shared_ptr;
using boost::to_string;
using DC::Configure::Default::GetPutObjectMaxSize;
using DC::Configure::Default::GetUploadMultipartMaxPartSize;
using DC::Configure::Default::GetUploadMultipartMinPartSize;
using DC::Data::Buffer;
using DC::Data::IOStream;
using DC::Exception::DCException;
using QingStor::AbortMultipartUploadInput;
using QingStor::CompleteMultipartUploadInput;
using QingStor::InitiateMultipartUploadInput;
using QingStor::ObjectPartType;
using QingStor::PutObjectInput;
using QingStor::UploadMultipartInput;
using std::string;
using std::vector;

namespace {

const char *const kContentType = "application/octet-stream";

}  // namespace

// --------------------------------------------------------------------------
QSUploadClient::QSUploadClient(const shared_ptr<QSClientImpl> &impl,
                               const UploadClientConfigure &configure,
                               RetryStrategy retryStrategy)
    : MultipartUploadClient(configure, retryStrategy), m_impl(impl) {
  if (!m_impl) {
    throw DCException("QSUploadClient is initialized with null QSClientImpl");
  }
  uint64_t partSize = GetConfigure().partSize;
  if (partSize < GetUploadMultipartMinPartSize() ||
      partSize > GetUploadMultipartMaxPartSize()) {
    throw DCException("Invalid upload part size " + to_string(partSize) +
                      ", expected [" +
                      to_string(GetUploadMultipartMinPartSize()) + ", " +
                      to_string(GetUploadMultipartMaxPartSize()) + "]");
  }
  if (GetConfigure().multipartThreshold > GetPutObjectMaxSize()) {
    SetMultipartThreshold(GetPutObjectMaxSize());
  }
}

// --------------------------------------------------------------------------
ClientError<TransferError::Value> QSUploadClient::DoPutObject(
    const ObjectURL &dest, const Buffer &body, uint64_t size) {
  PutObjectInput input;
  input.SetContentLength(static_cast<int64_t>(size));
  input.SetContentType(kContentType);
  IOStream stream(body, size);
  if (size > 0) {
    input.SetBody(&stream);
  }
  PutObjectOutcome outcome = m_impl->PutObject(dest.GetKey(), &input);
  return outcome.IsSuccess() ? GoodTransferError() : outcome.GetError();
}

// --------------------------------------------------------------------------
ClientError<TransferError::Value> QSUploadClient::DoInitiateMultipartUpload(
    const ObjectURL &dest, string *uploadId) {
  InitiateMultipartUploadInput input;
  input.SetContentType(kContentType);
  InitiateMultipartUploadOutcome outcome =
      m_impl->InitiateMultipartUpload(dest.GetKey(), &input);
  if (!outcome.IsSuccess()) {
    return outcome.GetError();
  }
  *uploadId = outcome.GetResult().GetUploadID();
  return GoodTransferError();
}

// --------------------------------------------------------------------------
ClientError<TransferError::Value> QSUploadClient::DoUploadPart(
    const ObjectURL &dest, const string &uploadId, int partNumber,
    const Buffer &part, uint64_t partLen) {
  UploadMultipartInput input;
  input.SetUploadID(uploadId);
  input.SetPartNumber(partNumber);
  input.SetContentLength(static_cast<int64_t>(partLen));
  IOStream stream(part, partLen);
  if (partLen > 0) {
    input.SetBody(&stream);
  }

  UploadMultipartOutcome outcome =
      m_impl->UploadMultipart(dest.GetKey(), &input);
  return outcome.IsSuccess() ? GoodTransferError() : outcome.GetError();
}

// --------------------------------------------------------------------------
ClientError<TransferError::Value> QSUploadClient::DoCompleteMultipartUpload(
    const ObjectURL &dest, const string &uploadId,
    const vector<int> &sortedPartIds) {
  CompleteMultipartUploadInput input;
  input.SetUploadID(uploadId);
  vector<ObjectPartType> objParts;
  BOOST_FOREACH (int partId, sortedPartIds) {
    ObjectPartType part;
    part.SetPartNumber(partId);
    objParts.push_back(part);
  }
  input.SetObjectParts(objParts);

  CompleteMultipartUploadOutcome outcome =
      m_impl->CompleteMultipartUpload(dest.GetKey(), &input);
  return outcome.IsSuccess() ? GoodTransferError() : outcome.GetError();
}

// --------------------------------------------------------------------------
void QSUploadClient::DoAbortMultipartUpload(const ObjectURL &dest,
                                            const string &uploadId) {
  AbortMultipartUploadInput input;
  input.SetUploadID(uploadId);
  AbortMultipartUploadOutcome outcome =
      m_impl->AbortMultipartUpload(dest.GetKey(), &input);
  ErrorIf(!outcome.IsSuccess(),
          "Fail to abort multipart upload " + uploadId + " " +
              GetMessageForTransferError(outcome.GetError()));
}

}  // namespace Client
}  // namespace DC

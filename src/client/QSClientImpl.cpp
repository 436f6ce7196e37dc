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

#include "client/QSClientImpl.h"

#include <stdint.h>

#include <string>

#include "boost/shared_ptr.hpp"

#include "qingstor/Bucket.h"
#include "qingstor/HttpCommon.h"
#include "qingstor/QsConfig.h"
#include "qingstor/QsErrors.h"  // for sdk QsError
#include "qingstor/Types.h"     // for sdk QsOutput

#include "base/Exception.h"
#include "base/LogMacros.h"
#include "base/StringUtils.h"
#include "client/SDKError.h"
#include "client/Utils.h"

namespace DC {

namespace Client {

using boost::shared_ptr;
using DC::Client::Utils::ParseRequestContentRange;
using DC::Exception::DCException;
using DC::StringUtils::FormatObject;
using QingStor::AbortMultipartUploadInput;
using QingStor::AbortMultipartUploadOutput;
using QingStor::Bucket;
using QingStor::CompleteMultipartUploadInput;
using QingStor::CompleteMultipartUploadOutput;
using QingStor::GetObjectInput;
using QingStor::GetObjectOutput;
using QingStor::HeadObjectInput;
using QingStor::HeadObjectOutput;
using QingStor::Http::HttpResponseCode;
using QingStor::InitiateMultipartUploadInput;
using QingStor::InitiateMultipartUploadOutput;
using QingStor::PutObjectInput;
using QingStor::PutObjectOutput;
using QingStor::QsConfig;
using QingStor::QsOutput;
using QingStor::UploadMultipartInput;
using QingStor::UploadMultipartOutput;
using std::string;

namespace {

// --------------------------------------------------------------------------
TransferClientError BuildTransferError(QsError sdkErr,
                                       const string &exceptionName,
                                       const QsOutput &output, bool retryable) {
  HttpResponseCode rspCode = const_cast<QsOutput &>(output).GetResponseCode();
  TransferError::Value err = SDKResponseToTransferError(sdkErr, rspCode);

  string errMsg = SDKResponseCodeToString(rspCode);
  if (sdkErr == QS_ERR_UNEXCEPTED_RESPONSE) {
    // error info of sdk may be empty, response code goes first
    QingStor::ResponseErrorInfo errInfo = output.GetResponseErrInfo();
    errMsg += "[code:" + errInfo.code + "; message:" + errInfo.message +
              "; request:" + errInfo.requestID + "; url:" + errInfo.url + "]";
  }
  return TransferClientError(err, exceptionName, errMsg, retryable);
}

// --------------------------------------------------------------------------
// Check request parameters, return a good error if they are valid
template <typename InputType>
TransferClientError CheckRequest(const string &objKey, const InputType *input,
                                 const char *inputName, string *exceptionName) {
  if (objKey.empty()) {
    return TransferClientError(TransferError::PARAMETER_MISSING,
                               *exceptionName, "Empty ObjectKey", false);
  }
  exceptionName->append(" ");
  exceptionName->append(FormatObject(objKey));
  if (input == NULL) {
    return TransferClientError(TransferError::PARAMETER_MISSING,
                               *exceptionName,
                               string("Null ") + inputName, false);
  }
  return GoodTransferError();
}

// --------------------------------------------------------------------------
template <typename OutcomeType, typename OutputType>
OutcomeType BuildOutcome(QsError sdkErr, const string &exceptionName,
                         const OutputType &output) {
  HttpResponseCode rspCode =
      const_cast<OutputType &>(output).GetResponseCode();
  if (SDKResponseSuccess(sdkErr, rspCode)) {
    return OutcomeType(output);
  }
  return OutcomeType(BuildTransferError(sdkErr, exceptionName, output,
                                        SDKShouldRetry(sdkErr, rspCode)));
}

}  // namespace

// --------------------------------------------------------------------------
QSClientImpl::QSClientImpl(const shared_ptr<QsConfig> &qsConfig,
                           const string &bucket, const string &zone)
    : m_qsConfig(qsConfig) {
  if (!m_qsConfig) {
    throw DCException("Null qingstor config for bucket " + bucket);
  }
  m_bucket = shared_ptr<Bucket>(new Bucket(*m_qsConfig, bucket, zone));
}

// --------------------------------------------------------------------------
GetObjectOutcome QSClientImpl::GetObject(const string &objKey,
                                         GetObjectInput *input) const {
  string exceptionName = "QingStorGetObject";
  TransferClientError err =
      CheckRequest(objKey, input, "GetObjectInput", &exceptionName);
  if (!IsGoodTransferError(err)) {
    return GetObjectOutcome(err);
  }

  GetObjectOutput output;
  QsError sdkErr = m_bucket->GetObject(objKey, *input, output);
  GetObjectOutcome outcome =
      BuildOutcome<GetObjectOutcome>(sdkErr, exceptionName, output);
  if (!outcome.IsSuccess() || input->GetRange().empty()) {
    return outcome;
  }

  // a ranged request succeeds with 206 (Partial Content) only
  if (output.GetResponseCode() != QingStor::Http::PARTIAL_CONTENT) {
    Warning("Request for " + input->GetRange() +
            ", but response is not 206 (Partial Content) " +
            FormatObject(objKey));
    return GetObjectOutcome(
        BuildTransferError(sdkErr, exceptionName, output, true));
  }
  uint64_t reqLen = ParseRequestContentRange(input->GetRange()).second;
  uint64_t rspLen = output.GetContentLength();
  DebugWarningIf(reqLen > 0 && rspLen < reqLen,
                 "[content range request:response=" + input->GetRange() + ":" +
                     output.GetContentRange() + "]");
  return outcome;
}

// --------------------------------------------------------------------------
HeadObjectOutcome QSClientImpl::HeadObject(const string &objKey,
                                           HeadObjectInput *input) const {
  string exceptionName = "QingStorHeadObject";
  TransferClientError err =
      CheckRequest(objKey, input, "HeadObjectInput", &exceptionName);
  if (!IsGoodTransferError(err)) {
    return HeadObjectOutcome(err);
  }

  HeadObjectOutput output;
  QsError sdkErr = m_bucket->HeadObject(objKey, *input, output);
  return BuildOutcome<HeadObjectOutcome>(sdkErr, exceptionName, output);
}

// --------------------------------------------------------------------------
PutObjectOutcome QSClientImpl::PutObject(const string &objKey,
                                         PutObjectInput *input) const {
  string exceptionName = "QingStorPutObject";
  TransferClientError err =
      CheckRequest(objKey, input, "PutObjectInput", &exceptionName);
  if (!IsGoodTransferError(err)) {
    return PutObjectOutcome(err);
  }

  PutObjectOutput output;
  QsError sdkErr = m_bucket->PutObject(objKey, *input, output);
  return BuildOutcome<PutObjectOutcome>(sdkErr, exceptionName, output);
}

// --------------------------------------------------------------------------
InitiateMultipartUploadOutcome QSClientImpl::InitiateMultipartUpload(
    const string &objKey, InitiateMultipartUploadInput *input) const {
  string exceptionName = "QingStorInitiateMultipartUpload";
  TransferClientError err = CheckRequest(
      objKey, input, "InitiateMultipartUploadInput", &exceptionName);
  if (!IsGoodTransferError(err)) {
    return InitiateMultipartUploadOutcome(err);
  }

  InitiateMultipartUploadOutput output;
  QsError sdkErr = m_bucket->InitiateMultipartUpload(objKey, *input, output);
  return BuildOutcome<InitiateMultipartUploadOutcome>(sdkErr, exceptionName,
                                                      output);
}

// --------------------------------------------------------------------------
UploadMultipartOutcome QSClientImpl::UploadMultipart(
    const string &objKey, UploadMultipartInput *input) const {
  string exceptionName = "QingStorUploadMultipart";
  TransferClientError err =
      CheckRequest(objKey, input, "UploadMultipartInput", &exceptionName);
  if (!IsGoodTransferError(err)) {
    return UploadMultipartOutcome(err);
  }

  UploadMultipartOutput output;
  QsError sdkErr = m_bucket->UploadMultipart(objKey, *input, output);
  return BuildOutcome<UploadMultipartOutcome>(sdkErr, exceptionName, output);
}

// --------------------------------------------------------------------------
CompleteMultipartUploadOutcome QSClientImpl::CompleteMultipartUpload(
    const string &objKey, CompleteMultipartUploadInput *input) const {
  string exceptionName = "QingStorCompleteMultipartUpload";
  TransferClientError err = CheckRequest(
      objKey, input, "CompleteMultipartUploadInput", &exceptionName);
  if (!IsGoodTransferError(err)) {
    return CompleteMultipartUploadOutcome(err);
  }

  CompleteMultipartUploadOutput output;
  QsError sdkErr = m_bucket->CompleteMultipartUpload(objKey, *input, output);
  return BuildOutcome<CompleteMultipartUploadOutcome>(sdkErr, exceptionName,
                                                      output);
}

// --------------------------------------------------------------------------
AbortMultipartUploadOutcome QSClientImpl::AbortMultipartUpload(
    const string &objKey, AbortMultipartUploadInput *input) const {
  string exceptionName = "QingStorAbortMultipartUpload";
  TransferClientError err =
      CheckRequest(objKey, input, "AbortMultipartUploadInput", &exceptionName);
  if (!IsGoodTransferError(err)) {
    return AbortMultipartUploadOutcome(err);
  }

  AbortMultipartUploadOutput output;
  QsError sdkErr = m_bucket->AbortMultipartUpload(objKey, *input, output);
  return BuildOutcome<AbortMultipartUploadOutcome>(sdkErr, exceptionName,
                                                   output);
}

}  // namespace Client
}  // namespace DC

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

#include "client/SDKError.h"

#include <string>

#include "boost/exception/to_string.hpp"

#include "qingstor/HttpCommon.h"
#include "qingstor/QsErrors.h"

namespace DC {

namespace Client {

using boost::to_string;
using QingStor::Http::HttpResponseCode;
using std::string;

namespace {

struct ResponseCodeEntry {
  HttpResponseCode code;
  int number;
  const char *name;
  bool success;
  bool retryable;
};

// keep in sorted order of code
const ResponseCodeEntry kResponseCodes[] = {
    {QingStor::Http::REQUEST_NOT_MADE, 0, "RequestNotMade", false, true},
    {QingStor::Http::CONTINUE, 100, "Continue", true, false},
    {QingStor::Http::SWITCHING_PROTOCOLS, 101, "SwitchingProtocols", false,
     false},
    {QingStor::Http::PROCESSING, 102, "Processing", true, false},
    {QingStor::Http::OK, 200, "Ok", true, false},
    {QingStor::Http::CREATED, 201, "Created", true, false},
    {QingStor::Http::ACCEPTED, 202, "Accepted", true, false},
    {QingStor::Http::NON_AUTHORITATIVE_INFORMATION, 203,
     "NonAuthoritativeInformation", false, false},
    {QingStor::Http::NO_CONTENT, 204, "NoContent", true, false},
    {QingStor::Http::RESET_CONTENT, 205, "ResetContent", false, false},
    {QingStor::Http::PARTIAL_CONTENT, 206, "PartialContent", true, false},
    {QingStor::Http::MULTI_STATUS, 207, "MultiStatus", false, false},
    {QingStor::Http::ALREADY_REPORTED, 208, "AlreadyReported", false, false},
    {QingStor::Http::IM_USED, 226, "IMUsed", false, false},
    {QingStor::Http::MULTIPLE_CHOICES, 300, "MultipleChoices", false, false},
    {QingStor::Http::MOVED_PERMANENTLY, 301, "MovedPermanently", false, false},
    {QingStor::Http::FOUND, 302, "Found", true, false},
    {QingStor::Http::SEE_OTHER, 303, "SeeOther", false, false},
    {QingStor::Http::NOT_MODIFIED, 304, "NotModified", true, false},
    {QingStor::Http::USE_PROXY, 305, "UseProxy", false, false},
    {QingStor::Http::SWITCH_PROXY, 306, "SwitchProxy", false, false},
    {QingStor::Http::TEMPORARY_REDIRECT, 307, "TemporaryRedirect", false,
     false},
    {QingStor::Http::PERMANENT_REDIRECT, 308, "PermanentRedirect", false,
     false},
    {QingStor::Http::BAD_REQUEST, 400, "BadRequest", false, false},
    {QingStor::Http::UNAUTHORIZED_OR_EXPIRED, 401, "UnauthorizedOrExpired",
     false, false},
    {QingStor::Http::DELINQUENT_ACCOUNT, 402, "DelinquentAccount", false,
     false},
    {QingStor::Http::FORBIDDEN, 403, "Forbidden", false, false},
    {QingStor::Http::NOT_FOUND, 404, "NotFound", false, false},
    {QingStor::Http::METHOD_NOT_ALLOWED, 405, "MethodNotAllowed", false,
     false},
    {QingStor::Http::CONFLICT, 409, "Conflict", false, false},
    {QingStor::Http::PRECONDITION_FAILED, 412, "PreconditionFailed", false,
     false},
    {QingStor::Http::INVALID_RANGE, 416, "InvalidRange", false, false},
    {QingStor::Http::TOO_MANY_REQUESTS, 429, "TooManyRequests", false, true},
    {QingStor::Http::INTERNAL_SERVER_ERROR, 500, "InternalServerError", false,
     true},
    {QingStor::Http::SERVICE_UNAVAILABLE, 503, "ServiceUnavailable", false,
     true},
    {QingStor::Http::GATEWAY_TIMEOUT, 504, "GatewayTimeout", false, true},
    {QingStor::Http::HTTP_VERSION_NOT_SUPPORTED, 505,
     "HttpVersionNotSupported", false, false},
    {QingStor::Http::VARIANT_ALSO_NEGOTIATES, 506, "VariantAlsoNegotiates",
     false, false},
    {QingStor::Http::INSUFFICIENT_STORAGE, 507, "InsufficientStorage", false,
     true},
    {QingStor::Http::LOOP_DETECTED, 508, "LoopDetected", false, false},
    {QingStor::Http::BANDWIDTH_LIMIT_EXCEEDED, 509, "BandwidthLimitExceeded",
     false, true},
    {QingStor::Http::NOT_EXTENDED, 510, "NotExtended", false, false},
    {QingStor::Http::NETWORK_AUTHENTICATION_REQUIRED, 511,
     "NetworkAuthenticationRequired", false, false},
    {QingStor::Http::NETWORK_READ_TIMEOUT, 598, "NetworkReadTimeout", false,
     true},
    {QingStor::Http::NETWORK_CONNECT_TIMEOUT, 599, "NetworkConnectTimeout",
     false, true},
};

// Return NULL if code is not in table
const ResponseCodeEntry *FindResponseCode(HttpResponseCode code) {
  int low = 0;
  int high = sizeof(kResponseCodes) / sizeof(kResponseCodes[0]) - 1;
  while (low <= high) {
    int mid = (low + high) / 2;
    if (code == kResponseCodes[mid].code) {
      return &kResponseCodes[mid];
    }
    if (static_cast<int>(code) < static_cast<int>(kResponseCodes[mid].code)) {
      high = mid - 1;
    } else {
      low = mid + 1;
    }
  }
  return NULL;
}

bool SDKResponseCodeSuccess(HttpResponseCode code) {
  const ResponseCodeEntry *entry = FindResponseCode(code);
  return entry != NULL && entry->success;
}

}  // namespace

// --------------------------------------------------------------------------
TransferError::Value SDKErrorToTransferError(QsError sdkErr) {
  switch (sdkErr) {
    case QS_ERR_NO_ERROR:
      return TransferError::GOOD;
    case QS_ERR_INVAILD_CONFIG_FILE:
      return TransferError::SDK_CONFIGURE_FILE_INVALID;
    case QS_ERR_NO_REQUIRED_PARAMETER:
      return TransferError::SDK_NO_REQUIRED_PARAMETER;
    case QS_ERR_SEND_REQUEST_ERROR:
      return TransferError::SDK_REQUEST_SEND_ERROR;
    case QS_ERR_UNEXCEPTED_RESPONSE:
      return TransferError::SDK_UNEXPECTED_RESPONSE;
    case QS_ERR_SIGN_WITH_INVAILD_KEY:
      return TransferError::SDK_SIGN_WITH_INVALID_KEY;
    default:
      return TransferError::UNKNOWN;
  }
}

// --------------------------------------------------------------------------
TransferError::Value SDKResponseToTransferError(QsError sdkErr,
                                                HttpResponseCode code) {
  TransferError::Value err = SDKErrorToTransferError(sdkErr);
  if (err != TransferError::SDK_UNEXPECTED_RESPONSE) {
    return err;
  }

  switch (code) {
    case QingStor::Http::FORBIDDEN:
      return TransferError::PERMISSION_DENIED;
    case QingStor::Http::NOT_FOUND:
      return TransferError::NOT_FOUND;
    case QingStor::Http::PRECONDITION_FAILED:
      return TransferError::SOURCE_CHANGED;
    case QingStor::Http::INVALID_RANGE:
      return TransferError::INVALID_RANGE;
    default:
      return SDKResponseCodeSuccess(code)
                 ? TransferError::GOOD
                 : TransferError::SDK_UNEXPECTED_RESPONSE;
  }
}

// --------------------------------------------------------------------------
bool SDKShouldRetry(QsError sdkErr, HttpResponseCode code) {
  if (sdkErr == QS_ERR_SEND_REQUEST_ERROR) {
    return true;
  }
  if (sdkErr != QS_ERR_UNEXCEPTED_RESPONSE) {
    return false;
  }
  const ResponseCodeEntry *entry = FindResponseCode(code);
  return entry != NULL && entry->retryable;
}

// --------------------------------------------------------------------------
bool SDKResponseSuccess(QsError sdkErr, HttpResponseCode code) {
  // sdk return UNEXPECTED_RESPONSE for a response not listed in api specs,
  // which may still be a success, e.g. 206 of a ranged get
  return sdkErr == QS_ERR_NO_ERROR ||
         (sdkErr == QS_ERR_UNEXCEPTED_RESPONSE && SDKResponseCodeSuccess(code));
}

// --------------------------------------------------------------------------
string SDKResponseCodeToName(HttpResponseCode code) {
  const ResponseCodeEntry *entry = FindResponseCode(code);
  return entry != NULL ? entry->name : "UnknownQingStorResponseCode";
}

// --------------------------------------------------------------------------
int SDKResponseCodeToInt(HttpResponseCode code) {
  const ResponseCodeEntry *entry = FindResponseCode(code);
  return entry != NULL ? entry->number : -1;
}

// --------------------------------------------------------------------------
string SDKResponseCodeToString(HttpResponseCode code) {
  return SDKResponseCodeToName(code) + "(" +
         to_string(SDKResponseCodeToInt(code)) + ")";
}

}  // namespace Client
}  // namespace DC

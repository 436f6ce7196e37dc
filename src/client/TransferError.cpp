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

#include "client/TransferError.h"

#include <string>
#include <utility>

namespace DC {

namespace Client {

using std::make_pair;
using std::pair;
using std::string;

namespace {

typedef pair<TransferError::Value, const char *> ErrorNamePair;

const ErrorNamePair errorNames[] = {
    // keep in order of enumeration
    make_pair(TransferError::UNKNOWN, "Unknown"),
    make_pair(TransferError::GOOD, "Good"),
    make_pair(TransferError::PARAMETER_MISSING, "ParameterMissing"),
    make_pair(TransferError::PARAMETER_INVALID, "ParameterInvalid"),
    make_pair(TransferError::NO_SUCH_UPLOAD, "NoSuchUpload"),
    make_pair(TransferError::SOURCE_CHANGED, "SourceChanged"),
    make_pair(TransferError::SHORT_READ, "ShortRead"),
    make_pair(TransferError::FETCH_FAILED, "FetchFailed"),
    make_pair(TransferError::SDK_CONFIGURE_FILE_INVALID,
              "SDKConfigureFileInvalid"),
    make_pair(TransferError::SDK_NO_REQUIRED_PARAMETER,
              "SDKNoRequiredParameter"),
    make_pair(TransferError::SDK_REQUEST_SEND_ERROR, "SDKRequestSendError"),
    make_pair(TransferError::SDK_UNEXPECTED_RESPONSE, "SDKUnexpectedResponse"),
    make_pair(TransferError::SDK_SIGN_WITH_INVALID_KEY,
              "SDKSignWithInvalidKey"),
    make_pair(TransferError::PERMISSION_DENIED, "PermissionDenied"),
    make_pair(TransferError::NOT_FOUND, "NotFound"),
    make_pair(TransferError::INVALID_RANGE, "InvalidRange"),
};

const int errorNamesCount = sizeof(errorNames) / sizeof(errorNames[0]);

}  // namespace

// --------------------------------------------------------------------------
TransferError::Value StringToTransferError(const string &errorName) {
  for (int i = 0; i < errorNamesCount; ++i) {
    if (errorName == errorNames[i].second) {
      return errorNames[i].first;
    }
  }
  return TransferError::UNKNOWN;
}

// --------------------------------------------------------------------------
string TransferErrorToString(TransferError::Value err) {
  // binary search
  int low = 0;
  int high = errorNamesCount - 1;
  while (low <= high) {
    int mid = (low + high) / 2;
    if (err == errorNames[mid].first) {
      return errorNames[mid].second;
    }
    if (static_cast<int>(err) < static_cast<int>(errorNames[mid].first)) {
      high = mid - 1;
    } else {
      low = mid + 1;
    }
  }
  return "Unknown";
}

// --------------------------------------------------------------------------
string GetMessageForTransferError(
    const ClientError<TransferError::Value> &error) {
  return TransferErrorToString(error.GetError()) + ", " +
         error.GetExceptionName() + ":" + error.GetMessage();
}

// --------------------------------------------------------------------------
bool IsGoodTransferError(const ClientError<TransferError::Value> &error) {
  return error.GetError() == TransferError::GOOD;
}

// --------------------------------------------------------------------------
ClientError<TransferError::Value> GoodTransferError() {
  return ClientError<TransferError::Value>(TransferError::GOOD, false);
}

}  // namespace Client
}  // namespace DC

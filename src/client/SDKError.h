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

#ifndef DAISYCP_CLIENT_SDKERROR_H_
#define DAISYCP_CLIENT_SDKERROR_H_

#include <string>

#include "qingstor/HttpCommon.h"
#include "qingstor/QsErrors.h"

#include "client/TransferError.h"

namespace DC {

namespace Client {

// Map sdk error to transfer error, ignoring http response
TransferError::Value SDKErrorToTransferError(QsError sdkErr);

// Map sdk error and http response to transfer error
TransferError::Value SDKResponseToTransferError(
    QsError sdkErr, QingStor::Http::HttpResponseCode code);

// Whether a failed request is worth to retry, such as a request which is
// not sent, or a response of server side busy or timeout
bool SDKShouldRetry(QsError sdkErr, QingStor::Http::HttpResponseCode code);

// Whether the request succeed
bool SDKResponseSuccess(QsError sdkErr, QingStor::Http::HttpResponseCode code);

std::string SDKResponseCodeToName(QingStor::Http::HttpResponseCode code);
int SDKResponseCodeToInt(QingStor::Http::HttpResponseCode code);
// Return string in format of "name(number)", e.g. "NotFound(404)"
std::string SDKResponseCodeToString(QingStor::Http::HttpResponseCode code);

}  // namespace Client
}  // namespace DC

#endif  // DAISYCP_CLIENT_SDKERROR_H_

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

#ifndef DAISYCP_CLIENT_TRANSFERERROR_H_
#define DAISYCP_CLIENT_TRANSFERERROR_H_

#include <string>

#include "client/ClientError.hpp"

namespace DC {

namespace Client {

struct TransferError {
  enum Value {
    UNKNOWN,
    GOOD,

    // check request
    PARAMETER_MISSING,
    PARAMETER_INVALID,
    NO_SUCH_UPLOAD,

    // copy
    SOURCE_CHANGED,  // source generation does not match the pinned one
    SHORT_READ,      // source delivered less bytes than expected
    FETCH_FAILED,    // background fetch of source failed

    // sdk error
    SDK_CONFIGURE_FILE_INVALID,  // error when loading config file
    SDK_NO_REQUIRED_PARAMETER,   // request not send as missing required
                                 // parameters accoriding api specs
    SDK_REQUEST_SEND_ERROR,      // request send but get no response
    SDK_UNEXPECTED_RESPONSE,     // sdk get response but is not expected by api
                                 // specs
    SDK_SIGN_WITH_INVALID_KEY,

    // specifics for http response
    PERMISSION_DENIED,  // Forbidden (403)
    NOT_FOUND,          // Not Found (404)
    INVALID_RANGE       // Range Not Satisfiable (416)
  };
};

TransferError::Value StringToTransferError(const std::string &errorName);
std::string TransferErrorToString(TransferError::Value err);

std::string GetMessageForTransferError(
    const ClientError<TransferError::Value> &error);
bool IsGoodTransferError(const ClientError<TransferError::Value> &error);

// Build a good error to return from successful operation
ClientError<TransferError::Value> GoodTransferError();

}  // namespace Client
}  // namespace DC

#endif  // DAISYCP_CLIENT_TRANSFERERROR_H_

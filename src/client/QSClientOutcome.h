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

#ifndef DAISYCP_CLIENT_QSCLIENTOUTCOME_H_
#define DAISYCP_CLIENT_QSCLIENTOUTCOME_H_

#include "qingstor/Bucket.h"

#include "client/ClientError.hpp"
#include "client/Outcome.hpp"
#include "client/TransferError.h"

namespace DC {

namespace Client {

typedef ClientError<TransferError::Value> TransferClientError;

typedef Outcome<QingStor::GetObjectOutput, TransferClientError>
    GetObjectOutcome;
typedef Outcome<QingStor::HeadObjectOutput, TransferClientError>
    HeadObjectOutcome;
typedef Outcome<QingStor::PutObjectOutput, TransferClientError>
    PutObjectOutcome;

typedef Outcome<QingStor::InitiateMultipartUploadOutput, TransferClientError>
    InitiateMultipartUploadOutcome;
typedef Outcome<QingStor::UploadMultipartOutput, TransferClientError>
    UploadMultipartOutcome;
typedef Outcome<QingStor::CompleteMultipartUploadOutput, TransferClientError>
    CompleteMultipartUploadOutcome;
typedef Outcome<QingStor::AbortMultipartUploadOutput, TransferClientError>
    AbortMultipartUploadOutcome;

}  // namespace Client
}  // namespace DC

#endif  // DAISYCP_CLIENT_QSCLIENTOUTCOME_H_

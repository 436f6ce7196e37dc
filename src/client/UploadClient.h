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

#ifndef DAISYCP_CLIENT_UPLOADCLIENT_H_
#define DAISYCP_CLIENT_UPLOADCLIENT_H_

#include <stdint.h>

#include "client/Client.h"
#include "client/ObjectURL.h"
#include "client/RetryStrategy.h"
#include "client/TransferError.h"

namespace DC {

namespace Data {
class InputSource;
}  // namespace Data

namespace Client {

//
// Client to upload a stream to the destination.
//
class UploadClient : public Client {
 public:
  explicit UploadClient(RetryStrategy retryStrategy = GetCustomRetryStrategy())
      : Client(retryStrategy) {}

  virtual ~UploadClient() {}

 public:
  // Upload object
  //
  // @param  : destination url, source stream, bytes uploaded (output)
  // @return : ClientError
  //
  // The source is read from its current position to its end. On retry the
  // client seeks the source back to the start of the failed request.
  virtual ClientError<TransferError::Value> UploadObject(
      const ObjectURL &dest, DC::Data::InputSource *source,
      uint64_t *bytesUploaded) = 0;
};

}  // namespace Client
}  // namespace DC

#endif  // DAISYCP_CLIENT_UPLOADCLIENT_H_

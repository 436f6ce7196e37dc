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

#ifndef DAISYCP_CLIENT_FETCHCLIENT_H_
#define DAISYCP_CLIENT_FETCHCLIENT_H_

#include <stdint.h>

#include <string>

#include "client/Client.h"
#include "client/ObjectURL.h"
#include "client/RetryStrategy.h"
#include "client/TransferError.h"

namespace DC {

namespace Data {
class DownloadSink;
}  // namespace Data

namespace Client {

struct DownloadStrategy {
  enum Value {
    OneShot,   // single pass, no resumption inside the client
    Resumable  // on retryable failure, continue from the reached offset
  };
};

struct ObjectInfo {
  uint64_t size;
  std::string eTag;

  ObjectInfo() : size(0) {}
};

//
// Client to fetch object data from the source.
//
class FetchClient : public Client {
 public:
  explicit FetchClient(RetryStrategy retryStrategy = GetCustomRetryStrategy())
      : Client(retryStrategy) {}

  virtual ~FetchClient() {}

 public:
  // Head object
  //
  // @param  : object url, object info (output)
  // @return : ClientError
  virtual ClientError<TransferError::Value> HeadObject(
      const ObjectURL &url, ObjectInfo *info) = 0;

  // Fetch a range of object and write it into the sink
  //
  // @param  : object url, start byte, end byte (inclusive, negative for end of
  //           object), total size of object, sink, download strategy
  // @return : ClientError
  //
  // If url has a generation, the fetch fails with SOURCE_CHANGED when the
  // object no longer matches it. Bytes are written to sink in pieces no
  // larger than the transfer chunk size.
  virtual ClientError<TransferError::Value> GetObjectMedia(
      const ObjectURL &url, uint64_t startByte, int64_t endByte,
      uint64_t objectSize, DC::Data::DownloadSink *sink,
      DownloadStrategy::Value strategy) = 0;
};

}  // namespace Client
}  // namespace DC

#endif  // DAISYCP_CLIENT_FETCHCLIENT_H_

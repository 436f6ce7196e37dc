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

#ifndef DAISYCP_CLIENT_QSFETCHCLIENT_H_
#define DAISYCP_CLIENT_QSFETCHCLIENT_H_

#include <stdint.h>

#include "boost/shared_ptr.hpp"

#include "client/ClientConfiguration.h"
#include "client/FetchClient.h"

namespace DC {

namespace Client {

class QSClientImpl;

//
// Fetch client of QingStor.
//
// The client owns its sdk bucket, so its connections are independent of
// the ones used by an upload.
//
class QSFetchClient : public FetchClient {
 public:
  QSFetchClient(const boost::shared_ptr<QSClientImpl> &impl,
                uint64_t transferChunkSize =
                    ClientConfiguration::Instance().GetTransferChunkSize(),
                RetryStrategy retryStrategy = GetCustomRetryStrategy());

  ~QSFetchClient() {}

  const boost::shared_ptr<QSClientImpl> &GetClientImpl() const {
    return m_impl;
  }

 public:
  ClientError<TransferError::Value> HeadObject(const ObjectURL &url,
                                               ObjectInfo *info);

  ClientError<TransferError::Value> GetObjectMedia(
      const ObjectURL &url, uint64_t startByte, int64_t endByte,
      uint64_t objectSize, DC::Data::DownloadSink *sink,
      DownloadStrategy::Value strategy);

 private:
  // Issue one ranged request and write response body into sink
  //
  // @param  : object url, first byte, last byte (inclusive, negative for end
  //           of object), sink, next byte to fetch (output)
  // @return : ClientError
  ClientError<TransferError::Value> FetchRange(const ObjectURL &url,
                                               uint64_t startByte,
                                               int64_t endByte,
                                               DC::Data::DownloadSink *sink,
                                               uint64_t *nextByte);

 private:
  boost::shared_ptr<QSClientImpl> m_impl;
  uint64_t m_transferChunkSize;
};

}  // namespace Client
}  // namespace DC

#endif  // DAISYCP_CLIENT_QSFETCHCLIENT_H_

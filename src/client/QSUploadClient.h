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

#ifndef DAISYCP_CLIENT_QSUPLOADCLIENT_H_
#define DAISYCP_CLIENT_QSUPLOADCLIENT_H_

#include <stdint.h>

#include <string>
#include <vector>

#include "boost/shared_ptr.hpp"

#include "client/MultipartUploadClient.h"
#include "data/StreamBuf.h"

namespace DC {

namespace Client {

class QSClientImpl;

//
// Upload client of QingStor.
//
// Each request goes through the sdk bucket of the client, which is not
// shared with the fetch of the source.
//
class QSUploadClient : public MultipartUploadClient {
 public:
  // Throw DCException if impl is null or part size is out of the range
  // qingstor accepts
  QSUploadClient(const boost::shared_ptr<QSClientImpl> &impl,
                 const UploadClientConfigure &configure =
                     UploadClientConfigure(),
                 RetryStrategy retryStrategy = GetCustomRetryStrategy());

  ~QSUploadClient() {}

  const boost::shared_ptr<QSClientImpl> &GetClientImpl() const {
    return m_impl;
  }

 protected:
  ClientError<TransferError::Value> DoPutObject(const ObjectURL &dest,
                                                const DC::Data::Buffer &body,
                                                uint64_t size);

  ClientError<TransferError::Value> DoInitiateMultipartUpload(
      const ObjectURL &dest, std::string *uploadId);

  ClientError<TransferError::Value> DoUploadPart(const ObjectURL &dest,
                                                 const std::string &uploadId,
                                                 int partNumber,
                                                 const DC::Data::Buffer &part,
                                                 uint64_t partLen);

  ClientError<TransferError::Value> DoCompleteMultipartUpload(
      const ObjectURL &dest, const std::string &uploadId,
      const std::vector<int> &sortedPartIds);

  void DoAbortMultipartUpload(const ObjectURL &dest,
                              const std::string &uploadId);

 private:
  boost::shared_ptr<QSClientImpl> m_impl;
};

}  // namespace Client
}  // namespace DC

#endif  // DAISYCP_CLIENT_QSUPLOADCLIENT_H_

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

#ifndef DAISYCP_CLIENT_MULTIPARTUPLOADCLIENT_H_
#define DAISYCP_CLIENT_MULTIPARTUPLOADCLIENT_H_

#include <stdint.h>

#include <string>
#include <vector>

#include "client/ClientConfiguration.h"
#include "client/UploadClient.h"
#include "configure/Default.h"
#include "data/StreamBuf.h"

namespace DC {

namespace Client {

class SourceReader;

struct UploadClientConfigure {
  uint64_t partSize;            // bytes of a multipart part
  uint64_t multipartThreshold;  // objects larger than it use multipart
  uint64_t transferChunkSize;   // bytes of one read from source
  uint64_t minPartSize;         // last part smaller than it is merged
  uint64_t maxPartCount;

  explicit UploadClientConfigure(
      uint64_t partSize_ = ClientConfiguration::Instance().GetUploadPartSize(),
      uint64_t threshold =
          DC::Configure::Default::GetUploadMultipartThresholdSize(),
      uint64_t chunkSize =
          ClientConfiguration::Instance().GetTransferChunkSize(),
      uint64_t minPartSize_ =
          DC::Configure::Default::GetUploadMultipartMinPartSize(),
      uint64_t maxPartCount_ = DC::Configure::Default::GetUploadMaxPartCount())
      : partSize(partSize_),
        multipartThreshold(threshold),
        transferChunkSize(chunkSize),
        minPartSize(minPartSize_),
        maxPartCount(maxPartCount_) {}
};

//
// Upload client driving single put and multipart upload over a source.
//
// Object no larger than the multipart threshold is read whole and put once.
// Larger one is cut into parts, each part is read from the source and
// uploaded. A part failing with a retryable error is read again after
// seeking the source back to the start of the part. The upload is aborted
// when a part or the completion finally fails.
//
// Subclasses implement one attempt of each request against the service.
//
class MultipartUploadClient : public UploadClient {
 public:
  // Throw DCException if chunk size or part size is 0
  explicit MultipartUploadClient(
      const UploadClientConfigure &configure = UploadClientConfigure(),
      RetryStrategy retryStrategy = GetCustomRetryStrategy());

  virtual ~MultipartUploadClient() {}

 public:
  ClientError<TransferError::Value> UploadObject(
      const ObjectURL &dest, DC::Data::InputSource *source,
      uint64_t *bytesUploaded);

  const UploadClientConfigure &GetConfigure() const { return m_configure; }

 protected:
  virtual ClientError<TransferError::Value> DoPutObject(
      const ObjectURL &dest, const DC::Data::Buffer &body, uint64_t size) = 0;

  virtual ClientError<TransferError::Value> DoInitiateMultipartUpload(
      const ObjectURL &dest, std::string *uploadId) = 0;

  virtual ClientError<TransferError::Value> DoUploadPart(
      const ObjectURL &dest, const std::string &uploadId, int partNumber,
      const DC::Data::Buffer &part, uint64_t partLen) = 0;

  virtual ClientError<TransferError::Value> DoCompleteMultipartUpload(
      const ObjectURL &dest, const std::string &uploadId,
      const std::vector<int> &sortedPartIds) = 0;

  virtual void DoAbortMultipartUpload(const ObjectURL &dest,
                                      const std::string &uploadId) = 0;

  void SetMultipartThreshold(uint64_t threshold) {
    m_configure.multipartThreshold = threshold;
  }

 private:
  ClientError<TransferError::Value> PutObject(const ObjectURL &dest,
                                              SourceReader *reader,
                                              uint64_t start, uint64_t size,
                                              uint64_t *bytesUploaded);

  ClientError<TransferError::Value> MultipartUpload(const ObjectURL &dest,
                                                    SourceReader *reader,
                                                    uint64_t start,
                                                    uint64_t size,
                                                    uint64_t *bytesUploaded);

  // Read the part from source and upload it, retry on retryable error
  ClientError<TransferError::Value> UploadPart(const ObjectURL &dest,
                                               const std::string &uploadId,
                                               int partNumber,
                                               SourceReader *reader,
                                               uint64_t offset, uint64_t len);

 private:
  UploadClientConfigure m_configure;
};

}  // namespace Client
}  // namespace DC

#endif  // DAISYCP_CLIENT_MULTIPARTUPLOADCLIENT_H_

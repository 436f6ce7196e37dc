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

#ifndef DAISYCP_CLIENT_QSCLIENTIMPL_H_
#define DAISYCP_CLIENT_QSCLIENTIMPL_H_

#include <string>

#include "boost/noncopyable.hpp"
#include "boost/shared_ptr.hpp"

#include "qingstor/Bucket.h"
#include "qingstor/QsConfig.h"

#include "client/QSClientOutcome.h"

namespace DC {

namespace Client {

//
// Thin wrapper of the sdk bucket, converting sdk errors into
// ClientError<TransferError::Value>.
//
// Each instance owns its own sdk bucket, so requests issued by different
// instances never share a connection.
//
class QSClientImpl : private boost::noncopyable {
 public:
  QSClientImpl(const boost::shared_ptr<QingStor::QsConfig> &qsConfig,
               const std::string &bucket, const std::string &zone);

  ~QSClientImpl() {}

 public:
  // Get object
  //
  // @param  : object key, GetObjectInput
  // @return : GetObjectOutcome
  //
  // If input has a range, the response must be 206 (Partial Content).
  GetObjectOutcome GetObject(const std::string &objKey,
                             QingStor::GetObjectInput *input) const;

  // Head object
  HeadObjectOutcome HeadObject(const std::string &objKey,
                               QingStor::HeadObjectInput *input) const;

  // Put object
  PutObjectOutcome PutObject(const std::string &objKey,
                             QingStor::PutObjectInput *input) const;

  InitiateMultipartUploadOutcome InitiateMultipartUpload(
      const std::string &objKey,
      QingStor::InitiateMultipartUploadInput *input) const;

  UploadMultipartOutcome UploadMultipart(
      const std::string &objKey, QingStor::UploadMultipartInput *input) const;

  CompleteMultipartUploadOutcome CompleteMultipartUpload(
      const std::string &objKey,
      QingStor::CompleteMultipartUploadInput *input) const;

  AbortMultipartUploadOutcome AbortMultipartUpload(
      const std::string &objKey,
      QingStor::AbortMultipartUploadInput *input) const;

 private:
  boost::shared_ptr<QingStor::QsConfig> m_qsConfig;
  boost::shared_ptr<QingStor::Bucket> m_bucket;
};

}  // namespace Client
}  // namespace DC

#endif  // DAISYCP_CLIENT_QSCLIENTIMPL_H_

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

#ifndef DAISYCP_CLIENT_QSSERVICE_H_
#define DAISYCP_CLIENT_QSSERVICE_H_

#include <string>

#include "boost/shared_ptr.hpp"
#include "boost/thread/mutex.hpp"

#include "qingstor/QsConfig.h"
#include "qingstor/QsSdkOption.h"

#include "base/Singleton.hpp"

namespace DC {

namespace Client {

class QSClientImpl;
class QSFetchClient;
class QSUploadClient;

//
// Lifetime of the qingstor sdk in process.
//
// Start initializes the sdk once, Stop shuts it down. Clients of different
// buckets get their own sdk config, built with the credentials of the bucket.
//
class QSService : public Singleton<QSService> {
 public:
  ~QSService();

 public:
  void Start();
  void Stop();
  bool IsStarted() const;

  // Build sdk config for the bucket
  //
  // @param  : bucket name
  // @return : sdk config
  //
  // Throw DCException if there is no credentials for the bucket.
  boost::shared_ptr<QingStor::QsConfig> MakeQingStorConfig(
      const std::string &bucket) const;

  // Build a client of the bucket, start service if not started
  boost::shared_ptr<QSClientImpl> MakeClientImpl(const std::string &bucket);

  // Build clients for a copy
  //
  // @param  : source bucket, destination bucket, fetch client (output),
  //           upload client (output)
  // @return : void
  //
  // Fetch and upload always get their own sdk bucket, also when source and
  // destination are in the same bucket, as they run at the same time.
  void MakeCopyClients(const std::string &sourceBucket,
                       const std::string &destBucket,
                       boost::shared_ptr<QSFetchClient> *fetchClient,
                       boost::shared_ptr<QSUploadClient> *uploadClient);

 private:
  QSService();

  QingStor::SDKOptions m_sdkOptions;
  std::string m_sdkLogDir;  // keep alive while sdk refers to it
  bool m_started;
  mutable boost::mutex m_lock;

  friend class Singleton<QSService>;
};

}  // namespace Client
}  // namespace DC

#endif  // DAISYCP_CLIENT_QSSERVICE_H_

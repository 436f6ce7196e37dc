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

#include "client/QSService.h"

#include <string>

#include "boost/shared_ptr.hpp"
#include "boost/thread/locks.hpp"

#include "qingstor/QingStor.h"
#include "qingstor/QsConfig.h"
#include "qingstor/QsSdkOption.h"

#include "base/Exception.h"
#include "base/LogMacros.h"
#include "base/Utils.h"
#include "client/ClientConfiguration.h"
#include "client/Credentials.h"
#include "client/Protocol.h"
#include "client/QSClientImpl.h"
#include "client/QSFetchClient.h"
#include "client/QSUploadClient.h"

namespace DC {

namespace Client {

using boost::lock_guard;
using boost::mutex;
using boost::shared_ptr;
using DC::Exception::DCException;
using DC::Utils::AppendPathDelim;
using QingStor::QsConfig;
using std::string;

namespace {

LogLevel ToSDKLogLevel(ClientLogLevel::Value level) {
  switch (level) {
    case ClientLogLevel::Verbose:
      return Verbose;
    case ClientLogLevel::Debug:
      return Debug;
    case ClientLogLevel::Info:
      return Info;
    case ClientLogLevel::Error:
      return Error;
    case ClientLogLevel::Fatal:
      return Fatal;
    case ClientLogLevel::Warn:
    default:
      return Warning;
  }
}

}  // namespace

// --------------------------------------------------------------------------
QSService::QSService() : m_started(false) {}

// --------------------------------------------------------------------------
QSService::~QSService() { Stop(); }

// --------------------------------------------------------------------------
void QSService::Start() {
  lock_guard<mutex> lock(m_lock);
  if (m_started) {
    return;
  }
  const ClientConfiguration &clientConfig = ClientConfiguration::Instance();
  m_sdkLogDir = AppendPathDelim(clientConfig.GetClientLogDirectory());
  m_sdkOptions.logLevel = ToSDKLogLevel(clientConfig.GetClientLogLevel());
  m_sdkOptions.logPath = m_sdkLogDir.c_str();
  InitializeSDK(m_sdkOptions);
  m_started = true;
  DebugInfo("QingStor sdk initialized [log=" + m_sdkLogDir + ", level=" +
            GetClientLogLevelName(clientConfig.GetClientLogLevel()) + "]");
}

// --------------------------------------------------------------------------
void QSService::Stop() {
  lock_guard<mutex> lock(m_lock);
  if (!m_started) {
    return;
  }
  ShutdownSDK(m_sdkOptions);
  m_started = false;
}

// --------------------------------------------------------------------------
bool QSService::IsStarted() const {
  lock_guard<mutex> lock(m_lock);
  return m_started;
}

// --------------------------------------------------------------------------
shared_ptr<QsConfig> QSService::MakeQingStorConfig(const string &bucket) const {
  const ClientConfiguration &clientConfig = ClientConfiguration::Instance();
  Credentials credentials = clientConfig.GetCredentials(bucket);

  shared_ptr<QsConfig> qsConfig(new QsConfig(credentials.GetAccessKeyId(),
                                             credentials.GetSecretKey()));
  qsConfig->additionalUserAgent = clientConfig.GetAdditionalAgent();
  qsConfig->host = clientConfig.GetHost();
  qsConfig->protocol = Http::ProtocolToString(clientConfig.GetProtocol());
  qsConfig->port = clientConfig.GetPort();
  qsConfig->connectionRetries = clientConfig.GetTransactionRetries();
  // timeoutPeriod is for one connection duration
  qsConfig->timeOutPeriod = clientConfig.GetTransactionTimeDuration();
  return qsConfig;
}

// --------------------------------------------------------------------------
shared_ptr<QSClientImpl> QSService::MakeClientImpl(const string &bucket) {
  Start();
  return shared_ptr<QSClientImpl>(new QSClientImpl(
      MakeQingStorConfig(bucket), bucket,
      ClientConfiguration::Instance().GetZone()));
}

// --------------------------------------------------------------------------
void QSService::MakeCopyClients(const string &sourceBucket,
                                const string &destBucket,
                                shared_ptr<QSFetchClient> *fetchClient,
                                shared_ptr<QSUploadClient> *uploadClient) {
  if (fetchClient == NULL || uploadClient == NULL) {
    throw DCException("Null output parameter of copy clients");
  }
  fetchClient->reset(new QSFetchClient(MakeClientImpl(sourceBucket)));
  uploadClient->reset(new QSUploadClient(MakeClientImpl(destBucket)));
}

}  // namespace Client
}  // namespace DC

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

#include "client/ClientConfiguration.h"

#include <errno.h>
#include <string.h>  // for strerror

#include <string>

#include "boost/bind.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/once.hpp"

#include "base/Exception.h"
#include "base/Utils.h"
#include "client/Credentials.h"
#include "client/Protocol.h"
#include "configure/Default.h"
#include "configure/Options.h"

namespace DC {

namespace Client {

using boost::call_once;
using boost::shared_ptr;
using DC::Configure::Default::GetDefaultFetchRangeSize;
using DC::Configure::Default::GetDefaultHostName;
using DC::Configure::Default::GetDefaultLogDirectory;
using DC::Configure::Default::GetDefaultMaxBufferedBytes;
using DC::Configure::Default::GetDefaultPort;
using DC::Configure::Default::GetDefaultProtocolName;
using DC::Configure::Default::GetDefaultTransactionRetries;
using DC::Configure::Default::GetDefaultTransactionTimeDuration;
using DC::Configure::Default::GetDefaultTransferChunkSize;
using DC::Configure::Default::GetDefaultUploadPartSize;
using DC::Configure::Default::GetDefaultZone;
using DC::Configure::Default::GetSDKLogFolderBaseName;
using DC::Exception::DCException;
using DC::Utils::AppendPathDelim;
using std::string;

// --------------------------------------------------------------------------
string GetClientLogLevelName(ClientLogLevel::Value level) {
  string name;
  switch (level) {
    case ClientLogLevel::Verbose:
      name = "verbose";
      break;
    case ClientLogLevel::Debug:
      name = "debug";
      break;
    case ClientLogLevel::Info:
      name = "info";
      break;
    case ClientLogLevel::Warn:
      name = "warning";
      break;
    case ClientLogLevel::Error:
      name = "error";
      break;
    case ClientLogLevel::Fatal:
      name = "fatal";
      break;
    default:
      break;
  }
  return name;
}

static shared_ptr<ClientConfiguration> clientConfigInstance;
static boost::once_flag clientConfigFlag = BOOST_ONCE_INIT;

namespace {

void SetClientConfigInstance(const shared_ptr<ClientConfiguration> &config) {
  clientConfigInstance = config;
}

void ConstructClientConfigInstance() {
  clientConfigInstance =
      shared_ptr<ClientConfiguration>(new ClientConfiguration);
}

}  // namespace

// --------------------------------------------------------------------------
void InitializeClientConfiguration(
    const shared_ptr<ClientConfiguration> &config) {
  if (!config) {
    throw DCException("Null client configuration");
  }
  call_once(clientConfigFlag,
            boost::bind(boost::type<void>(), SetClientConfigInstance, config));
}

// --------------------------------------------------------------------------
ClientConfiguration &ClientConfiguration::Instance() {
  call_once(clientConfigFlag, ConstructClientConfigInstance);
  return *clientConfigInstance.get();
}

// --------------------------------------------------------------------------
ClientConfiguration::ClientConfiguration(
    const shared_ptr<CredentialsProvider> &provider)
    : m_credentialsProvider(provider),
      m_zone(GetDefaultZone()),
      m_host(GetDefaultHostName()),
      m_protocol(Http::StringToProtocol(GetDefaultProtocolName())),
      m_port(GetDefaultPort(GetDefaultProtocolName())),
      m_additionalUserAgent(),
      m_logLevel(ClientLogLevel::Warn),
      m_sdkLogDirectory(AppendPathDelim(GetDefaultLogDirectory()) +
                        GetSDKLogFolderBaseName()),
      m_transactionRetries(GetDefaultTransactionRetries()),
      m_transactionTimeDuration(GetDefaultTransactionTimeDuration()),
      m_fetchRangeSize(GetDefaultFetchRangeSize()),
      m_maxBufferedBytes(GetDefaultMaxBufferedBytes()),
      m_transferChunkSize(GetDefaultTransferChunkSize()),
      m_uploadPartSize(GetDefaultUploadPartSize()) {}

// --------------------------------------------------------------------------
Credentials ClientConfiguration::GetCredentials(const string &bucket) const {
  if (m_credentialsProvider) {
    return m_credentialsProvider->GetCredentials(bucket);
  }
  return GetCredentialsProviderInstance().GetCredentials(bucket);
}

// --------------------------------------------------------------------------
void ClientConfiguration::InitializeByOptions() {
  const DC::Configure::Options &options = DC::Configure::Options::Instance();
  m_zone = options.GetZone();
  m_host = options.GetHost();
  m_protocol = Http::StringToProtocol(options.GetProtocol());
  m_port = options.GetPort();
  m_additionalUserAgent = options.GetAdditionalAgent();
  m_logLevel = static_cast<ClientLogLevel::Value>(options.GetLogLevel());
  if (options.IsDebug()) {
    m_logLevel = ClientLogLevel::Debug;
  }

  if (!options.IsForeground()) {
    m_sdkLogDirectory =
        AppendPathDelim(options.GetLogDirectory()) + GetSDKLogFolderBaseName();
    if (!DC::Utils::CreateDirectoryIfNotExists(m_sdkLogDirectory)) {
      throw DCException(string("Unable to create sdk log directory : ") +
                        strerror(errno) + " [path=" + m_sdkLogDirectory + "]");
    }
  }

  m_transactionRetries = options.GetRetries();
  m_transactionTimeDuration = options.GetRequestTimeOut();
  m_fetchRangeSize = options.GetFetchRangeSize();
  m_maxBufferedBytes = options.GetMaxBufferedBytes();
  m_transferChunkSize = options.GetTransferChunkSize();
  m_uploadPartSize = options.GetUploadPartSize();
}

}  // namespace Client
}  // namespace DC

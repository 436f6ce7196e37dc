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

#ifndef DAISYCP_CLIENT_CLIENTCONFIGURATION_H_
#define DAISYCP_CLIENT_CLIENTCONFIGURATION_H_

#include <stdint.h>

#include <string>

#include "boost/shared_ptr.hpp"

#include "client/Credentials.h"
#include "client/Protocol.h"

// Declare in global namespace before class ClientConfiguration, since friend
// declarations can only introduce names in the surrounding namespace.
extern void ClientConfigurationInitializer();

namespace DC {

namespace Client {

struct ClientLogLevel {  // SDK log level
  enum Value {
    Verbose = -2,
    Debug = -1,
    Info = 0,
    Warn = 1,
    Error = 2,
    Fatal = 3
  };
};

std::string GetClientLogLevelName(ClientLogLevel::Value level);

class ClientConfiguration;
void InitializeClientConfiguration(
    const boost::shared_ptr<ClientConfiguration>& config);

class ClientConfiguration {
 public:
  static ClientConfiguration& Instance();

 public:
  // Use the global credentials provider if provider is null
  explicit ClientConfiguration(
      const boost::shared_ptr<CredentialsProvider>& provider =
          boost::shared_ptr<CredentialsProvider>());

 public:
  // Get credentials for the bucket
  //
  // @param  : bucket
  // @return : credentials
  //
  // Throw DCException if there is no credentials for the bucket.
  Credentials GetCredentials(const std::string& bucket) const;

  // accessor
  const std::string& GetZone() const { return m_zone; }
  const std::string& GetHost() const { return m_host; }
  Http::Protocol::Value GetProtocol() const { return m_protocol; }
  uint16_t GetPort() const { return m_port; }
  const std::string& GetAdditionalAgent() const {
    return m_additionalUserAgent;
  }
  ClientLogLevel::Value GetClientLogLevel() const { return m_logLevel; }
  const std::string& GetClientLogDirectory() const { return m_sdkLogDirectory; }
  uint16_t GetTransactionRetries() const { return m_transactionRetries; }
  uint32_t GetTransactionTimeDuration() const {
    return m_transactionTimeDuration;
  }
  uint64_t GetFetchRangeSize() const { return m_fetchRangeSize; }
  uint64_t GetMaxBufferedBytes() const { return m_maxBufferedBytes; }
  uint64_t GetTransferChunkSize() const { return m_transferChunkSize; }
  uint64_t GetUploadPartSize() const { return m_uploadPartSize; }

 private:
  void InitializeByOptions();
  friend void ::ClientConfigurationInitializer();

 private:
  boost::shared_ptr<CredentialsProvider> m_credentialsProvider;
  std::string m_zone;  // zone or region
  std::string m_host;
  Http::Protocol::Value m_protocol;
  uint16_t m_port;
  std::string m_additionalUserAgent;
  ClientLogLevel::Value m_logLevel;
  std::string m_sdkLogDirectory;  // log directory

  uint16_t m_transactionRetries;       // retry times for one transaction
  uint32_t m_transactionTimeDuration;  // time duration for one transaction
                                       // in seconds
  uint64_t m_fetchRangeSize;     // bytes of one ranged fetch request
  uint64_t m_maxBufferedBytes;   // capacity of daisy chain buffer
  uint64_t m_transferChunkSize;  // chunk size between fetch and upload
  uint64_t m_uploadPartSize;     // multipart upload part size
};

}  // namespace Client
}  // namespace DC


#endif  // DAISYCP_CLIENT_CLIENTCONFIGURATION_H_

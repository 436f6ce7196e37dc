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

#include "configure/Default.h"

#include <sys/stat.h>
#include <sys/types.h>

#include <string>

#include "base/Size.h"
#include "base/StringUtils.h"

namespace DC {

namespace Configure {

namespace Default {

using std::string;

static const char* const PROGRAM_NAME = "daisycp";
static const char* const DAISYCP_DEFAULT_CREDENTIALS = "/etc/daisycp.cred";
static const char* const DAISYCP_DEFAULT_LOG_DIR = "/tmp/daisycp_log/";
static const char* const DAISYCP_DEFAULT_LOGLEVEL_NAME = "WARN";
static const char* const DAISYCP_DEFAULT_HOST = "qingstor.com";
static const char* const DAISYCP_DEFAULT_PROTOCOL = "https";
static const char* const DAISYCP_DEFAULT_ZONE = "pek3a";
static const char* const DAISYCP_OBJECT_URL_SCHEME = "qs://";
static const int DAISYCP_DEFAULT_MAX_LOG_SIZE = 50;  // MB
static uint16_t const DAISYCP_DEFAULT_TRANSACTION_RETRIES = 3;
static const char* QS_SDK_LOG_DIR_BASE_NAME = "sdk.log";  // qs sdk log

const char* GetProgramName() { return PROGRAM_NAME; }

string GetDefaultCredentialsFile() { return DAISYCP_DEFAULT_CREDENTIALS; }
string GetDefaultLogDirectory() { return DAISYCP_DEFAULT_LOG_DIR; }
string GetDefaultLogLevelName() { return DAISYCP_DEFAULT_LOGLEVEL_NAME; }
int GetDefaultMaxLogSize() { return DAISYCP_DEFAULT_MAX_LOG_SIZE; }
string GetDefaultHostName() { return DAISYCP_DEFAULT_HOST; }

uint16_t GetDefaultPort(const string& protocolName) {
  static const uint16_t HTTP_DEFAULT_PORT = 80;
  static const uint16_t HTTPS_DEFAULT_PORT = 443;
  return DC::StringUtils::ToLower(protocolName) == "http" ? HTTP_DEFAULT_PORT
                                                          : HTTPS_DEFAULT_PORT;
}

string GetDefaultProtocolName() { return DAISYCP_DEFAULT_PROTOCOL; }
string GetDefaultZone() { return DAISYCP_DEFAULT_ZONE; }
const char* GetObjectURLScheme() { return DAISYCP_OBJECT_URL_SCHEME; }

mode_t GetDefaultDirMode() {
  return (S_IRWXU | S_IRGRP | S_IXGRP | S_IROTH | S_IXOTH);
}

uint16_t GetDefaultTransactionRetries() {
  return DAISYCP_DEFAULT_TRANSACTION_RETRIES;
}

uint32_t GetDefaultTransactionTimeDuration() {
  return 300;  // in seconds, a ranged fetch may be slow to drain
}

const char* GetSDKLogFolderBaseName() { return QS_SDK_LOG_DIR_BASE_NAME; }

uint64_t GetDefaultFetchRangeSize() { return DC::Size::MB100; }

uint64_t GetDefaultMaxBufferedBytes() { return DC::Size::MB1; }

uint64_t GetDefaultTransferChunkSize() { return DC::Size::KB8; }

uint64_t GetUploadMultipartMinPartSize() {
  // qingstor specific
  return DC::Size::MB4;
}

uint64_t GetUploadMultipartMaxPartSize() { return DC::Size::GB1; }

uint64_t GetDefaultUploadPartSize() { return DC::Size::MB32; }

uint64_t GetUploadMultipartThresholdSize() { return DC::Size::MB32; }

uint64_t GetPutObjectMaxSize() { return DC::Size::GB5; }

uint16_t GetUploadMaxPartCount() { return 10000; }

}  // namespace Default
}  // namespace Configure
}  // namespace DC

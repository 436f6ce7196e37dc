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

#ifndef DAISYCP_CONFIGURE_DEFAULT_H_
#define DAISYCP_CONFIGURE_DEFAULT_H_

#include <stddef.h>
#include <stdint.h>  // for fixed width integer types

#include <sys/types.h>  // for mode_t

#include <string>

namespace DC {

namespace Configure {

namespace Default {

const char* GetProgramName();

std::string GetDefaultCredentialsFile();
std::string GetDefaultLogDirectory();
std::string GetDefaultLogLevelName();
int GetDefaultMaxLogSize();  // in MB
std::string GetDefaultHostName();
uint16_t GetDefaultPort(const std::string& protocolName);
std::string GetDefaultProtocolName();
std::string GetDefaultZone();
const char* GetObjectURLScheme();

mode_t GetDefaultDirMode();

uint16_t GetDefaultTransactionRetries();
uint32_t GetDefaultTransactionTimeDuration();  // in seconds
const char* GetSDKLogFolderBaseName();

// Daisy chain
uint64_t GetDefaultFetchRangeSize();     // bytes per ranged fetch request
uint64_t GetDefaultMaxBufferedBytes();   // capacity of in-memory buffer
uint64_t GetDefaultTransferChunkSize();  // consumer read size

// Upload
uint64_t GetUploadMultipartMinPartSize();
uint64_t GetUploadMultipartMaxPartSize();
uint64_t GetDefaultUploadPartSize();
uint64_t GetUploadMultipartThresholdSize();
uint64_t GetPutObjectMaxSize();
uint16_t GetUploadMaxPartCount();

}  // namespace Default
}  // namespace Configure
}  // namespace DC

#endif  // DAISYCP_CONFIGURE_DEFAULT_H_

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

#include "configure/Options.h"

#include <ostream>
#include <string>

#include "boost/exception/to_string.hpp"

#include "base/LogLevel.h"
#include "base/Size.h"
#include "configure/Default.h"

namespace DC {

namespace Configure {

using boost::to_string;
using DC::Configure::Default::GetDefaultCredentialsFile;
using DC::Configure::Default::GetDefaultFetchRangeSize;
using DC::Configure::Default::GetDefaultHostName;
using DC::Configure::Default::GetDefaultLogDirectory;
using DC::Configure::Default::GetDefaultLogLevelName;
using DC::Configure::Default::GetDefaultMaxBufferedBytes;
using DC::Configure::Default::GetDefaultMaxLogSize;
using DC::Configure::Default::GetDefaultPort;
using DC::Configure::Default::GetDefaultProtocolName;
using DC::Configure::Default::GetDefaultTransactionRetries;
using DC::Configure::Default::GetDefaultTransactionTimeDuration;
using DC::Configure::Default::GetDefaultTransferChunkSize;
using DC::Configure::Default::GetDefaultUploadPartSize;
using DC::Configure::Default::GetDefaultZone;
using DC::Logging::GetLogLevelByName;
using DC::Logging::GetLogLevelName;
using std::ostream;

// --------------------------------------------------------------------------
Options::Options()
    : m_source(),
      m_destination(),
      m_zone(GetDefaultZone()),
      m_credentialsFile(GetDefaultCredentialsFile()),
      m_logDirectory(GetDefaultLogDirectory()),
      m_logLevel(GetLogLevelByName(GetDefaultLogLevelName())),
      m_maxLogSizeInMB(GetDefaultMaxLogSize()),
      m_retries(GetDefaultTransactionRetries()),
      m_requestTimeOut(GetDefaultTransactionTimeDuration()),
      m_fetchRangeSize(GetDefaultFetchRangeSize()),
      m_maxBufferedBytes(GetDefaultMaxBufferedBytes()),
      m_transferChunkSize(GetDefaultTransferChunkSize()),
      m_uploadPartSize(GetDefaultUploadPartSize()),
      m_host(GetDefaultHostName()),
      m_protocol(GetDefaultProtocolName()),
      m_port(GetDefaultPort(GetDefaultProtocolName())),
      m_additionalAgent(),
      m_clearLogDir(false),
      m_foreground(false),
      m_debug(false),
      m_showHelp(false),
      m_showVersion(false) {}

// --------------------------------------------------------------------------
ostream &operator<<(ostream &os, const Options &opts) {
  return os
         << "[source: " << opts.m_source << "] "
         << "[destination: " << opts.m_destination << "] "
         << "[zone: " << opts.m_zone << "] "
         << "[credentials: " << opts.m_credentialsFile << "] "
         << "[log directory: " << opts.m_logDirectory << "] "
         << "[log level: " << GetLogLevelName(opts.m_logLevel) << "] "
         << "[max log size(MB): " << to_string(opts.m_maxLogSizeInMB) << "] "
         << "[retries: " << to_string(opts.m_retries) << "] "
         << "[req timeout(s): " << to_string(opts.m_requestTimeOut) << "] "
         << "[fetch range(MB): "
         << to_string(opts.m_fetchRangeSize / DC::Size::MB1) << "] "
         << "[buffer(KB): "
         << to_string(opts.m_maxBufferedBytes / DC::Size::KB1) << "] "
         << "[chunk(KB): "
         << to_string(opts.m_transferChunkSize / DC::Size::KB1) << "] "
         << "[part size(MB): "
         << to_string(opts.m_uploadPartSize / DC::Size::MB1) << "] "
         << "[host: " << opts.m_host << "] "
         << "[protocol: " << opts.m_protocol << "] "
         << "[port: " << to_string(opts.m_port) << "] "
         << "[additional agent: " << opts.m_additionalAgent << "] "
         << std::boolalpha
         << "[clear logdir: " << opts.m_clearLogDir << "] "
         << "[foreground: " << opts.m_foreground << "] "
         << "[debug: " << opts.m_debug << "] "
         << "[show help: " << opts.m_showHelp << "] "
         << "[show version: " << opts.m_showVersion << "]"
         << std::noboolalpha;
}

}  // namespace Configure
}  // namespace DC

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

#include "app/Parser.h"

#include <stdint.h>

#include <iostream>
#include <string>
#include <vector>

#include "boost/exception/to_string.hpp"
#include "boost/program_options.hpp"

#include "base/Exception.h"
#include "base/LogLevel.h"
#include "base/Size.h"
#include "client/Protocol.h"
#include "configure/Default.h"
#include "configure/Options.h"

namespace DC {

namespace App {

namespace Parser {

namespace po = boost::program_options;

using boost::to_string;
using DC::Client::Http::IsValidProtocolName;
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
using DC::Configure::Default::GetProgramName;
using DC::Configure::Default::GetUploadMultipartMaxPartSize;
using DC::Configure::Default::GetUploadMultipartMinPartSize;
using DC::Exception::DCException;
using DC::Logging::GetLogLevelByName;
using DC::Logging::IsValidLogLevelName;
using std::string;
using std::vector;

namespace {

void PrintWarnMsg(const char *opt, const string &invalidVal,
                  const string &defaultVal, const char *extraMsg = NULL) {
  std::cerr << "[" << GetProgramName() << "] invalid parameter in option "
            << opt << "=" << invalidVal << ", " << defaultVal << " is used.";
  if (extraMsg != NULL) {
    std::cerr << " " << extraMsg;
  }
  std::cerr << std::endl;
}

}  // namespace

// --------------------------------------------------------------------------
void Parse(int argc, char **argv) {
  int retries = GetDefaultTransactionRetries();
  int reqtimeout = GetDefaultTransactionTimeDuration();
  int maxlogsize = GetDefaultMaxLogSize();
  int rangeMB = static_cast<int>(GetDefaultFetchRangeSize() / DC::Size::MB1);
  int bufferKB = static_cast<int>(GetDefaultMaxBufferedBytes() / DC::Size::KB1);
  int chunkKB = static_cast<int>(GetDefaultTransferChunkSize() / DC::Size::KB1);
  int partsizeMB =
      static_cast<int>(GetDefaultUploadPartSize() / DC::Size::MB1);
  int port = -1;  // follow protocol
  string loglevel = GetDefaultLogLevelName();
  string protocol = GetDefaultProtocolName();

  DC::Configure::Options &options = DC::Configure::Options::Instance();

  po::options_description general("daisycp options");
  general.add_options()
      ("credentials,c",
       po::value<string>()->default_value(GetDefaultCredentialsFile()),
       "credentials file")
      ("zone,z", po::value<string>()->default_value(GetDefaultZone()),
       "zone or region")
      ("logdir,l",
       po::value<string>()->default_value(GetDefaultLogDirectory()),
       "log directory")
      ("loglevel,L", po::value<string>(&loglevel), "min log level")
      ("maxlogsize", po::value<int>(&maxlogsize), "max log file size in MB")
      ("retries,r", po::value<int>(&retries), "retries of a failed request")
      ("reqtimeout,R", po::value<int>(&reqtimeout), "request timeout in seconds")
      ("host,H", po::value<string>()->default_value(GetDefaultHostName()),
       "host name")
      ("protocol,p", po::value<string>(&protocol), "https or http")
      ("port,P", po::value<int>(&port), "port")
      ("agent,a", po::value<string>()->default_value(""),
       "additional user agent")
      ("range", po::value<int>(&rangeMB), "fetch range size in MB")
      ("buffer", po::value<int>(&bufferKB), "buffer capacity in KB")
      ("chunk", po::value<int>(&chunkKB), "transfer chunk size in KB")
      ("partsize", po::value<int>(&partsizeMB), "upload part size in MB")
      ("clearlogdir,C", "clear log directory at beginning")
      ("foreground,f", "log to stderr")
      ("debug,d", "turn on debug messages")
      ("help,h", "print help")
      ("version,V", "print version");

  po::options_description hidden;
  hidden.add_options()
      ("locations", po::value<vector<string> >(), "source and destination");

  po::options_description all;
  all.add(general).add(hidden);

  po::positional_options_description positional;
  positional.add("locations", -1);

  po::variables_map vm;
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(all)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error &e) {
    throw DCException("Error while parsing command line options: " +
                      string(e.what()));
  }

  options.SetShowHelp(vm.count("help") > 0);
  options.SetShowVersion(vm.count("version") > 0);

  if (vm.count("locations")) {
    const vector<string> &locations = vm["locations"].as<vector<string> >();
    if (locations.size() > 2) {
      throw DCException("Unknown argument " + locations[2]);
    }
    options.SetSource(locations[0]);
    if (locations.size() > 1) {
      options.SetDestination(locations[1]);
    }
  }

  options.SetCredentialsFile(vm["credentials"].as<string>());
  options.SetZone(vm["zone"].as<string>());
  options.SetLogDirectory(vm["logdir"].as<string>());

  if (!IsValidLogLevelName(loglevel)) {
    PrintWarnMsg("-L|--loglevel", loglevel, GetDefaultLogLevelName());
    loglevel = GetDefaultLogLevelName();
  }
  options.SetLogLevel(GetLogLevelByName(loglevel));

  if (maxlogsize <= 0) {
    PrintWarnMsg("--maxlogsize", to_string(maxlogsize),
                 to_string(GetDefaultMaxLogSize()));
    maxlogsize = GetDefaultMaxLogSize();
  }
  options.SetMaxLogSizeInMB(maxlogsize);

  if (retries <= 0) {
    PrintWarnMsg("-r|--retries", to_string(retries),
                 to_string(GetDefaultTransactionRetries()));
    retries = GetDefaultTransactionRetries();
  }
  options.SetRetries(static_cast<uint16_t>(retries));

  if (reqtimeout <= 0) {
    PrintWarnMsg("-R|--reqtimeout", to_string(reqtimeout),
                 to_string(GetDefaultTransactionTimeDuration()));
    reqtimeout = GetDefaultTransactionTimeDuration();
  }
  options.SetRequestTimeOut(static_cast<uint32_t>(reqtimeout));

  options.SetHost(vm["host"].as<string>());

  if (!IsValidProtocolName(protocol)) {
    PrintWarnMsg("-p|--protocol", protocol, GetDefaultProtocolName());
    protocol = GetDefaultProtocolName();
  }
  options.SetProtocol(protocol);

  if (vm.count("port") && (port <= 0 || port > 65535)) {
    PrintWarnMsg("-P|--port", to_string(port),
                 to_string(GetDefaultPort(protocol)));
    port = -1;
  }
  options.SetPort(port > 0 ? static_cast<uint16_t>(port)
                           : GetDefaultPort(protocol));

  options.SetAdditionalAgent(vm["agent"].as<string>());

  if (rangeMB <= 0) {
    PrintWarnMsg("--range", to_string(rangeMB),
                 to_string(GetDefaultFetchRangeSize() / DC::Size::MB1));
    options.SetFetchRangeSize(GetDefaultFetchRangeSize());
  } else {
    options.SetFetchRangeSize(static_cast<uint64_t>(rangeMB) * DC::Size::MB1);
  }

  if (bufferKB <= 0) {
    PrintWarnMsg("--buffer", to_string(bufferKB),
                 to_string(GetDefaultMaxBufferedBytes() / DC::Size::KB1));
    options.SetMaxBufferedBytes(GetDefaultMaxBufferedBytes());
  } else {
    options.SetMaxBufferedBytes(static_cast<uint64_t>(bufferKB) *
                                DC::Size::KB1);
  }

  // the fallback chunk must still fit a small buffer
  uint64_t bufferBytes = options.GetMaxBufferedBytes();
  uint64_t defaultChunkSize = GetDefaultTransferChunkSize() < bufferBytes
                                  ? GetDefaultTransferChunkSize()
                                  : bufferBytes;
  uint64_t chunkSize = static_cast<uint64_t>(chunkKB) * DC::Size::KB1;
  if (chunkKB <= 0 || chunkSize > bufferBytes) {
    PrintWarnMsg("--chunk", to_string(chunkKB),
                 to_string(defaultChunkSize / DC::Size::KB1),
                 "Chunk should not be larger than buffer.");
    chunkSize = defaultChunkSize;
  }
  options.SetTransferChunkSize(chunkSize);

  uint64_t partSize = static_cast<uint64_t>(partsizeMB) * DC::Size::MB1;
  if (partsizeMB <= 0 || partSize < GetUploadMultipartMinPartSize() ||
      partSize > GetUploadMultipartMaxPartSize()) {
    PrintWarnMsg("--partsize", to_string(partsizeMB),
                 to_string(GetDefaultUploadPartSize() / DC::Size::MB1));
    partSize = GetDefaultUploadPartSize();
  }
  options.SetUploadPartSize(partSize);

  options.SetClearLogDir(vm.count("clearlogdir") > 0);
  options.SetForeground(vm.count("foreground") > 0);
  options.SetDebug(vm.count("debug") > 0);
}

}  // namespace Parser
}  // namespace App
}  // namespace DC

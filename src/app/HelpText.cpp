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

#include "app/HelpText.h"

#include <iostream>
#include <string>

#include "boost/exception/to_string.hpp"

#include "base/Size.h"
#include "configure/Default.h"
#include "configure/Version.h"

namespace DC {

namespace App {

namespace HelpText {

using boost::to_string;
using DC::Configure::Default::GetDefaultCredentialsFile;
using DC::Configure::Default::GetDefaultFetchRangeSize;
using DC::Configure::Default::GetDefaultHostName;
using DC::Configure::Default::GetDefaultLogDirectory;
using DC::Configure::Default::GetDefaultLogLevelName;
using DC::Configure::Default::GetDefaultMaxBufferedBytes;
using DC::Configure::Default::GetDefaultMaxLogSize;
using DC::Configure::Default::GetDefaultProtocolName;
using DC::Configure::Default::GetDefaultTransactionRetries;
using DC::Configure::Default::GetDefaultTransactionTimeDuration;
using DC::Configure::Default::GetDefaultTransferChunkSize;
using DC::Configure::Default::GetDefaultUploadPartSize;
using DC::Configure::Default::GetDefaultZone;
using DC::Configure::Default::GetUploadMultipartMaxPartSize;
using DC::Configure::Default::GetUploadMultipartMinPartSize;
using std::cout;
using std::endl;

void ShowDaisycpVersion() {
  cout << "daisycp version: " << DC::Configure::Version::GetVersionString()
       << endl;
}

void ShowDaisycpHelp() {
  cout <<
  "Copy an object between QingStor locations without staging it on disk.\n";
  ShowDaisycpUsage();
  cout <<
  "\n"
  "  copying\n"
  "    daisycp qs://<BUCKET>/<KEY>[#ETAG] qs://<BUCKET>/<KEY> [options]\n"
  "  A source pinned with #ETAG fails if the object has been changed.\n"
  "\n"
  "daisycp Options:\n"
  "Mandatory argements to long options are mandatory for short options too.\n"
  "  -c, --credentials  Specify credentials file, default path is " <<
                          GetDefaultCredentialsFile() << "\n" <<
  "  -z, --zone         Zone or region, default value is " << GetDefaultZone() << "\n"
  "  -l, --logdir       Specify log directory, default path is " <<
                          GetDefaultLogDirectory() << "\n" <<
  "  -L, --loglevel     Min log level, message lower than this level don't logged;\n"
  "                     Specify one of following log level: INFO,WARN,ERROR,FATAL;\n"
  "                     " << GetDefaultLogLevelName() << " is set by default\n"
  "      --maxlogsize   Max size(MB) of a log file, default value is "
                        << to_string(GetDefaultMaxLogSize()) << "MB\n"
  "  -r, --retries      Number of times to retry a failed request, default value\n"
  "                     is " << to_string(GetDefaultTransactionRetries()) << " times\n"
  "  -R, --reqtimeout   Time(seconds) to wait before timing out a request, default value\n"
  "                     is " << to_string(GetDefaultTransactionTimeDuration())
                                          << " seconds\n"
  "  -H, --host         Host name, default value is " << GetDefaultHostName() << "\n" <<
  "  -p, --protocol     Protocol could be https or http, default value is " <<
                                              GetDefaultProtocolName() << "\n" <<
  "  -P, --port         Specify port, default is 443 for https and 80 for http\n"
  "  -a, --agent        Additional user agent\n"
  "\n"
  "Transfer Options:\n"
  "      --range        Size(MB) of one ranged request to the source, default value\n"
  "                     is " << to_string(GetDefaultFetchRangeSize() / DC::Size::MB1) << "MB\n"
  "      --buffer       Max size(KB) of data held in memory, default value is "
                        << to_string(GetDefaultMaxBufferedBytes() / DC::Size::KB1) << "KB\n"
  "      --chunk        Size(KB) of one read from the buffer, should not be larger\n"
  "                     than buffer, default value is "
                        << to_string(GetDefaultTransferChunkSize() / DC::Size::KB1) << "KB\n"
  "      --partsize     Size(MB) of a multipart upload part, between "
                        << to_string(GetUploadMultipartMinPartSize() / DC::Size::MB1) << "MB and "
                        << to_string(GetUploadMultipartMaxPartSize() / DC::Size::MB1) << "MB,\n"
  "                     default value is "
                        << to_string(GetDefaultUploadPartSize() / DC::Size::MB1) << "MB\n"
  "\n"
  "Miscellaneous Options:\n"
  "  -C, --clearlogdir  Clear log directory at beginning\n"
  "  -f, --foreground   Turn on log to STDERR\n"
  "  -d, --debug        Turn on debug messages to log\n"
  "  -h, --help         Print daisycp help\n"
  "  -V, --version      Print daisycp version\n";
  cout.flush();
}

void ShowDaisycpUsage() {
  cout <<
  "Usage: daisycp <SOURCE> <DESTINATION>\n"
  "       [-c|--credentials=[file path]] [-z|--zone=[value]]\n"
  "       [-l|--logdir=[dir]] [-L|--loglevel=[INFO|WARN|ERROR|FATAL]]\n"
  "       [--maxlogsize=[value]]\n"
  "       [-r|--retries=[value]] [-R|--reqtimeout=[value]]\n"
  "       [-H|--host=[value]] [-p|--protocol=[value]]\n"
  "       [-P|--port=[value]] [-a|--agent=[value]]\n"
  "       [--range=[value]] [--buffer=[value]]\n"
  "       [--chunk=[value]] [--partsize=[value]]\n"
  "       [-C|--clearlogdir]\n"
  "       [-f|--foreground]\n"
  "       [-d|--debug]\n"
  "       [-h|--help] [-V|--version]\n";
  cout.flush();
}

}  // namespace HelpText
}  // namespace App
}  // namespace DC

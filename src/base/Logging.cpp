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

#include "base/Logging.h"

#include <errno.h>
#include <string.h>  // for strerror

#include <iostream>
#include <string>
#include <utility>

#include "boost/bind.hpp"
#include "boost/thread/once.hpp"
#include "glog/logging.h"

#include "base/Exception.h"
#include "base/LogLevel.h"
#include "base/Utils.h"
#include "configure/Default.h"

namespace {

// Failure writer for glog signal handler, the dump is written to log file
// and also to stderr as the process is going down.
void WriteFailureDump(const char *data, int size) {
  if (data == NULL || size <= 0) {
    return;
  }
  std::string msg(data, size);
  if (!msg.empty() && msg[msg.size() - 1] == '\n') {
    msg.erase(msg.size() - 1);
  }
  LOG(ERROR) << msg;
  std::cerr << msg << std::endl;
}

void InitializeGLog() {
  google::InitGoogleLogging(DC::Configure::Default::GetProgramName());
  google::InstallFailureSignalHandler();
  google::InstallFailureWriter(&WriteFailureDump);
}

}  // namespace

namespace DC {

namespace Logging {

using DC::Exception::DCException;
using std::pair;
using std::string;

static boost::once_flag initOnce = BOOST_ONCE_INIT;

// --------------------------------------------------------------------------
void Log::Initialize(const string &logdir, int maxLogSizeMB) {
  boost::call_once(initOnce, boost::bind(boost::type<void>(),
                                         &Log::DoInitialize, this, logdir,
                                         maxLogSizeMB));
}

// --------------------------------------------------------------------------
void Log::SetLogLevel(LogLevel::Value level) {
  m_logLevel = level;
  FLAGS_minloglevel = static_cast<int>(level);
}

// --------------------------------------------------------------------------
void Log::DoInitialize(const string &logdir, int maxLogSizeMB) {
  if (logdir.empty()) {
    FLAGS_logtostderr = 1;
    FLAGS_colorlogtostderr = true;
  } else {
    m_logDirectory = logdir;
    // FLAGS_log_dir only takes effect if it is set before calling
    // google::InitGoogleLogging.
    FLAGS_log_dir = logdir.c_str();
    FLAGS_max_log_size = maxLogSizeMB > 0
                             ? maxLogSizeMB
                             : DC::Configure::Default::GetDefaultMaxLogSize();
    FLAGS_stop_logging_if_full_disk = true;

    if (!DC::Utils::CreateDirectoryIfNotExists(logdir)) {
      throw DCException("Unable to create log directory " + logdir + " : " +
                        strerror(errno));
    }

    pair<bool, string> permission = DC::Utils::HavePermission(logdir);
    if (!permission.first) {
      throw DCException("Could not create logging file at " + logdir + ": " +
                        permission.second);
    }
  }

  InitializeGLog();
}

// --------------------------------------------------------------------------
void Log::ClearLogDirectory() const {
  if (m_logDirectory.empty()) {
    std::cerr << "Log message to stderr, nothing to clear" << std::endl;
    return;
  }

  pair<bool, string> outcome =
      DC::Utils::DeleteFilesInDirectory(m_logDirectory, false);
  if (!outcome.first) {
    std::cerr << "Unable to clear log directory : " << outcome.second
              << ". But continue..." << std::endl;
  }
}

}  // namespace Logging
}  // namespace DC

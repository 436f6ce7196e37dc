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

#ifndef DAISYCP_BASE_LOGGING_H_
#define DAISYCP_BASE_LOGGING_H_

#include <string>

#include "base/LogLevel.h"
#include "base/Singleton.hpp"

// Declare in global namespace before class Log, since friend declarations
// can only introduce names in the surrounding namespace.
extern void LoggingInitializer();

namespace DC {

namespace Logging {

//
// Log
//
// Must call Initialize to get log ready, and it's one-time initialization.
// Specify a directory to log message to files under it,
// or log message to stderr with no specifying.
//
class Log : public Singleton<Log> {
 public:
  LogLevel::Value GetLogLevel() const { return m_logLevel; }
  bool IsDebug() const { return m_isDebug; }
  const std::string &GetLogDirectory() const { return m_logDirectory; }

  // Initialize
  //
  // @param  : log dir, max size (MB) of a single log file
  // @return : none
  //
  // Pass a null log dir to log message to stderr, this is default.
  // Throw DCException if log dir cannot be created or accessed.
  void Initialize(const std::string &logdir = std::string(),
                  int maxLogSizeMB = 0);

 private:
  void SetLogLevel(LogLevel::Value level);
  void SetDebug(bool debug) { m_isDebug = debug; }
  void DoInitialize(const std::string &logdir, int maxLogSizeMB);
  void ClearLogDirectory() const;

 private:
  Log()
      : m_logLevel(LogLevel::Info),
        m_logDirectory(std::string()),
        m_isDebug(false) {}

  LogLevel::Value m_logLevel;
  std::string m_logDirectory;  // log to stderr if it's empty
  bool m_isDebug;

  friend void ::LoggingInitializer();
  friend class LoggingTest;
  friend class Singleton<Log>;
};

}  // namespace Logging
}  // namespace DC

#endif  // DAISYCP_BASE_LOGGING_H_

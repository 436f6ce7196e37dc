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

#ifndef DAISYCP_BASE_LOGMACROS_H_
#define DAISYCP_BASE_LOGMACROS_H_

#include "glog/logging.h"

#include "base/LogLevel.h"
#include "base/Logging.h"

#ifdef DISABLE_DAISYCP_LOGGING
#define Info(msg)
#define Warning(msg)
#define Error(msg)
#define Fatal(msg)

#define InfoIf(condition, msg)
#define WarningIf(condition, msg)
#define ErrorIf(condition, msg)
#define FatalIf(condition, msg)

#define DebugInfo(msg)
#define DebugWarning(msg)
#define DebugError(msg)

#define DebugInfoIf(condition, msg)
#define DebugWarningIf(condition, msg)
#define DebugErrorIf(condition, msg)

#else  // !DISABLE_DAISYCP_LOGGING

#define DAISYCP_LOG_PREFIX(level) \
  DC::Logging::GetLogLevelPrefix(DC::Logging::LogLevel::level)

#define DAISYCP_IS_DEBUG() DC::Logging::Log::Instance().IsDebug()

// glog buffers INFO stream, flush it after each non-fatal message so the
// log file is always complete when a copy aborts.
#define DAISYCP_LOG_FLUSH() google::FlushLogFiles(google::INFO)

#define Info(msg)                                 \
  {                                               \
    LOG(INFO) << DAISYCP_LOG_PREFIX(Info) << msg; \
    DAISYCP_LOG_FLUSH();                          \
  }

#define Warning(msg)                                 \
  {                                                  \
    LOG(WARNING) << DAISYCP_LOG_PREFIX(Warn) << msg; \
    DAISYCP_LOG_FLUSH();                             \
  }

#define Error(msg)                                  \
  {                                                 \
    LOG(ERROR) << DAISYCP_LOG_PREFIX(Error) << msg; \
    DAISYCP_LOG_FLUSH();                            \
  }

#define Fatal(msg) \
  { LOG(FATAL) << DAISYCP_LOG_PREFIX(Fatal) << msg; }

#define InfoIf(condition, msg)                                  \
  {                                                             \
    LOG_IF(INFO, (condition)) << DAISYCP_LOG_PREFIX(Info) << msg; \
    DAISYCP_LOG_FLUSH();                                        \
  }

#define WarningIf(condition, msg)                                     \
  {                                                                   \
    LOG_IF(WARNING, (condition)) << DAISYCP_LOG_PREFIX(Warn) << msg; \
    DAISYCP_LOG_FLUSH();                                              \
  }

#define ErrorIf(condition, msg)                                      \
  {                                                                  \
    LOG_IF(ERROR, (condition)) << DAISYCP_LOG_PREFIX(Error) << msg; \
    DAISYCP_LOG_FLUSH();                                             \
  }

#define FatalIf(condition, msg) \
  { LOG_IF(FATAL, (condition)) << DAISYCP_LOG_PREFIX(Fatal) << msg; }

#define DebugInfo(msg)                  \
  {                                     \
    if (DAISYCP_IS_DEBUG()) {           \
      Info(msg);                        \
    }                                   \
  }

#define DebugWarning(msg)               \
  {                                     \
    if (DAISYCP_IS_DEBUG()) {           \
      Warning(msg);                     \
    }                                   \
  }

#define DebugError(msg)                 \
  {                                     \
    if (DAISYCP_IS_DEBUG()) {           \
      Error(msg);                       \
    }                                   \
  }

#define DebugInfoIf(condition, msg)     \
  {                                     \
    if (DAISYCP_IS_DEBUG()) {           \
      InfoIf(condition, msg);           \
    }                                   \
  }

#define DebugWarningIf(condition, msg)  \
  {                                     \
    if (DAISYCP_IS_DEBUG()) {           \
      WarningIf(condition, msg);        \
    }                                   \
  }

#define DebugErrorIf(condition, msg)    \
  {                                     \
    if (DAISYCP_IS_DEBUG()) {           \
      ErrorIf(condition, msg);          \
    }                                   \
  }

#endif  // DISABLE_DAISYCP_LOGGING

#endif  // DAISYCP_BASE_LOGMACROS_H_

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

#include "base/LogLevel.h"

#include <string>
#include <utility>

#include "base/StringUtils.h"

namespace DC {

namespace Logging {

using std::make_pair;
using std::pair;
using std::string;

namespace {

// lower case name to level, aliases included
const pair<const char *, LogLevel::Value> levelNames[] = {
    make_pair("info", LogLevel::Info),
    make_pair("warn", LogLevel::Warn),
    make_pair("warning", LogLevel::Warn),
    make_pair("error", LogLevel::Error),
    make_pair("fatal", LogLevel::Fatal),
};

const int levelNamesCount = sizeof(levelNames) / sizeof(levelNames[0]);

}  // namespace

// --------------------------------------------------------------------------
string GetLogLevelName(LogLevel::Value logLevel) {
  string name;
  switch (logLevel) {
    case LogLevel::Info:
      name = "INFO";
      break;
    case LogLevel::Warn:
      name = "WARN";
      break;
    case LogLevel::Error:
      name = "ERROR";
      break;
    case LogLevel::Fatal:
      name = "FATAL";
      break;
    default:
      break;
  }
  return name;
}

// --------------------------------------------------------------------------
LogLevel::Value GetLogLevelByName(const string &name) {
  string lower = DC::StringUtils::ToLower(DC::StringUtils::Trim(name, ' '));
  for (int i = 0; i < levelNamesCount; ++i) {
    if (lower == levelNames[i].first) {
      return levelNames[i].second;
    }
  }
  return LogLevel::Info;
}

// --------------------------------------------------------------------------
bool IsValidLogLevelName(const string &name) {
  string lower = DC::StringUtils::ToLower(DC::StringUtils::Trim(name, ' '));
  for (int i = 0; i < levelNamesCount; ++i) {
    if (lower == levelNames[i].first) {
      return true;
    }
  }
  return false;
}

// --------------------------------------------------------------------------
string GetLogLevelPrefix(LogLevel::Value logLevel) {
  return "[" + GetLogLevelName(logLevel) + "] ";
}

}  // namespace Logging
}  // namespace DC

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

#ifndef DAISYCP_BASE_STRINGUTILS_H_
#define DAISYCP_BASE_STRINGUTILS_H_

#include <stdint.h>  // for int64_t

#include <string>

namespace DC {

namespace StringUtils {

std::string ToLower(const std::string &str);
std::string ToUpper(const std::string &str);

std::string LTrim(const std::string &str, unsigned char c);
std::string RTrim(const std::string &str, unsigned char c);
std::string Trim(const std::string &str, unsigned char c);

// Check if str starts with prefix
bool StartsWith(const std::string &str, const std::string &prefix);

// Format object for logging
//
// @param  : object url
// @return : formatted string, e.g. "[object=qs://bucket/key]"
std::string FormatObject(const std::string &object);
std::string FormatObject(const std::string &from, const std::string &to);

// Format byte range for logging
//
// @param  : start, end (negative means end of object)
// @return : formatted string, e.g. "[range=0-99]" or "[range=100-]"
std::string FormatRange(int64_t start, int64_t end);

}  // namespace StringUtils
}  // namespace DC

#endif  // DAISYCP_BASE_STRINGUTILS_H_

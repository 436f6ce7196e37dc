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

#ifndef DAISYCP_BASE_UTILS_H_
#define DAISYCP_BASE_UTILS_H_

#include <unistd.h>  // for R_OK W_OK

#include <string>
#include <utility>

namespace DC {

namespace Utils {

// Create directory recursively if it doesn't exists
//
// @param  : dir path
// @return : bool
bool CreateDirectoryIfNotExists(const std::string &path);

// Delete files in dir recursively
//
// @param  : dir path, flag to delete dir itself
// @return : a pair of {true,""} or {false, message}
std::pair<bool, std::string> DeleteFilesInDirectory(const std::string &path,
                                                    bool deleteDirectorySelf);

// Check if file exists
bool FileExists(const std::string &path);

// Check if file is a directory
std::pair<bool, std::string> IsDirectory(const std::string &path);

// Check if process has access permission to the file
//
// @param  : file path, access mode combined of {R_OK, W_OK, X_OK}
// @return : a pair of {true,""} or {false, message}
std::pair<bool, std::string> HavePermission(const std::string &path,
                                            int amode = R_OK | W_OK);

// Check if path is root
bool IsRootDirectory(const std::string &path);

// Append delim to path
std::string AppendPathDelim(const std::string &path);

// Get dir name where the file belongs to
//
// @param  : file path
// @return : dir name ending with "/"
std::string GetDirName(const std::string &path);

}  // namespace Utils
}  // namespace DC

#endif  // DAISYCP_BASE_UTILS_H_

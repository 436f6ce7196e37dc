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

#include "base/Utils.h"

#include <errno.h>
#include <stdlib.h>  // for free
#include <string.h>  // for strerror strdup

#include <dirent.h>  // for opendir readdir
#include <libgen.h>  // for dirname
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <string>
#include <utility>

#include "boost/scope_exit.hpp"

#include "configure/Default.h"

namespace DC {

namespace Utils {

using std::make_pair;
using std::pair;
using std::string;

static const char PATH_DELIM = '/';

namespace {

string PostErrMsg(const string &path) {
  return string(": ") + strerror(errno) + " [path=" + path + "]";
}

}  // namespace

// --------------------------------------------------------------------------
bool CreateDirectoryIfNotExists(const string &path) {
  if (path.empty()) {
    return false;
  }
  if (IsRootDirectory(path)) {
    return true;
  }
  if (FileExists(path)) {
    return IsDirectory(path).first;
  }
  if (!CreateDirectoryIfNotExists(GetDirName(path))) {
    return false;
  }
  int errorCode =
      mkdir(path.c_str(), DC::Configure::Default::GetDefaultDirMode());
  return errorCode == 0 || errno == EEXIST;
}

// --------------------------------------------------------------------------
pair<bool, string> DeleteFilesInDirectory(const string &path,
                                          bool deleteSelf) {
  DIR *dir = opendir(path.c_str());
  if (dir == NULL) {
    return make_pair(false, "Could not open directory " + PostErrMsg(path));
  }
  BOOST_SCOPE_EXIT((dir)) { closedir(dir); }
  BOOST_SCOPE_EXIT_END

  struct dirent *entry = NULL;
  while ((entry = readdir(dir)) != NULL) {
    if (strcmp(entry->d_name, ".") == 0 || strcmp(entry->d_name, "..") == 0) {
      continue;
    }

    string fullPath = AppendPathDelim(path) + entry->d_name;
    struct stat st;
    if (lstat(fullPath.c_str(), &st) != 0) {
      return make_pair(false,
                       "Could not get stats of file " + PostErrMsg(fullPath));
    }

    if (S_ISDIR(st.st_mode)) {
      pair<bool, string> outcome = DeleteFilesInDirectory(fullPath, true);
      if (!outcome.first) {
        return outcome;
      }
    } else if (unlink(fullPath.c_str()) != 0) {
      return make_pair(false, "Could not remove file " + PostErrMsg(fullPath));
    }
  }

  if (deleteSelf && rmdir(path.c_str()) != 0) {
    return make_pair(false, "Could not remove dir " + PostErrMsg(path));
  }
  return make_pair(true, string());
}

// --------------------------------------------------------------------------
bool FileExists(const string &path) { return access(path.c_str(), F_OK) == 0; }

// --------------------------------------------------------------------------
pair<bool, string> IsDirectory(const string &path) {
  struct stat st;
  if (stat(path.c_str(), &st) != 0) {
    return make_pair(false, "Unable to access path " + PostErrMsg(path));
  }
  return make_pair(static_cast<bool>(S_ISDIR(st.st_mode)), string());
}

// --------------------------------------------------------------------------
pair<bool, string> HavePermission(const string &path, int amode) {
  if (access(path.c_str(), amode) != 0) {
    return make_pair(false, "No permission " + PostErrMsg(path));
  }
  return make_pair(true, string());
}

// --------------------------------------------------------------------------
bool IsRootDirectory(const string &path) { return path == "/"; }

// --------------------------------------------------------------------------
string AppendPathDelim(const string &path) {
  string copy(path);
  if (copy.empty() || copy[copy.size() - 1] != PATH_DELIM) {
    copy.append(1, PATH_DELIM);
  }
  return copy;
}

// --------------------------------------------------------------------------
string GetDirName(const string &path) {
  if (IsRootDirectory(path)) {
    return path;
  }
  string trimmed(path);
  while (trimmed.size() > 1 && trimmed[trimmed.size() - 1] == PATH_DELIM) {
    trimmed.erase(trimmed.size() - 1);
  }
  char *copy = strdup(trimmed.c_str());
  string dir = AppendPathDelim(dirname(copy));
  free(copy);
  return dir;
}

}  // namespace Utils
}  // namespace DC

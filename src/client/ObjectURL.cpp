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

#include "client/ObjectURL.h"

#include <string>
#include <utility>

#include "base/StringUtils.h"
#include "configure/Default.h"

namespace DC {

namespace Client {

using DC::Configure::Default::GetObjectURLScheme;
using DC::StringUtils::StartsWith;
using std::make_pair;
using std::pair;
using std::string;

namespace {

// qingstor object key limitation
const string::size_type KEY_MAX_LEN = 1023;

pair<bool, string> Invalid(const string &url, const string &reason) {
  return make_pair(false, "Invalid object url " + url + ": " + reason);
}

}  // namespace

// --------------------------------------------------------------------------
string ObjectURL::ToString() const {
  string url = string(GetObjectURLScheme()) + m_bucket + "/" + m_key;
  if (HasGeneration()) {
    url += "#" + m_generation;
  }
  return url;
}

// --------------------------------------------------------------------------
pair<bool, string> ParseObjectURL(const string &url, ObjectURL *objectURL) {
  if (objectURL == NULL) {
    return make_pair(false, "Null object url output");
  }
  string scheme = GetObjectURLScheme();
  if (!StartsWith(url, scheme)) {
    return Invalid(url, "expect scheme " + scheme);
  }

  string rest = url.substr(scheme.size());
  string generation;
  string::size_type hashPos = rest.find('#');
  if (hashPos != string::npos) {
    generation = rest.substr(hashPos + 1);
    rest.erase(hashPos);
    if (generation.empty()) {
      return Invalid(url, "empty generation after \"#\"");
    }
  }

  string::size_type slashPos = rest.find('/');
  if (slashPos == string::npos || slashPos == 0) {
    return Invalid(url, "missing bucket");
  }
  string bucket = rest.substr(0, slashPos);
  string key = rest.substr(slashPos + 1);
  if (key.empty()) {
    return Invalid(url, "missing object key");
  }
  if (key[key.size() - 1] == '/') {
    return Invalid(url, "object key should not be a directory");
  }
  if (key.size() > KEY_MAX_LEN) {
    return Invalid(url, "object key is too long");
  }

  *objectURL = ObjectURL(bucket, key, generation);
  return make_pair(true, string());
}

}  // namespace Client
}  // namespace DC

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

#include "client/Credentials.h"

#include <errno.h>
#include <string.h>

#include <sys/stat.h>

#include <fstream>
#include <string>
#include <utility>

#include "boost/bind.hpp"
#include "boost/make_shared.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/once.hpp"

#include "base/Exception.h"
#include "base/LogMacros.h"
#include "base/Utils.h"
#include "configure/Options.h"

namespace DC {

namespace Client {

using boost::bind;
using boost::call_once;
using boost::once_flag;
using boost::shared_ptr;
using DC::Exception::DCException;
using std::ifstream;
using std::make_pair;
using std::pair;
using std::string;

static shared_ptr<CredentialsProvider> credentialsProvider;
static once_flag credentialsProviderOnceFlag = BOOST_ONCE_INIT;

namespace {

string FormatFile(const string &file) { return " [file=" + file + "]"; }

pair<bool, string> ErrorOut(const string &str) { return make_pair(false, str); }

void SetProvider(const shared_ptr<CredentialsProvider> &provider) {
  credentialsProvider = provider;
}

void BuildDefaultProvider() {
  credentialsProvider = boost::make_shared<DefaultCredentialsProvider>(
      DC::Configure::Options::Instance().GetCredentialsFile());
}

// --------------------------------------------------------------------------
pair<bool, string> CheckCredentialsFilePermission(const string &file) {
  struct stat st;
  if (stat(file.c_str(), &st) != 0) {
    return ErrorOut("Unable to read credentials file : " +
                    string(strerror(errno)) + FormatFile(file));
  }
  if (st.st_mode & (S_IROTH | S_IWOTH | S_IXOTH)) {
    return ErrorOut("Credentials file should not have others permissions" +
                    FormatFile(file));
  }
  if (st.st_mode & (S_IRGRP | S_IWGRP | S_IXGRP)) {
    return ErrorOut("Credentials file should not have group permissions" +
                    FormatFile(file));
  }
  if (st.st_mode & S_IXUSR) {
    return ErrorOut("Credentials file should not have executable permissions" +
                    FormatFile(file));
  }
  return make_pair(true, string());
}

}  // namespace

// --------------------------------------------------------------------------
void InitializeCredentialsProvider(
    const shared_ptr<CredentialsProvider> &provider) {
  if (!provider) {
    throw DCException("Null credentials provider");
  }
  call_once(credentialsProviderOnceFlag,
            bind(boost::type<void>(), SetProvider, provider));
}

// --------------------------------------------------------------------------
CredentialsProvider &GetCredentialsProviderInstance() {
  call_once(credentialsProviderOnceFlag, BuildDefaultProvider);
  return *credentialsProvider.get();
}

// --------------------------------------------------------------------------
DefaultCredentialsProvider::DefaultCredentialsProvider(
    const string &credentialFile)
    : m_credentialsFile(credentialFile) {
  pair<bool, string> outcome = ReadCredentialsFile(credentialFile);
  if (!outcome.first) {
    throw DCException(outcome.second);
  }
}

// --------------------------------------------------------------------------
Credentials DefaultCredentialsProvider::GetCredentials(
    const string &bucket) const {
  BucketToKeyPairMapConstIterator it = m_bucketMap.find(bucket);
  if (it != m_bucketMap.end()) {
    return Credentials(it->second.first, it->second.second);
  }
  if (!HasDefaultKey()) {
    throw DCException("No access key for bucket " + bucket +
                      " and no default access key in credentials file" +
                      FormatFile(m_credentialsFile));
  }
  return Credentials(m_defaultAccessKeyId, m_defaultSecretKey);
}

// --------------------------------------------------------------------------
pair<bool, string> DefaultCredentialsProvider::ReadCredentialsFile(
    const string &file) {
  if (file.empty()) {
    return ErrorOut("Credentials file is not specified");
  }
  if (!DC::Utils::FileExists(file)) {
    return ErrorOut("Credentials file not exist" + FormatFile(file));
  }

  pair<bool, string> outcome = CheckCredentialsFilePermission(file);
  if (!outcome.first) {
    return outcome;
  }
  if (!DC::Utils::HavePermission(file, R_OK).first) {
    return ErrorOut("Credentials file permisson denied" + FormatFile(file));
  }

  ifstream credentials(file.c_str());
  if (!credentials) {
    return ErrorOut("Fail to read credentials file : " +
                    string(strerror(errno)) + FormatFile(file));
  }

  static const char *invalidChars = " \t";  // not allow space and tab
  static const char DELIM = ':';

  string line;
  while (std::getline(credentials, line)) {
    if (!line.empty() && line[line.size() - 1] == '\r') {
      line.erase(line.size() - 1, 1);
    }
    if (line.empty() || line[0] == '#') {
      continue;
    }
    if (line[0] == '[') {
      return ErrorOut("Invalid line starting with a bracket \"[\" is found" +
                      FormatFile(file));
    }
    if (line.find_first_of(invalidChars) != string::npos) {
      return ErrorOut("Invalid line with whitespace or tab is found" +
                      FormatFile(file));
    }

    string::size_type firstPos = line.find_first_of(DELIM);
    if (firstPos == string::npos) {
      return ErrorOut("Invalid line with no \":\" seperator is found" +
                      FormatFile(file));
    }
    string::size_type lastPos = line.find_last_of(DELIM);

    if (firstPos == lastPos) {  // default key
      if (HasDefaultKey()) {
        DebugWarning("More than one default key pairs are provided" +
                     FormatFile(file) + ". Only set with the first one");
        continue;
      }
      SetDefaultKey(line.substr(0, firstPos), line.substr(firstPos + 1));
    } else {  // bucket specified key
      string bucket = line.substr(0, firstPos);
      KeyIdToKeyPair keyPair =
          make_pair(line.substr(firstPos + 1, lastPos - firstPos - 1),
                    line.substr(lastPos + 1));
      if (!m_bucketMap.insert(make_pair(bucket, keyPair)).second) {
        DebugWarning("Duplicated key pairs for bucket " + bucket +
                     FormatFile(file) + ". Only set with the first one");
      }
    }
  }

  if (!HasDefaultKey() && m_bucketMap.empty()) {
    return ErrorOut("No access key is found" + FormatFile(file));
  }
  return make_pair(true, string());
}

}  // namespace Client
}  // namespace DC

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

#ifndef DAISYCP_CLIENT_CREDENTIALS_H_
#define DAISYCP_CLIENT_CREDENTIALS_H_

#include <map>
#include <string>
#include <utility>

#include "boost/shared_ptr.hpp"

namespace DC {

namespace Client {

class CredentialsProvider;

typedef std::pair<std::string, std::string> KeyIdToKeyPair;
typedef std::map<std::string, KeyIdToKeyPair> BucketToKeyPairMap;
typedef BucketToKeyPairMap::iterator BucketToKeyPairMapIterator;
typedef BucketToKeyPairMap::const_iterator BucketToKeyPairMapConstIterator;

void InitializeCredentialsProvider(
    const boost::shared_ptr<CredentialsProvider> &provider);

CredentialsProvider &GetCredentialsProviderInstance();

class Credentials {
 public:
  Credentials() {}

  Credentials(const std::string &accessKeyId, const std::string &secretKey)
      : m_accessKeyId(accessKeyId), m_secretKey(secretKey) {}

  ~Credentials() {}

 public:
  const std::string &GetAccessKeyId() const { return m_accessKeyId; }
  const std::string &GetSecretKey() const { return m_secretKey; }
  bool IsAnonymous() const {
    return m_accessKeyId.empty() && m_secretKey.empty();
  }

 private:
  std::string m_accessKeyId;
  std::string m_secretKey;
};

class CredentialsProvider {
 public:
  // Get credentials of given bucket, fall back to default credentials if
  // there is no bucket specific one.
  virtual Credentials GetCredentials(const std::string &bucket) const = 0;
  virtual ~CredentialsProvider() {}
};

// For public bucket
class AnonymousCredentialsProvider : public CredentialsProvider {
 public:
  Credentials GetCredentials(const std::string &bucket) const {
    return Credentials();
  }
};

class DefaultCredentialsProvider : public CredentialsProvider {
 public:
  DefaultCredentialsProvider(const std::string &accessKeyId,
                             const std::string &secretKey)
      : m_defaultAccessKeyId(accessKeyId), m_defaultSecretKey(secretKey) {}

  // Throw DCException if credentials file is invalid
  explicit DefaultCredentialsProvider(const std::string &credentialFile);

  Credentials GetCredentials(const std::string &bucket) const;

  bool HasDefaultKey() const {
    return (!m_defaultAccessKeyId.empty()) && (!m_defaultSecretKey.empty());
  }
  bool HasBucketKey(const std::string &bucket) const {
    return m_bucketMap.find(bucket) != m_bucketMap.end();
  }

 private:
  // Read credentials file
  //
  // @param  : credentials file path
  // @return : a pair of {true, ""} or {false, message}
  //
  // Credentials file format: [bucket:]AccessKeyId:SecretKey
  // Set default key pair by not providing bucket name, only the first
  // default key pair is used.
  //
  // Comment line is beginning with #; empty lines are ignored;
  // Uncommented lines without the ":" character are flaged as an error,
  // so are lines with space or tabs and lines starting with bracket "[".
  std::pair<bool, std::string> ReadCredentialsFile(const std::string &file);

  void SetDefaultKey(const std::string &keyId, const std::string &key) {
    m_defaultAccessKeyId = keyId;
    m_defaultSecretKey = key;
  }

 private:
  std::string m_credentialsFile;
  std::string m_defaultAccessKeyId;
  std::string m_defaultSecretKey;
  BucketToKeyPairMap m_bucketMap;

  friend class CredentialsTest;
};

}  // namespace Client
}  // namespace DC

#endif  // DAISYCP_CLIENT_CREDENTIALS_H_

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

#ifndef DAISYCP_CLIENT_OBJECTURL_H_
#define DAISYCP_CLIENT_OBJECTURL_H_

#include <string>
#include <utility>

namespace DC {

namespace Client {

//
// Location of an object, in form of qs://bucket/key[#generation]
//
// Generation pins the object content, for QingStor it is the ETag of the
// object. An empty generation matches any content.
//
class ObjectURL {
 public:
  ObjectURL() {}
  ObjectURL(const std::string &bucket, const std::string &key,
            const std::string &generation = std::string())
      : m_bucket(bucket), m_key(key), m_generation(generation) {}

 public:
  const std::string &GetBucket() const { return m_bucket; }
  const std::string &GetKey() const { return m_key; }
  const std::string &GetGeneration() const { return m_generation; }
  bool HasGeneration() const { return !m_generation.empty(); }
  bool IsValid() const { return !m_bucket.empty() && !m_key.empty(); }

  // Return a copy pinned to the generation
  ObjectURL WithGeneration(const std::string &generation) const {
    return ObjectURL(m_bucket, m_key, generation);
  }

  std::string ToString() const;

 private:
  std::string m_bucket;
  std::string m_key;
  std::string m_generation;
};

// Parse object url
//
// @param  : url string, object url (output)
// @return : a pair of {true, ""} or {false, message}
//
// Accept qs://bucket/key and qs://bucket/key#generation.
// Key must not be empty and must not end with "/".
std::pair<bool, std::string> ParseObjectURL(const std::string &url,
                                            ObjectURL *objectURL);

}  // namespace Client
}  // namespace DC

#endif  // DAISYCP_CLIENT_OBJECTURL_H_

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

#ifndef DAISYCP_BASE_EXCEPTION_H_
#define DAISYCP_BASE_EXCEPTION_H_

#include <stdexcept>
#include <string>

namespace DC {

namespace Exception {

struct DCException : public std::runtime_error {
  explicit DCException(const std::string& msg) : std::runtime_error(msg) {}
  explicit DCException(const char* msg)
      : std::runtime_error(std::string(msg)) {}

  std::string get() const { return this->what(); }
};

// Request is malformed, such as a read exceeding the transfer chunk size
// or a seek to an offset which is not supported for the given whence.
struct InvalidRequestException : public DCException {
  explicit InvalidRequestException(const std::string& msg)
      : DCException("InvalidRequest: " + msg) {}
};

// Operation is not supported by the stream, e.g. seek from current position.
struct UnsupportedOperationException : public DCException {
  explicit UnsupportedOperationException(const std::string& msg)
      : DCException("UnsupportedOperation: " + msg) {}
};

// Background fetch exited before delivering the requested bytes.
struct FetchFailedException : public DCException {
  explicit FetchFailedException(const std::string& msg)
      : DCException("FetchFailed: " + msg) {}
};

}  // namespace Exception
}  // namespace DC


#endif  // DAISYCP_BASE_EXCEPTION_H_

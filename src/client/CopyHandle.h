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

#ifndef DAISYCP_CLIENT_COPYHANDLE_H_
#define DAISYCP_CLIENT_COPYHANDLE_H_

#include <stdint.h>

#include <string>

#include "boost/noncopyable.hpp"
#include "boost/thread/mutex.hpp"

#include "client/ObjectURL.h"
#include "client/TransferError.h"

namespace DC {

namespace Client {

struct CopyStatus {
  enum Value {
    NotStarted,  // copy has not begun
    InProgress,  // copy is running
    Completed,   // copy was successful
    Failed       // copy failed
  };
};

std::string GetCopyStatusName(CopyStatus::Value status);

//
// State of one copy operation.
//
class CopyHandle : private boost::noncopyable {
 public:
  CopyHandle(const ObjectURL &source, const ObjectURL &dest);

 public:
  const ObjectURL &GetSource() const { return m_source; }
  const ObjectURL &GetDestination() const { return m_dest; }

  CopyStatus::Value GetStatus() const;
  uint64_t GetBytesTotalSize() const;
  uint64_t GetBytesCopied() const;
  ClientError<TransferError::Value> GetError() const;

  bool IsFinished() const;
  bool IsCompleted() const { return GetStatus() == CopyStatus::Completed; }

  std::string ToString() const;

 private:
  // A finished copy does not change status any more
  void UpdateStatus(CopyStatus::Value status);
  void SetBytesTotalSize(uint64_t size);
  void SetBytesCopied(uint64_t size);
  void SetError(const ClientError<TransferError::Value> &error);

 private:
  ObjectURL m_source;
  ObjectURL m_dest;

  mutable boost::mutex m_lock;
  CopyStatus::Value m_status;
  uint64_t m_bytesTotalSize;
  uint64_t m_bytesCopied;
  ClientError<TransferError::Value> m_error;

  friend class Copier;
  friend class CopyHandleTest;
};

}  // namespace Client
}  // namespace DC

#endif  // DAISYCP_CLIENT_COPYHANDLE_H_

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

#include "client/CopyHandle.h"

#include <stdint.h>

#include <string>

#include "boost/exception/to_string.hpp"
#include "boost/thread/locks.hpp"

namespace DC {

namespace Client {

using boost::lock_guard;
using boost::mutex;
using boost::to_string;
using std::string;

namespace {

bool IsFinishedStatus(CopyStatus::Value status) {
  return status == CopyStatus::Completed || status == CopyStatus::Failed;
}

}  // namespace

// --------------------------------------------------------------------------
string GetCopyStatusName(CopyStatus::Value status) {
  switch (status) {
    case CopyStatus::NotStarted:
      return "NotStarted";
    case CopyStatus::InProgress:
      return "InProgress";
    case CopyStatus::Completed:
      return "Completed";
    case CopyStatus::Failed:
      return "Failed";
    default:
      return "Unknown";
  }
}

// --------------------------------------------------------------------------
CopyHandle::CopyHandle(const ObjectURL &source, const ObjectURL &dest)
    : m_source(source),
      m_dest(dest),
      m_status(CopyStatus::NotStarted),
      m_bytesTotalSize(0),
      m_bytesCopied(0),
      m_error(GoodTransferError()) {}

// --------------------------------------------------------------------------
CopyStatus::Value CopyHandle::GetStatus() const {
  lock_guard<mutex> lock(m_lock);
  return m_status;
}

// --------------------------------------------------------------------------
uint64_t CopyHandle::GetBytesTotalSize() const {
  lock_guard<mutex> lock(m_lock);
  return m_bytesTotalSize;
}

// --------------------------------------------------------------------------
uint64_t CopyHandle::GetBytesCopied() const {
  lock_guard<mutex> lock(m_lock);
  return m_bytesCopied;
}

// --------------------------------------------------------------------------
ClientError<TransferError::Value> CopyHandle::GetError() const {
  lock_guard<mutex> lock(m_lock);
  return m_error;
}

// --------------------------------------------------------------------------
bool CopyHandle::IsFinished() const {
  lock_guard<mutex> lock(m_lock);
  return IsFinishedStatus(m_status);
}

// --------------------------------------------------------------------------
string CopyHandle::ToString() const {
  lock_guard<mutex> lock(m_lock);
  return "[source: " + m_source.ToString() +
         ", destination: " + m_dest.ToString() +
         ", status: " + GetCopyStatusName(m_status) +
         ", copied: " + to_string(m_bytesCopied) + "/" +
         to_string(m_bytesTotalSize) + "]";
}

// --------------------------------------------------------------------------
void CopyHandle::UpdateStatus(CopyStatus::Value status) {
  lock_guard<mutex> lock(m_lock);
  if (!IsFinishedStatus(m_status)) {
    m_status = status;
  }
}

// --------------------------------------------------------------------------
void CopyHandle::SetBytesTotalSize(uint64_t size) {
  lock_guard<mutex> lock(m_lock);
  m_bytesTotalSize = size;
}

// --------------------------------------------------------------------------
void CopyHandle::SetBytesCopied(uint64_t size) {
  lock_guard<mutex> lock(m_lock);
  m_bytesCopied = size;
}

// --------------------------------------------------------------------------
void CopyHandle::SetError(const ClientError<TransferError::Value> &error) {
  lock_guard<mutex> lock(m_lock);
  m_error = error;
}

}  // namespace Client
}  // namespace DC

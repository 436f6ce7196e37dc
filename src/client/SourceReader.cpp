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

#include "client/SourceReader.h"

#include <stddef.h>
#include <stdint.h>
#include <string.h>  // for memcpy

#include <vector>

#include "boost/exception/to_string.hpp"

#include "base/Exception.h"
#include "base/LogMacros.h"
#include "data/InputSource.h"

namespace DC {

namespace Client {

using boost::to_string;
using DC::Data::Buffer;
using DC::Data::InputSource;
using DC::Data::SeekMode;
using DC::Exception::DCException;
using DC::Exception::FetchFailedException;
using std::vector;

// --------------------------------------------------------------------------
SourceReader::SourceReader(InputSource *source, uint64_t chunkSize)
    : m_source(source), m_chunkSize(chunkSize), m_pendingOffset(0) {
  if (m_source == NULL) {
    throw DCException("SourceReader is initialized with null source");
  }
  if (m_chunkSize == 0) {
    throw DCException("SourceReader is initialized with zero chunk size");
  }
}

// --------------------------------------------------------------------------
ClientError<TransferError::Value> SourceReader::ReadExactly(uint64_t len,
                                                            Buffer *buf) {
  if (buf == NULL) {
    return ClientError<TransferError::Value>(
        TransferError::PARAMETER_MISSING, "SourceReader", "Null buffer", false);
  }
  Buffer out(new vector<char>(len));
  uint64_t filled = 0;
  while (filled < len) {
    if (PendingSize() == 0) {
      try {
        m_pending = m_source->Read(m_chunkSize);
      } catch (const FetchFailedException &e) {
        m_pending.reset();
        m_pendingOffset = 0;
        return ClientError<TransferError::Value>(
            TransferError::FETCH_FAILED, "SourceReader", e.what(), true);
      }
      m_pendingOffset = 0;
      if (!m_pending || m_pending->empty()) {
        return ClientError<TransferError::Value>(
            TransferError::SHORT_READ, "SourceReader",
            "source ended after " + to_string(filled) + " of " +
                to_string(len) + " bytes",
            false);
      }
    }
    uint64_t copyLen = PendingSize() < len - filled ? PendingSize()
                                                    : len - filled;
    memcpy(&(*out)[filled], &(*m_pending)[m_pendingOffset], copyLen);
    m_pendingOffset += copyLen;
    filled += copyLen;
  }
  *buf = out;
  return GoodTransferError();
}

// --------------------------------------------------------------------------
void SourceReader::Rewind(uint64_t offset) {
  m_pending.reset();
  m_pendingOffset = 0;
  m_source->Seek(static_cast<int64_t>(offset), SeekMode::FromStart);
}

// --------------------------------------------------------------------------
uint64_t SourceReader::Tell() const {
  return m_source->Tell() - PendingSize();
}

// --------------------------------------------------------------------------
size_t SourceReader::PendingSize() const {
  return m_pending ? m_pending->size() - m_pendingOffset : 0;
}

}  // namespace Client
}  // namespace DC

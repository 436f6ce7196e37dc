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

#ifndef DAISYCP_CLIENT_SOURCEREADER_H_
#define DAISYCP_CLIENT_SOURCEREADER_H_

#include <stddef.h>
#include <stdint.h>

#include "boost/noncopyable.hpp"

#include "client/TransferError.h"
#include "data/StreamBuf.h"

namespace DC {

namespace Data {
class InputSource;
}  // namespace Data

namespace Client {

//
// Assemble request bodies from an input source which is read in chunks of a
// fixed size.
//
// A chunk crossing the end of a body is split, the rest of it is kept for the
// next body.
//
class SourceReader : private boost::noncopyable {
 public:
  // Throw DCException if source is null or chunk size is 0
  SourceReader(DC::Data::InputSource *source, uint64_t chunkSize);

 public:
  // Read exactly len bytes
  //
  // @param  : len, buffer (output)
  // @return : ClientError
  //
  // Fail with FETCH_FAILED (retryable) if the source fails to produce data,
  // or with SHORT_READ if the source ends before len bytes.
  ClientError<TransferError::Value> ReadExactly(uint64_t len,
                                                DC::Data::Buffer *buf);

  // Move source to offset, drop kept bytes
  void Rewind(uint64_t offset);

  // Offset of the next byte ReadExactly returns
  uint64_t Tell() const;

 private:
  size_t PendingSize() const;

 private:
  DC::Data::InputSource *m_source;
  uint64_t m_chunkSize;
  DC::Data::Buffer m_pending;  // rest of the last chunk
  size_t m_pendingOffset;
};

}  // namespace Client
}  // namespace DC

#endif  // DAISYCP_CLIENT_SOURCEREADER_H_

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

#include "data/StreamBuf.h"

#include <stddef.h>

#include "boost/exception/to_string.hpp"

#include "base/Exception.h"
#include "base/LogMacros.h"

namespace DC {

namespace Data {

using boost::to_string;
using DC::Exception::DCException;

// --------------------------------------------------------------------------
StreamBuf::StreamBuf(const Buffer &buf, size_t lengthToRead)
    : m_buffer(buf), m_lengthToRead(lengthToRead) {
  if (!m_buffer) {
    throw DCException("Try to initialize streambuf with null buffer");
  }
  if (m_lengthToRead > m_buffer->size()) {
    throw DCException("Streambuf only have a " + to_string(m_buffer->size()) +
                      " bytes buffer, but want stream to see " +
                      to_string(m_lengthToRead) + " bytes of it");
  }

  setp(begin(), end());
  setg(begin(), begin(), end());
}

// --------------------------------------------------------------------------
StreamBuf::pos_type StreamBuf::seekoff(off_type off, std::ios_base::seekdir dir,
                                       std::ios_base::openmode which) {
  if (dir == std::ios_base::beg) {
    return seekpos(off, which);
  } else if (dir == std::ios_base::end) {
    return seekpos(static_cast<off_type>(m_lengthToRead) + off, which);
  } else if (dir == std::ios_base::cur) {
    if (which == std::ios_base::in) {
      return seekpos((gptr() - begin()) + off, which);
    } else if (which == std::ios_base::out) {
      return seekpos((pptr() - begin()) + off, which);
    }
  }
  return pos_type(off_type(-1));
}

// --------------------------------------------------------------------------
StreamBuf::pos_type StreamBuf::seekpos(pos_type pos,
                                       std::ios_base::openmode which) {
  off_type offset = static_cast<off_type>(pos);
  if (offset < 0 || static_cast<size_t>(offset) > m_lengthToRead) {
    DebugError("Streambuf only allow stream to see " +
               to_string(m_lengthToRead) +
               " bytes, but try to seek to buffer position " +
               to_string(offset));
    return pos_type(off_type(-1));
  }

  if (which & std::ios_base::in) {
    setg(begin(), begin() + offset, end());
  }
  if (which & std::ios_base::out) {
    setp(begin(), end());
    pbump(static_cast<int>(offset));
  }
  return pos;
}

}  // namespace Data
}  // namespace DC

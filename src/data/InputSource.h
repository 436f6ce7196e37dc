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

#ifndef DAISYCP_DATA_INPUTSOURCE_H_
#define DAISYCP_DATA_INPUTSOURCE_H_

#include <stddef.h>
#include <stdint.h>

#include "data/StreamBuf.h"

namespace DC {

namespace Data {

struct SeekMode {
  enum Value {
    FromStart,    // offset is relative to the beginning of stream
    FromCurrent,  // offset is relative to current position
    FromEnd       // offset is relative to the end of stream
  };
};

//
// A file like stream consumed by an upload.
//
// An upload reads the source in bounded chunks, and may seek back to resend
// a part when a request fails.
//
class InputSource {
 public:
  virtual ~InputSource() {}

 public:
  // Read next chunk
  //
  // @param  : max bytes to read
  // @return : buffer, which is empty at end of stream
  virtual Buffer Read(size_t amt) = 0;

  // Read with no size limit
  virtual Buffer Read() = 0;

  // Current position of stream
  virtual uint64_t Tell() const = 0;

  // Move position of stream
  //
  // @param  : offset, seek mode
  // @return : void
  virtual void Seek(int64_t offset,
                    SeekMode::Value mode = SeekMode::FromStart) = 0;

  virtual bool Seekable() const = 0;

  // Total size of stream in bytes
  virtual uint64_t GetSize() const = 0;
};

}  // namespace Data
}  // namespace DC

#endif  // DAISYCP_DATA_INPUTSOURCE_H_

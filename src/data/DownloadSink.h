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

#ifndef DAISYCP_DATA_DOWNLOADSINK_H_
#define DAISYCP_DATA_DOWNLOADSINK_H_

#include "data/StreamBuf.h"

namespace DC {

namespace Data {

// Receiver of the bytes of a download, chunk by chunk in download order.
class DownloadSink {
 public:
  virtual ~DownloadSink() {}

  // Blocks until the sink is able to take the chunk
  virtual void Write(const Buffer &chunk) = 0;
};

}  // namespace Data
}  // namespace DC

#endif  // DAISYCP_DATA_DOWNLOADSINK_H_

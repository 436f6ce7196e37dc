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

#ifndef DAISYCP_CLIENT_UTILS_H_
#define DAISYCP_CLIENT_UTILS_H_

#include <stdint.h>  // for uint64_t

#include <string>
#include <utility>
#include <vector>

#include "boost/tuple/tuple.hpp"

namespace DC {

namespace Client {

namespace Utils {

// Build request header of 'Range'
//
// @param  : start, stop (inclusive)
// @return : string with format of "bytes=start_offset-stop_offset"
std::string BuildRequestRange(uint64_t start, uint64_t stop);

// Build request header of 'Range'
//
// @param  : start
// @return : string with format of "bytes=start_offset-"
std::string BuildRequestRangeStart(uint64_t start);

// Parse response header of 'Content-Range'
//
// @param  : 'Content-Range' with format "bytes start_offset-stop_offset/size"
// @return : {true, start, body length(stop - start + 1), total size},
//           or {false, 0, 0, 0} if input is malformed
boost::tuple<bool, uint64_t, uint64_t, uint64_t> ParseResponseContentRange(
    const std::string &responseRange);

// Parse request header of 'Range'
//
// @param  : request range, "bytes=start_offset-stop_offset" or
//           "bytes=start_offset-"
// @return : start, size(stop - start + 1), size is 0 for open ended range
std::pair<uint64_t, uint64_t> ParseRequestContentRange(
    const std::string &requestRange);

typedef std::pair<uint64_t, uint64_t> PartRange;  // offset, length

// Enlarge part size so that size bytes fit in maxPartCount parts
uint64_t AdjustPartSize(uint64_t size, uint64_t partSize,
                        uint64_t maxPartCount);

// Cut [start, start + size) into parts of partSize
//
// @param  : start, size, part size, min part size
// @return : parts in order, empty if size or part size is 0
//
// If the last part is smaller than min part size, the last two parts are
// averaged.
std::vector<PartRange> CutParts(uint64_t start, uint64_t size,
                                uint64_t partSize, uint64_t minPartSize);

}  // namespace Utils
}  // namespace Client
}  // namespace DC

#endif  // DAISYCP_CLIENT_UTILS_H_

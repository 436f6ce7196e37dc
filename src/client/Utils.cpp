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

#include "client/Utils.h"

#include <stdint.h>

#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "boost/exception/to_string.hpp"
#include "boost/tuple/tuple.hpp"

#include "base/LogMacros.h"
#include "base/StringUtils.h"

namespace DC {

namespace Client {

namespace Utils {

using boost::make_tuple;
using boost::to_string;
using boost::tuple;
using DC::StringUtils::StartsWith;
using DC::StringUtils::Trim;
using std::istream;
using std::make_pair;
using std::pair;
using std::string;
using std::vector;

namespace {

template <char C>
istream &expect(istream &in) {
  if ((in >> std::ws).peek() == C) {
    in.ignore();
  } else {
    in.setstate(std::ios_base::failbit);
  }
  return in;
}

}  // namespace

// --------------------------------------------------------------------------
string BuildRequestRange(uint64_t start, uint64_t stop) {
  DebugWarningIf(stop < start, "Invalid range " + to_string(start) + "-" +
                                   to_string(stop));
  // e.g. bytes=0-0 return the first byte
  return "bytes=" + to_string(start) + "-" + to_string(stop);
}

// --------------------------------------------------------------------------
string BuildRequestRangeStart(uint64_t start) {
  return "bytes=" + to_string(start) + "-";
}

// --------------------------------------------------------------------------
tuple<bool, uint64_t, uint64_t, uint64_t> ParseResponseContentRange(
    const string &contentRange) {
  static const string prefix = "bytes ";
  string cpy(Trim(contentRange, ' '));
  if (!StartsWith(cpy, prefix)) {
    DebugWarning("Invalid content range: " + cpy);
    return make_tuple(false, 0, 0, 0);
  }

  uint64_t start = 0;
  uint64_t stop = 0;
  uint64_t size = 0;
  std::istringstream in(cpy.substr(prefix.size()));
  if (!(in >> start >> expect<'-'> >> stop >> expect<'/'> >> size) ||
      stop < start || size == 0 || stop >= size) {
    DebugWarning("Invalid content range: " + cpy);
    return make_tuple(false, 0, 0, 0);
  }
  return make_tuple(true, start, stop - start + 1, size);
}

// --------------------------------------------------------------------------
pair<uint64_t, uint64_t> ParseRequestContentRange(const string &requestRange) {
  static const string prefix = "bytes=";
  string cpy(Trim(requestRange, ' '));
  if (!StartsWith(cpy, prefix)) {
    DebugWarning("Invalid request range: " + cpy);
    return make_pair(0, 0);
  }

  uint64_t start = 0;
  uint64_t stop = 0;
  std::istringstream in(cpy.substr(prefix.size()));
  if (!(in >> start >> expect<'-'>)) {
    DebugWarning("Invalid request range: " + cpy);
    return make_pair(0, 0);
  }
  if ((in >> std::ws).eof()) {
    return make_pair(start, 0);  // open ended
  }
  if (!(in >> stop) || stop < start) {
    DebugWarning("Invalid request range: " + cpy);
    return make_pair(0, 0);
  }
  return make_pair(start, stop - start + 1);
}

// --------------------------------------------------------------------------
uint64_t AdjustPartSize(uint64_t size, uint64_t partSize,
                        uint64_t maxPartCount) {
  if (partSize == 0 || maxPartCount == 0) {
    return partSize;
  }
  if ((size + partSize - 1) / partSize > maxPartCount) {
    return (size + maxPartCount - 1) / maxPartCount;
  }
  return partSize;
}

// --------------------------------------------------------------------------
vector<PartRange> CutParts(uint64_t start, uint64_t size, uint64_t partSize,
                           uint64_t minPartSize) {
  vector<PartRange> parts;
  if (size == 0 || partSize == 0) {
    return parts;
  }
  uint64_t partCount = (size + partSize - 1) / partSize;
  uint64_t lastCuttingSize = size - (partCount - 1) * partSize;
  bool averageLastTwo = partCount > 1 && lastCuttingSize < minPartSize;

  uint64_t fullCount = averageLastTwo ? partCount - 2 : partCount - 1;
  uint64_t offset = start;
  for (uint64_t i = 0; i < fullCount; ++i) {
    parts.push_back(make_pair(offset, partSize));
    offset += partSize;
  }
  uint64_t rest = start + size - offset;
  if (averageLastTwo) {
    uint64_t first = rest / 2;
    parts.push_back(make_pair(offset, first));
    parts.push_back(make_pair(offset + first, rest - first));
  } else {
    parts.push_back(make_pair(offset, rest));
  }
  return parts;
}

}  // namespace Utils
}  // namespace Client
}  // namespace DC

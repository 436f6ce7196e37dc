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

#include "client/Client.h"

#include "boost/thread/locks.hpp"

namespace DC {

namespace Client {

// --------------------------------------------------------------------------
Client::Client(RetryStrategy retryStrategy) : m_retryStrategy(retryStrategy) {}

// --------------------------------------------------------------------------
Client::~Client() {
  // do nothing
}

// --------------------------------------------------------------------------
void Client::RetryRequestSleep(
    boost::posix_time::milliseconds sleepTime) const {
  boost::unique_lock<boost::mutex> lock(m_retryLock);
  m_retrySignal.timed_wait(lock, sleepTime);
}

// --------------------------------------------------------------------------
void Client::BackoffBeforeRetry(uint16_t attemptedRetryTimes) const {
  uint32_t delay =
      m_retryStrategy.CalculateDelayBeforeNextRetry(attemptedRetryTimes);
  if (delay > 0) {
    RetryRequestSleep(boost::posix_time::milliseconds(delay));
  }
}

}  // namespace Client
}  // namespace DC

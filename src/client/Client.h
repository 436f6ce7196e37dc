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

#ifndef DAISYCP_CLIENT_CLIENT_H_
#define DAISYCP_CLIENT_CLIENT_H_

#include "boost/noncopyable.hpp"
#include "boost/thread/condition_variable.hpp"
#include "boost/thread/mutex.hpp"
#include "boost/thread/thread_time.hpp"

#include "client/RetryStrategy.h"

namespace DC {

namespace Client {

// Base of the remote clients, shares the retry policy of a transfer.
class Client : private boost::noncopyable {
 public:
  explicit Client(RetryStrategy retryStrategy = GetCustomRetryStrategy());

  virtual ~Client();

 public:
  const RetryStrategy &GetRetryStrategy() const { return m_retryStrategy; }

 protected:
  // Sleep before next retry, interruptable by other thread
  void RetryRequestSleep(boost::posix_time::milliseconds sleepTime) const;

  // Sleep according to the backoff of the retry strategy
  void BackoffBeforeRetry(uint16_t attemptedRetryTimes) const;

 private:
  RetryStrategy m_retryStrategy;
  mutable boost::mutex m_retryLock;
  mutable boost::condition_variable m_retrySignal;
};

}  // namespace Client
}  // namespace DC

#endif  // DAISYCP_CLIENT_CLIENT_H_

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

#ifndef DAISYCP_APP_INITIALIZER_H_
#define DAISYCP_APP_INITIALIZER_H_

#include <queue>
#include <string>
#include <vector>

#include "boost/function.hpp"
#include "boost/noncopyable.hpp"
#include "boost/thread/once.hpp"

// Declare main in global namespace before class Initializer, since friend
// declarations can only introduce names in the surrounding namespace.
extern int main(int argc, char **argv);

namespace DC {

namespace App {

struct Priority {
  enum Value {
    First = 1,
    Second = 2,
    Third = 3,
    Fourth = 4
  };
};

typedef boost::function<void()> InitFunction;

struct InitStep {
  Priority::Value priority;
  std::string name;
  InitFunction func;

  InitStep(Priority::Value priority_, const std::string &name_,
           const InitFunction &func_)
      : priority(priority_), name(name_), func(func_) {}
};

//
// Steps to run once at start up, in order of priority.
//
// Register a step by defining a static Initializer, e.g.
//   static Initializer logInitializer(
//       InitStep(Priority::First, "logging", LoggingInitializer));
//
class Initializer : private boost::noncopyable {
 public:
  explicit Initializer(const InitStep &step);

  ~Initializer() {}

 private:
  static void Init();
  // Run all steps, a step throwing stops the rest
  static void RunInitializers();
  static void RemoveInitializers();
  static size_t GetInitializerCount();
  void AddStep(const InitStep &step);
  friend int ::main(int argc, char **argv);
  friend class InitializerTest;

 private:
  Initializer() {}

  struct LaterFirst {
    bool operator()(const InitStep &left, const InitStep &right) const {
      return static_cast<int>(left.priority) > static_cast<int>(right.priority);
    }
  };

  typedef std::priority_queue<InitStep, std::vector<InitStep>, LaterFirst>
      InitStepQueue;
  static InitStepQueue *m_queue;
  static boost::once_flag m_initOnceFlag;
};

}  // namespace App
}  // namespace DC

#endif  // DAISYCP_APP_INITIALIZER_H_

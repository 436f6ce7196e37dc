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

#include "app/Initializer.h"

#include <stddef.h>

#include "boost/thread/once.hpp"

namespace DC {

namespace App {

boost::once_flag Initializer::m_initOnceFlag = BOOST_ONCE_INIT;
Initializer::InitStepQueue *Initializer::m_queue = NULL;

// --------------------------------------------------------------------------
Initializer::Initializer(const InitStep &step) { AddStep(step); }

// --------------------------------------------------------------------------
void Initializer::RunInitializers() {
  if (m_queue == NULL) {
    return;
  }
  while (!m_queue->empty()) {
    InitStep step = m_queue->top();
    m_queue->pop();
    if (step.func) {
      step.func();
    }
  }
}

// --------------------------------------------------------------------------
void Initializer::RemoveInitializers() {
  if (m_queue != NULL) {
    while (!m_queue->empty()) {
      m_queue->pop();
    }
  }
}

// --------------------------------------------------------------------------
size_t Initializer::GetInitializerCount() {
  return m_queue == NULL ? 0 : m_queue->size();
}

// --------------------------------------------------------------------------
void Initializer::AddStep(const InitStep &step) {
  boost::call_once(m_initOnceFlag, Init);
  m_queue->push(step);
}

// --------------------------------------------------------------------------
void Initializer::Init() {
  if (m_queue == NULL) {
    m_queue = new InitStepQueue;
  }
}

}  // namespace App
}  // namespace DC

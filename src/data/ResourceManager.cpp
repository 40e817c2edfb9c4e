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

#include "data/ResourceManager.h"

#include <vector>

#include "boost/bind.hpp"
#include "boost/make_shared.hpp"
#include "boost/thread/locks.hpp"

#include "base/LogMacros.h"

namespace QSM {

namespace Data {

using boost::bind;
using boost::lock_guard;
using boost::make_shared;
using boost::mutex;
using boost::unique_lock;
using std::vector;

// --------------------------------------------------------------------------
ResourceManager::ResourceManager(size_t resourceCount, size_t resourceSize)
    : m_resourceCount(resourceCount),
      m_resourceSize(resourceSize),
      m_shutdown(false) {
  m_resources.reserve(resourceCount);
  for (size_t i = 0; i < resourceCount; ++i) {
    m_resources.push_back(make_shared<vector<char> >(resourceSize));
  }
}

// --------------------------------------------------------------------------
bool ResourceManager::ResourcesAvailable() {
  lock_guard<mutex> lock(m_queueLock);
  return !m_resources.empty() && !m_shutdown;
}

// --------------------------------------------------------------------------
bool ResourceManager::IsShutdown() const {
  lock_guard<mutex> lock(m_queueLock);
  return m_shutdown;
}

// --------------------------------------------------------------------------
Resource ResourceManager::Acquire() {
  unique_lock<mutex> lock(m_queueLock);
  m_semaphore.wait(lock, bind(boost::type<bool>(),
                              &ResourceManager::AcquirePredicate, this));
  if (m_shutdown) {
    DebugWarning("Trying to acquire buffer but resource manager is shutdown");
    return Resource();
  }

  Resource resource = m_resources.back();
  m_resources.pop_back();
  return resource;
}

// --------------------------------------------------------------------------
void ResourceManager::Release(const Resource &resource) {
  unique_lock<mutex> lock(m_queueLock);
  if (resource) {
    // Previous user may have shrunk it for a short last part
    resource->resize(m_resourceSize);
    m_resources.push_back(resource);
  }
  lock.unlock();
  // ShutdownAndWait and Acquire wait on the same condition
  m_semaphore.notify_all();
}

// --------------------------------------------------------------------------
void ResourceManager::ShutdownAndWait() {
  unique_lock<mutex> lock(m_queueLock);
  m_shutdown = true;
  m_semaphore.notify_all();
  m_semaphore.wait(lock, bind(boost::type<bool>(),
                              &ResourceManager::AllReleasedPredicate, this));
}

// --------------------------------------------------------------------------
bool ResourceManager::AcquirePredicate() const {
  return m_shutdown || !m_resources.empty();
}

// --------------------------------------------------------------------------
bool ResourceManager::AllReleasedPredicate() const {
  return m_resources.size() >= m_resourceCount;
}

}  // namespace Data
}  // namespace QSM

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

#ifndef QSMOVE_DATA_RESOURCEMANAGER_H_
#define QSMOVE_DATA_RESOURCEMANAGER_H_

#include <stddef.h>  // for size_t

#include <vector>

#include "boost/noncopyable.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/condition_variable.hpp"
#include "boost/thread/mutex.hpp"

namespace QSM {

namespace Data {

typedef boost::shared_ptr<std::vector<char> > Resource;

/**
 * Pool of equally sized buffers with Acquire/Release semantics.
 *
 * Acquire blocks until a buffer is available, Release gives one back and
 * unblocks one waiting acquisition. The pool bounds the memory held by
 * chunks or parts which are in flight at the same time.
 *
 * Call ShutdownAndWait when finished, it waits for every buffer to come
 * back. After shutdown, Acquire returns a null resource.
 */
class ResourceManager : private boost::noncopyable {
 public:
  // @param  : number of buffers, size of each buffer in bytes
  ResourceManager(size_t resourceCount, size_t resourceSize);

  ~ResourceManager() {}

 public:
  // Return whether or not resources are currently available for acquisition.
  //
  // This is only a hint. Another thread may grab the resource from under you.
  bool ResourcesAvailable();

  bool IsShutdown() const;

  size_t GetResourceCount() const { return m_resourceCount; }
  size_t GetResourceSize() const { return m_resourceSize; }

  // Return a buffer with exclusive ownership
  //
  // @param  : void
  // @return : buffer sized to GetResourceSize(), null if shutdown
  //
  // You must call Release on the buffer when you are finished
  // or other threads will block waiting to acquire it.
  Resource Acquire();

  // Release a buffer back to the pool
  //
  // @param  : resource
  // @return : void
  void Release(const Resource &resource);

  // Wake up all waiting acquisitions and wait for all acquired buffers
  // to be released.
  //
  // @param  : void
  // @return : void
  void ShutdownAndWait();

 private:
  bool AcquirePredicate() const;
  bool AllReleasedPredicate() const;

 private:
  size_t m_resourceCount;
  size_t m_resourceSize;
  std::vector<Resource> m_resources;
  mutable boost::mutex m_queueLock;
  boost::condition_variable m_semaphore;
  bool m_shutdown;  // protected by m_queueLock

  friend class ResourceManagerTest;
};

}  // namespace Data
}  // namespace QSM

#endif  // QSMOVE_DATA_RESOURCEMANAGER_H_

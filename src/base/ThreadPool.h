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

#ifndef QSMOVE_BASE_THREADPOOL_H_
#define QSMOVE_BASE_THREADPOOL_H_

#include <stddef.h>

#include <list>
#include <vector>

#include "boost/bind.hpp"
#include "boost/function.hpp"
#include "boost/make_shared.hpp"
#include "boost/move/move.hpp"
#include "boost/noncopyable.hpp"
#include "boost/preprocessor.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/condition_variable.hpp"
#include "boost/thread/future.hpp"
#include "boost/thread/locks.hpp"
#include "boost/thread/mutex.hpp"
#include "boost/utility/result_of.hpp"

//
// Macros for emulating Variadic Template in C++03
//
#define QSMOVE_TP_NUM_PARAMETERS 5
#define QSMOVE_TP_PARAMETERS(Z, N, D) \
  BOOST_PP_COMMA_IF(N)                \
  BOOST_FWD_REF(BOOST_PP_CAT(A, N)) BOOST_PP_CAT(a, N)
#define QSMOVE_TP_FORWARD(Z, N, D) \
  BOOST_PP_COMMA_IF(N)             \
  boost::forward<BOOST_PP_CAT(A, N)>(BOOST_PP_CAT(a, N))

namespace QSM {

namespace Threading {

// Runs a packaged task held by shared pointer, so the task itself can be
// copied into the queue as a plain boost::function.
template <typename R>
struct PackagedTaskRunner {
  boost::shared_ptr<boost::packaged_task<R> > m_task;
  explicit PackagedTaskRunner(
      const boost::shared_ptr<boost::packaged_task<R> > &task)
      : m_task(task) {}
  void operator()() { (*m_task)(); }
};

class TaskHandle;

typedef boost::function<void()> Task;

//
// ThreadPool
//
// Fixed number of worker threads consuming a FIFO task queue. Workers are
// started in constructor. Destructor stops workers and joins them, tasks
// still queued at that time are dropped, so callers must wait on the futures
// of all submitted tasks before destroying the pool.
//
class ThreadPool : private boost::noncopyable {
 public:
  explicit ThreadPool(size_t poolSize);
  ~ThreadPool();

 public:
  size_t GetPoolSize() const { return m_poolSize; }

  void SubmitToThread(const Task &task);

//
// SubmitCallable(f, args...)  : return a future of f's result
//
#define EXPAND(N)                                                          \
  template <typename F, BOOST_PP_ENUM_PARAMS(N, typename A)>               \
  boost::unique_future<                                                    \
      typename boost::result_of<F(BOOST_PP_ENUM_PARAMS(N, A))>::type>      \
  SubmitCallable(F f, BOOST_PP_REPEAT(N, QSMOVE_TP_PARAMETERS, ~)) {       \
    typedef typename boost::result_of<F(BOOST_PP_ENUM_PARAMS(N, A))>::type \
        ReturnType;                                                        \
    boost::shared_ptr<boost::packaged_task<ReturnType> > task =            \
        boost::make_shared<boost::packaged_task<ReturnType> >(             \
            boost::bind(boost::type<ReturnType>(), f,                      \
                        BOOST_PP_REPEAT(N, QSMOVE_TP_FORWARD, ~)));        \
    SubmitToThread(PackagedTaskRunner<ReturnType>(task));                  \
    return task->get_future();                                             \
  }

#define BOOST_PP_LOCAL_MACRO(N) EXPAND(N)
#define BOOST_PP_LOCAL_LIMITS (1, QSMOVE_TP_NUM_PARAMETERS)
#include BOOST_PP_LOCAL_ITERATE()

#undef BOOST_PP_LOCAL_MACRO
#undef BOOST_PP_LOCAL_LIMITS
#undef EXPAND

 private:
  Task *PopTask();
  bool HasTasks();

  // Create worker threads, only called by constructor
  void Initialize();

  // Tell all workers to quit, only called by destructor.
  void StopProcessing();

 private:
  size_t m_poolSize;
  std::list<Task *> m_tasks;
  boost::mutex m_queueLock;
  std::vector<TaskHandle *> m_taskHandles;
  boost::mutex m_syncLock;
  boost::condition_variable m_syncConditionVar;

  friend class TaskHandle;
  friend class ThreadPoolTest;
  friend class ThreadPoolTest_TestSubmitCallableManyTasks_Test;
};

}  // namespace Threading
}  // namespace QSM

#undef QSMOVE_TP_FORWARD
#undef QSMOVE_TP_PARAMETERS
#undef QSMOVE_TP_NUM_PARAMETERS

#endif  // QSMOVE_BASE_THREADPOOL_H_

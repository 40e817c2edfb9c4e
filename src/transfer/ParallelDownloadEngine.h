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

#ifndef QSMOVE_TRANSFER_PARALLELDOWNLOADENGINE_H_
#define QSMOVE_TRANSFER_PARALLELDOWNLOADENGINE_H_

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <vector>

#include "boost/noncopyable.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/mutex.hpp"

#include "transfer/ChunkPlanner.h"
#include "transfer/RetryStrategy.h"
#include "transfer/TransferError.h"

namespace QSM {

namespace Client {
class ObjectSource;
}  // namespace Client

namespace Data {
class ResourceManager;
class StagingBuffer;
}  // namespace Data

namespace Transfer {

//
// ParallelDownloadEngine
//
// Fetch every chunk of an object from source with a bounded worker pool and
// write it into the staging buffer at its offset. Chunks complete in any
// order; as they never overlap, the staged content does not depend on the
// completion order.
//
// A failed chunk does not cancel its siblings. All dispatched chunks are
// awaited, then the first failure in chunk order is raised.
//
class ParallelDownloadEngine : private boost::noncopyable {
 public:
  ParallelDownloadEngine(
      const boost::shared_ptr<QSM::Client::ObjectSource> &source,
      size_t workerCount, uint64_t chunkSize,
      const RetryStrategy &retryStrategy);

  ~ParallelDownloadEngine() {}

 public:
  // Download chunks of object into staging buffer
  //
  // @param  : object key, chunks, staging buffer
  // @return : void
  //
  // Throw SourceReadError, StagingWriteError or UnexpectedError
  void Download(const std::string &key, const std::vector<ChunkRange> &chunks,
                QSM::Data::StagingBuffer *buffer);

  size_t GetCompletedChunkCount() const;
  size_t GetWorkerCount() const { return m_workerCount; }

 private:
  // Worker task for one chunk, never throws
  static TransferClientError DownloadChunk(ParallelDownloadEngine *engine,
                                           const std::string &key,
                                           const ChunkRange &range,
                                           QSM::Data::StagingBuffer *buffer);

  TransferClientError DoDownloadChunk(const std::string &key,
                                      const ChunkRange &range,
                                      QSM::Data::StagingBuffer *buffer);

  void OnChunkFinished(bool success);

 private:
  boost::shared_ptr<QSM::Client::ObjectSource> m_source;
  size_t m_workerCount;
  uint64_t m_chunkSize;
  RetryStrategy m_retryStrategy;
  QSM::Data::ResourceManager *m_resourceManager;  // valid during Download

  mutable boost::mutex m_progressLock;
  size_t m_totalChunks;      // protected by m_progressLock
  size_t m_completedChunks;  // protected by m_progressLock
};

}  // namespace Transfer
}  // namespace QSM

#endif  // QSMOVE_TRANSFER_PARALLELDOWNLOADENGINE_H_

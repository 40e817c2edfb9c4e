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

#ifndef QSMOVE_TRANSFER_PARALLELUPLOADENGINE_H_
#define QSMOVE_TRANSFER_PARALLELUPLOADENGINE_H_

#include <stddef.h>
#include <stdint.h>

#include <string>

#include "boost/noncopyable.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/mutex.hpp"

#include "client/ObjectStore.h"
#include "client/Outcome.hpp"
#include "data/ResourceManager.h"
#include "transfer/RetryStrategy.h"
#include "transfer/TransferError.h"

namespace QSM {

namespace Data {
class StagingBuffer;
}  // namespace Data

namespace Transfer {

typedef QSM::Client::Outcome<QSM::Client::UploadedPart, TransferClientError>
    UploadPartOutcome;

//
// ParallelUploadEngine
//
// Open a multipart session, read the staging buffer sequentially in parts
// numbered from 1, upload parts with a bounded worker pool, and commit the
// parts sorted by part number once all of them succeed.
//
// Any failure after the session is opened aborts the session. Part buffers
// come from a pool of workerCount buffers, so the reader blocks when all
// workers are busy.
//
class ParallelUploadEngine : private boost::noncopyable {
 public:
  ParallelUploadEngine(const boost::shared_ptr<QSM::Client::ObjectSink> &sink,
                       size_t workerCount, uint64_t chunkSize,
                       const RetryStrategy &retryStrategy);

  virtual ~ParallelUploadEngine() {}

 public:
  // Upload staging buffer as object key
  //
  // @param  : object key, staging buffer
  // @return : void
  //
  // Throw DestinationUploadError, StagingReadError or UnexpectedError
  void Upload(const std::string &key, const QSM::Data::StagingBuffer &buffer);

  // Session id of the last upload, empty if none was opened
  const std::string &GetSessionId() const { return m_sessionId; }

  // Number of parts dispatched by the last upload
  size_t GetDispatchedPartCount() const { return m_dispatchedParts; }

  size_t GetCompletedPartCount() const;

  bool IsSessionOpen() const { return m_sessionOpen; }

  // Abort the open session if any, failures are logged only
  void AbortSession(const std::string &key);

 protected:
  struct PartJob {
    int m_partNumber;
    QSM::Data::Resource m_resource;
    size_t m_length;
  };

  // Upload one part with retries, the outcome names the part acknowledged
  // by the sink
  virtual UploadPartOutcome DoUploadPart(const std::string &key,
                                         const std::string &sessionId,
                                         const PartJob &job);

 private:
  // Worker task for one part, never throws
  static UploadPartOutcome UploadOnePart(ParallelUploadEngine *engine,
                                         const std::string &key,
                                         const std::string &sessionId,
                                         const PartJob &job);

  void OnPartFinished(bool success);
  bool HasFailedPart() const;

 private:
  boost::shared_ptr<QSM::Client::ObjectSink> m_sink;
  size_t m_workerCount;
  uint64_t m_chunkSize;
  RetryStrategy m_retryStrategy;
  QSM::Data::ResourceManager *m_resourceManager;  // valid during Upload

  std::string m_sessionId;
  bool m_sessionOpen;
  size_t m_dispatchedParts;

  mutable boost::mutex m_progressLock;
  size_t m_totalParts;      // protected by m_progressLock
  size_t m_completedParts;  // protected by m_progressLock
  bool m_partFailed;        // protected by m_progressLock
};

}  // namespace Transfer
}  // namespace QSM

#endif  // QSMOVE_TRANSFER_PARALLELUPLOADENGINE_H_

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

#ifndef QSMOVE_TRANSFER_TRANSFERORCHESTRATOR_H_
#define QSMOVE_TRANSFER_TRANSFERORCHESTRATOR_H_

#include <stddef.h>
#include <stdint.h>

#include <string>

#include "boost/noncopyable.hpp"
#include "boost/scoped_ptr.hpp"
#include "boost/shared_ptr.hpp"

#include "transfer/TransferError.h"
#include "transfer/TransferJob.h"

namespace QSM {

namespace Client {
class ObjectSink;
class ObjectSource;
}  // namespace Client

namespace Data {
class StagingBuffer;
}  // namespace Data

namespace Transfer {

struct TransferState {
  enum Value {
    Idle,
    Downloading,
    Hashing,
    Uploading,
    Validating,
    Succeeded,
    Failed
  };
};

std::string TransferStateToString(TransferState::Value state);

struct TransferResult {
  bool m_success;
  std::string m_message;
  TransferState::Value m_failedPhase;  // meaningful only if failed
  TransferError::Value m_error;
  uint64_t m_size;  // validated destination size
  std::string m_digest;
  size_t m_chunkCount;
  size_t m_partCount;
  std::string m_sessionId;

  TransferResult()
      : m_success(false),
        m_failedPhase(TransferState::Idle),
        m_error(TransferError::GOOD),
        m_size(0),
        m_chunkCount(0),
        m_partCount(0) {}
};

//
// TransferOrchestrator
//
// Run one job through
//   Idle -> Downloading -> Hashing -> Uploading -> Validating
// ending in Succeeded or Failed. Phases run strictly one after another,
// concurrency only exists inside the engines of a phase.
//
// The staging file is removed on every exit path. An open upload session is
// aborted on failure. No session is opened before download succeeds.
//
class TransferOrchestrator : private boost::noncopyable {
 public:
  TransferOrchestrator(
      const boost::shared_ptr<QSM::Client::ObjectSource> &source,
      const boost::shared_ptr<QSM::Client::ObjectSink> &sink);

  ~TransferOrchestrator();

 public:
  // Run job, never throws
  TransferResult Run(const TransferJob &job);

  TransferState::Value GetState() const { return m_state; }

 private:
  // Throw TransferException on failure
  void DoRun(const TransferJob &job, TransferResult *result);

  // Throw ConfigurationError
  void ValidateJob(const TransferJob &job) const;
  void ValidatePartLimits(const TransferJob &job, uint64_t size) const;

  // Throw StagingWriteError
  void PrepareStagingDirectory(const TransferJob &job, uint64_t size) const;

  void Validate(const TransferJob &job, TransferResult *result);

  void SetState(TransferState::Value state);
  void ReleaseStaging();

 private:
  boost::shared_ptr<QSM::Client::ObjectSource> m_source;
  boost::shared_ptr<QSM::Client::ObjectSink> m_sink;
  boost::scoped_ptr<QSM::Data::StagingBuffer> m_staging;
  TransferState::Value m_state;
};

}  // namespace Transfer
}  // namespace QSM

#endif  // QSMOVE_TRANSFER_TRANSFERORCHESTRATOR_H_

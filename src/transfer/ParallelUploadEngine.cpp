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

#include "transfer/ParallelUploadEngine.h"

#include <stddef.h>
#include <stdint.h>

#include <algorithm>
#include <exception>
#include <string>
#include <utility>
#include <vector>

#include "boost/bind.hpp"
#include "boost/exception/to_string.hpp"
#include "boost/thread/future.hpp"
#include "boost/thread/locks.hpp"
#include "boost/thread/mutex.hpp"

#include "base/LogMacros.h"
#include "base/StringUtils.h"
#include "base/ThreadPool.h"
#include "data/StagingBuffer.h"
#include "transfer/ChunkPlanner.h"
#include "transfer/UploadSession.h"

namespace QSM {

namespace Transfer {

using boost::lock_guard;
using boost::mutex;
using boost::shared_ptr;
using boost::to_string;
using boost::unique_future;
using QSM::Client::GetMessageForStoreError;
using QSM::Client::IsGoodStoreError;
using QSM::Client::ObjectSink;
using QSM::Client::UploadedPart;
using QSM::Data::Resource;
using QSM::Data::ResourceManager;
using QSM::Data::StagingBuffer;
using QSM::StringUtils::FormatKey;
using QSM::StringUtils::FormatProgress;
using QSM::Threading::ThreadPool;
using std::pair;
using std::string;
using std::vector;

// --------------------------------------------------------------------------
ParallelUploadEngine::ParallelUploadEngine(const shared_ptr<ObjectSink> &sink,
                                           size_t workerCount,
                                           uint64_t chunkSize,
                                           const RetryStrategy &retryStrategy)
    : m_sink(sink),
      m_workerCount(workerCount),
      m_chunkSize(chunkSize),
      m_retryStrategy(retryStrategy),
      m_resourceManager(NULL),
      m_sessionOpen(false),
      m_dispatchedParts(0),
      m_totalParts(0),
      m_completedParts(0),
      m_partFailed(false) {}

// --------------------------------------------------------------------------
size_t ParallelUploadEngine::GetCompletedPartCount() const {
  lock_guard<mutex> lock(m_progressLock);
  return m_completedParts;
}

// --------------------------------------------------------------------------
bool ParallelUploadEngine::HasFailedPart() const {
  lock_guard<mutex> lock(m_progressLock);
  return m_partFailed;
}

// --------------------------------------------------------------------------
void ParallelUploadEngine::Upload(const string &key,
                                  const StagingBuffer &buffer) {
  m_sessionId.clear();
  m_sessionOpen = false;
  m_dispatchedParts = 0;
  size_t partCount = GetChunkCount(buffer.GetSize(), m_chunkSize);
  {
    lock_guard<mutex> lock(m_progressLock);
    m_totalParts = partCount;
    m_completedParts = 0;
    m_partFailed = false;
  }

  // open session
  string sessionId;
  StoreClientError storeErr = CallWithRetry(
      m_retryStrategy,
      boost::bind(&ObjectSink::BeginMultipartSession, m_sink.get(), key,
                  &sessionId),
      "begin multipart session " + FormatKey(key));
  if (!IsGoodStoreError(storeErr)) {
    throw DestinationUploadError("Unable to open multipart session for " +
                                 FormatKey(key) + ": " +
                                 GetMessageForStoreError(storeErr));
  }
  m_sessionId = sessionId;
  m_sessionOpen = true;
  Info("Open multipart session [id=" << m_sessionId << "] for "
                                     << FormatKey(key) << " on "
                                     << m_sink->GetName() << ", " << partCount
                                     << " parts with " << m_workerCount
                                     << " workers");

  UploadSession session(m_sessionId, key);
  TransferClientError firstError = TransferErrorGood();

  // Pool and buffers live for this phase only
  ResourceManager resourceManager(m_workerCount,
                                  static_cast<size_t>(m_chunkSize));
  m_resourceManager = &resourceManager;
  {
    ThreadPool pool(m_workerCount);
    vector<unique_future<UploadPartOutcome> > futures;
    futures.reserve(partCount);

    // single reading point, part numbers follow read order
    uint64_t offset = 0;
    uint64_t size = buffer.GetSize();
    for (size_t i = 0; i < partCount; ++i) {
      PartJob job;
      job.m_partNumber = static_cast<int>(i + 1);
      job.m_length = static_cast<size_t>(std::min(m_chunkSize, size - offset));
      job.m_resource = resourceManager.Acquire();
      if (!job.m_resource) {
        firstError =
            TransferClientError(TransferError::UNEXPECTED, "UploadPart",
                                "Buffer pool is shutdown", false);
        break;
      }
      // a part is flagged failed before its buffer is released
      if (HasFailedPart()) {
        resourceManager.Release(job.m_resource);
        Warning("Stop dispatching parts of "
                << FormatKey(key) << " after a failed part, "
                << (partCount - i) << " of " << partCount
                << " parts never dispatched");
        break;
      }
      try {
        buffer.Read(offset, &(*job.m_resource)[0], job.m_length);
      } catch (const TransferException &e) {
        resourceManager.Release(job.m_resource);
        Error("Fail to read part " << job.m_partNumber << ": " << e.what());
        firstError =
            TransferClientError(e.GetError(), "ReadPart", e.what(), false);
        break;
      }
      offset += job.m_length;
      futures.push_back(pool.SubmitCallable(
          &ParallelUploadEngine::UploadOnePart, this, key, m_sessionId, job));
      ++m_dispatchedParts;
    }

    // collect in dispatch order, the session list is only touched here
    for (size_t i = 0; i < futures.size(); ++i) {
      UploadPartOutcome outcome;
      try {
        outcome = futures[i].get();
      } catch (const std::exception &e) {
        outcome = UploadPartOutcome(TransferClientError(
            TransferError::UNEXPECTED, "UploadPart", e.what(), false));
      }
      if (outcome.IsSuccess()) {
        session.AddPart(outcome.GetResult());
      } else if (IsGoodTransferError(firstError)) {
        firstError = outcome.GetError();
      }
    }
  }
  resourceManager.ShutdownAndWait();
  m_resourceManager = NULL;

  if (!IsGoodTransferError(firstError)) {
    Error("Fail to upload " << FormatKey(key) << " (" << m_dispatchedParts
                            << " of " << partCount << " parts dispatched): "
                            << GetMessageForTransferError(firstError));
    AbortSession(key);
    ThrowIfTransferError(firstError);
  }

  pair<bool, string> completeness = session.ValidateParts(partCount);
  if (!completeness.first) {
    Error("Reject commit of session [id=" << m_sessionId
                                          << "]: " << completeness.second);
    AbortSession(key);
    throw DestinationUploadError("Incomplete parts for " + FormatKey(key) +
                                 ": " + completeness.second);
  }

  vector<UploadedPart> sortedParts = session.GetSortedParts();
  storeErr = CallWithRetry(
      m_retryStrategy,
      boost::bind(&ObjectSink::CompleteSession, m_sink.get(), key, m_sessionId,
                  boost::cref(sortedParts)),
      "complete multipart session [id=" + m_sessionId + "]");
  if (!IsGoodStoreError(storeErr)) {
    Error("Fail to complete session [id=" << m_sessionId << "]: "
                                          << GetMessageForStoreError(storeErr));
    AbortSession(key);
    throw DestinationUploadError("Unable to complete multipart session for " +
                                 FormatKey(key) + ": " +
                                 GetMessageForStoreError(storeErr));
  }
  m_sessionOpen = false;
  Info("Complete multipart session [id=" << m_sessionId << "] with "
                                         << sortedParts.size() << " parts");
}

// --------------------------------------------------------------------------
void ParallelUploadEngine::AbortSession(const string &key) {
  if (!m_sessionOpen) {
    return;
  }
  StoreClientError err = CallWithRetry(
      m_retryStrategy,
      boost::bind(&ObjectSink::AbortSession, m_sink.get(), key, m_sessionId),
      "abort multipart session [id=" + m_sessionId + "]");
  if (IsGoodStoreError(err)) {
    Info("Abort multipart session [id=" << m_sessionId << "]");
  } else {
    Warning("Fail to abort multipart session [id="
            << m_sessionId << "]: " << GetMessageForStoreError(err));
  }
  m_sessionOpen = false;
}

// --------------------------------------------------------------------------
UploadPartOutcome ParallelUploadEngine::UploadOnePart(
    ParallelUploadEngine *engine, const string &key, const string &sessionId,
    const PartJob &job) {
  UploadPartOutcome outcome;
  try {
    outcome = engine->DoUploadPart(key, sessionId, job);
  } catch (const std::exception &e) {
    outcome = UploadPartOutcome(TransferClientError(
        TransferError::UNEXPECTED, "UploadPart", e.what(), false));
  }
  engine->OnPartFinished(outcome.IsSuccess());
  engine->m_resourceManager->Release(job.m_resource);
  return outcome;
}

// --------------------------------------------------------------------------
UploadPartOutcome ParallelUploadEngine::DoUploadPart(const string &key,
                                                     const string &sessionId,
                                                     const PartJob &job) {
  string description = "upload part " + to_string(job.m_partNumber) + " of " +
                       FormatKey(key);
  string contentId;
  StoreClientError storeErr = CallWithRetry(
      m_retryStrategy,
      boost::bind(&ObjectSink::UploadPart, m_sink.get(), key, sessionId,
                  job.m_partNumber,
                  static_cast<const char *>(&(*job.m_resource)[0]),
                  job.m_length, &contentId),
      description);
  if (!IsGoodStoreError(storeErr)) {
    Error("Part " << job.m_partNumber << " failed: "
                  << GetMessageForStoreError(storeErr));
    return UploadPartOutcome(
        TransferClientError(TransferError::DESTINATION_UPLOAD, description,
                            GetMessageForStoreError(storeErr), false));
  }
  DebugInfo("Part " << job.m_partNumber << " uploaded [etag=" << contentId
                    << "]");
  return UploadPartOutcome(UploadedPart(job.m_partNumber, contentId));
}

// --------------------------------------------------------------------------
void ParallelUploadEngine::OnPartFinished(bool success) {
  lock_guard<mutex> lock(m_progressLock);
  ++m_completedParts;
  if (!success) {
    m_partFailed = true;
  }
  Info("Upload progress: " << FormatProgress(m_completedParts, m_totalParts)
                           << (success ? "" : " (failed part)"));
}

}  // namespace Transfer
}  // namespace QSM

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

#include "transfer/TransferOrchestrator.h"

#include <stdint.h>

#include <exception>
#include <string>
#include <utility>
#include <vector>

#include "boost/bind.hpp"
#include "boost/exception/to_string.hpp"
#include "boost/shared_ptr.hpp"

#include "base/HashUtils.h"
#include "base/LogMacros.h"
#include "base/StringUtils.h"
#include "base/Utils.h"
#include "client/ObjectStore.h"
#include "configure/Default.h"
#include "data/StagingBuffer.h"
#include "transfer/ChunkPlanner.h"
#include "transfer/DigestComputer.h"
#include "transfer/ParallelDownloadEngine.h"
#include "transfer/ParallelUploadEngine.h"
#include "transfer/RetryStrategy.h"

namespace QSM {

namespace Transfer {

using boost::shared_ptr;
using boost::to_string;
using QSM::Client::GetMessageForStoreError;
using QSM::Client::IsGoodStoreError;
using QSM::Client::ObjectInfo;
using QSM::Client::ObjectSink;
using QSM::Client::ObjectSource;
using QSM::Data::StagingBuffer;
using QSM::StringUtils::FormatKey;
using QSM::StringUtils::FormatPath;
using QSM::StringUtils::ToLower;
using std::pair;
using std::string;
using std::vector;

// --------------------------------------------------------------------------
string TransferStateToString(TransferState::Value state) {
  switch (state) {
    case TransferState::Idle:
      return "Idle";
    case TransferState::Downloading:
      return "Downloading";
    case TransferState::Hashing:
      return "Hashing";
    case TransferState::Uploading:
      return "Uploading";
    case TransferState::Validating:
      return "Validating";
    case TransferState::Succeeded:
      return "Succeeded";
    case TransferState::Failed:
      return "Failed";
    default:
      return "Unknown";
  }
}

// --------------------------------------------------------------------------
TransferOrchestrator::TransferOrchestrator(
    const shared_ptr<ObjectSource> &source, const shared_ptr<ObjectSink> &sink)
    : m_source(source), m_sink(sink), m_state(TransferState::Idle) {}

// --------------------------------------------------------------------------
TransferOrchestrator::~TransferOrchestrator() { ReleaseStaging(); }

// --------------------------------------------------------------------------
void TransferOrchestrator::SetState(TransferState::Value state) {
  Info("Transfer state " << TransferStateToString(m_state) << " -> "
                         << TransferStateToString(state));
  m_state = state;
}

// --------------------------------------------------------------------------
void TransferOrchestrator::ReleaseStaging() {
  if (m_staging) {
    m_staging->Release();
    m_staging.reset();
  }
}

// --------------------------------------------------------------------------
TransferResult TransferOrchestrator::Run(const TransferJob &job) {
  m_state = TransferState::Idle;
  TransferResult result;
  Info("Start transfer " << job.ToString());

  TransferError::Value error = TransferError::GOOD;
  string message;
  try {
    DoRun(job, &result);
  } catch (const TransferException &e) {
    error = e.GetError();
    message = e.what();
  } catch (const std::exception &e) {
    error = TransferError::UNEXPECTED;
    message = e.what();
  }

  ReleaseStaging();

  if (error == TransferError::GOOD) {
    result.m_success = true;
    result.m_error = TransferError::GOOD;
    result.m_message = "File " + job.GetDestinationKey() +
                       " transferred successfully (" +
                       to_string(result.m_size) + " bytes)";
    SetState(TransferState::Succeeded);
    Info(result.m_message);
  } else {
    result.m_success = false;
    result.m_error = error;
    result.m_failedPhase = m_state;
    result.m_message = message;
    Error("Transfer failed in phase " << TransferStateToString(m_state) << ": "
                                      << message);
    SetState(TransferState::Failed);
  }
  return result;
}

// --------------------------------------------------------------------------
void TransferOrchestrator::ValidateJob(const TransferJob &job) const {
  if (!m_source) {
    throw ConfigurationError("Missing source");
  }
  if (!m_sink) {
    throw ConfigurationError("Missing destination");
  }
  if (job.GetSourceKey().empty()) {
    throw ConfigurationError("Missing source object key");
  }
  if (job.GetDestinationKey().empty()) {
    throw ConfigurationError("Missing destination object key");
  }
  if (job.GetWorkerCount() == 0) {
    throw ConfigurationError("Worker count must be positive");
  }
  if (job.GetChunkSize() == 0) {
    throw ConfigurationError("Chunk size must be positive");
  }
  if (job.GetStagingDirectory().empty()) {
    throw ConfigurationError("Missing staging directory");
  }

  uint64_t minPart = m_sink->GetMinPartSize();
  uint64_t maxPart = m_sink->GetMaxPartSize();
  if (minPart > 0 && job.GetChunkSize() < minPart) {
    throw ConfigurationError("Chunk size " + to_string(job.GetChunkSize()) +
                             " is below minimum part size " +
                             to_string(minPart) + " of " + m_sink->GetName());
  }
  if (maxPart > 0 && job.GetChunkSize() > maxPart) {
    throw ConfigurationError("Chunk size " + to_string(job.GetChunkSize()) +
                             " is above maximum part size " +
                             to_string(maxPart) + " of " + m_sink->GetName());
  }
}

// --------------------------------------------------------------------------
void TransferOrchestrator::ValidatePartLimits(const TransferJob &job,
                                              uint64_t size) const {
  size_t maxCount = m_sink->GetMaxPartCount();
  size_t count = GetChunkCount(size, job.GetChunkSize());
  if (maxCount > 0 && count > maxCount) {
    throw ConfigurationError(
        "Object of " + to_string(size) + " bytes needs " + to_string(count) +
        " parts, more than " + to_string(maxCount) + " allowed by " +
        m_sink->GetName() + ", use a larger chunk size");
  }
}

// --------------------------------------------------------------------------
void TransferOrchestrator::PrepareStagingDirectory(const TransferJob &job,
                                                   uint64_t size) const {
  const string &dir = job.GetStagingDirectory();
  if (!QSM::Utils::CreateDirectoryIfNotExists(dir)) {
    throw StagingWriteError("Unable to create staging directory " +
                            FormatPath(dir));
  }
  pair<bool, string> outcome = QSM::Utils::IsSafeDiskSpace(dir, size);
  if (!outcome.first) {
    throw StagingWriteError("No room for " + to_string(size) +
                            " bytes in staging directory " + FormatPath(dir) +
                            ": " + outcome.second);
  }
}

// --------------------------------------------------------------------------
void TransferOrchestrator::DoRun(const TransferJob &job,
                                 TransferResult *result) {
  ValidateJob(job);
  RetryStrategy retryStrategy(job.GetRetries(), job.GetRetryScaleFactor());

  // source size
  uint64_t size = 0;
  StoreClientError storeErr = CallWithRetry(
      retryStrategy,
      boost::bind(&ObjectSource::GetSize, m_source.get(), job.GetSourceKey(),
                  &size),
      "get size of " + FormatKey(job.GetSourceKey()));
  if (!IsGoodStoreError(storeErr)) {
    throw SourceReadError("Unable to get size of " +
                          FormatKey(job.GetSourceKey()) + " from " +
                          m_source->GetName() + ": " +
                          GetMessageForStoreError(storeErr));
  }
  Info("Source object " << FormatKey(job.GetSourceKey()) << " has " << size
                        << " bytes");

  if (size == 0) {
    Warning("Source object " << FormatKey(job.GetSourceKey())
                             << " is empty, nothing to transfer");
    HashUtils::MD5Digest digest;
    result->m_digest = digest.HexDigest();
    result->m_size = 0;
    return;
  }
  ValidatePartLimits(job, size);
  PrepareStagingDirectory(job, size);

  // download
  SetState(TransferState::Downloading);
  m_staging.reset(new StagingBuffer(job.GetStagingDirectory(), size));
  vector<ChunkRange> chunks = PlanChunks(size, job.GetChunkSize());
  result->m_chunkCount = chunks.size();
  {
    ParallelDownloadEngine engine(m_source, job.GetWorkerCount(),
                                  job.GetChunkSize(), retryStrategy);
    engine.Download(job.GetSourceKey(), chunks, m_staging.get());
  }

  // digest
  SetState(TransferState::Hashing);
  result->m_digest = ComputeDigest(
      *m_staging, QSM::Configure::Default::GetDigestBlockSize());
  Info("Staged object digest [md5=" << result->m_digest << "]");

  // upload
  SetState(TransferState::Uploading);
  {
    ParallelUploadEngine engine(m_sink, job.GetWorkerCount(),
                                job.GetChunkSize(), retryStrategy);
    try {
      engine.Upload(job.GetDestinationKey(), *m_staging);
    } catch (const std::exception &) {
      result->m_sessionId = engine.GetSessionId();
      result->m_partCount = engine.GetDispatchedPartCount();
      engine.AbortSession(job.GetDestinationKey());
      throw;
    }
    result->m_sessionId = engine.GetSessionId();
    result->m_partCount = engine.GetDispatchedPartCount();
  }

  // validate
  SetState(TransferState::Validating);
  Validate(job, result);
}

// --------------------------------------------------------------------------
void TransferOrchestrator::Validate(const TransferJob &job,
                                    TransferResult *result) {
  RetryStrategy retryStrategy(job.GetRetries(), job.GetRetryScaleFactor());
  ObjectInfo info;
  StoreClientError storeErr = CallWithRetry(
      retryStrategy,
      boost::bind(&ObjectSink::HeadObject, m_sink.get(),
                  job.GetDestinationKey(), &info),
      "head " + FormatKey(job.GetDestinationKey()));
  if (!IsGoodStoreError(storeErr)) {
    throw DestinationUploadError("Unable to head uploaded object " +
                                 FormatKey(job.GetDestinationKey()) + ": " +
                                 GetMessageForStoreError(storeErr));
  }

  uint64_t expected = m_staging->GetSize();
  if (info.m_size != expected) {
    throw SizeMismatchError("Destination reports " + to_string(info.m_size) +
                            " bytes but " + to_string(expected) +
                            " bytes were staged");
  }

  if (job.IsStrictVerify()) {
    if (info.m_digest.empty()) {
      throw DigestMismatchError("Destination reports no digest for " +
                                FormatKey(job.GetDestinationKey()));
    }
    if (ToLower(info.m_digest) != ToLower(result->m_digest)) {
      throw DigestMismatchError("Destination digest " + info.m_digest +
                                " differs from staged digest " +
                                result->m_digest);
    }
    Info("Destination digest matches staged digest");
  } else {
    DebugInfo("Destination digest [" << info.m_digest
                                     << "], not compared");
  }
  result->m_size = info.m_size;
}

}  // namespace Transfer
}  // namespace QSM

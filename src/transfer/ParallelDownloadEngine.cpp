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

#include "transfer/ParallelDownloadEngine.h"

#include <stddef.h>
#include <stdint.h>

#include <exception>
#include <string>
#include <vector>

#include "boost/bind.hpp"
#include "boost/foreach.hpp"
#include "boost/shared_ptr.hpp"
#include "boost/thread/future.hpp"
#include "boost/thread/locks.hpp"
#include "boost/thread/mutex.hpp"

#include "base/LogMacros.h"
#include "base/StringUtils.h"
#include "base/ThreadPool.h"
#include "client/ObjectStore.h"
#include "data/ResourceManager.h"
#include "data/StagingBuffer.h"

namespace QSM {

namespace Transfer {

using boost::lock_guard;
using boost::mutex;
using boost::shared_ptr;
using boost::unique_future;
using QSM::Client::GetMessageForStoreError;
using QSM::Client::IsGoodStoreError;
using QSM::Client::ObjectSource;
using QSM::Data::Resource;
using QSM::Data::ResourceManager;
using QSM::Data::StagingBuffer;
using QSM::StringUtils::FormatKey;
using QSM::StringUtils::FormatProgress;
using QSM::StringUtils::FormatRange;
using QSM::Threading::ThreadPool;
using std::string;
using std::vector;

namespace {

// Return resource to the pool when leaving scope
class ResourceGuard {
 public:
  ResourceGuard(ResourceManager *manager, const Resource &resource)
      : m_manager(manager), m_resource(resource) {}
  ~ResourceGuard() {
    if (m_resource) {
      m_manager->Release(m_resource);
    }
  }

 private:
  ResourceManager *m_manager;
  Resource m_resource;
};

}  // namespace

// --------------------------------------------------------------------------
ParallelDownloadEngine::ParallelDownloadEngine(
    const shared_ptr<ObjectSource> &source, size_t workerCount,
    uint64_t chunkSize, const RetryStrategy &retryStrategy)
    : m_source(source),
      m_workerCount(workerCount),
      m_chunkSize(chunkSize),
      m_retryStrategy(retryStrategy),
      m_resourceManager(NULL),
      m_totalChunks(0),
      m_completedChunks(0) {}

// --------------------------------------------------------------------------
size_t ParallelDownloadEngine::GetCompletedChunkCount() const {
  lock_guard<mutex> lock(m_progressLock);
  return m_completedChunks;
}

// --------------------------------------------------------------------------
void ParallelDownloadEngine::Download(const string &key,
                                      const vector<ChunkRange> &chunks,
                                      StagingBuffer *buffer) {
  if (buffer == NULL) {
    throw UnexpectedError("Null staging buffer");
  }
  {
    lock_guard<mutex> lock(m_progressLock);
    m_totalChunks = chunks.size();
    m_completedChunks = 0;
  }
  if (chunks.empty()) {
    Info("Nothing to download for " << FormatKey(key));
    return;
  }

  Info("Start downloading " << FormatKey(key) << " from "
                            << m_source->GetName() << " in " << chunks.size()
                            << " chunks with " << m_workerCount << " workers");

  // Pool and buffers live for this phase only
  ResourceManager resourceManager(m_workerCount,
                                  static_cast<size_t>(m_chunkSize));
  m_resourceManager = &resourceManager;
  TransferClientError firstError = TransferErrorGood();
  {
    ThreadPool pool(m_workerCount);
    vector<unique_future<TransferClientError> > futures;
    futures.reserve(chunks.size());
    BOOST_FOREACH(const ChunkRange &range, chunks) {
      futures.push_back(pool.SubmitCallable(
          &ParallelDownloadEngine::DownloadChunk, this, key, range, buffer));
    }

    for (size_t i = 0; i < futures.size(); ++i) {
      TransferClientError err;
      try {
        err = futures[i].get();
      } catch (const std::exception &e) {
        err = TransferClientError(TransferError::UNEXPECTED, "DownloadChunk",
                                  e.what(), false);
      }
      if (!IsGoodTransferError(err) && IsGoodTransferError(firstError)) {
        firstError = err;
      }
    }
  }
  resourceManager.ShutdownAndWait();
  m_resourceManager = NULL;

  if (!IsGoodTransferError(firstError)) {
    Error("Fail to download " << FormatKey(key) << ": "
                              << GetMessageForTransferError(firstError));
    ThrowIfTransferError(firstError);
  }
  Info("Finish downloading " << FormatKey(key));
}

// --------------------------------------------------------------------------
TransferClientError ParallelDownloadEngine::DownloadChunk(
    ParallelDownloadEngine *engine, const string &key, const ChunkRange &range,
    StagingBuffer *buffer) {
  TransferClientError err;
  try {
    err = engine->DoDownloadChunk(key, range, buffer);
  } catch (const TransferException &e) {
    err = TransferClientError(e.GetError(), "DownloadChunk", e.what(), false);
  } catch (const std::exception &e) {
    err = TransferClientError(TransferError::UNEXPECTED, "DownloadChunk",
                              e.what(), false);
  }
  engine->OnChunkFinished(IsGoodTransferError(err));
  return err;
}

// --------------------------------------------------------------------------
TransferClientError ParallelDownloadEngine::DoDownloadChunk(
    const string &key, const ChunkRange &range, StagingBuffer *buffer) {
  string description = "read " + FormatKey(key) + " " +
                       FormatRange(range.m_start, range.m_stop);
  Resource resource = m_resourceManager->Acquire();
  if (!resource) {
    return TransferClientError(TransferError::UNEXPECTED, description,
                               "Buffer pool is shutdown", false);
  }
  ResourceGuard guard(m_resourceManager, resource);

  size_t len = static_cast<size_t>(range.GetSize());
  if (resource->size() < len) {
    return TransferClientError(TransferError::UNEXPECTED, description,
                               "Chunk is larger than buffer", false);
  }
  char *data = &(*resource)[0];
  size_t bytesRead = 0;
  StoreClientError storeErr = CallWithRetry(
      m_retryStrategy,
      boost::bind(&ObjectSource::ReadRange, m_source.get(), key, range.m_start,
                  range.m_stop, data, &bytesRead),
      description);
  if (!IsGoodStoreError(storeErr)) {
    Error("Chunk " << range.m_index << " failed: "
                   << GetMessageForStoreError(storeErr));
    return TransferClientError(TransferError::SOURCE_READ, description,
                               GetMessageForStoreError(storeErr), false);
  }

  buffer->Write(range.m_start, data, len);
  DebugInfo("Chunk " << range.m_index << " staged "
                     << FormatRange(range.m_start, range.m_stop));
  return TransferErrorGood();
}

// --------------------------------------------------------------------------
void ParallelDownloadEngine::OnChunkFinished(bool success) {
  lock_guard<mutex> lock(m_progressLock);
  ++m_completedChunks;
  Info("Download progress: " << FormatProgress(m_completedChunks,
                                               m_totalChunks)
                             << (success ? "" : " (failed chunk)"));
}

}  // namespace Transfer
}  // namespace QSM

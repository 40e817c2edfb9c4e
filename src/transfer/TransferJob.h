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

#ifndef QSMOVE_TRANSFER_TRANSFERJOB_H_
#define QSMOVE_TRANSFER_TRANSFERJOB_H_

#include <stddef.h>
#include <stdint.h>

#include <string>

namespace QSM {

namespace Transfer {

//
// One object to move, immutable once created
//
class TransferJob {
 public:
  // Job with default worker count, chunk size, retries and staging dir
  TransferJob(const std::string &sourceKey, const std::string &destinationKey);

  TransferJob(const std::string &sourceKey, const std::string &destinationKey,
              size_t workerCount, uint64_t chunkSize, uint16_t retries,
              uint32_t retryScaleFactor, bool strictVerify,
              const std::string &stagingDirectory);

 public:
  const std::string &GetSourceKey() const { return m_sourceKey; }
  const std::string &GetDestinationKey() const { return m_destinationKey; }
  size_t GetWorkerCount() const { return m_workerCount; }
  uint64_t GetChunkSize() const { return m_chunkSize; }
  uint16_t GetRetries() const { return m_retries; }
  uint32_t GetRetryScaleFactor() const { return m_retryScaleFactor; }
  bool IsStrictVerify() const { return m_strictVerify; }
  const std::string &GetStagingDirectory() const { return m_stagingDirectory; }

  std::string ToString() const;

 private:
  std::string m_sourceKey;
  std::string m_destinationKey;
  size_t m_workerCount;
  uint64_t m_chunkSize;          // in bytes
  uint16_t m_retries;            // per chunk or part
  uint32_t m_retryScaleFactor;   // in milliseconds
  bool m_strictVerify;
  std::string m_stagingDirectory;
};

}  // namespace Transfer
}  // namespace QSM

#endif  // QSMOVE_TRANSFER_TRANSFERJOB_H_

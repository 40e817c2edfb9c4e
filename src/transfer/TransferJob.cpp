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

#include "transfer/TransferJob.h"

#include <sstream>
#include <string>

#include "configure/Default.h"

namespace QSM {

namespace Transfer {

using std::string;

// --------------------------------------------------------------------------
TransferJob::TransferJob(const string &sourceKey, const string &destinationKey)
    : m_sourceKey(sourceKey),
      m_destinationKey(destinationKey),
      m_workerCount(QSM::Configure::Default::GetDefaultWorkerCount()),
      m_chunkSize(QSM::Configure::Default::GetDefaultChunkSize()),
      m_retries(QSM::Configure::Default::GetDefaultRetries()),
      m_retryScaleFactor(
          QSM::Configure::Default::GetDefaultRetryScaleFactor()),
      m_strictVerify(false),
      m_stagingDirectory(
          QSM::Configure::Default::GetDefaultStagingDirectory()) {}

// --------------------------------------------------------------------------
TransferJob::TransferJob(const string &sourceKey, const string &destinationKey,
                         size_t workerCount, uint64_t chunkSize,
                         uint16_t retries, uint32_t retryScaleFactor,
                         bool strictVerify, const string &stagingDirectory)
    : m_sourceKey(sourceKey),
      m_destinationKey(destinationKey),
      m_workerCount(workerCount),
      m_chunkSize(chunkSize),
      m_retries(retries),
      m_retryScaleFactor(retryScaleFactor),
      m_strictVerify(strictVerify),
      m_stagingDirectory(stagingDirectory) {}

// --------------------------------------------------------------------------
string TransferJob::ToString() const {
  std::stringstream ss;
  ss << "[source=" << m_sourceKey << ", destination=" << m_destinationKey
     << ", workers=" << m_workerCount << ", chunksize=" << m_chunkSize
     << ", retries=" << m_retries << ", strict=" << std::boolalpha
     << m_strictVerify << ", staging=" << m_stagingDirectory << "]";
  return ss.str();
}

}  // namespace Transfer
}  // namespace QSM

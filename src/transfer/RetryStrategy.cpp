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

#include "transfer/RetryStrategy.h"

#include <stdint.h>

#include <string>

#include "boost/thread/thread.hpp"

#include "base/LogMacros.h"
#include "configure/Default.h"

namespace QSM {

namespace Transfer {

using QSM::Client::GetMessageForStoreError;
using QSM::Client::IsGoodStoreError;
using std::string;

// --------------------------------------------------------------------------
bool RetryStrategy::ShouldRetry(const StoreClientError &error,
                                uint16_t attemptedRetryTimes) const {
  return attemptedRetryTimes >= m_maxRetryTimes ? false : error.ShouldRetry();
}

// --------------------------------------------------------------------------
uint32_t RetryStrategy::CalculateDelayBeforeNextRetry(
    uint16_t attemptedRetryTimes) const {
  if (attemptedRetryTimes == 0 || m_scaleFactor == 0) {
    return 0;
  }
  uint64_t maxDelay = QSM::Configure::Default::GetMaxRetryDelay();
  // 2^32 * scale already exceeds any max delay
  if (attemptedRetryTimes >= 32) {
    return static_cast<uint32_t>(maxDelay);
  }
  uint64_t delay = (static_cast<uint64_t>(1) << attemptedRetryTimes) *
                   static_cast<uint64_t>(m_scaleFactor);
  return static_cast<uint32_t>(delay < maxDelay ? delay : maxDelay);
}

// --------------------------------------------------------------------------
RetryStrategy GetDefaultRetryStrategy() {
  return RetryStrategy(QSM::Configure::Default::GetDefaultRetries(),
                       QSM::Configure::Default::GetDefaultRetryScaleFactor());
}

// --------------------------------------------------------------------------
StoreClientError CallWithRetry(
    const RetryStrategy &strategy,
    const boost::function<StoreClientError()> &operation,
    const string &description, uint16_t *attemptedRetryTimes) {
  uint16_t attempted = 0;
  StoreClientError err = operation();
  while (!IsGoodStoreError(err) && strategy.ShouldRetry(err, attempted)) {
    uint32_t delay = strategy.CalculateDelayBeforeNextRetry(attempted);
    ++attempted;
    Warning("Retry " << description << " (" << attempted << "/"
                     << strategy.GetMaxRetryTimes() << ") in " << delay
                     << "ms after " << GetMessageForStoreError(err));
    if (delay > 0) {
      boost::this_thread::sleep_for(boost::chrono::milliseconds(delay));
    }
    err = operation();
  }
  if (attemptedRetryTimes != NULL) {
    *attemptedRetryTimes = attempted;
  }
  return err;
}

}  // namespace Transfer
}  // namespace QSM

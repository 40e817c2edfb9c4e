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

#ifndef QSMOVE_TRANSFER_RETRYSTRATEGY_H_
#define QSMOVE_TRANSFER_RETRYSTRATEGY_H_

#include <stdint.h>

#include <string>

#include "boost/function.hpp"

#include "client/ClientError.hpp"
#include "client/StoreError.h"

namespace QSM {

namespace Transfer {

typedef QSM::Client::ClientError<QSM::Client::StoreError::Value>
    StoreClientError;

//
// Bounded retry with exponential backoff for a single chunk or part
// operation
//
class RetryStrategy {
 public:
  RetryStrategy(uint16_t maxRetryTimes, uint32_t scaleFactor)
      : m_maxRetryTimes(maxRetryTimes), m_scaleFactor(scaleFactor) {}

  bool ShouldRetry(const StoreClientError &error,
                   uint16_t attemptedRetryTimes) const;

  // in milliseconds, capped by Default::GetMaxRetryDelay
  uint32_t CalculateDelayBeforeNextRetry(uint16_t attemptedRetryTimes) const;

  uint16_t GetMaxRetryTimes() const { return m_maxRetryTimes; }
  uint32_t GetScaleFactor() const { return m_scaleFactor; }

 private:
  uint16_t m_maxRetryTimes;
  uint32_t m_scaleFactor;  // in milliseconds
};

RetryStrategy GetDefaultRetryStrategy();

// Call operation until it succeeds or the strategy gives up
//
// @param  : strategy, operation, description used in log messages,
//           attempted retry times(output, can be null)
// @return : result of the last call
StoreClientError CallWithRetry(
    const RetryStrategy &strategy,
    const boost::function<StoreClientError()> &operation,
    const std::string &description, uint16_t *attemptedRetryTimes = NULL);

}  // namespace Transfer
}  // namespace QSM

#endif  // QSMOVE_TRANSFER_RETRYSTRATEGY_H_

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
#include <string>

#include "boost/bind.hpp"
#include "gtest/gtest.h"

#include "base/Logging.h"
#include "base/Utils.h"
#include "client/StoreError.h"
#include "configure/Default.h"
#include "transfer/RetryStrategy.h"

namespace {

using QSM::Client::StoreError;
using QSM::Client::StoreErrorGood;
using QSM::Transfer::CallWithRetry;
using QSM::Transfer::GetDefaultRetryStrategy;
using QSM::Transfer::RetryStrategy;
using QSM::Transfer::StoreClientError;

static const char *defaultLogDir = "/tmp/qsmove.test.logs/";
void InitLog() {
  QSM::Utils::CreateDirectoryIfNotExists(defaultLogDir);
  QSM::Logging::Log::Instance().Initialize(defaultLogDir);
}

StoreClientError Retryable() {
  return StoreClientError(StoreError::THROTTLED, "Op", "slow down", true);
}

StoreClientError Fatal() {
  return StoreClientError(StoreError::ACCESS_DENIED, "Op", "denied", false);
}

// Fail failures times then succeed
StoreClientError FlakyOperation(int *calls, int failures, bool retryable) {
  ++(*calls);
  if (*calls <= failures) {
    return retryable ? Retryable() : Fatal();
  }
  return StoreErrorGood();
}

class RetryStrategyTest : public ::testing::Test {
 protected:
  static void SetUpTestCase() { InitLog(); }
};

}  // namespace

TEST_F(RetryStrategyTest, ShouldRetry) {
  RetryStrategy strategy(3, 1);
  EXPECT_TRUE(strategy.ShouldRetry(Retryable(), 0));
  EXPECT_TRUE(strategy.ShouldRetry(Retryable(), 2));
  EXPECT_FALSE(strategy.ShouldRetry(Retryable(), 3));
  EXPECT_FALSE(strategy.ShouldRetry(Fatal(), 0));

  RetryStrategy never(0, 1);
  EXPECT_FALSE(never.ShouldRetry(Retryable(), 0));
}

TEST_F(RetryStrategyTest, DefaultStrategy) {
  RetryStrategy strategy = GetDefaultRetryStrategy();
  EXPECT_EQ(strategy.GetMaxRetryTimes(),
            QSM::Configure::Default::GetDefaultRetries());
  EXPECT_EQ(strategy.GetScaleFactor(),
            QSM::Configure::Default::GetDefaultRetryScaleFactor());
}

TEST_F(RetryStrategyTest, ExponentialDelay) {
  RetryStrategy strategy(5, 25);
  EXPECT_EQ(strategy.CalculateDelayBeforeNextRetry(0), 0u);
  EXPECT_EQ(strategy.CalculateDelayBeforeNextRetry(1), 50u);
  EXPECT_EQ(strategy.CalculateDelayBeforeNextRetry(2), 100u);
  EXPECT_EQ(strategy.CalculateDelayBeforeNextRetry(3), 200u);
}

TEST_F(RetryStrategyTest, DelayIsCapped) {
  uint32_t maxDelay = QSM::Configure::Default::GetMaxRetryDelay();
  RetryStrategy strategy(100, 25);
  EXPECT_EQ(strategy.CalculateDelayBeforeNextRetry(10), 25600u);
  EXPECT_EQ(strategy.CalculateDelayBeforeNextRetry(11), maxDelay);
  EXPECT_EQ(strategy.CalculateDelayBeforeNextRetry(28), maxDelay);
  EXPECT_EQ(strategy.CalculateDelayBeforeNextRetry(31), maxDelay);
  EXPECT_EQ(strategy.CalculateDelayBeforeNextRetry(40), maxDelay);
  EXPECT_EQ(strategy.CalculateDelayBeforeNextRetry(65535), maxDelay);

  RetryStrategy huge(3, 0xFFFFFFFFu);
  EXPECT_EQ(huge.CalculateDelayBeforeNextRetry(1), maxDelay);

  RetryStrategy noDelay(100, 0);
  EXPECT_EQ(noDelay.CalculateDelayBeforeNextRetry(40), 0u);
}

TEST_F(RetryStrategyTest, CallWithRetryRecovers) {
  int calls = 0;
  uint16_t attempted = 0;
  StoreClientError err = CallWithRetry(
      RetryStrategy(3, 1), boost::bind(FlakyOperation, &calls, 2, true),
      "flaky", &attempted);
  EXPECT_TRUE(QSM::Client::IsGoodStoreError(err));
  EXPECT_EQ(calls, 3);
  EXPECT_EQ(attempted, 2u);
}

TEST_F(RetryStrategyTest, CallWithRetryGivesUp) {
  int calls = 0;
  StoreClientError err = CallWithRetry(
      RetryStrategy(2, 1), boost::bind(FlakyOperation, &calls, 10, true),
      "always failing");
  EXPECT_EQ(err.GetError(), StoreError::THROTTLED);
  EXPECT_EQ(calls, 3);
}

TEST_F(RetryStrategyTest, CallWithRetryStopsOnNonRetryable) {
  int calls = 0;
  StoreClientError err = CallWithRetry(
      RetryStrategy(5, 1), boost::bind(FlakyOperation, &calls, 1, false),
      "denied");
  EXPECT_EQ(err.GetError(), StoreError::ACCESS_DENIED);
  EXPECT_EQ(calls, 1);
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}

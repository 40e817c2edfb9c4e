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

#include "gtest/gtest.h"

#include "base/Exception.h"

namespace {

using QSM::Exception::QSMException;
using std::string;

static const char *const testMsg = "test QSMException";

void ThrowException() { throw QSMException(testMsg); }

string GetExceptionMsg() {
  try {
    ThrowException();
  } catch (const QSMException &err) {
    return err.get();
  }
  return string();
}

}  // namespace

TEST(QSMExceptionTest, DefaultTest) {
  EXPECT_EQ(GetExceptionMsg(), string(testMsg));
}

TEST(QSMExceptionTest, CatchAsRuntimeError) {
  try {
    ThrowException();
  } catch (const std::runtime_error &err) {
    EXPECT_EQ(string(err.what()), string(testMsg));
  }
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  int code = RUN_ALL_TESTS();
  return code;
}

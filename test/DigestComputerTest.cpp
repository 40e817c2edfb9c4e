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

#include "base/Logging.h"
#include "base/Utils.h"
#include "data/StagingBuffer.h"
#include "transfer/DigestComputer.h"
#include "transfer/TransferError.h"

namespace QSM {

namespace Transfer {

using QSM::Data::StagingBuffer;
using std::string;

static const char *defaultLogDir = "/tmp/qsmove.test.logs/";
static const char *stagingDir = "/tmp/qsmove.test.digest";

void InitLog() {
  QSM::Utils::CreateDirectoryIfNotExists(defaultLogDir);
  QSM::Logging::Log::Instance().Initialize(defaultLogDir);
}

class DigestComputerTest : public ::testing::Test {
 protected:
  static void SetUpTestCase() {
    InitLog();
    QSM::Utils::CreateDirectoryIfNotExists(stagingDir);
  }

  static void TearDownTestCase() {
    QSM::Utils::DeleteFilesInDirectory(stagingDir, true);
  }
};

TEST_F(DigestComputerTest, KnownDigest) {
  StagingBuffer buffer(stagingDir, 3);
  buffer.Write(0, "abc", 3);
  EXPECT_EQ(ComputeDigest(buffer, 8192),
            string("900150983cd24fb0d6963f7d28e17f72"));
  // block size does not change the result
  EXPECT_EQ(ComputeDigest(buffer, 1),
            string("900150983cd24fb0d6963f7d28e17f72"));
  EXPECT_EQ(ComputeDigest(buffer, 2),
            string("900150983cd24fb0d6963f7d28e17f72"));
}

TEST_F(DigestComputerTest, ZeroFilled) {
  // md5 of 1024 zero bytes
  StagingBuffer buffer(stagingDir, 1024);
  EXPECT_EQ(ComputeDigest(buffer, 100),
            string("0f343b0931126a20f133d67c2b018a3b"));
}

TEST_F(DigestComputerTest, ReleasedBuffer) {
  StagingBuffer buffer(stagingDir, 3);
  buffer.Release();
  EXPECT_THROW(ComputeDigest(buffer, 8192), StagingReadError);
}

}  // namespace Transfer
}  // namespace QSM

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}

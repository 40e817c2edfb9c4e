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
#include <vector>

#include "gtest/gtest.h"

#include "base/Logging.h"
#include "base/Utils.h"
#include "data/StagingBuffer.h"
#include "transfer/TransferError.h"

namespace QSM {

namespace Data {

using QSM::Transfer::StagingReadError;
using QSM::Transfer::StagingWriteError;
using std::string;
using std::vector;

static const char *defaultLogDir = "/tmp/qsmove.test.logs/";
static const char *stagingDir = "/tmp/qsmove.test.staging";

void InitLog() {
  QSM::Utils::CreateDirectoryIfNotExists(defaultLogDir);
  QSM::Logging::Log::Instance().Initialize(defaultLogDir);
}

class StagingBufferTest : public ::testing::Test {
 protected:
  static void SetUpTestCase() {
    InitLog();
    QSM::Utils::CreateDirectoryIfNotExists(stagingDir);
  }

  static void TearDownTestCase() {
    QSM::Utils::DeleteFilesInDirectory(stagingDir, true);
  }
};

TEST_F(StagingBufferTest, CreatePresized) {
  StagingBuffer buffer(stagingDir, 100);
  EXPECT_EQ(buffer.GetSize(), 100u);
  EXPECT_FALSE(buffer.IsReleased());
  EXPECT_TRUE(QSM::Utils::FileExists(buffer.GetPath()));
  EXPECT_EQ(buffer.GetPath().find(string(stagingDir) + "/qsmove-"), 0u);

  // unwritten regions read as zeros
  vector<char> data(100, 'x');
  buffer.Read(0, &data[0], 100);
  EXPECT_EQ(data, vector<char>(100, '\0'));
}

TEST_F(StagingBufferTest, WriteOutOfOrder) {
  StagingBuffer buffer(stagingDir, 9);
  buffer.Write(6, "ghi", 3);
  buffer.Write(0, "abc", 3);
  buffer.Write(3, "def", 3);

  char data[9];
  buffer.Read(0, data, 9);
  EXPECT_EQ(string(data, 9), string("abcdefghi"));

  buffer.Read(4, data, 2);
  EXPECT_EQ(string(data, 2), string("ef"));
}

TEST_F(StagingBufferTest, OutOfRange) {
  StagingBuffer buffer(stagingDir, 4);
  char data[8] = {0};
  EXPECT_THROW(buffer.Write(2, data, 3), StagingWriteError);
  EXPECT_THROW(buffer.Write(5, data, 0), StagingWriteError);
  EXPECT_THROW(buffer.Read(0, data, 5), StagingReadError);
  EXPECT_NO_THROW(buffer.Read(4, data, 0));
}

TEST_F(StagingBufferTest, Release) {
  string path;
  {
    StagingBuffer buffer(stagingDir, 4);
    path = buffer.GetPath();
    buffer.Release();
    EXPECT_TRUE(buffer.IsReleased());
    EXPECT_FALSE(QSM::Utils::FileExists(path));
    // second release is harmless
    buffer.Release();

    char data[4];
    EXPECT_THROW(buffer.Read(0, data, 4), StagingReadError);
    EXPECT_THROW(buffer.Write(0, data, 4), StagingWriteError);
  }
  {
    StagingBuffer buffer(stagingDir, 4);
    path = buffer.GetPath();
  }
  // destructor removes the file
  EXPECT_FALSE(QSM::Utils::FileExists(path));
}

TEST_F(StagingBufferTest, MissingDirectory) {
  EXPECT_THROW(StagingBuffer("/tmp/qsmove.test.staging.missing/sub", 4),
               StagingWriteError);
}

}  // namespace Data
}  // namespace QSM

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}

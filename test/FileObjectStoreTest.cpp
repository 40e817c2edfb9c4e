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
#include <stdio.h>
#include <sys/stat.h>

#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "base/Logging.h"
#include "base/Utils.h"
#include "client/ClientError.hpp"
#include "client/FileObjectStore.h"
#include "client/ObjectStore.h"
#include "client/StoreError.h"

namespace QSM {

namespace Client {

using std::string;
using std::vector;

static const char *defaultLogDir = "/tmp/qsmove.test.logs/";
static const char *testDir = "/tmp/qsmove.test.filestore/";
static const char *srcDir = "/tmp/qsmove.test.filestore/src/";
static const char *dstDir = "/tmp/qsmove.test.filestore/dst/";

void InitLog() {
  QSM::Utils::CreateDirectoryIfNotExists(defaultLogDir);
  QSM::Logging::Log::Instance().Initialize(defaultLogDir);
}

void WriteFile(const string &path, const string &content) {
  FILE *pf = fopen(path.c_str(), "wb");
  ASSERT_TRUE(pf != NULL) << "Fail to open " << path;
  if (!content.empty()) {
    ASSERT_EQ(fwrite(content.data(), 1, content.size(), pf), content.size());
  }
  fclose(pf);
}

string ReadFile(const string &path) {
  string content;
  FILE *pf = fopen(path.c_str(), "rb");
  if (pf == NULL) {
    return content;
  }
  char buf[256];
  size_t n = 0;
  while ((n = fread(buf, 1, sizeof(buf), pf)) > 0) {
    content.append(buf, n);
  }
  fclose(pf);
  return content;
}

class FileObjectStoreTest : public ::testing::Test {
 protected:
  static void SetUpTestCase() { InitLog(); }

  void SetUp() {
    QSM::Utils::DeleteFilesInDirectory(testDir, true);
    ASSERT_TRUE(QSM::Utils::CreateDirectoryIfNotExists(srcDir));
    WriteFile(string(srcDir) + "data.bin", "0123456789abcdef");
  }

  void TearDown() { QSM::Utils::DeleteFilesInDirectory(testDir, true); }
};

TEST_F(FileObjectStoreTest, SourceGetSize) {
  FileObjectSource source(srcDir);
  uint64_t size = 0;
  ClientError<StoreError::Value> err = source.GetSize("data.bin", &size);
  ASSERT_TRUE(IsGoodStoreError(err)) << GetMessageForStoreError(err);
  EXPECT_EQ(size, 16u);

  EXPECT_EQ(source.GetSize("missing.bin", &size).GetError(),
            StoreError::NOT_FOUND);
  // a directory is not an object
  mkdir((string(srcDir) + "sub").c_str(), 0755);
  EXPECT_EQ(source.GetSize("sub", &size).GetError(),
            StoreError::INVALID_PARAMETER);
  EXPECT_EQ(source.GetSize("../src/data.bin", &size).GetError(),
            StoreError::INVALID_PARAMETER);
  EXPECT_EQ(source.GetSize("", &size).GetError(),
            StoreError::INVALID_PARAMETER);
}

TEST_F(FileObjectStoreTest, SourceReadRange) {
  FileObjectSource source("/tmp/qsmove.test.filestore/src");
  EXPECT_EQ(source.GetRootDirectory(), string(srcDir));

  char buf[16];
  size_t bytesRead = 0;
  ClientError<StoreError::Value> err =
      source.ReadRange("data.bin", 4, 9, buf, &bytesRead);
  ASSERT_TRUE(IsGoodStoreError(err)) << GetMessageForStoreError(err);
  EXPECT_EQ(bytesRead, 6u);
  EXPECT_EQ(string(buf, bytesRead), string("456789"));

  err = source.ReadRange("data.bin", 10, 20, buf, &bytesRead);
  EXPECT_EQ(err.GetError(), StoreError::SHORT_READ);
  EXPECT_EQ(bytesRead, 6u);

  err = source.ReadRange("data.bin", 5, 4, buf, &bytesRead);
  EXPECT_EQ(err.GetError(), StoreError::INVALID_PARAMETER);
}

TEST_F(FileObjectStoreTest, SinkMultipartSession) {
  FileObjectSink sink(dstDir);
  string sessionId;
  ClientError<StoreError::Value> err =
      sink.BeginMultipartSession("dir/out.bin", &sessionId);
  ASSERT_TRUE(IsGoodStoreError(err)) << GetMessageForStoreError(err);
  ASSERT_FALSE(sessionId.empty());
  string sessionDir = sink.GetSessionDirectory(sessionId);
  EXPECT_TRUE(QSM::Utils::IsDirectory(sessionDir).first);

  // upload out of order
  vector<UploadedPart> parts(2);
  string etag;
  err = sink.UploadPart("dir/out.bin", sessionId, 2, "world", 5, &etag);
  ASSERT_TRUE(IsGoodStoreError(err)) << GetMessageForStoreError(err);
  parts[1] = UploadedPart(2, etag);
  err = sink.UploadPart("dir/out.bin", sessionId, 1, "hello ", 6, &etag);
  ASSERT_TRUE(IsGoodStoreError(err)) << GetMessageForStoreError(err);
  parts[0] = UploadedPart(1, etag);
  // md5 of "hello "
  EXPECT_EQ(etag, string("f814893777bcc2295fff05f00e508da6"));

  // nothing visible before commit
  EXPECT_FALSE(QSM::Utils::FileExists(string(dstDir) + "dir/out.bin"));

  err = sink.CompleteSession("dir/out.bin", sessionId, parts);
  ASSERT_TRUE(IsGoodStoreError(err)) << GetMessageForStoreError(err);
  EXPECT_EQ(ReadFile(string(dstDir) + "dir/out.bin"), string("hello world"));
  EXPECT_FALSE(QSM::Utils::FileExists(sessionDir));

  ObjectInfo info;
  err = sink.HeadObject("dir/out.bin", &info);
  ASSERT_TRUE(IsGoodStoreError(err)) << GetMessageForStoreError(err);
  EXPECT_EQ(info.m_size, 11u);
  // md5 of "hello world"
  EXPECT_EQ(info.m_digest, string("5eb63bbbe01eeed093cb22bb8f5acdc3"));
}

TEST_F(FileObjectStoreTest, SinkAbortSession) {
  FileObjectSink sink(dstDir);
  string sessionId;
  ASSERT_TRUE(IsGoodStoreError(sink.BeginMultipartSession("out", &sessionId)));
  string etag;
  ASSERT_TRUE(IsGoodStoreError(
      sink.UploadPart("out", sessionId, 1, "abc", 3, &etag)));

  ClientError<StoreError::Value> err = sink.AbortSession("out", sessionId);
  ASSERT_TRUE(IsGoodStoreError(err)) << GetMessageForStoreError(err);
  EXPECT_FALSE(QSM::Utils::FileExists(sink.GetSessionDirectory(sessionId)));
  EXPECT_FALSE(QSM::Utils::FileExists(string(dstDir) + "out"));

  EXPECT_EQ(sink.AbortSession("out", sessionId).GetError(),
            StoreError::NO_SUCH_UPLOAD);
  EXPECT_EQ(sink.UploadPart("out", sessionId, 2, "d", 1, &etag).GetError(),
            StoreError::NO_SUCH_UPLOAD);
  EXPECT_EQ(
      sink.CompleteSession("out", sessionId, vector<UploadedPart>()).GetError(),
      StoreError::NO_SUCH_UPLOAD);
}

TEST_F(FileObjectStoreTest, SinkHeadMissing) {
  FileObjectSink sink(dstDir);
  ObjectInfo info;
  EXPECT_EQ(sink.HeadObject("none", &info).GetError(), StoreError::NOT_FOUND);
}

TEST_F(FileObjectStoreTest, SinkRejectsInvalidKey) {
  FileObjectSink sink(dstDir);
  string sessionId;
  EXPECT_EQ(sink.BeginMultipartSession("../escape", &sessionId).GetError(),
            StoreError::INVALID_PARAMETER);
  EXPECT_EQ(sink.BeginMultipartSession("dir/", &sessionId).GetError(),
            StoreError::INVALID_PARAMETER);
}

}  // namespace Client
}  // namespace QSM

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}

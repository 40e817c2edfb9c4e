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
#include <dirent.h>
#include <string.h>

#include <string>
#include <vector>

#include "boost/make_shared.hpp"
#include "boost/shared_ptr.hpp"
#include "gtest/gtest.h"

#include "base/Logging.h"
#include "base/Utils.h"
#include "client/ObjectStore.h"
#include "transfer/TransferError.h"
#include "transfer/TransferJob.h"
#include "transfer/TransferOrchestrator.h"

#include "FakeObjectStore.h"

namespace QSM {

namespace Transfer {

using boost::make_shared;
using boost::shared_ptr;
using QSM::Client::FakeObjectSink;
using QSM::Client::FakeObjectSource;
using QSM::Client::MakePattern;
using QSM::Client::MD5Of;
using QSM::Client::ObjectSink;
using std::string;
using std::vector;

static const char *defaultLogDir = "/tmp/qsmove.test.logs/";
static const char *stagingDir = "/tmp/qsmove.test.orchestrator";
static const uint64_t smallChunk = 1024;

void InitLog() {
  QSM::Utils::CreateDirectoryIfNotExists(defaultLogDir);
  QSM::Logging::Log::Instance().Initialize(defaultLogDir);
}

// Number of staging files left in staging directory
int CountStagingFiles() {
  DIR *dir = opendir(stagingDir);
  if (dir == NULL) {
    return 0;
  }
  int count = 0;
  struct dirent *entry = NULL;
  while ((entry = readdir(dir)) != NULL) {
    if (strncmp(entry->d_name, "qsmove-", 7) == 0) {
      ++count;
    }
  }
  closedir(dir);
  return count;
}

TransferJob MakeJob(const string &src, const string &dst, size_t workers,
                    uint64_t chunkSize, bool strict = false) {
  return TransferJob(src, dst, workers, chunkSize, 2, 1, strict, stagingDir);
}

class TransferOrchestratorTest : public ::testing::Test {
 protected:
  static void SetUpTestCase() { InitLog(); }

  static void TearDownTestCase() {
    QSM::Utils::DeleteFilesInDirectory(stagingDir, true);
  }

  void SetUp() {
    m_content = MakePattern(5 * smallChunk + 1);
    m_source = make_shared<FakeObjectSource>();
    m_source->PutObject("src", m_content);
    m_sink = make_shared<FakeObjectSink>();
    m_orchestrator.reset(new TransferOrchestrator(m_source, m_sink));
  }

  void ExpectFailure(const TransferResult &result, TransferError::Value error,
                     TransferState::Value phase) {
    EXPECT_FALSE(result.m_success);
    EXPECT_EQ(result.m_error, error) << result.m_message;
    EXPECT_EQ(result.m_failedPhase, phase) << result.m_message;
    EXPECT_FALSE(result.m_message.empty());
    EXPECT_EQ(m_orchestrator->GetState(), TransferState::Failed);
    EXPECT_EQ(CountStagingFiles(), 0);
    EXPECT_EQ(m_sink->GetOpenSessionCount(), 0u);
  }

 protected:
  string m_content;
  shared_ptr<FakeObjectSource> m_source;
  shared_ptr<FakeObjectSink> m_sink;
  shared_ptr<TransferOrchestrator> m_orchestrator;
};

TEST_F(TransferOrchestratorTest, TransferUnevenObject) {
  // 25 MB in 10 MB chunks
  string content = MakePattern(26214400);
  m_source->PutObject("big", content);
  TransferResult result =
      m_orchestrator->Run(MakeJob("big", "dir/big", 3, 10485760));

  ASSERT_TRUE(result.m_success) << result.m_message;
  EXPECT_EQ(result.m_message,
            string("File dir/big transferred successfully (26214400 bytes)"));
  EXPECT_EQ(result.m_size, 26214400u);
  EXPECT_EQ(result.m_chunkCount, 3u);
  EXPECT_EQ(result.m_partCount, 3u);
  EXPECT_EQ(result.m_digest, MD5Of(content));
  EXPECT_FALSE(result.m_sessionId.empty());
  EXPECT_EQ(m_orchestrator->GetState(), TransferState::Succeeded);
  EXPECT_TRUE(m_sink->GetObject("dir/big") == content);
  EXPECT_EQ(CountStagingFiles(), 0);

  vector<vector<int> > completed = m_sink->GetCompletedPartNumbers();
  ASSERT_EQ(completed.size(), 1u);
  ASSERT_EQ(completed[0].size(), 3u);
  EXPECT_EQ(completed[0][0], 1);
  EXPECT_EQ(completed[0][1], 2);
  EXPECT_EQ(completed[0][2], 3);
}

TEST_F(TransferOrchestratorTest, OutOfOrderChunksAndParts) {
  m_source->DelayFirstChunk(100);
  m_sink->DelayFirstPart(100);
  TransferResult result =
      m_orchestrator->Run(MakeJob("src", "dst", 4, smallChunk));
  ASSERT_TRUE(result.m_success) << result.m_message;
  EXPECT_EQ(m_sink->GetObject("dst"), m_content);
  EXPECT_EQ(result.m_chunkCount, 6u);
  EXPECT_EQ(result.m_partCount, 6u);
}

TEST_F(TransferOrchestratorTest, SequentialRunsAreIndependent) {
  TransferResult first =
      m_orchestrator->Run(MakeJob("src", "one", 2, smallChunk));
  TransferResult second =
      m_orchestrator->Run(MakeJob("src", "two", 1, 4 * smallChunk));
  EXPECT_TRUE(first.m_success);
  EXPECT_TRUE(second.m_success);
  EXPECT_EQ(second.m_partCount, 2u);
  EXPECT_EQ(m_sink->GetObject("two"), m_content);
  EXPECT_NE(first.m_sessionId, second.m_sessionId);
}

TEST_F(TransferOrchestratorTest, EmptyObject) {
  m_source->PutObject("empty", string());
  TransferResult result =
      m_orchestrator->Run(MakeJob("empty", "dst", 2, smallChunk));
  ASSERT_TRUE(result.m_success) << result.m_message;
  EXPECT_EQ(result.m_size, 0u);
  EXPECT_EQ(result.m_chunkCount, 0u);
  EXPECT_EQ(result.m_digest, string("d41d8cd98f00b204e9800998ecf8427e"));
  EXPECT_EQ(m_sink->GetBeginCalls(), 0);
  EXPECT_TRUE(m_source->GetReads().empty());
}

TEST_F(TransferOrchestratorTest, SourceReadFailure) {
  m_source->FailReadAt(2 * smallChunk, 100, true);
  TransferResult result =
      m_orchestrator->Run(MakeJob("src", "dst", 3, smallChunk));
  ExpectFailure(result, TransferError::SOURCE_READ,
                TransferState::Downloading);
  // no session is opened before download succeeds
  EXPECT_EQ(m_sink->GetBeginCalls(), 0);
  EXPECT_FALSE(m_sink->HasObject("dst"));
  EXPECT_TRUE(result.m_sessionId.empty());
}

TEST_F(TransferOrchestratorTest, SourceSizeFailure) {
  m_source->FailGetSize(100, true);
  TransferResult result =
      m_orchestrator->Run(MakeJob("src", "dst", 3, smallChunk));
  ExpectFailure(result, TransferError::SOURCE_READ, TransferState::Idle);
  EXPECT_TRUE(m_source->GetReads().empty());
}

TEST_F(TransferOrchestratorTest, MissingSourceObject) {
  TransferResult result =
      m_orchestrator->Run(MakeJob("nothing", "dst", 3, smallChunk));
  ExpectFailure(result, TransferError::SOURCE_READ, TransferState::Idle);
}

TEST_F(TransferOrchestratorTest, UploadFailureAbortsSession) {
  m_sink->FailPart(2, 100, false);
  TransferResult result =
      m_orchestrator->Run(MakeJob("src", "dst", 2, smallChunk));
  ExpectFailure(result, TransferError::DESTINATION_UPLOAD,
                TransferState::Uploading);
  EXPECT_FALSE(result.m_sessionId.empty());
  vector<string> aborted = m_sink->GetAbortedSessions();
  ASSERT_EQ(aborted.size(), 1u);
  EXPECT_EQ(aborted[0], result.m_sessionId);
  EXPECT_FALSE(m_sink->HasObject("dst"));
}

TEST_F(TransferOrchestratorTest, SizeMismatch) {
  m_sink->SetSizeDelta(-1);
  TransferResult result =
      m_orchestrator->Run(MakeJob("src", "dst", 2, smallChunk));
  ExpectFailure(result, TransferError::SIZE_MISMATCH,
                TransferState::Validating);
}

TEST_F(TransferOrchestratorTest, DigestIgnoredByDefault) {
  m_sink->SetDigestOverride("0123456789abcdef0123456789abcdef");
  TransferResult result =
      m_orchestrator->Run(MakeJob("src", "dst", 2, smallChunk));
  EXPECT_TRUE(result.m_success) << result.m_message;
}

TEST_F(TransferOrchestratorTest, StrictVerify) {
  TransferResult result =
      m_orchestrator->Run(MakeJob("src", "dst", 2, smallChunk, true));
  EXPECT_TRUE(result.m_success) << result.m_message;
  EXPECT_EQ(result.m_digest, MD5Of(m_content));
}

TEST_F(TransferOrchestratorTest, StrictVerifyDigestMismatch) {
  m_sink->SetDigestOverride("0123456789abcdef0123456789abcdef");
  TransferResult result =
      m_orchestrator->Run(MakeJob("src", "dst", 2, smallChunk, true));
  ExpectFailure(result, TransferError::DIGEST_MISMATCH,
                TransferState::Validating);
}

TEST_F(TransferOrchestratorTest, StrictVerifyMissingDigest) {
  m_sink->SetReportDigest(false);
  TransferResult result =
      m_orchestrator->Run(MakeJob("src", "dst", 2, smallChunk, true));
  ExpectFailure(result, TransferError::DIGEST_MISMATCH,
                TransferState::Validating);
}

TEST_F(TransferOrchestratorTest, ConfigurationErrors) {
  ExpectFailure(m_orchestrator->Run(MakeJob("", "dst", 2, smallChunk)),
                TransferError::CONFIGURATION, TransferState::Idle);
  ExpectFailure(m_orchestrator->Run(MakeJob("src", "", 2, smallChunk)),
                TransferError::CONFIGURATION, TransferState::Idle);
  ExpectFailure(m_orchestrator->Run(MakeJob("src", "dst", 0, smallChunk)),
                TransferError::CONFIGURATION, TransferState::Idle);
  ExpectFailure(m_orchestrator->Run(MakeJob("src", "dst", 2, 0)),
                TransferError::CONFIGURATION, TransferState::Idle);
  ExpectFailure(m_orchestrator->Run(TransferJob("src", "dst", 2, smallChunk,
                                                2, 1, false, string())),
                TransferError::CONFIGURATION, TransferState::Idle);
  // nothing touched the stores
  EXPECT_TRUE(m_source->GetReads().empty());
  EXPECT_EQ(m_sink->GetBeginCalls(), 0);
}

TEST_F(TransferOrchestratorTest, MissingSink) {
  TransferOrchestrator orchestrator(m_source, shared_ptr<ObjectSink>());
  TransferResult result =
      orchestrator.Run(MakeJob("src", "dst", 2, smallChunk));
  EXPECT_FALSE(result.m_success);
  EXPECT_EQ(result.m_error, TransferError::CONFIGURATION);
  EXPECT_EQ(result.m_failedPhase, TransferState::Idle);
}

TEST_F(TransferOrchestratorTest, PartLimits) {
  m_sink->SetPartLimits(2 * smallChunk, 0, 0);
  ExpectFailure(m_orchestrator->Run(MakeJob("src", "dst", 2, smallChunk)),
                TransferError::CONFIGURATION, TransferState::Idle);

  m_sink->SetPartLimits(0, smallChunk / 2, 0);
  ExpectFailure(m_orchestrator->Run(MakeJob("src", "dst", 2, smallChunk)),
                TransferError::CONFIGURATION, TransferState::Idle);

  // 6 parts needed
  m_sink->SetPartLimits(0, 0, 5);
  ExpectFailure(m_orchestrator->Run(MakeJob("src", "dst", 2, smallChunk)),
                TransferError::CONFIGURATION, TransferState::Idle);
  EXPECT_TRUE(m_source->GetReads().empty());

  m_sink->SetPartLimits(0, 0, 6);
  EXPECT_TRUE(
      m_orchestrator->Run(MakeJob("src", "dst", 2, smallChunk)).m_success);
}

TEST(TransferStateTest, Names) {
  EXPECT_EQ(TransferStateToString(TransferState::Idle), string("Idle"));
  EXPECT_EQ(TransferStateToString(TransferState::Downloading),
            string("Downloading"));
  EXPECT_EQ(TransferStateToString(TransferState::Validating),
            string("Validating"));
  EXPECT_EQ(TransferStateToString(TransferState::Failed), string("Failed"));
}

}  // namespace Transfer
}  // namespace QSM

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}

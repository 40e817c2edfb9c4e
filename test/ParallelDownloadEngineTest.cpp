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
#include <utility>
#include <vector>

#include "boost/make_shared.hpp"
#include "boost/shared_ptr.hpp"
#include "gtest/gtest.h"

#include "base/Logging.h"
#include "base/Utils.h"
#include "data/StagingBuffer.h"
#include "transfer/ChunkPlanner.h"
#include "transfer/ParallelDownloadEngine.h"
#include "transfer/RetryStrategy.h"
#include "transfer/TransferError.h"

#include "FakeObjectStore.h"

namespace QSM {

namespace Transfer {

using boost::make_shared;
using boost::shared_ptr;
using QSM::Client::FakeObjectSource;
using QSM::Client::MakePattern;
using QSM::Data::StagingBuffer;
using std::pair;
using std::string;
using std::vector;

static const char *defaultLogDir = "/tmp/qsmove.test.logs/";
static const char *stagingDir = "/tmp/qsmove.test.download";
static const uint64_t chunkSize = 1024;

void InitLog() {
  QSM::Utils::CreateDirectoryIfNotExists(defaultLogDir);
  QSM::Logging::Log::Instance().Initialize(defaultLogDir);
}

string ReadAll(const StagingBuffer &buffer) {
  string content(static_cast<size_t>(buffer.GetSize()), '\0');
  if (!content.empty()) {
    buffer.Read(0, &content[0], content.size());
  }
  return content;
}

class ParallelDownloadEngineTest : public ::testing::Test {
 protected:
  static void SetUpTestCase() {
    InitLog();
    QSM::Utils::CreateDirectoryIfNotExists(stagingDir);
  }

  static void TearDownTestCase() {
    QSM::Utils::DeleteFilesInDirectory(stagingDir, true);
  }

  void SetUp() {
    m_content = MakePattern(10 * chunkSize + 100);
    m_source = make_shared<FakeObjectSource>();
    m_source->PutObject("obj", m_content);
    m_chunks = PlanChunks(m_content.size(), chunkSize);
  }

 protected:
  string m_content;
  shared_ptr<FakeObjectSource> m_source;
  vector<ChunkRange> m_chunks;
};

TEST_F(ParallelDownloadEngineTest, StagesEveryChunk) {
  StagingBuffer buffer(stagingDir, m_content.size());
  ParallelDownloadEngine engine(m_source, 4, chunkSize, RetryStrategy(0, 1));
  engine.Download("obj", m_chunks, &buffer);

  EXPECT_EQ(ReadAll(buffer), m_content);
  EXPECT_EQ(engine.GetCompletedChunkCount(), m_chunks.size());
  vector<pair<uint64_t, uint64_t> > reads = m_source->GetReads();
  EXPECT_EQ(reads.size(), m_chunks.size());
}

TEST_F(ParallelDownloadEngineTest, OutOfOrderCompletion) {
  // first chunk finishes last
  m_source->DelayFirstChunk(200);
  StagingBuffer buffer(stagingDir, m_content.size());
  ParallelDownloadEngine engine(m_source, 4, chunkSize, RetryStrategy(0, 1));
  engine.Download("obj", m_chunks, &buffer);
  EXPECT_EQ(ReadAll(buffer), m_content);
}

TEST_F(ParallelDownloadEngineTest, SingleWorker) {
  StagingBuffer buffer(stagingDir, m_content.size());
  ParallelDownloadEngine engine(m_source, 1, chunkSize, RetryStrategy(0, 1));
  engine.Download("obj", m_chunks, &buffer);
  EXPECT_EQ(ReadAll(buffer), m_content);
}

TEST_F(ParallelDownloadEngineTest, TransientFailureIsRetried) {
  m_source->FailReadAt(m_chunks[3].m_start, 2, true);
  StagingBuffer buffer(stagingDir, m_content.size());
  ParallelDownloadEngine engine(m_source, 4, chunkSize, RetryStrategy(3, 1));
  engine.Download("obj", m_chunks, &buffer);
  EXPECT_EQ(ReadAll(buffer), m_content);
  EXPECT_EQ(m_source->GetReads().size(), m_chunks.size() + 2);
}

TEST_F(ParallelDownloadEngineTest, FailedChunkRaisesSourceReadError) {
  m_source->FailReadAt(m_chunks[5].m_start, 100, true);
  StagingBuffer buffer(stagingDir, m_content.size());
  ParallelDownloadEngine engine(m_source, 4, chunkSize, RetryStrategy(2, 1));
  EXPECT_THROW(engine.Download("obj", m_chunks, &buffer), SourceReadError);
  // siblings are not cancelled
  EXPECT_EQ(engine.GetCompletedChunkCount(), m_chunks.size());
  EXPECT_EQ(m_source->GetReads().size(), m_chunks.size() + 2);
}

TEST_F(ParallelDownloadEngineTest, NonRetryableFailureNotRetried) {
  m_source->FailReadAt(m_chunks[0].m_start, 1, false);
  StagingBuffer buffer(stagingDir, m_content.size());
  ParallelDownloadEngine engine(m_source, 2, chunkSize, RetryStrategy(5, 1));
  EXPECT_THROW(engine.Download("obj", m_chunks, &buffer), SourceReadError);
  EXPECT_EQ(m_source->GetReads().size(), m_chunks.size());
}

TEST_F(ParallelDownloadEngineTest, NoChunks) {
  StagingBuffer buffer(stagingDir, 0);
  ParallelDownloadEngine engine(m_source, 2, chunkSize, RetryStrategy(0, 1));
  engine.Download("obj", vector<ChunkRange>(), &buffer);
  EXPECT_TRUE(m_source->GetReads().empty());
}

TEST_F(ParallelDownloadEngineTest, NullBuffer) {
  ParallelDownloadEngine engine(m_source, 2, chunkSize, RetryStrategy(0, 1));
  EXPECT_THROW(engine.Download("obj", m_chunks, NULL), UnexpectedError);
}

}  // namespace Transfer
}  // namespace QSM

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}

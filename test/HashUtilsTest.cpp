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

#include <string>

#include "gtest/gtest.h"

#include "base/HashUtils.h"
#include "base/Utils.h"

using QSM::HashUtils::ComputeFileMD5;
using QSM::HashUtils::IsHexDigest;
using QSM::HashUtils::MD5Digest;
using std::pair;
using std::string;

namespace {

const char *const emptyMD5 = "d41d8cd98f00b204e9800998ecf8427e";
const char *const abcMD5 = "900150983cd24fb0d6963f7d28e17f72";
const char *const testDir = "/tmp/qsmove.test.hashutils/";

void WriteFile(const string &path, const string &content) {
  FILE *pf = fopen(path.c_str(), "wb");
  ASSERT_TRUE(pf != NULL) << "Fail to open " << path;
  if (!content.empty()) {
    ASSERT_EQ(fwrite(content.data(), 1, content.size(), pf), content.size());
  }
  fclose(pf);
}

}  // namespace

TEST(HashUtilsTest, MD5OfEmptyInput) {
  MD5Digest digest;
  EXPECT_EQ(digest.HexDigest(), string(emptyMD5));
}

TEST(HashUtilsTest, MD5Incremental) {
  MD5Digest whole;
  whole.Update("abc", 3);
  EXPECT_EQ(whole.HexDigest(), string(abcMD5));

  MD5Digest pieces;
  pieces.Update("a", 1);
  pieces.Update("", 0);
  pieces.Update("bc", 2);
  EXPECT_EQ(pieces.HexDigest(), string(abcMD5));
}

TEST(HashUtilsTest, ComputeFileMD5) {
  ASSERT_TRUE(QSM::Utils::CreateDirectoryIfNotExists(testDir));
  string path = string(testDir) + "abc";
  WriteFile(path, "abc");

  string hex;
  // block smaller than content
  pair<bool, string> outcome = ComputeFileMD5(path, &hex, 2);
  ASSERT_TRUE(outcome.first) << outcome.second;
  EXPECT_EQ(hex, string(abcMD5));

  string emptyPath = string(testDir) + "empty";
  WriteFile(emptyPath, "");
  outcome = ComputeFileMD5(emptyPath, &hex);
  ASSERT_TRUE(outcome.first) << outcome.second;
  EXPECT_EQ(hex, string(emptyMD5));

  QSM::Utils::DeleteFilesInDirectory(testDir, true);
}

TEST(HashUtilsTest, ComputeFileMD5Missing) {
  string hex;
  pair<bool, string> outcome =
      ComputeFileMD5("/tmp/qsmove.test.hashutils.missing/none", &hex);
  EXPECT_FALSE(outcome.first);
  EXPECT_FALSE(outcome.second.empty());
}

TEST(HashUtilsTest, IsHexDigest) {
  EXPECT_TRUE(IsHexDigest(emptyMD5));
  EXPECT_TRUE(IsHexDigest("ABCdef0123"));
  EXPECT_FALSE(IsHexDigest("xyz"));
  EXPECT_FALSE(IsHexDigest("\"abc\""));
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}

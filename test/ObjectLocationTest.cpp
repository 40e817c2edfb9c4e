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

#include "gtest/gtest.h"

#include "client/ObjectLocation.h"

namespace {

using QSM::Client::ObjectLocation;
using QSM::Client::ParseObjectLocation;
using QSM::Client::ResolveDestinationKey;
using QSM::Client::Scheme;
using QSM::Client::SchemeToString;
using QSM::Client::StringToScheme;
using std::pair;
using std::string;

ObjectLocation MustParse(const string &str) {
  ObjectLocation loc;
  pair<bool, string> outcome = ParseObjectLocation(str, &loc);
  EXPECT_TRUE(outcome.first) << outcome.second;
  return loc;
}

bool ParseFails(const string &str) {
  ObjectLocation loc;
  return !ParseObjectLocation(str, &loc).first;
}

}  // namespace

TEST(ObjectLocationTest, Scheme) {
  EXPECT_EQ(StringToScheme("file"), Scheme::File);
  EXPECT_EQ(StringToScheme("QS"), Scheme::QingStor);
  EXPECT_EQ(StringToScheme("http"), Scheme::Null);
  EXPECT_EQ(SchemeToString(Scheme::QingStor), string("qs"));
  EXPECT_EQ(SchemeToString(Scheme::Null), string());
}

TEST(ObjectLocationTest, ParseFile) {
  ObjectLocation loc = MustParse("file:///data/in/file.bin");
  EXPECT_EQ(loc.m_scheme, Scheme::File);
  EXPECT_EQ(loc.m_directory, string("/data/in/"));
  EXPECT_EQ(loc.m_key, string("file.bin"));
  EXPECT_FALSE(loc.IsContainer());
  EXPECT_EQ(loc.ToString(), string("file:///data/in/file.bin"));

  loc = MustParse("file:///file.bin");
  EXPECT_EQ(loc.m_directory, string("/"));
  EXPECT_EQ(loc.m_key, string("file.bin"));
}

TEST(ObjectLocationTest, ParseFileDirectory) {
  ObjectLocation loc = MustParse("file:///data/out/");
  EXPECT_EQ(loc.m_directory, string("/data/out/"));
  EXPECT_TRUE(loc.m_key.empty());
  EXPECT_TRUE(loc.IsContainer());
}

TEST(ObjectLocationTest, ParseQingStor) {
  ObjectLocation loc = MustParse("qs://mybucket/dir/obj.tar");
  EXPECT_EQ(loc.m_scheme, Scheme::QingStor);
  EXPECT_EQ(loc.m_bucket, string("mybucket"));
  EXPECT_TRUE(loc.m_zone.empty());
  EXPECT_EQ(loc.m_key, string("dir/obj.tar"));
  EXPECT_EQ(loc.ToString(), string("qs://mybucket/dir/obj.tar"));

  loc = MustParse("qs://mybucket@pek3a/obj");
  EXPECT_EQ(loc.m_bucket, string("mybucket"));
  EXPECT_EQ(loc.m_zone, string("pek3a"));
  EXPECT_EQ(loc.m_key, string("obj"));
  EXPECT_EQ(loc.ToString(), string("qs://mybucket@pek3a/obj"));
}

TEST(ObjectLocationTest, ParseQingStorContainer) {
  EXPECT_TRUE(MustParse("qs://mybucket").IsContainer());
  EXPECT_TRUE(MustParse("qs://mybucket/").IsContainer());
  EXPECT_TRUE(MustParse("qs://mybucket/backup/").IsContainer());
}

TEST(ObjectLocationTest, ParseInvalid) {
  EXPECT_TRUE(ParseFails("/data/file"));
  EXPECT_TRUE(ParseFails("ftp://host/file"));
  EXPECT_TRUE(ParseFails("file://relative/path"));
  EXPECT_TRUE(ParseFails("file://"));
  EXPECT_TRUE(ParseFails("qs:///key"));
  EXPECT_TRUE(ParseFails("qs://bucket@/key"));
  EXPECT_FALSE(ParseObjectLocation("qs://bucket/key", NULL).first);
}

TEST(ObjectLocationTest, ResolveDestinationKey) {
  EXPECT_EQ(ResolveDestinationKey("dir/obj.tar", MustParse("qs://b/")),
            string("obj.tar"));
  EXPECT_EQ(ResolveDestinationKey("obj.tar", MustParse("qs://b/backup/")),
            string("backup/obj.tar"));
  EXPECT_EQ(ResolveDestinationKey("obj.tar", MustParse("qs://b/renamed")),
            string("renamed"));
  EXPECT_EQ(ResolveDestinationKey("file.bin", MustParse("file:///out/")),
            string("file.bin"));
}

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}

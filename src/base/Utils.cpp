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

#include "base/Utils.h"

#include <errno.h>
#include <stdint.h>
#include <stdlib.h>  // for free
#include <string.h>  // for strerror, strdup

#include <dirent.h>  // for opendir readdir
#include <libgen.h>
#include <sys/stat.h>
#include <sys/statvfs.h>
#include <sys/types.h>
#include <unistd.h>  // for access

#include <string>
#include <utility>

#include "boost/exception/to_string.hpp"
#include "boost/scope_exit.hpp"

#include "base/StringUtils.h"
#include "configure/Default.h"

namespace QSM {

namespace Utils {

using boost::to_string;
using QSM::StringUtils::FormatPath;
using std::make_pair;
using std::pair;
using std::string;

static const char PATH_DELIM = '/';

namespace {

string PostErrMsg(const string &path) {
  return string(": ") + strerror(errno) + " " + FormatPath(path);
}

}  // namespace

// --------------------------------------------------------------------------
bool CreateDirectoryIfNotExists(const string &path) {
  if (path.empty()) {
    return false;
  }
  if (IsRootDirectory(path)) {
    return true;
  }
  if (FileExists(path)) {
    return IsDirectory(path).first;
  }
  if (!CreateDirectoryIfNotExists(GetDirName(path))) {
    return false;
  }
  int errorCode =
      mkdir(path.c_str(), QSM::Configure::Default::GetDefineDirMode());
  return errorCode == 0 || errno == EEXIST;
}

// --------------------------------------------------------------------------
bool RemoveFileIfExists(const string &path) {
  int errorCode = unlink(path.c_str());
  return (errorCode == 0 || errno == ENOENT);
}

// --------------------------------------------------------------------------
pair<bool, string> DeleteFilesInDirectory(const string &path,
                                          bool deleteSelf) {
  DIR *dir = opendir(path.c_str());
  if (dir == NULL) {
    return make_pair(false, "Could not open directory " + PostErrMsg(path));
  }
  BOOST_SCOPE_EXIT((dir)) { closedir(dir); }
  BOOST_SCOPE_EXIT_END

  struct dirent *nextDir = NULL;
  while ((nextDir = readdir(dir)) != NULL) {
    if (strcmp(nextDir->d_name, ".") == 0 ||
        strcmp(nextDir->d_name, "..") == 0) {
      continue;
    }

    string fullPath = AppendPathDelim(path) + nextDir->d_name;
    struct stat st;
    if (lstat(fullPath.c_str(), &st) != 0) {
      return make_pair(false,
                       "Could not get stats of file " + PostErrMsg(fullPath));
    }

    if (S_ISDIR(st.st_mode)) {
      pair<bool, string> outcome = DeleteFilesInDirectory(fullPath, true);
      if (!outcome.first) {
        return outcome;
      }
    } else if (unlink(fullPath.c_str()) != 0) {
      return make_pair(false, "Could not remove file " + PostErrMsg(fullPath));
    }
  }

  if (deleteSelf && rmdir(path.c_str()) != 0) {
    return make_pair(false, "Could not remove dir " + PostErrMsg(path));
  }
  return make_pair(true, string());
}

// --------------------------------------------------------------------------
bool FileExists(const string &path) {
  return access(path.c_str(), F_OK) == 0;
}

// --------------------------------------------------------------------------
pair<bool, string> IsDirectory(const string &path) {
  struct stat stBuf;
  if (stat(path.c_str(), &stBuf) != 0) {
    return make_pair(false, "Unable to access path " + PostErrMsg(path));
  }
  return make_pair(static_cast<bool>(S_ISDIR(stBuf.st_mode)), string());
}

// --------------------------------------------------------------------------
pair<bool, string> HavePermission(const string &path) {
  struct stat st;
  if (stat(path.c_str(), &st) != 0) {
    return make_pair(false,
                     "Unable to access file when trying to check its "
                     "permission " + PostErrMsg(path));
  }
  return HavePermission(&st);
}

// --------------------------------------------------------------------------
pair<bool, string> HavePermission(const struct stat *st) {
  if (st == NULL) {
    return make_pair(false, "Null stat input");
  }

  uid_t uidProcess = GetProcessEffectiveUserID();
  gid_t gidProcess = GetProcessEffectiveGroupID();

  if (0 == uidProcess || st->st_uid == uidProcess) {
    return make_pair(true, string());
  }
  if (st->st_gid == gidProcess && S_IRWXG == (st->st_mode & S_IRWXG)) {
    return make_pair(true, string());
  }
  if (S_IRWXO == (st->st_mode & S_IRWXO)) {
    return make_pair(true, string());
  }

  return make_pair(false, "No permission, [Process uid:gid=" +
                              to_string(uidProcess) + ":" +
                              to_string(gidProcess) + ", File uid:gid=" +
                              to_string(st->st_uid) + ":" +
                              to_string(st->st_gid) + "]");
}

// --------------------------------------------------------------------------
pair<uint64_t, string> GetFreeDiskSpace(const string &absolutePath) {
  struct statvfs vfsbuf;
  if (statvfs(absolutePath.c_str(), &vfsbuf) != 0) {
    return make_pair(static_cast<uint64_t>(0),
                     "Fail to get free disk space " + PostErrMsg(absolutePath));
  }
  return make_pair(static_cast<uint64_t>(vfsbuf.f_bavail) * vfsbuf.f_bsize,
                   string());
}

// --------------------------------------------------------------------------
pair<bool, string> IsSafeDiskSpace(const string &absolutePath,
                                   uint64_t freeSpace) {
  pair<uint64_t, string> outcome = GetFreeDiskSpace(absolutePath);
  if (!outcome.second.empty()) {
    return make_pair(false, outcome.second);
  }
  if (outcome.first < freeSpace) {
    return make_pair(false, "Only " + to_string(outcome.first) +
                                " bytes free, need " + to_string(freeSpace) +
                                " " + FormatPath(absolutePath));
  }
  return make_pair(true, string());
}

// --------------------------------------------------------------------------
bool IsRootDirectory(const string &path) { return path == "/"; }

// --------------------------------------------------------------------------
string AppendPathDelim(const string &path) {
  string cpy(path);
  if (cpy.empty() || cpy[cpy.size() - 1] != PATH_DELIM) {
    cpy.append(1, PATH_DELIM);
  }
  return cpy;
}

// --------------------------------------------------------------------------
string GetDirName(const string &path) {
  if (IsRootDirectory(path)) {
    return path;
  }

  char *cpy = strdup(path.c_str());
  string ret = AppendPathDelim(dirname(cpy));
  free(cpy);
  return ret;
}

// --------------------------------------------------------------------------
string GetBaseName(const string &path) {
  char *cpy = strdup(path.c_str());
  string ret(basename(cpy));
  free(cpy);
  return ret;
}

// --------------------------------------------------------------------------
uid_t GetProcessEffectiveUserID() {
  static uid_t uid = geteuid();
  return uid;
}

// --------------------------------------------------------------------------
gid_t GetProcessEffectiveGroupID() {
  static gid_t gid = getegid();
  return gid;
}

}  // namespace Utils
}  // namespace QSM

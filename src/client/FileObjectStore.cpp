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

#include "client/FileObjectStore.h"

#include <errno.h>
#include <fcntl.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <string>
#include <utility>
#include <vector>

#include "boost/exception/to_string.hpp"
#include "boost/foreach.hpp"
#include "boost/scope_exit.hpp"

#include "base/Exception.h"
#include "base/HashUtils.h"
#include "base/LogMacros.h"
#include "base/Size.h"
#include "base/StringUtils.h"
#include "base/Utils.h"
#include "configure/Default.h"

namespace QSM {

namespace Client {

using boost::to_string;
using QSM::Configure::Default::GetDefineFileMode;
using QSM::Exception::QSMException;
using QSM::StringUtils::FormatKey;
using QSM::StringUtils::FormatPath;
using QSM::StringUtils::FormatRange;
using QSM::Utils::AppendPathDelim;
using QSM::Utils::CreateDirectoryIfNotExists;
using QSM::Utils::DeleteFilesInDirectory;
using QSM::Utils::GetDirName;
using QSM::Utils::IsDirectory;
using std::pair;
using std::string;
using std::vector;

namespace {

const char *const SESSION_DIR_PREFIX = ".qsmove-upload-";

// --------------------------------------------------------------------------
StoreError::Value ErrnoToStoreError(int errorCode) {
  switch (errorCode) {
    case ENOENT:
    case ENOTDIR:
      return StoreError::NOT_FOUND;
    case EACCES:
    case EPERM:
      return StoreError::ACCESS_DENIED;
    default:
      return StoreError::IO_ERROR;
  }
}

// --------------------------------------------------------------------------
ClientError<StoreError::Value> BuildErrnoError(int errorCode,
                                               const string &exceptionName,
                                               const string &path) {
  return ClientError<StoreError::Value>(
      ErrnoToStoreError(errorCode), exceptionName,
      string(strerror(errorCode)) + " " + FormatPath(path), false);
}

// --------------------------------------------------------------------------
bool IsValidKey(const string &key) {
  if (key.empty() || key[0] == '/' || key[key.size() - 1] == '/') {
    return false;
  }
  return key != ".." && key.find("../") == string::npos &&
         key.find("/..") == string::npos;
}

// --------------------------------------------------------------------------
ClientError<StoreError::Value> InvalidKeyError(const string &exceptionName,
                                               const string &key) {
  return ClientError<StoreError::Value>(StoreError::INVALID_PARAMETER,
                                        exceptionName,
                                        "Invalid key " + FormatKey(key), false);
}

// --------------------------------------------------------------------------
string BuildPartPath(const string &sessionDir, int partNumber) {
  return AppendPathDelim(sessionDir) + "part-" + to_string(partNumber);
}

// --------------------------------------------------------------------------
// Write all of data to fd
bool WriteAll(int fd, const char *data, size_t len) {
  size_t written = 0;
  while (written < len) {
    ssize_t n = write(fd, data + written, len - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    written += static_cast<size_t>(n);
  }
  return true;
}

// --------------------------------------------------------------------------
// Append content of file at path to fd
bool AppendFile(int fd, const string &path, vector<char> *block) {
  int in = open(path.c_str(), O_RDONLY);
  if (in == -1) {
    return false;
  }
  bool success = true;
  while (true) {
    ssize_t n = read(in, &(*block)[0], block->size());
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      success = false;
      break;
    }
    if (n == 0) {
      break;
    }
    if (!WriteAll(fd, &(*block)[0], static_cast<size_t>(n))) {
      success = false;
      break;
    }
  }
  int savedErrno = errno;
  close(in);
  errno = savedErrno;
  return success;
}

}  // namespace

// --------------------------------------------------------------------------
FileObjectSource::FileObjectSource(const string &rootDirectory)
    : m_rootDirectory(AppendPathDelim(rootDirectory)) {}

// --------------------------------------------------------------------------
ClientError<StoreError::Value> FileObjectSource::GetSize(const string &key,
                                                         uint64_t *size) {
  string exceptionName = "FileGetSize " + FormatKey(key);
  if (!IsValidKey(key)) {
    return InvalidKeyError(exceptionName, key);
  }
  string path = m_rootDirectory + key;
  struct stat st;
  if (stat(path.c_str(), &st) != 0) {
    return BuildErrnoError(errno, exceptionName, path);
  }
  if (!S_ISREG(st.st_mode)) {
    return ClientError<StoreError::Value>(
        StoreError::INVALID_PARAMETER, exceptionName,
        "Not a regular file " + FormatPath(path), false);
  }
  if (size != NULL) {
    *size = static_cast<uint64_t>(st.st_size);
  }
  return StoreErrorGood();
}

// --------------------------------------------------------------------------
ClientError<StoreError::Value> FileObjectSource::ReadRange(const string &key,
                                                           uint64_t start,
                                                           uint64_t stop,
                                                           char *buffer,
                                                           size_t *bytesRead) {
  string exceptionName = "FileReadRange " + FormatKey(key);
  if (!IsValidKey(key)) {
    return InvalidKeyError(exceptionName, key);
  }
  if (buffer == NULL || stop < start) {
    return ClientError<StoreError::Value>(
        StoreError::INVALID_PARAMETER, exceptionName,
        "Null buffer or invalid range " + FormatRange(start, stop), false);
  }

  string path = m_rootDirectory + key;
  int fd = open(path.c_str(), O_RDONLY);
  if (fd == -1) {
    return BuildErrnoError(errno, exceptionName, path);
  }
  BOOST_SCOPE_EXIT((fd)) { close(fd); }
  BOOST_SCOPE_EXIT_END

  size_t len = static_cast<size_t>(stop - start + 1);
  size_t count = 0;
  while (count < len) {
    ssize_t n = pread(fd, buffer + count, len - count,
                      static_cast<off_t>(start + count));
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (bytesRead != NULL) {
        *bytesRead = count;
      }
      return BuildErrnoError(errno, exceptionName, path);
    }
    if (n == 0) {
      break;  // eof
    }
    count += static_cast<size_t>(n);
  }

  if (bytesRead != NULL) {
    *bytesRead = count;
  }
  if (count != len) {
    return ClientError<StoreError::Value>(
        StoreError::SHORT_READ, exceptionName,
        "Expect " + to_string(len) + " bytes but got " + to_string(count) +
            " " + FormatRange(start, stop),
        false);
  }
  return StoreErrorGood();
}

// --------------------------------------------------------------------------
string FileObjectSource::GetName() const { return "file://" + m_rootDirectory; }

// --------------------------------------------------------------------------
FileObjectSink::FileObjectSink(const string &rootDirectory)
    : m_rootDirectory(AppendPathDelim(rootDirectory)) {}

// --------------------------------------------------------------------------
string FileObjectSink::GetSessionDirectory(const string &sessionId) const {
  return m_rootDirectory + sessionId;
}

// --------------------------------------------------------------------------
ClientError<StoreError::Value> FileObjectSink::BeginMultipartSession(
    const string &key, string *sessionId) {
  string exceptionName = "FileBeginMultipartSession " + FormatKey(key);
  if (!IsValidKey(key)) {
    return InvalidKeyError(exceptionName, key);
  }
  if (!CreateDirectoryIfNotExists(m_rootDirectory)) {
    return BuildErrnoError(errno, exceptionName, m_rootDirectory);
  }

  string templ = m_rootDirectory + SESSION_DIR_PREFIX + "XXXXXX";
  vector<char> buf(templ.begin(), templ.end());
  buf.push_back('\0');
  if (mkdtemp(&buf[0]) == NULL) {
    return BuildErrnoError(errno, exceptionName, templ);
  }
  string dir(&buf[0]);
  if (sessionId != NULL) {
    *sessionId = dir.substr(m_rootDirectory.size());
  }
  DebugInfo("Open session directory " << FormatPath(dir));
  return StoreErrorGood();
}

// --------------------------------------------------------------------------
ClientError<StoreError::Value> FileObjectSink::UploadPart(
    const string &key, const string &sessionId, int partNumber,
    const char *data, size_t len, string *contentIdentifier) {
  string exceptionName = "FileUploadPart " + FormatKey(key) + " [part=" +
                         to_string(partNumber) + "]";
  if (sessionId.empty() || partNumber < 1 || (data == NULL && len > 0)) {
    return ClientError<StoreError::Value>(
        StoreError::INVALID_PARAMETER, exceptionName,
        "Empty session id or invalid part", false);
  }
  string dir = GetSessionDirectory(sessionId);
  if (!IsDirectory(dir).first) {
    return ClientError<StoreError::Value>(
        StoreError::NO_SUCH_UPLOAD, exceptionName,
        "No such session " + FormatPath(dir), false);
  }

  string path = BuildPartPath(dir, partNumber);
  int fd =
      open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, GetDefineFileMode());
  if (fd == -1) {
    return BuildErrnoError(errno, exceptionName, path);
  }
  bool success = WriteAll(fd, data, len);
  int writeErrno = errno;
  if (close(fd) != 0 && success) {
    success = false;
    writeErrno = errno;
  }
  if (!success) {
    return BuildErrnoError(writeErrno, exceptionName, path);
  }

  if (contentIdentifier != NULL) {
    try {
      HashUtils::MD5Digest digest;
      digest.Update(data, len);
      *contentIdentifier = digest.HexDigest();
    } catch (const QSMException &err) {
      return ClientError<StoreError::Value>(StoreError::IO_ERROR,
                                            exceptionName, err.get(), false);
    }
  }
  return StoreErrorGood();
}

// --------------------------------------------------------------------------
ClientError<StoreError::Value> FileObjectSink::CompleteSession(
    const string &key, const string &sessionId,
    const vector<UploadedPart> &sortedParts) {
  string exceptionName = "FileCompleteSession " + FormatKey(key);
  if (!IsValidKey(key)) {
    return InvalidKeyError(exceptionName, key);
  }
  string dir = GetSessionDirectory(sessionId);
  if (sessionId.empty() || !IsDirectory(dir).first) {
    return ClientError<StoreError::Value>(
        StoreError::NO_SUCH_UPLOAD, exceptionName,
        "No such session " + FormatPath(dir), false);
  }

  string assembled = AppendPathDelim(dir) + "object";
  int fd = open(assembled.c_str(), O_WRONLY | O_CREAT | O_TRUNC,
                GetDefineFileMode());
  if (fd == -1) {
    return BuildErrnoError(errno, exceptionName, assembled);
  }

  vector<char> block(Size::KB64);
  BOOST_FOREACH(const UploadedPart &part, sortedParts) {
    string partPath = BuildPartPath(dir, part.m_partNumber);
    if (!AppendFile(fd, partPath, &block)) {
      int err = errno;
      close(fd);
      return BuildErrnoError(err, exceptionName, partPath);
    }
  }
  if (close(fd) != 0) {
    return BuildErrnoError(errno, exceptionName, assembled);
  }

  string target = m_rootDirectory + key;
  if (!CreateDirectoryIfNotExists(GetDirName(target))) {
    return BuildErrnoError(errno, exceptionName, GetDirName(target));
  }
  if (rename(assembled.c_str(), target.c_str()) != 0) {
    return BuildErrnoError(errno, exceptionName, target);
  }

  pair<bool, string> outcome = DeleteFilesInDirectory(dir, true);
  WarningIf(!outcome.first, "Fail to clean session directory "
                                << FormatPath(dir) << ": " << outcome.second);
  return StoreErrorGood();
}

// --------------------------------------------------------------------------
ClientError<StoreError::Value> FileObjectSink::AbortSession(
    const string &key, const string &sessionId) {
  string exceptionName = "FileAbortSession " + FormatKey(key);
  string dir = GetSessionDirectory(sessionId);
  if (sessionId.empty() || !IsDirectory(dir).first) {
    return ClientError<StoreError::Value>(
        StoreError::NO_SUCH_UPLOAD, exceptionName,
        "No such session " + FormatPath(dir), false);
  }
  pair<bool, string> outcome = DeleteFilesInDirectory(dir, true);
  if (!outcome.first) {
    return ClientError<StoreError::Value>(StoreError::IO_ERROR, exceptionName,
                                          outcome.second, false);
  }
  return StoreErrorGood();
}

// --------------------------------------------------------------------------
ClientError<StoreError::Value> FileObjectSink::HeadObject(const string &key,
                                                          ObjectInfo *info) {
  string exceptionName = "FileHeadObject " + FormatKey(key);
  if (!IsValidKey(key)) {
    return InvalidKeyError(exceptionName, key);
  }
  string path = m_rootDirectory + key;
  struct stat st;
  if (stat(path.c_str(), &st) != 0) {
    return BuildErrnoError(errno, exceptionName, path);
  }
  if (info == NULL) {
    return StoreErrorGood();
  }
  info->m_size = static_cast<uint64_t>(st.st_size);
  pair<bool, string> outcome = HashUtils::ComputeFileMD5(
      path, &info->m_digest, QSM::Configure::Default::GetDigestBlockSize());
  if (!outcome.first) {
    return ClientError<StoreError::Value>(StoreError::IO_ERROR, exceptionName,
                                          outcome.second, false);
  }
  return StoreErrorGood();
}

// --------------------------------------------------------------------------
string FileObjectSink::GetName() const { return "file://" + m_rootDirectory; }

}  // namespace Client
}  // namespace QSM

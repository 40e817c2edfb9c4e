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

#include "data/StagingBuffer.h"

#include <errno.h>
#include <stdlib.h>
#include <string.h>
#include <sys/types.h>
#include <unistd.h>

#include <string>
#include <vector>

#include "boost/exception/to_string.hpp"

#include "base/LogMacros.h"
#include "base/StringUtils.h"
#include "base/Utils.h"
#include "transfer/TransferError.h"

namespace QSM {

namespace Data {

using boost::to_string;
using QSM::StringUtils::FormatPath;
using QSM::StringUtils::FormatRange;
using QSM::Transfer::StagingReadError;
using QSM::Transfer::StagingWriteError;
using std::string;
using std::vector;

namespace {

string PostErrMsg(const string &path) {
  return string(strerror(errno)) + " " + FormatPath(path);
}

}  // namespace

// --------------------------------------------------------------------------
StagingBuffer::StagingBuffer(const string &directory, uint64_t size)
    : m_size(size), m_fd(-1) {
  string templ = QSM::Utils::AppendPathDelim(directory) + "qsmove-XXXXXX";
  vector<char> buf(templ.begin(), templ.end());
  buf.push_back('\0');
  int fd = mkstemp(&buf[0]);
  if (fd == -1) {
    throw StagingWriteError("Unable to create staging file " +
                            PostErrMsg(templ));
  }
  m_path = string(&buf[0]);
  m_fd = fd;

  if (ftruncate(m_fd, static_cast<off_t>(size)) != 0) {
    string msg = "Unable to size staging file to " + to_string(size) +
                 " bytes " + PostErrMsg(m_path);
    Release();
    throw StagingWriteError(msg);
  }
  Info("Create staging file " << FormatPath(m_path) << " of " << size
                              << " bytes");
}

// --------------------------------------------------------------------------
StagingBuffer::~StagingBuffer() { Release(); }

// --------------------------------------------------------------------------
void StagingBuffer::CheckRange(uint64_t offset, size_t len,
                               bool forWrite) const {
  string msg;
  if (m_fd == -1) {
    msg = "Staging file is released " + FormatPath(m_path);
  } else if (offset > m_size || len > m_size - offset) {
    msg = "Range " + FormatRange(offset, offset + len - 1) +
          " is out of staging file size " + to_string(m_size);
  }
  if (msg.empty()) {
    return;
  }
  if (forWrite) {
    throw StagingWriteError(msg);
  } else {
    throw StagingReadError(msg);
  }
}

// --------------------------------------------------------------------------
void StagingBuffer::Write(uint64_t offset, const char *data, size_t len) {
  CheckRange(offset, len, true);
  size_t written = 0;
  while (written < len) {
    ssize_t n = pwrite(m_fd, data + written, len - written,
                       static_cast<off_t>(offset + written));
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw StagingWriteError(
          "Unable to write " + FormatRange(offset, offset + len - 1) + " " +
          PostErrMsg(m_path));
    }
    written += static_cast<size_t>(n);
  }
}

// --------------------------------------------------------------------------
void StagingBuffer::Read(uint64_t offset, char *buffer, size_t len) const {
  CheckRange(offset, len, false);
  size_t count = 0;
  while (count < len) {
    ssize_t n = pread(m_fd, buffer + count, len - count,
                      static_cast<off_t>(offset + count));
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw StagingReadError(
          "Unable to read " + FormatRange(offset, offset + len - 1) + " " +
          PostErrMsg(m_path));
    }
    if (n == 0) {
      throw StagingReadError("Unexpected end of staging file at " +
                             to_string(offset + count) + " " +
                             FormatPath(m_path));
    }
    count += static_cast<size_t>(n);
  }
}

// --------------------------------------------------------------------------
void StagingBuffer::Release() {
  if (m_fd == -1) {
    return;
  }
  close(m_fd);
  m_fd = -1;
  if (QSM::Utils::RemoveFileIfExists(m_path)) {
    Info("Remove staging file " << FormatPath(m_path));
  } else {
    Warning("Unable to remove staging file " << PostErrMsg(m_path));
  }
}

}  // namespace Data
}  // namespace QSM

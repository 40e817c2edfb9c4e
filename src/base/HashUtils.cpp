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

#include "base/HashUtils.h"

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <unistd.h>

#include <iomanip>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "openssl/err.h"
#include "openssl/evp.h"

#include "base/Exception.h"

namespace QSM {

namespace HashUtils {

using QSM::Exception::QSMException;
using std::make_pair;
using std::pair;
using std::string;
using std::vector;

namespace {

// --------------------------------------------------------------------------
string GetOpenSSLErrorString() {
  unsigned long code = ERR_get_error();  // NOLINT
  char buf[256];
  ERR_error_string_n(code, buf, sizeof(buf));
  return string(buf);
}

}  // namespace

// --------------------------------------------------------------------------
MD5Digest::MD5Digest() : m_context(EVP_MD_CTX_new()), m_finished(false) {
  if (m_context == NULL) {
    throw QSMException("Unable to allocate md5 digest context");
  }
  if (EVP_DigestInit_ex(m_context, EVP_md5(), NULL) == 0) {
    EVP_MD_CTX_free(m_context);
    m_context = NULL;
    throw QSMException("Failed to initialize md5 digest: " +
                       GetOpenSSLErrorString());
  }
}

// --------------------------------------------------------------------------
MD5Digest::~MD5Digest() {
  if (m_context != NULL) {
    EVP_MD_CTX_free(m_context);
    m_context = NULL;
  }
}

// --------------------------------------------------------------------------
void MD5Digest::Update(const char *data, size_t len) {
  if (m_finished) {
    throw QSMException("Unable to update a finished md5 digest");
  }
  if (len == 0) {
    return;
  }
  if (EVP_DigestUpdate(m_context, data, len) == 0) {
    throw QSMException("Failed to update md5 digest: " +
                       GetOpenSSLErrorString());
  }
}

// --------------------------------------------------------------------------
string MD5Digest::HexDigest() {
  if (m_finished) {
    throw QSMException("Md5 digest is already finished");
  }
  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int mdLen = 0;
  if (EVP_DigestFinal_ex(m_context, md, &mdLen) == 0) {
    throw QSMException("Failed to finalize md5 digest: " +
                       GetOpenSSLErrorString());
  }
  m_finished = true;

  std::ostringstream ss;
  for (unsigned int i = 0; i < mdLen; ++i) {
    ss << std::setfill('0') << std::setw(2) << std::hex
       << static_cast<int>(md[i]);
  }
  return ss.str();
}

// --------------------------------------------------------------------------
pair<bool, string> ComputeFileMD5(const string &path, string *hexDigest,
                                  size_t blockSize) {
  if (blockSize == 0) {
    return make_pair(false, "Invalid digest block size 0");
  }
  int fd = open(path.c_str(), O_RDONLY);
  if (fd == -1) {
    return make_pair(false, "Unable to open file " + path + ": " +
                                strerror(errno));
  }

  vector<char> block(blockSize);
  pair<bool, string> res = make_pair(true, string());
  try {
    MD5Digest digest;
    while (true) {
      ssize_t n = read(fd, &block[0], blockSize);
      if (n < 0) {
        if (errno == EINTR) {
          continue;
        }
        res = make_pair(false, "Unable to read file " + path + ": " +
                                   strerror(errno));
        break;
      }
      if (n == 0) {
        break;
      }
      digest.Update(&block[0], static_cast<size_t>(n));
    }
    if (res.first && hexDigest != NULL) {
      *hexDigest = digest.HexDigest();
    }
  } catch (const QSMException &err) {
    res = make_pair(false, err.get());
  }
  close(fd);
  return res;
}

// --------------------------------------------------------------------------
bool IsHexDigest(const string &str) {
  return !str.empty() &&
         str.find_first_not_of("0123456789abcdefABCDEF") == string::npos;
}

}  // namespace HashUtils
}  // namespace QSM

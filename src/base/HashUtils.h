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

#ifndef QSMOVE_BASE_HASHUTILS_H_
#define QSMOVE_BASE_HASHUTILS_H_

#include <stddef.h>

#include <string>
#include <utility>

#include "boost/noncopyable.hpp"

#include "base/Size.h"

// forward declaration
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace QSM {

namespace HashUtils {

/**
 * Incremental MD5 digest over openssl EVP.
 *
 * Throws QSMException if openssl fails to initialize or update the digest.
 */
class MD5Digest : private boost::noncopyable {
 public:
  MD5Digest();
  ~MD5Digest();

 public:
  void Update(const char *data, size_t len);

  // Finish the digest and return it as lower case hex string.
  // No more updates are allowed after this.
  std::string HexDigest();

 private:
  EVP_MD_CTX *m_context;
  bool m_finished;
};

// Compute md5 of a whole file
//
// @param  : file path, hex digest(output), size of each read block
// @return : {true, ""} if success, {false, message} otherwise
std::pair<bool, std::string> ComputeFileMD5(const std::string &path,
                                            std::string *hexDigest,
                                            size_t blockSize = Size::KB8);

// Return true if str consists of hex digits only
bool IsHexDigest(const std::string &str);

}  // namespace HashUtils
}  // namespace QSM

#endif  // QSMOVE_BASE_HASHUTILS_H_

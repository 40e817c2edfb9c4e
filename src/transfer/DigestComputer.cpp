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

#include "transfer/DigestComputer.h"

#include <stddef.h>
#include <stdint.h>

#include <algorithm>
#include <string>
#include <vector>

#include "base/Exception.h"
#include "base/HashUtils.h"
#include "data/StagingBuffer.h"
#include "transfer/TransferError.h"

namespace QSM {

namespace Transfer {

using QSM::Data::StagingBuffer;
using QSM::Exception::QSMException;
using QSM::HashUtils::MD5Digest;
using std::string;
using std::vector;

// --------------------------------------------------------------------------
string ComputeDigest(const StagingBuffer &buffer, size_t blockSize) {
  if (blockSize == 0) {
    throw ConfigurationError("Digest block size must be positive");
  }
  try {
    MD5Digest digest;
    vector<char> block(blockSize);
    uint64_t offset = 0;
    uint64_t size = buffer.GetSize();
    while (offset < size) {
      size_t len = static_cast<size_t>(
          std::min(static_cast<uint64_t>(blockSize), size - offset));
      buffer.Read(offset, &block[0], len);
      digest.Update(&block[0], len);
      offset += len;
    }
    return digest.HexDigest();
  } catch (const TransferException &) {
    throw;
  } catch (const QSMException &err) {
    throw UnexpectedError("Fail to compute digest: " + err.get());
  }
}

}  // namespace Transfer
}  // namespace QSM

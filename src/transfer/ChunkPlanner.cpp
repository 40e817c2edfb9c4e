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

#include "transfer/ChunkPlanner.h"

#include <stddef.h>
#include <stdint.h>

#include <algorithm>
#include <vector>

#include "transfer/TransferError.h"

namespace QSM {

namespace Transfer {

using std::vector;

// --------------------------------------------------------------------------
size_t GetChunkCount(uint64_t size, uint64_t chunkSize) {
  if (chunkSize == 0) {
    throw ConfigurationError("Chunk size must be positive");
  }
  return static_cast<size_t>(size / chunkSize + (size % chunkSize > 0 ? 1 : 0));
}

// --------------------------------------------------------------------------
vector<ChunkRange> PlanChunks(uint64_t size, uint64_t chunkSize) {
  size_t count = GetChunkCount(size, chunkSize);
  vector<ChunkRange> chunks;
  chunks.reserve(count);
  uint64_t start = 0;
  for (size_t i = 0; i < count; ++i) {
    uint64_t len = std::min(chunkSize, size - start);
    chunks.push_back(ChunkRange(i, start, start + len - 1));
    start += len;
  }
  return chunks;
}

}  // namespace Transfer
}  // namespace QSM

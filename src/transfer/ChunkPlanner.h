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

#ifndef QSMOVE_TRANSFER_CHUNKPLANNER_H_
#define QSMOVE_TRANSFER_CHUNKPLANNER_H_

#include <stddef.h>
#include <stdint.h>

#include <vector>

namespace QSM {

namespace Transfer {

// Closed byte range [m_start, m_stop] of an object
struct ChunkRange {
  size_t m_index;  // 0 based
  uint64_t m_start;
  uint64_t m_stop;

  ChunkRange() : m_index(0), m_start(0), m_stop(0) {}
  ChunkRange(size_t index, uint64_t start, uint64_t stop)
      : m_index(index), m_start(start), m_stop(stop) {}

  uint64_t GetSize() const { return m_stop - m_start + 1; }
};

inline bool operator==(const ChunkRange &lhs, const ChunkRange &rhs) {
  return lhs.m_index == rhs.m_index && lhs.m_start == rhs.m_start &&
         lhs.m_stop == rhs.m_stop;
}

// Number of chunks of an object, ceil(size / chunkSize)
//
// @param  : object size, chunk size
// @return : chunk count
//
// Throw ConfigurationError if chunk size is 0
size_t GetChunkCount(uint64_t size, uint64_t chunkSize);

// Split [0, size) into ordered contiguous chunks
//
// @param  : object size, chunk size
// @return : chunks in ascending offset order, empty if size is 0
//
// Throw ConfigurationError if chunk size is 0
std::vector<ChunkRange> PlanChunks(uint64_t size, uint64_t chunkSize);

}  // namespace Transfer
}  // namespace QSM

#endif  // QSMOVE_TRANSFER_CHUNKPLANNER_H_

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

#ifndef QSMOVE_DATA_STAGINGBUFFER_H_
#define QSMOVE_DATA_STAGINGBUFFER_H_

#include <stddef.h>
#include <stdint.h>

#include <string>

#include "boost/noncopyable.hpp"

namespace QSM {

namespace Data {

/**
 * Local pre-sized staging file of an object.
 *
 * The file is created with exactly the object size before any write.
 * Writes and reads address the file by offset with pwrite/pread, so
 * concurrent writers of disjoint ranges need no synchronization.
 *
 * The file is removed when the buffer is released or destroyed.
 *
 * Write failures throw StagingWriteError, read failures throw
 * StagingReadError.
 */
class StagingBuffer : private boost::noncopyable {
 public:
  // Create staging file in directory
  //
  // @param  : staging directory, size in bytes
  StagingBuffer(const std::string &directory, uint64_t size);

  ~StagingBuffer();

 public:
  // Write len bytes of data at offset
  void Write(uint64_t offset, const char *data, size_t len);

  // Read exactly len bytes at offset into buffer
  void Read(uint64_t offset, char *buffer, size_t len) const;

  // Close and remove the staging file, safe to call more than once
  void Release();

  bool IsReleased() const { return m_fd == -1; }
  const std::string &GetPath() const { return m_path; }
  uint64_t GetSize() const { return m_size; }

 private:
  void CheckRange(uint64_t offset, size_t len, bool forWrite) const;

  std::string m_path;
  uint64_t m_size;
  int m_fd;
};

}  // namespace Data
}  // namespace QSM

#endif  // QSMOVE_DATA_STAGINGBUFFER_H_

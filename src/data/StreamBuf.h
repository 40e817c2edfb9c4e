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

#ifndef QSMOVE_DATA_STREAMBUF_H_
#define QSMOVE_DATA_STREAMBUF_H_

#include <stddef.h>  // for size_t

#include <streambuf>  // NOLINT

#include "boost/noncopyable.hpp"

namespace QSM {

namespace Data {

/**
 * A stream buf over memory owned by somebody else, to use with std::iostream.
 *
 * The memory must outlive the stream buf. Stream sees the first
 * lengthToUse bytes of it.
 */
class StreamBuf : public std::streambuf, private boost::noncopyable {
 public:
  StreamBuf(char *data, size_t lengthToUse);

  ~StreamBuf() {}

  size_t GetLength() const { return m_length; }

 protected:
  pos_type seekoff(off_type off, std::ios_base::seekdir dir,
                   std::ios_base::openmode which = std::ios_base::in |
                                                   std::ios_base::out);
  pos_type seekpos(pos_type pos,
                   std::ios_base::openmode which = std::ios_base::in |
                                                   std::ios_base::out);

 private:
  char *begin() { return m_data; }
  char *end() { return m_data + m_length; }

 private:
  char *m_data;
  size_t m_length;

  friend class StreamBufTest;
};

}  // namespace Data
}  // namespace QSM

#endif  // QSMOVE_DATA_STREAMBUF_H_

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

#ifndef QSMOVE_TRANSFER_DIGESTCOMPUTER_H_
#define QSMOVE_TRANSFER_DIGESTCOMPUTER_H_

#include <stddef.h>

#include <string>

namespace QSM {

namespace Data {
class StagingBuffer;
}  // namespace Data

namespace Transfer {

// Stream the staging buffer once and compute its md5
//
// @param  : staging buffer, read block size
// @return : lower case hex digest
//
// Throw StagingReadError if staging buffer can not be read
std::string ComputeDigest(const QSM::Data::StagingBuffer &buffer,
                          size_t blockSize);

}  // namespace Transfer
}  // namespace QSM

#endif  // QSMOVE_TRANSFER_DIGESTCOMPUTER_H_

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

#ifndef QSMOVE_TRANSFER_UPLOADSESSION_H_
#define QSMOVE_TRANSFER_UPLOADSESSION_H_

#include <stddef.h>

#include <string>
#include <utility>
#include <vector>

#include "client/ObjectStore.h"

namespace QSM {

namespace Transfer {

//
// Parts collected for one multipart upload session
//
// Only the collecting thread touches a session, workers hand their parts
// back as results.
//
class UploadSession {
 public:
  UploadSession(const std::string &sessionId, const std::string &key)
      : m_sessionId(sessionId), m_key(key) {}

 public:
  const std::string &GetSessionId() const { return m_sessionId; }
  const std::string &GetKey() const { return m_key; }
  size_t GetPartCount() const { return m_parts.size(); }

  void AddPart(const QSM::Client::UploadedPart &part);

  // Parts sorted by part number
  std::vector<QSM::Client::UploadedPart> GetSortedParts() const;

  // Check the sorted parts are exactly 1..expectedCount
  //
  // @param  : expected part count
  // @return : {true, ""} if complete, {false, message} otherwise
  std::pair<bool, std::string> ValidateParts(size_t expectedCount) const;

 private:
  std::string m_sessionId;
  std::string m_key;
  std::vector<QSM::Client::UploadedPart> m_parts;
};

}  // namespace Transfer
}  // namespace QSM

#endif  // QSMOVE_TRANSFER_UPLOADSESSION_H_

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

#include "transfer/UploadSession.h"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include "boost/exception/to_string.hpp"

namespace QSM {

namespace Transfer {

using boost::to_string;
using QSM::Client::UploadedPart;
using std::make_pair;
using std::pair;
using std::string;
using std::vector;

// --------------------------------------------------------------------------
void UploadSession::AddPart(const UploadedPart &part) {
  m_parts.push_back(part);
}

// --------------------------------------------------------------------------
vector<UploadedPart> UploadSession::GetSortedParts() const {
  vector<UploadedPart> parts(m_parts);
  std::stable_sort(parts.begin(), parts.end());
  return parts;
}

// --------------------------------------------------------------------------
pair<bool, string> UploadSession::ValidateParts(size_t expectedCount) const {
  if (m_parts.size() != expectedCount) {
    return make_pair(false, "Expect " + to_string(expectedCount) +
                                " parts but collected " +
                                to_string(m_parts.size()));
  }
  vector<UploadedPart> parts = GetSortedParts();
  for (size_t i = 0; i < parts.size(); ++i) {
    int expected = static_cast<int>(i + 1);
    if (parts[i].m_partNumber != expected) {
      return make_pair(false, "Missing part " + to_string(expected) +
                                  ", got part " +
                                  to_string(parts[i].m_partNumber));
    }
  }
  return make_pair(true, string());
}

}  // namespace Transfer
}  // namespace QSM

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

#include "base/StringUtils.h"

#include <stdint.h>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <string>

#include "boost/exception/to_string.hpp"
#include "boost/foreach.hpp"
#include "boost/lambda/lambda.hpp"

namespace QSM {

namespace StringUtils {

using boost::to_string;
using std::string;

// --------------------------------------------------------------------------
string ToLower(const string &str) {
  string copy(str);
  BOOST_FOREACH(char &ch, copy) { ch = std::tolower(ch); }
  return copy;
}

// --------------------------------------------------------------------------
string ToUpper(const string &str) {
  string copy(str);
  BOOST_FOREACH(char &ch, copy) { ch = std::toupper(ch); }
  return copy;
}

// --------------------------------------------------------------------------
string LTrim(const string &str, unsigned char ch) {
  using boost::lambda::_1;
  string copy(str);
  string::iterator pos = std::find_if(copy.begin(), copy.end(), ch != _1);
  copy.erase(copy.begin(), pos);
  return copy;
}

// --------------------------------------------------------------------------
string RTrim(const string &str, unsigned char ch) {
  using boost::lambda::_1;
  string copy(str);
  string::reverse_iterator rpos =
      std::find_if(copy.rbegin(), copy.rend(), ch != _1);
  copy.erase(rpos.base(), copy.end());
  return copy;
}

// --------------------------------------------------------------------------
string Trim(const string &str, unsigned char ch) {
  return LTrim(RTrim(str, ch), ch);
}

// --------------------------------------------------------------------------
string FormatPath(const string &path) { return "[path=" + path + "]"; }

// --------------------------------------------------------------------------
string FormatKey(const string &key) { return "[key=" + key + "]"; }

// --------------------------------------------------------------------------
string FormatRange(uint64_t start, uint64_t stop) {
  return "[range=" + to_string(start) + "-" + to_string(stop) + "]";
}

// --------------------------------------------------------------------------
string FormatProgress(size_t done, size_t total) {
  double percent =
      total == 0 ? 100.0 : static_cast<double>(done) * 100.0 / total;
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(2) << percent << "% (" << done << "/"
     << total << ")";
  return ss.str();
}

}  // namespace StringUtils
}  // namespace QSM

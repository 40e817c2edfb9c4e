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

#ifndef QSMOVE_BASE_STRINGUTILS_H_
#define QSMOVE_BASE_STRINGUTILS_H_

#include <stddef.h>
#include <stdint.h>

#include <string>

namespace QSM {

namespace StringUtils {

std::string ToLower(const std::string &str);
std::string ToUpper(const std::string &str);

std::string LTrim(const std::string &str, unsigned char c);
std::string RTrim(const std::string &str, unsigned char c);
std::string Trim(const std::string &str, unsigned char c);

// Format path as "[path=<path>]"
std::string FormatPath(const std::string &path);

// Format object key as "[key=<key>]"
std::string FormatKey(const std::string &key);

// Format a closed byte range as "[range=<start>-<stop>]"
std::string FormatRange(uint64_t start, uint64_t stop);

// Format progress as "NN.NN% (done/total)"
//
// @param  : number of finished units, number of total units
// @return : progress string, 100.00% when total is 0
std::string FormatProgress(size_t done, size_t total);

}  // namespace StringUtils
}  // namespace QSM


#endif  // QSMOVE_BASE_STRINGUTILS_H_

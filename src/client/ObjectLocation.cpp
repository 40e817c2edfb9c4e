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

#include "client/ObjectLocation.h"

#include <string>
#include <utility>

#include "boost/unordered_map.hpp"

#include "base/LogMacros.h"
#include "base/StringUtils.h"
#include "base/Utils.h"

namespace QSM {

namespace Client {

using boost::unordered_map;
using QSM::Utils::AppendPathDelim;
using QSM::Utils::GetBaseName;
using QSM::Utils::GetDirName;
using std::make_pair;
using std::pair;
using std::string;

static const char *const SCHEME_FILE = "file";
static const char *const SCHEME_QINGSTOR = "qs";
static const char *const SCHEME_NULL = "";
static const char *const SCHEME_DELIM = "://";

// --------------------------------------------------------------------------
string SchemeToString(Scheme::Value scheme) {
  switch (scheme) {
    case Scheme::File:
      return SCHEME_FILE;
    case Scheme::QingStor:
      return SCHEME_QINGSTOR;
    case Scheme::Null:
    default:
      return SCHEME_NULL;
  }
}

// --------------------------------------------------------------------------
Scheme::Value StringToScheme(const string &name) {
  static unordered_map<string, Scheme::Value> nameToSchemeMap;
  if (nameToSchemeMap.empty()) {
    nameToSchemeMap[SCHEME_FILE] = Scheme::File;
    nameToSchemeMap[SCHEME_QINGSTOR] = Scheme::QingStor;
  }

  unordered_map<string, Scheme::Value>::iterator it =
      nameToSchemeMap.find(StringUtils::ToLower(name));
  if (it == nameToSchemeMap.end()) {
    DebugWarning("Unrecognized scheme " << name << ", null returned");
    return Scheme::Null;
  }
  return it->second;
}

// --------------------------------------------------------------------------
bool ObjectLocation::IsContainer() const {
  return m_key.empty() || m_key[m_key.size() - 1] == '/';
}

// --------------------------------------------------------------------------
string ObjectLocation::ToString() const {
  if (m_scheme == Scheme::File) {
    return string(SCHEME_FILE) + SCHEME_DELIM + m_directory + m_key;
  } else if (m_scheme == Scheme::QingStor) {
    string zone = m_zone.empty() ? "" : "@" + m_zone;
    return string(SCHEME_QINGSTOR) + SCHEME_DELIM + m_bucket + zone + "/" +
           m_key;
  }
  return string();
}

// --------------------------------------------------------------------------
pair<bool, string> ParseObjectLocation(const string &str,
                                       ObjectLocation *location) {
  if (location == NULL) {
    return make_pair(false, "Null location output");
  }
  string::size_type pos = str.find(SCHEME_DELIM);
  if (pos == string::npos) {
    return make_pair(false, "Missing scheme in location " + str);
  }
  Scheme::Value scheme = StringToScheme(str.substr(0, pos));
  string rest = str.substr(pos + 3);

  ObjectLocation loc;
  loc.m_scheme = scheme;
  if (scheme == Scheme::File) {
    if (rest.empty() || rest[0] != '/') {
      return make_pair(false, "File location must be an absolute path " + str);
    }
    if (rest[rest.size() - 1] == '/') {
      loc.m_directory = rest;
    } else {
      loc.m_directory = GetDirName(rest);
      loc.m_key = GetBaseName(rest);
    }
  } else if (scheme == Scheme::QingStor) {
    string::size_type slash = rest.find('/');
    string bucketPart = rest.substr(0, slash);
    if (slash != string::npos) {
      loc.m_key = rest.substr(slash + 1);
    }
    string::size_type at = bucketPart.find('@');
    loc.m_bucket = bucketPart.substr(0, at);
    if (at != string::npos) {
      loc.m_zone = bucketPart.substr(at + 1);
      if (loc.m_zone.empty()) {
        return make_pair(false, "Empty zone in location " + str);
      }
    }
    if (loc.m_bucket.empty()) {
      return make_pair(false, "Missing bucket in location " + str);
    }
  } else {
    return make_pair(false, "Unsupported scheme in location " + str);
  }

  *location = loc;
  return make_pair(true, string());
}

// --------------------------------------------------------------------------
string ResolveDestinationKey(const string &sourceKey,
                             const ObjectLocation &destination) {
  if (!destination.IsContainer()) {
    return destination.m_key;
  }
  if (sourceKey.empty()) {
    return destination.m_key;
  }
  return destination.m_key + GetBaseName(sourceKey);
}

}  // namespace Client
}  // namespace QSM

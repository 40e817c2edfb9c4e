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

#ifndef QSMOVE_CLIENT_OBJECTLOCATION_H_
#define QSMOVE_CLIENT_OBJECTLOCATION_H_

#include <string>
#include <utility>

namespace QSM {

namespace Client {

struct Scheme {
  enum Value {
    Null,
    File,      // file:///absolute/path
    QingStor   // qs://bucket[@zone]/key
  };
};

std::string SchemeToString(Scheme::Value scheme);
Scheme::Value StringToScheme(const std::string &name);

//
// Where an object lives
//
// For file scheme, directory is the absolute directory ending with '/' and
// key is the file name under it.
// For qingstor scheme, key is the object key inside bucket. Zone is empty
// when not given in the location.
//
struct ObjectLocation {
  Scheme::Value m_scheme;
  std::string m_bucket;
  std::string m_zone;
  std::string m_directory;
  std::string m_key;

  ObjectLocation() : m_scheme(Scheme::Null) {}

  // Return true if the location names only a bucket or a directory
  bool IsContainer() const;

  std::string ToString() const;
};

// Parse location
//
// @param  : location string, location(output)
// @return : {true, ""} if success, {false, message} otherwise
std::pair<bool, std::string> ParseObjectLocation(const std::string &str,
                                                 ObjectLocation *location);

// Fill destination key with source key base name when destination is a
// container, a key prefix ending with '/' gets the base name appended.
//
// @param  : source key, destination location
// @return : destination key
std::string ResolveDestinationKey(const std::string &sourceKey,
                                  const ObjectLocation &destination);

}  // namespace Client
}  // namespace QSM

#endif  // QSMOVE_CLIENT_OBJECTLOCATION_H_

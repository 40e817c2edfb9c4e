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

#ifndef QSMOVE_CLIENT_OBJECTSTOREFACTORY_H_
#define QSMOVE_CLIENT_OBJECTSTOREFACTORY_H_

#include <string>

#include "boost/shared_ptr.hpp"

#include "client/ClientConfiguration.h"
#include "client/ObjectLocation.h"
#include "client/ObjectStore.h"

namespace QSM {

namespace Client {

class CredentialsProvider;

//
// Create object source or sink for a location
//
// Credentials are only loaded when a qingstor location is made, so local
// transfers need no credentials file.
//
class ObjectStoreFactory {
 public:
  ObjectStoreFactory(const ClientConfiguration &config,
                     const std::string &credentialsFile);
  ObjectStoreFactory(
      const ClientConfiguration &config,
      const boost::shared_ptr<CredentialsProvider> &credentialsProvider);

  ~ObjectStoreFactory() {}

 public:
  // Throw QSMException if location is not supported or credentials are
  // unavailable
  boost::shared_ptr<ObjectSource> MakeSource(const ObjectLocation &location);
  boost::shared_ptr<ObjectSink> MakeSink(const ObjectLocation &location);

 private:
  const CredentialsProvider &GetCredentialsProvider();

  ClientConfiguration m_config;
  std::string m_credentialsFile;
  boost::shared_ptr<CredentialsProvider> m_credentialsProvider;
};

}  // namespace Client
}  // namespace QSM

#endif  // QSMOVE_CLIENT_OBJECTSTOREFACTORY_H_

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

#include "client/ObjectStoreFactory.h"

#include <string>

#include "boost/make_shared.hpp"
#include "boost/shared_ptr.hpp"

#include "base/Exception.h"
#include "base/LogMacros.h"
#include "client/Credentials.h"
#include "client/FileObjectStore.h"
#include "client/QSBucketClient.h"
#include "client/QSObjectStore.h"

namespace QSM {

namespace Client {

using boost::make_shared;
using boost::shared_ptr;
using QSM::Exception::QSMException;
using std::string;

// --------------------------------------------------------------------------
ObjectStoreFactory::ObjectStoreFactory(const ClientConfiguration &config,
                                       const string &credentialsFile)
    : m_config(config), m_credentialsFile(credentialsFile) {}

// --------------------------------------------------------------------------
ObjectStoreFactory::ObjectStoreFactory(
    const ClientConfiguration &config,
    const shared_ptr<CredentialsProvider> &credentialsProvider)
    : m_config(config), m_credentialsProvider(credentialsProvider) {}

// --------------------------------------------------------------------------
const CredentialsProvider &ObjectStoreFactory::GetCredentialsProvider() {
  if (!m_credentialsProvider) {
    m_credentialsProvider =
        make_shared<DefaultCredentialsProvider>(m_credentialsFile);
  }
  return *m_credentialsProvider;
}

namespace {

// --------------------------------------------------------------------------
shared_ptr<QSBucketClient> MakeBucketClient(
    const ClientConfiguration &config, const CredentialsProvider &provider,
    const ObjectLocation &location) {
  string zone = location.m_zone.empty() ? config.GetZone() : location.m_zone;
  QSBucketClient::StartQSService(config);
  Info("Connecting to bucket " << location.m_bucket << " in zone " << zone);
  return make_shared<QSBucketClient>(
      config, provider.GetCredentials(location.m_bucket), location.m_bucket,
      zone);
}

}  // namespace

// --------------------------------------------------------------------------
shared_ptr<ObjectSource> ObjectStoreFactory::MakeSource(
    const ObjectLocation &location) {
  switch (location.m_scheme) {
    case Scheme::File:
      return make_shared<FileObjectSource>(location.m_directory);
    case Scheme::QingStor:
      return make_shared<QSObjectSource>(MakeBucketClient(
          m_config, GetCredentialsProvider(), location));
    case Scheme::Null:
    default:
      throw QSMException("Unsupported source location " + location.ToString());
  }
}

// --------------------------------------------------------------------------
shared_ptr<ObjectSink> ObjectStoreFactory::MakeSink(
    const ObjectLocation &location) {
  switch (location.m_scheme) {
    case Scheme::File:
      return make_shared<FileObjectSink>(location.m_directory);
    case Scheme::QingStor:
      return make_shared<QSObjectSink>(MakeBucketClient(
          m_config, GetCredentialsProvider(), location));
    case Scheme::Null:
    default:
      throw QSMException("Unsupported destination location " +
                         location.ToString());
  }
}

}  // namespace Client
}  // namespace QSM

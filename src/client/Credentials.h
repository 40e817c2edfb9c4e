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

#ifndef QSMOVE_CLIENT_CREDENTIALS_H_
#define QSMOVE_CLIENT_CREDENTIALS_H_

#include <string>
#include <utility>

#include "boost/unordered_map.hpp"

namespace QSM {

namespace Client {

typedef std::pair<std::string, std::string> KeyIdToKeyPair;
typedef boost::unordered_map<std::string, KeyIdToKeyPair> BucketToKeyPairMap;
typedef BucketToKeyPairMap::const_iterator BucketToKeyPairMapConstIterator;

class Credentials {
 public:
  Credentials() {}

  Credentials(const std::string &accessKeyId, const std::string &secretKey)
      : m_accessKeyId(accessKeyId), m_secretKey(secretKey) {}

  ~Credentials() {}

 public:
  const std::string &GetAccessKeyId() const { return m_accessKeyId; }
  const std::string &GetSecretKey() const { return m_secretKey; }

 private:
  std::string m_accessKeyId;
  std::string m_secretKey;
};

class CredentialsProvider {
 public:
  virtual ~CredentialsProvider() {}

  // Key pair for bucket, default key pair if bucket has no specific one
  virtual Credentials GetCredentials(const std::string &bucket) const = 0;
};

// For public bucket
class AnonymousCredentialsProvider : public CredentialsProvider {
 public:
  Credentials GetCredentials(const std::string &bucket) const {
    return Credentials(std::string(), std::string());
  }
};

class DefaultCredentialsProvider : public CredentialsProvider {
 public:
  DefaultCredentialsProvider(const std::string &accessKeyId,
                             const std::string &secretKey)
      : m_defaultAccessKeyId(accessKeyId), m_defaultSecretKey(secretKey) {}

  // Throw QSMException if credentials file is not usable
  explicit DefaultCredentialsProvider(const std::string &credentialsFile);

  // Throw QSMException if neither the bucket nor default key pair is found
  Credentials GetCredentials(const std::string &bucket) const;

  bool HasDefaultKey() const {
    return (!m_defaultAccessKeyId.empty()) && (!m_defaultSecretKey.empty());
  }

 private:
  // Read credentials file
  //
  // @param  : credentials file path
  // @return : a pair of {true, ""} or {false, message}
  //
  // Credentials file format: [bucket:]AccessKeyId:SecretKey
  // Support for per bucket credentials;
  // Set default key pair by not providing bucket name;
  // Only allow to have one default key pair, but not required to.
  //
  // Comment line is beginning with #;
  // Empty lines are ignored;
  // Uncommented lines without the ":" character are flaged as an error,
  // so are lines with space or tabs and lines starting with bracket "[".
  std::pair<bool, std::string> ReadCredentialsFile(const std::string &file);

 private:
  std::string m_credentialsFile;
  std::string m_defaultAccessKeyId;
  std::string m_defaultSecretKey;
  BucketToKeyPairMap m_bucketMap;

  friend class CredentialsTest;
};

}  // namespace Client
}  // namespace QSM

#endif  // QSMOVE_CLIENT_CREDENTIALS_H_

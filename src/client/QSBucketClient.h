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

#ifndef QSMOVE_CLIENT_QSBUCKETCLIENT_H_
#define QSMOVE_CLIENT_QSBUCKETCLIENT_H_

#include <string>

#include "boost/noncopyable.hpp"
#include "boost/scoped_ptr.hpp"

#include "qingstor/Bucket.h"
#include "qingstor/QsConfig.h"

#include "client/ClientConfiguration.h"
#include "client/ClientError.hpp"
#include "client/Credentials.h"
#include "client/Outcome.hpp"
#include "client/StoreError.h"

namespace QSM {

namespace Client {

typedef Outcome<QingStor::GetObjectOutput, ClientError<StoreError::Value> >
    GetObjectOutcome;
typedef Outcome<QingStor::HeadObjectOutput, ClientError<StoreError::Value> >
    HeadObjectOutcome;
typedef Outcome<QingStor::InitiateMultipartUploadOutput,
                ClientError<StoreError::Value> >
    InitiateMultipartUploadOutcome;
typedef Outcome<QingStor::UploadMultipartOutput,
                ClientError<StoreError::Value> >
    UploadMultipartOutcome;
typedef Outcome<QingStor::CompleteMultipartUploadOutput,
                ClientError<StoreError::Value> >
    CompleteMultipartUploadOutcome;
typedef Outcome<QingStor::AbortMultipartUploadOutput,
                ClientError<StoreError::Value> >
    AbortMultipartUploadOutcome;

//
// QSBucketClient
//
// Object level requests to one qingstor bucket, translating sdk responses
// into outcomes. StartQSService must be called once before creating any
// bucket client.
//
class QSBucketClient : private boost::noncopyable {
 public:
  QSBucketClient(const ClientConfiguration &config,
                 const Credentials &credentials, const std::string &bucket,
                 const std::string &zone);

  ~QSBucketClient() {}

 public:
  // Initialize qingstor sdk, one-time initialization
  static void StartQSService(const ClientConfiguration &config);
  static void CloseQSService();

  const std::string &GetBucketName() const { return m_bucketName; }
  const std::string &GetZone() const { return m_zone; }

  // Get object
  //
  // @param  : object key, input
  // @return : GetObjectOutcome
  //
  // If input has range, a successful response must be 206 (Partial Content)
  GetObjectOutcome GetObject(const std::string &objKey,
                             QingStor::GetObjectInput *input) const;

  HeadObjectOutcome HeadObject(const std::string &objKey,
                               QingStor::HeadObjectInput *input) const;

  InitiateMultipartUploadOutcome InitiateMultipartUpload(
      const std::string &objKey,
      QingStor::InitiateMultipartUploadInput *input) const;

  UploadMultipartOutcome UploadMultipart(
      const std::string &objKey, QingStor::UploadMultipartInput *input) const;

  CompleteMultipartUploadOutcome CompleteMultipartUpload(
      const std::string &objKey,
      QingStor::CompleteMultipartUploadInput *input) const;

  AbortMultipartUploadOutcome AbortMultipartUpload(
      const std::string &objKey,
      QingStor::AbortMultipartUploadInput *input) const;

 private:
  std::string m_bucketName;
  std::string m_zone;
  boost::scoped_ptr<QingStor::QsConfig> m_qsConfig;  // outlives m_bucket
  boost::scoped_ptr<QingStor::Bucket> m_bucket;
};

}  // namespace Client
}  // namespace QSM

#endif  // QSMOVE_CLIENT_QSBUCKETCLIENT_H_

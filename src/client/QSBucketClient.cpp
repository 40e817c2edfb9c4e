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

#include "client/QSBucketClient.h"

#include <string>

#include "boost/bind.hpp"
#include "boost/thread/once.hpp"

#include "qingstor/Bucket.h"
#include "qingstor/HttpCommon.h"
#include "qingstor/QingStor.h"
#include "qingstor/QsConfig.h"
#include "qingstor/QsErrors.h"  // for sdk QsError
#include "qingstor/QsSdkOption.h"
#include "qingstor/Types.h"  // for sdk QsOutput

#include "base/LogMacros.h"
#include "base/Utils.h"
#include "client/QSError.h"

namespace QSM {

namespace Client {

using QingStor::AbortMultipartUploadInput;
using QingStor::AbortMultipartUploadOutput;
using QingStor::Bucket;
using QingStor::CompleteMultipartUploadInput;
using QingStor::CompleteMultipartUploadOutput;
using QingStor::GetObjectInput;
using QingStor::GetObjectOutput;
using QingStor::HeadObjectInput;
using QingStor::HeadObjectOutput;
using QingStor::Http::HttpResponseCode;
using QingStor::InitiateMultipartUploadInput;
using QingStor::InitiateMultipartUploadOutput;
using QingStor::QsConfig;
using QingStor::UploadMultipartInput;
using QingStor::UploadMultipartOutput;
using std::string;

namespace {

QingStor::SDKOptions sdkOptions;
string sdkLogPath;
boost::once_flag startServiceOnce = BOOST_ONCE_INIT;
bool serviceStarted = false;

void DoStartQSService(const ClientConfiguration &config) {
  sdkLogPath = config.GetSDKLogDirectory();
  if (!QSM::Utils::CreateDirectoryIfNotExists(sdkLogPath)) {
    Warning("Unable to create sdk log directory " + sdkLogPath);
  }
  sdkOptions.logLevel = ::Warning;
  sdkOptions.logPath = sdkLogPath.c_str();
  QingStor::InitializeSDK(sdkOptions);
  serviceStarted = true;
}

ClientError<StoreError::Value> ParameterMissing(const string &exceptionName,
                                                const string &msg) {
  return ClientError<StoreError::Value>(StoreError::PARAMETER_MISSING,
                                        exceptionName, msg, false);
}

}  // namespace

// --------------------------------------------------------------------------
void QSBucketClient::StartQSService(const ClientConfiguration &config) {
  boost::call_once(startServiceOnce,
                   boost::bind(boost::type<void>(), DoStartQSService,
                               boost::cref(config)));
}

// --------------------------------------------------------------------------
void QSBucketClient::CloseQSService() {
  if (serviceStarted) {
    QingStor::ShutdownSDK(sdkOptions);
    serviceStarted = false;
  }
}

// --------------------------------------------------------------------------
QSBucketClient::QSBucketClient(const ClientConfiguration &config,
                               const Credentials &credentials,
                               const string &bucket, const string &zone)
    : m_bucketName(bucket), m_zone(zone.empty() ? config.GetZone() : zone) {
  m_qsConfig.reset(
      new QsConfig(credentials.GetAccessKeyId(), credentials.GetSecretKey()));
  m_qsConfig->additionalUserAgent = config.GetAdditionalAgent();
  m_qsConfig->host = config.GetHost();
  m_qsConfig->protocol = config.GetProtocol();
  m_qsConfig->port = config.GetPort();
  // chunk and part requests are retried by transfer engines
  m_qsConfig->connectionRetries = 0;
  m_qsConfig->timeOutPeriod = config.GetTransactionTimeDuration();

  m_bucket.reset(new Bucket(*m_qsConfig, m_bucketName, m_zone));
}

// --------------------------------------------------------------------------
GetObjectOutcome QSBucketClient::GetObject(const string &objKey,
                                           GetObjectInput *input) const {
  string exceptionName = "QingStorGetObject";
  if (objKey.empty()) {
    return GetObjectOutcome(ParameterMissing(exceptionName, "Empty ObjectKey"));
  }
  exceptionName.append(" object=" + objKey);
  if (input == NULL) {
    return GetObjectOutcome(
        ParameterMissing(exceptionName, "Null GetObjectInput"));
  }

  GetObjectOutput output;
  QsError sdkErr = m_bucket->GetObject(objKey, *input, output);

  HttpResponseCode responseCode = output.GetResponseCode();
  if (!SDKResponseSuccess(sdkErr, responseCode)) {
    return GetObjectOutcome(BuildStoreError(sdkErr, exceptionName, output));
  }
  if (!input->GetRange().empty() &&
      responseCode != QingStor::Http::PARTIAL_CONTENT) {
    Warning("Request for " + input->GetRange() +
            ", but response is not 206 (Partial Content)");
    ClientError<StoreError::Value> err =
        BuildStoreError(sdkErr, exceptionName, output);
    return GetObjectOutcome(ClientError<StoreError::Value>(
        StoreError::UNEXPECTED_RESPONSE, exceptionName, err.GetMessage(),
        true));
  }
  return GetObjectOutcome(output);
}

// --------------------------------------------------------------------------
HeadObjectOutcome QSBucketClient::HeadObject(const string &objKey,
                                             HeadObjectInput *input) const {
  string exceptionName = "QingStorHeadObject";
  if (objKey.empty()) {
    return HeadObjectOutcome(
        ParameterMissing(exceptionName, "Empty ObjectKey"));
  }
  exceptionName.append(" object=" + objKey);
  if (input == NULL) {
    return HeadObjectOutcome(
        ParameterMissing(exceptionName, "Null HeadObjectInput"));
  }

  HeadObjectOutput output;
  QsError sdkErr = m_bucket->HeadObject(objKey, *input, output);

  if (SDKResponseSuccess(sdkErr, output.GetResponseCode())) {
    return HeadObjectOutcome(output);
  }
  return HeadObjectOutcome(BuildStoreError(sdkErr, exceptionName, output));
}

// --------------------------------------------------------------------------
InitiateMultipartUploadOutcome QSBucketClient::InitiateMultipartUpload(
    const string &objKey, InitiateMultipartUploadInput *input) const {
  string exceptionName = "QingStorInitiateMultipartUpload";
  if (objKey.empty()) {
    return InitiateMultipartUploadOutcome(
        ParameterMissing(exceptionName, "Empty ObjectKey"));
  }
  exceptionName.append(" object=" + objKey);
  if (input == NULL) {
    return InitiateMultipartUploadOutcome(
        ParameterMissing(exceptionName, "Null InitiateMultipartUploadInput"));
  }

  InitiateMultipartUploadOutput output;
  QsError sdkErr = m_bucket->InitiateMultipartUpload(objKey, *input, output);

  if (SDKResponseSuccess(sdkErr, output.GetResponseCode())) {
    return InitiateMultipartUploadOutcome(output);
  }
  return InitiateMultipartUploadOutcome(
      BuildStoreError(sdkErr, exceptionName, output));
}

// --------------------------------------------------------------------------
UploadMultipartOutcome QSBucketClient::UploadMultipart(
    const string &objKey, UploadMultipartInput *input) const {
  string exceptionName = "QingStorUploadMultipart";
  if (objKey.empty()) {
    return UploadMultipartOutcome(
        ParameterMissing(exceptionName, "Empty ObjectKey"));
  }
  exceptionName.append(" object=" + objKey);
  if (input == NULL) {
    return UploadMultipartOutcome(
        ParameterMissing(exceptionName, "Null UploadMultipartInput"));
  }

  UploadMultipartOutput output;
  QsError sdkErr = m_bucket->UploadMultipart(objKey, *input, output);

  if (SDKResponseSuccess(sdkErr, output.GetResponseCode())) {
    return UploadMultipartOutcome(output);
  }
  return UploadMultipartOutcome(BuildStoreError(sdkErr, exceptionName, output));
}

// --------------------------------------------------------------------------
CompleteMultipartUploadOutcome QSBucketClient::CompleteMultipartUpload(
    const string &objKey, CompleteMultipartUploadInput *input) const {
  string exceptionName = "QingStorCompleteMultipartUpload";
  if (objKey.empty()) {
    return CompleteMultipartUploadOutcome(
        ParameterMissing(exceptionName, "Empty ObjectKey"));
  }
  exceptionName.append(" object=" + objKey);
  if (input == NULL) {
    return CompleteMultipartUploadOutcome(
        ParameterMissing(exceptionName, "Null CompleteMultipartUploadInput"));
  }

  CompleteMultipartUploadOutput output;
  QsError sdkErr = m_bucket->CompleteMultipartUpload(objKey, *input, output);

  if (SDKResponseSuccess(sdkErr, output.GetResponseCode())) {
    return CompleteMultipartUploadOutcome(output);
  }
  return CompleteMultipartUploadOutcome(
      BuildStoreError(sdkErr, exceptionName, output));
}

// --------------------------------------------------------------------------
AbortMultipartUploadOutcome QSBucketClient::AbortMultipartUpload(
    const string &objKey, AbortMultipartUploadInput *input) const {
  string exceptionName = "QingStorAbortMultipartUpload";
  if (objKey.empty()) {
    return AbortMultipartUploadOutcome(
        ParameterMissing(exceptionName, "Empty ObjectKey"));
  }
  exceptionName.append(" object=" + objKey);
  if (input == NULL) {
    return AbortMultipartUploadOutcome(
        ParameterMissing(exceptionName, "Null AbortMultipartUploadInput"));
  }

  AbortMultipartUploadOutput output;
  QsError sdkErr = m_bucket->AbortMultipartUpload(objKey, *input, output);

  if (SDKResponseSuccess(sdkErr, output.GetResponseCode())) {
    return AbortMultipartUploadOutcome(output);
  }
  return AbortMultipartUploadOutcome(
      BuildStoreError(sdkErr, exceptionName, output));
}

}  // namespace Client
}  // namespace QSM

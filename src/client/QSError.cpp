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

#include "client/QSError.h"

#include <string>

#include "boost/exception/to_string.hpp"

#include "qingstor/HttpCommon.h"
#include "qingstor/QsErrors.h"
#include "qingstor/Types.h"

namespace QSM {

namespace Client {

using boost::to_string;
using QingStor::Http::HttpResponseCode;
using std::string;

namespace {

bool SDKResponseCodeSuccess(HttpResponseCode code) {
  using namespace QingStor::Http;  // NOLINT
  switch (code) {
    case CONTINUE:
    case PROCESSING:
    case OK:
    case CREATED:
    case ACCEPTED:
    case NO_CONTENT:
    case PARTIAL_CONTENT:
    case FOUND:
    case NOT_MODIFIED:
      return true;
    default:
      return false;
  }
}

}  // namespace

// --------------------------------------------------------------------------
StoreError::Value SDKResponseToStoreError(QsError sdkErr,
                                          HttpResponseCode code) {
  using namespace QingStor::Http;  // NOLINT
  if (SDKResponseSuccess(sdkErr, code)) {
    return StoreError::GOOD;
  }
  if (sdkErr == QS_ERR_SEND_REQUEST_ERROR) {
    return StoreError::REQUEST_SEND_ERROR;
  }
  if (sdkErr == QS_ERR_NO_REQUIRED_PARAMETER) {
    return StoreError::PARAMETER_MISSING;
  }

  switch (code) {
    case NOT_FOUND:
      return StoreError::NOT_FOUND;
    case UNAUTHORIZED_OR_EXPIRED:
    case FORBIDDEN:
      return StoreError::ACCESS_DENIED;
    case INVALID_RANGE:
      return StoreError::INVALID_RANGE;
    case TOO_MANY_REQUESTS:
      return StoreError::THROTTLED;
    case INTERNAL_SERVER_ERROR:
    case SERVICE_UNAVAILABLE:
    case GATEWAY_TIMEOUT:
      return StoreError::SERVICE_UNAVAILABLE;
    case NETWORK_READ_TIMEOUT:
    case NETWORK_CONNECT_TIMEOUT:
      return StoreError::REQUEST_SEND_ERROR;
    default:
      return sdkErr == QS_ERR_UNEXCEPTED_RESPONSE
                 ? StoreError::UNEXPECTED_RESPONSE
                 : StoreError::UNKNOWN;
  }
}

// --------------------------------------------------------------------------
bool SDKShouldRetry(QsError sdkErr, HttpResponseCode code) {
  switch (SDKResponseToStoreError(sdkErr, code)) {
    case StoreError::REQUEST_SEND_ERROR:
    case StoreError::THROTTLED:
    case StoreError::SERVICE_UNAVAILABLE:
      return true;
    default:
      return false;
  }
}

// --------------------------------------------------------------------------
bool SDKResponseSuccess(QsError sdkErr, HttpResponseCode code) {
  return sdkErr == QS_ERR_NO_ERROR ||
         (sdkErr == QS_ERR_UNEXCEPTED_RESPONSE && SDKResponseCodeSuccess(code));
}

// --------------------------------------------------------------------------
string SDKResponseCodeToString(HttpResponseCode code) {
  return "HttpResponseCode(" + to_string(static_cast<int>(code)) + ")";
}

// --------------------------------------------------------------------------
ClientError<StoreError::Value> BuildStoreError(QsError sdkErr,
                                               const string &exceptionName,
                                               const QingStor::QsOutput &output) {
  HttpResponseCode rspCode = const_cast<QingStor::QsOutput &>(output)
                                 .GetResponseCode();
  StoreError::Value err = SDKResponseToStoreError(sdkErr, rspCode);
  bool retryable = SDKShouldRetry(sdkErr, rspCode);

  string errMsg = SDKResponseCodeToString(rspCode);
  if (sdkErr == QS_ERR_UNEXCEPTED_RESPONSE) {
    QingStor::ResponseErrorInfo errInfo = output.GetResponseErrInfo();
    errMsg += "[code:" + errInfo.code;
    errMsg += "; message:" + errInfo.message;
    errMsg += "; request:" + errInfo.requestID;
    errMsg += "; url:" + errInfo.url;
    errMsg += "]";
  }
  return ClientError<StoreError::Value>(err, exceptionName, errMsg, retryable);
}

}  // namespace Client
}  // namespace QSM

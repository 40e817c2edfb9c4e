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

#include "client/StoreError.h"

#include <string>

namespace QSM {

namespace Client {

using std::string;

// --------------------------------------------------------------------------
string StoreErrorToString(StoreError::Value err) {
  switch (err) {
    case StoreError::GOOD:
      return "Good";
    case StoreError::PARAMETER_MISSING:
      return "ParameterMissing";
    case StoreError::INVALID_PARAMETER:
      return "InvalidParameter";
    case StoreError::NOT_FOUND:
      return "NotFound";
    case StoreError::ACCESS_DENIED:
      return "AccessDenied";
    case StoreError::INVALID_RANGE:
      return "InvalidRange";
    case StoreError::NO_SUCH_UPLOAD:
      return "NoSuchUpload";
    case StoreError::THROTTLED:
      return "Throttled";
    case StoreError::SERVICE_UNAVAILABLE:
      return "ServiceUnavailable";
    case StoreError::UNEXPECTED_RESPONSE:
      return "UnexpectedResponse";
    case StoreError::REQUEST_SEND_ERROR:
      return "RequestSendError";
    case StoreError::IO_ERROR:
      return "IOError";
    case StoreError::SHORT_READ:
      return "ShortRead";
    case StoreError::UNKNOWN:
    default:
      return "Unknown";
  }
}

// --------------------------------------------------------------------------
string GetMessageForStoreError(const ClientError<StoreError::Value> &error) {
  return StoreErrorToString(error.GetError()) + ", " +
         error.GetExceptionName() + ":" + error.GetMessage();
}

// --------------------------------------------------------------------------
bool IsGoodStoreError(const ClientError<StoreError::Value> &error) {
  return error.GetError() == StoreError::GOOD;
}

// --------------------------------------------------------------------------
ClientError<StoreError::Value> StoreErrorGood() {
  return ClientError<StoreError::Value>(StoreError::GOOD, false);
}

}  // namespace Client
}  // namespace QSM

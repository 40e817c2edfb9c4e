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

#ifndef QSMOVE_CLIENT_QSERROR_H_
#define QSMOVE_CLIENT_QSERROR_H_

#include <string>

#include "qingstor/HttpCommon.h"
#include "qingstor/QsErrors.h"
#include "qingstor/Types.h"

#include "client/ClientError.hpp"
#include "client/StoreError.h"

namespace QSM {

namespace Client {

// Map qingstor sdk response to store error
StoreError::Value SDKResponseToStoreError(QsError sdkErr,
                                          QingStor::Http::HttpResponseCode code);

// Send errors, throttling and server side errors are worth retrying
bool SDKShouldRetry(QsError sdkErr, QingStor::Http::HttpResponseCode code);

// The sdk returns UNEXPECTED_RESPONSE for any response code not listed in
// api specs, so success is decided by response code as well.
bool SDKResponseSuccess(QsError sdkErr, QingStor::Http::HttpResponseCode code);

std::string SDKResponseCodeToString(QingStor::Http::HttpResponseCode code);

// Build store error from a failed sdk response
ClientError<StoreError::Value> BuildStoreError(QsError sdkErr,
                                               const std::string &exceptionName,
                                               const QingStor::QsOutput &output);

}  // namespace Client
}  // namespace QSM

#endif  // QSMOVE_CLIENT_QSERROR_H_

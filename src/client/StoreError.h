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

#ifndef QSMOVE_CLIENT_STOREERROR_H_
#define QSMOVE_CLIENT_STOREERROR_H_

#include <string>

#include "client/ClientError.hpp"

namespace QSM {

namespace Client {

// Errors reported by object stores, independent of the store backend
struct StoreError {
  enum Value {
    UNKNOWN,
    GOOD,

    // request check
    PARAMETER_MISSING,
    INVALID_PARAMETER,

    // store response
    NOT_FOUND,
    ACCESS_DENIED,
    INVALID_RANGE,
    NO_SUCH_UPLOAD,
    THROTTLED,
    SERVICE_UNAVAILABLE,
    UNEXPECTED_RESPONSE,

    // transport
    REQUEST_SEND_ERROR,

    // local io
    IO_ERROR,
    SHORT_READ
  };
};

std::string StoreErrorToString(StoreError::Value err);

std::string GetMessageForStoreError(const ClientError<StoreError::Value> &error);

bool IsGoodStoreError(const ClientError<StoreError::Value> &error);

// Shortcut for a good error
ClientError<StoreError::Value> StoreErrorGood();

}  // namespace Client
}  // namespace QSM

#endif  // QSMOVE_CLIENT_STOREERROR_H_

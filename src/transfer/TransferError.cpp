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

#include "transfer/TransferError.h"

#include <string>

namespace QSM {

namespace Transfer {

using std::string;

// --------------------------------------------------------------------------
string TransferErrorToString(TransferError::Value err) {
  switch (err) {
    case TransferError::GOOD:
      return "Good";
    case TransferError::CONFIGURATION:
      return "ConfigurationError";
    case TransferError::SOURCE_READ:
      return "SourceReadError";
    case TransferError::STAGING_WRITE:
      return "StagingWriteError";
    case TransferError::STAGING_READ:
      return "StagingReadError";
    case TransferError::DESTINATION_UPLOAD:
      return "DestinationUploadError";
    case TransferError::SIZE_MISMATCH:
      return "SizeMismatchError";
    case TransferError::DIGEST_MISMATCH:
      return "DigestMismatchError";
    case TransferError::UNEXPECTED:
    default:
      return "UnexpectedError";
  }
}

// --------------------------------------------------------------------------
TransferClientError TransferErrorGood() {
  return TransferClientError(TransferError::GOOD, false);
}

// --------------------------------------------------------------------------
bool IsGoodTransferError(const TransferClientError &err) {
  return err.GetError() == TransferError::GOOD;
}

// --------------------------------------------------------------------------
string GetMessageForTransferError(const TransferClientError &err) {
  string msg = TransferErrorToString(err.GetError());
  if (!err.GetExceptionName().empty()) {
    msg += ", " + err.GetExceptionName();
  }
  if (!err.GetMessage().empty()) {
    msg += ": " + err.GetMessage();
  }
  return msg;
}

// --------------------------------------------------------------------------
void ThrowIfTransferError(const TransferClientError &err) {
  string msg = GetMessageForTransferError(err);
  switch (err.GetError()) {
    case TransferError::GOOD:
      return;
    case TransferError::CONFIGURATION:
      throw ConfigurationError(msg);
    case TransferError::SOURCE_READ:
      throw SourceReadError(msg);
    case TransferError::STAGING_WRITE:
      throw StagingWriteError(msg);
    case TransferError::STAGING_READ:
      throw StagingReadError(msg);
    case TransferError::DESTINATION_UPLOAD:
      throw DestinationUploadError(msg);
    case TransferError::SIZE_MISMATCH:
      throw SizeMismatchError(msg);
    case TransferError::DIGEST_MISMATCH:
      throw DigestMismatchError(msg);
    case TransferError::UNEXPECTED:
    default:
      throw UnexpectedError(msg);
  }
}

}  // namespace Transfer
}  // namespace QSM

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

#ifndef QSMOVE_TRANSFER_TRANSFERERROR_H_
#define QSMOVE_TRANSFER_TRANSFERERROR_H_

#include <string>

#include "base/Exception.h"
#include "client/ClientError.hpp"

namespace QSM {

namespace Transfer {

struct TransferError {
  enum Value {
    GOOD,
    CONFIGURATION,       // missing or invalid job parameters
    SOURCE_READ,         // a ranged read from source failed
    STAGING_WRITE,       // local staging io failed
    STAGING_READ,
    DESTINATION_UPLOAD,  // a part or session operation failed
    SIZE_MISMATCH,       // destination size differs from staged size
    DIGEST_MISMATCH,     // only in strict verification mode
    UNEXPECTED
  };
};

std::string TransferErrorToString(TransferError::Value err);

typedef QSM::Client::ClientError<TransferError::Value> TransferClientError;

TransferClientError TransferErrorGood();

bool IsGoodTransferError(const TransferClientError &err);

std::string GetMessageForTransferError(const TransferClientError &err);

//
// Root of transfer failures, carrying the error kind
//
class TransferException : public QSM::Exception::QSMException {
 public:
  TransferException(TransferError::Value error, const std::string &msg)
      : QSMException(msg), m_error(error) {}

  TransferError::Value GetError() const { return m_error; }

 private:
  TransferError::Value m_error;
};

#define QSMOVE_DECLARE_TRANSFER_EXCEPTION(name, value) \
  class name : public TransferException {              \
   public:                                             \
    explicit name(const std::string &msg)              \
        : TransferException(TransferError::value, msg) {} \
  };

QSMOVE_DECLARE_TRANSFER_EXCEPTION(ConfigurationError, CONFIGURATION)
QSMOVE_DECLARE_TRANSFER_EXCEPTION(SourceReadError, SOURCE_READ)
QSMOVE_DECLARE_TRANSFER_EXCEPTION(StagingWriteError, STAGING_WRITE)
QSMOVE_DECLARE_TRANSFER_EXCEPTION(StagingReadError, STAGING_READ)
QSMOVE_DECLARE_TRANSFER_EXCEPTION(DestinationUploadError, DESTINATION_UPLOAD)
QSMOVE_DECLARE_TRANSFER_EXCEPTION(SizeMismatchError, SIZE_MISMATCH)
QSMOVE_DECLARE_TRANSFER_EXCEPTION(DigestMismatchError, DIGEST_MISMATCH)
QSMOVE_DECLARE_TRANSFER_EXCEPTION(UnexpectedError, UNEXPECTED)

#undef QSMOVE_DECLARE_TRANSFER_EXCEPTION

// Throw the exception matching the error kind, do nothing for good error
void ThrowIfTransferError(const TransferClientError &err);

}  // namespace Transfer
}  // namespace QSM

#endif  // QSMOVE_TRANSFER_TRANSFERERROR_H_

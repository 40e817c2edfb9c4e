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

#ifndef QSMOVE_CLIENT_OBJECTSTORE_H_
#define QSMOVE_CLIENT_OBJECTSTORE_H_

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <vector>

#include "client/ClientError.hpp"
#include "client/StoreError.h"

namespace QSM {

namespace Client {

// Metadata reported by head request
struct ObjectInfo {
  uint64_t m_size;
  std::string m_digest;  // hex digest reported by store, may be empty

  ObjectInfo() : m_size(0) {}
};

// A part acknowledged by the destination
struct UploadedPart {
  int m_partNumber;                 // 1 based
  std::string m_contentIdentifier;  // e.g. ETag

  UploadedPart() : m_partNumber(0) {}
  UploadedPart(int partNumber, const std::string &contentIdentifier)
      : m_partNumber(partNumber), m_contentIdentifier(contentIdentifier) {}
};

inline bool operator<(const UploadedPart &lhs, const UploadedPart &rhs) {
  return lhs.m_partNumber < rhs.m_partNumber;
}

//
// ObjectSource
//
// Read-only store which supports ranged reads. Implementations must allow
// concurrent calls of ReadRange from different threads.
//
class ObjectSource {
 public:
  virtual ~ObjectSource() {}

  // Get object size
  //
  // @param  : object key, size(output)
  // @return : ClientError
  virtual ClientError<StoreError::Value> GetSize(const std::string &key,
                                                 uint64_t *size) = 0;

  // Read closed byte range [start, stop] of the object
  //
  // @param  : object key, start, stop, buffer with at least stop-start+1
  //           bytes, bytes read(output)
  // @return : ClientError
  //
  // A read returning fewer bytes than asked is a SHORT_READ error.
  virtual ClientError<StoreError::Value> ReadRange(const std::string &key,
                                                   uint64_t start,
                                                   uint64_t stop, char *buffer,
                                                   size_t *bytesRead) = 0;

  // Description of the store, used in log messages
  virtual std::string GetName() const = 0;
};

//
// ObjectSink
//
// Store which receives an object through a multipart upload session.
// Implementations must allow concurrent calls of UploadPart.
//
class ObjectSink {
 public:
  virtual ~ObjectSink() {}

  // Open a multipart upload session
  //
  // @param  : object key, session id(output)
  // @return : ClientError
  virtual ClientError<StoreError::Value> BeginMultipartSession(
      const std::string &key, std::string *sessionId) = 0;

  // Upload one part
  //
  // @param  : object key, session id, part number (1 based), data, data
  //           length, content identifier(output)
  // @return : ClientError
  virtual ClientError<StoreError::Value> UploadPart(
      const std::string &key, const std::string &sessionId, int partNumber,
      const char *data, size_t len, std::string *contentIdentifier) = 0;

  // Commit the session, parts must be sorted by part number
  virtual ClientError<StoreError::Value> CompleteSession(
      const std::string &key, const std::string &sessionId,
      const std::vector<UploadedPart> &sortedParts) = 0;

  // Discard the session and any parts uploaded through it
  virtual ClientError<StoreError::Value> AbortSession(
      const std::string &key, const std::string &sessionId) = 0;

  virtual ClientError<StoreError::Value> HeadObject(const std::string &key,
                                                    ObjectInfo *info) = 0;

  // Part limits of the store, 0 means no limit.
  // Min part size does not apply to the last part.
  virtual uint64_t GetMinPartSize() const { return 0; }
  virtual uint64_t GetMaxPartSize() const { return 0; }
  virtual size_t GetMaxPartCount() const { return 0; }

  // Description of the store, used in log messages
  virtual std::string GetName() const = 0;
};

}  // namespace Client
}  // namespace QSM

#endif  // QSMOVE_CLIENT_OBJECTSTORE_H_

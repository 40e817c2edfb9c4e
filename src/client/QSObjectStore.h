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

#ifndef QSMOVE_CLIENT_QSOBJECTSTORE_H_
#define QSMOVE_CLIENT_QSOBJECTSTORE_H_

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <vector>

#include "boost/shared_ptr.hpp"

#include "client/ObjectStore.h"

namespace QSM {

namespace Client {

class QSBucketClient;

// Build qingstor range header value "bytes=start-stop"
std::string BuildRequestRange(uint64_t start, uint64_t stop);

// Strip the quotes around an ETag
std::string TrimETag(const std::string &eTag);

//
// A qingstor bucket as object source
//
class QSObjectSource : public ObjectSource {
 public:
  explicit QSObjectSource(const boost::shared_ptr<QSBucketClient> &client);

  ClientError<StoreError::Value> GetSize(const std::string &key,
                                         uint64_t *size);

  ClientError<StoreError::Value> ReadRange(const std::string &key,
                                           uint64_t start, uint64_t stop,
                                           char *buffer, size_t *bytesRead);

  std::string GetName() const;

 private:
  boost::shared_ptr<QSBucketClient> m_client;
};

//
// A qingstor bucket as object sink, using multipart upload
//
class QSObjectSink : public ObjectSink {
 public:
  explicit QSObjectSink(const boost::shared_ptr<QSBucketClient> &client);

  ClientError<StoreError::Value> BeginMultipartSession(const std::string &key,
                                                       std::string *sessionId);

  ClientError<StoreError::Value> UploadPart(const std::string &key,
                                            const std::string &sessionId,
                                            int partNumber, const char *data,
                                            size_t len,
                                            std::string *contentIdentifier);

  ClientError<StoreError::Value> CompleteSession(
      const std::string &key, const std::string &sessionId,
      const std::vector<UploadedPart> &sortedParts);

  ClientError<StoreError::Value> AbortSession(const std::string &key,
                                              const std::string &sessionId);

  ClientError<StoreError::Value> HeadObject(const std::string &key,
                                            ObjectInfo *info);

  uint64_t GetMinPartSize() const;
  uint64_t GetMaxPartSize() const;
  size_t GetMaxPartCount() const;

  std::string GetName() const;

 private:
  boost::shared_ptr<QSBucketClient> m_client;
};

}  // namespace Client
}  // namespace QSM

#endif  // QSMOVE_CLIENT_QSOBJECTSTORE_H_

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

#ifndef QSMOVE_CLIENT_FILEOBJECTSTORE_H_
#define QSMOVE_CLIENT_FILEOBJECTSTORE_H_

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <vector>

#include "client/ObjectStore.h"

namespace QSM {

namespace Client {

//
// A local directory as object source, object key is the path relative to
// the directory
//
class FileObjectSource : public ObjectSource {
 public:
  explicit FileObjectSource(const std::string &rootDirectory);

  ClientError<StoreError::Value> GetSize(const std::string &key,
                                         uint64_t *size);

  ClientError<StoreError::Value> ReadRange(const std::string &key,
                                           uint64_t start, uint64_t stop,
                                           char *buffer, size_t *bytesRead);

  std::string GetName() const;

  const std::string &GetRootDirectory() const { return m_rootDirectory; }

 private:
  std::string m_rootDirectory;
};

//
// A local directory as object sink
//
// A session is a hidden directory under the root directory holding one file
// per part. Completing the session concatenates the parts and renames the
// result to the object path, so the object never appears half written.
//
class FileObjectSink : public ObjectSink {
 public:
  explicit FileObjectSink(const std::string &rootDirectory);

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

  // Report file size and md5 of file content
  ClientError<StoreError::Value> HeadObject(const std::string &key,
                                            ObjectInfo *info);

  std::string GetName() const;

  const std::string &GetRootDirectory() const { return m_rootDirectory; }

  std::string GetSessionDirectory(const std::string &sessionId) const;

 private:
  std::string m_rootDirectory;
};

}  // namespace Client
}  // namespace QSM

#endif  // QSMOVE_CLIENT_FILEOBJECTSTORE_H_

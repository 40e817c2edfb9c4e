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

#include "client/QSObjectStore.h"

#include <stddef.h>
#include <stdint.h>

#include <iostream>
#include <string>
#include <vector>

#include "boost/exception/to_string.hpp"
#include "boost/foreach.hpp"
#include "boost/shared_ptr.hpp"

#include "qingstor/Bucket.h"
#include "qingstor/types/ObjectPartType.h"

#include "base/LogMacros.h"
#include "base/StringUtils.h"
#include "client/QSBucketClient.h"
#include "configure/Default.h"
#include "data/IOStream.h"

namespace QSM {

namespace Client {

using boost::shared_ptr;
using boost::to_string;
using QingStor::AbortMultipartUploadInput;
using QingStor::CompleteMultipartUploadInput;
using QingStor::GetObjectInput;
using QingStor::GetObjectOutput;
using QingStor::HeadObjectInput;
using QingStor::HeadObjectOutput;
using QingStor::InitiateMultipartUploadInput;
using QingStor::InitiateMultipartUploadOutput;
using QingStor::UploadMultipartInput;
using QingStor::UploadMultipartOutput;
using QSM::Data::IOStream;
using QSM::StringUtils::FormatKey;
using QSM::StringUtils::Trim;
using std::iostream;
using std::string;
using std::vector;

// --------------------------------------------------------------------------
string BuildRequestRange(uint64_t start, uint64_t stop) {
  return "bytes=" + to_string(start) + "-" + to_string(stop);
}

// --------------------------------------------------------------------------
string TrimETag(const string &eTag) { return Trim(eTag, '"'); }

// --------------------------------------------------------------------------
QSObjectSource::QSObjectSource(const shared_ptr<QSBucketClient> &client)
    : m_client(client) {}

// --------------------------------------------------------------------------
ClientError<StoreError::Value> QSObjectSource::GetSize(const string &key,
                                                       uint64_t *size) {
  HeadObjectInput input;
  HeadObjectOutcome outcome = m_client->HeadObject(key, &input);
  if (!outcome.IsSuccess()) {
    return outcome.GetError();
  }
  if (size != NULL) {
    *size = static_cast<uint64_t>(outcome.GetResult().GetContentLength());
  }
  return StoreErrorGood();
}

// --------------------------------------------------------------------------
ClientError<StoreError::Value> QSObjectSource::ReadRange(const string &key,
                                                         uint64_t start,
                                                         uint64_t stop,
                                                         char *buffer,
                                                         size_t *bytesRead) {
  string exceptionName = "QingStorReadRange " + FormatKey(key);
  if (buffer == NULL || stop < start) {
    return ClientError<StoreError::Value>(
        StoreError::INVALID_PARAMETER, exceptionName,
        "Null buffer or invalid range " + StringUtils::FormatRange(start, stop),
        false);
  }

  GetObjectInput input;
  input.SetRange(BuildRequestRange(start, stop));
  GetObjectOutcome outcome = m_client->GetObject(key, &input);
  if (!outcome.IsSuccess()) {
    return outcome.GetError();
  }

  size_t len = static_cast<size_t>(stop - start + 1);
  iostream *body = outcome.GetResult().GetBody();
  size_t count = 0;
  if (body != NULL) {
    body->seekg(0, std::ios_base::beg);
    body->read(buffer, len);
    count = static_cast<size_t>(body->gcount());
  }
  if (bytesRead != NULL) {
    *bytesRead = count;
  }
  if (count != len) {
    return ClientError<StoreError::Value>(
        StoreError::SHORT_READ, exceptionName,
        "Expect " + to_string(len) + " bytes but got " + to_string(count) +
            " " + StringUtils::FormatRange(start, stop),
        true);
  }
  return StoreErrorGood();
}

// --------------------------------------------------------------------------
string QSObjectSource::GetName() const {
  return "qs://" + m_client->GetBucketName() + "@" + m_client->GetZone();
}

// --------------------------------------------------------------------------
QSObjectSink::QSObjectSink(const shared_ptr<QSBucketClient> &client)
    : m_client(client) {}

// --------------------------------------------------------------------------
ClientError<StoreError::Value> QSObjectSink::BeginMultipartSession(
    const string &key, string *sessionId) {
  InitiateMultipartUploadInput input;
  input.SetContentType("application/octet-stream");

  InitiateMultipartUploadOutcome outcome =
      m_client->InitiateMultipartUpload(key, &input);
  if (!outcome.IsSuccess()) {
    return outcome.GetError();
  }
  if (sessionId != NULL) {
    *sessionId = outcome.GetResult().GetUploadID();
  }
  return StoreErrorGood();
}

// --------------------------------------------------------------------------
ClientError<StoreError::Value> QSObjectSink::UploadPart(
    const string &key, const string &sessionId, int partNumber,
    const char *data, size_t len, string *contentIdentifier) {
  // sdk only reads from body
  IOStream body(const_cast<char *>(data), len);

  UploadMultipartInput input;
  input.SetUploadID(sessionId);
  input.SetPartNumber(partNumber);
  input.SetContentLength(len);
  if (len > 0) {
    input.SetBody(&body);
  }

  UploadMultipartOutcome outcome = m_client->UploadMultipart(key, &input);
  if (!outcome.IsSuccess()) {
    return outcome.GetError();
  }
  if (contentIdentifier != NULL) {
    *contentIdentifier = TrimETag(outcome.GetResult().GetETag());
  }
  return StoreErrorGood();
}

// --------------------------------------------------------------------------
ClientError<StoreError::Value> QSObjectSink::CompleteSession(
    const string &key, const string &sessionId,
    const vector<UploadedPart> &sortedParts) {
  CompleteMultipartUploadInput input;
  input.SetUploadID(sessionId);
  vector<QingStor::ObjectPartType> objParts;
  BOOST_FOREACH(const UploadedPart &part, sortedParts) {
    QingStor::ObjectPartType objPart;
    objPart.SetPartNumber(part.m_partNumber);
    objParts.push_back(objPart);
  }
  input.SetObjectParts(objParts);

  CompleteMultipartUploadOutcome outcome =
      m_client->CompleteMultipartUpload(key, &input);
  return outcome.IsSuccess() ? StoreErrorGood() : outcome.GetError();
}

// --------------------------------------------------------------------------
ClientError<StoreError::Value> QSObjectSink::AbortSession(
    const string &key, const string &sessionId) {
  AbortMultipartUploadInput input;
  input.SetUploadID(sessionId);

  AbortMultipartUploadOutcome outcome =
      m_client->AbortMultipartUpload(key, &input);
  return outcome.IsSuccess() ? StoreErrorGood() : outcome.GetError();
}

// --------------------------------------------------------------------------
ClientError<StoreError::Value> QSObjectSink::HeadObject(const string &key,
                                                        ObjectInfo *info) {
  HeadObjectInput input;
  HeadObjectOutcome outcome = m_client->HeadObject(key, &input);
  if (!outcome.IsSuccess()) {
    return outcome.GetError();
  }
  if (info != NULL) {
    HeadObjectOutput &res = outcome.GetResult();
    info->m_size = static_cast<uint64_t>(res.GetContentLength());
    // etag of a multipart object is not the md5 of its content
    info->m_digest = TrimETag(res.GetETag());
  }
  return StoreErrorGood();
}

// --------------------------------------------------------------------------
uint64_t QSObjectSink::GetMinPartSize() const {
  return QSM::Configure::Default::GetUploadMultipartMinPartSize();
}

// --------------------------------------------------------------------------
uint64_t QSObjectSink::GetMaxPartSize() const {
  return QSM::Configure::Default::GetUploadMultipartMaxPartSize();
}

// --------------------------------------------------------------------------
size_t QSObjectSink::GetMaxPartCount() const {
  return QSM::Configure::Default::GetUploadMultipartMaxPartCount();
}

// --------------------------------------------------------------------------
string QSObjectSink::GetName() const {
  return "qs://" + m_client->GetBucketName() + "@" + m_client->GetZone();
}

}  // namespace Client
}  // namespace QSM

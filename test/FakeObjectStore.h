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
#ifndef QSMOVE_TEST_FAKEOBJECTSTORE_H_
#define QSMOVE_TEST_FAKEOBJECTSTORE_H_

#include <stddef.h>
#include <stdint.h>
#include <string.h>

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "boost/exception/to_string.hpp"
#include "boost/foreach.hpp"
#include "boost/thread/locks.hpp"
#include "boost/thread/mutex.hpp"
#include "boost/thread/thread.hpp"
#include "boost/thread/thread_time.hpp"

#include "base/HashUtils.h"
#include "client/ClientError.hpp"
#include "client/ObjectStore.h"
#include "client/StoreError.h"

namespace QSM {

namespace Client {

typedef ClientError<StoreError::Value> FakeStoreError;

inline FakeStoreError FakeFailure(StoreError::Value err, bool retryable) {
  return FakeStoreError(err, "FakeStore", "injected failure", retryable);
}

// Fill a string with a position dependent pattern
inline std::string MakePattern(size_t size) {
  std::string content(size, '\0');
  for (size_t i = 0; i < size; ++i) {
    content[i] = static_cast<char>((i * 31 + i / 251) % 256);
  }
  return content;
}

inline std::string MD5Of(const std::string &content) {
  QSM::HashUtils::MD5Digest digest;
  digest.Update(content.data(), content.size());
  return digest.HexDigest();
}

//
// In memory source with failure injection and call recording
//
class FakeObjectSource : public ObjectSource {
 public:
  FakeObjectSource()
      : m_sizeFailures(0), m_sizeRetryable(false), m_firstChunkDelayMs(0) {}

  void PutObject(const std::string &key, const std::string &content) {
    m_objects[key] = content;
  }

  // Fail ranged reads starting at offset for count times
  void FailReadAt(uint64_t start, int count, bool retryable) {
    boost::lock_guard<boost::mutex> lock(m_lock);
    m_readFailures[start] = std::make_pair(count, retryable);
  }

  void FailGetSize(int count, bool retryable) {
    m_sizeFailures = count;
    m_sizeRetryable = retryable;
  }

  // Delay the read at offset 0, so later chunks complete first
  void DelayFirstChunk(int ms) { m_firstChunkDelayMs = ms; }

  FakeStoreError GetSize(const std::string &key, uint64_t *size) {
    if (m_sizeFailures > 0) {
      --m_sizeFailures;
      return FakeFailure(StoreError::SERVICE_UNAVAILABLE, m_sizeRetryable);
    }
    std::map<std::string, std::string>::const_iterator it =
        m_objects.find(key);
    if (it == m_objects.end()) {
      return FakeFailure(StoreError::NOT_FOUND, false);
    }
    *size = it->second.size();
    return StoreErrorGood();
  }

  FakeStoreError ReadRange(const std::string &key, uint64_t start,
                           uint64_t stop, char *buffer, size_t *bytesRead) {
    {
      boost::lock_guard<boost::mutex> lock(m_lock);
      m_reads.push_back(std::make_pair(start, stop));
      std::map<uint64_t, std::pair<int, bool> >::iterator failure =
          m_readFailures.find(start);
      if (failure != m_readFailures.end() && failure->second.first > 0) {
        --failure->second.first;
        return FakeFailure(StoreError::SERVICE_UNAVAILABLE,
                           failure->second.second);
      }
    }
    if (start == 0 && m_firstChunkDelayMs > 0) {
      boost::this_thread::sleep(
          boost::posix_time::milliseconds(m_firstChunkDelayMs));
    }
    std::map<std::string, std::string>::const_iterator it =
        m_objects.find(key);
    if (it == m_objects.end()) {
      return FakeFailure(StoreError::NOT_FOUND, false);
    }
    if (stop < start || stop >= it->second.size()) {
      return FakeFailure(StoreError::INVALID_RANGE, false);
    }
    size_t len = static_cast<size_t>(stop - start + 1);
    memcpy(buffer, it->second.data() + start, len);
    *bytesRead = len;
    return StoreErrorGood();
  }

  std::string GetName() const { return "fake source"; }

  std::vector<std::pair<uint64_t, uint64_t> > GetReads() const {
    boost::lock_guard<boost::mutex> lock(m_lock);
    return m_reads;
  }

 private:
  std::map<std::string, std::string> m_objects;
  int m_sizeFailures;
  bool m_sizeRetryable;
  int m_firstChunkDelayMs;
  mutable boost::mutex m_lock;
  std::map<uint64_t, std::pair<int, bool> > m_readFailures;
  std::vector<std::pair<uint64_t, uint64_t> > m_reads;
};

//
// In memory sink with failure injection and call recording
//
class FakeObjectSink : public ObjectSink {
 public:
  FakeObjectSink()
      : m_sessionCounter(0),
        m_beginFailures(0),
        m_completeFailures(0),
        m_reportDigest(true),
        m_sizeDelta(0),
        m_minPartSize(0),
        m_maxPartSize(0),
        m_maxPartCount(0),
        m_firstPartDelayMs(0),
        m_beginCalls(0) {}

  void FailBegin(int count) { m_beginFailures = count; }
  void FailComplete(int count) { m_completeFailures = count; }
  void FailPart(int partNumber, int count, bool retryable) {
    boost::lock_guard<boost::mutex> lock(m_lock);
    m_partFailures[partNumber] = std::make_pair(count, retryable);
  }
  void SetReportDigest(bool report) { m_reportDigest = report; }
  void SetDigestOverride(const std::string &digest) {
    m_digestOverride = digest;
  }
  // Head reports stored size plus delta
  void SetSizeDelta(int64_t delta) { m_sizeDelta = delta; }
  void SetPartLimits(uint64_t minSize, uint64_t maxSize, size_t maxCount) {
    m_minPartSize = minSize;
    m_maxPartSize = maxSize;
    m_maxPartCount = maxCount;
  }
  void DelayFirstPart(int ms) { m_firstPartDelayMs = ms; }

  FakeStoreError BeginMultipartSession(const std::string &key,
                                       std::string *sessionId) {
    boost::lock_guard<boost::mutex> lock(m_lock);
    ++m_beginCalls;
    if (m_beginFailures > 0) {
      --m_beginFailures;
      return FakeFailure(StoreError::ACCESS_DENIED, false);
    }
    *sessionId = "session-" + boost::to_string(++m_sessionCounter);
    m_sessions[*sessionId];
    return StoreErrorGood();
  }

  FakeStoreError UploadPart(const std::string &key,
                            const std::string &sessionId, int partNumber,
                            const char *data, size_t len,
                            std::string *contentIdentifier) {
    if (partNumber == 1 && m_firstPartDelayMs > 0) {
      boost::this_thread::sleep(
          boost::posix_time::milliseconds(m_firstPartDelayMs));
    }
    boost::lock_guard<boost::mutex> lock(m_lock);
    m_uploadedPartNumbers.push_back(partNumber);
    std::map<int, std::pair<int, bool> >::iterator failure =
        m_partFailures.find(partNumber);
    if (failure != m_partFailures.end() && failure->second.first > 0) {
      --failure->second.first;
      return FakeFailure(StoreError::SERVICE_UNAVAILABLE,
                         failure->second.second);
    }
    std::map<std::string, std::map<int, std::string> >::iterator session =
        m_sessions.find(sessionId);
    if (session == m_sessions.end()) {
      return FakeFailure(StoreError::NO_SUCH_UPLOAD, false);
    }
    std::string part(data, len);
    session->second[partNumber] = part;
    *contentIdentifier = MD5Of(part);
    return StoreErrorGood();
  }

  FakeStoreError CompleteSession(const std::string &key,
                                 const std::string &sessionId,
                                 const std::vector<QSM::Client::UploadedPart>
                                     &sortedParts) {
    boost::lock_guard<boost::mutex> lock(m_lock);
    std::vector<int> numbers;
    BOOST_FOREACH(const QSM::Client::UploadedPart &part, sortedParts) {
      numbers.push_back(part.m_partNumber);
    }
    m_completedPartNumbers.push_back(numbers);
    if (m_completeFailures > 0) {
      --m_completeFailures;
      return FakeFailure(StoreError::UNEXPECTED_RESPONSE, false);
    }
    std::map<std::string, std::map<int, std::string> >::iterator session =
        m_sessions.find(sessionId);
    if (session == m_sessions.end()) {
      return FakeFailure(StoreError::NO_SUCH_UPLOAD, false);
    }
    std::string object;
    BOOST_FOREACH(const QSM::Client::UploadedPart &part, sortedParts) {
      std::map<int, std::string>::const_iterator it =
          session->second.find(part.m_partNumber);
      if (it == session->second.end() ||
          MD5Of(it->second) != part.m_contentIdentifier) {
        return FakeFailure(StoreError::INVALID_PARAMETER, false);
      }
      object += it->second;
    }
    m_objects[key] = object;
    m_sessions.erase(session);
    return StoreErrorGood();
  }

  FakeStoreError AbortSession(const std::string &key,
                              const std::string &sessionId) {
    boost::lock_guard<boost::mutex> lock(m_lock);
    m_abortedSessions.push_back(sessionId);
    if (m_sessions.erase(sessionId) == 0) {
      return FakeFailure(StoreError::NO_SUCH_UPLOAD, false);
    }
    return StoreErrorGood();
  }

  FakeStoreError HeadObject(const std::string &key, ObjectInfo *info) {
    boost::lock_guard<boost::mutex> lock(m_lock);
    std::map<std::string, std::string>::const_iterator it =
        m_objects.find(key);
    if (it == m_objects.end()) {
      return FakeFailure(StoreError::NOT_FOUND, false);
    }
    info->m_size = static_cast<uint64_t>(
        static_cast<int64_t>(it->second.size()) + m_sizeDelta);
    if (!m_digestOverride.empty()) {
      info->m_digest = m_digestOverride;
    } else if (m_reportDigest) {
      info->m_digest = MD5Of(it->second);
    }
    return StoreErrorGood();
  }

  uint64_t GetMinPartSize() const { return m_minPartSize; }
  uint64_t GetMaxPartSize() const { return m_maxPartSize; }
  size_t GetMaxPartCount() const { return m_maxPartCount; }
  std::string GetName() const { return "fake sink"; }

 public:
  bool HasObject(const std::string &key) const {
    boost::lock_guard<boost::mutex> lock(m_lock);
    return m_objects.find(key) != m_objects.end();
  }
  std::string GetObject(const std::string &key) const {
    boost::lock_guard<boost::mutex> lock(m_lock);
    std::map<std::string, std::string>::const_iterator it =
        m_objects.find(key);
    return it == m_objects.end() ? std::string() : it->second;
  }
  size_t GetOpenSessionCount() const {
    boost::lock_guard<boost::mutex> lock(m_lock);
    return m_sessions.size();
  }
  int GetBeginCalls() const {
    boost::lock_guard<boost::mutex> lock(m_lock);
    return m_beginCalls;
  }
  std::vector<std::string> GetAbortedSessions() const {
    boost::lock_guard<boost::mutex> lock(m_lock);
    return m_abortedSessions;
  }
  std::vector<std::vector<int> > GetCompletedPartNumbers() const {
    boost::lock_guard<boost::mutex> lock(m_lock);
    return m_completedPartNumbers;
  }
  std::vector<int> GetUploadedPartNumbers() const {
    boost::lock_guard<boost::mutex> lock(m_lock);
    return m_uploadedPartNumbers;
  }

 private:
  mutable boost::mutex m_lock;
  int m_sessionCounter;
  int m_beginFailures;
  int m_completeFailures;
  bool m_reportDigest;
  std::string m_digestOverride;
  int64_t m_sizeDelta;
  uint64_t m_minPartSize;
  uint64_t m_maxPartSize;
  size_t m_maxPartCount;
  int m_firstPartDelayMs;
  int m_beginCalls;
  std::map<int, std::pair<int, bool> > m_partFailures;
  std::map<std::string, std::map<int, std::string> > m_sessions;
  std::map<std::string, std::string> m_objects;
  std::vector<std::string> m_abortedSessions;
  std::vector<std::vector<int> > m_completedPartNumbers;
  std::vector<int> m_uploadedPartNumbers;
};

}  // namespace Client
}  // namespace QSM

#endif  // QSMOVE_TEST_FAKEOBJECTSTORE_H_

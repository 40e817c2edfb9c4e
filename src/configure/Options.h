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

#ifndef QSMOVE_CONFIGURE_OPTIONS_H_
#define QSMOVE_CONFIGURE_OPTIONS_H_

#include <stddef.h>
#include <stdint.h>  // for uint16_t

#include <ostream>
#include <string>

#include "base/LogLevel.h"
#include "base/Singleton.hpp"

namespace QSM {

namespace Cli {
namespace Parser {
void Parse(int argc, char **argv);
}  // namespace Parser
}  // namespace Cli

namespace Configure {

using QSM::Logging::LogLevel;

//
// Options
//
// Settings of a qsmove run, populated once by the command line parser.
//
class Options : public Singleton<Options> {
 public:
  ~Options() {}

 public:
  bool IsNoTransfer() const { return m_showHelp || m_showVersion; }

  // accessor
  const std::string &GetSource() const { return m_source; }
  const std::string &GetDestination() const { return m_destination; }
  const std::string &GetZone() const { return m_zone; }
  const std::string &GetCredentialsFile() const { return m_credentialsFile; }
  const std::string &GetStagingDirectory() const { return m_stagingDir; }
  const std::string &GetLogDirectory() const { return m_logDirectory; }
  LogLevel::Value GetLogLevel() const { return m_logLevel; }
  size_t GetWorkerCount() const { return m_workerCount; }
  uint64_t GetChunkSizeInMB() const { return m_chunkSizeInMB; }
  uint16_t GetRetries() const { return m_retries; }
  uint32_t GetRequestTimeOut() const { return m_requestTimeOut; }
  const std::string &GetHost() const { return m_host; }
  const std::string &GetProtocol() const { return m_protocol; }
  uint16_t GetPort() const { return m_port; }
  const std::string &GetAdditionalAgent() const { return m_additionalAgent; }
  bool IsStrictVerify() const { return m_strictVerify; }
  bool IsDebug() const { return m_debug; }
  bool IsShowHelp() const { return m_showHelp; }
  bool IsShowVersion() const { return m_showVersion; }

 private:
  Options();

  // mutator
  void SetSource(const std::string &source) { m_source = source; }
  void SetDestination(const std::string &dest) { m_destination = dest; }
  void SetZone(const std::string &zone) { m_zone = zone; }
  void SetCredentialsFile(const std::string &file) { m_credentialsFile = file; }
  void SetStagingDirectory(const std::string &dir) { m_stagingDir = dir; }
  void SetLogDirectory(const std::string &path) { m_logDirectory = path; }
  void SetLogLevel(LogLevel::Value level) { m_logLevel = level; }
  void SetWorkerCount(size_t count) { m_workerCount = count; }
  void SetChunkSizeInMB(uint64_t size) { m_chunkSizeInMB = size; }
  void SetRetries(uint16_t retries) { m_retries = retries; }
  void SetRequestTimeOut(uint32_t timeout) { m_requestTimeOut = timeout; }
  void SetHost(const std::string &host) { m_host = host; }
  void SetProtocol(const std::string &protocol) { m_protocol = protocol; }
  void SetPort(uint16_t port) { m_port = port; }
  void SetAdditionalAgent(const std::string &agent) {
    m_additionalAgent = agent;
  }
  void SetStrictVerify(bool strict) { m_strictVerify = strict; }
  void SetDebug(bool debug) { m_debug = debug; }
  void SetShowHelp(bool showHelp) { m_showHelp = showHelp; }
  void SetShowVersion(bool showVersion) { m_showVersion = showVersion; }

  std::string m_source;       // file:///path or qs://bucket[@zone]/key
  std::string m_destination;  // file:///path or qs://bucket[@zone]/key
  std::string m_zone;         // default zone for qs locations
  std::string m_credentialsFile;
  std::string m_stagingDir;
  std::string m_logDirectory;  // log to console if empty
  LogLevel::Value m_logLevel;
  size_t m_workerCount;
  uint64_t m_chunkSizeInMB;
  uint16_t m_retries;        // retries of each chunk or part operation
  uint32_t m_requestTimeOut;  // in seconds
  std::string m_host;
  std::string m_protocol;
  uint16_t m_port;
  std::string m_additionalAgent;
  bool m_strictVerify;  // compare digest reported by destination
  bool m_debug;
  bool m_showHelp;
  bool m_showVersion;

  friend void QSM::Cli::Parser::Parse(int argc, char **argv);
  friend class Singleton<Options>;
  friend std::ostream &operator<<(std::ostream &os, const Options &opts);
};

std::ostream &operator<<(std::ostream &os, const Options &opts);

}  // namespace Configure
}  // namespace QSM

#endif  // QSMOVE_CONFIGURE_OPTIONS_H_

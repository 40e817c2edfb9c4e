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

#include "configure/Options.h"

#include <ostream>
#include <string>

#include "boost/exception/to_string.hpp"

#include "base/LogLevel.h"
#include "base/Size.h"
#include "configure/Default.h"

namespace QSM {

namespace Configure {

using boost::to_string;
using QSM::Configure::Default::GetDefaultChunkSize;
using QSM::Configure::Default::GetDefaultCredentialsFile;
using QSM::Configure::Default::GetDefaultHostName;
using QSM::Configure::Default::GetDefaultLogLevelName;
using QSM::Configure::Default::GetDefaultPort;
using QSM::Configure::Default::GetDefaultProtocolName;
using QSM::Configure::Default::GetDefaultRequestTimeOut;
using QSM::Configure::Default::GetDefaultRetries;
using QSM::Configure::Default::GetDefaultStagingDirectory;
using QSM::Configure::Default::GetDefaultWorkerCount;
using QSM::Configure::Default::GetDefaultZone;
using QSM::Logging::GetLogLevelByName;
using QSM::Logging::GetLogLevelName;
using std::ostream;
using std::string;

// --------------------------------------------------------------------------
Options::Options()
    : m_source(),
      m_destination(),
      m_zone(GetDefaultZone()),
      m_credentialsFile(GetDefaultCredentialsFile()),
      m_stagingDir(GetDefaultStagingDirectory()),
      m_logDirectory(),
      m_logLevel(GetLogLevelByName(GetDefaultLogLevelName())),
      m_workerCount(GetDefaultWorkerCount()),
      m_chunkSizeInMB(GetDefaultChunkSize() / QSM::Size::MB1),
      m_retries(GetDefaultRetries()),
      m_requestTimeOut(GetDefaultRequestTimeOut()),
      m_host(GetDefaultHostName()),
      m_protocol(GetDefaultProtocolName()),
      m_port(GetDefaultPort(GetDefaultProtocolName())),
      m_additionalAgent(),
      m_strictVerify(false),
      m_debug(false),
      m_showHelp(false),
      m_showVersion(false) {}

// --------------------------------------------------------------------------
ostream &operator<<(ostream &os, const Options &opts) {
  return os << "[source: " << opts.m_source << "] "
            << "[destination: " << opts.m_destination << "] "
            << "[zone: " << opts.m_zone << "] "
            << "[credentials: " << opts.m_credentialsFile << "] "
            << "[staging dir: " << opts.m_stagingDir << "] "
            << "[log directory: " << opts.m_logDirectory << "] "
            << "[log level: " << GetLogLevelName(opts.m_logLevel) << "] "
            << "[workers: " << to_string(opts.m_workerCount) << "] "
            << "[chunk size(MB): " << to_string(opts.m_chunkSizeInMB) << "] "
            << "[retries: " << to_string(opts.m_retries) << "] "
            << "[req timeout(s): " << to_string(opts.m_requestTimeOut) << "] "
            << "[host: " << opts.m_host << "] "
            << "[protocol: " << opts.m_protocol << "] "
            << "[port: " << to_string(opts.m_port) << "] "
            << "[additional agent: " << opts.m_additionalAgent << "] "
            << std::boolalpha
            << "[strict verify: " << opts.m_strictVerify << "] "
            << "[debug: " << opts.m_debug << "] "
            << "[show help: " << opts.m_showHelp << "] "
            << "[show version: " << opts.m_showVersion << "]"
            << std::noboolalpha;
}

}  // namespace Configure
}  // namespace QSM

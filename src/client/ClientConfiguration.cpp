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

#include "client/ClientConfiguration.h"

#include <string>

#include "base/Utils.h"
#include "configure/Default.h"
#include "configure/Options.h"

namespace QSM {

namespace Client {

using QSM::Configure::Default::GetDefaultHostName;
using QSM::Configure::Default::GetDefaultPort;
using QSM::Configure::Default::GetDefaultProtocolName;
using QSM::Configure::Default::GetDefaultRequestTimeOut;
using QSM::Configure::Default::GetDefaultZone;
using std::string;

namespace {

// sdk writes its own log files, keep them beside ours
string GetSDKLogDir(const string &logdir) {
  return logdir.empty() ? string("/tmp/")
                        : QSM::Utils::AppendPathDelim(logdir) + "sdk/";
}

}  // namespace

// --------------------------------------------------------------------------
ClientConfiguration::ClientConfiguration()
    : m_zone(GetDefaultZone()),
      m_host(GetDefaultHostName()),
      m_protocol(GetDefaultProtocolName()),
      m_port(GetDefaultPort(GetDefaultProtocolName())),
      m_additionalUserAgent(),
      m_sdkLogDirectory(GetSDKLogDir(string())),
      m_transactionTimeDuration(GetDefaultRequestTimeOut()) {}

// --------------------------------------------------------------------------
ClientConfiguration::ClientConfiguration(
    const QSM::Configure::Options &options)
    : m_zone(options.GetZone()),
      m_host(options.GetHost()),
      m_protocol(options.GetProtocol()),
      m_port(options.GetPort()),
      m_additionalUserAgent(options.GetAdditionalAgent()),
      m_sdkLogDirectory(GetSDKLogDir(options.GetLogDirectory())),
      m_transactionTimeDuration(options.GetRequestTimeOut()) {}

}  // namespace Client
}  // namespace QSM

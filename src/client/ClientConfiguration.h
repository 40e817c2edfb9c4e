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

#ifndef QSMOVE_CLIENT_CLIENTCONFIGURATION_H_
#define QSMOVE_CLIENT_CLIENTCONFIGURATION_H_

#include <stdint.h>

#include <string>

namespace QSM {

namespace Configure {
class Options;
}  // namespace Configure

namespace Client {

//
// Endpoint settings shared by all qingstor buckets of a run
//
class ClientConfiguration {
 public:
  ClientConfiguration();
  explicit ClientConfiguration(const QSM::Configure::Options &options);

 public:
  const std::string &GetZone() const { return m_zone; }
  const std::string &GetHost() const { return m_host; }
  const std::string &GetProtocol() const { return m_protocol; }
  uint16_t GetPort() const { return m_port; }
  const std::string &GetAdditionalAgent() const {
    return m_additionalUserAgent;
  }
  const std::string &GetSDKLogDirectory() const { return m_sdkLogDirectory; }
  uint32_t GetTransactionTimeDuration() const {
    return m_transactionTimeDuration;
  }

  void SetZone(const std::string &zone) { m_zone = zone; }
  void SetHost(const std::string &host) { m_host = host; }
  void SetProtocol(const std::string &protocol) { m_protocol = protocol; }
  void SetPort(uint16_t port) { m_port = port; }

 private:
  std::string m_zone;  // default zone of buckets
  std::string m_host;
  std::string m_protocol;
  uint16_t m_port;
  std::string m_additionalUserAgent;
  std::string m_sdkLogDirectory;
  uint32_t m_transactionTimeDuration;  // in seconds
};

}  // namespace Client
}  // namespace QSM


#endif  // QSMOVE_CLIENT_CLIENTCONFIGURATION_H_

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

#include "cli/Parser.h"

#include <stdint.h>

#include <string>
#include <vector>

#include "boost/exception/to_string.hpp"
#include "boost/program_options.hpp"

#include "base/LogLevel.h"
#include "base/Size.h"
#include "base/StringUtils.h"
#include "configure/Default.h"
#include "configure/Options.h"
#include "transfer/TransferError.h"

namespace QSM {

namespace Cli {

namespace Parser {

namespace po = boost::program_options;

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
using QSM::Transfer::ConfigurationError;
using std::string;

namespace {

// --------------------------------------------------------------------------
void CheckRange(const char *opt, long long value, long long min,  // NOLINT
                long long max) {                                 // NOLINT
  if (value < min || value > max) {
    throw ConfigurationError("Invalid value " + to_string(value) +
                             " of option " + opt + ", expect [" +
                             to_string(min) + ", " + to_string(max) + "]");
  }
}

// --------------------------------------------------------------------------
bool IsValidLogLevelName(const string &name) {
  string upper = QSM::StringUtils::ToUpper(name);
  return upper == "INFO" || upper == "WARN" || upper == "ERROR" ||
         upper == "FATAL";
}

}  // namespace

// --------------------------------------------------------------------------
void Parse(int argc, char **argv) {
  typedef long long Number;  // NOLINT

  po::options_description desc("qsmove options");
  desc.add_options()
    ("workers,n",
     po::value<Number>()->default_value(GetDefaultWorkerCount()))
    ("chunksize,b",
     po::value<Number>()->default_value(GetDefaultChunkSize() /
                                        QSM::Size::MB1))
    ("retries,r", po::value<Number>()->default_value(GetDefaultRetries()))
    ("stagingdir,k",
     po::value<string>()->default_value(GetDefaultStagingDirectory()))
    ("credentials,c",
     po::value<string>()->default_value(GetDefaultCredentialsFile()))
    ("zone,z", po::value<string>()->default_value(GetDefaultZone()))
    ("host,H", po::value<string>()->default_value(GetDefaultHostName()))
    ("protocol,p",
     po::value<string>()->default_value(GetDefaultProtocolName()))
    ("port,P", po::value<Number>())
    ("reqtimeout,R",
     po::value<Number>()->default_value(GetDefaultRequestTimeOut()))
    ("agent,a", po::value<string>()->default_value(""))
    ("strict-verify,s", po::bool_switch())
    ("logdir,l", po::value<string>()->default_value(""))
    ("loglevel,L",
     po::value<string>()->default_value(GetDefaultLogLevelName()))
    ("debug,d", po::bool_switch())
    ("help,h", po::bool_switch())
    ("version,V", po::bool_switch())
    ("location", po::value<std::vector<string> >());

  po::positional_options_description pod;
  pod.add("location", -1);

  po::variables_map vm;
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(desc)
                  .positional(pod)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error &err) {
    throw ConfigurationError(string("Error while parsing command line: ") +
                             err.what());
  }

  QSM::Configure::Options &options = QSM::Configure::Options::Instance();
  options.SetShowHelp(vm["help"].as<bool>());
  options.SetShowVersion(vm["version"].as<bool>());
  options.SetDebug(vm["debug"].as<bool>());
  options.SetStrictVerify(vm["strict-verify"].as<bool>());

  options.SetLogDirectory(vm["logdir"].as<string>());
  string logLevel = vm["loglevel"].as<string>();
  if (!IsValidLogLevelName(logLevel)) {
    throw ConfigurationError("Invalid log level " + logLevel +
                             ", expect one of INFO,WARN,ERROR,FATAL");
  }
  options.SetLogLevel(QSM::Logging::GetLogLevelByName(
      QSM::StringUtils::ToUpper(logLevel)));

  if (options.IsNoTransfer()) {
    return;
  }

  std::vector<string> locations;
  if (vm.count("location") > 0) {
    locations = vm["location"].as<std::vector<string> >();
  }
  if (locations.size() < 2) {
    throw ConfigurationError(locations.empty()
                                 ? "Missing SOURCE and DESTINATION parameters"
                                 : "Missing DESTINATION parameter");
  }
  if (locations.size() > 2) {
    throw ConfigurationError("Unexpected parameter " + locations[2]);
  }
  options.SetSource(locations[0]);
  options.SetDestination(locations[1]);

  Number workers = vm["workers"].as<Number>();
  CheckRange("-n|--workers", workers, 1, 1024);
  options.SetWorkerCount(static_cast<size_t>(workers));

  Number chunkSize = vm["chunksize"].as<Number>();
  CheckRange("-b|--chunksize", chunkSize, 1,
             QSM::Configure::Default::GetUploadMultipartMaxPartSize() /
                 QSM::Size::MB1);
  options.SetChunkSizeInMB(static_cast<uint64_t>(chunkSize));

  Number retries = vm["retries"].as<Number>();
  CheckRange("-r|--retries", retries, 0,
             QSM::Configure::Default::GetMaxRetries());
  options.SetRetries(static_cast<uint16_t>(retries));

  Number timeout = vm["reqtimeout"].as<Number>();
  CheckRange("-R|--reqtimeout", timeout, 1, 86400);
  options.SetRequestTimeOut(static_cast<uint32_t>(timeout));

  string protocol = QSM::StringUtils::ToLower(vm["protocol"].as<string>());
  if (protocol != "https" && protocol != "http") {
    throw ConfigurationError("Invalid protocol " + protocol +
                             ", expect https or http");
  }
  options.SetProtocol(protocol);
  if (vm.count("port") > 0) {
    Number port = vm["port"].as<Number>();
    CheckRange("-P|--port", port, 1, 65535);
    options.SetPort(static_cast<uint16_t>(port));
  } else {
    options.SetPort(GetDefaultPort(protocol));
  }

  options.SetStagingDirectory(vm["stagingdir"].as<string>());
  options.SetCredentialsFile(vm["credentials"].as<string>());
  options.SetZone(vm["zone"].as<string>());
  options.SetHost(vm["host"].as<string>());
  options.SetAdditionalAgent(vm["agent"].as<string>());
}

}  // namespace Parser
}  // namespace Cli
}  // namespace QSM

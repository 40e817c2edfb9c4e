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

#include <iostream>
#include <string>

#include "boost/shared_ptr.hpp"

#include "base/Exception.h"
#include "base/LogMacros.h"
#include "base/Logging.h"
#include "cli/HelpText.h"
#include "cli/JobBuilder.h"
#include "cli/Parser.h"
#include "client/ClientConfiguration.h"
#include "client/ObjectStore.h"
#include "client/ObjectStoreFactory.h"
#include "client/QSBucketClient.h"
#include "configure/Options.h"
#include "transfer/TransferError.h"
#include "transfer/TransferOrchestrator.h"

using boost::shared_ptr;
using QSM::Cli::HelpText::ShowQSMoveHelp;
using QSM::Cli::HelpText::ShowQSMoveUsage;
using QSM::Cli::HelpText::ShowQSMoveVersion;
using QSM::Cli::TransferPlan;
using QSM::Client::ClientConfiguration;
using QSM::Client::ObjectSink;
using QSM::Client::ObjectSource;
using QSM::Client::ObjectStoreFactory;
using QSM::Client::QSBucketClient;
using QSM::Configure::Options;
using QSM::Exception::QSMException;
using QSM::Transfer::ConfigurationError;
using QSM::Transfer::TransferError;
using QSM::Transfer::TransferOrchestrator;
using QSM::Transfer::TransferResult;
using QSM::Transfer::TransferState;
using QSM::Transfer::TransferStateToString;
using std::string;

namespace {

const int EXIT_OK = 0;
const int EXIT_FAILURE_GENERIC = 1;
const int EXIT_CONFIGURATION = 2;

void PrintFailure(TransferState::Value phase, const string &cause) {
  std::cerr << "Error during file transfer: [" << TransferStateToString(phase)
            << "] " << cause << std::endl;
}

int ExitCodeOf(TransferError::Value err) {
  if (err == TransferError::GOOD) {
    return EXIT_OK;
  }
  return err == TransferError::CONFIGURATION ? EXIT_CONFIGURATION
                                             : EXIT_FAILURE_GENERIC;
}

}  // namespace

int main(int argc, char **argv) {
  // Parse command line arguments.
  try {
    QSM::Cli::Parser::Parse(argc, argv);
  } catch (const ConfigurationError &err) {
    ShowQSMoveUsage();
    PrintFailure(TransferState::Idle, err.what());
    return EXIT_CONFIGURATION;
  }

  const Options &options = Options::Instance();
  if (options.IsNoTransfer()) {
    if (options.IsShowVersion()) {
      ShowQSMoveVersion();
    }
    if (options.IsShowHelp()) {
      ShowQSMoveHelp();
    }
    return EXIT_OK;
  }

  // Notice: DO NOT use logging before initialization done.
  try {
    QSM::Logging::Log &log = QSM::Logging::Log::Instance();
    log.Initialize(options.GetLogDirectory());
    log.SetLogLevel(options.GetLogLevel());
    log.SetDebug(options.IsDebug());
  } catch (const QSMException &err) {
    PrintFailure(TransferState::Idle, err.what());
    return EXIT_CONFIGURATION;
  }
  DebugInfo("Options " << options);

  shared_ptr<ObjectSource> source;
  shared_ptr<ObjectSink> sink;
  TransferResult result;
  try {
    TransferPlan plan = QSM::Cli::BuildTransferPlan(options);
    ObjectStoreFactory factory((ClientConfiguration(options)),
                               options.GetCredentialsFile());
    try {
      source = factory.MakeSource(plan.m_source);
      sink = factory.MakeSink(plan.m_destination);
    } catch (const QSMException &err) {
      // credentials or unsupported location
      throw ConfigurationError(err.what());
    }

    TransferOrchestrator orchestrator(source, sink);
    result = orchestrator.Run(plan.m_job);
  } catch (const ConfigurationError &err) {
    Error(err.what());
    PrintFailure(TransferState::Idle, err.what());
    QSBucketClient::CloseQSService();
    return EXIT_CONFIGURATION;
  }

  if (result.m_success) {
    std::cout << result.m_message << std::endl;
  } else {
    PrintFailure(result.m_failedPhase, result.m_message);
  }

  source.reset();
  sink.reset();
  QSBucketClient::CloseQSService();
  return ExitCodeOf(result.m_error);
}

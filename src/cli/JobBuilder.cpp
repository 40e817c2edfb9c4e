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

#include "cli/JobBuilder.h"

#include <string>
#include <utility>

#include "base/Size.h"
#include "configure/Default.h"
#include "configure/Options.h"
#include "transfer/TransferError.h"

namespace QSM {

namespace Cli {

using QSM::Client::ObjectLocation;
using QSM::Client::ParseObjectLocation;
using QSM::Client::ResolveDestinationKey;
using QSM::Configure::Options;
using QSM::Transfer::ConfigurationError;
using QSM::Transfer::TransferJob;
using std::pair;
using std::string;

namespace {

// --------------------------------------------------------------------------
ObjectLocation ParseLocation(const char *name, const string &str) {
  if (str.empty()) {
    throw ConfigurationError(string("Missing ") + name + " parameter");
  }
  ObjectLocation location;
  pair<bool, string> outcome = ParseObjectLocation(str, &location);
  if (!outcome.first) {
    throw ConfigurationError(string("Invalid ") + name + ": " +
                             outcome.second);
  }
  return location;
}

}  // namespace

// --------------------------------------------------------------------------
TransferPlan BuildTransferPlan(const Options &options) {
  ObjectLocation source = ParseLocation("SOURCE", options.GetSource());
  if (source.IsContainer()) {
    throw ConfigurationError("SOURCE " + options.GetSource() +
                             " must name an object");
  }
  ObjectLocation destination =
      ParseLocation("DESTINATION", options.GetDestination());
  destination.m_key = ResolveDestinationKey(source.m_key, destination);

  TransferJob job(source.m_key, destination.m_key, options.GetWorkerCount(),
                  options.GetChunkSizeInMB() * QSM::Size::MB1,
                  options.GetRetries(),
                  QSM::Configure::Default::GetDefaultRetryScaleFactor(),
                  options.IsStrictVerify(), options.GetStagingDirectory());
  return TransferPlan(source, destination, job);
}

}  // namespace Cli
}  // namespace QSM

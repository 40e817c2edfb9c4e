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

#ifndef QSMOVE_CLI_JOBBUILDER_H_
#define QSMOVE_CLI_JOBBUILDER_H_

#include "client/ObjectLocation.h"
#include "transfer/TransferJob.h"

namespace QSM {

namespace Configure {
class Options;
}  // namespace Configure

namespace Cli {

//
// Source and destination of a run with the job moving between them
//
struct TransferPlan {
  QSM::Client::ObjectLocation m_source;
  QSM::Client::ObjectLocation m_destination;
  QSM::Transfer::TransferJob m_job;

  TransferPlan(const QSM::Client::ObjectLocation &source,
               const QSM::Client::ObjectLocation &destination,
               const QSM::Transfer::TransferJob &job)
      : m_source(source), m_destination(destination), m_job(job) {}
};

// Build transfer plan from options
//
// Throw ConfigurationError if a location is missing or invalid
TransferPlan BuildTransferPlan(const QSM::Configure::Options &options);

}  // namespace Cli
}  // namespace QSM

#endif  // QSMOVE_CLI_JOBBUILDER_H_

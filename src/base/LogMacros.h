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

#ifndef QSMOVE_BASE_LOGMACROS_H_
#define QSMOVE_BASE_LOGMACROS_H_

#include "glog/logging.h"

#include "base/LogLevel.h"
#include "base/Logging.h"

#ifdef DISABLE_QSMOVE_LOGGING
#define Info(msg)
#define Warning(msg)
#define Error(msg)
#define Fatal(msg)

#define InfoIf(condition, msg)
#define WarningIf(condition, msg)
#define ErrorIf(condition, msg)
#define FatalIf(condition, msg)

#define DebugInfo(msg)
#define DebugWarning(msg)
#define DebugError(msg)

#else  // !DISABLE_QSMOVE_LOGGING

#define QSMOVE_LOG_PREFIX(level) \
  QSM::Logging::GetLogLevelPrefix(QSM::Logging::LogLevel::level)

#define QSMOVE_IS_DEBUG() QSM::Logging::Log::Instance().IsDebug()

// Flush INFO stream for every non-fatal message, so progress lines of
// concurrent workers show up in order they were emitted.
#define QSMOVE_LOG(severity, level, msg)                \
  {                                                     \
    LOG(severity) << QSMOVE_LOG_PREFIX(level) << msg;   \
    google::FlushLogFiles(google::INFO);                \
  }

#define QSMOVE_LOG_IF(severity, level, condition, msg)                  \
  {                                                                     \
    LOG_IF(severity, (condition)) << QSMOVE_LOG_PREFIX(level) << msg;   \
    google::FlushLogFiles(google::INFO);                                \
  }

#define Info(msg) QSMOVE_LOG(INFO, Info, msg)
#define Warning(msg) QSMOVE_LOG(WARNING, Warn, msg)
#define Error(msg) QSMOVE_LOG(ERROR, Error, msg)
#define Fatal(msg) \
  { LOG(FATAL) << QSMOVE_LOG_PREFIX(Fatal) << msg; }

#define InfoIf(condition, msg) QSMOVE_LOG_IF(INFO, Info, condition, msg)
#define WarningIf(condition, msg) QSMOVE_LOG_IF(WARNING, Warn, condition, msg)
#define ErrorIf(condition, msg) QSMOVE_LOG_IF(ERROR, Error, condition, msg)
#define FatalIf(condition, msg) \
  { LOG_IF(FATAL, (condition)) << QSMOVE_LOG_PREFIX(Fatal) << msg; }

#define DebugInfo(msg)                                     \
  {                                                        \
    if (QSMOVE_IS_DEBUG()) QSMOVE_LOG(INFO, Info, msg)     \
  }

#define DebugWarning(msg)                                  \
  {                                                        \
    if (QSMOVE_IS_DEBUG()) QSMOVE_LOG(WARNING, Warn, msg)  \
  }

#define DebugError(msg)                                    \
  {                                                        \
    if (QSMOVE_IS_DEBUG()) QSMOVE_LOG(ERROR, Error, msg)   \
  }

#endif  // DISABLE_QSMOVE_LOGGING

#endif  // QSMOVE_BASE_LOGMACROS_H_

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

#include "configure/Default.h"

#include <sys/stat.h>
#include <sys/types.h>

#include <string>

#include "base/Size.h"
#include "base/StringUtils.h"

namespace QSM {

namespace Configure {

namespace Default {

using std::string;

static const char* const PROGRAM_NAME = "qsmove";
static const char* const QSMOVE_DEFAULT_CREDENTIALS = "/etc/qsmove.cred";
static const char* const QSMOVE_DEFAULT_STAGING_DIR = "/tmp/qsmove_staging/";
static const char* const QSMOVE_DEFAULT_LOGLEVEL_NAME = "INFO";
static const char* const QSMOVE_DEFAULT_HOST = "qingstor.com";
static const char* const QSMOVE_DEFAULT_PROTOCOL = "https";
static const char* const QSMOVE_DEFAULT_ZONE = "pek3a";
static const size_t QSMOVE_DEFAULT_WORKERS = 15;
static const uint16_t QSMOVE_DEFAULT_RETRIES = 5;
static const uint32_t QSMOVE_DEFAULT_RETRY_SCALE_FACTOR = 25;
static const uint16_t QSMOVE_MAX_RETRIES = 10;
static const uint32_t QSMOVE_MAX_RETRY_DELAY = 30000;
static const uint32_t QSMOVE_DEFAULT_REQUEST_TIMEOUT = 300;

const char* GetProgramName() { return PROGRAM_NAME; }

string GetDefaultCredentialsFile() { return QSMOVE_DEFAULT_CREDENTIALS; }
string GetDefaultStagingDirectory() { return QSMOVE_DEFAULT_STAGING_DIR; }
string GetDefaultLogLevelName() { return QSMOVE_DEFAULT_LOGLEVEL_NAME; }
string GetDefaultHostName() { return QSMOVE_DEFAULT_HOST; }

uint16_t GetDefaultPort(const string& protocolName) {
  static const uint16_t HTTP_DEFAULT_PORT = 80;
  static const uint16_t HTTPS_DEFAULT_PORT = 443;
  return QSM::StringUtils::ToLower(protocolName) == "http"
             ? HTTP_DEFAULT_PORT
             : HTTPS_DEFAULT_PORT;
}

string GetDefaultProtocolName() { return QSMOVE_DEFAULT_PROTOCOL; }
string GetDefaultZone() { return QSMOVE_DEFAULT_ZONE; }

mode_t GetDefineFileMode() { return (S_IRUSR | S_IWUSR); }
mode_t GetDefineDirMode() {
  return (S_IRWXU | S_IRGRP | S_IXGRP | S_IROTH | S_IXOTH);
}

int GetMaxLogSize() { return 100; }

size_t GetDefaultWorkerCount() { return QSMOVE_DEFAULT_WORKERS; }

uint64_t GetDefaultChunkSize() { return QSM::Size::MB10; }

uint16_t GetDefaultRetries() { return QSMOVE_DEFAULT_RETRIES; }

uint32_t GetDefaultRetryScaleFactor() {
  return QSMOVE_DEFAULT_RETRY_SCALE_FACTOR;
}

// --------------------------------------------------------------------------
uint16_t GetMaxRetries() { return QSMOVE_MAX_RETRIES; }

// --------------------------------------------------------------------------
uint32_t GetMaxRetryDelay() { return QSMOVE_MAX_RETRY_DELAY; }

uint32_t GetDefaultRequestTimeOut() { return QSMOVE_DEFAULT_REQUEST_TIMEOUT; }

size_t GetDigestBlockSize() { return QSM::Size::KB8; }

uint64_t GetUploadMultipartMinPartSize() {
  // qingstor specific, except for the last part
  return QSM::Size::MB4;
}

uint64_t GetUploadMultipartMaxPartSize() { return QSM::Size::GB1 * 5; }

size_t GetUploadMultipartMaxPartCount() { return 10000; }

}  // namespace Default
}  // namespace Configure
}  // namespace QSM

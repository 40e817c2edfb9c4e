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

#ifndef QSMOVE_CONFIGURE_DEFAULT_H_
#define QSMOVE_CONFIGURE_DEFAULT_H_

#include <stddef.h>
#include <stdint.h>  // for fixed width integer types

#include <sys/types.h>  // for mode_t

#include <string>

namespace QSM {

namespace Configure {

namespace Default {

const char* GetProgramName();

std::string GetDefaultCredentialsFile();
std::string GetDefaultStagingDirectory();
std::string GetDefaultLogLevelName();
std::string GetDefaultHostName();
uint16_t GetDefaultPort(const std::string& protocolName);
std::string GetDefaultProtocolName();
std::string GetDefaultZone();

mode_t GetDefineFileMode();
mode_t GetDefineDirMode();

int GetMaxLogSize();  // in MB

size_t GetDefaultWorkerCount();
uint64_t GetDefaultChunkSize();
uint16_t GetDefaultRetries();
uint32_t GetDefaultRetryScaleFactor();  // in milliseconds
uint16_t GetMaxRetries();
uint32_t GetMaxRetryDelay();  // in milliseconds
uint32_t GetDefaultRequestTimeOut();    // in seconds

size_t GetDigestBlockSize();

// qingstor multipart upload limits
uint64_t GetUploadMultipartMinPartSize();
uint64_t GetUploadMultipartMaxPartSize();
size_t GetUploadMultipartMaxPartCount();

}  // namespace Default
}  // namespace Configure
}  // namespace QSM

#endif  // QSMOVE_CONFIGURE_DEFAULT_H_

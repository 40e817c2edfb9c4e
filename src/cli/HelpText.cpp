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

#include "cli/HelpText.h"

#include <iostream>
#include <string>

#include "boost/exception/to_string.hpp"

#include "base/Size.h"
#include "configure/Default.h"
#include "configure/Version.h"

namespace QSM {

namespace Cli {

namespace HelpText {

using boost::to_string;
using QSM::Configure::Default::GetDefaultChunkSize;
using QSM::Configure::Default::GetDefaultCredentialsFile;
using QSM::Configure::Default::GetDefaultHostName;
using QSM::Configure::Default::GetDefaultLogLevelName;
using QSM::Configure::Default::GetDefaultProtocolName;
using QSM::Configure::Default::GetDefaultRequestTimeOut;
using QSM::Configure::Default::GetDefaultRetries;
using QSM::Configure::Default::GetDefaultStagingDirectory;
using QSM::Configure::Default::GetDefaultWorkerCount;
using QSM::Configure::Default::GetDefaultZone;
using QSM::Configure::Default::GetMaxRetries;
using std::cout;
using std::endl;

void ShowQSMoveVersion() {
  cout << "qsmove version: " << QSM::Configure::Version::GetVersionString()
       << endl;
}

void ShowQSMoveHelp() {
  cout <<
  "Move one large object between object stores with parallel ranged reads,\n"
  "a local staging file and parallel multipart upload.\n";
  ShowQSMoveUsage();
  cout <<
  "\n"
  "  locations\n"
  "    file:///absolute/path      a local file, or a directory if ending with '/'\n"
  "    qs://bucket[@zone]/key     a QingStor object, or a bucket if key is empty\n"
  "  when DESTINATION is a directory or bucket, the source file name is used as key\n"
  "\n"
  "qsmove Options:\n"
  "Mandatory argements to long options are mandatory for short options too.\n"
  "  -n, --workers      Concurrent workers of download and upload, default value\n"
  "                     is " << to_string(GetDefaultWorkerCount()) << "\n"
  "  -b, --chunksize    Chunk and part size(MB), default value is "
                        << to_string(GetDefaultChunkSize() / QSM::Size::MB1) << "MB\n"
  "  -r, --retries      Number of times to retry a failed chunk or part, default\n"
  "                     value is " << to_string(GetDefaultRetries()) << " times, at most "
                        << to_string(GetMaxRetries()) << "\n"
  "  -k, --stagingdir   Directory of the staging file, default path is\n"
  "                     " << GetDefaultStagingDirectory() << "\n"
  "  -c, --credentials  Specify credentials file, default path is " <<
                          GetDefaultCredentialsFile() << "\n" <<
  "  -z, --zone         Zone of qs locations without zone, default value is "
                        << GetDefaultZone() << "\n"
  "  -H, --host         Host name, default value is " << GetDefaultHostName() << "\n" <<
  "  -p, --protocol     Protocol could be https or http, default value is " <<
                                              GetDefaultProtocolName() << "\n" <<
  "  -P, --port         Specify port, default is 443 for https and 80 for http\n"
  "  -R, --reqtimeout   Time(seconds) to wait before timing out a request, default value\n"
  "                     is " << to_string(GetDefaultRequestTimeOut()) << " seconds\n"
  "  -a, --agent        Additional user agent\n"
  "  -s, --strict-verify  Fail if the digest reported by destination differs from\n"
  "                     the digest of the staged object, destination must\n"
  "                     report an MD5 digest (file:// does)\n"
  "  -l, --logdir       Specify log directory, log to STDERR if not set\n"
  "  -L, --loglevel     Min log level, message lower than this level don't logged;\n"
  "                     Specify one of following log level: INFO,WARN,ERROR,FATAL;\n"
  "                     " << GetDefaultLogLevelName() << " is set by default\n"
  "\n"
  "Miscellaneous Options:\n"
  "  -d, --debug        Turn on debug messages\n"
  "  -h, --help         Print qsmove help\n"
  "  -V, --version      Print qsmove version\n"
  "\n"
  "Exit status is 0 on success, 2 on configuration error and 1 otherwise.\n";
  cout.flush();
}

void ShowQSMoveUsage() {
  cout <<
  "Usage: qsmove <SOURCE> <DESTINATION>\n"
  "       [-n|--workers=[value]] [-b|--chunksize=[value]]\n"
  "       [-r|--retries=[value]] [-k|--stagingdir=[dir]]\n"
  "       [-c|--credentials=[file path]] [-z|--zone=[value]]\n"
  "       [-H|--host=[value]] [-p|--protocol=[value]]\n"
  "       [-P|--port=[value]] [-R|--reqtimeout=[value]]\n"
  "       [-a|--agent=[value]] [-s|--strict-verify]\n"
  "       [-l|--logdir=[dir]] [-L|--loglevel=[INFO|WARN|ERROR|FATAL]]\n"
  "       [-d|--debug]\n"
  "       [-h|--help] [-V|--version]\n";
  cout.flush();
}

}  // namespace HelpText
}  // namespace Cli
}  // namespace QSM

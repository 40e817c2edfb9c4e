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

#ifndef QSMOVE_BASE_UTILS_H_
#define QSMOVE_BASE_UTILS_H_

#include <stdint.h>
#include <sys/stat.h>
#include <sys/types.h>

#include <string>
#include <utility>

namespace QSM {

namespace Utils {

// Create directory, including any missing parent directory
//
// @param  : dir path
// @return : true if the directory exists or has been created
bool CreateDirectoryIfNotExists(const std::string &path);

// Remove file
//
// @param  : file path
// @return : true if the file is removed or not existing
bool RemoveFileIfExists(const std::string &path);

// Delete all files in the directory, and the directory itself if asked
//
// @param  : dir path, flag to delete directory itself
// @return : {success, error message}
std::pair<bool, std::string> DeleteFilesInDirectory(const std::string &path,
                                                    bool deleteSelf);

bool FileExists(const std::string &path);

// @return : {is directory, error message}
std::pair<bool, std::string> IsDirectory(const std::string &path);

// Check if process has read/write/execute permission of path
//
// @param  : path
// @return : {has permission, error message}
std::pair<bool, std::string> HavePermission(const std::string &path);
std::pair<bool, std::string> HavePermission(const struct stat *st);

// @param  : absolute path
// @return : {free bytes of the file system holding path, error message}
std::pair<uint64_t, std::string> GetFreeDiskSpace(
    const std::string &absolutePath);

// Check if there is more than freeSpace bytes available
//
// @param  : absolute path, required space in bytes
// @return : {is safe, error message}
std::pair<bool, std::string> IsSafeDiskSpace(const std::string &absolutePath,
                                             uint64_t freeSpace);

bool IsRootDirectory(const std::string &path);

// Append '/' to path if it is not ending with '/'
std::string AppendPathDelim(const std::string &path);

// Get directory name of path, always ending with '/'
std::string GetDirName(const std::string &path);

// Get last component of path
std::string GetBaseName(const std::string &path);

uid_t GetProcessEffectiveUserID();
gid_t GetProcessEffectiveGroupID();

}  // namespace Utils
}  // namespace QSM


#endif  // QSMOVE_BASE_UTILS_H_

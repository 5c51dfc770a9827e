/*
 * Copyright (C) 2017 The Android Open Source Project
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */
#pragma once

#include <sys/stat.h>
#include <sys/types.h>

#include <functional>
#include <string>
#include <vector>

#include "wsabridge/result/result.h"

namespace wsabridge {

bool FileExists(const std::string& path, bool follow_symlinks = true);
bool DirectoryExists(const std::string& path, bool follow_symlinks = true);
bool IsSymlink(const std::string& path);
Result<std::vector<std::string>> DirectoryContents(const std::string& path);
Result<void> EnsureDirectoryExists(const std::string& directory_path,
                                   const mode_t mode = S_IRWXU | S_IRGRP |
                                                       S_IXGRP | S_IROTH |
                                                       S_IXOTH);
bool RecursivelyRemoveDirectory(const std::string& path);
// Removes a file, a symlink or a whole directory tree. Absent paths succeed.
Result<void> RemovePath(const std::string& path);
bool RemoveFile(const std::string& file);

// Sparse aware copy of a regular file. The destination is truncated first.
Result<void> Copy(const std::string& from, const std::string& to);
// Copies a directory tree, recreating symlinks instead of following them.
Result<void> CopyRecursively(const std::string& from, const std::string& to);

Result<std::string> ReadFile(const std::string& file);
Result<void> WriteFile(const std::string& file, const std::string& contents);
Result<std::string> RenameFile(const std::string& current_filepath,
                               const std::string& target_filepath);

std::string AbsolutePath(const std::string& path);
std::string CurrentDirectory();

// The returned value may contain .. or . if these are present in the path
// argument.
// path must not contain ~
std::string cpp_dirname(const std::string& str);

// Recursively enumerate files in |dir|, invoking the callback with the path to
// each file/directory. Symlinked directories are reported but not entered.
// Returning false from the callback skips the contents of that directory.
Result<void> WalkDirectory(
    const std::string& dir,
    const std::function<bool(const std::string&)>& callback);

}  // namespace wsabridge

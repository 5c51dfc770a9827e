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

#include "wsabridge/common/libs/utils/files.h"

#include <dirent.h>
#include <fcntl.h>
#include <ftw.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/sendfile.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <memory>
#include <string>
#include <vector>

#include <android-base/file.h>
#include <android-base/logging.h>
#include <android-base/macros.h>
#include <android-base/unique_fd.h>

namespace wsabridge {

bool FileExists(const std::string& path, bool follow_symlinks) {
  struct stat st {};
  return (follow_symlinks ? stat : lstat)(path.c_str(), &st) == 0;
}

bool DirectoryExists(const std::string& path, bool follow_symlinks) {
  struct stat st {};
  if ((follow_symlinks ? stat : lstat)(path.c_str(), &st) == -1) {
    return false;
  }
  if ((st.st_mode & S_IFMT) != S_IFDIR) {
    return false;
  }
  return true;
}

bool IsSymlink(const std::string& path) {
  struct stat st {};
  return lstat(path.c_str(), &st) == 0 && S_ISLNK(st.st_mode);
}

Result<std::vector<std::string>> DirectoryContents(const std::string& path) {
  std::vector<std::string> ret;
  std::unique_ptr<DIR, int (*)(DIR*)> dir(opendir(path.c_str()), closedir);
  WB_EXPECTF(dir != nullptr, "Could not read from dir \"{}\": {}", path,
             strerror(errno));
  struct dirent* ent{};
  while ((ent = readdir(dir.get()))) {
    ret.emplace_back(ent->d_name);
  }
  return ret;
}

Result<void> EnsureDirectoryExists(const std::string& directory_path,
                                   const mode_t mode) {
  if (DirectoryExists(directory_path, /* follow_symlinks */ true)) {
    return {};
  }
  const auto parent_dir = android::base::Dirname(directory_path);
  if (parent_dir.size() > 1 && parent_dir != directory_path) {
    WB_EXPECT(EnsureDirectoryExists(parent_dir, mode));
  }
  LOG(VERBOSE) << "Setting up " << directory_path;
  if (mkdir(directory_path.c_str(), mode) < 0 && errno != EEXIST) {
    return WB_ERRNO("Failed to create directory: \"" << directory_path
                                                     << "\": "
                                                     << strerror(errno));
  }
  return {};
}

bool RecursivelyRemoveDirectory(const std::string& path) {
  // Copied from libbase TemporaryDir destructor.
  auto callback = [](const char* child, const struct stat*, int file_type,
                     struct FTW*) -> int {
    switch (file_type) {
      case FTW_D:
      case FTW_DP:
      case FTW_DNR:
        if (rmdir(child) == -1) {
          PLOG(ERROR) << "rmdir " << child;
        }
        break;
      case FTW_NS:
      default:
        if (rmdir(child) != -1) {
          break;
        }
        // FALLTHRU (for gcc, lint, pcc, etc; and following for clang)
        FALLTHROUGH_INTENDED;
      case FTW_F:
      case FTW_SL:
      case FTW_SLN:
        if (unlink(child) == -1) {
          PLOG(ERROR) << "unlink " << child;
        }
        break;
    }
    return 0;
  };

  return nftw(path.c_str(), callback, 128, FTW_DEPTH | FTW_MOUNT | FTW_PHYS) ==
             0 &&
         !FileExists(path, /* follow_symlinks */ false);
}

Result<void> RemovePath(const std::string& path) {
  if (!FileExists(path, /* follow_symlinks */ false)) {
    return {};
  }
  if (DirectoryExists(path, /* follow_symlinks */ false)) {
    WB_EXPECTF(RecursivelyRemoveDirectory(path),
               "Failed to remove directory \"{}\"", path);
    return {};
  }
  if (unlink(path.c_str()) != 0) {
    return WB_ERRNO("unlink(\"" << path << "\") failed: " << strerror(errno));
  }
  return {};
}

bool RemoveFile(const std::string& file) {
  LOG(DEBUG) << "Removing file " << file;
  return remove(file.c_str()) == 0;
}

namespace {

bool SendFile(int out_fd, int in_fd, off64_t* offset, size_t count) {
  while (count > 0) {
    const auto bytes_written =
        TEMP_FAILURE_RETRY(sendfile(out_fd, in_fd, offset, count));
    if (bytes_written <= 0) {
      return false;
    }
    count -= bytes_written;
  }
  return true;
}

}  // namespace

Result<void> Copy(const std::string& from, const std::string& to) {
  android::base::unique_fd fd_from(open(from.c_str(), O_RDONLY | O_CLOEXEC));
  if (fd_from.get() < 0) {
    return WB_ERRNO("Could not open \"" << from << "\": " << strerror(errno));
  }
  android::base::unique_fd fd_to(
      open(to.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
  if (fd_to.get() < 0) {
    return WB_ERRNO("Could not open \"" << to << "\": " << strerror(errno));
  }

  off_t farthest_seek = lseek(fd_from.get(), 0, SEEK_END);
  if (farthest_seek == -1) {
    return WB_ERRNO("Could not lseek in \"" << from << "\": "
                                            << strerror(errno));
  }
  if (ftruncate64(fd_to.get(), farthest_seek) < 0) {
    return WB_ERRNO("Failed to ftruncate \"" << to << "\": "
                                             << strerror(errno));
  }
  off64_t offset = 0;
  while (offset < farthest_seek) {
    off_t new_offset = lseek(fd_from.get(), offset, SEEK_HOLE);
    if (new_offset == -1) {
      // ENXIO is returned when there are no more blocks of this type
      // coming.
      if (errno == ENXIO) {
        return {};
      }
      return WB_ERRNO("Could not lseek in \"" << from << "\": "
                                              << strerror(errno));
    }
    auto data_bytes = new_offset - offset;
    if (lseek(fd_to.get(), offset, SEEK_SET) < 0) {
      return WB_ERRNO("lseek() on \"" << to << "\" failed: "
                                      << strerror(errno));
    }
    if (!SendFile(fd_to.get(), fd_from.get(), &offset, data_bytes)) {
      return WB_ERRNO("sendfile() from \"" << from << "\" to \"" << to
                                           << "\" failed: " << strerror(errno));
    }
    if (offset >= farthest_seek) {
      return {};
    }
    new_offset = lseek(fd_from.get(), offset, SEEK_DATA);
    if (new_offset == -1) {
      if (errno == ENXIO) {
        return {};
      }
      return WB_ERRNO("Could not lseek in \"" << from << "\": "
                                              << strerror(errno));
    }
    offset = new_offset;
  }
  return {};
}

Result<void> CopyRecursively(const std::string& from, const std::string& to) {
  struct stat st {};
  if (lstat(from.c_str(), &st) != 0) {
    return WB_ERRNO("lstat(\"" << from << "\") failed: " << strerror(errno));
  }
  if (S_ISLNK(st.st_mode)) {
    std::string target;
    WB_EXPECTF(android::base::Readlink(from, &target),
               "Could not read symlink \"{}\"", from);
    WB_EXPECT(RemovePath(to));
    if (symlink(target.c_str(), to.c_str()) != 0) {
      return WB_ERRNO("symlink(\"" << target << "\", \"" << to
                                   << "\") failed: " << strerror(errno));
    }
    return {};
  }
  if (!S_ISDIR(st.st_mode)) {
    WB_EXPECT(Copy(from, to));
    return {};
  }
  if (FileExists(to, /* follow_symlinks */ false) && !DirectoryExists(to)) {
    WB_EXPECT(RemovePath(to));
  }
  WB_EXPECT(EnsureDirectoryExists(to));
  for (const auto& name : WB_EXPECT(DirectoryContents(from))) {
    if (name == "." || name == "..") {
      continue;
    }
    WB_EXPECT(CopyRecursively(from + "/" + name, to + "/" + name));
  }
  return {};
}

Result<std::string> ReadFile(const std::string& file) {
  std::string contents;
  WB_EXPECTF(android::base::ReadFileToString(file, &contents),
             "Failed to read \"{}\": {}", file, strerror(errno));
  return contents;
}

Result<void> WriteFile(const std::string& file, const std::string& contents) {
  WB_EXPECTF(android::base::WriteStringToFile(contents, file),
             "Failed to write \"{}\": {}", file, strerror(errno));
  return {};
}

Result<std::string> RenameFile(const std::string& current_filepath,
                               const std::string& target_filepath) {
  if (current_filepath != target_filepath) {
    WB_EXPECT(rename(current_filepath.c_str(), target_filepath.c_str()) == 0,
              "rename " << current_filepath << " to " << target_filepath
                        << " failed: " << strerror(errno));
  }
  return target_filepath;
}

std::string AbsolutePath(const std::string& path) {
  if (path.empty()) {
    return {};
  }
  if (path[0] == '/') {
    return path;
  }
  if (path[0] == '~') {
    LOG(WARNING) << "Tilde expansion in path " << path << " is not supported";
    return {};
  }
  return CurrentDirectory() + "/" + path;
}

std::string CurrentDirectory() {
  std::unique_ptr<char, void (*)(void*)> cwd(getcwd(nullptr, 0), &free);
  if (!cwd) {
    PLOG(ERROR) << "`getcwd(nullptr, 0)` failed";
    return "";
  }
  return std::string(cwd.get());
}

std::string cpp_dirname(const std::string& str) {
  return android::base::Dirname(str);
}

Result<void> WalkDirectory(
    const std::string& dir,
    const std::function<bool(const std::string&)>& callback) {
  const auto files = WB_EXPECT(DirectoryContents(dir));
  for (const auto& filename : files) {
    if (filename == "." || filename == "..") {
      continue;
    }
    auto file_path = dir + "/";
    file_path.append(filename);
    bool descend = callback(file_path);
    if (descend && DirectoryExists(file_path, /* follow_symlinks */ false)) {
      WB_EXPECT(WalkDirectory(file_path, callback));
    }
  }
  return {};
}

}  // namespace wsabridge

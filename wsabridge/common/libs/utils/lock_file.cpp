/*
 * Copyright (C) 2023 The Android Open Source Project
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

#include "wsabridge/common/libs/utils/lock_file.h"

#include <fcntl.h>
#include <string.h>
#include <sys/file.h>

#include <android-base/logging.h>

namespace wsabridge {

LockFile::LockFile(android::base::unique_fd fd, std::string lock_file_path)
    : fd_(std::move(fd)), lock_file_path_(std::move(lock_file_path)) {}

LockFile::~LockFile() {
  if (fd_.get() < 0) {
    return;
  }
  if (flock(fd_.get(), LOCK_UN | LOCK_NB) != 0) {
    PLOG(ERROR) << "Unlock the \"" << lock_file_path_ << "\" failed";
  }
}

Result<std::optional<LockFile>> LockFile::TryAcquire(
    const std::string& lock_file_path) {
  android::base::unique_fd fd(
      open(lock_file_path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644));
  if (fd.get() < 0) {
    return WB_ERRNO("open(\"" << lock_file_path
                              << "\"): " << strerror(errno));
  }
  if (flock(fd.get(), LOCK_EX | LOCK_NB) == 0) {
    return std::optional<LockFile>(LockFile(std::move(fd), lock_file_path));
  }
  if (errno == EWOULDBLOCK) {
    return std::optional<LockFile>();
  }
  return WB_ERRNO("flock(\"" << lock_file_path << "\"): " << strerror(errno));
}

}  // namespace wsabridge

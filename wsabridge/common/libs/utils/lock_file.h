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
#pragma once

#include <optional>
#include <string>

#include <android-base/unique_fd.h>

#include "wsabridge/result/result.h"

namespace wsabridge {

// An exclusive flock() on a file, held until the object is destroyed.
// This class is not thread safe.
class LockFile {
 public:
  LockFile(LockFile&&) = default;
  LockFile& operator=(LockFile&&) = default;
  ~LockFile();

  const std::string& LockFilePath() const { return lock_file_path_; }

  // Returns nullopt if another open file description holds the lock.
  static Result<std::optional<LockFile>> TryAcquire(
      const std::string& lock_file_path);

 private:
  LockFile(android::base::unique_fd fd, std::string lock_file_path);

  android::base::unique_fd fd_;
  std::string lock_file_path_;
};

}  // namespace wsabridge

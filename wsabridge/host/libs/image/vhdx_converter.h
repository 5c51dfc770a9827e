/*
 * Copyright (C) 2025 The Android Open Source Project
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

#include <stdint.h>

#include <string>
#include <string_view>

#include "wsabridge/host/libs/image/command_runner.h"
#include "wsabridge/result/result.h"

namespace wsabridge {

// Subset of `qemu-img info --output=json`.
struct ContainerInfo {
  std::string format;
  uint64_t virtual_size = 0;
  uint64_t actual_size = 0;
};

Result<ContainerInfo> ParseQemuImgInfo(std::string_view json);

// Moves partition images between the VHDX container and raw ext4 using
// qemu-img.
class VhdxConverter {
 public:
  explicit VhdxConverter(CommandRunner& runner) : runner_(runner) {}

  Result<void> ToRaw(const std::string& vhdx, const std::string& raw);
  // Converts `raw` into `<vhdx>.new` and returns that path. `vhdx` itself is
  // not touched until Commit.
  Result<std::string> StageVhdx(const std::string& raw,
                                const std::string& vhdx);
  // Renames a staged container over `vhdx`.
  Result<void> Commit(const std::string& staged, const std::string& vhdx);
  // Deletes a staged container that will not be committed.
  void Discard(const std::string& staged);
  Result<ContainerInfo> Inspect(const std::string& path);

 private:
  CommandRunner& runner_;
};

}  // namespace wsabridge

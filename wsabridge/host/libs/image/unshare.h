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

#include <optional>
#include <ostream>
#include <string>

#include "wsabridge/common/libs/utils/size_utils.h"
#include "wsabridge/host/libs/image/command_runner.h"
#include "wsabridge/host/libs/image/image_resizer.h"
#include "wsabridge/result/result.h"

namespace wsabridge {

// How the shared blocks of an image were dealt with.
enum class UnshareMethod {
  // The superblock did not advertise shared blocks.
  kNotShared,
  // `e2fsck -pf -E unshare_blocks`
  kAutomatic,
  // `e2fsck -E unshare_blocks` answering its prompts with "y".
  kInteractive,
  // Only a plain forced repair succeeded. The blocks may still be shared.
  kForcedRepairOnly,
};

std::ostream& operator<<(std::ostream& out, UnshareMethod method);

// Turns an image produced by a container conversion into one whose blocks
// are all owned by the filesystem, so it can be mounted read-write.
class Unsharer {
 public:
  Unsharer(CommandRunner& runner, ImageResizer& resizer)
      : runner_(runner), resizer_(resizer) {}

  // With `final_target` the image ends at that size (the partition that will
  // receive the payload), otherwise at its minimum size.
  Result<UnshareMethod> Materialize(const std::string& image,
                                    std::optional<Sectors> final_target);

 private:
  Result<UnshareMethod> UnshareBlocks(const std::string& image);

  CommandRunner& runner_;
  ImageResizer& resizer_;
};

}  // namespace wsabridge

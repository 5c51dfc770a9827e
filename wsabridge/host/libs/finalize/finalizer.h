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

#include <time.h>

#include <string>

#include "wsabridge/common/libs/utils/size_utils.h"
#include "wsabridge/host/libs/config/install_config.h"
#include "wsabridge/host/libs/image/command_runner.h"
#include "wsabridge/host/libs/image/image_resizer.h"
#include "wsabridge/host/libs/image/vhdx_converter.h"
#include "wsabridge/host/libs/mount/mount_session.h"
#include "wsabridge/host/libs/planner/space_planner.h"
#include "wsabridge/result/result.h"

namespace wsabridge {

// 2009-01-01 00:00:00 UTC, the timestamp of every file in a built image.
inline constexpr time_t kNormalizedTimestamp = 1230768000;

// Sets the access and modification times of `root` and everything below it,
// symlinks included but not followed. Individual failures are logged and
// counted; only an unreadable tree is an error.
Result<size_t> NormalizeTimestamps(const std::string& root, time_t timestamp);

// Takes the images from mounted and modified back to VHDX containers.
class Finalizer {
 public:
  Finalizer(CommandRunner& runner, ImageResizer& resizer,
            VhdxConverter& converter)
      : runner_(runner), resizer_(resizer), converter_(converter) {}

  // Normalizes timestamps, unmounts vendor then system, checks and shrinks
  // both images, converts them over the containers and deletes the raw
  // images. The containers are replaced together or not at all.
  Result<void> Finalize(MountedPartitions& mounts, const InstallConfig& config,
                        const SizePlan& plan);

  // Shrinks filesystem and file to the smallest size resize2fs manages.
  Result<Sectors> ShrinkToMinimum(const std::string& image);

  // Leaves vendor at the size the policy asks for. Returns that size.
  Result<Sectors> ShrinkVendor(const std::string& image, const SizePlan& plan,
                               VendorShrinkPolicy policy);

 private:
  CommandRunner& runner_;
  ImageResizer& resizer_;
  VhdxConverter& converter_;
};

}  // namespace wsabridge

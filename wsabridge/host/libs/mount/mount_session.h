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

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "wsabridge/host/libs/image/command_runner.h"
#include "wsabridge/host/libs/image/vhdx_converter.h"
#include "wsabridge/result/result.h"

namespace wsabridge {

// One loop mount of a raw ext4 image. The image is unmounted exactly once:
// by Unmount() or, if that never succeeded, by the destructor.
class MountSession {
 public:
  static Result<std::unique_ptr<MountSession>> Mount(
      CommandRunner& runner, const std::string& image,
      const std::string& mount_point);

  MountSession(const MountSession&) = delete;
  MountSession& operator=(const MountSession&) = delete;
  ~MountSession();

  // Calling this again after a successful unmount does nothing.
  Result<void> Unmount();

  bool mounted() const { return mounted_; }
  const std::string& image() const { return image_; }
  const std::string& mount_point() const { return mount_point_; }

 private:
  MountSession(CommandRunner& runner, std::string image,
               std::string mount_point);

  CommandRunner& runner_;
  std::string image_;
  std::string mount_point_;
  bool mounted_;
};

struct MountedPartitions {
  std::unique_ptr<MountSession> system;
  std::unique_ptr<MountSession> vendor;
  // Where the partition content starts, the mount point or a directory in it.
  std::string system_root;
  std::string vendor_root;

  // Vendor first, the reverse of the mount order.
  Result<void> UnmountAll();
};

// Returns `mount_point` if bin, etc or lib exist right under it, else
// `mount_point/partition_name` if they exist there. Otherwise logs what the
// mount point contains and returns `mount_point`.
std::string ResolvePartitionRoot(const std::string& mount_point,
                                 const std::string& partition_name);

// Mount points listed in a /proc/self/mounts style table that are `base` or
// below it, deepest first.
std::vector<std::string> MountPointsBelow(std::string_view mounts_table,
                                          const std::string& base);

class MountCoordinator {
 public:
  MountCoordinator(CommandRunner& runner, VhdxConverter& converter)
      : runner_(runner), converter_(converter) {}

  // Mounts system at `<mount_base>/system` and vendor at
  // `<mount_base>/vendor`. If vendor fails, system is unmounted again.
  Result<MountedPartitions> MountPartitions(const std::string& system_image,
                                            const std::string& vendor_image,
                                            const std::string& mount_base);

  // Mounts one image. On failure the image is inspected and a repair is
  // attempted for the log before the error is returned.
  Result<std::unique_ptr<MountSession>> MountImage(
      const std::string& image, const std::string& mount_point);

  // Unmounts whatever an interrupted earlier run left below `mount_base`.
  Result<void> UnmountStale(const std::string& mount_base);

 private:
  void LogMountDiagnostics(const std::string& image);

  CommandRunner& runner_;
  VhdxConverter& converter_;
};

}  // namespace wsabridge

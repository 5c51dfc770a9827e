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

#include "wsabridge/host/libs/mount/mount_session.h"

#include <algorithm>

#include <android-base/logging.h>
#include <android-base/strings.h>

#include "wsabridge/common/libs/utils/files.h"
#include "wsabridge/host/libs/image/fsck.h"

namespace wsabridge {
namespace {

constexpr char kProcMounts[] = "/proc/self/mounts";

Result<void> RunUmount(CommandRunner& runner, const std::string& mount_point) {
  Command umount_cmd("umount");
  umount_cmd.AddParameter(mount_point);
  WB_EXPECTF(RunSuccessfully(runner, std::move(umount_cmd)),
             "Failed to unmount \"{}\"", mount_point);
  return {};
}

// Undoes the octal escapes the kernel uses for blanks in mount paths.
std::string UnescapeMountPath(const std::string& field) {
  std::string out;
  for (size_t i = 0; i < field.size(); i++) {
    if (field[i] == '\\' && i + 3 < field.size() &&
        std::all_of(field.begin() + i + 1, field.begin() + i + 4,
                    [](char c) { return c >= '0' && c <= '7'; })) {
      out.push_back(static_cast<char>((field[i + 1] - '0') * 64 +
                                      (field[i + 2] - '0') * 8 +
                                      (field[i + 3] - '0')));
      i += 3;
    } else {
      out.push_back(field[i]);
    }
  }
  return out;
}

}  // namespace

MountSession::MountSession(CommandRunner& runner, std::string image,
                           std::string mount_point)
    : runner_(runner),
      image_(std::move(image)),
      mount_point_(std::move(mount_point)),
      mounted_(true) {}

Result<std::unique_ptr<MountSession>> MountSession::Mount(
    CommandRunner& runner, const std::string& image,
    const std::string& mount_point) {
  WB_EXPECT(EnsureDirectoryExists(mount_point));
  Command mount_cmd("mount");
  mount_cmd.AddParameter("-t");
  mount_cmd.AddParameter("ext4");
  mount_cmd.AddParameter("-o");
  mount_cmd.AddParameter("loop");
  mount_cmd.AddParameter(image);
  mount_cmd.AddParameter(mount_point);
  WB_EXPECTF(RunSuccessfully(runner, std::move(mount_cmd)),
             "Failed to mount \"{}\" at \"{}\"", image, mount_point);
  LOG(INFO) << "Mounted \"" << image << "\" at \"" << mount_point << "\"";
  return std::unique_ptr<MountSession>(
      new MountSession(runner, image, mount_point));
}

MountSession::~MountSession() {
  if (!mounted_) {
    return;
  }
  auto result = Unmount();
  if (!result.ok()) {
    LOG(ERROR) << "Leaving \"" << mount_point_
               << "\" mounted: " << result.error().Message();
  }
}

Result<void> MountSession::Unmount() {
  if (!mounted_) {
    return {};
  }
  WB_EXPECT(RunUmount(runner_, mount_point_));
  mounted_ = false;
  LOG(DEBUG) << "Unmounted \"" << mount_point_ << "\"";
  return {};
}

Result<void> MountedPartitions::UnmountAll() {
  if (vendor) {
    WB_EXPECT(vendor->Unmount());
  }
  if (system) {
    WB_EXPECT(system->Unmount());
  }
  return {};
}

std::string ResolvePartitionRoot(const std::string& mount_point,
                                 const std::string& partition_name) {
  auto has_layout = [](const std::string& dir) {
    return DirectoryExists(dir + "/bin") || DirectoryExists(dir + "/etc") ||
           DirectoryExists(dir + "/lib");
  };
  if (has_layout(mount_point)) {
    LOG(DEBUG) << "Using direct " << partition_name << " mount: "
               << mount_point;
    return mount_point;
  }
  auto nested = mount_point + "/" + partition_name;
  if (has_layout(nested)) {
    LOG(INFO) << "Using nested " << partition_name << " root: " << nested;
    return nested;
  }
  LOG(WARNING) << "Could not find standard " << partition_name
               << " directories under \"" << mount_point << "\"";
  auto contents = DirectoryContents(mount_point);
  if (contents.ok()) {
    std::sort(contents->begin(), contents->end());
    LOG(WARNING) << "Available entries: "
                 << android::base::Join(*contents, " ");
  } else {
    LOG(WARNING) << "Cannot list \"" << mount_point
                 << "\": " << contents.error().Message();
  }
  return mount_point;
}

std::vector<std::string> MountPointsBelow(std::string_view mounts_table,
                                          const std::string& base) {
  std::vector<std::string> mount_points;
  for (const auto& line :
       android::base::Split(std::string(mounts_table), "\n")) {
    auto fields = android::base::Tokenize(line, " \t");
    if (fields.size() < 2) {
      continue;
    }
    auto mount_point = UnescapeMountPath(fields[1]);
    if (mount_point == base ||
        android::base::StartsWith(mount_point, base + "/")) {
      mount_points.push_back(mount_point);
    }
  }
  std::stable_sort(mount_points.begin(), mount_points.end(),
                   [](const std::string& a, const std::string& b) {
                     return a.size() > b.size();
                   });
  return mount_points;
}

void MountCoordinator::LogMountDiagnostics(const std::string& image) {
  Command file_cmd("file");
  file_cmd.AddParameter(image);
  auto file_output = runner_.Run(std::move(file_cmd));
  if (file_output.ok()) {
    LOG(ERROR) << android::base::Trim(file_output->stdout_content);
  }
  auto container = converter_.Inspect(image);
  if (container.ok()) {
    LOG(ERROR) << "\"" << image << "\" is " << container->format << ", "
               << container->virtual_size << " bytes";
  } else {
    LOG(ERROR) << "Could not inspect \"" << image
               << "\": " << container.error().Message();
  }
  auto repair = ForceRepair(runner_, image);
  if (!repair.ok()) {
    LOG(ERROR) << "Repair attempt failed: " << repair.error().Message();
  }
}

Result<std::unique_ptr<MountSession>> MountCoordinator::MountImage(
    const std::string& image, const std::string& mount_point) {
  auto session = MountSession::Mount(runner_, image, mount_point);
  if (!session.ok()) {
    LogMountDiagnostics(image);
  }
  return session;
}

Result<MountedPartitions> MountCoordinator::MountPartitions(
    const std::string& system_image, const std::string& vendor_image,
    const std::string& mount_base) {
  MountedPartitions partitions;
  partitions.system = WB_EXPECT(MountImage(system_image, mount_base + "/system"));
  // If this fails the system session is released on the way out.
  partitions.vendor = WB_EXPECT(MountImage(vendor_image, mount_base + "/vendor"));
  partitions.system_root =
      ResolvePartitionRoot(partitions.system->mount_point(), "system");
  partitions.vendor_root =
      ResolvePartitionRoot(partitions.vendor->mount_point(), "vendor");
  return partitions;
}

Result<void> MountCoordinator::UnmountStale(const std::string& mount_base) {
  auto table = WB_EXPECT(ReadFile(kProcMounts));
  for (const auto& mount_point : MountPointsBelow(table, mount_base)) {
    LOG(WARNING) << "Unmounting \"" << mount_point
                 << "\" left behind by an earlier run";
    WB_EXPECT(RunUmount(runner_, mount_point));
  }
  return {};
}

}  // namespace wsabridge

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

#include "wsabridge/host/libs/finalize/finalizer.h"

#include <fcntl.h>
#include <string.h>
#include <sys/stat.h>

#include <android-base/logging.h>

#include "wsabridge/common/libs/utils/files.h"
#include "wsabridge/host/libs/image/ext4_info.h"
#include "wsabridge/host/libs/image/fsck.h"

namespace wsabridge {

Result<size_t> NormalizeTimestamps(const std::string& root, time_t timestamp) {
  const struct timespec times[2] = {{timestamp, 0}, {timestamp, 0}};
  size_t failures = 0;
  auto touch = [&times, &failures](const std::string& path) {
    if (utimensat(AT_FDCWD, path.c_str(), times, AT_SYMLINK_NOFOLLOW) != 0) {
      PLOG(WARNING) << "Could not set the timestamps of " << path;
      ++failures;
    }
    return true;
  };
  WB_EXPECTF(DirectoryExists(root), "\"{}\" is not a directory", root);
  WB_EXPECT(WalkDirectory(root, touch));
  touch(root);
  if (failures > 0) {
    LOG(WARNING) << failures << " paths below " << root
                 << " kept their timestamps";
  }
  return failures;
}

Result<Sectors> Finalizer::ShrinkToMinimum(const std::string& image) {
  WB_EXPECT(resizer_.Shrink(image));
  auto info = WB_EXPECTF(ReadExt4Info(image),
                         "Could not read the size of \"{}\" after shrinking",
                         image);
  auto minimum = Sectors::FromBytesRoundUp(info.SizeBytes());
  WB_EXPECT(TruncateFile(image, minimum));
  LOG(INFO) << image << " is now " << HumanReadableBytes(minimum.bytes())
            << ", " << HumanReadableBytes(info.UsedBytes()) << " used";
  return minimum;
}

Result<Sectors> Finalizer::ShrinkVendor(const std::string& image,
                                        const SizePlan& plan,
                                        VendorShrinkPolicy policy) {
  if (policy == VendorShrinkPolicy::kKeepPlanned && !plan.vendor_expanded) {
    auto current = WB_EXPECT(ApparentSize(image));
    LOG(INFO) << "Keeping " << image << " at its planned size of "
              << HumanReadableBytes(current.bytes());
    return current;
  }
  auto minimum = WB_EXPECT(ShrinkToMinimum(image));
  auto final_size = FinalVendorSize(minimum, plan, policy);
  if (final_size != minimum) {
    LOG(INFO) << "Leaving " << HumanReadableBytes((final_size - minimum).bytes())
              << " free on " << image;
    WB_EXPECT(resizer_.ResizeTo(image, final_size));
  }
  return final_size;
}

Result<void> Finalizer::Finalize(MountedPartitions& mounts,
                                 const InstallConfig& config,
                                 const SizePlan& plan) {
  for (const auto* session : {mounts.system.get(), mounts.vendor.get()}) {
    WB_EXPECT(session != nullptr && session->mounted(),
              "Finalizing needs both partitions mounted");
    LOG(INFO) << "Normalizing timestamps below " << session->mount_point();
    WB_EXPECT(NormalizeTimestamps(session->mount_point(),
                                  kNormalizedTimestamp));
  }

  LOG(INFO) << "Unmounting partitions";
  WB_EXPECT(mounts.UnmountAll());

  const auto system_image = config.SystemImage();
  const auto vendor_image = config.VendorImage();
  for (const auto& image : {system_image, vendor_image}) {
    WB_EXPECTF(CheckFilesystem(runner_, image),
               "\"{}\" is damaged after unmounting", image);
  }

  WB_EXPECT(ShrinkToMinimum(system_image));
  WB_EXPECT(ShrinkVendor(vendor_image, plan, config.vendor_shrink_policy()));

  for (const auto& image : {system_image, vendor_image}) {
    WB_EXPECTF(CheckFilesystem(runner_, image),
               "\"{}\" failed its last check before conversion", image);
  }

  LOG(INFO) << "Converting images back to VHDX";
  // Both conversions finish before either container is replaced, so a failed
  // conversion leaves the pair as it was.
  auto system_staged =
      WB_EXPECT(converter_.StageVhdx(system_image, config.SystemVhdx()));
  auto vendor_staged = converter_.StageVhdx(vendor_image, config.VendorVhdx());
  if (!vendor_staged.ok()) {
    converter_.Discard(system_staged);
    return WB_ERRF("Neither container was replaced: {}",
                   vendor_staged.error().Message());
  }
  WB_EXPECT(converter_.Commit(system_staged, config.SystemVhdx()));
  WB_EXPECT(converter_.Commit(*vendor_staged, config.VendorVhdx()));

  for (const auto& image : {system_image, vendor_image}) {
    if (!RemoveFile(image)) {
      PLOG(WARNING) << "Could not remove intermediate image " << image;
    }
  }
  return {};
}

}  // namespace wsabridge

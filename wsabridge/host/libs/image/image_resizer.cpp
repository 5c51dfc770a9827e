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

#include "wsabridge/host/libs/image/image_resizer.h"

#include <fcntl.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include <android-base/logging.h>
#include <android-base/strings.h>
#include <android-base/unique_fd.h>

#include "wsabridge/host/libs/image/fsck.h"

namespace wsabridge {

Result<Sectors> ApparentSize(const std::string& path) {
  struct stat st {};
  if (stat(path.c_str(), &st) != 0) {
    return WB_ERRNO("stat(\"" << path << "\") failed: " << strerror(errno));
  }
  return Sectors::FromBytesRoundUp(static_cast<uint64_t>(st.st_size));
}

Result<void> AllocateFile(const std::string& path, Sectors target) {
  android::base::unique_fd fd(open(path.c_str(), O_RDWR | O_CLOEXEC));
  if (fd.get() < 0) {
    return WB_ERRNO("Could not open \"" << path << "\": " << strerror(errno));
  }
  if (fallocate(fd.get(), 0, 0, target.ToOffT()) == 0) {
    return {};
  }
  if (errno != EOPNOTSUPP) {
    return WB_ERRNO("fallocate(\"" << path << "\", " << target.bytes()
                                   << ") failed: " << strerror(errno));
  }
  LOG(WARNING) << "fallocate is not supported for \"" << path
               << "\", extending it sparsely";
  if (ftruncate(fd.get(), target.ToOffT()) != 0) {
    return WB_ERRNO("ftruncate(\"" << path << "\", " << target.bytes()
                                   << ") failed: " << strerror(errno));
  }
  return {};
}

Result<void> TruncateFile(const std::string& path, Sectors target) {
  if (truncate(path.c_str(), target.ToOffT()) != 0) {
    return WB_ERRNO("truncate(\"" << path << "\", " << target.bytes()
                                  << ") failed: " << strerror(errno));
  }
  return {};
}

Result<void> ImageResizer::RunResize2fs(
    const std::string& image, const std::vector<std::string>& flags,
    const std::string& size) {
  auto make_command = [&image, &flags, &size]() {
    Command resize_cmd("resize2fs");
    for (const auto& flag : flags) {
      resize_cmd.AddParameter(flag);
    }
    resize_cmd.AddParameter(image);
    if (!size.empty()) {
      resize_cmd.AddParameter(size);
    }
    return resize_cmd;
  };
  auto first = RunSuccessfully(runner_, make_command());
  if (first.ok()) {
    return {};
  }
  LOG(WARNING) << "resize2fs failed on \"" << image
               << "\", repairing and retrying: " << first.error().Message();
  WB_EXPECTF(ForceRepair(runner_, image),
             "Could not repair \"{}\" after a failed resize", image);
  WB_EXPECTF(RunSuccessfully(runner_, make_command()),
             "resize2fs {} failed twice on \"{}\"",
             android::base::Join(flags, " "), image);
  return {};
}

Result<void> ImageResizer::Grow(const std::string& image, Sectors target) {
  WB_EXPECTF(CheckFilesystem(runner_, image),
             "Refusing to grow \"{}\" with a damaged filesystem", image);
  Sectors current = WB_EXPECT(ApparentSize(image));
  WB_EXPECT_GE(target, current, "Grow target is smaller than " << image);
  LOG(INFO) << "Growing \"" << image << "\" from "
            << HumanReadableBytes(current.bytes()) << " to "
            << HumanReadableBytes(target.bytes());
  if (allocation_ == Allocation::kReserve) {
    WB_EXPECT(AllocateFile(image, target));
  } else {
    WB_EXPECT(TruncateFile(image, target));
  }
  WB_EXPECT(RunResize2fs(image, {}));
  return {};
}

Result<void> ImageResizer::Shrink(const std::string& image) {
  WB_EXPECTF(CheckFilesystem(runner_, image),
             "Refusing to shrink \"{}\" with a damaged filesystem", image);
  LOG(INFO) << "Shrinking \"" << image << "\" to its minimum size";
  WB_EXPECT(RunResize2fs(image, {"-M"}));
  return {};
}

Result<void> ImageResizer::ResizeTo(const std::string& image, Sectors target) {
  Sectors current = WB_EXPECT(ApparentSize(image));
  if (target >= current) {
    WB_EXPECT(Grow(image, target));
    return {};
  }
  WB_EXPECTF(CheckFilesystem(runner_, image),
             "Refusing to resize \"{}\" with a damaged filesystem", image);
  LOG(INFO) << "Resizing \"" << image << "\" down to "
            << HumanReadableBytes(target.bytes());
  // resize2fs takes a size suffixed with 's' as 512 byte sectors.
  WB_EXPECT(RunResize2fs(image, {}, std::to_string(target.count()) + "s"));
  WB_EXPECT(TruncateFile(image, target));
  return {};
}

Result<void> ImageResizer::GrowToFill(const std::string& image) {
  WB_EXPECT(RunResize2fs(image, {}));
  return {};
}

}  // namespace wsabridge

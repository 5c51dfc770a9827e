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

#include "wsabridge/host/libs/payload/file_metadata.h"

#include <string.h>
#include <sys/stat.h>
#include <sys/xattr.h>
#include <unistd.h>

#include <vector>

#include <android-base/logging.h>

#include "wsabridge/common/libs/utils/files.h"

namespace wsabridge {
namespace {

constexpr char kSelinuxXattr[] = "security.selinux";

Result<void> ApplyToPath(MetadataApplier& applier, const std::string& path,
                         const FileMetadata& metadata,
                         const std::string& context) {
  WB_EXPECT(applier.SetOwnership(path, metadata.owner, metadata.group));
  // Symlink permissions are meaningless and chmod would follow the link.
  if (!IsSymlink(path)) {
    WB_EXPECT(applier.SetMode(path, metadata.mode));
  }
  auto labeled = applier.SetSecurityLabel(path, context);
  if (!labeled.ok()) {
    LOG(WARNING) << "Could not label " << path << " as " << context << ": "
                 << labeled.error().Message();
  }
  return {};
}

}  // namespace

Result<void> HostMetadataApplier::SetOwnership(const std::string& path,
                                               uid_t owner, gid_t group) {
  if (lchown(path.c_str(), owner, group) != 0) {
    return WB_ERRNO("lchown(\"" << path << "\", " << owner << ", " << group
                                << ") failed: " << strerror(errno));
  }
  return {};
}

Result<void> HostMetadataApplier::SetMode(const std::string& path,
                                          mode_t mode) {
  if (chmod(path.c_str(), mode) != 0) {
    return WB_ERRNO("chmod(\"" << path << "\", " << std::oct << mode
                               << ") failed: " << strerror(errno));
  }
  return {};
}

Result<void> HostMetadataApplier::SetSecurityLabel(
    const std::string& path, const std::string& context) {
  // The stored attribute includes the terminating NUL, like setfattr does.
  if (lsetxattr(path.c_str(), kSelinuxXattr, context.c_str(),
                context.size() + 1, 0) != 0) {
    return WB_ERRNO("lsetxattr(\"" << path << "\", " << kSelinuxXattr
                                   << ") failed: " << strerror(errno));
  }
  return {};
}

Result<void> ApplyEntryMetadata(MetadataApplier& applier,
                                const ManifestEntry& entry,
                                const std::string& path) {
  const auto context = SecurityContext(entry.label);
  std::vector<std::string> failures;
  auto apply = [&](const std::string& target, const FileMetadata& metadata) {
    auto result = ApplyToPath(applier, target, metadata, context);
    if (!result.ok()) {
      failures.push_back(result.error().Message());
    }
  };

  if (entry.kind == EntryKind::kFile) {
    apply(path, entry.file_metadata);
  } else {
    apply(path, entry.directory_metadata);
    auto walked = WalkDirectory(path, [&](const std::string& child) {
      if (DirectoryExists(child, /* follow_symlinks */ false)) {
        apply(child, entry.directory_metadata);
      } else {
        apply(child, entry.file_metadata);
      }
      return true;
    });
    if (!walked.ok()) {
      failures.push_back(walked.error().Message());
    }
  }

  if (failures.empty()) {
    return {};
  }
  if (entry.requirement == Requirement::kMandatory) {
    return WB_ERRF("Could not set ownership or permissions below \"{}\": {}",
                   path, failures.front());
  }
  for (const auto& failure : failures) {
    LOG(WARNING) << "Optional " << entry.destination << ": " << failure;
  }
  return {};
}

}  // namespace wsabridge

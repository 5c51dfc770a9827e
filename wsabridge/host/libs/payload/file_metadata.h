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

#include <sys/types.h>

#include <string>

#include "wsabridge/host/libs/payload/manifest.h"
#include "wsabridge/result/result.h"

namespace wsabridge {

// Ownership, permission and label setters for paths inside a mounted
// partition. None of these follow symlinks.
class MetadataApplier {
 public:
  virtual ~MetadataApplier() = default;

  virtual Result<void> SetOwnership(const std::string& path, uid_t owner,
                                    gid_t group) = 0;
  virtual Result<void> SetMode(const std::string& path, mode_t mode) = 0;
  // Writes `context` to the security.selinux extended attribute.
  virtual Result<void> SetSecurityLabel(const std::string& path,
                                        const std::string& context) = 0;
};

// lchown, chmod and lsetxattr on the local filesystem.
class HostMetadataApplier : public MetadataApplier {
 public:
  Result<void> SetOwnership(const std::string& path, uid_t owner,
                            gid_t group) override;
  Result<void> SetMode(const std::string& path, mode_t mode) override;
  Result<void> SetSecurityLabel(const std::string& path,
                                const std::string& context) override;
};

// Applies the metadata of `entry` to the installed copy at `path`, descending
// into directories. Ownership and mode errors fail mandatory entries and are
// logged for optional ones. Label errors are always only logged.
Result<void> ApplyEntryMetadata(MetadataApplier& applier,
                                const ManifestEntry& entry,
                                const std::string& path);

}  // namespace wsabridge

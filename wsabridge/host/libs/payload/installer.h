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

#include <string>

#include "wsabridge/host/libs/config/install_config.h"
#include "wsabridge/host/libs/payload/file_metadata.h"
#include "wsabridge/host/libs/payload/manifest.h"
#include "wsabridge/result/result.h"

namespace wsabridge {

// Resolved roots of the mounted partitions.
struct PartitionRoots {
  std::string system;
  std::string vendor;

  const std::string& For(Partition partition) const {
    return partition == Partition::kSystem ? system : vendor;
  }
};

// Copies one payload variant into mounted partitions and points the
// configuration at it.
class PayloadInstaller {
 public:
  PayloadInstaller(LayerType layer, std::string source,
                   std::string payload_dir, MetadataApplier& applier);

  // Removes the other layer from both partitions, installs the manifest and
  // patches build.prop and the init script.
  Result<void> Install(const PartitionRoots& roots);

  // Deletes every path `layer` installs, in both partitions.
  Result<void> RemoveLayer(LayerType layer, const PartitionRoots& roots);

  // Copies a single entry and applies its metadata. Optional entries only
  // fail on metadata errors of their own kind.
  Result<void> InstallEntry(const ManifestEntry& entry,
                            const PartitionRoots& roots);

 private:
  LayerType layer_;
  std::string source_;
  std::string payload_dir_;
  MetadataApplier& applier_;
};

}  // namespace wsabridge

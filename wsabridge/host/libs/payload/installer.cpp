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

#include "wsabridge/host/libs/payload/installer.h"

#include <utility>

#include <android-base/logging.h>

#include "wsabridge/common/libs/utils/files.h"
#include "wsabridge/host/libs/payload/layer_config.h"

namespace wsabridge {
namespace {

LayerType OtherLayer(LayerType layer) {
  return layer == LayerType::kNdk ? LayerType::kHoudini : LayerType::kNdk;
}

Result<void> CopyEntry(const ManifestEntry& entry, const std::string& source,
                       const std::string& destination) {
  if (entry.kind == EntryKind::kDirectory) {
    WB_EXPECTF(DirectoryExists(source), "Payload directory \"{}\" is missing",
               source);
  } else {
    WB_EXPECTF(FileExists(source) && !DirectoryExists(source),
               "Payload file \"{}\" is missing", source);
  }
  WB_EXPECT(EnsureDirectoryExists(cpp_dirname(destination)));
  if (entry.kind == EntryKind::kDirectory) {
    WB_EXPECT(CopyRecursively(source, destination));
  } else {
    WB_EXPECT(Copy(source, destination));
  }
  return {};
}

}  // namespace

PayloadInstaller::PayloadInstaller(LayerType layer, std::string source,
                                   std::string payload_dir,
                                   MetadataApplier& applier)
    : layer_(layer),
      source_(std::move(source)),
      payload_dir_(std::move(payload_dir)),
      applier_(applier) {}

Result<void> PayloadInstaller::Install(const PartitionRoots& roots) {
  LOG(INFO) << "Removing " << OtherLayer(layer_) << " from both partitions";
  WB_EXPECT(RemoveLayer(OtherLayer(layer_), roots));

  auto manifest = ManifestFor(layer_, source_);
  LOG(INFO) << "Installing " << manifest.size() << " " << layer_
            << " entries from " << payload_dir_;
  for (const auto& entry : manifest) {
    WB_EXPECT(InstallEntry(entry, roots));
  }

  LOG(INFO) << "Updating build.prop and init script for " << layer_;
  WB_EXPECT(ApplyLayerConfig(layer_, source_, roots.system, roots.vendor,
                             applier_));
  return {};
}

Result<void> PayloadInstaller::RemoveLayer(LayerType layer,
                                           const PartitionRoots& roots) {
  for (const auto& root : {roots.system, roots.vendor}) {
    for (const auto& destination : AllDestinations(layer)) {
      auto path = root + "/" + destination;
      if (!FileExists(path, /* follow_symlinks */ false)) {
        continue;
      }
      LOG(DEBUG) << "Removing " << path;
      WB_EXPECTF(RemovePath(path), "Could not remove {} file \"{}\"", layer,
                 path);
    }
  }
  return {};
}

Result<void> PayloadInstaller::InstallEntry(const ManifestEntry& entry,
                                            const PartitionRoots& roots) {
  const auto source = payload_dir_ + "/" + entry.source;
  const auto destination = roots.For(entry.partition) + "/" + entry.destination;
  auto copied = CopyEntry(entry, source, destination);
  if (!copied.ok()) {
    if (entry.requirement == Requirement::kMandatory) {
      WB_EXPECTF(std::move(copied), "Could not install \"{}\" to \"{}\"",
                 source, destination);
    }
    LOG(WARNING) << "Skipping optional " << entry.partition << " "
                 << entry.destination << ": " << copied.error().Message();
    return {};
  }
  LOG(DEBUG) << "Installed " << source << " -> " << destination;
  WB_EXPECT(ApplyEntryMetadata(applier_, entry, destination));
  return {};
}

}  // namespace wsabridge

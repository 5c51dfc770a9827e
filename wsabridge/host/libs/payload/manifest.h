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

#include <ostream>
#include <set>
#include <string>
#include <vector>

#include "wsabridge/host/libs/config/install_config.h"

namespace wsabridge {

enum class Partition {
  kSystem,
  kVendor,
};

std::ostream& operator<<(std::ostream& out, Partition partition);

enum class EntryKind {
  kFile,
  kDirectory,
};

enum class Requirement {
  // A missing source or a failed copy aborts the install.
  kMandatory,
  // Failures are logged and the install goes on.
  kOptional,
};

// AID_ROOT and AID_SHELL
inline constexpr uid_t kRootUid = 0;
inline constexpr gid_t kRootGid = 0;
inline constexpr gid_t kShellGid = 2000;

struct FileMetadata {
  uid_t owner = kRootUid;
  gid_t group = kRootGid;
  mode_t mode = 0644;
};

struct ManifestEntry {
  Partition partition = Partition::kSystem;
  // Relative to the payload directory.
  std::string source;
  // Relative to the partition root.
  std::string destination;
  EntryKind kind = EntryKind::kFile;
  Requirement requirement = Requirement::kMandatory;
  // For a directory entry, `file_metadata` applies to every file below it and
  // `directory_metadata` to the directory and its subdirectories.
  FileMetadata file_metadata;
  FileMetadata directory_metadata;
  // SELinux type, e.g. "system_file".
  std::string label;
};

using InstallManifest = std::vector<ManifestEntry>;

// "u:object_r:<type>:s0"
std::string SecurityContext(const std::string& type);

// The ordered list of paths a payload variant installs.
InstallManifest ManifestFor(LayerType layer, const std::string& source);

// Every destination any variant of `layer` installs, without the partition.
// Removing these from both partitions uninstalls the layer.
std::set<std::string> AllDestinations(LayerType layer);

// Libraries the NDK translation payload may carry in lib and lib64.
const std::vector<std::string>& NdkTranslationLibraries();

}  // namespace wsabridge

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

#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "wsabridge/result/result.h"

namespace wsabridge {

enum class LayerType {
  kHoudini,
  kNdk,
};

// "libhoudini" or "libndk", as given on the command line and used as the
// payload directory name.
std::string LayerTypeName(LayerType layer);
Result<LayerType> ParseLayerType(const std::string& name);
std::ostream& operator<<(std::ostream& out, LayerType layer);

// Payload variants that can be installed for each layer.
const std::vector<std::string>& ValidSources(LayerType layer);

// What happens to the vendor image after the payload is in.
enum class VendorShrinkPolicy {
  // resize2fs -M
  kMinimum,
  // The minimum plus a fixed buffer of free space.
  kUsedPlusBuffer,
  // Stays at the size planned before the install.
  kKeepPlanned,
};

std::string VendorShrinkPolicyName(VendorShrinkPolicy policy);
Result<VendorShrinkPolicy> ParseVendorShrinkPolicy(const std::string& name);

inline constexpr char kBlueStacksSource[] = "libhoudini_bluestacks";

// Command line values before validation.
struct InstallFlags {
  std::string type;
  std::string source;
  std::string dir;
  std::string archive;
  std::string payload_root;
  std::string mount_base;
  std::string vendor_shrink_policy;
};

// Validated settings for one run. Built once before any image is touched and
// never modified afterwards.
class InstallConfig {
 public:
  // Rejects unknown layer types, sources that don't belong to the layer,
  // missing container files and a missing payload directory.
  static Result<InstallConfig> FromFlags(const InstallFlags& flags);

  LayerType layer() const { return layer_; }
  const std::string& source() const { return source_; }

  // The directory passed with --dir.
  const std::string& input_dir() const { return input_dir_; }
  // Where the images are processed: input_dir, or input_dir/source when an
  // archive is requested.
  const std::string& work_dir() const { return work_dir_; }
  const std::optional<std::string>& archive_name() const {
    return archive_name_;
  }
  // payload_root/type/source
  const std::string& payload_dir() const { return payload_dir_; }
  const std::string& mount_base() const { return mount_base_; }
  VendorShrinkPolicy vendor_shrink_policy() const {
    return vendor_shrink_policy_;
  }

  std::string SystemVhdx() const { return work_dir_ + "/system.vhdx"; }
  std::string VendorVhdx() const { return work_dir_ + "/vendor.vhdx"; }
  std::string SystemImage() const { return work_dir_ + "/system.img"; }
  std::string VendorImage() const { return work_dir_ + "/vendor.img"; }
  // Both live beside the input containers, never in an archived work_dir.
  std::string JournalPath() const {
    return input_dir_ + "/.wsa_bridge_state.json";
  }
  std::string LockPath() const { return input_dir_ + "/.wsa_bridge.lock"; }

 private:
  InstallConfig() = default;

  LayerType layer_ = LayerType::kHoudini;
  std::string source_;
  std::string input_dir_;
  std::string work_dir_;
  std::optional<std::string> archive_name_;
  std::string payload_dir_;
  std::string mount_base_;
  VendorShrinkPolicy vendor_shrink_policy_ = VendorShrinkPolicy::kMinimum;
};

std::ostream& operator<<(std::ostream& out, const InstallConfig& config);

}  // namespace wsabridge

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

#include "wsabridge/host/libs/config/install_config.h"

#include <algorithm>

#include <android-base/strings.h>

#include "wsabridge/common/libs/utils/files.h"

namespace wsabridge {

std::string LayerTypeName(LayerType layer) {
  switch (layer) {
    case LayerType::kHoudini:
      return "libhoudini";
    case LayerType::kNdk:
      return "libndk";
  }
  return "unknown";
}

Result<LayerType> ParseLayerType(const std::string& name) {
  if (name == "libhoudini") {
    return LayerType::kHoudini;
  } else if (name == "libndk") {
    return LayerType::kNdk;
  }
  return WB_ERRF("Invalid translation type \"{}\", must be libndk or "
                 "libhoudini",
                 name);
}

std::ostream& operator<<(std::ostream& out, LayerType layer) {
  return out << LayerTypeName(layer);
}

const std::vector<std::string>& ValidSources(LayerType layer) {
  static const std::vector<std::string> kNdkSources = {"chromeos_zork"};
  static const std::vector<std::string> kHoudiniSources = {
      "chromeos_volteer", "hpe-14", "aow-13", kBlueStacksSource};
  return layer == LayerType::kNdk ? kNdkSources : kHoudiniSources;
}

std::string VendorShrinkPolicyName(VendorShrinkPolicy policy) {
  switch (policy) {
    case VendorShrinkPolicy::kMinimum:
      return "minimum";
    case VendorShrinkPolicy::kUsedPlusBuffer:
      return "used_plus_buffer";
    case VendorShrinkPolicy::kKeepPlanned:
      return "keep_planned";
  }
  return "unknown";
}

Result<VendorShrinkPolicy> ParseVendorShrinkPolicy(const std::string& name) {
  for (auto policy :
       {VendorShrinkPolicy::kMinimum, VendorShrinkPolicy::kUsedPlusBuffer,
        VendorShrinkPolicy::kKeepPlanned}) {
    if (VendorShrinkPolicyName(policy) == name) {
      return policy;
    }
  }
  return WB_ERRF("Invalid vendor shrink policy \"{}\", must be minimum, "
                 "used_plus_buffer or keep_planned",
                 name);
}

Result<InstallConfig> InstallConfig::FromFlags(const InstallFlags& flags) {
  WB_EXPECT(!flags.type.empty(), "--type is required");
  WB_EXPECT(!flags.source.empty(), "--source is required");
  WB_EXPECT(!flags.dir.empty(), "--dir is required");

  InstallConfig config;
  config.layer_ = WB_EXPECT(ParseLayerType(flags.type));
  const auto& sources = ValidSources(config.layer_);
  WB_EXPECTF(std::find(sources.begin(), sources.end(), flags.source) !=
                 sources.end(),
             "Invalid source \"{}\" for {}, must be one of: {}", flags.source,
             flags.type, android::base::Join(sources, ", "));
  config.source_ = flags.source;

  config.input_dir_ = AbsolutePath(flags.dir);
  WB_EXPECTF(DirectoryExists(config.input_dir_), "\"{}\" is not a directory",
             flags.dir);
  for (const auto& name : {"system.vhdx", "vendor.vhdx"}) {
    WB_EXPECTF(FileExists(config.input_dir_ + "/" + name),
               "WSA image {} not found in \"{}\"", name, config.input_dir_);
  }

  if (!flags.archive.empty()) {
    WB_EXPECTF(flags.archive.find('/') == std::string::npos,
               "Archive name \"{}\" must not contain a path", flags.archive);
    config.archive_name_ = flags.archive;
    config.work_dir_ = config.input_dir_ + "/" + config.source_;
  } else {
    config.work_dir_ = config.input_dir_;
  }

  std::string payload_root =
      flags.payload_root.empty() ? CurrentDirectory() : flags.payload_root;
  config.payload_dir_ = AbsolutePath(payload_root) + "/" + flags.type + "/" +
                        flags.source;
  WB_EXPECTF(DirectoryExists(config.payload_dir_),
             "Translation files not found at \"{}\"", config.payload_dir_);

  config.mount_base_ = flags.mount_base.empty()
                           ? CurrentDirectory() + "/mount_temp"
                           : AbsolutePath(flags.mount_base);
  config.vendor_shrink_policy_ = WB_EXPECT(ParseVendorShrinkPolicy(
      flags.vendor_shrink_policy.empty() ? "minimum"
                                         : flags.vendor_shrink_policy));
  return config;
}

std::ostream& operator<<(std::ostream& out, const InstallConfig& config) {
  out << "type: " << config.layer() << ", source: " << config.source()
      << ", working directory: " << config.work_dir()
      << ", translation files: " << config.payload_dir();
  if (config.archive_name()) {
    out << ", archive: " << *config.archive_name() << ".7z";
  }
  return out;
}

}  // namespace wsabridge

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

#include "wsabridge/host/libs/payload/layer_config.h"

#include <utility>

#include <android-base/logging.h>

#include "wsabridge/common/libs/utils/files.h"
#include "wsabridge/host/libs/payload/config_patch.h"

namespace wsabridge {
namespace {

constexpr char kNdkLibrary[] = "libndk_translation.so";
constexpr char kHoudiniLibrary[] = "libhoudini.so";
constexpr char kBlueStacksLibrary[] = "libnb.so";
constexpr char kNdkVersionKey[] = "ro.ndk_translation.version";
constexpr char kNdkVersion[] = "0.2.3";

using Properties = std::vector<std::pair<std::string, std::string>>;

const Properties& NdkSystemProperties() {
  static const Properties kProperties = {
      {"ro.dalvik.vm.isa.arm64", "x86_64"},
      {"ro.dalvik.vm.isa.arm", "x86"},
      {"ro.enable.native.bridge.exec", "1"},
      {"ro.enable.native.bridge.exec64", "1"},
      {kNdkVersionKey, kNdkVersion},
  };
  return kProperties;
}

std::vector<std::string> Keys(const Properties& properties) {
  std::vector<std::string> keys;
  for (const auto& property : properties) {
    keys.push_back(property.first);
  }
  return keys;
}

// The first registration of a sequence uses `>`, the others append.
std::string RegistrationLine(const std::string& name, const char* elf_class,
                             const char* elf_type, const char* machine,
                             const std::string& interpreter, bool append) {
  std::string magic = std::string("\\\\x7f\\\\x45\\\\x4c\\\\x46\\\\x") +
                      elf_class +
                      "\\\\x01\\\\x01\\\\x00\\\\x00\\\\x00\\\\x00\\\\x00"
                      "\\\\x00\\\\x00\\\\x00\\\\x00\\\\x" +
                      elf_type + "\\\\x00\\\\x" + machine;
  return "    exec -- /system/bin/sh -c \"echo ':" + name + ":M::" + magic +
         "::" + interpreter + ":P' " + (append ? ">>" : ">") +
         " /proc/sys/fs/binfmt_misc/register\"";
}

bool IsHoudiniRegistration(std::string_view line) {
  return line.find("/proc/sys/fs/binfmt_misc/register") != line.npos &&
         line.find("/system/bin/houdini") != line.npos;
}

bool SetNativeBridge(std::string* contents, const std::string& library,
                     const char* file) {
  if (!SetProperty(contents, kNativeBridgeKey, library)) {
    LOG(WARNING) << kNativeBridgeKey << " not found in " << file
                 << ", leaving it unchanged";
    return false;
  }
  return true;
}

// Loads `path` if it exists, runs `patch` and saves it. Absent files are
// errors only when `required`.
Result<void> PatchFile(const std::string& path, bool required,
                       const std::function<bool(std::string*)>& patch,
                       const std::string& label, MetadataApplier& applier) {
  if (!FileExists(path)) {
    WB_EXPECTF(!required, "Required config file \"{}\" is missing", path);
    LOG(WARNING) << path << " not found, skipping its update";
    return {};
  }
  auto file = WB_EXPECT(ConfigFile::Load(path));
  patch(file.contents());
  if (!WB_EXPECT(file.Save())) {
    return {};
  }
  for (const auto& written : {file.path(), file.BackupPath()}) {
    auto labeled = applier.SetSecurityLabel(written, SecurityContext(label));
    if (!labeled.ok()) {
      LOG(WARNING) << "Could not label " << written << ": "
                   << labeled.error().Message();
    }
  }
  return {};
}

}  // namespace

std::string NativeBridgeLibrary(LayerType layer, const std::string& source) {
  if (layer == LayerType::kNdk) {
    return kNdkLibrary;
  }
  return source == kBlueStacksSource ? kBlueStacksLibrary : kHoudiniLibrary;
}

std::vector<std::string> HoudiniRegistrationLines() {
  return {
      RegistrationLine("arm_exe", "01", "02", "28", "/system/bin/houdini",
                       false),
      RegistrationLine("arm_dyn", "01", "03", "28", "/system/bin/houdini",
                       true),
  };
}

std::vector<std::string> Houdini64RegistrationLines() {
  return {
      RegistrationLine("arm64_exe", "02", "02", "b7", "/system/bin/houdini64",
                       true),
      RegistrationLine("arm64_dyn", "02", "03", "b7", "/system/bin/houdini64",
                       true),
  };
}

bool PatchNdkSystemProperties(std::string* contents) {
  if (!SetNativeBridge(contents, kNdkLibrary, "system build.prop")) {
    return false;
  }
  return UpsertPropertiesAfter(contents, kNativeBridgeKey,
                               NdkSystemProperties());
}

bool PatchNdkVendorProperties(std::string* contents) {
  if (!SetNativeBridge(contents, kNdkLibrary, "vendor build.prop")) {
    return false;
  }
  return UpsertPropertiesAfter(contents, kNativeBridgeKey,
                               {{kNdkVersionKey, kNdkVersion}});
}

bool PatchHoudiniSystemProperties(std::string* contents) {
  bool changed = RemoveProperties(contents, Keys(NdkSystemProperties())) > 0;
  if (GetProperty(*contents, kNativeBridgeKey) == kNdkLibrary) {
    changed |= SetProperty(contents, kNativeBridgeKey, "0");
  }
  return changed;
}

bool PatchHoudiniVendorProperties(std::string* contents,
                                  const std::string& native_bridge) {
  RemoveProperties(contents, {kNdkVersionKey});
  return SetNativeBridge(contents, native_bridge, "vendor build.prop");
}

bool PatchNdkInitScript(std::string* contents) {
  size_t removed = DeleteLines(contents, [](std::string_view line) {
    return line.find(kHoudiniMountAnchor) != line.npos ||
           line.find(kHoudini64MountAnchor) != line.npos ||
           IsHoudiniRegistration(line);
  });
  return removed > 0;
}

bool PatchHoudiniInitScript(std::string* contents) {
  bool found = false;
  for (const auto& [anchor, lines] :
       {std::make_pair(kHoudiniMountAnchor, HoudiniRegistrationLines()),
        std::make_pair(kHoudini64MountAnchor, Houdini64RegistrationLines())}) {
    auto patch = InsertAfterAnchor(contents, anchor, lines);
    if (patch.anchors == 0) {
      LOG(WARNING) << "No \"" << anchor << "\" line in the init script";
      continue;
    }
    found = true;
    if (patch.already_patched > 0) {
      LOG(INFO) << "binfmt_misc registration after \"" << anchor
                << "\" is already present";
    }
  }
  return found;
}

Result<void> ApplyLayerConfig(LayerType layer, const std::string& source,
                              const std::string& system_root,
                              const std::string& vendor_root,
                              MetadataApplier& applier) {
  const auto system_prop = system_root + "/build.prop";
  const auto vendor_prop = vendor_root + "/build.prop";
  const auto init_script = vendor_root + "/" + kInitScript;
  if (layer == LayerType::kNdk) {
    WB_EXPECT(PatchFile(system_prop, false, PatchNdkSystemProperties,
                        "system_file", applier));
    WB_EXPECT(PatchFile(vendor_prop, true, PatchNdkVendorProperties,
                        "vendor_configs_file", applier));
    WB_EXPECT(PatchFile(init_script, false, PatchNdkInitScript,
                        "vendor_configs_file", applier));
    return {};
  }
  const auto native_bridge = NativeBridgeLibrary(layer, source);
  WB_EXPECT(PatchFile(system_prop, false, PatchHoudiniSystemProperties,
                      "system_file", applier));
  WB_EXPECT(PatchFile(
      vendor_prop, true,
      [&native_bridge](std::string* contents) {
        return PatchHoudiniVendorProperties(contents, native_bridge);
      },
      "vendor_configs_file", applier));
  WB_EXPECT(PatchFile(init_script, false, PatchHoudiniInitScript,
                      "vendor_configs_file", applier));
  return {};
}

}  // namespace wsabridge

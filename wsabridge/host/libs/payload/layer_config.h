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
#include <vector>

#include "wsabridge/host/libs/config/install_config.h"
#include "wsabridge/host/libs/payload/file_metadata.h"
#include "wsabridge/result/result.h"

namespace wsabridge {

inline constexpr char kNativeBridgeKey[] = "ro.dalvik.vm.native.bridge";
inline constexpr char kInitScript[] = "etc/init/init.windows_x86_64.rc";
inline constexpr char kHoudiniMountAnchor[] =
    "mount none /vendor/bin/houdini /system/bin/houdini bind rec";
inline constexpr char kHoudini64MountAnchor[] =
    "mount none /vendor/bin/houdini64 /system/bin/houdini64 bind rec";

// Name of the native bridge library a payload variant is loaded through.
std::string NativeBridgeLibrary(LayerType layer, const std::string& source);

// init commands registering the ARM ELF formats with binfmt_misc, for the
// 32 bit (arm_exe, arm_dyn) and 64 bit (arm64_exe, arm64_dyn) interpreters.
std::vector<std::string> HoudiniRegistrationLines();
std::vector<std::string> Houdini64RegistrationLines();

// In-memory edits for each file, returning whether anything was found to
// edit. Missing keys are logged.
bool PatchNdkSystemProperties(std::string* contents);
bool PatchNdkVendorProperties(std::string* contents);
bool PatchHoudiniSystemProperties(std::string* contents);
bool PatchHoudiniVendorProperties(std::string* contents,
                                  const std::string& native_bridge);
bool PatchNdkInitScript(std::string* contents);
bool PatchHoudiniInitScript(std::string* contents);

// Points build.prop and the init script of both partitions at the installed
// layer, reverting the other layer's settings. A missing vendor build.prop is
// an error, a missing system build.prop or init script is logged.
Result<void> ApplyLayerConfig(LayerType layer, const std::string& source,
                              const std::string& system_root,
                              const std::string& vendor_root,
                              MetadataApplier& applier);

}  // namespace wsabridge

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

#include "wsabridge/host/libs/payload/manifest.h"

namespace wsabridge {
namespace {

constexpr FileMetadata kLibrary{kRootUid, kRootGid, 0644};
constexpr FileMetadata kLibraryDirectory{kRootUid, kRootGid, 0755};
constexpr FileMetadata kExecutable{kRootUid, kShellGid, 0755};
constexpr FileMetadata kExecutableDirectory{kRootUid, kShellGid, 0751};
constexpr FileMetadata kConfig{kRootUid, kRootGid, 0644};
constexpr FileMetadata kConfigDirectory{kRootUid, kRootGid, 0755};

ManifestEntry File(Partition partition, const std::string& path,
                   Requirement requirement, FileMetadata metadata,
                   const std::string& label) {
  ManifestEntry entry;
  entry.partition = partition;
  entry.source = path;
  entry.destination = path;
  entry.kind = EntryKind::kFile;
  entry.requirement = requirement;
  entry.file_metadata = metadata;
  entry.directory_metadata = metadata;
  entry.label = label;
  return entry;
}

ManifestEntry Directory(Partition partition, const std::string& path,
                        Requirement requirement, FileMetadata files,
                        FileMetadata directories, const std::string& label) {
  ManifestEntry entry;
  entry.partition = partition;
  entry.source = path;
  entry.destination = path;
  entry.kind = EntryKind::kDirectory;
  entry.requirement = requirement;
  entry.file_metadata = files;
  entry.directory_metadata = directories;
  entry.label = label;
  return entry;
}

void AddNdkPartition(Partition partition, InstallManifest& manifest) {
  const bool system = partition == Partition::kSystem;
  const std::string runner_label =
      system ? "system_file" : "same_process_hal_file";
  const std::string bin_label = system ? "system_file" : "vendor_file";
  const std::string config_label =
      system ? "system_file" : "vendor_configs_file";
  const std::string lib_label =
      system ? "system_lib_file" : "same_process_hal_file";

  for (const auto& runner : {"bin/ndk_translation_program_runner_binfmt_misc",
                             "bin/ndk_translation_program_runner_binfmt_misc_arm64"}) {
    manifest.push_back(File(partition, runner, Requirement::kMandatory,
                            kExecutable, runner_label));
  }
  for (const auto& dir : {"bin/arm", "bin/arm64"}) {
    manifest.push_back(Directory(partition, dir, Requirement::kMandatory,
                                 kExecutable, kExecutableDirectory,
                                 bin_label));
  }
  manifest.push_back(Directory(partition, "etc/binfmt_misc",
                               Requirement::kMandatory, kConfig,
                               kConfigDirectory, config_label));
  if (system) {
    manifest.push_back(File(partition, "etc/init/ndk_translation.rc",
                            Requirement::kMandatory, kConfig, "system_file"));
  }
  for (const auto& text : {"etc/ld.config.arm.txt", "etc/ld.config.arm64.txt",
                           "etc/cpuinfo.arm.txt", "etc/cpuinfo.arm64.txt"}) {
    manifest.push_back(File(partition, text, Requirement::kMandatory, kConfig,
                            config_label));
  }
  // The 32 bit tree keeps the generic label on system.
  manifest.push_back(Directory(partition, "lib/arm", Requirement::kOptional,
                               kLibrary, kLibraryDirectory,
                               system ? "system_file" : lib_label));
  manifest.push_back(Directory(partition, "lib64/arm64",
                               Requirement::kOptional, kLibrary,
                               kLibraryDirectory, lib_label));
  for (const auto& lib_dir : {"lib64/", "lib/"}) {
    for (const auto& library : NdkTranslationLibraries()) {
      manifest.push_back(File(partition, lib_dir + library,
                              Requirement::kOptional, kLibrary, lib_label));
    }
  }
}

InstallManifest NdkManifest() {
  InstallManifest manifest;
  AddNdkPartition(Partition::kSystem, manifest);
  AddNdkPartition(Partition::kVendor, manifest);
  return manifest;
}

InstallManifest HoudiniManifest(bool bluestacks) {
  InstallManifest manifest;
  for (const auto& descriptor :
       {"etc/binfmt_misc/arm64_dyn", "etc/binfmt_misc/arm64_exe",
        "etc/binfmt_misc/arm_dyn", "etc/binfmt_misc/arm_exe"}) {
    manifest.push_back(File(Partition::kVendor, descriptor,
                            Requirement::kMandatory, kConfig,
                            "vendor_configs_file"));
  }
  std::vector<std::string> libraries = {"lib/libhoudini.so",
                                        "lib64/libhoudini.so"};
  if (bluestacks) {
    libraries.push_back("lib/libnb.so");
    libraries.push_back("lib64/libnb.so");
  }
  for (const auto& library : libraries) {
    manifest.push_back(File(Partition::kVendor, library,
                            Requirement::kMandatory, kLibrary,
                            "same_process_hal_file"));
  }
  for (const auto& binary : {"bin/houdini", "bin/houdini64"}) {
    manifest.push_back(File(Partition::kVendor, binary,
                            Requirement::kMandatory, kExecutable,
                            "same_process_hal_file"));
  }
  for (const auto& binary : {"bin/houdini", "bin/houdini64"}) {
    manifest.push_back(File(Partition::kSystem, binary,
                            Requirement::kMandatory, kExecutable,
                            "system_file"));
  }
  for (const auto& dir : {"lib64/arm64", "lib/arm"}) {
    manifest.push_back(Directory(Partition::kVendor, dir,
                                 Requirement::kOptional, kLibrary,
                                 kLibraryDirectory, "same_process_hal_file"));
  }
  return manifest;
}

}  // namespace

std::ostream& operator<<(std::ostream& out, Partition partition) {
  return out << (partition == Partition::kSystem ? "system" : "vendor");
}

std::string SecurityContext(const std::string& type) {
  return "u:object_r:" + type + ":s0";
}

const std::vector<std::string>& NdkTranslationLibraries() {
  static const std::vector<std::string> kLibraries = {
      "libndk_translation_exec_region.so",
      "libndk_translation_proxy_libaaudio.so",
      "libndk_translation_proxy_libamidi.so",
      "libndk_translation_proxy_libandroid_runtime.so",
      "libndk_translation_proxy_libandroid.so",
      "libndk_translation_proxy_libbinder_ndk.so",
      "libndk_translation_proxy_libc.so",
      "libndk_translation_proxy_libcamera2ndk.so",
      "libndk_translation_proxy_libEGL.so",
      "libndk_translation_proxy_libGLESv1_CM.so",
      "libndk_translation_proxy_libGLESv2.so",
      "libndk_translation_proxy_libGLESv3.so",
      "libndk_translation_proxy_libjnigraphics.so",
      "libndk_translation_proxy_libmediandk.so",
      "libndk_translation_proxy_libnativehelper.so",
      "libndk_translation_proxy_libnativewindow.so",
      "libndk_translation_proxy_libneuralnetworks.so",
      "libndk_translation_proxy_libOpenMAXAL.so",
      "libndk_translation_proxy_libOpenSLES.so",
      "libndk_translation_proxy_libvulkan.so",
      "libndk_translation_proxy_libwebviewchromium_plat_support.so",
      "libndk_translation.so",
  };
  return kLibraries;
}

InstallManifest ManifestFor(LayerType layer, const std::string& source) {
  if (layer == LayerType::kNdk) {
    return NdkManifest();
  }
  return HoudiniManifest(source == kBlueStacksSource);
}

std::set<std::string> AllDestinations(LayerType layer) {
  std::set<std::string> destinations;
  for (const auto& source : ValidSources(layer)) {
    for (const auto& entry : ManifestFor(layer, source)) {
      destinations.insert(entry.destination);
    }
  }
  return destinations;
}

}  // namespace wsabridge

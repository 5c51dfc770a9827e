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

#include "wsabridge/host/libs/image/vhdx_converter.h"

#include <android-base/logging.h>

#include "wsabridge/common/libs/utils/files.h"
#include "wsabridge/common/libs/utils/json.h"

namespace wsabridge {

Result<ContainerInfo> ParseQemuImgInfo(std::string_view json) {
  auto root = WB_EXPECT(ParseJson(json));
  ContainerInfo info;
  info.format = WB_EXPECT(GetValue<std::string>(root, {"format"}));
  info.virtual_size = WB_EXPECT(GetValue<uint64_t>(root, {"virtual-size"}));
  if (HasValue(root, {"actual-size"})) {
    info.actual_size = WB_EXPECT(GetValue<uint64_t>(root, {"actual-size"}));
  }
  return info;
}

Result<void> VhdxConverter::ToRaw(const std::string& vhdx,
                                  const std::string& raw) {
  LOG(INFO) << "Converting \"" << vhdx << "\" to a raw image";
  Command convert_cmd("qemu-img");
  convert_cmd.AddParameter("convert");
  convert_cmd.AddParameter("-f");
  convert_cmd.AddParameter("vhdx");
  convert_cmd.AddParameter("-O");
  convert_cmd.AddParameter("raw");
  convert_cmd.AddParameter(vhdx);
  convert_cmd.AddParameter(raw);
  WB_EXPECTF(RunSuccessfully(runner_, std::move(convert_cmd)),
             "Failed to convert \"{}\"", vhdx);
  return {};
}

Result<std::string> VhdxConverter::StageVhdx(const std::string& raw,
                                             const std::string& vhdx) {
  auto staging = vhdx + ".new";
  LOG(INFO) << "Converting \"" << raw << "\" to \"" << staging << "\"";
  Command convert_cmd("qemu-img");
  convert_cmd.AddParameter("convert");
  convert_cmd.AddParameter("-q");
  convert_cmd.AddParameter("-f");
  convert_cmd.AddParameter("raw");
  convert_cmd.AddParameter("-O");
  convert_cmd.AddParameter("vhdx");
  convert_cmd.AddParameter("-o");
  convert_cmd.AddParameter("subformat=fixed");
  convert_cmd.AddParameter(raw);
  convert_cmd.AddParameter(staging);
  auto converted = RunSuccessfully(runner_, std::move(convert_cmd));
  if (!converted.ok()) {
    Discard(staging);
    return WB_ERRF("Failed to convert \"{}\": {}", raw,
                   converted.error().Message());
  }
  return staging;
}

Result<void> VhdxConverter::Commit(const std::string& staged,
                                   const std::string& vhdx) {
  WB_EXPECT(RenameFile(staged, vhdx));
  LOG(INFO) << "Replaced \"" << vhdx << "\"";
  return {};
}

void VhdxConverter::Discard(const std::string& staged) {
  if (FileExists(staged) && !RemoveFile(staged)) {
    PLOG(WARNING) << "Could not remove \"" << staged << "\"";
  }
}

Result<ContainerInfo> VhdxConverter::Inspect(const std::string& path) {
  Command info_cmd("qemu-img");
  info_cmd.AddParameter("info");
  info_cmd.AddParameter("--output=json");
  info_cmd.AddParameter(path);
  auto json = WB_EXPECT(RunSuccessfully(runner_, std::move(info_cmd)));
  return WB_EXPECTF(ParseQemuImgInfo(json), "Unexpected qemu-img output for {}",
                    path);
}

}  // namespace wsabridge

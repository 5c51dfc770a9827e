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

#include "wsabridge/host/libs/finalize/archive.h"

#include <android-base/logging.h>

#include "wsabridge/common/libs/utils/files.h"

namespace wsabridge {

Result<void> StageContainers(const InstallConfig& config) {
  if (!config.archive_name()) {
    return {};
  }
  WB_EXPECT(EnsureDirectoryExists(config.work_dir()));
  for (const auto& name : {"system.vhdx", "vendor.vhdx"}) {
    auto from = config.input_dir() + "/" + name;
    auto to = config.work_dir() + "/" + name;
    LOG(INFO) << "Copying " << from << " to " << to;
    WB_EXPECTF(Copy(from, to), "Could not stage {} for archiving", name);
  }
  return {};
}

Command SevenZipCommand(const std::string& archive_path,
                        const std::string& source) {
  Command command("7z");
  command.AddParameter("a")
      .AddParameter("-t7z")
      .AddParameter("-m0=lzma2")
      .AddParameter("-mx=9")
      .AddParameter("-mfb=64")
      .AddParameter("-md=32m")
      .AddParameter("-ms=on")
      .AddParameter(archive_path)
      .AddParameter(source);
  return command;
}

Result<std::string> CreateArchive(CommandRunner& runner,
                                  const InstallConfig& config) {
  WB_EXPECT(config.archive_name().has_value(), "No archive was requested");
  const auto archive_file = *config.archive_name() + ".7z";
  const auto archive_path = config.input_dir() + "/" + archive_file;
  if (FileExists(archive_path)) {
    // 7z would add to it instead of replacing it.
    LOG(WARNING) << "Replacing existing archive " << archive_path;
    WB_EXPECT(RemovePath(archive_path));
  }

  // Relative paths, so the archive holds `<source>/...`.
  auto command = SevenZipCommand(archive_file, config.source());
  command.SetWorkingDirectory(config.input_dir());
  LOG(INFO) << "Creating " << archive_path;
  WB_EXPECTF(RunSuccessfully(runner, std::move(command)),
             "Could not create archive \"{}\"", archive_path);

  WB_EXPECTF(RemovePath(config.work_dir()),
             "Archive created but \"{}\" could not be removed",
             config.work_dir());
  return archive_path;
}

}  // namespace wsabridge

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
#include "wsabridge/host/libs/image/command_runner.h"
#include "wsabridge/result/result.h"

namespace wsabridge {

// Copies the input containers into the working directory of an archived run.
// Runs without an archive work on the input directory and need nothing.
Result<void> StageContainers(const InstallConfig& config);

// `7z a` with the settings used for published images: LZMA2 at level 9,
// 64 fast bytes, a 32 MiB dictionary, solid.
Command SevenZipCommand(const std::string& archive_path,
                        const std::string& source);

// Packs the working directory into `<input_dir>/<archive_name>.7z` and removes
// the working directory. Returns the archive path.
Result<std::string> CreateArchive(CommandRunner& runner,
                                  const InstallConfig& config);

}  // namespace wsabridge

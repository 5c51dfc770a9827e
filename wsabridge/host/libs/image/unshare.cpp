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

#include "wsabridge/host/libs/image/unshare.h"

#include <android-base/logging.h>

#include "wsabridge/host/libs/image/ext4_info.h"
#include "wsabridge/host/libs/image/fsck.h"

namespace wsabridge {

std::ostream& operator<<(std::ostream& out, UnshareMethod method) {
  switch (method) {
    case UnshareMethod::kNotShared:
      return out << "no shared blocks";
    case UnshareMethod::kAutomatic:
      return out << "automatic unshare";
    case UnshareMethod::kInteractive:
      return out << "interactive unshare";
    case UnshareMethod::kForcedRepairOnly:
      return out << "forced repair only";
  }
  return out << "unknown";
}

namespace {

// A rung that could not be run at all, e.g. e2fsck closing its stdin before
// reading the answers, counts as a failed rung.
bool RungSucceeded(CommandRunner& runner, Command command,
                   const std::string* stdin_content = nullptr) {
  const auto command_line = command.ToString();
  auto output = runner.Run(std::move(command), stdin_content);
  if (!output.ok()) {
    LOG(WARNING) << "Could not run `" << command_line
                 << "`: " << output.error().Message();
    return false;
  }
  if (InterpretFsckExitCode(output->exit_code).ok()) {
    return true;
  }
  LOG(WARNING) << "`" << command_line << "` failed with "
               << output->exit_code;
  return false;
}

}  // namespace

Result<UnshareMethod> Unsharer::UnshareBlocks(const std::string& image) {
  Command automatic("e2fsck");
  automatic.AddParameter("-pf");
  automatic.AddParameter("-E");
  automatic.AddParameter("unshare_blocks");
  automatic.AddParameter(image);
  if (RungSucceeded(runner_, std::move(automatic))) {
    return UnshareMethod::kAutomatic;
  }
  LOG(WARNING) << "Unsharing \"" << image << "\" interactively";

  Command interactive("e2fsck");
  interactive.AddParameter("-E");
  interactive.AddParameter("unshare_blocks");
  interactive.AddParameter(image);
  const std::string answers = "y\n";
  if (RungSucceeded(runner_, std::move(interactive), &answers)) {
    return UnshareMethod::kInteractive;
  }
  LOG(WARNING) << "Falling back to a forced repair of \"" << image << "\"";

  WB_EXPECTF(ForceRepair(runner_, image),
             "Could not prepare \"{}\" for read-write access", image);
  LOG(WARNING) << "\"" << image << "\" was only repaired, shared blocks may "
               << "remain and writes to them can fail";
  return UnshareMethod::kForcedRepairOnly;
}

Result<UnshareMethod> Unsharer::Materialize(
    const std::string& image, std::optional<Sectors> final_target) {
  WB_EXPECTF(CheckFilesystem(runner_, image),
             "\"{}\" must pass a filesystem check before unsharing", image);

  bool shared = true;
  auto info = ReadExt4Info(image);
  if (info.ok()) {
    shared = info->shared_blocks;
  } else {
    LOG(WARNING) << "Could not read the superblock of \"" << image
                 << "\", unsharing anyway: " << info.error().Message();
  }

  UnshareMethod method = UnshareMethod::kNotShared;
  if (shared) {
    // The headroom gives e2fsck space to copy every shared block.
    Sectors current = WB_EXPECT(ApparentSize(image));
    WB_EXPECT(TruncateFile(image, current * 2));
    WB_EXPECTF(resizer_.GrowToFill(image),
               "Could not grow \"{}\" for unsharing", image);
    method = WB_EXPECT(UnshareBlocks(image));
  } else {
    LOG(INFO) << "\"" << image << "\" has no shared blocks";
  }

  if (final_target) {
    WB_EXPECT(resizer_.ResizeTo(image, *final_target));
  } else {
    WB_EXPECT(resizer_.Shrink(image));
  }

  auto final_check = CheckFilesystem(runner_, image);
  if (!final_check.ok()) {
    LOG(WARNING) << "Final filesystem check failed for \"" << image
                 << "\", continuing: " << final_check.error().Message();
  }
  LOG(INFO) << "Materialized \"" << image << "\" using " << method;
  return method;
}

}  // namespace wsabridge

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

#include "wsabridge/host/libs/image/fsck.h"

#include <android-base/logging.h>

namespace wsabridge {
namespace {

Result<FsckOutcome> RunFsck(CommandRunner& runner, const std::string& image,
                            const std::string& mode_flag) {
  Command fsck_cmd("e2fsck");
  fsck_cmd.AddParameter("-f");
  fsck_cmd.AddParameter(mode_flag);
  fsck_cmd.AddParameter(image);
  auto output = WB_EXPECT(runner.Run(std::move(fsck_cmd)));
  return WB_EXPECTF(InterpretFsckExitCode(output.exit_code),
                    "`e2fsck -f {}` could not repair \"{}\"", mode_flag, image);
}

}  // namespace

std::ostream& operator<<(std::ostream& out, FsckOutcome outcome) {
  switch (outcome) {
    case FsckOutcome::kClean:
      return out << "clean";
    case FsckOutcome::kRepaired:
      return out << "repaired";
  }
  return out << "unknown";
}

Result<FsckOutcome> InterpretFsckExitCode(int exit_code) {
  if (exit_code == 0) {
    return FsckOutcome::kClean;
  }
  if (exit_code > 0 && (exit_code & ~(1 | 2)) == 0) {
    return FsckOutcome::kRepaired;
  }
  return WB_ERRF("e2fsck exited with {}", exit_code);
}

Result<FsckOutcome> CheckFilesystem(CommandRunner& runner,
                                    const std::string& image) {
  auto automatic = RunFsck(runner, image, "-p");
  if (automatic.ok()) {
    LOG(DEBUG) << "Filesystem in \"" << image << "\" is " << *automatic;
    return automatic;
  }
  LOG(WARNING) << "Automatic filesystem check failed for \"" << image
               << "\", attempting forced repair";
  LOG(DEBUG) << automatic.error().Trace();
  auto forced = ForceRepair(runner, image);
  if (!forced.ok()) {
    return WB_ERRF("Filesystem in \"{}\" could not be repaired: {}", image,
                   forced.error().Message());
  }
  return forced;
}

Result<FsckOutcome> ForceRepair(CommandRunner& runner,
                                const std::string& image) {
  auto outcome = WB_EXPECT(RunFsck(runner, image, "-y"));
  LOG(DEBUG) << "Forced repair of \"" << image << "\": " << outcome;
  return outcome;
}

}  // namespace wsabridge

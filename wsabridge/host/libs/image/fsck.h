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

#include <ostream>
#include <string>

#include "wsabridge/host/libs/image/command_runner.h"
#include "wsabridge/result/result.h"

namespace wsabridge {

enum class FsckOutcome {
  kClean,
  kRepaired,
};

std::ostream& operator<<(std::ostream& out, FsckOutcome outcome);

// e2fsck reports 0 for a clean filesystem and sets bit 1 (errors corrected)
// and/or bit 2 (corrected, reboot advised) after a repair. Any other bit means
// the run did not leave a consistent filesystem.
Result<FsckOutcome> InterpretFsckExitCode(int exit_code);

// Check and repair ladder: an automatic `e2fsck -f -p` pass first, then a full
// forced `e2fsck -f -y` pass. An error means both rungs failed; the caller
// decides whether that is fatal. The filesystem size is never changed.
Result<FsckOutcome> CheckFilesystem(CommandRunner& runner,
                                    const std::string& image);

// Just the forced repair rung, `e2fsck -f -y`.
Result<FsckOutcome> ForceRepair(CommandRunner& runner,
                                const std::string& image);

}  // namespace wsabridge

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

#include "wsabridge/common/libs/utils/subprocess.h"
#include "wsabridge/result/result.h"

namespace wsabridge {

struct CommandOutput {
  int exit_code = 0;
  std::string stdout_content;
  std::string stderr_content;
};

// Runs the external filesystem and container tools. Everything that touches
// an image goes through this interface so the retry ladders can be exercised
// without real images.
class CommandRunner {
 public:
  virtual ~CommandRunner() = default;

  // Runs `command` to completion. A non zero exit code is not an error here;
  // the error case is a command that could not be started or was killed.
  virtual Result<CommandOutput> Run(Command command,
                                    const std::string* stdin_content) = 0;

  Result<CommandOutput> Run(Command command) {
    return Run(std::move(command), nullptr);
  }
};

class HostCommandRunner : public CommandRunner {
 public:
  using CommandRunner::Run;
  Result<CommandOutput> Run(Command command,
                            const std::string* stdin_content) override;
};

// Runs `command` and requires a zero exit code. Returns the captured stdout.
Result<std::string> RunSuccessfully(CommandRunner& runner, Command command,
                                    const std::string* stdin_content = nullptr);

}  // namespace wsabridge

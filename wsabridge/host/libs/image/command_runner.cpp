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

#include "wsabridge/host/libs/image/command_runner.h"

#include <android-base/logging.h>
#include <android-base/strings.h>

namespace wsabridge {

Result<CommandOutput> HostCommandRunner::Run(Command command,
                                             const std::string* stdin_content) {
  std::string command_line = command.ToString();
  CommandOutput output;
  output.exit_code =
      RunWithManagedStdio(std::move(command), stdin_content,
                          &output.stdout_content, &output.stderr_content);
  WB_EXPECTF(output.exit_code >= 0, "Could not run \"{}\"", command_line);
  for (const auto& line :
       android::base::Split(android::base::Trim(output.stdout_content), "\n")) {
    if (!line.empty()) {
      LOG(VERBOSE) << line;
    }
  }
  return output;
}

Result<std::string> RunSuccessfully(CommandRunner& runner, Command command,
                                    const std::string* stdin_content) {
  std::string command_line = command.ToString();
  auto output = WB_EXPECT(runner.Run(std::move(command), stdin_content));
  WB_EXPECTF(output.exit_code == 0, "\"{}\" exited with {}: {}", command_line,
             output.exit_code, android::base::Trim(output.stderr_content));
  return output.stdout_content;
}

}  // namespace wsabridge

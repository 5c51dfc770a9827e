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

#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <android-base/strings.h>

#include "wsabridge/host/libs/image/command_runner.h"

namespace wsabridge {

// Test double for CommandRunner. Every command line is recorded. Responses are
// queued per command line prefix and consumed in order; anything unscripted
// exits with 0 and prints nothing. A response made with FailToRun makes Run
// itself return an error, as when the tool can't be started or its pipes
// break.
class FakeCommandRunner : public CommandRunner {
 public:
  struct Invocation {
    std::vector<std::string> args;
    std::string working_directory;
    std::optional<std::string> stdin_content;

    std::string CommandLine() const { return android::base::Join(args, " "); }
  };
  using SideEffect = std::function<void(const Invocation&)>;

  void Respond(const std::string& prefix, int exit_code,
               std::string stdout_content = "",
               SideEffect side_effect = nullptr) {
    Response response;
    response.prefix = prefix;
    response.exit_code = exit_code;
    response.stdout_content = std::move(stdout_content);
    response.side_effect = std::move(side_effect);
    responses_.push_back(std::move(response));
  }

  void FailToRun(const std::string& prefix, std::string message) {
    Response response;
    response.prefix = prefix;
    response.run_error = std::move(message);
    responses_.push_back(std::move(response));
  }

  using CommandRunner::Run;
  Result<CommandOutput> Run(Command command,
                            const std::string* stdin_content) override {
    Invocation invocation{command.Arguments(), command.WorkingDirectory(),
                          std::nullopt};
    if (stdin_content != nullptr) {
      invocation.stdin_content = *stdin_content;
    }
    invocations_.push_back(invocation);
    auto command_line = invocation.CommandLine();
    for (auto it = responses_.begin(); it != responses_.end(); ++it) {
      if (android::base::StartsWith(command_line, it->prefix)) {
        auto response = std::move(*it);
        responses_.erase(it);
        if (response.side_effect) {
          response.side_effect(invocation);
        }
        if (response.run_error) {
          return WB_ERR(*response.run_error);
        }
        CommandOutput output;
        output.exit_code = response.exit_code;
        output.stdout_content = std::move(response.stdout_content);
        return output;
      }
    }
    return CommandOutput{};
  }

  const std::vector<Invocation>& invocations() const { return invocations_; }

  std::vector<std::string> CommandLines() const {
    std::vector<std::string> lines;
    for (const auto& invocation : invocations_) {
      lines.push_back(invocation.CommandLine());
    }
    return lines;
  }

 private:
  struct Response {
    std::string prefix;
    int exit_code = 0;
    std::string stdout_content;
    SideEffect side_effect;
    std::optional<std::string> run_error;
  };
  std::deque<Response> responses_;
  std::vector<Invocation> invocations_;
};

}  // namespace wsabridge

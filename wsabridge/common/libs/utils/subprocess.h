/*
 * Copyright (C) 2018 The Android Open Source Project
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

#include <sys/types.h>

#include <map>
#include <sstream>
#include <string>
#include <vector>

#include <android-base/unique_fd.h>

namespace wsabridge {

// Keeps track of a running (sub)process. Allows to wait for its completion.
// It's an error to wait twice for the same subprocess.
class Subprocess {
 public:
  enum class StdIOChannel {
    kStdIn = 0,
    kStdOut = 1,
    kStdErr = 2,
  };

  explicit Subprocess(pid_t pid) : pid_(pid), started_(pid > 0) {}
  // The default implementation won't do because we need to reset the pid of the
  // moved object.
  Subprocess(Subprocess&&);
  ~Subprocess() = default;
  Subprocess& operator=(Subprocess&&);
  // Same as waitpid(2)
  pid_t Wait(int* wstatus, int options);
  // Whether the command started successfully. It only says whether the call to
  // fork() succeeded or not, it says nothing about exec or successful
  // completion of the command, that's what Wait is for.
  bool Started() const { return started_; }
  pid_t pid() const { return pid_; }

 private:
  // Copy is disabled to avoid waiting twice for the same pid (the first wait
  // frees the pid, which allows the kernel to reuse it so we may end up waiting
  // for the wrong process)
  Subprocess(const Subprocess&) = delete;
  Subprocess& operator=(const Subprocess&) = delete;
  pid_t pid_ = -1;
  bool started_ = false;
};

class SubprocessOptions {
 public:
  SubprocessOptions() : verbose_(true), exit_with_parent_(true) {}

  SubprocessOptions& Verbose(bool verbose) {
    verbose_ = verbose;
    return *this;
  }
  SubprocessOptions& ExitWithParent(bool exit_with_parent) {
    exit_with_parent_ = exit_with_parent;
    return *this;
  }

  bool Verbose() const { return verbose_; }
  bool ExitWithParent() const { return exit_with_parent_; }

 private:
  bool verbose_;
  bool exit_with_parent_;
};

// An executable command. The executable is looked up in PATH when it does not
// contain a slash. This class owns any file descriptors that the subprocess
// should get as its standard IO.
class Command {
 public:
  explicit Command(const std::string& executable) {
    command_.push_back(executable);
  }
  Command(Command&&) = default;
  Command& operator=(Command&&) = default;
  Command(const Command&) = delete;
  Command& operator=(const Command&) = delete;
  ~Command() = default;

  // Adds a single parameter to the command. All arguments are concatenated into
  // a single string to form a parameter. To add multiple parameters to the
  // command the function must be called multiple times, one per parameter.
  template <typename... Args>
  Command& AddParameter(Args&&... args) {
    std::stringstream ss;
    (ss << ... << std::forward<Args>(args));
    command_.push_back(ss.str());
    return *this;
  }

  // The subprocess changes to this directory before exec.
  Command& SetWorkingDirectory(const std::string& path) {
    working_directory_ = path;
    return *this;
  }

  // Redirects the standard IO of the command. The descriptor is duplicated,
  // the caller keeps ownership of `fd`.
  bool RedirectStdIO(Subprocess::StdIOChannel channel, int fd);

  // Starts execution of the command. This method can be called multiple times,
  // effectively staring multiple (possibly concurrent) instances.
  Subprocess Start(SubprocessOptions options = SubprocessOptions()) const;

  const std::string& GetShortName() const {
    // The constructor guarantees the name of the binary to be at index 0.
    return command_[0];
  }
  const std::vector<std::string>& Arguments() const { return command_; }
  const std::string& WorkingDirectory() const { return working_directory_; }

  // Space separated rendering for log lines.
  std::string ToString() const;

 private:
  std::vector<std::string> command_;
  std::string working_directory_;
  std::map<Subprocess::StdIOChannel, android::base::unique_fd> redirects_;
};

/*
 * Consumes a Command and runs it, optionally managing the stdio channels.
 *
 * If `stdin` is set, the subprocess stdin will be pipe providing its contents.
 * If `stdout` is set, the subprocess stdout will be captured and saved to it.
 * If `stderr` is set, the subprocess stderr will be captured and saved to it.
 *
 * If `command` exits normally, the lower 8 bits of the return code will be
 * returned in a value between 0 and 255.
 * If some setup fails, `command` fails to start, or `command` exits due to a
 * signal, the return value will be negative.
 */
int RunWithManagedStdio(Command&& command, const std::string* stdin,
                        std::string* stdout, std::string* stderr,
                        SubprocessOptions options = SubprocessOptions());

}  // namespace wsabridge

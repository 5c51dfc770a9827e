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

#include "wsabridge/common/libs/utils/subprocess.h"

#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <stdlib.h>
#include <string.h>
#include <sys/prctl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <thread>

#include <android-base/file.h>
#include <android-base/logging.h>
#include <android-base/strings.h>

namespace wsabridge {
namespace {

void DoRedirects(
    const std::map<Subprocess::StdIOChannel, android::base::unique_fd>&
        redirects) {
  for (const auto& entry : redirects) {
    auto std_channel = static_cast<int>(entry.first);
    TEMP_FAILURE_RETRY(dup2(entry.second.get(), std_channel));
  }
}

std::vector<const char*> ToCharPointers(const std::vector<std::string>& vect) {
  std::vector<const char*> ret = {};
  for (const auto& str : vect) {
    ret.push_back(str.c_str());
  }
  ret.push_back(NULL);
  return ret;
}

// A class that waits for threads to exit in its destructor.
class ThreadJoiner {
 public:
  ThreadJoiner(const std::vector<std::thread*> threads) : threads_(threads) {}
  ~ThreadJoiner() { Join(); }
  void Join() {
    for (auto& thread : threads_) {
      if (thread->joinable()) {
        thread->join();
      }
    }
  }

 private:
  std::vector<std::thread*> threads_;
};

}  // namespace

Subprocess::Subprocess(Subprocess&& subprocess)
    : pid_(subprocess.pid_), started_(subprocess.started_) {
  // Make sure the moved object no longer controls this subprocess
  subprocess.pid_ = -1;
  subprocess.started_ = false;
}

Subprocess& Subprocess::operator=(Subprocess&& other) {
  pid_ = other.pid_;
  started_ = other.started_;

  other.pid_ = -1;
  other.started_ = false;
  return *this;
}

pid_t Subprocess::Wait(int* wstatus, int options) {
  if (pid_ < 0) {
    LOG(ERROR)
        << "Attempt to wait on invalid pid(has it been waited on already?): "
        << pid_;
    return -1;
  }
  auto retval = TEMP_FAILURE_RETRY(waitpid(pid_, wstatus, options));
  // We don't want to wait twice for the same process
  pid_ = -1;
  return retval;
}

bool Command::RedirectStdIO(Subprocess::StdIOChannel channel, int fd) {
  if (fd < 0) {
    return false;
  }
  if (redirects_.count(channel)) {
    LOG(ERROR) << "Attempted multiple redirections of fd: "
               << static_cast<int>(channel);
    return false;
  }
  android::base::unique_fd dup_fd(fcntl(fd, F_DUPFD_CLOEXEC, 3));
  if (dup_fd.get() < 0) {
    PLOG(ERROR) << "Could not acquire a new file descriptor";
    return false;
  }
  redirects_[channel] = std::move(dup_fd);
  return true;
}

std::string Command::ToString() const {
  return android::base::Join(command_, " ");
}

Subprocess Command::Start(SubprocessOptions options) const {
  auto cmd = ToCharPointers(command_);

  pid_t pid = fork();
  if (!pid) {
    if (options.ExitWithParent()) {
      prctl(PR_SET_PDEATHSIG, SIGHUP);  // Die when parent dies
    }

    DoRedirects(redirects_);
    if (!working_directory_.empty() && chdir(working_directory_.c_str()) != 0) {
      PLOG(ERROR) << "chdir(\"" << working_directory_ << "\") failed";
      _exit(127);
    }
    execvp(cmd[0], const_cast<char* const*>(cmd.data()));
    // No need for an if: if exec worked it wouldn't have returned
    PLOG(ERROR) << "exec of " << cmd[0] << " failed";
    _exit(127);
  }
  if (pid == -1) {
    PLOG(ERROR) << "fork failed";
  }
  if (options.Verbose()) {
    LOG(DEBUG) << "Started (pid: " << pid << "): " << ToString();
  } else {
    LOG(VERBOSE) << "Started (pid: " << pid << "): " << ToString();
  }
  return Subprocess(pid);
}

int RunWithManagedStdio(Command&& cmd_tmp, const std::string* stdin,
                        std::string* stdout, std::string* stderr,
                        SubprocessOptions options) {
  /*
   * The order of these declarations is necessary for safety. If the function
   * returns at any point, the Command will be destroyed first, closing all of
   * its pipe ends. This will cause the thread internals to fail their reads or
   * writes. The ThreadJoiner then waits for the threads to complete, as running
   * the destructor of an active std::thread crashes the program.
   */
  std::thread stdin_thread, stdout_thread, stderr_thread;
  ThreadJoiner thread_joiner({&stdin_thread, &stdout_thread, &stderr_thread});
  Command cmd = std::move(cmd_tmp);
  bool io_error = false;
  android::base::unique_fd stdin_write, stdout_read, stderr_read;
  if (stdin != nullptr) {
    android::base::unique_fd pipe_read;
    if (!android::base::Pipe(&pipe_read, &stdin_write)) {
      PLOG(ERROR) << "Could not create a pipe to write the stdin of \""
                  << cmd.GetShortName() << "\"";
      return -1;
    }
    if (!cmd.RedirectStdIO(Subprocess::StdIOChannel::kStdIn, pipe_read.get())) {
      LOG(ERROR) << "Could not set stdin of \"" << cmd.GetShortName()
                 << "\", was already set.";
      return -1;
    }
  }
  if (stdout != nullptr) {
    android::base::unique_fd pipe_write;
    if (!android::base::Pipe(&stdout_read, &pipe_write)) {
      PLOG(ERROR) << "Could not create a pipe to read the stdout of \""
                  << cmd.GetShortName() << "\"";
      return -1;
    }
    if (!cmd.RedirectStdIO(Subprocess::StdIOChannel::kStdOut,
                           pipe_write.get())) {
      LOG(ERROR) << "Could not set stdout of \"" << cmd.GetShortName()
                 << "\", was already set.";
      return -1;
    }
  }
  if (stderr != nullptr) {
    android::base::unique_fd pipe_write;
    if (!android::base::Pipe(&stderr_read, &pipe_write)) {
      PLOG(ERROR) << "Could not create a pipe to read the stderr of \""
                  << cmd.GetShortName() << "\"";
      return -1;
    }
    if (!cmd.RedirectStdIO(Subprocess::StdIOChannel::kStdErr,
                           pipe_write.get())) {
      LOG(ERROR) << "Could not set stderr of \"" << cmd.GetShortName()
                 << "\", was already set.";
      return -1;
    }
  }

  auto subprocess = cmd.Start(options);
  if (!subprocess.Started()) {
    return -1;
  }
  auto cmd_short_name = cmd.GetShortName();
  {
    // Force the destructor to run by moving it into a smaller scope.
    // This is necessary to close the child's ends of the pipes.
    Command force_delete = std::move(cmd);
  }
  if (stdin != nullptr) {
    stdin_thread = std::thread([fd = std::move(stdin_write), stdin,
                                &io_error]() mutable {
      if (!android::base::WriteStringToFd(*stdin, fd.get())) {
        io_error = true;
        PLOG(ERROR) << "Error in writing stdin to process";
      }
      fd.reset();
    });
  }
  if (stdout != nullptr) {
    stdout_thread = std::thread([fd = std::move(stdout_read), stdout,
                                 &io_error]() {
      if (!android::base::ReadFdToString(fd.get(), stdout)) {
        io_error = true;
        PLOG(ERROR) << "Error in reading stdout from process";
      }
    });
  }
  if (stderr != nullptr) {
    stderr_thread = std::thread([fd = std::move(stderr_read), stderr,
                                 &io_error]() {
      if (!android::base::ReadFdToString(fd.get(), stderr)) {
        io_error = true;
        PLOG(ERROR) << "Error in reading stderr from process";
      }
    });
  }
  int wstatus = 0;
  if (subprocess.Wait(&wstatus, 0) < 0) {
    PLOG(ERROR) << "waitpid on " << cmd_short_name << " failed";
    return -1;
  }
  thread_joiner.Join();
  if (WIFSIGNALED(wstatus)) {
    LOG(ERROR) << "Command was interrupted by a signal: " << WTERMSIG(wstatus);
    return -1;
  }
  if (io_error) {
    LOG(ERROR) << "IO error communicating with " << cmd_short_name;
    return -1;
  }
  return WEXITSTATUS(wstatus);
}

}  // namespace wsabridge

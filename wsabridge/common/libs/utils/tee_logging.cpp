//
// Copyright (C) 2020 The Android Open Source Project
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "wsabridge/common/libs/utils/tee_logging.h"

#include <fcntl.h>
#include <inttypes.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <time.h>
#include <unistd.h>

#include <android-base/file.h>
#include <android-base/macros.h>
#include <android-base/stringprintf.h>
#include <android-base/strings.h>
#include <android-base/threads.h>

using android::base::GetThreadId;
using android::base::FATAL;
using android::base::LogSeverity;
using android::base::StringPrintf;

namespace wsabridge {

Result<LogSeverity> ToSeverity(const std::string& value) {
  using android::base::VERBOSE;
  using android::base::DEBUG;
  using android::base::INFO;
  using android::base::WARNING;
  using android::base::ERROR;
  using android::base::FATAL_WITHOUT_ABORT;
  using android::base::EqualsIgnoreCase;
  if (EqualsIgnoreCase(value, "VERBOSE") ||
      value == std::to_string((int)VERBOSE)) {
    return VERBOSE;
  } else if (EqualsIgnoreCase(value, "DEBUG") ||
             value == std::to_string((int)DEBUG)) {
    return DEBUG;
  } else if (EqualsIgnoreCase(value, "INFO") ||
             value == std::to_string((int)INFO)) {
    return INFO;
  } else if (EqualsIgnoreCase(value, "WARNING") ||
             value == std::to_string((int)WARNING)) {
    return WARNING;
  } else if (EqualsIgnoreCase(value, "ERROR") ||
             value == std::to_string((int)ERROR)) {
    return ERROR;
  } else if (EqualsIgnoreCase(value, "FATAL_WITHOUT_ABORT") ||
             value == std::to_string((int)FATAL_WITHOUT_ABORT)) {
    return FATAL_WITHOUT_ABORT;
  } else if (EqualsIgnoreCase(value, "FATAL") ||
             value == std::to_string((int)FATAL)) {
    return FATAL;
  }
  return WB_ERR("Unexpected severity: \"" << value << "\"");
}

static LogSeverity GuessSeverity(const std::string& env_var,
                                 LogSeverity default_value) {
  char* env_cstr = getenv(env_var.c_str());
  if (env_cstr == nullptr) {
    return default_value;
  }
  auto severity = ToSeverity(env_cstr);
  return severity.ok() ? *severity : default_value;
}

LogSeverity ConsoleSeverity() {
  return GuessSeverity("WSA_BRIDGE_CONSOLE_SEVERITY", android::base::INFO);
}

LogSeverity LogFileSeverity() {
  return GuessSeverity("WSA_BRIDGE_FILE_SEVERITY", android::base::VERBOSE);
}

TeeLogger::TeeLogger(const std::vector<SeverityTarget>& destinations)
    : destinations_(destinations) {}

// Copied from system/libbase/logging_splitters.h
// This splits the message up line by line, by calling log_function with a
// pointer to the start of each line and the size up to the newline character.
// It sends size = -1 for the final line.
template <typename F>
static void SplitByLines(const char* msg, const F& log_function) {
  const char* newline = strchr(msg, '\n');
  while (newline != nullptr) {
    log_function(msg, newline - msg);
    msg = newline + 1;
    newline = strchr(msg, '\n');
  }

  log_function(msg, -1);
}

std::string StderrOutputGenerator(const struct tm& now, int pid, uint64_t tid,
                                  LogSeverity severity, const char* tag,
                                  const char* file, unsigned int line,
                                  const char* message) {
  char timestamp[32];
  strftime(timestamp, sizeof(timestamp), "%m-%d %H:%M:%S", &now);

  static const char log_characters[] = "VDIWEFF";
  static_assert(arraysize(log_characters) - 1 == FATAL + 1,
                "Mismatch in size of log_characters and values in LogSeverity");
  char severity_char = log_characters[severity];
  std::string line_prefix;
  if (file != nullptr) {
    line_prefix =
        StringPrintf("%s %c %s %5d %5" PRIu64 " %s:%u] ", tag ? tag : "nullptr",
                     severity_char, timestamp, pid, tid, file, line);
  } else {
    line_prefix = StringPrintf("%s %c %s %5d %5" PRIu64 " ",
                               tag ? tag : "nullptr", severity_char, timestamp,
                               pid, tid);
  }

  std::string output_string;
  auto concat_lines = [&](const char* message, int size) {
    output_string.append(line_prefix);
    if (size == -1) {
      output_string.append(message);
    } else {
      output_string.append(message, size);
    }
    output_string.append("\n");
  };
  SplitByLines(message, concat_lines);
  return output_string;
}

void TeeLogger::operator()(android::base::LogId, LogSeverity severity,
                           const char* tag, const char* file,
                           unsigned int line, const char* message) {
  struct tm now;
  time_t t = time(nullptr);
  localtime_r(&t, &now);
  auto output_string = StderrOutputGenerator(now, getpid(), GetThreadId(),
                                             severity, tag, file, line, message);
  for (const auto& destination : destinations_) {
    if (severity >= destination.severity) {
      // Nowhere left to report a failed log write.
      (void)android::base::WriteStringToFd(output_string,
                                           destination.target->get());
    }
  }
}

Result<TeeLogger> LogToStderrAndFiles(const std::vector<std::string>& files) {
  std::vector<SeverityTarget> log_severities;
  for (const auto& file : files) {
    auto log_file_fd = std::make_shared<android::base::unique_fd>(
        open(file.c_str(), O_CREAT | O_WRONLY | O_APPEND | O_CLOEXEC,
             S_IRUSR | S_IWUSR | S_IRGRP | S_IWGRP));
    if (log_file_fd->get() < 0) {
      return WB_ERRNO("Failed to create log file \"" << file
                                                     << "\": " << strerror(errno));
    }
    log_severities.push_back(SeverityTarget{LogFileSeverity(), log_file_fd});
  }
  auto stderr_fd = std::make_shared<android::base::unique_fd>(
      fcntl(STDERR_FILENO, F_DUPFD_CLOEXEC, 3));
  if (stderr_fd->get() < 0) {
    return WB_ERRNO("Failed to duplicate stderr: " << strerror(errno));
  }
  log_severities.push_back(SeverityTarget{ConsoleSeverity(), stderr_fd});
  return TeeLogger(log_severities);
}

}  // namespace wsabridge

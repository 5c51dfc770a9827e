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

#pragma once

#include <memory>
#include <string>
#include <vector>

#include <android-base/logging.h>
#include <android-base/unique_fd.h>

#include "wsabridge/result/result.h"

namespace wsabridge {

android::base::LogSeverity ConsoleSeverity();
android::base::LogSeverity LogFileSeverity();

Result<android::base::LogSeverity> ToSeverity(const std::string& value);

std::string StderrOutputGenerator(const struct tm& now, int pid, uint64_t tid,
                                  android::base::LogSeverity severity,
                                  const char* tag, const char* file,
                                  unsigned int line, const char* message);

struct SeverityTarget {
  android::base::LogSeverity severity;
  // Shared so that the logger stays copyable, as SetLogger requires.
  std::shared_ptr<android::base::unique_fd> target;
};

class TeeLogger {
 public:
  TeeLogger(const std::vector<SeverityTarget>& destinations);
  ~TeeLogger() = default;

  void operator()(android::base::LogId log_id,
                  android::base::LogSeverity severity, const char* tag,
                  const char* file, unsigned int line, const char* message);

 private:
  std::vector<SeverityTarget> destinations_;
};

Result<TeeLogger> LogToStderrAndFiles(const std::vector<std::string>& files);

}  // namespace wsabridge

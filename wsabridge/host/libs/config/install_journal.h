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

#include <stdint.h>

#include <optional>
#include <ostream>
#include <string>

#include <json/json.h>

#include "wsabridge/host/libs/config/install_config.h"
#include "wsabridge/result/result.h"

namespace wsabridge {

// Pipeline stages in execution order. A journal names the last one that
// completed.
enum class InstallStage {
  kStarted,
  kConverted,
  kMaterialized,
  kMounted,
  kInstalled,
  kFinalized,
  kArchived,
};

std::string InstallStageName(InstallStage stage);
Result<InstallStage> ParseInstallStage(const std::string& name);
std::ostream& operator<<(std::ostream& out, InstallStage stage);

struct JournalRecord {
  LayerType layer = LayerType::kHoudini;
  std::string source;
  InstallStage stage = InstallStage::kStarted;
  // Planned sizes in 512 byte sectors, 0 until planned.
  uint64_t system_target_sectors = 0;
  uint64_t vendor_target_sectors = 0;
  bool vendor_expanded = false;
};

Json::Value ToJson(const JournalRecord& record);
Result<JournalRecord> JournalRecordFromJson(const Json::Value& root);

// Progress of a run, kept in a json file inside the working directory so that
// a later run can tell the previous one died half way.
class InstallJournal {
 public:
  explicit InstallJournal(std::string path) : path_(std::move(path)) {}

  // The record left by an earlier run, nullopt if there is none.
  Result<std::optional<JournalRecord>> Load() const;
  Result<void> Record(const JournalRecord& record);
  Result<void> Remove();

  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

}  // namespace wsabridge

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

#include "wsabridge/host/libs/config/install_journal.h"

#include <android-base/logging.h>

#include "wsabridge/common/libs/utils/files.h"
#include "wsabridge/common/libs/utils/json.h"

namespace wsabridge {
namespace {

constexpr char kLayerKey[] = "layer";
constexpr char kSourceKey[] = "source";
constexpr char kStageKey[] = "stage";
constexpr char kSystemTargetKey[] = "system_target_sectors";
constexpr char kVendorTargetKey[] = "vendor_target_sectors";
constexpr char kVendorExpandedKey[] = "vendor_expanded";

constexpr InstallStage kAllStages[] = {
    InstallStage::kStarted,   InstallStage::kConverted,
    InstallStage::kMaterialized, InstallStage::kMounted,
    InstallStage::kInstalled, InstallStage::kFinalized,
    InstallStage::kArchived};

}  // namespace

std::string InstallStageName(InstallStage stage) {
  switch (stage) {
    case InstallStage::kStarted:
      return "started";
    case InstallStage::kConverted:
      return "converted";
    case InstallStage::kMaterialized:
      return "materialized";
    case InstallStage::kMounted:
      return "mounted";
    case InstallStage::kInstalled:
      return "installed";
    case InstallStage::kFinalized:
      return "finalized";
    case InstallStage::kArchived:
      return "archived";
  }
  return "unknown";
}

Result<InstallStage> ParseInstallStage(const std::string& name) {
  for (auto stage : kAllStages) {
    if (InstallStageName(stage) == name) {
      return stage;
    }
  }
  return WB_ERRF("Unknown install stage \"{}\"", name);
}

std::ostream& operator<<(std::ostream& out, InstallStage stage) {
  return out << InstallStageName(stage);
}

Json::Value ToJson(const JournalRecord& record) {
  Json::Value root(Json::objectValue);
  root[kLayerKey] = LayerTypeName(record.layer);
  root[kSourceKey] = record.source;
  root[kStageKey] = InstallStageName(record.stage);
  root[kSystemTargetKey] = Json::UInt64(record.system_target_sectors);
  root[kVendorTargetKey] = Json::UInt64(record.vendor_target_sectors);
  root[kVendorExpandedKey] = record.vendor_expanded;
  return root;
}

Result<JournalRecord> JournalRecordFromJson(const Json::Value& root) {
  JournalRecord record;
  auto layer_name = WB_EXPECT(GetValue<std::string>(root, {kLayerKey}));
  record.layer = WB_EXPECT(ParseLayerType(layer_name));
  record.source = WB_EXPECT(GetValue<std::string>(root, {kSourceKey}));
  auto stage_name = WB_EXPECT(GetValue<std::string>(root, {kStageKey}));
  record.stage = WB_EXPECT(ParseInstallStage(stage_name));
  if (HasValue(root, {kSystemTargetKey})) {
    record.system_target_sectors =
        WB_EXPECT(GetValue<uint64_t>(root, {kSystemTargetKey}));
  }
  if (HasValue(root, {kVendorTargetKey})) {
    record.vendor_target_sectors =
        WB_EXPECT(GetValue<uint64_t>(root, {kVendorTargetKey}));
  }
  if (HasValue(root, {kVendorExpandedKey})) {
    record.vendor_expanded =
        WB_EXPECT(GetValue<bool>(root, {kVendorExpandedKey}));
  }
  return record;
}

Result<std::optional<JournalRecord>> InstallJournal::Load() const {
  if (!FileExists(path_)) {
    return std::nullopt;
  }
  auto root = WB_EXPECT(LoadFromFile(path_));
  auto record = WB_EXPECTF(JournalRecordFromJson(root),
                           "Malformed journal \"{}\"", path_);
  return record;
}

Result<void> InstallJournal::Record(const JournalRecord& record) {
  LOG(VERBOSE) << "Journal " << path_ << ": " << record.stage;
  WB_EXPECT(SaveToFile(ToJson(record), path_));
  return {};
}

Result<void> InstallJournal::Remove() {
  WB_EXPECT(RemovePath(path_));
  return {};
}

}  // namespace wsabridge

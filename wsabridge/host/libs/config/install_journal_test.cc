//
// Copyright (C) 2025 The Android Open Source Project
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

#include "wsabridge/host/libs/config/install_journal.h"

#include <string>

#include <android-base/file.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "wsabridge/common/libs/utils/files.h"
#include "wsabridge/result/result_matchers.h"

namespace wsabridge {
namespace {

using ::testing::HasSubstr;

TEST(InstallJournalTest, NoJournalYet) {
  TemporaryDir dir;
  InstallJournal journal(std::string(dir.path) + "/state.json");
  auto previous = journal.Load();
  ASSERT_THAT(previous, IsOk());
  EXPECT_FALSE(previous->has_value());
}

TEST(InstallJournalTest, RecordThenLoad) {
  TemporaryDir dir;
  InstallJournal journal(std::string(dir.path) + "/state.json");
  JournalRecord record;
  record.layer = LayerType::kNdk;
  record.source = "chromeos_zork";
  record.stage = InstallStage::kMounted;
  record.system_target_sectors = 12582912;
  record.vendor_target_sectors = 3325952;
  record.vendor_expanded = true;
  ASSERT_THAT(journal.Record(record), IsOk());

  auto loaded = journal.Load();
  ASSERT_THAT(loaded, IsOk());
  ASSERT_TRUE(loaded->has_value());
  const auto& previous = **loaded;
  EXPECT_EQ(previous.layer, LayerType::kNdk);
  EXPECT_EQ(previous.source, "chromeos_zork");
  EXPECT_EQ(previous.stage, InstallStage::kMounted);
  EXPECT_EQ(previous.system_target_sectors, 12582912u);
  EXPECT_EQ(previous.vendor_target_sectors, 3325952u);
  EXPECT_TRUE(previous.vendor_expanded);
}

TEST(InstallJournalTest, LaterStageOverwrites) {
  TemporaryDir dir;
  InstallJournal journal(std::string(dir.path) + "/state.json");
  JournalRecord record;
  record.source = "aow-13";
  ASSERT_THAT(journal.Record(record), IsOk());
  record.stage = InstallStage::kFinalized;
  ASSERT_THAT(journal.Record(record), IsOk());
  auto loaded = journal.Load();
  ASSERT_THAT(loaded, IsOk());
  ASSERT_TRUE(loaded->has_value());
  EXPECT_EQ((*loaded)->stage, InstallStage::kFinalized);
}

TEST(InstallJournalTest, RemoveIsIdempotent) {
  TemporaryDir dir;
  InstallJournal journal(std::string(dir.path) + "/state.json");
  ASSERT_THAT(journal.Record(JournalRecord{}), IsOk());
  EXPECT_THAT(journal.Remove(), IsOk());
  EXPECT_FALSE(FileExists(journal.path()));
  EXPECT_THAT(journal.Remove(), IsOk());
}

TEST(InstallJournalTest, UnknownStageIsMalformed) {
  TemporaryDir dir;
  std::string path = std::string(dir.path) + "/state.json";
  ASSERT_THAT(WriteFile(path, R"({"layer": "libndk", "source": "chromeos_zork",
                                  "stage": "halfway"})"),
              IsOk());
  InstallJournal journal(path);
  EXPECT_THAT(journal.Load(), IsErrorAndMessage(HasSubstr("Malformed")));
}

TEST(InstallStageTest, NamesParseBack) {
  EXPECT_THAT(ParseInstallStage("materialized"),
              IsOkAndValue(InstallStage::kMaterialized));
  EXPECT_EQ(InstallStageName(InstallStage::kArchived), "archived");
}

}  // namespace
}  // namespace wsabridge

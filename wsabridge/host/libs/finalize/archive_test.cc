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


#include "wsabridge/host/libs/finalize/archive.h"

#include <string>

#include <android-base/file.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "wsabridge/common/libs/utils/files.h"
#include "wsabridge/host/libs/image/fake_command_runner.h"
#include "wsabridge/result/result_matchers.h"

namespace wsabridge {
namespace {

using ::testing::ElementsAre;
using ::testing::Eq;
using ::testing::HasSubstr;

TEST(SevenZipCommandTest, UsesReleaseCompressionSettings) {
  auto command = SevenZipCommand("WSA_zork.7z", "chromeos_zork");
  EXPECT_THAT(command.Arguments(),
              ElementsAre("7z", "a", "-t7z", "-m0=lzma2", "-mx=9", "-mfb=64",
                          "-md=32m", "-ms=on", "WSA_zork.7z", "chromeos_zork"));
}

class ArchiveTest : public ::testing::Test {
 protected:
  void SetUp() override {
    images_ = std::string(images_dir_.path);
    payload_root_ = std::string(payload_dir_.path);
    ASSERT_THAT(WriteFile(images_ + "/system.vhdx", "system"), IsOk());
    ASSERT_THAT(WriteFile(images_ + "/vendor.vhdx", "vendor"), IsOk());
    ASSERT_THAT(EnsureDirectoryExists(payload_root_ + "/libndk/chromeos_zork"),
                IsOk());
  }

  Result<InstallConfig> Config(const std::string& archive) {
    InstallFlags flags;
    flags.type = "libndk";
    flags.source = "chromeos_zork";
    flags.dir = images_;
    flags.archive = archive;
    flags.payload_root = payload_root_;
    return InstallConfig::FromFlags(flags);
  }

  TemporaryDir images_dir_;
  TemporaryDir payload_dir_;
  std::string images_;
  std::string payload_root_;
  FakeCommandRunner runner_;
};

TEST_F(ArchiveTest, StagingCopiesBothContainers) {
  auto config = Config("WSA_zork");
  ASSERT_THAT(config, IsOk());
  ASSERT_THAT(StageContainers(*config), IsOk());
  EXPECT_THAT(ReadFile(config->SystemVhdx()), IsOkAndValue(Eq("system")));
  EXPECT_THAT(ReadFile(config->VendorVhdx()), IsOkAndValue(Eq("vendor")));
  // The originals stay where they were.
  EXPECT_TRUE(FileExists(images_ + "/system.vhdx"));
}

TEST_F(ArchiveTest, StagingWithoutArchiveDoesNothing) {
  auto config = Config("");
  ASSERT_THAT(config, IsOk());
  ASSERT_THAT(StageContainers(*config), IsOk());
  EXPECT_FALSE(DirectoryExists(images_ + "/chromeos_zork"));
}

TEST_F(ArchiveTest, ArchivesWorkDirFromInputDir) {
  auto config = Config("WSA_zork");
  ASSERT_THAT(config, IsOk());
  ASSERT_THAT(StageContainers(*config), IsOk());

  EXPECT_THAT(CreateArchive(runner_, *config),
              IsOkAndValue(Eq(images_ + "/WSA_zork.7z")));
  ASSERT_EQ(runner_.invocations().size(), 1u);
  const auto& call = runner_.invocations()[0];
  EXPECT_EQ(call.working_directory, images_);
  EXPECT_EQ(call.CommandLine(),
            "7z a -t7z -m0=lzma2 -mx=9 -mfb=64 -md=32m -ms=on WSA_zork.7z "
            "chromeos_zork");
  EXPECT_FALSE(DirectoryExists(config->work_dir()));
}

TEST_F(ArchiveTest, ExistingArchiveIsReplaced) {
  auto config = Config("WSA_zork");
  ASSERT_THAT(config, IsOk());
  ASSERT_THAT(WriteFile(images_ + "/WSA_zork.7z", "stale"), IsOk());
  const auto archive = images_ + "/WSA_zork.7z";
  runner_.Respond("7z a", 0, "",
                  [archive](const FakeCommandRunner::Invocation&) {
                    EXPECT_FALSE(FileExists(archive));
                  });
  ASSERT_THAT(CreateArchive(runner_, *config), IsOk());
}

TEST_F(ArchiveTest, FailedCompressionKeepsWorkDir) {
  auto config = Config("WSA_zork");
  ASSERT_THAT(config, IsOk());
  ASSERT_THAT(StageContainers(*config), IsOk());
  runner_.Respond("7z a", 2);
  EXPECT_THAT(CreateArchive(runner_, *config),
              IsErrorAndMessage(HasSubstr("Could not create archive")));
  EXPECT_TRUE(FileExists(config->SystemVhdx()));
}

TEST_F(ArchiveTest, ArchiveMustBeRequested) {
  auto config = Config("");
  ASSERT_THAT(config, IsOk());
  EXPECT_THAT(CreateArchive(runner_, *config), IsError());
  EXPECT_TRUE(runner_.invocations().empty());
}

}  // namespace
}  // namespace wsabridge

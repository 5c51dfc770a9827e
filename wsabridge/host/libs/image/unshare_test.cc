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

#include "wsabridge/host/libs/image/unshare.h"

#include <endian.h>
#include <string.h>

#include <string>

#include <android-base/file.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "wsabridge/common/libs/utils/files.h"
#include "wsabridge/host/libs/image/ext4_info.h"
#include "wsabridge/host/libs/image/fake_command_runner.h"
#include "wsabridge/result/result_matchers.h"

namespace wsabridge {
namespace {

using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::Eq;
using ::testing::Optional;

// 4 KiB blocks, 512 blocks, optionally flagged as sharing blocks.
void WriteSuperblock(const std::string& image, bool shared_blocks) {
  std::string data(kExt4SuperblockOffset + kExt4SuperblockSize, '\0');
  auto put32 = [&data](size_t offset, uint32_t value) {
    value = htole32(value);
    memcpy(data.data() + kExt4SuperblockOffset + offset, &value, sizeof(value));
  };
  put32(0x04, 512);
  put32(0x0C, 100);
  put32(0x18, 2);
  uint16_t magic = htole16(0xEF53);
  memcpy(data.data() + kExt4SuperblockOffset + 0x38, &magic, sizeof(magic));
  put32(0x64, shared_blocks ? 0x4000 : 0);
  ASSERT_TRUE(android::base::WriteStringToFile(data, image));
  ASSERT_THAT(TruncateFile(image, Sectors::FromMiB(1)), IsOk());
}

class UnsharerTest : public ::testing::Test {
 protected:
  void SetUp() override { image_ = std::string(dir_.path) + "/system.img"; }

  TemporaryDir dir_;
  std::string image_;
  FakeCommandRunner runner_;
  ImageResizer resizer_{runner_};
  Unsharer unsharer_{runner_, resizer_};
};

TEST_F(UnsharerTest, SharedImageGetsHeadroomUnshareAndFinalTarget) {
  WriteSuperblock(image_, true);
  ASSERT_THAT(unsharer_.Materialize(image_, Sectors::FromMiB(3)),
              IsOkAndValue(Eq(UnshareMethod::kAutomatic)));

  EXPECT_THAT(runner_.CommandLines(),
              ElementsAre("e2fsck -f -p " + image_, "resize2fs " + image_,
                          "e2fsck -pf -E unshare_blocks " + image_,
                          "e2fsck -f -p " + image_, "resize2fs " + image_,
                          "e2fsck -f -p " + image_));
  EXPECT_THAT(ApparentSize(image_), IsOkAndValue(Eq(Sectors::FromMiB(3))));
}

TEST_F(UnsharerTest, FinalTargetBelowHeadroomShrinksBack) {
  WriteSuperblock(image_, true);
  // Doubled to 2 MiB for the unshare pass, then brought back to 1.5 MiB.
  ASSERT_THAT(unsharer_.Materialize(image_, Sectors(3072)), IsOk());
  EXPECT_THAT(ApparentSize(image_), IsOkAndValue(Eq(Sectors(3072))));
}

TEST_F(UnsharerTest, InteractiveUnshareGetsConfirmationOnStdin) {
  WriteSuperblock(image_, true);
  runner_.Respond("e2fsck -pf -E unshare_blocks", 4);
  ASSERT_THAT(unsharer_.Materialize(image_, std::nullopt),
              IsOkAndValue(Eq(UnshareMethod::kInteractive)));

  const auto& calls = runner_.invocations();
  ASSERT_GE(calls.size(), 4u);
  EXPECT_EQ(calls[3].CommandLine(), "e2fsck -E unshare_blocks " + image_);
  EXPECT_THAT(calls[3].stdin_content, Optional(Eq(std::string("y\n"))));
}

TEST_F(UnsharerTest, ForcedRepairIsTheLastResort) {
  WriteSuperblock(image_, true);
  runner_.Respond("e2fsck -pf -E unshare_blocks", 8);
  runner_.Respond("e2fsck -E unshare_blocks", 8);
  EXPECT_THAT(unsharer_.Materialize(image_, std::nullopt),
              IsOkAndValue(Eq(UnshareMethod::kForcedRepairOnly)));
}

TEST_F(UnsharerTest, UnshareThatCannotRunFallsThrough) {
  WriteSuperblock(image_, true);
  runner_.Respond("e2fsck -pf -E unshare_blocks", 8);
  runner_.FailToRun("e2fsck -E unshare_blocks", "Broken pipe writing stdin");
  EXPECT_THAT(unsharer_.Materialize(image_, std::nullopt),
              IsOkAndValue(Eq(UnshareMethod::kForcedRepairOnly)));
  EXPECT_THAT(runner_.CommandLines(), Contains("e2fsck -f -y " + image_));
}

TEST_F(UnsharerTest, AutomaticUnshareThatCannotRunTriesInteractive) {
  WriteSuperblock(image_, true);
  runner_.FailToRun("e2fsck -pf -E unshare_blocks", "could not start");
  EXPECT_THAT(unsharer_.Materialize(image_, std::nullopt),
              IsOkAndValue(Eq(UnshareMethod::kInteractive)));
}

TEST_F(UnsharerTest, FailsWhenEveryUnshareRungFails) {
  WriteSuperblock(image_, true);
  runner_.Respond("e2fsck -pf -E unshare_blocks", 8);
  runner_.Respond("e2fsck -E unshare_blocks", 8);
  runner_.Respond("e2fsck -f -y", 8);
  EXPECT_THAT(unsharer_.Materialize(image_, std::nullopt), IsError());
}

TEST_F(UnsharerTest, UnsharedImageOnlyResizes) {
  WriteSuperblock(image_, false);
  ASSERT_THAT(unsharer_.Materialize(image_, std::nullopt),
              IsOkAndValue(Eq(UnshareMethod::kNotShared)));
  EXPECT_THAT(runner_.CommandLines(),
              ElementsAre("e2fsck -f -p " + image_, "e2fsck -f -p " + image_,
                          "resize2fs -M " + image_, "e2fsck -f -p " + image_));
}

TEST_F(UnsharerTest, FinalCheckFailureIsOnlyAWarning) {
  WriteSuperblock(image_, false);
  runner_.Respond("e2fsck -f -p", 0);
  runner_.Respond("e2fsck -f -p", 0);
  runner_.Respond("e2fsck -f -p", 4);
  runner_.Respond("e2fsck -f -y", 4);
  EXPECT_THAT(unsharer_.Materialize(image_, std::nullopt), IsOk());
}

}  // namespace
}  // namespace wsabridge

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

#include "wsabridge/host/libs/image/vhdx_converter.h"

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

TEST(VhdxConverterTest, ToRawCommandLine) {
  FakeCommandRunner runner;
  VhdxConverter converter(runner);
  ASSERT_THAT(converter.ToRaw("system.vhdx", "system.img"), IsOk());
  EXPECT_THAT(runner.CommandLines(),
              ElementsAre("qemu-img convert -f vhdx -O raw system.vhdx "
                          "system.img"));
}

TEST(VhdxConverterTest, ContainerIsReplacedOnlyByCommit) {
  TemporaryDir dir;
  std::string vhdx = std::string(dir.path) + "/vendor.vhdx";
  ASSERT_THAT(WriteFile(vhdx, "old"), IsOk());
  FakeCommandRunner runner;
  runner.Respond("qemu-img convert", 0, "",
                 [](const FakeCommandRunner::Invocation& call) {
                   ASSERT_TRUE(android::base::WriteStringToFile(
                       "new", call.args.back()));
                 });
  VhdxConverter converter(runner);
  auto staged = converter.StageVhdx("vendor.img", vhdx);
  ASSERT_THAT(staged, IsOkAndValue(Eq(vhdx + ".new")));
  EXPECT_THAT(ReadFile(vhdx), IsOkAndValue(Eq("old")));
  ASSERT_THAT(converter.Commit(*staged, vhdx), IsOk());

  EXPECT_THAT(runner.CommandLines(),
              ElementsAre("qemu-img convert -q -f raw -O vhdx -o "
                          "subformat=fixed vendor.img " +
                          vhdx + ".new"));
  EXPECT_THAT(ReadFile(vhdx), IsOkAndValue(Eq("new")));
  EXPECT_FALSE(FileExists(vhdx + ".new"));
}

TEST(VhdxConverterTest, FailedConversionKeepsOriginalContainer) {
  TemporaryDir dir;
  std::string vhdx = std::string(dir.path) + "/vendor.vhdx";
  ASSERT_THAT(WriteFile(vhdx, "old"), IsOk());
  FakeCommandRunner runner;
  runner.Respond("qemu-img convert", 1, "",
                 [](const FakeCommandRunner::Invocation& call) {
                   ASSERT_TRUE(android::base::WriteStringToFile(
                       "partial", call.args.back()));
                 });
  VhdxConverter converter(runner);
  EXPECT_THAT(converter.StageVhdx("vendor.img", vhdx), IsError());
  EXPECT_THAT(ReadFile(vhdx), IsOkAndValue(Eq("old")));
  EXPECT_FALSE(FileExists(vhdx + ".new"));
}

TEST(VhdxConverterTest, InspectParsesQemuImgJson) {
  FakeCommandRunner runner;
  runner.Respond("qemu-img info --output=json", 0,
                 R"({"virtual-size": 1073741824, "filename": "system.vhdx",
                     "format": "vhdx", "actual-size": 536875008,
                     "dirty-flag": false})");
  VhdxConverter converter(runner);
  auto info = converter.Inspect("system.vhdx");
  ASSERT_THAT(info, IsOk());
  EXPECT_EQ(info->format, "vhdx");
  EXPECT_EQ(info->virtual_size, 1073741824u);
  EXPECT_EQ(info->actual_size, 536875008u);
}

TEST(VhdxConverterTest, InspectRejectsIncompleteJson) {
  EXPECT_THAT(ParseQemuImgInfo(R"({"format": "raw"})"), IsError());
}

}  // namespace
}  // namespace wsabridge

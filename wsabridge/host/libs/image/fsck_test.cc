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

#include "wsabridge/host/libs/image/fsck.h"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "wsabridge/host/libs/image/fake_command_runner.h"
#include "wsabridge/result/result_matchers.h"

namespace wsabridge {
namespace {

using ::testing::ElementsAre;
using ::testing::Eq;
using ::testing::HasSubstr;

TEST(FsckTest, ExitCodeInterpretation) {
  EXPECT_THAT(InterpretFsckExitCode(0), IsOkAndValue(Eq(FsckOutcome::kClean)));
  EXPECT_THAT(InterpretFsckExitCode(1),
              IsOkAndValue(Eq(FsckOutcome::kRepaired)));
  EXPECT_THAT(InterpretFsckExitCode(2),
              IsOkAndValue(Eq(FsckOutcome::kRepaired)));
  EXPECT_THAT(InterpretFsckExitCode(3),
              IsOkAndValue(Eq(FsckOutcome::kRepaired)));
  EXPECT_THAT(InterpretFsckExitCode(4), IsError());
  EXPECT_THAT(InterpretFsckExitCode(5), IsError());
  EXPECT_THAT(InterpretFsckExitCode(8), IsError());
  EXPECT_THAT(InterpretFsckExitCode(-1), IsError());
}

TEST(FsckTest, CleanImageStopsAtFirstRung) {
  FakeCommandRunner runner;
  EXPECT_THAT(CheckFilesystem(runner, "system.img"),
              IsOkAndValue(Eq(FsckOutcome::kClean)));
  EXPECT_THAT(runner.CommandLines(), ElementsAre("e2fsck -f -p system.img"));
}

TEST(FsckTest, EscalatesToForcedRepair) {
  FakeCommandRunner runner;
  runner.Respond("e2fsck -f -p", 4);
  runner.Respond("e2fsck -f -y", 1);
  EXPECT_THAT(CheckFilesystem(runner, "vendor.img"),
              IsOkAndValue(Eq(FsckOutcome::kRepaired)));
  EXPECT_THAT(runner.CommandLines(),
              ElementsAre("e2fsck -f -p vendor.img", "e2fsck -f -y vendor.img"));
}

TEST(FsckTest, FailsWhenBothRungsFail) {
  FakeCommandRunner runner;
  runner.Respond("e2fsck -f -p", 4);
  runner.Respond("e2fsck -f -y", 8);
  EXPECT_THAT(CheckFilesystem(runner, "vendor.img"),
              IsErrorAndMessage(HasSubstr("could not be repaired")));
  EXPECT_EQ(runner.invocations().size(), 2u);
}

}  // namespace
}  // namespace wsabridge

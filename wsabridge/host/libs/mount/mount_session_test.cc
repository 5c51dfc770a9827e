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

#include "wsabridge/host/libs/mount/mount_session.h"

#include <string>

#include <android-base/file.h>
#include <android-base/strings.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "wsabridge/common/libs/utils/files.h"
#include "wsabridge/host/libs/image/fake_command_runner.h"
#include "wsabridge/result/result_matchers.h"

namespace wsabridge {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;

int CountCommands(const FakeCommandRunner& runner, const std::string& prefix) {
  int count = 0;
  for (const auto& line : runner.CommandLines()) {
    if (android::base::StartsWith(line, prefix)) {
      count++;
    }
  }
  return count;
}

TEST(ResolvePartitionRootTest, DirectLayout) {
  TemporaryDir dir;
  std::string mount(dir.path);
  ASSERT_THAT(EnsureDirectoryExists(mount + "/etc"), IsOk());
  EXPECT_EQ(ResolvePartitionRoot(mount, "vendor"), mount);
}

TEST(ResolvePartitionRootTest, NestedLayout) {
  TemporaryDir dir;
  std::string mount(dir.path);
  ASSERT_THAT(EnsureDirectoryExists(mount + "/vendor/bin"), IsOk());
  ASSERT_THAT(EnsureDirectoryExists(mount + "/vendor/lib"), IsOk());
  EXPECT_EQ(ResolvePartitionRoot(mount, "vendor"), mount + "/vendor");
}

TEST(ResolvePartitionRootTest, UnknownLayoutFallsBackToMountPoint) {
  TemporaryDir dir;
  std::string mount(dir.path);
  ASSERT_THAT(EnsureDirectoryExists(mount + "/lost+found"), IsOk());
  EXPECT_EQ(ResolvePartitionRoot(mount, "system"), mount);
}

TEST(ResolvePartitionRootTest, FilesNamedLikeDirectoriesDoNotCount) {
  TemporaryDir dir;
  std::string mount(dir.path);
  ASSERT_THAT(WriteFile(mount + "/bin", ""), IsOk());
  ASSERT_THAT(EnsureDirectoryExists(mount + "/system/etc"), IsOk());
  EXPECT_EQ(ResolvePartitionRoot(mount, "system"), mount + "/system");
}

TEST(MountSessionTest, UnmountsExactlyOnce) {
  TemporaryDir dir;
  FakeCommandRunner runner;
  std::string mount_point = std::string(dir.path) + "/vendor";
  {
    auto session = MountSession::Mount(runner, "vendor.img", mount_point);
    ASSERT_THAT(session, IsOk());
    EXPECT_TRUE(DirectoryExists(mount_point));
    EXPECT_THAT((*session)->Unmount(), IsOk());
    EXPECT_THAT((*session)->Unmount(), IsOk());
    EXPECT_FALSE((*session)->mounted());
  }
  EXPECT_THAT(runner.CommandLines(),
              ElementsAre("mount -t ext4 -o loop vendor.img " + mount_point,
                          "umount " + mount_point));
}

TEST(MountSessionTest, DestructorUnmountsWhatIsStillMounted) {
  TemporaryDir dir;
  FakeCommandRunner runner;
  {
    auto session = MountSession::Mount(runner, "system.img",
                                       std::string(dir.path) + "/system");
    ASSERT_THAT(session, IsOk());
  }
  EXPECT_EQ(CountCommands(runner, "umount"), 1);
}

TEST(MountSessionTest, FailedUnmountStaysMountedAndCanBeRetried) {
  TemporaryDir dir;
  FakeCommandRunner runner;
  runner.Respond("umount", 32);
  {
    auto session = MountSession::Mount(runner, "system.img",
                                       std::string(dir.path) + "/system");
    ASSERT_THAT(session, IsOk());
    EXPECT_THAT((*session)->Unmount(), IsError());
    EXPECT_TRUE((*session)->mounted());
  }
  EXPECT_EQ(CountCommands(runner, "umount"), 2);
}

TEST(MountCoordinatorTest, MountsBothPartitionsAndResolvesRoots) {
  TemporaryDir dir;
  std::string base(dir.path);
  ASSERT_THAT(EnsureDirectoryExists(base + "/system/system/bin"), IsOk());
  ASSERT_THAT(EnsureDirectoryExists(base + "/vendor/etc"), IsOk());
  FakeCommandRunner runner;
  VhdxConverter converter(runner);
  MountCoordinator coordinator(runner, converter);

  auto partitions =
      coordinator.MountPartitions("system.img", "vendor.img", base);
  ASSERT_THAT(partitions, IsOk());
  EXPECT_EQ(partitions->system_root, base + "/system/system");
  EXPECT_EQ(partitions->vendor_root, base + "/vendor");

  ASSERT_THAT(partitions->UnmountAll(), IsOk());
  EXPECT_THAT(runner.CommandLines(),
              ElementsAre("mount -t ext4 -o loop system.img " + base +
                              "/system",
                          "mount -t ext4 -o loop vendor.img " + base +
                              "/vendor",
                          "umount " + base + "/vendor",
                          "umount " + base + "/system"));
}

TEST(MountCoordinatorTest, VendorFailureReleasesSystemAndDiagnoses) {
  TemporaryDir dir;
  std::string base(dir.path);
  FakeCommandRunner runner;
  runner.Respond("mount -t ext4 -o loop vendor.img", 32);
  VhdxConverter converter(runner);
  MountCoordinator coordinator(runner, converter);

  EXPECT_THAT(coordinator.MountPartitions("system.img", "vendor.img", base),
              IsErrorAndMessage(HasSubstr("vendor.img")));
  EXPECT_EQ(CountCommands(runner, "file vendor.img"), 1);
  EXPECT_EQ(CountCommands(runner, "qemu-img info --output=json vendor.img"),
            1);
  EXPECT_EQ(CountCommands(runner, "e2fsck -f -y vendor.img"), 1);
  EXPECT_EQ(CountCommands(runner, "umount " + base + "/system"), 1);
}

TEST(MountPointsBelowTest, FiltersAndOrdersDeepestFirst) {
  std::string table =
      "sysfs /sys sysfs rw 0 0\n"
      "/dev/loop0 /work/mount_temp/system ext4 rw 0 0\n"
      "/dev/loop1 /work/mount_temp/system/vendor ext4 rw 0 0\n"
      "/dev/loop2 /work/mount_temp_other ext4 rw 0 0\n"
      "/dev/loop3 /work/mount\\040temp/vendor ext4 rw 0 0\n";
  EXPECT_THAT(MountPointsBelow(table, "/work/mount_temp"),
              ElementsAre("/work/mount_temp/system/vendor",
                          "/work/mount_temp/system"));
  EXPECT_THAT(MountPointsBelow(table, "/work/mount temp"),
              ElementsAre("/work/mount temp/vendor"));
  EXPECT_THAT(MountPointsBelow(table, "/elsewhere"), IsEmpty());
}

}  // namespace
}  // namespace wsabridge

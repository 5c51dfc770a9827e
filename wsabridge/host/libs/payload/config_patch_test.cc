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

#include "wsabridge/host/libs/payload/config_patch.h"

#include <string>

#include <android-base/file.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "wsabridge/common/libs/utils/files.h"
#include "wsabridge/result/result_matchers.h"

namespace wsabridge {
namespace {

using ::testing::Eq;
using ::testing::Optional;

TEST(ConfigPatchTest, GetPropertyIgnoresComments) {
  std::string props = "# ro.a=commented\nro.a=1\nro.b = 2\n";
  EXPECT_THAT(GetProperty(props, "ro.a"), Optional(Eq("1")));
  EXPECT_THAT(GetProperty(props, "ro.b"), Optional(Eq(" 2")));
  EXPECT_EQ(GetProperty(props, "ro.c"), std::nullopt);
}

TEST(ConfigPatchTest, SetPropertyReplacesValue) {
  std::string props = "ro.x=1\nro.dalvik.vm.native.bridge=0\nro.y=2\n";
  EXPECT_TRUE(SetProperty(&props, "ro.dalvik.vm.native.bridge", "libnb.so"));
  EXPECT_EQ(props, "ro.x=1\nro.dalvik.vm.native.bridge=libnb.so\nro.y=2\n");
  EXPECT_FALSE(SetProperty(&props, "ro.missing", "1"));
}

TEST(ConfigPatchTest, UpsertInsertsAfterAnchorInOrder) {
  std::string props = "ro.x=1\nro.bridge=lib.so\nro.y=2\n";
  EXPECT_TRUE(UpsertPropertiesAfter(&props, "ro.bridge",
                                    {{"ro.a", "1"}, {"ro.b", "2"}}));
  EXPECT_EQ(props, "ro.x=1\nro.bridge=lib.so\nro.a=1\nro.b=2\nro.y=2\n");
}

TEST(ConfigPatchTest, UpsertUpdatesInsteadOfDuplicating) {
  std::string props = "ro.bridge=lib.so\nro.a=1\nro.b=old\n";
  ASSERT_TRUE(UpsertPropertiesAfter(&props, "ro.bridge",
                                    {{"ro.a", "1"}, {"ro.b", "new"}}));
  EXPECT_EQ(props, "ro.bridge=lib.so\nro.a=1\nro.b=new\n");
  std::string again = props;
  ASSERT_TRUE(UpsertPropertiesAfter(&again, "ro.bridge",
                                    {{"ro.a", "1"}, {"ro.b", "new"}}));
  EXPECT_EQ(again, props);
}

TEST(ConfigPatchTest, UpsertWithoutAnchorChangesNothing) {
  std::string props = "ro.x=1\n";
  EXPECT_FALSE(UpsertPropertiesAfter(&props, "ro.bridge", {{"ro.a", "1"}}));
  EXPECT_EQ(props, "ro.x=1\n");
}

TEST(ConfigPatchTest, RemoveProperties) {
  std::string props = "ro.a=1\n#ro.b=2\nro.b=2\nro.c=3\n";
  EXPECT_EQ(RemoveProperties(&props, {"ro.b", "ro.z"}), 1u);
  EXPECT_EQ(props, "ro.a=1\n#ro.b=2\nro.c=3\n");
}

TEST(ConfigPatchTest, InsertAfterEveryAnchor) {
  std::string script = "on boot\n    anchor one\n    other\n    anchor two\n";
  auto patch = InsertAfterAnchor(&script, "anchor", {"    added"});
  EXPECT_EQ(patch.anchors, 2u);
  EXPECT_EQ(patch.inserted, 2u);
  EXPECT_EQ(script,
            "on boot\n    anchor one\n    added\n    other\n    anchor two\n"
            "    added\n");
}

TEST(ConfigPatchTest, InsertAfterAnchorIsGuarded) {
  std::string script = "    anchor\n    first\n    second\n    tail\n";
  std::string original = script;
  auto patch = InsertAfterAnchor(&script, "anchor", {"    first", "    second"});
  EXPECT_EQ(patch.anchors, 1u);
  EXPECT_EQ(patch.inserted, 0u);
  EXPECT_EQ(patch.already_patched, 1u);
  EXPECT_EQ(script, original);
}

TEST(ConfigPatchTest, PartialPatchIsCompleted) {
  // Only the first of the two lines is there, so both are inserted.
  std::string script = "    anchor\n    first\n";
  auto patch = InsertAfterAnchor(&script, "anchor", {"    first", "    second"});
  EXPECT_EQ(patch.inserted, 1u);
  EXPECT_EQ(script, "    anchor\n    first\n    second\n    first\n");
}

TEST(ConfigPatchTest, DeleteLines) {
  std::string script = "keep\ndrop me\nkeep too\ndrop again\n";
  auto removed = DeleteLines(&script, [](std::string_view line) {
    return line.find("drop") != line.npos;
  });
  EXPECT_EQ(removed, 2u);
  EXPECT_EQ(script, "keep\nkeep too\n");
}

TEST(ConfigFileTest, SaveKeepsBackupOfOriginal) {
  TemporaryDir dir;
  std::string path = std::string(dir.path) + "/build.prop";
  ASSERT_THAT(WriteFile(path, "ro.a=1\n"), IsOk());
  auto file = ConfigFile::Load(path);
  ASSERT_THAT(file, IsOk());
  ASSERT_TRUE(SetProperty(file->contents(), "ro.a", "2"));
  EXPECT_THAT(file->Save(), IsOkAndValue(true));
  EXPECT_THAT(ReadFile(path), IsOkAndValue(Eq("ro.a=2\n")));
  EXPECT_THAT(ReadFile(path + ".backup"), IsOkAndValue(Eq("ro.a=1\n")));
}

TEST(ConfigFileTest, UnchangedFileIsNotWritten) {
  TemporaryDir dir;
  std::string path = std::string(dir.path) + "/build.prop";
  ASSERT_THAT(WriteFile(path, "ro.a=1\n"), IsOk());
  auto file = ConfigFile::Load(path);
  ASSERT_THAT(file, IsOk());
  ASSERT_TRUE(SetProperty(file->contents(), "ro.a", "1"));
  EXPECT_THAT(file->Save(), IsOkAndValue(false));
  EXPECT_FALSE(FileExists(path + ".backup"));
}

TEST(ConfigFileTest, LoadMissingFileFails) {
  TemporaryDir dir;
  EXPECT_THAT(ConfigFile::Load(std::string(dir.path) + "/none"), IsError());
}

}  // namespace
}  // namespace wsabridge

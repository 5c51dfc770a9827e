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

#include "wsabridge/host/libs/image/ext4_info.h"

#include <endian.h>
#include <string.h>

#include <string>

#include <android-base/file.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "wsabridge/result/result_matchers.h"

namespace wsabridge {
namespace {

using ::testing::HasSubstr;

class SuperblockBuilder {
 public:
  SuperblockBuilder() : data_(kExt4SuperblockSize, '\0') {
    uint16_t magic = htole16(0xEF53);
    memcpy(data_.data() + 0x38, &magic, sizeof(magic));
  }
  SuperblockBuilder& Set32(size_t offset, uint32_t value) {
    value = htole32(value);
    memcpy(data_.data() + offset, &value, sizeof(value));
    return *this;
  }
  const std::string& data() const { return data_; }

 private:
  std::string data_;
};

TEST(Ext4InfoTest, ParsesSizesAndFeatures) {
  auto superblock = SuperblockBuilder()
                        .Set32(0x04, 262144)  // blocks
                        .Set32(0x08, 13107)   // reserved
                        .Set32(0x0C, 131072)  // free
                        .Set32(0x18, 2)       // 4096 byte blocks
                        .Set32(0x64, 0x4000)  // shared_blocks
                        .data();
  auto info = ParseExt4Superblock(superblock);
  ASSERT_THAT(info, IsOk());
  EXPECT_EQ(info->block_size, 4096u);
  EXPECT_EQ(info->block_count, 262144u);
  EXPECT_EQ(info->free_blocks, 131072u);
  EXPECT_EQ(info->reserved_blocks, 13107u);
  EXPECT_TRUE(info->shared_blocks);
  EXPECT_EQ(info->SizeBytes(), 1073741824u);
  EXPECT_EQ(info->UsedBytes(), 536870912u);
}

TEST(Ext4InfoTest, HighWordsOnlyCountWith64BitFeature) {
  auto builder = SuperblockBuilder();
  builder.Set32(0x04, 16).Set32(0x0C, 8).Set32(0x150, 1).Set32(0x158, 1);
  auto narrow = ParseExt4Superblock(builder.data());
  ASSERT_THAT(narrow, IsOk());
  EXPECT_EQ(narrow->block_count, 16u);
  EXPECT_FALSE(narrow->shared_blocks);

  builder.Set32(0x60, 0x80);
  auto wide = ParseExt4Superblock(builder.data());
  ASSERT_THAT(wide, IsOk());
  EXPECT_EQ(wide->block_count, (uint64_t{1} << 32) + 16);
  EXPECT_EQ(wide->free_blocks, (uint64_t{1} << 32) + 8);
}

TEST(Ext4InfoTest, RejectsOtherData) {
  std::string zeros(kExt4SuperblockSize, '\0');
  EXPECT_THAT(ParseExt4Superblock(zeros),
              IsErrorAndMessage(HasSubstr("Not an ext2/3/4 superblock")));
  EXPECT_THAT(ParseExt4Superblock("short"), IsError());
}

TEST(Ext4InfoTest, ReadsFromImageOffset) {
  TemporaryDir dir;
  std::string image = std::string(dir.path) + "/vendor.img";
  auto superblock = SuperblockBuilder().Set32(0x04, 1024).Set32(0x18, 0).data();
  ASSERT_TRUE(android::base::WriteStringToFile(
      std::string(kExt4SuperblockOffset, '\0') + superblock, image));
  auto info = ReadExt4Info(image);
  ASSERT_THAT(info, IsOk());
  EXPECT_EQ(info->block_size, 1024u);
  EXPECT_EQ(info->block_count, 1024u);

  EXPECT_THAT(ReadExt4Info(std::string(dir.path) + "/missing.img"), IsError());
}

}  // namespace
}  // namespace wsabridge

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

#include "wsabridge/host/libs/image/ext4_info.h"

#include <endian.h>
#include <fcntl.h>
#include <string.h>
#include <unistd.h>

#include <android-base/file.h>
#include <android-base/unique_fd.h>

namespace wsabridge {
namespace {

constexpr uint16_t kExt4Magic = 0xEF53;

constexpr size_t kBlocksCountLo = 0x04;
constexpr size_t kReservedBlocksCountLo = 0x08;
constexpr size_t kFreeBlocksCountLo = 0x0C;
constexpr size_t kLogBlockSize = 0x18;
constexpr size_t kMagic = 0x38;
constexpr size_t kFeatureIncompat = 0x60;
constexpr size_t kFeatureRoCompat = 0x64;
constexpr size_t kBlocksCountHi = 0x150;
constexpr size_t kReservedBlocksCountHi = 0x154;
constexpr size_t kFreeBlocksCountHi = 0x158;

constexpr uint32_t kIncompat64Bit = 0x80;
constexpr uint32_t kRoCompatSharedBlocks = 0x4000;

uint16_t Le16At(std::string_view data, size_t offset) {
  uint16_t value;
  memcpy(&value, data.data() + offset, sizeof(value));
  return le16toh(value);
}

uint32_t Le32At(std::string_view data, size_t offset) {
  uint32_t value;
  memcpy(&value, data.data() + offset, sizeof(value));
  return le32toh(value);
}

}  // namespace

Result<Ext4Info> ParseExt4Superblock(std::string_view superblock) {
  WB_EXPECT_GE(superblock.size(), kExt4SuperblockSize,
               "Superblock is truncated");
  WB_EXPECT_EQ(Le16At(superblock, kMagic), kExt4Magic,
               "Not an ext2/3/4 superblock");
  uint32_t log_block_size = Le32At(superblock, kLogBlockSize);
  WB_EXPECT_LE(log_block_size, 6u, "Implausible block size");

  Ext4Info info;
  info.block_size = 1024u << log_block_size;
  info.block_count = Le32At(superblock, kBlocksCountLo);
  info.reserved_blocks = Le32At(superblock, kReservedBlocksCountLo);
  info.free_blocks = Le32At(superblock, kFreeBlocksCountLo);
  if (Le32At(superblock, kFeatureIncompat) & kIncompat64Bit) {
    info.block_count |=
        static_cast<uint64_t>(Le32At(superblock, kBlocksCountHi)) << 32;
    info.reserved_blocks |=
        static_cast<uint64_t>(Le32At(superblock, kReservedBlocksCountHi)) << 32;
    info.free_blocks |=
        static_cast<uint64_t>(Le32At(superblock, kFreeBlocksCountHi)) << 32;
  }
  info.shared_blocks =
      (Le32At(superblock, kFeatureRoCompat) & kRoCompatSharedBlocks) != 0;
  WB_EXPECT_LE(info.free_blocks, info.block_count,
               "Superblock free block count exceeds block count");
  return info;
}

Result<Ext4Info> ReadExt4Info(const std::string& image) {
  android::base::unique_fd fd(open(image.c_str(), O_RDONLY | O_CLOEXEC));
  if (fd.get() < 0) {
    return WB_ERRNO("Could not open \"" << image << "\": " << strerror(errno));
  }
  std::string superblock(kExt4SuperblockSize, '\0');
  WB_EXPECTF(android::base::ReadFullyAtOffset(fd.get(), superblock.data(),
                                              superblock.size(),
                                              kExt4SuperblockOffset),
             "Could not read the superblock of \"{}\"", image);
  return WB_EXPECTF(ParseExt4Superblock(superblock),
                    "\"{}\" does not hold an ext4 filesystem", image);
}

}  // namespace wsabridge

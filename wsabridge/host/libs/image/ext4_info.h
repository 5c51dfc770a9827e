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
#pragma once

#include <stdint.h>

#include <string>
#include <string_view>

#include "wsabridge/result/result.h"

namespace wsabridge {

// What the primary ext4 superblock says about an image.
struct Ext4Info {
  uint32_t block_size = 0;
  uint64_t block_count = 0;
  uint64_t free_blocks = 0;
  uint64_t reserved_blocks = 0;
  // Set by images built with `e2fsdroid -s`; such a filesystem can't be
  // written until e2fsck unshares its blocks.
  bool shared_blocks = false;

  uint64_t SizeBytes() const { return block_count * block_size; }
  uint64_t UsedBytes() const {
    return (block_count - free_blocks) * block_size;
  }
};

inline constexpr size_t kExt4SuperblockOffset = 1024;
inline constexpr size_t kExt4SuperblockSize = 1024;

// `superblock` holds the kExt4SuperblockSize bytes found at
// kExt4SuperblockOffset.
Result<Ext4Info> ParseExt4Superblock(std::string_view superblock);
Result<Ext4Info> ReadExt4Info(const std::string& image);

}  // namespace wsabridge

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

#include <string>
#include <vector>

#include "wsabridge/common/libs/utils/size_utils.h"
#include "wsabridge/host/libs/image/command_runner.h"
#include "wsabridge/result/result.h"

namespace wsabridge {

// Apparent size of a file, rounded up to whole sectors.
Result<Sectors> ApparentSize(const std::string& path);

// Extends `path` to `target` reserving the blocks with fallocate. Only storage
// that does not implement fallocate falls back to a sparse ftruncate; running
// out of space is an error.
Result<void> AllocateFile(const std::string& path, Sectors target);

// Sets the length of `path` to `target` without allocating blocks.
Result<void> TruncateFile(const std::string& path, Sectors target);

// Grows and shrinks raw ext4 images together with their filesystem.
class ImageResizer {
 public:
  // How Grow extends the file.
  enum class Allocation {
    kReserve,  // AllocateFile
    kSparse,   // TruncateFile
  };

  explicit ImageResizer(CommandRunner& runner,
                        Allocation allocation = Allocation::kReserve)
      : runner_(runner), allocation_(allocation) {}

  // Checks the filesystem, extends the file to `target` and grows the
  // filesystem to fill it. `target` may not be smaller than the file.
  Result<void> Grow(const std::string& image, Sectors target);

  // Shrinks the filesystem to its minimum size with `resize2fs -M`. The file
  // itself keeps its length.
  Result<void> Shrink(const std::string& image);

  // Leaves the filesystem and the file at exactly `target`, whichever
  // direction that is.
  Result<void> ResizeTo(const std::string& image, Sectors target);

  // Grows the filesystem to fill its file, e.g. after a truncate.
  Result<void> GrowToFill(const std::string& image);

 private:
  // resize2fs with one forced repair and one retry on failure. An empty
  // `size` fills the file.
  Result<void> RunResize2fs(const std::string& image,
                            const std::vector<std::string>& flags,
                            const std::string& size = "");

  CommandRunner& runner_;
  Allocation allocation_;
};

}  // namespace wsabridge

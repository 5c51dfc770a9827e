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
#include <sys/types.h>

#include <ostream>
#include <string>

namespace wsabridge {

constexpr uint64_t kSectorSize = 512;
constexpr uint64_t kMiB = 1024 * 1024;

// A length measured in 512 byte sectors. Image sizes are kept in this unit so
// that the apparent size query, the allocation call and the filesystem resize
// tool never disagree on rounding. Convert to bytes only when calling out.
class Sectors {
 public:
  constexpr Sectors() : count_(0) {}
  constexpr explicit Sectors(uint64_t count) : count_(count) {}

  // Rounds up, like `du --apparent-size -B512`.
  static constexpr Sectors FromBytesRoundUp(uint64_t bytes) {
    return Sectors((bytes + kSectorSize - 1) / kSectorSize);
  }
  // Only for byte amounts that are known sector multiples (budgets, buffers).
  static constexpr Sectors FromMiB(uint64_t mib) {
    return Sectors(mib * kMiB / kSectorSize);
  }

  constexpr uint64_t count() const { return count_; }
  constexpr uint64_t bytes() const { return count_ * kSectorSize; }
  constexpr off_t ToOffT() const { return static_cast<off_t>(bytes()); }

  constexpr Sectors operator+(Sectors other) const {
    return Sectors(count_ + other.count_);
  }
  constexpr Sectors operator-(Sectors other) const {
    return Sectors(count_ > other.count_ ? count_ - other.count_ : 0);
  }
  constexpr Sectors operator*(uint64_t factor) const {
    return Sectors(count_ * factor);
  }
  Sectors& operator+=(Sectors other) {
    count_ += other.count_;
    return *this;
  }

  constexpr bool operator==(Sectors other) const {
    return count_ == other.count_;
  }
  constexpr bool operator!=(Sectors other) const {
    return count_ != other.count_;
  }
  constexpr bool operator<(Sectors other) const {
    return count_ < other.count_;
  }
  constexpr bool operator<=(Sectors other) const {
    return count_ <= other.count_;
  }
  constexpr bool operator>(Sectors other) const {
    return count_ > other.count_;
  }
  constexpr bool operator>=(Sectors other) const {
    return count_ >= other.count_;
  }

 private:
  uint64_t count_;
};

std::ostream& operator<<(std::ostream& out, Sectors sectors);

// Human readable size for log lines, e.g. "612.0 MiB".
std::string HumanReadableBytes(uint64_t bytes);

}  // namespace wsabridge

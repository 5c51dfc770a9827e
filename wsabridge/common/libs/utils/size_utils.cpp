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

#include "wsabridge/common/libs/utils/size_utils.h"

#include <string>

#include <android-base/stringprintf.h>

namespace wsabridge {

std::ostream& operator<<(std::ostream& out, Sectors sectors) {
  return out << sectors.count() << " sectors (" << sectors.bytes()
             << " bytes)";
}

std::string HumanReadableBytes(uint64_t bytes) {
  static constexpr const char* kUnits[] = {"B", "KiB", "MiB", "GiB", "TiB"};
  double value = static_cast<double>(bytes);
  size_t unit = 0;
  while (value >= 1024.0 && unit + 1 < sizeof(kUnits) / sizeof(kUnits[0])) {
    value /= 1024.0;
    unit++;
  }
  return android::base::StringPrintf("%.1f %s", value, kUnits[unit]);
}

}  // namespace wsabridge

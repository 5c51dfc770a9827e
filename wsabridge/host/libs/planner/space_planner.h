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

#include <ostream>
#include <string>

#include "wsabridge/common/libs/utils/size_utils.h"
#include "wsabridge/host/libs/config/install_config.h"
#include "wsabridge/result/result.h"

namespace wsabridge {

// The system image is grown to this multiple of its apparent size.
inline constexpr uint64_t kSystemGrowthFactor = 3;
// Room reserved on vendor for the translation runtime itself.
inline constexpr Sectors kHoudiniPayloadBudget = Sectors::FromMiB(400);
inline constexpr Sectors kNdkPayloadBudget = Sectors::FromMiB(600);
inline constexpr Sectors kVendorSafetyBuffer = Sectors::FromMiB(200);
// Once mounted, vendor must offer at least this much free space...
inline constexpr Sectors kMinimumVendorFree = Sectors::FromMiB(400);
// ...or it is grown by this much, at most once.
inline constexpr Sectors kVendorExpansionStep = Sectors::FromMiB(300);
// Free space kept on vendor by VendorShrinkPolicy::kUsedPlusBuffer.
inline constexpr Sectors kFinalVendorBuffer = Sectors::FromMiB(100);

struct SizePlan {
  Sectors system_apparent;
  Sectors vendor_apparent;
  Sectors system_target;
  Sectors vendor_target;
  // vendor_target as first planned, before any expansion.
  Sectors vendor_planned_target;
  // The post-mount expansion already happened.
  bool vendor_expanded = false;
};

std::ostream& operator<<(std::ostream& out, const SizePlan& plan);

Sectors PayloadBudget(LayerType layer);

// system: apparent * 3, vendor: apparent + payload budget + safety buffer.
Result<SizePlan> PlanSizes(Sectors system_apparent, Sectors vendor_apparent,
                           LayerType layer);

bool NeedsVendorExpansion(uint64_t vendor_available_bytes);

// The plan with vendor grown by kVendorExpansionStep. Fails if that already
// happened.
Result<SizePlan> ExpandVendor(const SizePlan& plan);

// Size the vendor filesystem ends at, given the minimum resize2fs could reach.
// Never below `minimum`, and never above the target planned before any
// expansion unless the minimum itself is.
Sectors FinalVendorSize(Sectors minimum, const SizePlan& plan,
                        VendorShrinkPolicy policy);

// Free bytes available to unprivileged writers on the filesystem holding
// `path`.
Result<uint64_t> AvailableBytes(const std::string& path);

}  // namespace wsabridge

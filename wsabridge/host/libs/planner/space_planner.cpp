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

#include "wsabridge/host/libs/planner/space_planner.h"

#include <string.h>
#include <sys/statvfs.h>

#include <algorithm>

namespace wsabridge {

std::ostream& operator<<(std::ostream& out, const SizePlan& plan) {
  return out << "system " << HumanReadableBytes(plan.system_apparent.bytes())
             << " -> " << HumanReadableBytes(plan.system_target.bytes())
             << ", vendor " << HumanReadableBytes(plan.vendor_apparent.bytes())
             << " -> " << HumanReadableBytes(plan.vendor_target.bytes())
             << (plan.vendor_expanded ? " (expanded)" : "");
}

Sectors PayloadBudget(LayerType layer) {
  return layer == LayerType::kNdk ? kNdkPayloadBudget : kHoudiniPayloadBudget;
}

Result<SizePlan> PlanSizes(Sectors system_apparent, Sectors vendor_apparent,
                           LayerType layer) {
  WB_EXPECT_GT(system_apparent.count(), 0u, "system image is empty");
  WB_EXPECT_GT(vendor_apparent.count(), 0u, "vendor image is empty");
  SizePlan plan;
  plan.system_apparent = system_apparent;
  plan.vendor_apparent = vendor_apparent;
  plan.system_target = system_apparent * kSystemGrowthFactor;
  plan.vendor_target =
      vendor_apparent + PayloadBudget(layer) + kVendorSafetyBuffer;
  plan.vendor_planned_target = plan.vendor_target;
  return plan;
}

bool NeedsVendorExpansion(uint64_t vendor_available_bytes) {
  return vendor_available_bytes < kMinimumVendorFree.bytes();
}

Result<SizePlan> ExpandVendor(const SizePlan& plan) {
  WB_EXPECT(!plan.vendor_expanded,
            "vendor was already expanded once and is still short of space");
  SizePlan expanded = plan;
  expanded.vendor_target += kVendorExpansionStep;
  expanded.vendor_expanded = true;
  return expanded;
}

Sectors FinalVendorSize(Sectors minimum, const SizePlan& plan,
                        VendorShrinkPolicy policy) {
  switch (policy) {
    case VendorShrinkPolicy::kMinimum:
      return minimum;
    case VendorShrinkPolicy::kUsedPlusBuffer:
      return std::max(minimum,
                      std::min(minimum + kFinalVendorBuffer,
                               plan.vendor_planned_target));
    case VendorShrinkPolicy::kKeepPlanned:
      return std::max(minimum, plan.vendor_planned_target);
  }
  return minimum;
}

Result<uint64_t> AvailableBytes(const std::string& path) {
  struct statvfs fs_stats {};
  if (statvfs(path.c_str(), &fs_stats) != 0) {
    return WB_ERRNO("statvfs(\"" << path << "\") failed: " << strerror(errno));
  }
  return static_cast<uint64_t>(fs_stats.f_bavail) * fs_stats.f_frsize;
}

}  // namespace wsabridge

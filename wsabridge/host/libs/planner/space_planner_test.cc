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

#include "wsabridge/host/libs/planner/space_planner.h"

#include <android-base/file.h>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "wsabridge/result/result_matchers.h"

namespace wsabridge {
namespace {

constexpr uint64_t kGiB = 1024 * kMiB;

TEST(SpacePlannerTest, TwoGigSystemOneGigVendorHoudini) {
  auto system = Sectors::FromBytesRoundUp(2 * kGiB);
  auto vendor = Sectors::FromBytesRoundUp(1 * kGiB);
  auto plan = PlanSizes(system, vendor, LayerType::kHoudini);
  ASSERT_THAT(plan, IsOk());
  EXPECT_EQ(plan->system_target.bytes(), 6 * kGiB);
  // 400 MiB payload budget plus the 200 MiB buffer.
  EXPECT_EQ(plan->vendor_target.bytes(), 1 * kGiB + 600 * kMiB);
  EXPECT_FALSE(plan->vendor_expanded);
}

TEST(SpacePlannerTest, NdkReservesMore) {
  auto plan = PlanSizes(Sectors::FromMiB(100), Sectors::FromMiB(100),
                        LayerType::kNdk);
  ASSERT_THAT(plan, IsOk());
  EXPECT_EQ(plan->vendor_target, Sectors::FromMiB(900));
  EXPECT_EQ(plan->system_target, Sectors::FromMiB(300));
}

TEST(SpacePlannerTest, TargetsNeverBelowApparentSize) {
  for (auto layer : {LayerType::kHoudini, LayerType::kNdk}) {
    for (uint64_t sectors : {1u, 7u, 4096u, 3000000u}) {
      auto plan = PlanSizes(Sectors(sectors), Sectors(sectors), layer);
      ASSERT_THAT(plan, IsOk());
      EXPECT_GE(plan->system_target, plan->system_apparent);
      EXPECT_GE(plan->vendor_target, plan->vendor_apparent);
    }
  }
}

TEST(SpacePlannerTest, EmptyImagesAreRejected) {
  EXPECT_THAT(PlanSizes(Sectors(0), Sectors(8), LayerType::kNdk), IsError());
  EXPECT_THAT(PlanSizes(Sectors(8), Sectors(0), LayerType::kNdk), IsError());
}

TEST(SpacePlannerTest, ExpansionThreshold) {
  EXPECT_TRUE(NeedsVendorExpansion(0));
  EXPECT_TRUE(NeedsVendorExpansion(400 * kMiB - 1));
  EXPECT_FALSE(NeedsVendorExpansion(400 * kMiB));
}

TEST(SpacePlannerTest, VendorExpandsOnlyOnce) {
  auto plan = PlanSizes(Sectors::FromMiB(1024), Sectors::FromMiB(1024),
                        LayerType::kHoudini);
  ASSERT_THAT(plan, IsOk());
  auto expanded = ExpandVendor(*plan);
  ASSERT_THAT(expanded, IsOk());
  EXPECT_EQ(expanded->vendor_target, plan->vendor_target + kVendorExpansionStep);
  EXPECT_EQ(expanded->system_target, plan->system_target);
  EXPECT_THAT(ExpandVendor(*expanded), IsError());
}

TEST(SpacePlannerTest, FinalVendorSizePolicies) {
  auto plan = PlanSizes(Sectors::FromMiB(2048), Sectors::FromMiB(1024),
                        LayerType::kHoudini);
  ASSERT_THAT(plan, IsOk());
  auto minimum = Sectors::FromMiB(1300);
  EXPECT_EQ(FinalVendorSize(minimum, *plan, VendorShrinkPolicy::kMinimum),
            minimum);
  EXPECT_EQ(
      FinalVendorSize(minimum, *plan, VendorShrinkPolicy::kUsedPlusBuffer),
      Sectors::FromMiB(1400));
  EXPECT_EQ(FinalVendorSize(minimum, *plan, VendorShrinkPolicy::kKeepPlanned),
            plan->vendor_target);
}

TEST(SpacePlannerTest, FinalVendorSizeStaysWithinPlan) {
  auto plan = PlanSizes(Sectors::FromMiB(2048), Sectors::FromMiB(1024),
                        LayerType::kHoudini);
  ASSERT_THAT(plan, IsOk());
  // The payload filled almost all of the planned headroom.
  auto minimum = Sectors::FromMiB(1600);
  auto final_size =
      FinalVendorSize(minimum, *plan, VendorShrinkPolicy::kUsedPlusBuffer);
  EXPECT_GE(final_size, minimum);
  EXPECT_LE(final_size, plan->vendor_target);

  // Growing vendor after mounting does not raise the ceiling.
  auto expanded = ExpandVendor(*plan);
  ASSERT_THAT(expanded, IsOk());
  EXPECT_EQ(expanded->vendor_planned_target, plan->vendor_target);
  for (auto policy : {VendorShrinkPolicy::kUsedPlusBuffer,
                      VendorShrinkPolicy::kKeepPlanned}) {
    EXPECT_EQ(FinalVendorSize(minimum, *expanded, policy),
              plan->vendor_target);
  }
  // Unless the payload needs more than that.
  auto large_minimum = plan->vendor_target + Sectors::FromMiB(50);
  EXPECT_EQ(FinalVendorSize(large_minimum, *expanded,
                            VendorShrinkPolicy::kUsedPlusBuffer),
            large_minimum);
}

TEST(SpacePlannerTest, AvailableBytesOfExistingDirectory) {
  TemporaryDir dir;
  EXPECT_THAT(AvailableBytes(dir.path), IsOk());
  EXPECT_THAT(AvailableBytes("/nonexistent/path"), IsError());
}

}  // namespace
}  // namespace wsabridge

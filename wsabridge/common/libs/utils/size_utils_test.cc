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

#include "wsabridge/common/libs/utils/size_utils.h"

#include <gtest/gtest.h>

namespace wsabridge {
namespace {

TEST(SectorsTest, RoundsPartialSectorsUp) {
  EXPECT_EQ(Sectors::FromBytesRoundUp(0).count(), 0u);
  EXPECT_EQ(Sectors::FromBytesRoundUp(1).count(), 1u);
  EXPECT_EQ(Sectors::FromBytesRoundUp(512).count(), 1u);
  EXPECT_EQ(Sectors::FromBytesRoundUp(513).count(), 2u);
}

TEST(SectorsTest, MiBConversionIsExact) {
  EXPECT_EQ(Sectors::FromMiB(400).bytes(), 419430400u);
  EXPECT_EQ(Sectors::FromMiB(200).bytes(), 209715200u);
  EXPECT_EQ(Sectors::FromMiB(300).count(), 314572800u / 512);
}

TEST(SectorsTest, SubtractionSaturatesAtZero) {
  EXPECT_EQ((Sectors(3) - Sectors(5)).count(), 0u);
  EXPECT_EQ((Sectors(5) - Sectors(3)).count(), 2u);
}

TEST(SizeUtilsTest, HumanReadableBytes) {
  EXPECT_EQ(HumanReadableBytes(512), "512.0 B");
  EXPECT_EQ(HumanReadableBytes(600 * kMiB), "600.0 MiB");
  EXPECT_EQ(HumanReadableBytes(2048 * kMiB), "2.0 GiB");
}

}  // namespace
}  // namespace wsabridge

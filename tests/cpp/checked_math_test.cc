// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

#include "bootmem/core/checked_math.h"

using namespace bootmem::core;

namespace {
constexpr std::uintptr_t kMax = std::numeric_limits<std::uintptr_t>::max();
}

TEST(CheckedMathTest, AddSubDetectOverflow) {
  std::uintptr_t out = 7;
  EXPECT_TRUE(checked_add_uptr(0x1000, 0x10, out));
  EXPECT_EQ(out, 0x1010u);
  out = 7;
  EXPECT_FALSE(checked_add_uptr(kMax, 1, out));
  EXPECT_EQ(out, 7u); // untouched on failure
  EXPECT_TRUE(checked_add_uptr(kMax - 1, 1, out));
  EXPECT_EQ(out, kMax);

  EXPECT_TRUE(checked_sub_uptr(0x2000, 0x1000, out));
  EXPECT_EQ(out, 0x1000u);
  EXPECT_FALSE(checked_sub_uptr(0x0fff, 0x1000, out));
}

TEST(CheckedMathTest, MulDetectsOverflow) {
  std::size_t out = 0;
  EXPECT_TRUE(checked_mul_size(3, 4096, out));
  EXPECT_EQ(out, 3u * 4096u);
  EXPECT_TRUE(checked_mul_size(0, std::numeric_limits<std::size_t>::max(), out));
  EXPECT_EQ(out, 0u);
  EXPECT_FALSE(checked_mul_size(std::numeric_limits<std::size_t>::max() / 2 + 1, 2, out));
}

TEST(CheckedMathTest, AlignUpHandlesPow2AndOtherAlignments) {
  std::uintptr_t out = 0;
  EXPECT_TRUE(checked_align_up(0x1001, 8, out));
  EXPECT_EQ(out, 0x1008u);
  EXPECT_TRUE(checked_align_up(0x1008, 8, out));
  EXPECT_EQ(out, 0x1008u);
  // align 0 behaves like 1
  EXPECT_TRUE(checked_align_up(0x1003, 0, out));
  EXPECT_EQ(out, 0x1003u);
  // non power of two
  EXPECT_TRUE(checked_align_up(10, 3, out));
  EXPECT_EQ(out, 12u);
  // rounding past the top of the address space fails
  EXPECT_FALSE(checked_align_up(kMax - 2, 16, out));
}

TEST(CheckedMathTest, AlignDownAndPow2Helpers) {
  EXPECT_EQ(align_down_pow2(0x2fff, 0x1000), 0x2000u);
  EXPECT_EQ(align_down_pow2(0x2000, 0x1000), 0x2000u);
  EXPECT_TRUE(is_pow2(1));
  EXPECT_TRUE(is_pow2(4096));
  EXPECT_FALSE(is_pow2(0));
  EXPECT_FALSE(is_pow2(12));

  EXPECT_EQ(pow2_clamped(0), 1u);
  EXPECT_EQ(pow2_clamped(12), 4096u);
  const std::uintptr_t top = std::uintptr_t{1} << (kAddressBits - 1);
  EXPECT_EQ(pow2_clamped(kAddressBits - 1), top);
  EXPECT_EQ(pow2_clamped(kAddressBits + 50), top);

  EXPECT_EQ(ceil_pow2(0), 1u);
  EXPECT_EQ(ceil_pow2(1), 1u);
  EXPECT_EQ(ceil_pow2(3), 4u);
  EXPECT_EQ(ceil_pow2(64), 64u);
  EXPECT_EQ(ceil_pow2(65), 128u);
}

// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>

namespace bootmem {
namespace core {

inline constexpr std::size_t kAddressBits =
    static_cast<std::size_t>(std::numeric_limits<std::uintptr_t>::digits);

[[nodiscard]] inline bool checked_add_uptr(std::uintptr_t a, std::uintptr_t b, std::uintptr_t& out) noexcept {
  // Detect overflow before computing
  if (a > std::numeric_limits<std::uintptr_t>::max() - b) return false;
  out = a + b;
  return true;
}

[[nodiscard]] inline bool checked_sub_uptr(std::uintptr_t a, std::uintptr_t b, std::uintptr_t& out) noexcept {
  if (b > a) return false;
  out = a - b;
  return true;
}

[[nodiscard]] inline bool checked_mul_size(std::size_t a, std::size_t b, std::size_t& out) noexcept {
  // Fast paths
  if (a == 0 || b == 0) { out = 0; return true; }
  if (a == 1) { out = b; return true; }
  if (b == 1) { out = a; return true; }
  if (a > std::numeric_limits<std::size_t>::max() / b) return false;
  out = a * b;
  return true;
}

inline constexpr bool is_pow2(std::uintptr_t v) noexcept {
  return v != 0 && (v & (v - 1)) == 0;
}

// Rounds addr up to a multiple of align (align 0 is treated as 1). Works for
// any alignment; powers of two take the mask path.
[[nodiscard]] inline bool checked_align_up(std::uintptr_t addr, std::uintptr_t align, std::uintptr_t& out) noexcept {
  const std::uintptr_t a = align == 0 ? 1 : align;
  const std::uintptr_t rem = is_pow2(a) ? (addr & (a - 1)) : (addr % a);
  if (rem == 0) { out = addr; return true; }
  return checked_add_uptr(addr, a - rem, out);
}

// align must be a power of two.
inline constexpr std::uintptr_t align_down_pow2(std::uintptr_t addr, std::uintptr_t align) noexcept {
  return addr & ~(align - 1);
}

// 2^shift with shift clamped to kAddressBits - 1 so the shift is always defined.
inline constexpr std::uintptr_t pow2_clamped(std::size_t shift) noexcept {
  const std::size_t s = shift < kAddressBits - 1 ? shift : kAddressBits - 1;
  return std::uintptr_t{1} << s;
}

// Smallest power of two >= v; 0 maps to 1. Saturates at the top bit.
inline constexpr std::size_t ceil_pow2(std::size_t v) noexcept {
  if (v <= 1) return 1;
  const std::size_t top = std::size_t{1} << (std::numeric_limits<std::size_t>::digits - 1);
  if (v > top) return top;
  std::size_t p = 1;
  while (p < v) p <<= 1;
  return p;
}

} // namespace core
} // namespace bootmem

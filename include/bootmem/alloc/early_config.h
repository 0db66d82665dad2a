// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <string_view>

namespace bootmem { namespace alloc {

inline constexpr const char* kEarlyAllocConfEnv = "BOOTMEM_EARLY_ALLOC_CONF";

struct EarlyAllocConfig {
  // Floor applied to every byte allocation's alignment; power of two.
  std::size_t min_byte_align{1};
  // Log every operation at INFO.
  bool        trace{false};
  // Log failed allocations at WARNING.
  bool        warn_on_exhaustion{true};
};

// Parses "key=value,key=value". Unknown keys and malformed values are
// ignored; min_byte_align is rounded up to a power of two.
EarlyAllocConfig ParseEarlyAllocConf(std::string_view conf);

// ParseEarlyAllocConf over BOOTMEM_EARLY_ALLOC_CONF; defaults when unset.
EarlyAllocConfig EarlyAllocConfigFromEnv();

}} // namespace bootmem::alloc

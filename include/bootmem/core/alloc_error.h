// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

namespace bootmem {
namespace core {

enum class AllocError : std::uint8_t {
  // Explicit numbering to keep numeric codes stable.
  // Policy: append-only.

  // Address-space overflow, or the byte and page regions would collide.
  NoMemory = 0,
  // Structurally invalid request (zero page count).
  InvalidParam = 1,
};

using AllocStatus = absl::Status;

template <class T>
using AllocResult = absl::StatusOr<T>;

namespace detail {
inline constexpr std::size_t kMaxErrorMessageBytes = 256;
} // namespace detail

const char* AllocErrorName(AllocError e) noexcept;

// Builds a non-OK status whose code encodes `e` and whose message is
// "<name>: <detail>", bounded to kMaxErrorMessageBytes.
absl::Status MakeAllocError(AllocError e, std::string_view detail);

// Inverse of MakeAllocError's code mapping. nullopt for OK or foreign codes.
std::optional<AllocError> AllocErrorFromStatus(const absl::Status& st) noexcept;

} // namespace core
} // namespace bootmem

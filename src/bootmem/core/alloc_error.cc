// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "bootmem/core/alloc_error.h"

#include <utility>

namespace bootmem {
namespace core {

const char* AllocErrorName(AllocError e) noexcept {
  switch (e) {
    case AllocError::NoMemory: return "NoMemory";
    case AllocError::InvalidParam: return "InvalidParam";
  }
  return "Unknown";
}

absl::Status MakeAllocError(AllocError e, std::string_view detail) {
  std::string msg(AllocErrorName(e));
  if (!detail.empty()) {
    msg += ": ";
    msg.append(detail.data(), detail.size());
  }
  if (msg.size() > detail::kMaxErrorMessageBytes) msg.resize(detail::kMaxErrorMessageBytes);
  switch (e) {
    case AllocError::NoMemory:
      return absl::ResourceExhaustedError(std::move(msg));
    case AllocError::InvalidParam:
      return absl::InvalidArgumentError(std::move(msg));
  }
  return absl::UnknownError(std::move(msg));
}

std::optional<AllocError> AllocErrorFromStatus(const absl::Status& st) noexcept {
  switch (st.code()) {
    case absl::StatusCode::kResourceExhausted: return AllocError::NoMemory;
    case absl::StatusCode::kInvalidArgument: return AllocError::InvalidParam;
    default: return std::nullopt;
  }
}

} // namespace core
} // namespace bootmem

// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once
#include <optional>
#include <string_view>
#include <cassert>
#include <absl/log/log.h>
#include <absl/log/check.h>

namespace bootmem {
// Initialize Abseil logging once; optionally set min log level.
void InitLogging(std::optional<int> min_level);

// Reads BOOTMEM_LOG_LEVEL (info|warning|error|fatal, or 0..3) and calls
// InitLogging with it. Unset or unrecognized values keep Abseil's default.
void InitLoggingFromEnv();

// Maps a level name or digit to an absl severity value; nullopt if invalid.
std::optional<int> ParseLogLevel(std::string_view text);
}

// Programmer errors only; allocation failures are returned, never CHECKed.
#define BOOTMEM_LOG(level) LOG(level)
#define BOOTMEM_CHECK(cond) CHECK(cond)
#define BOOTMEM_ASSERT(cond) assert(cond)

// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "bootmem/logging/logging.h"
#include <cctype>
#include <cstdlib>
#include <mutex>
#include <string>
#include <absl/log/initialize.h>
#include <absl/log/globals.h>
#include <absl/base/log_severity.h>

namespace bootmem {
namespace {
std::once_flag g_once;

std::string ToLower(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}
}

void InitLogging(std::optional<int> min_level) {
  std::call_once(g_once, [] { absl::InitializeLog(); });
  if (min_level) {
    absl::SetMinLogLevel(static_cast<absl::LogSeverityAtLeast>(
        absl::NormalizeLogSeverity(*min_level)));
  }
}

std::optional<int> ParseLogLevel(std::string_view text) {
  std::size_t a = 0, b = text.size();
  while (a < b && std::isspace(static_cast<unsigned char>(text[a]))) ++a;
  while (b > a && std::isspace(static_cast<unsigned char>(text[b - 1]))) --b;
  const std::string lowered = ToLower(text.substr(a, b - a));
  if (lowered == "info" || lowered == "0") return static_cast<int>(absl::LogSeverity::kInfo);
  if (lowered == "warn" || lowered == "warning" || lowered == "1") {
    return static_cast<int>(absl::LogSeverity::kWarning);
  }
  if (lowered == "error" || lowered == "err" || lowered == "2") {
    return static_cast<int>(absl::LogSeverity::kError);
  }
  if (lowered == "fatal" || lowered == "3") return static_cast<int>(absl::LogSeverity::kFatal);
  return std::nullopt;
}

void InitLoggingFromEnv() {
  const char* env_level = std::getenv("BOOTMEM_LOG_LEVEL");
  if (!env_level || *env_level == '\0') {
    InitLogging(std::nullopt);
    return;
  }
  InitLogging(ParseLogLevel(env_level));
}

}  // namespace bootmem

// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "bootmem/alloc/early_config.h"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <string>

#include "bootmem/core/checked_math.h"
#include "bootmem/logging/logging.h"

namespace bootmem { namespace alloc {

namespace {

bool is_space(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; }

void trim(std::string& t) {
  std::size_t a = 0;
  while (a < t.size() && is_space(t[a])) ++a;
  std::size_t b = t.size();
  while (b > a && is_space(t[b - 1])) --b;
  t = t.substr(a, b - a);
}

bool to_uint(const std::string& t, std::size_t& out) {
  if (t.empty() || t[0] == '-' || t[0] == '+') return false;
  char* end = nullptr;
  errno = 0;
  unsigned long long x = std::strtoull(t.c_str(), &end, 10);
  if (errno != 0 || (end && *end != '\0')) return false;
  out = static_cast<std::size_t>(x);
  return true;
}

bool to_bool(const std::string& t, bool& out) {
  std::string u = t;
  for (auto& c : u) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (u == "1" || u == "true" || u == "yes") { out = true; return true; }
  if (u == "0" || u == "false" || u == "no") { out = false; return true; }
  return false;
}

} // namespace

EarlyAllocConfig ParseEarlyAllocConf(std::string_view conf) {
  EarlyAllocConfig cfg;
  const std::string s(conf);
  std::size_t i = 0;
  while (i < s.size()) {
    while (i < s.size() && (is_space(s[i]) || s[i] == ',')) ++i;
    if (i >= s.size()) break;
    std::size_t k0 = i;
    while (i < s.size() && s[i] != '=' && s[i] != ',') ++i;
    if (i >= s.size() || s[i] != '=') {
      // bare key without a value: skip to the next pair
      continue;
    }
    std::string key = s.substr(k0, i - k0);
    ++i;
    std::size_t v0 = i;
    while (i < s.size() && s[i] != ',') ++i;
    std::string val = s.substr(v0, i - v0);
    trim(key);
    trim(val);
    if (key == "min_byte_align") {
      std::size_t v = 0;
      if (to_uint(val, v)) cfg.min_byte_align = core::ceil_pow2(v);
    } else if (key == "trace") {
      bool b = false;
      if (to_bool(val, b)) cfg.trace = b;
    } else if (key == "warn_on_exhaustion") {
      bool b = false;
      if (to_bool(val, b)) cfg.warn_on_exhaustion = b;
    } else {
      BOOTMEM_LOG(WARNING) << "[early_alloc] ignoring unknown config key '" << key << "'";
    }
  }
  return cfg;
}

EarlyAllocConfig EarlyAllocConfigFromEnv() {
  const char* env = std::getenv(kEarlyAllocConfEnv);
  if (!env || !*env) return EarlyAllocConfig{};
  return ParseEarlyAllocConf(env);
}

}} // namespace bootmem::alloc

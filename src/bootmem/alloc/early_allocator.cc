// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "bootmem/alloc/early_allocator.h"

#include <sstream>
#include <string>

#include "bootmem/logging/logging.h"

namespace bootmem { namespace alloc {

template class EarlyAllocator<kDefaultPageSize>;

namespace detail {

namespace {
std::string Hex(std::uintptr_t v) {
  std::ostringstream os;
  os << "0x" << std::hex << v;
  return os.str();
}

std::string Describe(const EarlyRegionSnapshot& s) {
  std::ostringstream os;
  os << "start=" << Hex(s.start) << " b_pos=" << Hex(s.b_pos)
     << " p_pos=" << Hex(s.p_pos) << " end=" << Hex(s.end)
     << " count=" << s.count;
  return os.str();
}
} // namespace

void log_early_init(const EarlyRegionSnapshot& s, std::size_t page_size, bool saturated) {
  if (saturated) {
    BOOTMEM_LOG(WARNING) << "[early_alloc] init: base + size overflows the address space; "
                         << "end clamped (" << Describe(s) << ")";
    return;
  }
  BOOTMEM_LOG(INFO) << "[early_alloc] init: page_size=" << page_size << " " << Describe(s);
}

void log_early_op(const char* op, std::uintptr_t addr, std::size_t size, const EarlyRegionSnapshot& s) {
  BOOTMEM_LOG(INFO) << "[early_alloc] " << op << " addr=" << Hex(addr) << " size=" << size
                    << " -> " << Describe(s);
}

void log_early_failure(const char* op, const AllocStatus& st, const EarlyRegionSnapshot& s) {
  BOOTMEM_LOG(WARNING) << "[early_alloc] " << op << " failed: " << st.message() << " (" << Describe(s) << ")";
}

} // namespace detail

}} // namespace bootmem::alloc

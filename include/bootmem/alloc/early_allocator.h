// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <numeric>
#include <string>

#include "bootmem/alloc/allocator_base.h"
#include "bootmem/alloc/early_config.h"
#include "bootmem/core/alloc_error.h"
#include "bootmem/core/checked_math.h"

namespace bootmem { namespace alloc {

// Layout of the managed region:
//
//   [ bytes-used | available | pages-used ]
//   |            | -->   <-- |            |
//   start      b_pos       p_pos         end
//
// Byte allocations bump b_pos forward; page allocations bump p_pos backward.
// Invariant: start <= b_pos <= p_pos <= end.
struct EarlyRegionSnapshot {
  std::uintptr_t start{0};
  std::uintptr_t end{0};
  std::uintptr_t b_pos{0};
  std::uintptr_t p_pos{0};
  std::size_t    count{0};
};

struct EarlyAllocStats {
  // Counters (since init)
  std::uint64_t byte_allocs{0};
  std::uint64_t byte_frees{0};
  std::uint64_t byte_reclaims{0};      // live count dropped from 1 to 0
  std::uint64_t page_allocs{0};
  std::uint64_t ignored_page_frees{0};
  std::uint64_t failed_allocs{0};
  // Gauges
  std::uint64_t peak_used_bytes{0};
  std::uint64_t peak_used_pages{0};
};

namespace detail {
// Out-of-line so the header does not pull in absl/log.
void log_early_init(const EarlyRegionSnapshot& s, std::size_t page_size, bool saturated);
void log_early_op(const char* op, std::uintptr_t addr, std::size_t size, const EarlyRegionSnapshot& s);
void log_early_failure(const char* op, const AllocStatus& st, const EarlyRegionSnapshot& s);
} // namespace detail

// Bootstrap allocator over one contiguous region. Serves byte requests from
// the low end and page requests from the high end until the two meet.
//
// Byte frees are not tracked per allocation: only a live count is kept, and
// the whole byte region is reclaimed when it drops to zero. Addresses passed
// to dealloc are not validated. Page allocations are never reclaimed.
//
// Not thread-safe; callers provide mutual exclusion.
template <std::size_t PageSize>
class EarlyAllocator final : public BaseAllocator,
                             public ByteAllocator,
                             public PageAllocator<PageSize> {
 public:
  using PageAllocator<PageSize>::kPageSize;

  EarlyAllocator() = default;
  explicit EarlyAllocator(const EarlyAllocConfig& cfg) : cfg_(cfg) {
    cfg_.min_byte_align = core::ceil_pow2(cfg_.min_byte_align);
  }

  EarlyAllocator(const EarlyAllocator&) = delete;
  EarlyAllocator& operator=(const EarlyAllocator&) = delete;

  // ---- lifecycle ----

  void init(std::uintptr_t base, std::size_t size) override {
    std::uintptr_t end = 0;
    const bool saturated = !core::checked_add_uptr(base, size, end);
    if (saturated) end = std::numeric_limits<std::uintptr_t>::max();
    start_ = base;
    end_ = end;
    b_pos_ = start_;
    p_pos_ = end_;
    count_ = 0;
    stats_ = EarlyAllocStats{};
    if (cfg_.trace || saturated) detail::log_early_init(snapshot(), kPageSize, saturated);
  }

  // The region cannot grow; accepted and ignored.
  AllocStatus add_memory(std::uintptr_t base, std::size_t size) override {
    if (cfg_.trace) detail::log_early_op("add_memory(ignored)", base, size, snapshot());
    return absl::OkStatus();
  }

  // ---- bytes ----

  std::size_t total_bytes() const override { return end_ - start_; }
  std::size_t used_bytes() const override { return b_pos_ - start_; }
  std::size_t available_bytes() const override { return p_pos_ - b_pos_; }

  AllocResult<std::uintptr_t> alloc(std::size_t size, std::size_t align) override {
    const std::size_t sz = size == 0 ? 1 : size;
    std::size_t a = align == 0 ? 1 : align;
    if (cfg_.min_byte_align > 1 && a % cfg_.min_byte_align != 0) {
      // lcm keeps the result a multiple of both the request and the floor
      const std::size_t g = std::gcd(a, cfg_.min_byte_align);
      if (!core::checked_mul_size(a / g, cfg_.min_byte_align, a)) {
        return fail_("alloc", AllocError::NoMemory, "effective alignment overflows");
      }
    }

    std::uintptr_t candidate = 0;
    std::uintptr_t new_b = 0;
    if (!core::checked_align_up(b_pos_, a, candidate) ||
        !core::checked_add_uptr(candidate, sz, new_b)) {
      return fail_("alloc", AllocError::NoMemory, "address overflow (size=" +
                   std::to_string(sz) + ", align=" + std::to_string(a) + ")");
    }
    if (new_b > p_pos_) {
      return fail_("alloc", AllocError::NoMemory, "byte region would overlap page region (size=" +
                   std::to_string(sz) + ", align=" + std::to_string(a) +
                   ", available=" + std::to_string(available_bytes()) + ")");
    }

    b_pos_ = new_b;
    ++count_;
    ++stats_.byte_allocs;
    if (used_bytes() > stats_.peak_used_bytes) stats_.peak_used_bytes = used_bytes();
    if (cfg_.trace) detail::log_early_op("alloc", candidate, sz, snapshot());
    return candidate;
  }

  // Saturates at zero live allocations; the region is reclaimed whenever
  // the count ends at zero.
  void dealloc(std::uintptr_t addr, std::size_t size) override {
    ++stats_.byte_frees;
    if (count_ > 0) {
      --count_;
      if (count_ == 0) ++stats_.byte_reclaims;
    }
    if (count_ == 0) b_pos_ = start_;
    if (cfg_.trace) detail::log_early_op("dealloc", addr, size, snapshot());
  }

  AllocResult<MemBlock> alloc_block(std::size_t size, std::size_t align) {
    AllocResult<std::uintptr_t> r = alloc(size, align);
    if (!r.ok()) return r.status();
    return MemBlock{*r, size == 0 ? 1 : size};
  }

  void dealloc_block(const MemBlock& block) { dealloc(block.addr, block.size); }

  // ---- pages ----

  static constexpr std::size_t page_size() noexcept { return kPageSize; }

  std::size_t total_pages() const override { return (end_ - start_) / kPageSize; }
  std::size_t used_pages() const override { return (end_ - p_pos_) / kPageSize; }
  std::size_t available_pages() const override { return (p_pos_ - b_pos_) / kPageSize; }

  AllocResult<std::uintptr_t> alloc_pages(std::size_t num_pages, std::size_t align_pow2) override {
    if (num_pages == 0) {
      return fail_("alloc_pages", AllocError::InvalidParam, "num_pages must be non-zero");
    }
    std::size_t size = 0;
    if (!core::checked_mul_size(num_pages, kPageSize, size)) {
      return fail_("alloc_pages", AllocError::NoMemory,
                   "size overflow (num_pages=" + std::to_string(num_pages) + ")");
    }
    const std::uintptr_t req_align = core::pow2_clamped(align_pow2);
    const std::uintptr_t align = req_align > kPageSize ? req_align : kPageSize;
    const std::uintptr_t top = core::align_down_pow2(p_pos_, align);

    // The block start must honor the alignment too, not only its end.
    std::uintptr_t block = 0;
    const bool fits = core::checked_sub_uptr(top, size, block);
    if (fits) block = core::align_down_pow2(block, align);
    if (!fits || block < b_pos_) {
      return fail_("alloc_pages", AllocError::NoMemory, "page region would overlap byte region (num_pages=" +
                   std::to_string(num_pages) + ", align=" + std::to_string(align) +
                   ", available_pages=" + std::to_string(available_pages()) + ")");
    }

    p_pos_ = block;
    ++stats_.page_allocs;
    if (used_pages() > stats_.peak_used_pages) stats_.peak_used_pages = used_pages();
    if (cfg_.trace) detail::log_early_op("alloc_pages", block, size, snapshot());
    return block;
  }

  // Page allocations live as long as the region.
  void dealloc_pages(std::uintptr_t addr, std::size_t num_pages) override {
    ++stats_.ignored_page_frees;
    if (cfg_.trace) detail::log_early_op("dealloc_pages(ignored)", addr, num_pages * kPageSize, snapshot());
  }

  // ---- introspection ----

  std::uintptr_t region_start() const noexcept { return start_; }
  std::uintptr_t region_end() const noexcept { return end_; }
  bool contains(std::uintptr_t addr) const noexcept { return addr >= start_ && addr < end_; }
  std::size_t live_allocations() const noexcept { return count_; }

  EarlyRegionSnapshot snapshot() const noexcept {
    return EarlyRegionSnapshot{start_, end_, b_pos_, p_pos_, count_};
  }

  EarlyAllocStats stats() const noexcept { return stats_; }

  void reset_peak_stats() noexcept {
    stats_.peak_used_bytes = used_bytes();
    stats_.peak_used_pages = used_pages();
  }

  const EarlyAllocConfig& config() const noexcept { return cfg_; }

 private:
  AllocStatus fail_(const char* op, AllocError e, const std::string& what) {
    ++stats_.failed_allocs;
    AllocStatus st = core::MakeAllocError(e, std::string(op) + ": " + what);
    if (cfg_.warn_on_exhaustion) detail::log_early_failure(op, st, snapshot());
    return st;
  }

  EarlyAllocConfig cfg_{};
  std::uintptr_t start_{0};
  std::uintptr_t end_{0};
  std::uintptr_t b_pos_{0};
  std::uintptr_t p_pos_{0};
  std::size_t    count_{0};
  EarlyAllocStats stats_{};
};

inline constexpr std::size_t kDefaultPageSize = 4096;
using DefaultEarlyAllocator = EarlyAllocator<kDefaultPageSize>;
extern template class EarlyAllocator<kDefaultPageSize>;

}} // namespace bootmem::alloc

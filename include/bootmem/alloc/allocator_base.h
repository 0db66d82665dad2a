// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstddef>
#include <cstdint>

#include "bootmem/core/alloc_error.h"
#include "bootmem/core/checked_math.h"

namespace bootmem { namespace alloc {

using core::AllocError;
using core::AllocResult;
using core::AllocStatus;

// Non-owning capability token: an address plus the size it was allocated
// with. Carries no lifetime; the holder is trusted to release it once.
struct MemBlock {
  std::uintptr_t addr{0};
  std::size_t    size{0};

  void* ptr() const noexcept { return reinterpret_cast<void*>(addr); }
};

// Lifecycle contract.
class BaseAllocator {
 public:
  virtual ~BaseAllocator() = default;

  // Takes [base, base + size) as the managed region. Re-initialization
  // discards prior state.
  virtual void init(std::uintptr_t base, std::size_t size) = 0;
  virtual AllocStatus add_memory(std::uintptr_t base, std::size_t size) = 0;
};

// Byte-granularity allocation contract.
class ByteAllocator {
 public:
  virtual ~ByteAllocator() = default;

  virtual AllocResult<std::uintptr_t> alloc(std::size_t size, std::size_t align) = 0;
  virtual void dealloc(std::uintptr_t addr, std::size_t size) = 0;

  virtual std::size_t total_bytes() const = 0;
  virtual std::size_t used_bytes() const = 0;
  virtual std::size_t available_bytes() const = 0;
};

// Page-granularity allocation contract. PageSize is fixed at compile time.
template <std::size_t PageSize>
class PageAllocator {
  static_assert(core::is_pow2(PageSize), "PageSize must be a non-zero power of two");

 public:
  static constexpr std::size_t kPageSize = PageSize;

  virtual ~PageAllocator() = default;

  // Alignment is max(kPageSize, 2^align_pow2).
  virtual AllocResult<std::uintptr_t> alloc_pages(std::size_t num_pages, std::size_t align_pow2) = 0;
  virtual void dealloc_pages(std::uintptr_t addr, std::size_t num_pages) = 0;

  virtual std::size_t total_pages() const = 0;
  virtual std::size_t used_pages() const = 0;
  virtual std::size_t available_pages() const = 0;
};

}} // namespace bootmem::alloc

// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include "commondefs.h"

#include <cstddef>
#include <type_traits>
#include <utility>

namespace scratchpool {

// Sole owner of one allocation obtained from internalAlloc, holding no live
// elements. Move-only; ownership leaves through release() into a container, or
// the allocation is freed when the handle is destroyed.
struct BufferHandle {
  std::byte* ptr = nullptr;
  size_t bytes = 0;
  BufferHandle() = default;
  BufferHandle(std::nullptr_t) noexcept {}
  BufferHandle(void* ptr, size_t bytes) noexcept : ptr((std::byte*)ptr), bytes(ptr ? bytes : 0) {}
  BufferHandle(const BufferHandle&) = delete;
  BufferHandle& operator=(const BufferHandle&) = delete;
  BufferHandle(BufferHandle&& n) noexcept {
    ptr = std::exchange(n.ptr, nullptr);
    bytes = std::exchange(n.bytes, 0);
  }
  BufferHandle& operator=(BufferHandle&& n) noexcept {
    std::swap(ptr, n.ptr);
    std::swap(bytes, n.bytes);
    return *this;
  }
  ~BufferHandle() {
    reset();
  }
  explicit operator bool() const noexcept {
    return ptr != nullptr;
  }
  std::byte* data() const noexcept {
    return ptr;
  }
  size_t size() const noexcept {
    return bytes;
  }
  void reset() noexcept {
    if (ptr) {
      internalFree(ptr);
      ptr = nullptr;
      bytes = 0;
    }
  }
  // Gives up ownership. The caller becomes responsible for the allocation.
  std::byte* release() noexcept {
    bytes = 0;
    return std::exchange(ptr, nullptr);
  }
};
static_assert(!std::is_copy_constructible_v<BufferHandle>);

inline BufferHandle makeBuffer(size_t nbytes) {
  if (nbytes == 0) {
    return BufferHandle();
  }
  void* r = internalAlloc(nbytes);
  if (!r) {
    throw std::bad_alloc();
  }
  return BufferHandle(r, nbytes);
}

} // namespace scratchpool

// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include "logging.h"

#include "fmt/printf.h"

#include <cstddef>
#include <new>
#include <stdexcept>
#include <string>

#define SCRATCHPOOL_API __attribute__((visibility("default")))

namespace scratchpool {

// Every pooled buffer is allocated and freed through these, so that any poolable
// container can adopt storage that another poolable container gave up.
// Returned memory is aligned to alignof(std::max_align_t).
SCRATCHPOOL_API void* internalAlloc(size_t bytes);
SCRATCHPOOL_API void internalFree(void* ptr);
SCRATCHPOOL_API size_t internalAllocSize(void* ptr);

#ifdef SCRATCHPOOL_ALLOCATOR_GUARDS
// Number of allocations not yet freed.
SCRATCHPOOL_API size_t internalLiveAllocations();
#endif

inline constexpr size_t internalAllocAlignment = alignof(std::max_align_t);

template<typename T>
struct InternalAllocator {
  typedef T value_type;
  static_assert(alignof(T) <= internalAllocAlignment, "over-aligned types cannot share pooled storage");
  T* allocate(size_t n) {
    void* r = internalAlloc(sizeof(T) * n);
    if (!r) {
      throw std::bad_alloc();
    }
    return (T*)r;
  }
  void deallocate(T* p, std::size_t) noexcept {
    internalFree(p);
  }
};

[[noreturn]] [[gnu::cold]] inline void throwCheckFail(const char* file, int line, const char* text) {
  std::string str = fmt::sprintf("[CHECK FAILED %s:%d] %s\n", file, line, text);
  log.error("%s", str);
  throw std::runtime_error(str);
}

#define NORETURN(...)                                                                                                  \
  [&] [[noreturn]] [[gnu::cold]] [[gnu::noinline]] () -> decltype(auto) {                                              \
    __VA_ARGS__                                                                                                        \
  }();

#undef CHECK
#define CHECK(x)                                                                                                       \
  {                                                                                                                    \
    if (!(x)) [[unlikely]]                                                                                             \
      NORETURN(throwCheckFail(__FILE__, __LINE__, #x);)                                                                \
  }

} // namespace scratchpool

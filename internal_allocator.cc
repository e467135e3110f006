// Copyright (c) Meta Platforms, Inc. and affiliates.

// Allocation routine shared by every poolable container.

#include "commondefs.h"

#include <cstdint>
#include <cstdlib>
#include <cstring>

#include <malloc.h>

#ifdef SCRATCHPOOL_ALLOCATOR_GUARDS
#include <mutex>
#include <unordered_set>
#endif

namespace scratchpool {

#ifdef SCRATCHPOOL_ALLOCATOR_GUARDS
// Add guard bytes to detect buffer overflows and track allocations for double-free detection

static constexpr uint64_t GUARD_MAGIC = 0xDEADBEEFCAFEBABEULL;
static constexpr uint64_t FREED_MAGIC = 0xFEEDFACEFEEDFACEULL;
static constexpr size_t GUARD_SIZE = 64; // bytes of guard region

struct alignas(std::max_align_t) GuardHeader {
  void* rawPtr;
  size_t requestedSize;
  uint64_t magic;
};

// Never destroyed, thread-exit pool teardown may run after static destructors.
static std::mutex& getGuardsMutex() {
  static std::mutex* m = new std::mutex();
  return *m;
}

static std::unordered_set<void*>& getLiveAllocations() {
  static std::unordered_set<void*>* s = new std::unordered_set<void*>();
  return *s;
}

[[gnu::malloc]]
void* internalAlloc(size_t bytes) {
  void* raw = std::malloc(sizeof(GuardHeader) + bytes + GUARD_SIZE);
  if (!raw) {
    return nullptr;
  }
  GuardHeader* hdr = (GuardHeader*)raw;
  char* userPtr = (char*)(hdr + 1);
  hdr->rawPtr = raw;
  hdr->requestedSize = bytes;
  hdr->magic = GUARD_MAGIC;

  uint64_t guard = GUARD_MAGIC;
  for (size_t i = 0; i < GUARD_SIZE / sizeof(uint64_t); ++i) {
    std::memcpy(userPtr + bytes + i * sizeof(uint64_t), &guard, sizeof(guard));
  }

  {
    std::lock_guard<std::mutex> lock(getGuardsMutex());
    getLiveAllocations().insert(userPtr);
  }

  return userPtr;
}

void internalFree(void* ptr) {
  if (!ptr) {
    return;
  }

  {
    std::lock_guard<std::mutex> lock(getGuardsMutex());
    auto& liveAllocations = getLiveAllocations();
    auto it = liveAllocations.find(ptr);
    if (it == liveAllocations.end()) {
      log.error("INVALID FREE: ptr=%p was never allocated or was already freed!\n", ptr);
      GuardHeader* hdr = (GuardHeader*)ptr - 1;
      if (hdr->magic == FREED_MAGIC) {
        log.error("  (header indicates double-free)\n");
      }
      std::abort();
    }
    liveAllocations.erase(it);
  }

  GuardHeader* hdr = (GuardHeader*)ptr - 1;

  if (hdr->magic != GUARD_MAGIC) {
    log.error("HEAP CORRUPTION: header magic corrupted! ptr=%p expected=%llx got=%llx\n", ptr,
        (unsigned long long)GUARD_MAGIC, (unsigned long long)hdr->magic);
    std::abort();
  }

  char* userPtr = (char*)ptr;
  for (size_t i = 0; i < GUARD_SIZE / sizeof(uint64_t); ++i) {
    uint64_t guard;
    std::memcpy(&guard, userPtr + hdr->requestedSize + i * sizeof(uint64_t), sizeof(guard));
    if (guard != GUARD_MAGIC) {
      log.error("HEAP CORRUPTION: buffer overflow detected! ptr=%p size=%zu guard[%zu]=%llx\n", ptr, hdr->requestedSize,
          i, (unsigned long long)guard);
      std::abort();
    }
  }

  hdr->magic = FREED_MAGIC;

  std::free(hdr->rawPtr);
}

size_t internalAllocSize(void* ptr) {
  if (!ptr) {
    return 0;
  }
  GuardHeader* hdr = (GuardHeader*)ptr - 1;
  return hdr->requestedSize;
}

size_t internalLiveAllocations() {
  std::lock_guard<std::mutex> lock(getGuardsMutex());
  return getLiveAllocations().size();
}
#else
[[gnu::malloc]]
void* internalAlloc(size_t bytes) {
  return std::malloc(bytes);
}

void internalFree(void* ptr) {
  std::free(ptr);
}

size_t internalAllocSize(void* ptr) {
  return malloc_usable_size(ptr);
}
#endif

} // namespace scratchpool

// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include "buffer.h"
#include "commondefs.h"
#include "logging.h"
#include "poolable.h"
#include "vector.h"

#include <concepts>
#include <cstddef>
#include <functional>
#include <new>
#include <type_traits>
#include <utility>

namespace scratchpool {

struct RecyclingPoolStats {
  size_t acquires = 0;
  // acquires that were served from the free list
  size_t reuses = 0;
  // releases that pushed a buffer onto the free list
  size_t releases = 0;
  // releases of zero capacity values
  size_t discards = 0;
};

// LIFO free list of empty buffers. Buffers carry no type; any Poolable type can
// take a buffer released by any other. Not thread safe: one pool per thread.
class RecyclingPool {
  Vector<BufferHandle> buffers;
  size_t residentBytes = 0;
  RecyclingPoolStats counters;

  template<Poolable T>
  struct BorrowGuard {
    RecyclingPool& pool;
    T value;
    BorrowGuard(RecyclingPool& pool) : pool(pool), value(pool.acquire<T>()) {}
    BorrowGuard(const BorrowGuard&) = delete;
    BorrowGuard& operator=(const BorrowGuard&) = delete;
    ~BorrowGuard() {
      pool.release(std::move(value));
    }
  };

public:
  RecyclingPool() = default;
  RecyclingPool(const RecyclingPool&) = delete;
  RecyclingPool& operator=(const RecyclingPool&) = delete;
  ~RecyclingPool() {
    if (!buffers.empty()) {
      log.debug("recycling pool %p freeing %d buffers (%d bytes)\n", (void*)this, buffers.size(), residentBytes);
    }
    clear();
  }

  // Returns the most recently released buffer as a T of length 0, or an empty T
  // if there is none.
  template<Poolable T>
  T acquire() noexcept {
    ++counters.acquires;
    if (buffers.empty()) {
      return PoolableTraits<T>::empty();
    }
    BufferHandle buffer = std::move(buffers.back());
    buffers.pop_back();
    residentBytes -= buffer.size();
    ++counters.reuses;
    return PoolableTraits<T>::fromBuffer(std::move(buffer));
  }

  // Takes the storage of value, which must be an rvalue. Live elements are
  // destroyed first and value is left empty. A value without storage leaves the
  // free list untouched. Lvalues deduce T as a reference, which is not Poolable.
  template<Poolable T>
  void release(T&& value) noexcept {
    BufferHandle buffer = PoolableTraits<T>::extractBuffer(value);
    if (buffer.size() == 0) {
      ++counters.discards;
      return;
    }
    size_t bytes = buffer.size();
    try {
      buffers.push_back(std::move(buffer));
    } catch (const std::bad_alloc&) {
      // The free list could not grow; the buffer is freed by its handle instead.
      log.error("recycling pool %p out of memory, dropping %d byte buffer\n", (void*)this, bytes);
      ++counters.discards;
      return;
    }
    residentBytes += bytes;
    ++counters.releases;
  }

  // Runs callback on a pooled T and returns the T's storage to the pool
  // afterwards, also when callback throws. The result is returned by value, a
  // callback returning a reference would let the T outlive the borrow.
  template<Poolable T, typename F>
    requires std::invocable<F, T&> && (!std::is_reference_v<std::invoke_result_t<F, T&>>)
  std::invoke_result_t<F, T&> borrow(F&& callback) {
    BorrowGuard<T> guard(*this);
    return std::invoke(std::forward<F>(callback), guard.value);
  }

  // Number of buffers on the free list.
  size_t size() const {
    return buffers.size();
  }
  bool empty() const {
    return buffers.empty();
  }
  // Sum of the byte capacities on the free list.
  size_t bytes() const {
    return residentBytes;
  }
  const RecyclingPoolStats& stats() const {
    return counters;
  }

  // Frees every buffer on the free list.
  void clear() noexcept {
    buffers.clear();
    buffers.shrinkToFit();
    residentBytes = 0;
  }
};

} // namespace scratchpool

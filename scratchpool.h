// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include "bytestring.h"
#include "commondefs.h"
#include "poolable.h"
#include "recycling_pool.h"
#include "vector.h"

#include <concepts>
#include <functional>
#include <type_traits>
#include <utility>

namespace scratchpool {

// The calling thread's pool. Created on first use, destroyed at thread exit
// together with every buffer still on it. Returns nullptr once the pool has been
// destroyed, for callers running later in thread teardown.
SCRATCHPOOL_API RecyclingPool* currentPool() noexcept;

// As currentPool(), for callers that know the thread is not being torn down.
SCRATCHPOOL_API RecyclingPool& localPool();

// Constructs a T with storage from the calling thread's pool.
//
//   auto buffer = scratchpool::acquire<ByteString>();
//   buffer.append("I like cupcakes!");
//   scratchpool::release(std::move(buffer));
template<Poolable T>
T acquire() noexcept {
  if (RecyclingPool* pool = currentPool()) {
    return pool->acquire<T>();
  }
  return PoolableTraits<T>::empty();
}

// Destroys the contents of value and returns its storage to the calling thread's
// pool. value must be an rvalue and is left empty. After the pool is gone the
// storage is freed instead.
template<Poolable T>
void release(T&& value) noexcept {
  if (RecyclingPool* pool = currentPool()) {
    pool->release(std::move(value));
  } else {
    PoolableTraits<T>::extractBuffer(value).reset();
  }
}

// Runs callback with a temporary T whose storage comes from, and afterwards goes
// back to, the calling thread's pool. Returns what callback returns, by value.
//
//   scratchpool::borrow<Vector<uint32_t>>([](Vector<uint32_t>& v) {
//     v.push_back(1);
//   });
template<Poolable T, typename F>
  requires std::invocable<F, T&> && (!std::is_reference_v<std::invoke_result_t<F, T&>>)
std::invoke_result_t<F, T&> borrow(F&& callback) {
  if (RecyclingPool* pool = currentPool()) {
    return pool->borrow<T>(std::forward<F>(callback));
  }
  T value = PoolableTraits<T>::empty();
  return std::invoke(std::forward<F>(callback), value);
}

} // namespace scratchpool

// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include "buffer.h"
#include "bytestring.h"
#include "vector.h"

#include <concepts>
#include <cstdint>
#include <type_traits>

namespace scratchpool {

// A container backed by a single internalAlloc allocation opts into pooling by
// specializing PoolableTraits with:
//
//   static T empty();                         zero length, zero capacity, no allocation
//   static BufferHandle extractBuffer(T&);    destroys live elements, detaches storage
//   static T fromBuffer(BufferHandle);        length 0 container owning the buffer
//
// fromBuffer is unchecked. The buffer must come from internalAlloc, and its byte
// size must not exceed the real allocation. Byte counts that are not a multiple
// of the element size are rounded down to whole elements.
template<typename T>
struct PoolableTraits;

template<typename T>
concept Poolable = std::is_object_v<T> && !std::is_const_v<T> && std::is_nothrow_move_constructible_v<T> &&
    requires(T& value, BufferHandle buffer) {
  { PoolableTraits<T>::empty() } -> std::same_as<T>;
  { PoolableTraits<T>::extractBuffer(value) } -> std::same_as<BufferHandle>;
  { PoolableTraits<T>::fromBuffer(std::move(buffer)) } -> std::same_as<T>;
};

template<typename T>
struct PoolableTraits<Vector<T>> {
  static Vector<T> empty() noexcept {
    return Vector<T>();
  }
  static BufferHandle extractBuffer(Vector<T>& value) noexcept {
    return value.releaseBuffer();
  }
  static Vector<T> fromBuffer(BufferHandle buffer) noexcept {
    return Vector<T>::fromBuffer(std::move(buffer));
  }
};

template<>
struct PoolableTraits<ByteString> {
  static ByteString empty() noexcept {
    return ByteString();
  }
  static BufferHandle extractBuffer(ByteString& value) noexcept {
    return value.releaseBuffer();
  }
  static ByteString fromBuffer(BufferHandle buffer) noexcept {
    return ByteString::fromBuffer(std::move(buffer));
  }
};

static_assert(Poolable<ByteString>);
static_assert(Poolable<Vector<uint32_t>>);

} // namespace scratchpool

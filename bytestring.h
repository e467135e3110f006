// Copyright (c) Meta Platforms, Inc. and affiliates.

#pragma once

#include "buffer.h"
#include "vector.h"

#include <algorithm>
#include <cstring>
#include <string>
#include <string_view>

namespace scratchpool {

// Growable byte string. The contents are not null terminated.
struct ByteString {
  Vector<char> bytes;

  ByteString() = default;
  explicit ByteString(std::string_view str) {
    append(str);
  }

  static ByteString fromBuffer(BufferHandle buffer) noexcept {
    ByteString r;
    r.bytes = Vector<char>::fromBuffer(std::move(buffer));
    return r;
  }
  BufferHandle releaseBuffer() noexcept {
    return bytes.releaseBuffer();
  }

  size_t size() const {
    return bytes.size();
  }
  bool empty() const {
    return bytes.empty();
  }
  size_t capacity() const {
    return bytes.capacity();
  }
  char* data() {
    return bytes.data();
  }
  const char* data() const {
    return bytes.data();
  }
  char* begin() {
    return bytes.begin();
  }
  char* end() {
    return bytes.end();
  }
  const char* begin() const {
    return bytes.begin();
  }
  const char* end() const {
    return bytes.end();
  }
  char& operator[](size_t index) {
    return bytes[index];
  }
  const char& operator[](size_t index) const {
    return bytes[index];
  }

  std::string_view view() const {
    return std::string_view(data(), size());
  }
  operator std::string_view() const {
    return view();
  }
  std::string str() const {
    return std::string(view());
  }

  void reserve(size_t n) {
    bytes.reserve(n);
  }
  void resize(size_t n) {
    bytes.resize(n);
  }
  void clear() {
    bytes.clear();
  }
  void shrinkToFit() {
    bytes.shrinkToFit();
  }

  void push_back(char c) {
    bytes.push_back(c);
  }
  ByteString& append(const void* src, size_t n) {
    if (n == 0) {
      return *this;
    }
    size_t offset = size();
    if (offset + n > capacity()) {
      bytes.reserve(std::max(offset + n, capacity() * 2));
    }
    bytes.resize(offset + n);
    std::memcpy(bytes.data() + offset, src, n);
    return *this;
  }
  ByteString& append(std::string_view str) {
    return append(str.data(), str.size());
  }
  ByteString& operator+=(std::string_view str) {
    return append(str);
  }
  ByteString& operator+=(char c) {
    push_back(c);
    return *this;
  }

  bool operator==(std::string_view other) const {
    return view() == other;
  }
  bool operator==(const ByteString& other) const {
    return view() == other.view();
  }
};

} // namespace scratchpool

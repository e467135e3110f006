// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "scratchpool.h"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "fmt/printf.h"

#undef CHECK
#define CHECK(x)                                                                                                       \
  (bool(x) ? 0                                                                                                         \
           : (printf("[CHECK FAILED %s:%d] %s\n", __FILE__, __LINE__, #x), fflush(stderr), fflush(stdout),             \
              std::abort(), 0))

using namespace scratchpool;

namespace {

template<typename V>
concept Releasable = requires(V&& value) { scratchpool::release(std::forward<V>(value)); };

template<typename T, typename F>
concept Borrowable = requires(F callback) { scratchpool::borrow<T>(callback); };

struct Length {
  size_t operator()(ByteString& s) const {
    return s.size();
  }
};
struct Contents {
  std::string operator()(ByteString& s) const {
    return s.str();
  }
};
struct Escape {
  ByteString& operator()(ByteString& s) const {
    return s;
  }
};
struct FirstElement {
  const uint32_t& operator()(Vector<uint32_t>& v) const {
    return v.front();
  }
};

} // namespace

static_assert(Releasable<ByteString>);
static_assert(Releasable<Vector<uint64_t>>);
static_assert(!Releasable<ByteString&>);
static_assert(!Releasable<const ByteString&>);
static_assert(!Releasable<Vector<uint64_t>&>);
static_assert(!Releasable<const Vector<uint64_t>>);

static_assert(Borrowable<ByteString, Length>);
static_assert(Borrowable<ByteString, Contents>);
static_assert(!Borrowable<ByteString, Escape>);
static_assert(!Borrowable<Vector<uint32_t>, FirstElement>);

static void testBorrowString() {
  localPool().clear();
  const char* storage = nullptr;
  scratchpool::borrow<ByteString>([&](ByteString& aux) {
    // A clean buffer at first.
    CHECK(aux.size() == 0);
    CHECK(aux.capacity() == 0);
    aux.append("Hello World!");
    CHECK(aux.size() == 12);
    CHECK(aux.capacity() >= 12);
    CHECK(aux == "Hello World!");
    storage = aux.data();
  });

  scratchpool::borrow<ByteString>([&](ByteString& aux) {
    // The same buffer as before, emptied.
    CHECK(aux.size() == 0);
    CHECK(aux.capacity() >= 12);
    CHECK(aux.data() == storage);
  });
  fmt::printf("[PASS] borrow string\n");
}

static void testAcquireAndReleaseString() {
  localPool().clear();
  auto string = scratchpool::acquire<ByteString>();
  CHECK(string.size() == 0);
  CHECK(string.capacity() == 0);
  string.append("I like cupcakes!");
  scratchpool::release(std::move(string));

  auto again = scratchpool::acquire<ByteString>();
  CHECK(again.size() == 0);
  CHECK(again.capacity() >= 16);
  fmt::printf("[PASS] acquire and release string\n");
}

static void testBorrowStringAndVector() {
  localPool().clear();
  scratchpool::borrow<ByteString>([](ByteString& aux) {
    aux.append("Do you like cupcakes?");
    aux.shrinkToFit();
    CHECK(aux.capacity() == 21);
  });
  scratchpool::borrow<Vector<uint32_t>>([](Vector<uint32_t>& vec) {
    CHECK(vec.capacity() == 21 / 4);
    vec.push_back(1);
    vec.push_back(2);
    vec.push_back(3);
  });
  fmt::printf("[PASS] borrow string and vector\n");
}

static void testBorrowResult() {
  localPool().clear();
  int r = scratchpool::borrow<Vector<int>>([](Vector<int>& v) {
    for (int i = 1; i <= 4; ++i) {
      v.push_back(i);
    }
    int sum = 0;
    for (int x : v) {
      sum += x;
    }
    return sum;
  });
  CHECK(r == 10);
  CHECK(localPool().size() == 1);
  fmt::printf("[PASS] borrow result\n");
}

static void testReleaseEmptiesSource() {
  localPool().clear();
  ByteString s;
  s.reserve(64);
  s.append("abcde");
  scratchpool::release(std::move(s));
  CHECK(s.size() == 0);
  CHECK(s.capacity() == 0);
  CHECK(localPool().bytes() == 64);

  auto again = scratchpool::acquire<ByteString>();
  CHECK(again.size() == 0);
  CHECK(again.capacity() == 64);
  fmt::printf("[PASS] release empties source\n");
}

static void testCurrentPool() {
  RecyclingPool* pool = currentPool();
  CHECK(pool != nullptr);
  CHECK(pool == &localPool());
  CHECK(pool == currentPool());
  fmt::printf("[PASS] current pool\n");
}

static void testZeroCapacityRelease() {
  localPool().clear();
  for (int i = 0; i != 10; ++i) {
    scratchpool::release(scratchpool::acquire<ByteString>());
  }
  CHECK(localPool().size() == 0);
  auto s = scratchpool::acquire<ByteString>();
  CHECK(s.capacity() == 0);
  fmt::printf("[PASS] zero capacity release\n");
}

static void testThreadsAreIndependent() {
  localPool().clear();
  ByteString mine;
  mine.append("main thread buffer");
  const char* storage = mine.data();
  scratchpool::release(std::move(mine));
  CHECK(localPool().size() == 1);

  RecyclingPool* mainPool = &localPool();
  RecyclingPool* otherPool = nullptr;
  size_t otherCapacity = 1;
  size_t otherResident = 1;

  std::thread thread([&]() {
    otherPool = &localPool();
    auto s = scratchpool::acquire<ByteString>();
    otherCapacity = s.capacity();
    s.append("other thread buffer");
    scratchpool::release(std::move(s));
    otherResident = localPool().size();
  });
  thread.join();

  CHECK(otherPool != mainPool);
  CHECK(otherCapacity == 0);
  CHECK(otherResident == 1);
  CHECK(localPool().size() == 1);
  auto back = scratchpool::acquire<ByteString>();
  CHECK(back.data() == storage);
  fmt::printf("[PASS] threads are independent\n");
}

static void testManyThreads() {
  std::vector<std::thread> threads;
  std::vector<size_t> reused(8, 0);
  for (size_t t = 0; t != reused.size(); ++t) {
    threads.emplace_back([&reused, t]() {
      for (int i = 0; i != 1000; ++i) {
        scratchpool::borrow<Vector<uint64_t>>([&](Vector<uint64_t>& v) {
          if (v.capacity() > 0) {
            ++reused[t];
          }
          v.resize(64 + t);
        });
      }
      CHECK(localPool().size() == 1);
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  for (size_t n : reused) {
    CHECK(n == 999);
  }
  fmt::printf("[PASS] many threads\n");
}

int main() {
  testBorrowString();
  testAcquireAndReleaseString();
  testBorrowStringAndVector();
  testBorrowResult();
  testReleaseEmptiesSource();
  testCurrentPool();
  testZeroCapacityRelease();
  testThreadsAreIndependent();
  testManyThreads();
  return 0;
}

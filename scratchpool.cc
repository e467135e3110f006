// Copyright (c) Meta Platforms, Inc. and affiliates.

#include "scratchpool.h"

#include <sys/syscall.h>
#include <unistd.h>

namespace scratchpool {

namespace {

// Trivially destructible, so it stays readable after the pool itself is gone.
thread_local bool localPoolDestroyed = false;

struct LocalPoolStorage {
  RecyclingPool pool;
  LocalPoolStorage() {
    log.verbose("thread %d: recycling pool created\n", (long)::syscall(SYS_gettid));
  }
  ~LocalPoolStorage() {
    localPoolDestroyed = true;
    auto& stats = pool.stats();
    log.verbose(
        "thread %d: recycling pool destroyed, %d acquires (%d reused), %d releases, %d discards, %d buffers (%d "
        "bytes) freed\n",
        (long)::syscall(SYS_gettid), stats.acquires, stats.reuses, stats.releases, stats.discards, pool.size(),
        pool.bytes());
  }
};

} // namespace

RecyclingPool* currentPool() noexcept {
  if (localPoolDestroyed) [[unlikely]] {
    return nullptr;
  }
  thread_local LocalPoolStorage storage;
  return &storage.pool;
}

RecyclingPool& localPool() {
  RecyclingPool* pool = currentPool();
  CHECK(pool != nullptr);
  return *pool;
}

} // namespace scratchpool

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <atomic>
#include <cstdint>

namespace echosrv {
namespace server {

// Point-in-time copy of a server's counters
struct ServerStats {
  uint64_t accepted{0};
  uint64_t rejected{0};
  uint64_t closed{0};
  uint64_t accept_errors{0};
  uint64_t io_errors{0};
  uint64_t timeouts{0};
  uint64_t datagrams_received{0};
  uint64_t datagrams_echoed{0};
  uint64_t datagrams_dropped{0};
};

// Live counters, updated from the io thread and read from anywhere
struct StatsCounters {
  std::atomic<uint64_t> accepted{0};
  std::atomic<uint64_t> rejected{0};
  std::atomic<uint64_t> closed{0};
  std::atomic<uint64_t> accept_errors{0};
  std::atomic<uint64_t> io_errors{0};
  std::atomic<uint64_t> timeouts{0};
  std::atomic<uint64_t> datagrams_received{0};
  std::atomic<uint64_t> datagrams_echoed{0};
  std::atomic<uint64_t> datagrams_dropped{0};

  ServerStats Snapshot() const {
    ServerStats s;
    s.accepted = accepted.load(std::memory_order_relaxed);
    s.rejected = rejected.load(std::memory_order_relaxed);
    s.closed = closed.load(std::memory_order_relaxed);
    s.accept_errors = accept_errors.load(std::memory_order_relaxed);
    s.io_errors = io_errors.load(std::memory_order_relaxed);
    s.timeouts = timeouts.load(std::memory_order_relaxed);
    s.datagrams_received = datagrams_received.load(std::memory_order_relaxed);
    s.datagrams_echoed = datagrams_echoed.load(std::memory_order_relaxed);
    s.datagrams_dropped = datagrams_dropped.load(std::memory_order_relaxed);
    return s;
  }
};

} // namespace server
} // namespace echosrv

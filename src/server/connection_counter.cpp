// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "server/connection_counter.hpp"

namespace echosrv {
namespace server {

std::optional<ConnectionCounter::Slot> ConnectionCounter::TryAcquire(size_t limit) {
  size_t current = count_.load(std::memory_order_acquire);
  do {
    if (current >= limit) {
      return std::nullopt;
    }
  } while (!count_.compare_exchange_weak(current, current + 1, std::memory_order_acq_rel,
                                         std::memory_order_acquire));

  size_t now = current + 1;
  size_t seen = peak_.load(std::memory_order_relaxed);
  while (now > seen && !peak_.compare_exchange_weak(seen, now, std::memory_order_relaxed)) {
  }

  return Slot(this);
}

} // namespace server
} // namespace echosrv

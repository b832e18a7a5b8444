// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <atomic>
#include <cstddef>
#include <optional>

namespace echosrv {
namespace server {

/**
 * ConnectionCounter - admission gate for stream connections
 *
 * TryAcquire() is a single compare-and-increment, so the count can never
 * exceed the limit even when many accepts race. The returned Slot gives the
 * unit back when destroyed, whichever path ends the connection.
 */
class ConnectionCounter {
public:
  class Slot {
  public:
    ~Slot() { Release(); }

    Slot(Slot &&other) noexcept : counter_(other.counter_) { other.counter_ = nullptr; }
    Slot &operator=(Slot &&other) noexcept {
      if (this != &other) {
        Release();
        counter_ = other.counter_;
        other.counter_ = nullptr;
      }
      return *this;
    }
    Slot(const Slot &) = delete;
    Slot &operator=(const Slot &) = delete;

  private:
    friend class ConnectionCounter;
    explicit Slot(ConnectionCounter *counter) : counter_(counter) {}

    void Release() {
      if (counter_) {
        counter_->count_.fetch_sub(1, std::memory_order_acq_rel);
        counter_ = nullptr;
      }
    }

    ConnectionCounter *counter_;
  };

  ConnectionCounter() = default;
  ConnectionCounter(const ConnectionCounter &) = delete;
  ConnectionCounter &operator=(const ConnectionCounter &) = delete;

  // Returns std::nullopt when limit slots are already taken
  std::optional<Slot> TryAcquire(size_t limit);

  size_t current() const { return count_.load(std::memory_order_acquire); }
  size_t peak() const { return peak_.load(std::memory_order_relaxed); }

private:
  std::atomic<size_t> count_{0};
  std::atomic<size_t> peak_{0};
};

} // namespace server
} // namespace echosrv

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <vector>

namespace echosrv {
namespace server {

/**
 * ShutdownSignal - one-shot broadcast to any number of observers
 *
 * - Fire() is idempotent; only the first call notifies subscribers
 * - Subscribing after the signal fired runs the callback immediately
 * - Callbacks run outside the lock on the firing thread and must not
 *   block; a throwing callback is logged and does not stop the others
 * - Wait()/WaitFor() block a thread until the signal fires
 *
 * The signal must outlive every Subscription taken from it.
 */
class ShutdownSignal {
public:
  using Callback = std::function<void()>;

  /**
   * Subscription handle - RAII wrapper
   * Automatically unsubscribes when destroyed
   */
  class Subscription {
  public:
    Subscription() = default;
    ~Subscription();

    // Movable but not copyable
    Subscription(Subscription &&other) noexcept;
    Subscription &operator=(Subscription &&other) noexcept;
    Subscription(const Subscription &) = delete;
    Subscription &operator=(const Subscription &) = delete;

    void Unsubscribe();

  private:
    friend class ShutdownSignal;
    Subscription(ShutdownSignal *owner, size_t id);

    ShutdownSignal *owner_{nullptr};
    size_t id_{0};
    bool active_{false};
  };

  ShutdownSignal() = default;
  ShutdownSignal(const ShutdownSignal &) = delete;
  ShutdownSignal &operator=(const ShutdownSignal &) = delete;

  // Returns true if this call fired the signal
  bool Fire();

  bool fired() const;

  [[nodiscard]] Subscription Subscribe(Callback callback);

  void Wait() const;

  // Returns true if the signal fired within timeout
  bool WaitFor(std::chrono::milliseconds timeout) const;

private:
  void Unsubscribe(size_t id);

  struct CallbackEntry {
    size_t id;
    Callback callback;
  };

  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  bool fired_{false};
  std::vector<CallbackEntry> callbacks_;
  size_t next_id_{1}; // 0 reserved for invalid
};

} // namespace server
} // namespace echosrv

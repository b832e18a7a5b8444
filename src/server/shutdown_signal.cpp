// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "server/shutdown_signal.hpp"
#include "util/logging.hpp"
#include <algorithm>

namespace echosrv {
namespace server {

// ============================================================================
// ShutdownSignal::Subscription
// ============================================================================

ShutdownSignal::Subscription::Subscription(ShutdownSignal *owner, size_t id)
    : owner_(owner), id_(id), active_(true) {}

ShutdownSignal::Subscription::~Subscription() { Unsubscribe(); }

ShutdownSignal::Subscription::Subscription(Subscription &&other) noexcept
    : owner_(other.owner_), id_(other.id_), active_(other.active_) {
  other.owner_ = nullptr;
  other.active_ = false;
}

ShutdownSignal::Subscription &
ShutdownSignal::Subscription::operator=(Subscription &&other) noexcept {
  if (this != &other) {
    Unsubscribe();
    owner_ = other.owner_;
    id_ = other.id_;
    active_ = other.active_;
    other.owner_ = nullptr;
    other.active_ = false;
  }
  return *this;
}

void ShutdownSignal::Subscription::Unsubscribe() {
  if (active_ && owner_) {
    owner_->Unsubscribe(id_);
    active_ = false;
  }
}

// ============================================================================
// ShutdownSignal
// ============================================================================

static void InvokeSafely(const ShutdownSignal::Callback &callback) {
  try {
    callback();
  } catch (const std::exception &e) {
    LOG_SERVER_ERROR("exception in shutdown callback: {}", e.what());
  }
}

bool ShutdownSignal::Fire() {
  std::vector<CallbackEntry> to_notify;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fired_) {
      return false;
    }
    fired_ = true;
    to_notify = std::move(callbacks_);
    callbacks_.clear();
  }
  cv_.notify_all();

  for (const auto &entry : to_notify) {
    InvokeSafely(entry.callback);
  }
  return true;
}

bool ShutdownSignal::fired() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return fired_;
}

ShutdownSignal::Subscription ShutdownSignal::Subscribe(Callback callback) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!fired_) {
      size_t id = next_id_++;
      callbacks_.push_back(CallbackEntry{id, std::move(callback)});
      return Subscription(this, id);
    }
  }
  // Already fired: observers that arrive late still see the edge
  InvokeSafely(callback);
  return Subscription();
}

void ShutdownSignal::Wait() const {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return fired_; });
}

bool ShutdownSignal::WaitFor(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [this] { return fired_; });
}

void ShutdownSignal::Unsubscribe(size_t id) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = std::find_if(callbacks_.begin(), callbacks_.end(),
                         [id](const CallbackEntry &entry) { return entry.id == id; });

  if (it != callbacks_.end()) {
    callbacks_.erase(it);
  }
}

} // namespace server
} // namespace echosrv

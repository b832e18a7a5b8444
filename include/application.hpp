// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/transport_factory.hpp"
#include "server/datagram_server.hpp"
#include "server/server_config.hpp"
#include "server/stream_server.hpp"
#include <atomic>
#include <memory>
#include <optional>

namespace echosrv {
namespace app {

// Application configuration
struct AppConfig {
  network::Protocol protocol = network::Protocol::Tcp;
  server::ServerConfig server;

  // Descriptors handed over by a supervisor; read from the environment
  // when unset
  std::optional<network::InheritanceConfig> inheritance;
};

// Application - builds the transport and server for the configured
// protocol, runs it and drains it on shutdown
class Application {
public:
  explicit Application(const AppConfig &config = AppConfig{});
  ~Application();

  // Lifecycle
  bool initialize();
  bool start();
  void stop();
  void wait_for_shutdown();

  // Status
  bool is_running() const { return running_; }
  std::optional<network::Address> local_address() const;

  // Valid after initialize()
  server::ShutdownSignal &shutdown_signal();

private:
  AppConfig config_;
  std::atomic<bool> running_{false};

  // Exactly one is set after initialize()
  std::unique_ptr<server::StreamServer> stream_server_;
  std::unique_ptr<server::DatagramServer> datagram_server_;
};

} // namespace app
} // namespace echosrv

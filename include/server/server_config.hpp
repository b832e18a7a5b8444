// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/socket_provisioner.hpp"
#include <chrono>
#include <cstddef>
#include <string>

namespace echosrv {
namespace server {

/**
 * ServerConfig - settings shared by every transport
 *
 * Each connection session takes its own copy at dispatch time, so a
 * config change never affects connections already in flight.
 */
struct ServerConfig {
  static constexpr size_t DEFAULT_BUFFER_SIZE = 1024;
  static constexpr size_t DEFAULT_MAX_CONNECTIONS = 100;
  static constexpr std::chrono::milliseconds DEFAULT_TIMEOUT{std::chrono::seconds(30)};

  network::BindStrategy bind_strategy;

  // Key used to look up an inherited descriptor (LISTEN_FDNAMES)
  std::string service_name;

  size_t buffer_size{DEFAULT_BUFFER_SIZE};
  std::chrono::milliseconds read_timeout{DEFAULT_TIMEOUT};
  std::chrono::milliseconds write_timeout{DEFAULT_TIMEOUT};

  // Stream servers only
  size_t max_connections{DEFAULT_MAX_CONNECTIONS};

  // Treat SIGINT/SIGTERM as a shutdown request
  bool handle_interrupt{true};
};

} // namespace server
} // namespace echosrv

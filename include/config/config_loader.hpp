// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/socket_provisioner.hpp"
#include "network/transport_factory.hpp"
#include "server/server_config.hpp"
#include <optional>
#include <string>

namespace echosrv {
namespace config {

/**
 * JSON server configuration
 *
 * {
 *   "protocol": "tcp",                 // tcp | udp | unix-stream | unix-datagram
 *   "service_name": "tcp-echo",        // LISTEN_FDNAMES lookup key
 *   "bind": "127.0.0.1:8080",          // or "unix:/run/echo.sock"
 *   "inherit": "auto",                 // auto | never | always
 *   "inherit_fd": 3,                   // required for "always"
 *   "buffer_size": 1024,
 *   "read_timeout_ms": 30000,
 *   "write_timeout_ms": 30000,
 *   "max_connections": 100
 * }
 *
 * Every field is optional. Unknown fields are ignored. Malformed values
 * throw ConfigError.
 */
struct EchoConfig {
  network::Protocol protocol{network::Protocol::Tcp};
  server::ServerConfig server;
};

EchoConfig ParseServerConfig(const std::string &json_text);
EchoConfig LoadServerConfig(const std::string &path);

/**
 * Build a bind strategy from an inheritance mode
 *   never  -> Bind(bind)
 *   always -> Inherit(fd), fd required
 *   auto   -> InheritOrBind(fd, bind)
 */
network::BindStrategy MakeBindStrategy(const std::string &mode, std::optional<int> fd,
                                       const network::Address &bind);

} // namespace config
} // namespace echosrv

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "config/config_loader.hpp"
#include "util/errors.hpp"
#include "util/logging.hpp"
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>
#include <sstream>

namespace echosrv {
namespace config {

using json = nlohmann::json;

namespace {

std::optional<std::string> GetString(const json &root, const char *key) {
  if (!root.contains(key)) {
    return std::nullopt;
  }
  const json &value = root[key];
  if (!value.is_string()) {
    throw ConfigError(std::string("'") + key + "' must be a string");
  }
  return value.get<std::string>();
}

std::optional<uint64_t> GetUnsigned(const json &root, const char *key, uint64_t max) {
  if (!root.contains(key)) {
    return std::nullopt;
  }
  const json &value = root[key];
  if (!value.is_number_unsigned()) {
    throw ConfigError(std::string("'") + key + "' must be a non-negative integer");
  }
  uint64_t n = value.get<uint64_t>();
  if (n > max) {
    throw ConfigError(std::string("'") + key + "' is out of range (max " +
                      std::to_string(max) + ")");
  }
  return n;
}

} // namespace

network::BindStrategy MakeBindStrategy(const std::string &mode, std::optional<int> fd,
                                       const network::Address &bind) {
  if (mode == "never") {
    return network::BindStrategy::Bind(bind);
  }
  if (mode == "always") {
    if (!fd) {
      throw ConfigError("inherit mode 'always' requires a descriptor");
    }
    return network::BindStrategy::Inherit(*fd);
  }
  if (mode == "auto") {
    return network::BindStrategy::InheritOrBind(fd, bind);
  }
  throw ConfigError("unknown inherit mode '" + mode + "' (expected auto, never or always)");
}

EchoConfig ParseServerConfig(const std::string &json_text) {
  json root;
  try {
    root = json::parse(json_text);
  } catch (const json::exception &e) {
    throw ConfigError(std::string("invalid JSON: ") + e.what());
  }
  if (!root.is_object()) {
    throw ConfigError("configuration must be a JSON object");
  }

  EchoConfig config;

  if (auto name = GetString(root, "protocol")) {
    auto protocol = network::ParseProtocol(*name);
    if (!protocol) {
      throw ConfigError("unknown protocol '" + *name + "'");
    }
    config.protocol = *protocol;
  }

  auto &server = config.server;
  server.service_name = GetString(root, "service_name")
                            .value_or(std::string(network::ProtocolName(config.protocol)) + "-echo");

  network::Address bind = network::DefaultBindAddress(config.protocol);
  if (auto text = GetString(root, "bind")) {
    auto parsed = network::Address::Parse(*text);
    if (!parsed) {
      throw ConfigError("malformed bind address '" + *text + "'");
    }
    bind = *parsed;
  }

  std::optional<int> fd;
  if (auto value = GetUnsigned(root, "inherit_fd", std::numeric_limits<int>::max())) {
    fd = static_cast<int>(*value);
  }
  server.bind_strategy = MakeBindStrategy(GetString(root, "inherit").value_or("auto"), fd, bind);

  if (auto value = GetUnsigned(root, "buffer_size", 64 * 1024 * 1024)) {
    if (*value == 0) {
      throw ConfigError("'buffer_size' must be greater than zero");
    }
    server.buffer_size = *value;
  }
  constexpr uint64_t kMaxTimeoutMs = 24ULL * 60 * 60 * 1000;
  if (auto value = GetUnsigned(root, "read_timeout_ms", kMaxTimeoutMs)) {
    if (*value == 0) {
      throw ConfigError("'read_timeout_ms' must be greater than zero");
    }
    server.read_timeout = std::chrono::milliseconds(*value);
  }
  if (auto value = GetUnsigned(root, "write_timeout_ms", kMaxTimeoutMs)) {
    if (*value == 0) {
      throw ConfigError("'write_timeout_ms' must be greater than zero");
    }
    server.write_timeout = std::chrono::milliseconds(*value);
  }
  if (auto value = GetUnsigned(root, "max_connections", std::numeric_limits<uint32_t>::max())) {
    server.max_connections = *value;
  }

  return config;
}

EchoConfig LoadServerConfig(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw ConfigError("cannot open config file " + path);
  }
  std::stringstream contents;
  contents << file.rdbuf();

  try {
    auto config = ParseServerConfig(contents.str());
    LOG_APP_INFO("loaded {} configuration from {}", network::ProtocolName(config.protocol), path);
    return config;
  } catch (const ConfigError &e) {
    throw ConfigError(path + ": " + e.what());
  }
}

} // namespace config
} // namespace echosrv

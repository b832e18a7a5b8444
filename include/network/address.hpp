// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <boost/asio/ip/address.hpp>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace echosrv {
namespace network {

/**
 * Address - where a socket is bound or where a peer lives
 *
 * Either a network endpoint (IP address + port) or a filesystem path for
 * Unix-domain sockets. Immutable once constructed.
 *
 * Textual forms accepted by Parse() and produced by ToString():
 *   127.0.0.1:8080
 *   [::1]:8080
 *   unix:/run/echo.sock
 *
 * Host names are not resolved; only numeric addresses are accepted.
 * An unbound Unix-domain peer is represented as a Unix address with an
 * empty path.
 */
class Address {
public:
  struct NetworkEndpoint {
    boost::asio::ip::address ip;
    uint16_t port{0};

    bool operator==(const NetworkEndpoint &other) const = default;
  };

  static Address Network(const boost::asio::ip::address &ip, uint16_t port);
  static Address Unix(const std::filesystem::path &path);

  // Returns std::nullopt on malformed input
  static std::optional<Address> Parse(const std::string &text);

  bool is_network() const { return std::holds_alternative<NetworkEndpoint>(value_); }
  bool is_unix() const { return std::holds_alternative<std::filesystem::path>(value_); }

  // Precondition: is_network()
  const boost::asio::ip::address &ip() const;
  uint16_t port() const;

  // Precondition: is_unix()
  const std::filesystem::path &path() const;

  std::string ToString() const;

  bool operator==(const Address &other) const = default;

private:
  explicit Address(std::variant<NetworkEndpoint, std::filesystem::path> value)
      : value_(std::move(value)) {}

  std::variant<NetworkEndpoint, std::filesystem::path> value_;
};

// A bind target is simply the address a fresh socket gets bound to
using BindTarget = Address;

} // namespace network
} // namespace echosrv

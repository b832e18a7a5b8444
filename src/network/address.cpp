// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/address.hpp"
#include "util/string_parsing.hpp"

namespace echosrv {
namespace network {

static constexpr const char *kUnixPrefix = "unix:";

Address Address::Network(const boost::asio::ip::address &ip, uint16_t port) {
  return Address(NetworkEndpoint{ip, port});
}

Address Address::Unix(const std::filesystem::path &path) {
  return Address(path);
}

std::optional<Address> Address::Parse(const std::string &text) {
  if (text.rfind(kUnixPrefix, 0) == 0) {
    std::string path = text.substr(std::char_traits<char>::length(kUnixPrefix));
    if (path.empty()) {
      return std::nullopt;
    }
    return Unix(path);
  }

  std::string host;
  std::string port_str;
  if (!text.empty() && text[0] == '[') {
    // [v6]:port
    size_t close = text.find("]:");
    if (close == std::string::npos) {
      return std::nullopt;
    }
    host = text.substr(1, close - 1);
    port_str = text.substr(close + 2);
  } else {
    size_t colon = text.rfind(':');
    if (colon == std::string::npos || colon == 0) {
      return std::nullopt;
    }
    host = text.substr(0, colon);
    port_str = text.substr(colon + 1);
    // Unbracketed IPv6 is ambiguous
    if (host.find(':') != std::string::npos) {
      return std::nullopt;
    }
  }

  auto port = util::SafeParsePort(port_str);
  if (!port) {
    return std::nullopt;
  }

  boost::system::error_code ec;
  auto ip = boost::asio::ip::make_address(host, ec);
  if (ec) {
    return std::nullopt;
  }
  if (text[0] == '[' && !ip.is_v6()) {
    return std::nullopt;
  }
  return Network(ip, *port);
}

const boost::asio::ip::address &Address::ip() const {
  return std::get<NetworkEndpoint>(value_).ip;
}

uint16_t Address::port() const {
  return std::get<NetworkEndpoint>(value_).port;
}

const std::filesystem::path &Address::path() const {
  return std::get<std::filesystem::path>(value_);
}

std::string Address::ToString() const {
  if (is_unix()) {
    return std::string(kUnixPrefix) + path().string();
  }
  const auto &ep = std::get<NetworkEndpoint>(value_);
  if (ep.ip.is_v6()) {
    return "[" + ep.ip.to_string() + "]:" + std::to_string(ep.port);
  }
  return ep.ip.to_string() + ":" + std::to_string(ep.port);
}

} // namespace network
} // namespace echosrv

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/transport_factory.hpp"
#include "network/real_transport.hpp"
#include "util/errors.hpp"
#include <boost/asio/ip/address_v4.hpp>

namespace echosrv {
namespace network {

std::optional<Protocol> ParseProtocol(const std::string &name) {
  if (name == "tcp") return Protocol::Tcp;
  if (name == "udp") return Protocol::Udp;
  if (name == "unix-stream" || name == "unix") return Protocol::UnixStream;
  if (name == "unix-datagram") return Protocol::UnixDatagram;
  return std::nullopt;
}

const char *ProtocolName(Protocol protocol) {
  switch (protocol) {
  case Protocol::Tcp:
    return "tcp";
  case Protocol::Udp:
    return "udp";
  case Protocol::UnixStream:
    return "unix-stream";
  case Protocol::UnixDatagram:
    return "unix-datagram";
  }
  return "unknown";
}

bool IsStreamProtocol(Protocol protocol) {
  return protocol == Protocol::Tcp || protocol == Protocol::UnixStream;
}

Address DefaultBindAddress(Protocol protocol) {
  switch (protocol) {
  case Protocol::UnixStream:
    return Address::Unix("/tmp/echosrv.sock");
  case Protocol::UnixDatagram:
    return Address::Unix("/tmp/echosrv_datagram.sock");
  case Protocol::Tcp:
  case Protocol::Udp:
    break;
  }
  return Address::Network(boost::asio::ip::address_v4::loopback(), 8080);
}

std::shared_ptr<StreamTransport> MakeStreamTransport(Protocol protocol) {
  switch (protocol) {
  case Protocol::Tcp:
    return std::make_shared<TcpTransport>();
  case Protocol::UnixStream:
    return std::make_shared<UnixStreamTransport>();
  default:
    throw ConfigError(std::string(ProtocolName(protocol)) + " is not a stream protocol");
  }
}

std::shared_ptr<DatagramTransport> MakeDatagramTransport(Protocol protocol) {
  switch (protocol) {
  case Protocol::Udp:
    return std::make_shared<UdpTransport>();
  case Protocol::UnixDatagram:
    return std::make_shared<UnixDatagramTransport>();
  default:
    throw ConfigError(std::string(ProtocolName(protocol)) + " is not a datagram protocol");
  }
}

} // namespace network
} // namespace echosrv

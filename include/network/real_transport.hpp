// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/transport.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/local/datagram_protocol.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <memory>
#include <string>
#include <vector>

namespace echosrv {
namespace network {

namespace detail {

/**
 * AsioStreamTransport - boost::asio implementation of StreamTransport
 *
 * Shared by every connection-oriented protocol asio provides. Member
 * definitions live in real_transport.cpp and are explicitly instantiated
 * for ip::tcp and local::stream_protocol.
 */
template <typename Protocol>
class AsioStreamTransport : public StreamTransport {
public:
  AsioStreamTransport(std::string name, std::vector<int> families)
      : name_(std::move(name)), families_(std::move(families)) {}

  std::string name() const override { return name_; }
  std::vector<int> accepted_families() const override { return families_; }

  std::unique_ptr<StreamListener>
  bind_with_inheritance(boost::asio::io_context &io_context, const server::ServerConfig &config,
                        const InheritanceConfig &inheritance) override;

  void async_connect(boost::asio::io_context &io_context, const Address &address,
                     std::chrono::milliseconds timeout, ConnectHandler handler) override;

private:
  std::string name_;
  std::vector<int> families_;
};

/**
 * AsioDatagramTransport - boost::asio implementation of DatagramTransport
 *
 * Explicitly instantiated for ip::udp and local::datagram_protocol.
 */
template <typename Protocol>
class AsioDatagramTransport : public DatagramTransport {
public:
  AsioDatagramTransport(std::string name, std::vector<int> families)
      : name_(std::move(name)), families_(std::move(families)) {}

  std::string name() const override { return name_; }
  std::vector<int> accepted_families() const override { return families_; }

  std::unique_ptr<DatagramSocket>
  bind_with_inheritance(boost::asio::io_context &io_context, const server::ServerConfig &config,
                        const InheritanceConfig &inheritance) override;

  std::unique_ptr<DatagramSocket> open_client(boost::asio::io_context &io_context,
                                              const Address &server) override;

private:
  std::string name_;
  std::vector<int> families_;
};

extern template class AsioStreamTransport<boost::asio::ip::tcp>;
extern template class AsioStreamTransport<boost::asio::local::stream_protocol>;
extern template class AsioDatagramTransport<boost::asio::ip::udp>;
extern template class AsioDatagramTransport<boost::asio::local::datagram_protocol>;

} // namespace detail

// TCP over IPv4/IPv6; listeners set SO_REUSEADDR
class TcpTransport final : public detail::AsioStreamTransport<boost::asio::ip::tcp> {
public:
  TcpTransport();
};

// UDP over IPv4/IPv6
class UdpTransport final : public detail::AsioDatagramTransport<boost::asio::ip::udp> {
public:
  UdpTransport();
};

/**
 * Unix-domain stream sockets
 *
 * Binding creates missing parent directories. An existing file at the
 * socket path is never removed: the bind fails with BindError instead.
 * A listener removes the socket file it created when closed.
 */
class UnixStreamTransport final
    : public detail::AsioStreamTransport<boost::asio::local::stream_protocol> {
public:
  UnixStreamTransport();
};

/**
 * Unix-domain datagram sockets
 *
 * Same path rules as UnixStreamTransport. Client sockets are bound to a
 * unique path in the temp directory so the server can reply; the path is
 * removed when the client socket closes.
 */
class UnixDatagramTransport final
    : public detail::AsioDatagramTransport<boost::asio::local::datagram_protocol> {
public:
  UnixDatagramTransport();
};

} // namespace network
} // namespace echosrv

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/address.hpp"
#include "network/inheritance.hpp"
#include "server/server_config.hpp"
#include <boost/asio/buffer.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace echosrv {
namespace network {

// Abstract transport interfaces
// The server and client engines are written only against these, so the same
// engine drives every implementation:
// - TcpTransport / UdpTransport: IPv4/IPv6 sockets via boost::asio
// - UnixStreamTransport / UnixDatagramTransport: Unix-domain sockets

// Completion conventions (all handlers run on the io_context thread):
// - A deadline that expires reports boost::asio::error::timed_out
// - Orderly peer close on a stream reports boost::asio::error::eof
// - A zero timeout means no deadline

class StreamConnection;
class DatagramSocket;

using IoHandler = std::function<void(const boost::system::error_code &ec, size_t bytes)>;
using AcceptHandler = std::function<void(const boost::system::error_code &ec,
                                         std::unique_ptr<StreamConnection> connection)>;
using ConnectHandler = std::function<void(const boost::system::error_code &ec,
                                          std::unique_ptr<StreamConnection> connection)>;
// sender is unset on error, and when the peer has no address to reply to
// (an unbound Unix-domain datagram socket)
using ReceiveHandler = std::function<void(const boost::system::error_code &ec, size_t bytes,
                                          const std::optional<Address> &sender)>;

// StreamConnection - one established byte stream
// Owned by exactly one session; destroying it closes the socket.
class StreamConnection {
public:
  virtual ~StreamConnection() = default;

  // Read at most buffer.size() bytes
  virtual void async_read_some(boost::asio::mutable_buffer buffer,
                               std::chrono::milliseconds timeout, IoHandler handler) = 0;

  // Write the whole buffer (handler sees the total on success)
  virtual void async_write(boost::asio::const_buffer buffer, std::chrono::milliseconds timeout,
                           IoHandler handler) = 0;

  // Kernel sockets keep no user-space buffer: succeeds unless closed
  virtual boost::system::error_code flush() = 0;

  virtual void close() = 0;
  virtual bool is_open() const = 0;

  virtual Address remote_address() const = 0;
};

// StreamListener - bound, listening stream socket
class StreamListener {
public:
  virtual ~StreamListener() = default;

  // The peer address is available from connection->remote_address().
  // A zero timeout waits indefinitely.
  virtual void async_accept(std::chrono::milliseconds timeout, AcceptHandler handler) = 0;

  // Pending accepts complete with operation_aborted
  virtual void close() = 0;

  virtual Address local_address() const = 0;
};

// DatagramSocket - one bound datagram socket (server side or client side)
class DatagramSocket {
public:
  virtual ~DatagramSocket() = default;

  virtual void async_receive_from(boost::asio::mutable_buffer buffer,
                                  std::chrono::milliseconds timeout,
                                  ReceiveHandler handler) = 0;

  virtual void async_send_to(boost::asio::const_buffer buffer, const Address &destination,
                             std::chrono::milliseconds timeout, IoHandler handler) = 0;

  virtual void close() = 0;

  virtual Address local_address() const = 0;
};

// StreamTransport - factory for listeners and outbound connections
class StreamTransport {
public:
  virtual ~StreamTransport() = default;

  virtual std::string name() const = 0;

  // AF_* families this transport can serve (inherited fds are checked against these)
  virtual std::vector<int> accepted_families() const = 0;

  // Bind using descriptors inherited through the process environment.
  // Throws BindError, FdInheritanceError or ConfigError.
  std::unique_ptr<StreamListener> bind(boost::asio::io_context &io_context,
                                       const server::ServerConfig &config) {
    return bind_with_inheritance(io_context, config, InheritanceConfig::FromEnvironment());
  }

  virtual std::unique_ptr<StreamListener>
  bind_with_inheritance(boost::asio::io_context &io_context, const server::ServerConfig &config,
                        const InheritanceConfig &inheritance) = 0;

  virtual void async_connect(boost::asio::io_context &io_context, const Address &address,
                             std::chrono::milliseconds timeout, ConnectHandler handler) = 0;
};

// DatagramTransport - factory for server and client datagram sockets
class DatagramTransport {
public:
  virtual ~DatagramTransport() = default;

  virtual std::string name() const = 0;

  virtual std::vector<int> accepted_families() const = 0;

  std::unique_ptr<DatagramSocket> bind(boost::asio::io_context &io_context,
                                       const server::ServerConfig &config) {
    return bind_with_inheritance(io_context, config, InheritanceConfig::FromEnvironment());
  }

  virtual std::unique_ptr<DatagramSocket>
  bind_with_inheritance(boost::asio::io_context &io_context, const server::ServerConfig &config,
                        const InheritanceConfig &inheritance) = 0;

  // Ephemeral socket able to exchange datagrams with server
  // Throws IoError or ConfigError.
  virtual std::unique_ptr<DatagramSocket> open_client(boost::asio::io_context &io_context,
                                                      const Address &server) = 0;
};

} // namespace network
} // namespace echosrv

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/address.hpp"
#include "network/transport.hpp"
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace echosrv {
namespace client {

struct ClientConfig {
  std::chrono::milliseconds read_timeout{std::chrono::seconds(30)};
  std::chrono::milliseconds write_timeout{std::chrono::seconds(30)};
  std::chrono::milliseconds connect_timeout{std::chrono::seconds(10)};
  size_t buffer_size{1024};
  size_t max_response_size{10 * 1024 * 1024};
};

/**
 * StreamClient - blocking echo client for connection-oriented transports
 *
 * Each call runs a private io_context until the operation completes, so
 * the client needs no threads of its own and every call is bounded by its
 * deadline. Not thread-safe; use one client per thread.
 *
 * Errors are thrown: TimeoutError, IoError, TooLargeError, ConfigError.
 */
class StreamClient {
public:
  static StreamClient Connect(std::shared_ptr<network::StreamTransport> transport,
                              const network::Address &address, ClientConfig config = {});

  StreamClient(StreamClient &&) = default;
  StreamClient &operator=(StreamClient &&) = default;
  ~StreamClient();

  /**
   * Send data and collect the echo
   *
   * Reading stops once at least data.size() bytes have arrived, or at end
   * of stream. A read deadline that expires before that point is a
   * TimeoutError. Responses larger than max_response_size raise
   * TooLargeError and are never truncated.
   *
   * An empty request returns an empty response without touching the
   * connection.
   */
  std::vector<uint8_t> Request(const std::vector<uint8_t> &data);
  std::string RequestString(const std::string &data);

  // True when no request completed within max_idle
  bool IsIdle(std::chrono::milliseconds max_idle) const;

  void Close();

  const network::Address &remote_address() const { return remote_; }

private:
  StreamClient(std::unique_ptr<boost::asio::io_context> io_context,
               std::unique_ptr<network::StreamConnection> connection, network::Address remote,
               ClientConfig config);

  std::unique_ptr<boost::asio::io_context> io_context_;
  std::unique_ptr<network::StreamConnection> connection_;
  network::Address remote_;
  ClientConfig config_;
  std::chrono::steady_clock::time_point last_activity_;
};

/**
 * DatagramClient - blocking echo client for connectionless transports
 *
 * One request is one datagram; the reply is the next datagram received
 * within read_timeout.
 */
class DatagramClient {
public:
  static DatagramClient Connect(std::shared_ptr<network::DatagramTransport> transport,
                                const network::Address &server, ClientConfig config = {});

  DatagramClient(DatagramClient &&) = default;
  DatagramClient &operator=(DatagramClient &&) = default;
  ~DatagramClient();

  std::vector<uint8_t> Request(const std::vector<uint8_t> &data);
  std::string RequestString(const std::string &data);

  void Close();

  network::Address local_address() const { return socket_->local_address(); }

private:
  DatagramClient(std::unique_ptr<boost::asio::io_context> io_context,
                 std::unique_ptr<network::DatagramSocket> socket, network::Address server,
                 ClientConfig config);

  std::unique_ptr<boost::asio::io_context> io_context_;
  std::unique_ptr<network::DatagramSocket> socket_;
  network::Address server_;
  ClientConfig config_;
};

} // namespace client
} // namespace echosrv

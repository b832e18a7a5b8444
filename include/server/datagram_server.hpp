// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/transport.hpp"
#include "server/server_config.hpp"
#include "server/server_stats.hpp"
#include "server/shutdown_signal.hpp"
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace echosrv {
namespace server {

/**
 * DatagramServer - echo engine for connectionless transports
 *
 * One receive loop on one socket: each datagram is sent back to the
 * address it came from before the next receive starts. No per-peer state
 * and no admission limit (max_connections is ignored).
 *
 * Receive timeouts are logged as warnings and the loop keeps going;
 * receive and send errors are logged and the loop keeps going. A datagram
 * from a sender with no address (unbound Unix-domain socket) is dropped.
 *
 * Same lifecycle as StreamServer: start(), wait(), join().
 */
class DatagramServer {
public:
  DatagramServer(std::shared_ptr<network::DatagramTransport> transport, ServerConfig config);
  ~DatagramServer();

  DatagramServer(const DatagramServer &) = delete;
  DatagramServer &operator=(const DatagramServer &) = delete;

  void start();
  void start(const network::InheritanceConfig &inheritance);

  void run();
  void wait();
  void join();

  ShutdownSignal &shutdown_signal() { return shutdown_; }

  bool is_running() const { return receiving_.load(); }
  ServerStats stats() const { return stats_.Snapshot(); }

  const std::optional<network::Address> &local_address() const { return local_address_; }

private:
  void do_receive();
  void handle_receive(const boost::system::error_code &ec, size_t bytes,
                      const std::optional<network::Address> &sender);
  void stop_receiving();

  std::shared_ptr<network::DatagramTransport> transport_;
  const ServerConfig config_;

  StatsCounters stats_;
  ShutdownSignal shutdown_;
  ShutdownSignal receive_loop_done_;

  std::unique_ptr<boost::asio::io_context> io_context_;
  std::unique_ptr<network::DatagramSocket> socket_;
  std::unique_ptr<boost::asio::signal_set> signals_;
  ShutdownSignal::Subscription shutdown_subscription_;
  std::thread io_thread_;

  // Single receive/send in flight; only touched on the io thread
  std::vector<uint8_t> buffer_;

  std::atomic<bool> started_{false};
  std::atomic<bool> receiving_{false};
  std::optional<network::Address> local_address_;
};

} // namespace server
} // namespace echosrv

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/transport.hpp"
#include "server/connection_counter.hpp"
#include "server/server_config.hpp"
#include "server/server_stats.hpp"
#include "server/shutdown_signal.hpp"
#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <memory>
#include <optional>
#include <thread>

namespace echosrv {
namespace server {

/**
 * StreamServer - echo engine for connection-oriented transports
 *
 * Owns one io_context driven by a single io thread. Every accepted
 * connection becomes a session that loops read -> write until the peer
 * closes, a deadline expires or an I/O error occurs.
 *
 * Admission: a connection that would exceed max_connections is closed
 * right after accept, without reading or writing anything.
 *
 * Shutdown (ShutdownSignal, or SIGINT/SIGTERM with handle_interrupt):
 * the listener closes and no new connection is accepted. Sessions already
 * running are left alone and end on their own; join() waits for them.
 *
 * Lifecycle:
 *   StreamServer server(transport, config);
 *   server.start();                       // throws on bind failure
 *   server.shutdown_signal().Fire();      // from any thread
 *   server.wait();                        // accept loop has stopped
 *   server.join();                        // every session has ended
 */
class StreamServer {
public:
  StreamServer(std::shared_ptr<network::StreamTransport> transport, ServerConfig config);
  ~StreamServer();

  StreamServer(const StreamServer &) = delete;
  StreamServer &operator=(const StreamServer &) = delete;

  // Bind (inheriting from the process environment) and start serving
  void start();
  void start(const network::InheritanceConfig &inheritance);

  // start() then wait()
  void run();

  // Block until the accept loop has stopped
  void wait();

  // Block until the io thread has finished (all sessions drained)
  void join();

  ShutdownSignal &shutdown_signal() { return shutdown_; }

  bool is_running() const { return accepting_.load(); }
  size_t active_connections() const { return counter_.current(); }
  size_t peak_connections() const { return counter_.peak(); }
  ServerStats stats() const { return stats_.Snapshot(); }

  // Valid after start()
  const std::optional<network::Address> &local_address() const { return local_address_; }

private:
  void start_accept();
  void handle_accept(const boost::system::error_code &ec,
                     std::unique_ptr<network::StreamConnection> connection);
  void stop_accepting();

  std::shared_ptr<network::StreamTransport> transport_;
  const ServerConfig config_;

  // Declared before io_context_: sessions destroyed with the io_context
  // still release their slots into counter_
  ConnectionCounter counter_;
  StatsCounters stats_;
  ShutdownSignal shutdown_;
  ShutdownSignal accept_loop_done_;

  std::unique_ptr<boost::asio::io_context> io_context_;
  std::unique_ptr<network::StreamListener> listener_;
  std::unique_ptr<boost::asio::signal_set> signals_;
  ShutdownSignal::Subscription shutdown_subscription_;
  std::thread io_thread_;

  std::atomic<bool> started_{false};
  std::atomic<bool> accepting_{false};
  std::atomic<uint64_t> next_session_id_{1};
  std::optional<network::Address> local_address_;
};

} // namespace server
} // namespace echosrv

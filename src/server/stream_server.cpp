// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "server/stream_server.hpp"
#include "util/errors.hpp"
#include "util/logging.hpp"
#include <boost/asio/post.hpp>
#include <csignal>
#include <stdexcept>
#include <vector>

namespace echosrv {
namespace server {

namespace {

/**
 * StreamSession - one accepted connection
 *
 * Reading -> Echoing -> Reading ... -> Closed
 *
 * Kept alive by the completion handler of its pending operation; when the
 * loop ends no handler holds it any more and the destructor releases the
 * admission slot and closes the connection.
 */
class StreamSession : public std::enable_shared_from_this<StreamSession> {
public:
  StreamSession(uint64_t id, std::unique_ptr<network::StreamConnection> connection,
                ServerConfig config, ConnectionCounter::Slot slot, StatsCounters &stats)
      : id_(id), connection_(std::move(connection)), config_(std::move(config)),
        slot_(std::move(slot)), stats_(stats), peer_(connection_->remote_address().ToString()),
        buffer_(config_.buffer_size) {}

  void start() { do_read(); }

private:
  void do_read() {
    connection_->async_read_some(
        boost::asio::buffer(buffer_), config_.read_timeout,
        [self = shared_from_this()](const boost::system::error_code &ec, size_t bytes) {
          self->on_read(ec, bytes);
        });
  }

  void on_read(const boost::system::error_code &ec, size_t bytes) {
    if (ec) {
      finish(ec, "read");
      return;
    }
    if (bytes == 0) {
      finish(boost::asio::error::eof, "read");
      return;
    }
    bytes_echoed_ += bytes;
    connection_->async_write(
        boost::asio::buffer(buffer_.data(), bytes), config_.write_timeout,
        [self = shared_from_this()](const boost::system::error_code &ec, size_t) {
          if (ec) {
            self->finish(ec, "write");
            return;
          }
          self->do_read();
        });
  }

  void finish(const boost::system::error_code &ec, const char *op) {
    stats_.closed.fetch_add(1, std::memory_order_relaxed);
    switch (ClassifyError(ec)) {
    case ErrorKind::Timeout:
      stats_.timeouts.fetch_add(1, std::memory_order_relaxed);
      LOG_SERVER_WARN("connection {} from {} {} timed out, closing", id_, peer_, op);
      break;
    default:
      if (ec == boost::asio::error::eof || ec == boost::asio::error::connection_reset) {
        LOG_SERVER_INFO("connection {} from {} closed ({} bytes echoed)", id_, peer_,
                        bytes_echoed_);
      } else if (ec == boost::asio::error::operation_aborted) {
        LOG_SERVER_DEBUG("connection {} from {} aborted", id_, peer_);
      } else {
        stats_.io_errors.fetch_add(1, std::memory_order_relaxed);
        LOG_SERVER_ERROR("connection {} from {} {} failed: {}", id_, peer_, op, ec.message());
      }
      break;
    }
    connection_->close();
  }

  const uint64_t id_;
  std::unique_ptr<network::StreamConnection> connection_;
  const ServerConfig config_;
  ConnectionCounter::Slot slot_;
  StatsCounters &stats_;
  const std::string peer_;
  std::vector<uint8_t> buffer_;
  uint64_t bytes_echoed_{0};
};

} // namespace

StreamServer::StreamServer(std::shared_ptr<network::StreamTransport> transport,
                           ServerConfig config)
    : transport_(std::move(transport)), config_(std::move(config)),
      io_context_(std::make_unique<boost::asio::io_context>()) {
  if (!transport_) {
    throw ConfigError("stream server requires a transport");
  }
  if (config_.buffer_size == 0) {
    throw ConfigError("buffer size must be greater than zero");
  }
  if (config_.read_timeout <= std::chrono::milliseconds::zero() ||
      config_.write_timeout <= std::chrono::milliseconds::zero()) {
    throw ConfigError("read and write timeouts must be greater than zero");
  }
}

StreamServer::~StreamServer() {
  // Don't log here - logger may already be shut down
  shutdown_subscription_.Unsubscribe();
  if (io_context_) {
    io_context_->stop();
  }
  if (io_thread_.joinable()) {
    io_thread_.join();
  }
  // Sockets before the io_context they are registered with
  listener_.reset();
  signals_.reset();
  io_context_.reset();
}

void StreamServer::start() { start(network::InheritanceConfig::FromEnvironment()); }

void StreamServer::start(const network::InheritanceConfig &inheritance) {
  if (started_.exchange(true)) {
    throw std::logic_error("stream server already started");
  }

  try {
    listener_ = transport_->bind_with_inheritance(*io_context_, config_, inheritance);
  } catch (const Error &e) {
    LOG_SERVER_ERROR("{} server failed to bind: {}", transport_->name(), e.what());
    throw;
  }
  local_address_ = listener_->local_address();
  accepting_ = true;

  if (config_.handle_interrupt) {
    signals_ = std::make_unique<boost::asio::signal_set>(*io_context_, SIGINT, SIGTERM);
    signals_->async_wait([this](const boost::system::error_code &ec, int signo) {
      if (ec) {
        return;
      }
      LOG_SERVER_INFO("received signal {}, shutting down", signo);
      shutdown_.Fire();
    });
  }

  // Runs on whichever thread fires the signal; hop onto the io thread
  shutdown_subscription_ = shutdown_.Subscribe([this]() {
    boost::asio::post(*io_context_, [this]() { stop_accepting(); });
  });

  start_accept();

  LOG_SERVER_INFO("{} echo server started on {} (max connections: {})", transport_->name(),
                  local_address_->ToString(), config_.max_connections);

  // No work guard: run() returns once the listener is closed and the last
  // session has ended
  io_thread_ = std::thread([this]() { io_context_->run(); });
}

void StreamServer::run() {
  start();
  wait();
}

void StreamServer::wait() { accept_loop_done_.Wait(); }

void StreamServer::join() {
  if (io_thread_.joinable()) {
    io_thread_.join();
  }
  LOG_SERVER_INFO("{} echo server stopped ({} connections served, {} rejected)",
                  transport_->name(), stats_.accepted.load(), stats_.rejected.load());
}

void StreamServer::start_accept() {
  // No accept deadline: the loop waits for a peer or for shutdown to close the listener
  listener_->async_accept(std::chrono::milliseconds(0),
                          [this](const boost::system::error_code &ec,
                                 std::unique_ptr<network::StreamConnection> connection) {
                            handle_accept(ec, std::move(connection));
                          });
}

void StreamServer::handle_accept(const boost::system::error_code &ec,
                                 std::unique_ptr<network::StreamConnection> connection) {
  if (!accepting_) {
    if (connection) {
      connection->close();
    }
    return;
  }

  if (ec) {
    if (ec == boost::asio::error::operation_aborted) {
      return;
    }
    stats_.accept_errors.fetch_add(1, std::memory_order_relaxed);
    LOG_SERVER_ERROR("accept error: {}", ec.message());
    // Continue accepting despite error
    start_accept();
    return;
  }

  auto slot = counter_.TryAcquire(config_.max_connections);
  if (!slot) {
    stats_.rejected.fetch_add(1, std::memory_order_relaxed);
    LOG_SERVER_WARN("connection rejected: limit reached ({} active, peer {})",
                    config_.max_connections, connection->remote_address().ToString());
    connection->close();
    start_accept();
    return;
  }

  stats_.accepted.fetch_add(1, std::memory_order_relaxed);
  uint64_t id = next_session_id_++;
  LOG_SERVER_INFO("connection {} from {} accepted ({} active)", id,
                  connection->remote_address().ToString(), counter_.current());

  auto session = std::make_shared<StreamSession>(id, std::move(connection), config_,
                                                 std::move(*slot), stats_);
  session->start();

  start_accept();
}

void StreamServer::stop_accepting() {
  if (!accepting_.exchange(false)) {
    return;
  }
  LOG_SERVER_INFO("shutdown initiated, closing listener on {} ({} connections still active)",
                  local_address_->ToString(), counter_.current());

  listener_->close();
  if (signals_) {
    boost::system::error_code ec;
    signals_->cancel(ec);
  }
  accept_loop_done_.Fire();
}

} // namespace server
} // namespace echosrv

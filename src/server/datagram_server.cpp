// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "server/datagram_server.hpp"
#include "util/errors.hpp"
#include "util/logging.hpp"
#include <boost/asio/post.hpp>
#include <csignal>
#include <stdexcept>

namespace echosrv {
namespace server {

DatagramServer::DatagramServer(std::shared_ptr<network::DatagramTransport> transport,
                               ServerConfig config)
    : transport_(std::move(transport)), config_(std::move(config)),
      io_context_(std::make_unique<boost::asio::io_context>()) {
  if (!transport_) {
    throw ConfigError("datagram server requires a transport");
  }
  if (config_.buffer_size == 0) {
    throw ConfigError("buffer size must be greater than zero");
  }
  if (config_.read_timeout <= std::chrono::milliseconds::zero() ||
      config_.write_timeout <= std::chrono::milliseconds::zero()) {
    throw ConfigError("read and write timeouts must be greater than zero");
  }
  buffer_.resize(config_.buffer_size);
}

DatagramServer::~DatagramServer() {
  shutdown_subscription_.Unsubscribe();
  if (io_context_) {
    io_context_->stop();
  }
  if (io_thread_.joinable()) {
    io_thread_.join();
  }
  socket_.reset();
  signals_.reset();
  io_context_.reset();
}

void DatagramServer::start() { start(network::InheritanceConfig::FromEnvironment()); }

void DatagramServer::start(const network::InheritanceConfig &inheritance) {
  if (started_.exchange(true)) {
    throw std::logic_error("datagram server already started");
  }

  try {
    socket_ = transport_->bind_with_inheritance(*io_context_, config_, inheritance);
  } catch (const Error &e) {
    LOG_SERVER_ERROR("{} server failed to bind: {}", transport_->name(), e.what());
    throw;
  }
  local_address_ = socket_->local_address();
  receiving_ = true;

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

  shutdown_subscription_ = shutdown_.Subscribe([this]() {
    boost::asio::post(*io_context_, [this]() { stop_receiving(); });
  });

  do_receive();

  LOG_SERVER_INFO("{} echo server started on {}", transport_->name(),
                  local_address_->ToString());

  io_thread_ = std::thread([this]() { io_context_->run(); });
}

void DatagramServer::run() {
  start();
  wait();
}

void DatagramServer::wait() { receive_loop_done_.Wait(); }

void DatagramServer::join() {
  if (io_thread_.joinable()) {
    io_thread_.join();
  }
  LOG_SERVER_INFO("{} echo server stopped ({} datagrams echoed)", transport_->name(),
                  stats_.datagrams_echoed.load());
}

void DatagramServer::do_receive() {
  socket_->async_receive_from(
      boost::asio::buffer(buffer_), config_.read_timeout,
      [this](const boost::system::error_code &ec, size_t bytes,
             const std::optional<network::Address> &sender) { handle_receive(ec, bytes, sender); });
}

void DatagramServer::handle_receive(const boost::system::error_code &ec, size_t bytes,
                                    const std::optional<network::Address> &sender) {
  if (!receiving_) {
    return;
  }

  if (ec) {
    if (ClassifyError(ec) == ErrorKind::Timeout) {
      stats_.timeouts.fetch_add(1, std::memory_order_relaxed);
      LOG_SERVER_WARN("no datagram within {} ms, still waiting", config_.read_timeout.count());
    } else {
      stats_.io_errors.fetch_add(1, std::memory_order_relaxed);
      LOG_SERVER_ERROR("receive error: {}", ec.message());
    }
    do_receive();
    return;
  }

  stats_.datagrams_received.fetch_add(1, std::memory_order_relaxed);

  if (!sender) {
    stats_.datagrams_dropped.fetch_add(1, std::memory_order_relaxed);
    LOG_SERVER_WARN("dropping {}-byte datagram from sender without a reply address", bytes);
    do_receive();
    return;
  }

  LOG_SERVER_DEBUG("received {} bytes from {}", bytes, sender->ToString());

  socket_->async_send_to(
      boost::asio::buffer(buffer_.data(), bytes), *sender, config_.write_timeout,
      [this, peer = *sender](const boost::system::error_code &send_ec, size_t) {
        if (!receiving_) {
          return;
        }
        if (send_ec) {
          if (ClassifyError(send_ec) == ErrorKind::Timeout) {
            stats_.timeouts.fetch_add(1, std::memory_order_relaxed);
            LOG_SERVER_WARN("send to {} timed out", peer.ToString());
          } else {
            stats_.io_errors.fetch_add(1, std::memory_order_relaxed);
            LOG_SERVER_ERROR("send to {} failed: {}", peer.ToString(), send_ec.message());
          }
        } else {
          stats_.datagrams_echoed.fetch_add(1, std::memory_order_relaxed);
        }
        do_receive();
      });
}

void DatagramServer::stop_receiving() {
  if (!receiving_.exchange(false)) {
    return;
  }
  LOG_SERVER_INFO("shutdown initiated, closing {} socket on {}", transport_->name(),
                  local_address_->ToString());
  socket_->close();
  if (signals_) {
    boost::system::error_code ec;
    signals_->cancel(ec);
  }
  receive_loop_done_.Fire();
}

} // namespace server
} // namespace echosrv

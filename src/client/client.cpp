// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "client/client.hpp"
#include "util/errors.hpp"
#include "util/logging.hpp"
#include <algorithm>

namespace echosrv {
namespace client {

namespace {

struct OpResult {
  boost::system::error_code ec;
  size_t bytes{0};
};

// Run the io_context until the started operation and its deadline timer
// have both completed
template <typename Start> OpResult RunOperation(boost::asio::io_context &io_context, Start start) {
  OpResult result;
  io_context.restart();
  start([&result](const boost::system::error_code &ec, size_t bytes) {
    result.ec = ec;
    result.bytes = bytes;
  });
  io_context.run();
  return result;
}

[[noreturn]] void ThrowFor(const boost::system::error_code &ec, const std::string &what) {
  if (ClassifyError(ec) == ErrorKind::Timeout) {
    throw TimeoutError(what + " timed out");
  }
  throw IoError(what + " failed: " + ec.message());
}

} // namespace

// ============================================================================
// StreamClient
// ============================================================================

StreamClient StreamClient::Connect(std::shared_ptr<network::StreamTransport> transport,
                                   const network::Address &address, ClientConfig config) {
  if (!transport) {
    throw ConfigError("stream client requires a transport");
  }
  if (config.buffer_size == 0) {
    throw ConfigError("buffer size must be greater than zero");
  }

  auto io_context = std::make_unique<boost::asio::io_context>();
  std::unique_ptr<network::StreamConnection> connection;
  boost::system::error_code result;

  transport->async_connect(*io_context, address, config.connect_timeout,
                           [&](const boost::system::error_code &ec,
                               std::unique_ptr<network::StreamConnection> conn) {
                             result = ec;
                             connection = std::move(conn);
                           });
  io_context->run();

  if (!result && !connection) {
    result = boost::asio::error::not_connected;
  }
  if (result) {
    ThrowFor(result, "connect to " + address.ToString());
  }

  LOG_CLIENT_DEBUG("connected to {} over {}", address.ToString(), transport->name());
  return StreamClient(std::move(io_context), std::move(connection), address, config);
}

StreamClient::StreamClient(std::unique_ptr<boost::asio::io_context> io_context,
                           std::unique_ptr<network::StreamConnection> connection,
                           network::Address remote, ClientConfig config)
    : io_context_(std::move(io_context)), connection_(std::move(connection)),
      remote_(std::move(remote)), config_(config),
      last_activity_(std::chrono::steady_clock::now()) {}

StreamClient::~StreamClient() {
  // Connection before the io_context it is registered with
  connection_.reset();
  io_context_.reset();
}

std::vector<uint8_t> StreamClient::Request(const std::vector<uint8_t> &data) {
  if (data.empty()) {
    return {};
  }
  if (!connection_) {
    throw IoError("connection to " + remote_.ToString() + " is closed");
  }
  if (data.size() > config_.max_response_size) {
    throw ConfigError("request of " + std::to_string(data.size()) +
                      " bytes exceeds max response size " +
                      std::to_string(config_.max_response_size));
  }

  last_activity_ = std::chrono::steady_clock::now();

  auto written = RunOperation(*io_context_, [&](network::IoHandler handler) {
    connection_->async_write(boost::asio::buffer(data), config_.write_timeout, std::move(handler));
  });
  if (written.ec) {
    ThrowFor(written.ec, "write to " + remote_.ToString());
  }
  if (auto ec = connection_->flush()) {
    ThrowFor(ec, "flush to " + remote_.ToString());
  }

  std::vector<uint8_t> response;
  std::vector<uint8_t> chunk(config_.buffer_size);

  // Echo semantics: the reply is complete once it is as long as the request
  while (response.size() < data.size()) {
    auto read = RunOperation(*io_context_, [&](network::IoHandler handler) {
      connection_->async_read_some(boost::asio::buffer(chunk), config_.read_timeout,
                                   std::move(handler));
    });

    if (read.ec == boost::asio::error::eof) {
      break;
    }
    if (read.ec) {
      ThrowFor(read.ec, "read from " + remote_.ToString() + " (" +
                            std::to_string(response.size()) + " of " +
                            std::to_string(data.size()) + " bytes received)");
    }
    if (read.bytes == 0) {
      break;
    }
    if (response.size() + read.bytes > config_.max_response_size) {
      throw TooLargeError("response from " + remote_.ToString() + " exceeds " +
                          std::to_string(config_.max_response_size) + " bytes");
    }
    response.insert(response.end(), chunk.begin(), chunk.begin() + read.bytes);
  }

  LOG_CLIENT_TRACE("request to {}: {} bytes sent, {} bytes received", remote_.ToString(),
                   data.size(), response.size());
  last_activity_ = std::chrono::steady_clock::now();
  return response;
}

std::string StreamClient::RequestString(const std::string &data) {
  auto response = Request(std::vector<uint8_t>(data.begin(), data.end()));
  return std::string(response.begin(), response.end());
}

bool StreamClient::IsIdle(std::chrono::milliseconds max_idle) const {
  return std::chrono::steady_clock::now() - last_activity_ > max_idle;
}

void StreamClient::Close() {
  if (connection_) {
    connection_->close();
  }
}

// ============================================================================
// DatagramClient
// ============================================================================

DatagramClient DatagramClient::Connect(std::shared_ptr<network::DatagramTransport> transport,
                                       const network::Address &server, ClientConfig config) {
  if (!transport) {
    throw ConfigError("datagram client requires a transport");
  }
  if (config.buffer_size == 0) {
    throw ConfigError("buffer size must be greater than zero");
  }

  auto io_context = std::make_unique<boost::asio::io_context>();
  auto socket = transport->open_client(*io_context, server);
  LOG_CLIENT_DEBUG("datagram client {} ready for {}", socket->local_address().ToString(),
                   server.ToString());
  return DatagramClient(std::move(io_context), std::move(socket), server, config);
}

DatagramClient::DatagramClient(std::unique_ptr<boost::asio::io_context> io_context,
                               std::unique_ptr<network::DatagramSocket> socket,
                               network::Address server, ClientConfig config)
    : io_context_(std::move(io_context)), socket_(std::move(socket)), server_(std::move(server)),
      config_(config) {}

DatagramClient::~DatagramClient() {
  socket_.reset();
  io_context_.reset();
}

std::vector<uint8_t> DatagramClient::Request(const std::vector<uint8_t> &data) {
  if (data.empty()) {
    return {};
  }
  if (!socket_) {
    throw IoError("datagram client is closed");
  }
  if (data.size() > config_.max_response_size) {
    throw ConfigError("request of " + std::to_string(data.size()) +
                      " bytes exceeds max response size " +
                      std::to_string(config_.max_response_size));
  }

  auto sent = RunOperation(*io_context_, [&](network::IoHandler handler) {
    socket_->async_send_to(boost::asio::buffer(data), server_, config_.write_timeout,
                           std::move(handler));
  });
  if (sent.ec) {
    ThrowFor(sent.ec, "send to " + server_.ToString());
  }

  // Large enough for the echo of this request
  std::vector<uint8_t> reply(std::min(std::max(config_.buffer_size, data.size()),
                                      config_.max_response_size));
  auto received = RunOperation(*io_context_, [&](network::IoHandler handler) {
    socket_->async_receive_from(
        boost::asio::buffer(reply), config_.read_timeout,
        [handler = std::move(handler)](const boost::system::error_code &ec, size_t bytes,
                                       const std::optional<network::Address> &) {
          handler(ec, bytes);
        });
  });
  if (received.ec) {
    ThrowFor(received.ec, "receive from " + server_.ToString());
  }

  reply.resize(received.bytes);
  return reply;
}

std::string DatagramClient::RequestString(const std::string &data) {
  auto response = Request(std::vector<uint8_t>(data.begin(), data.end()));
  return std::string(response.begin(), response.end());
}

void DatagramClient::Close() {
  if (socket_) {
    socket_->close();
  }
}

} // namespace client
} // namespace echosrv

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "application.hpp"
#include "util/errors.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <stdexcept>

namespace echosrv {
namespace app {

Application::Application(const AppConfig &config) : config_(config) {}

Application::~Application() {
  // Server destructors stop their io threads; sessions still running are cut off
  stream_server_.reset();
  datagram_server_.reset();
}

bool Application::initialize() {
  LOG_APP_INFO("Initializing {} ({})", GetFullVersionString(),
               network::ProtocolName(config_.protocol));

  try {
    if (network::IsStreamProtocol(config_.protocol)) {
      stream_server_ = std::make_unique<server::StreamServer>(
          network::MakeStreamTransport(config_.protocol), config_.server);
    } else {
      datagram_server_ = std::make_unique<server::DatagramServer>(
          network::MakeDatagramTransport(config_.protocol), config_.server);
    }
  } catch (const Error &e) {
    LOG_APP_ERROR("Invalid configuration: {}", e.what());
    return false;
  }

  LOG_APP_INFO("Bind strategy: {}, service name '{}'", config_.server.bind_strategy.ToString(),
               config_.server.service_name);
  return true;
}

bool Application::start() {
  if (running_) {
    LOG_APP_ERROR("Application already running");
    return false;
  }
  if (!stream_server_ && !datagram_server_) {
    LOG_APP_ERROR("Application not initialized");
    return false;
  }

  auto inheritance = config_.inheritance ? *config_.inheritance
                                         : network::InheritanceConfig::FromEnvironment(true);
  try {
    if (stream_server_) {
      stream_server_->start(inheritance);
    } else {
      datagram_server_->start(inheritance);
    }
  } catch (const Error &e) {
    LOG_APP_ERROR("Failed to start server ({} error): {}", ErrorKindName(e.kind()), e.what());
    return false;
  }

  running_ = true;
  return true;
}

void Application::stop() {
  if (!running_) {
    return;
  }
  shutdown_signal().Fire();
}

void Application::wait_for_shutdown() {
  if (!running_) {
    return;
  }

  if (stream_server_) {
    stream_server_->wait();
    LOG_APP_INFO("Waiting for {} active connection(s) to finish",
                 stream_server_->active_connections());
    stream_server_->join();
  } else {
    datagram_server_->wait();
    datagram_server_->join();
  }

  running_ = false;
  LOG_APP_INFO("Shutdown complete");
}

std::optional<network::Address> Application::local_address() const {
  if (stream_server_) {
    return stream_server_->local_address();
  }
  if (datagram_server_) {
    return datagram_server_->local_address();
  }
  return std::nullopt;
}

server::ShutdownSignal &Application::shutdown_signal() {
  if (stream_server_) {
    return stream_server_->shutdown_signal();
  }
  if (datagram_server_) {
    return datagram_server_->shutdown_signal();
  }
  throw std::logic_error("application not initialized");
}

} // namespace app
} // namespace echosrv

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/socket_provisioner.hpp"
#include "util/errors.hpp"
#include "util/logging.hpp"
#include <boost/asio/ip/address_v4.hpp>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/socket.h>

namespace echosrv {
namespace network {

namespace {

std::string LastOsError() {
  return std::strerror(errno);
}

} // namespace

const char *SocketTypeName(int socket_type) {
  switch (socket_type) {
  case SOCK_STREAM:
    return "SOCK_STREAM";
  case SOCK_DGRAM:
    return "SOCK_DGRAM";
  case SOCK_SEQPACKET:
    return "SOCK_SEQPACKET";
  default:
    return "unknown";
  }
}

const char *AddressFamilyName(int family) {
  switch (family) {
  case AF_INET:
    return "AF_INET";
  case AF_INET6:
    return "AF_INET6";
  case AF_UNIX:
    return "AF_UNIX";
  default:
    return "unknown";
  }
}

// ============================================================================
// BindStrategy
// ============================================================================

BindStrategy::BindStrategy()
    : BindStrategy(Kind::Bind, std::nullopt,
                   Address::Network(boost::asio::ip::address_v4::loopback(), 0)) {}

BindStrategy BindStrategy::Bind(const BindTarget &target) {
  return BindStrategy(Kind::Bind, std::nullopt, target);
}

BindStrategy BindStrategy::Inherit(int fd) {
  return BindStrategy(Kind::Inherit, fd, std::nullopt);
}

BindStrategy BindStrategy::InheritOrBind(std::optional<int> fd, const BindTarget &fallback) {
  return BindStrategy(Kind::InheritOrBind, fd, fallback);
}

std::string BindStrategy::ToString() const {
  switch (kind_) {
  case Kind::Bind:
    return "bind " + target_->ToString();
  case Kind::Inherit:
    return "inherit fd " + std::to_string(*fd_);
  case Kind::InheritOrBind:
    return "inherit " + (fd_ ? "fd " + std::to_string(*fd_) : std::string("by service name")) +
           " or bind " + target_->ToString();
  }
  return "unknown";
}

// ============================================================================
// SocketProvisioner
// ============================================================================

SocketProvisioner::SocketProvisioner(int socket_type, std::vector<int> families)
    : socket_type_(socket_type), families_(std::move(families)) {}

SocketSource SocketProvisioner::Resolve(const BindStrategy &strategy,
                                        const std::string &service_name,
                                        const InheritanceConfig &inheritance) {
  switch (strategy.kind()) {
  case BindStrategy::Kind::Bind:
    return SocketSource::Bind(*strategy.target());

  case BindStrategy::Kind::Inherit:
    return SocketSource::Inherit(*strategy.fd());

  case BindStrategy::Kind::InheritOrBind:
    if (strategy.fd()) {
      return SocketSource::Inherit(*strategy.fd());
    }
    if (inheritance.enabled()) {
      if (auto fd = inheritance.GetFd(service_name)) {
        return SocketSource::Inherit(*fd);
      }
    }
    return SocketSource::Bind(*strategy.target());
  }
  throw ConfigError("unknown bind strategy");
}

SocketSource SocketProvisioner::Plan(const BindStrategy &strategy,
                                     const std::string &service_name,
                                     const InheritanceConfig &inheritance) const {
  SocketSource source = Resolve(strategy, service_name, inheritance);
  if (!source.is_inherit()) {
    return source;
  }

  try {
    ValidateInheritedFd(*source.fd);
  } catch (const FdInheritanceError &e) {
    if (strategy.kind() != BindStrategy::Kind::InheritOrBind) {
      throw;
    }
    LOG_NET_WARN("inherited fd {} unusable ({}), falling back to {}", *source.fd, e.what(),
                 strategy.target()->ToString());
    return SocketSource::Bind(*strategy.target());
  }

  LOG_NET_DEBUG("using inherited fd {} for service '{}'", *source.fd, service_name);
  return source;
}

void SocketProvisioner::ValidateSocketType(int fd, int expected_type) {
  int type = 0;
  socklen_t len = sizeof(type);
  if (getsockopt(fd, SOL_SOCKET, SO_TYPE, &type, &len) != 0) {
    throw FdInheritanceError("failed to get socket type for fd " + std::to_string(fd) + ": " +
                             LastOsError());
  }
  if (type != expected_type) {
    throw FdInheritanceError("fd " + std::to_string(fd) + " has socket type " +
                             SocketTypeName(type) + ", expected " +
                             SocketTypeName(expected_type));
  }
}

void SocketProvisioner::ValidateSocketFamily(int fd, int expected_family) {
  sockaddr_storage addr{};
  socklen_t len = sizeof(addr);
  if (getsockname(fd, reinterpret_cast<sockaddr *>(&addr), &len) != 0) {
    throw FdInheritanceError("failed to get socket address for fd " + std::to_string(fd) +
                             ": " + LastOsError());
  }
  if (addr.ss_family != expected_family) {
    throw FdInheritanceError("fd " + std::to_string(fd) + " has address family " +
                             AddressFamilyName(addr.ss_family) + ", expected " +
                             AddressFamilyName(expected_family));
  }
}

void SocketProvisioner::ValidateInheritedFd(int fd) const {
  ValidateSocketType(fd, socket_type_);

  if (families_.empty()) {
    throw FdInheritanceError("no address families accepted for fd " + std::to_string(fd));
  }

  std::optional<FdInheritanceError> last_error;
  for (int family : families_) {
    try {
      ValidateSocketFamily(fd, family);
      return;
    } catch (const FdInheritanceError &e) {
      last_error = e;
    }
  }
  throw *last_error;
}

int SocketProvisioner::AdoptDescriptor(int fd) const {
  ValidateInheritedFd(fd);

  int flags = fcntl(fd, F_GETFL);
  if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
    throw FdInheritanceError("failed to set O_NONBLOCK on fd " + std::to_string(fd) + ": " +
                             LastOsError());
  }
  int fd_flags = fcntl(fd, F_GETFD);
  if (fd_flags < 0 || fcntl(fd, F_SETFD, fd_flags | FD_CLOEXEC) < 0) {
    throw FdInheritanceError("failed to set FD_CLOEXEC on fd " + std::to_string(fd) + ": " +
                             LastOsError());
  }

  sockaddr_storage addr{};
  socklen_t len = sizeof(addr);
  if (getsockname(fd, reinterpret_cast<sockaddr *>(&addr), &len) != 0) {
    throw FdInheritanceError("failed to get socket address for fd " + std::to_string(fd) +
                             ": " + LastOsError());
  }
  return addr.ss_family;
}

} // namespace network
} // namespace echosrv

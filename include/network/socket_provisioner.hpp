// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "network/address.hpp"
#include "network/inheritance.hpp"
#include <optional>
#include <string>
#include <vector>

namespace echosrv {
namespace network {

/**
 * BindStrategy - how a server obtains its listening socket
 *
 *   Bind(target)               always bind a fresh socket
 *   Inherit(fd)                always use the given descriptor, no fallback
 *   InheritOrBind(fd, target)  explicit fd, else the descriptor inherited
 *                              under the service name, else bind target
 */
class BindStrategy {
public:
  enum class Kind { Bind, Inherit, InheritOrBind };

  // Bind(127.0.0.1:0)
  BindStrategy();

  static BindStrategy Bind(const BindTarget &target);
  static BindStrategy Inherit(int fd);
  static BindStrategy InheritOrBind(std::optional<int> fd, const BindTarget &fallback);

  Kind kind() const { return kind_; }
  // Set for Inherit, optional for InheritOrBind
  std::optional<int> fd() const { return fd_; }
  // Bind target, or the fallback for InheritOrBind; unset for Inherit
  const std::optional<BindTarget> &target() const { return target_; }

  std::string ToString() const;

private:
  BindStrategy(Kind kind, std::optional<int> fd, std::optional<BindTarget> target)
      : kind_(kind), fd_(fd), target_(std::move(target)) {}

  Kind kind_;
  std::optional<int> fd_;
  std::optional<BindTarget> target_;
};

// Resolved origin of a socket: bind this target or adopt this descriptor
struct SocketSource {
  enum class Kind { Bind, Inherit };

  static SocketSource Bind(const BindTarget &target) { return {Kind::Bind, std::nullopt, target}; }
  static SocketSource Inherit(int fd) { return {Kind::Inherit, fd, std::nullopt}; }

  bool is_inherit() const { return kind == Kind::Inherit; }

  Kind kind;
  std::optional<int> fd;
  std::optional<BindTarget> target;
};

/**
 * SocketProvisioner - turns a BindStrategy into a usable socket source
 *
 * A provisioner is parameterized by the socket kind (SOCK_STREAM or
 * SOCK_DGRAM) and address families (AF_INET, AF_INET6, AF_UNIX) the owning
 * transport can serve. Inherited descriptors are validated against both
 * before anything touches them:
 *   1. getsockopt(SO_TYPE) must equal the expected kind
 *   2. getsockname() family must be one of the accepted families
 *
 * Validation and OS query failures throw FdInheritanceError.
 */
class SocketProvisioner {
public:
  SocketProvisioner(int socket_type, std::vector<int> families);

  // Pure resolution, no validation and no side effects
  static SocketSource Resolve(const BindStrategy &strategy, const std::string &service_name,
                              const InheritanceConfig &inheritance);

  /**
   * Resolve and validate
   *
   * A descriptor that fails validation is fatal under Inherit (throws
   * FdInheritanceError) and degrades to binding the fallback target under
   * InheritOrBind (logged as a warning).
   */
  SocketSource Plan(const BindStrategy &strategy, const std::string &service_name,
                    const InheritanceConfig &inheritance) const;

  static void ValidateSocketType(int fd, int expected_type);
  static void ValidateSocketFamily(int fd, int expected_family);

  // Type check, then each accepted family in turn (last failure surfaces)
  void ValidateInheritedFd(int fd) const;

  /**
   * Prepare an inherited descriptor for the reactor
   *
   * Re-validates, sets O_NONBLOCK and FD_CLOEXEC and returns the address
   * family so the caller can pick the matching protocol before assigning
   * the descriptor to an asio socket.
   */
  int AdoptDescriptor(int fd) const;

  int socket_type() const { return socket_type_; }
  const std::vector<int> &families() const { return families_; }

private:
  int socket_type_;
  std::vector<int> families_;
};

const char *SocketTypeName(int socket_type);
const char *AddressFamilyName(int family);

} // namespace network
} // namespace echosrv

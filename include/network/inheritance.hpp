// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <map>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace echosrv {
namespace network {

/**
 * InheritanceConfig - descriptors handed over by a supervisor
 *
 * Socket activation protocol (systemd compatible):
 *   LISTEN_FDS      number of passed descriptors, starting at fd 3
 *   LISTEN_PID      pid the descriptors are meant for
 *   LISTEN_FDNAMES  colon-separated names, one per descriptor
 *
 * Descriptor i (0-based) is fd 3+i and is named by the i-th LISTEN_FDNAMES
 * entry, or "fd_<i>" when the entry is missing or empty.
 *
 * Inheritance is disabled when LISTEN_FDS is absent, zero or unparsable, or
 * when LISTEN_PID is present and does not name the current process.
 *
 * Built once at startup and read-only afterwards.
 */
class InheritanceConfig {
public:
  static constexpr int LISTEN_FDS_START = 3;
  // Larger LISTEN_FDS values are treated as unparsable
  static constexpr int MAX_LISTEN_FDS = 4096;

  InheritanceConfig() = default;

  // Read the current process environment. With unset_environment the
  // three variables are removed afterwards so children do not re-inherit.
  static InheritanceConfig FromEnvironment(bool unset_environment = false);

  // Build from raw variable values (std::nullopt = variable not set)
  static InheritanceConfig FromValues(const std::optional<std::string> &listen_fds,
                                      const std::optional<std::string> &listen_pid,
                                      const std::optional<std::string> &listen_fdnames,
                                      pid_t current_pid);

  // Programmatic construction (tests, embedding)
  static InheritanceConfig FromMap(std::map<std::string, int> fds);

  std::optional<int> GetFd(const std::string &service_name) const;

  bool enabled() const { return enabled_; }
  bool HasInheritedFds() const { return enabled_ && !fds_.empty(); }
  std::vector<std::string> ServiceNames() const;
  const std::map<std::string, int> &fds() const { return fds_; }

private:
  std::map<std::string, int> fds_;
  bool enabled_{false};
};

} // namespace network
} // namespace echosrv

// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "network/inheritance.hpp"
#include "util/logging.hpp"
#include "util/string_parsing.hpp"
#include <cstdlib>
#include <limits>
#include <unistd.h>

namespace echosrv {
namespace network {

namespace {

std::optional<std::string> GetEnv(const char *name) {
  const char *value = std::getenv(name);
  if (!value) {
    return std::nullopt;
  }
  return std::string(value);
}

} // namespace

InheritanceConfig InheritanceConfig::FromEnvironment(bool unset_environment) {
  auto config = FromValues(GetEnv("LISTEN_FDS"), GetEnv("LISTEN_PID"),
                           GetEnv("LISTEN_FDNAMES"), getpid());
  if (unset_environment) {
    unsetenv("LISTEN_FDS");
    unsetenv("LISTEN_PID");
    unsetenv("LISTEN_FDNAMES");
  }
  return config;
}

InheritanceConfig InheritanceConfig::FromValues(const std::optional<std::string> &listen_fds,
                                                const std::optional<std::string> &listen_pid,
                                                const std::optional<std::string> &listen_fdnames,
                                                pid_t current_pid) {
  InheritanceConfig config;

  if (!listen_fds) {
    return config;
  }

  auto count = util::SafeParseInt(*listen_fds, 0, MAX_LISTEN_FDS);
  if (!count || *count == 0) {
    if (!count) {
      LOG_NET_WARN("ignoring unparsable LISTEN_FDS='{}'", *listen_fds);
    }
    return config;
  }

  if (listen_pid) {
    auto pid = util::SafeParseInt64(*listen_pid, 1, std::numeric_limits<pid_t>::max());
    if (!pid || static_cast<pid_t>(*pid) != current_pid) {
      LOG_NET_DEBUG("LISTEN_PID={} does not match pid {}, inheritance disabled",
                    *listen_pid, current_pid);
      return config;
    }
  }

  std::vector<std::string> names;
  if (listen_fdnames) {
    names = util::SplitString(*listen_fdnames, ':');
  }

  for (int i = 0; i < *count; ++i) {
    std::string name;
    if (static_cast<size_t>(i) < names.size() && !names[i].empty()) {
      name = names[i];
    } else {
      name = "fd_" + std::to_string(i);
    }
    config.fds_[name] = LISTEN_FDS_START + i;
  }
  config.enabled_ = true;

  LOG_NET_DEBUG("inherited {} descriptor(s) from supervisor", config.fds_.size());
  return config;
}

InheritanceConfig InheritanceConfig::FromMap(std::map<std::string, int> fds) {
  InheritanceConfig config;
  config.fds_ = std::move(fds);
  config.enabled_ = true;
  return config;
}

std::optional<int> InheritanceConfig::GetFd(const std::string &service_name) const {
  auto it = fds_.find(service_name);
  if (it == fds_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<std::string> InheritanceConfig::ServiceNames() const {
  std::vector<std::string> names;
  names.reserve(fds_.size());
  for (const auto &[name, fd] : fds_) {
    names.push_back(name);
  }
  return names;
}

} // namespace network
} // namespace echosrv

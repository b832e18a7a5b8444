// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string>

namespace echosrv {

// Software version
constexpr int ECHOSRV_VERSION_MAJOR = 1;
constexpr int ECHOSRV_VERSION_MINOR = 0;
constexpr int ECHOSRV_VERSION_PATCH = 0;

// Build version string
inline std::string GetVersionString() {
  return std::to_string(ECHOSRV_VERSION_MAJOR) + "." +
         std::to_string(ECHOSRV_VERSION_MINOR) + "." +
         std::to_string(ECHOSRV_VERSION_PATCH);
}

// Copyright
constexpr const char *COPYRIGHT_YEAR = "2025";
constexpr const char *COPYRIGHT_HOLDERS = "The Unicity Foundation";

// Full version info for display
inline std::string GetFullVersionString() {
  return "echosrv version " + GetVersionString();
}

// Get copyright string
inline std::string GetCopyrightString() {
  return "Copyright (C) " + std::string(COPYRIGHT_YEAR) + " " +
         std::string(COPYRIGHT_HOLDERS);
}

} // namespace echosrv

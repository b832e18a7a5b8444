// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/errors.hpp"
#include <boost/asio/error.hpp>

namespace echosrv {

const char *ErrorKindName(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Bind:
    return "bind";
  case ErrorKind::FdInheritance:
    return "fd-inheritance";
  case ErrorKind::Io:
    return "io";
  case ErrorKind::Timeout:
    return "timeout";
  case ErrorKind::Config:
    return "config";
  case ErrorKind::TooLarge:
    return "too-large";
  }
  return "unknown";
}

ErrorKind ClassifyError(const boost::system::error_code &ec) {
  if (ec == boost::asio::error::timed_out) {
    return ErrorKind::Timeout;
  }
  if (ec == boost::asio::error::address_in_use ||
      ec == boost::asio::error::access_denied ||
      ec == boost::system::errc::address_not_available) {
    return ErrorKind::Bind;
  }
  return ErrorKind::Io;
}

} // namespace echosrv

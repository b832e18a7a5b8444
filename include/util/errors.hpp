// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <boost/system/error_code.hpp>
#include <stdexcept>
#include <string>

namespace echosrv {

/**
 * Shared error taxonomy
 *
 * Every transport maps its OS-level failures onto these kinds, so the
 * server and client engines never branch on transport identity.
 *
 * Synchronous entry points (bind, provisioning, client calls) throw the
 * exception classes below. Asynchronous completions carry a
 * boost::system::error_code instead; ClassifyError() maps those onto the
 * same kinds for logging and decisions.
 */
enum class ErrorKind {
  Bind,          // address/path in use, permission denied
  FdInheritance, // inherited descriptor failed validation or OS query failed
  Io,            // any other read/write/accept/connect failure
  Timeout,       // deadline expired before data or a peer arrived
  Config,        // internally inconsistent configuration
  TooLarge       // response exceeded the configured maximum size
};

const char *ErrorKindName(ErrorKind kind);

class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }

private:
  ErrorKind kind_;
};

class BindError : public Error {
public:
  explicit BindError(const std::string &message) : Error(ErrorKind::Bind, message) {}
};

class FdInheritanceError : public Error {
public:
  explicit FdInheritanceError(const std::string &message)
      : Error(ErrorKind::FdInheritance, message) {}
};

class IoError : public Error {
public:
  explicit IoError(const std::string &message) : Error(ErrorKind::Io, message) {}
};

class TimeoutError : public Error {
public:
  explicit TimeoutError(const std::string &message) : Error(ErrorKind::Timeout, message) {}
};

class ConfigError : public Error {
public:
  explicit ConfigError(const std::string &message) : Error(ErrorKind::Config, message) {}
};

class TooLargeError : public Error {
public:
  explicit TooLargeError(const std::string &message) : Error(ErrorKind::TooLarge, message) {}
};

/**
 * Map an asynchronous completion code onto the shared taxonomy
 *
 * - boost::asio::error::timed_out                  -> Timeout
 * - address_in_use / access_denied / not_available -> Bind
 * - anything else                                  -> Io
 *
 * Precondition: ec is set (a success code has no kind).
 */
ErrorKind ClassifyError(const boost::system::error_code &ec);

} // namespace echosrv

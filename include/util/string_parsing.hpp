#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Safe parsing of strings to numeric types with validation
 - Centralized input validation for environment variables, command-line
   arguments and config files
 - Consistent error handling across the codebase

 Key functions:
 - SafeParseInt: Parse integer with bounds checking
 - SafeParsePort: Parse port number (0-65535, 0 = ephemeral)
 - SafeParseInt64: Parse 64-bit integer with bounds checking
 - SplitString: Split on a single delimiter, keeping empty fields

 Security:
 - All functions validate entire input is consumed (no trailing garbage)
 - Bounds checking prevents overflow/underflow
 - Returns std::nullopt on any parsing error (no exceptions thrown)
*/

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace echosrv {
namespace util {

/**
 * Parse integer string with bounds checking
 *
 * @param str String to parse
 * @param min Minimum allowed value (inclusive)
 * @param max Maximum allowed value (inclusive)
 * @return Parsed integer or std::nullopt if invalid
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 *   SafeParseInt("", 0, 100) -> std::nullopt (empty string)
 */
std::optional<int> SafeParseInt(const std::string& str, int min, int max);

/**
 * Parse port number string (0-65535)
 *
 * Port 0 is accepted: binding to it asks the kernel for an ephemeral port.
 *
 * Examples:
 *   SafeParsePort("8080") -> 8080
 *   SafeParsePort("0") -> 0
 *   SafeParsePort("99999") -> std::nullopt (out of range)
 */
std::optional<uint16_t> SafeParsePort(const std::string& str);

/**
 * Parse int64_t string with bounds checking
 *
 * Examples:
 *   SafeParseInt64("86400", 0, 1000000) -> 86400
 *   SafeParseInt64("-1", 0, 1000000) -> std::nullopt (out of range)
 */
std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max);

/**
 * Split a string on a delimiter
 *
 * Empty fields are preserved so positional lists keep their indices:
 *   SplitString("a::b", ':') -> {"a", "", "b"}
 *   SplitString("", ':') -> {}
 */
std::vector<std::string> SplitString(const std::string& str, char delim);

} // namespace util
} // namespace echosrv

#include "util/string_parsing.hpp"
#include <cctype>
#include <limits>
#include <stdexcept>

namespace echosrv {
namespace util {

std::optional<int> SafeParseInt(const std::string& str, int min, int max) {
  auto value = SafeParseInt64(str, min, max);
  if (!value) {
    return std::nullopt;
  }
  return static_cast<int>(*value);
}

std::optional<uint16_t> SafeParsePort(const std::string& str) {
  auto value = SafeParseInt64(str, 0, std::numeric_limits<uint16_t>::max());
  if (!value) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(*value);
}

std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max) {
  try {
    // Reject empty or whitespace-leading strings
    if (str.empty() || std::isspace(static_cast<unsigned char>(str[0]))) {
      return std::nullopt;
    }

    size_t pos = 0;
    long long value = std::stoll(str, &pos);

    // Check entire string was consumed
    if (pos != str.size()) {
      return std::nullopt;
    }

    if (value < min || value > max) {
      return std::nullopt;
    }

    return static_cast<int64_t>(value);
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
}

std::vector<std::string> SplitString(const std::string& str, char delim) {
  std::vector<std::string> parts;
  if (str.empty()) {
    return parts;
  }

  size_t pos = 0;
  while (true) {
    size_t next = str.find(delim, pos);
    if (next == std::string::npos) {
      parts.push_back(str.substr(pos));
      break;
    }
    parts.push_back(str.substr(pos, next - pos));
    pos = next + 1;
  }
  return parts;
}

} // namespace util
} // namespace echosrv

#include "util/string_parsing.hpp"
#include <cctype>
#include <cmath>

namespace lorasim {
namespace util {

std::optional<int> SafeParseInt(const std::string& str, int min, int max) {
  try {
    // Reject empty or whitespace-leading strings
    if (str.empty() || std::isspace(static_cast<unsigned char>(str[0]))) {
      return std::nullopt;
    }

    size_t pos = 0;
    long value = std::stol(str, &pos);

    // Check entire string was consumed
    if (pos != str.size()) {
      return std::nullopt;
    }

    if (value < min || value > max) {
      return std::nullopt;
    }

    return static_cast<int>(value);
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

std::optional<int64_t> SafeParseInt64(const std::string& str, int64_t min, int64_t max) {
  try {
    if (str.empty() || std::isspace(static_cast<unsigned char>(str[0]))) {
      return std::nullopt;
    }

    size_t pos = 0;
    long long value = std::stoll(str, &pos);

    if (pos != str.size()) {
      return std::nullopt;
    }

    if (value < min || value > max) {
      return std::nullopt;
    }

    return static_cast<int64_t>(value);
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

std::optional<double> SafeParseDouble(const std::string& str, double min, double max) {
  try {
    if (str.empty() || std::isspace(static_cast<unsigned char>(str[0]))) {
      return std::nullopt;
    }

    size_t pos = 0;
    double value = std::stod(str, &pos);

    if (pos != str.size()) {
      return std::nullopt;
    }

    // stod accepts "nan" and "inf"; neither is a usable time or offset
    if (!std::isfinite(value)) {
      return std::nullopt;
    }

    if (value < min || value > max) {
      return std::nullopt;
    }

    return value;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

bool IsValidHex(const std::string& str) {
  if (str.empty()) {
    return false;
  }

  for (char c : str) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) {
      return false;
    }
  }
  return true;
}

std::vector<std::string> SplitFields(const std::string& str, char delim,
                                     size_t max_fields) {
  std::vector<std::string> fields;
  size_t pos = 0;
  while (true) {
    if (max_fields > 0 && fields.size() + 1 == max_fields) {
      fields.push_back(str.substr(pos));
      break;
    }
    size_t next = str.find(delim, pos);
    if (next == std::string::npos) {
      fields.push_back(str.substr(pos));
      break;
    }
    fields.push_back(str.substr(pos, next - pos));
    pos = next + 1;
  }
  return fields;
}

std::string Trim(const std::string& str) {
  const char* ws = " \t\r\n";
  size_t begin = str.find_first_not_of(ws);
  if (begin == std::string::npos) {
    return "";
  }
  size_t end = str.find_last_not_of(ws);
  return str.substr(begin, end - begin + 1);
}

} // namespace util
} // namespace lorasim

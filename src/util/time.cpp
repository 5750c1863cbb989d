// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/time.hpp"
#include <spdlog/fmt/fmt.h>

namespace lorasim {
namespace util {

std::string FormatSeconds(double seconds) {
  return fmt::format("{:.3f}", seconds);
}

} // namespace util
} // namespace lorasim

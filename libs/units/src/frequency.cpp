/**
 * @file frequency.cpp
 * @brief Frequency quantity parsing implementation.
 * @author Watosn
 */

#include "ringsky/units/frequency.hpp"

#include <array>
#include <cmath>
#include <cstdlib>
#include <regex>
#include <utility>

#include <fmt/format.h>

namespace ringsky::units {
namespace {

const std::regex kFrequencyPattern(R"(^\s*([+-]?(?:\d+(?:\.\d*)?|\.\d+)(?:[eE][+-]?\d+)?)\s*([kMGT]?Hz)\s*$)");

constexpr std::array<std::pair<const char*, double>, 5> kUnitScales{{
    {"Hz", 1.0},
    {"kHz", 1.0e3},
    {"MHz", 1.0e6},
    {"GHz", 1.0e9},
    {"THz", 1.0e12},
}};

}  // namespace

FrequencyResult parse_frequency(const std::string& text) {
  std::smatch m;
  if (!std::regex_match(text, m, kFrequencyPattern)) {
    return FrequencyResult{.hz = 0.0,
                           .status = ringsky::core::Status::InvalidFrequency,
                           .detail = fmt::format("invalid frequency: {}", text)};
  }
  const double value = std::strtod(m[1].str().c_str(), nullptr);
  const std::string unit = m[2].str();
  double scale = 1.0;
  for (const auto& [name, factor] : kUnitScales) {
    if (unit == name) {
      scale = factor;
      break;
    }
  }
  const double hz = value * scale;
  if (!std::isfinite(hz)) {
    return FrequencyResult{.hz = 0.0,
                           .status = ringsky::core::Status::InvalidFrequency,
                           .detail = fmt::format("frequency is not finite: {}", text)};
  }
  return FrequencyResult{.hz = hz, .status = ringsky::core::Status::Ok, .detail = {}};
}

}  // namespace ringsky::units

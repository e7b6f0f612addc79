/**
 * @file frequency.hpp
 * @brief Frequency quantity parsing.
 * @author Watosn
 */
#pragma once

#include <string>

#include "ringsky/core/types.hpp"

namespace ringsky::units {

/**
 * @brief Outcome of converting a frequency expression to Hz.
 */
struct FrequencyResult {
  double hz{};
  ringsky::core::Status status{ringsky::core::Status::Ok};
  std::string detail{};
};

/**
 * @brief Convert `<decimal><unit>` (unit one of Hz, kHz, MHz, GHz, THz) to Hz.
 *
 * A leading sign is accepted so spectral increments may be negative.
 */
[[nodiscard]] FrequencyResult parse_frequency(const std::string& text);

}  // namespace ringsky::units

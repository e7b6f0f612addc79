/**
 * @file angle.hpp
 * @brief Angle string parsing and RA/Dec validation.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <string>

#include "ringsky/core/types.hpp"

namespace ringsky::units {

/**
 * @brief Which coordinate an angle string is meant to describe.
 */
enum class AngleRole : std::uint8_t { RA, Dec };

/**
 * @brief Display name for an angle role ("RA" / "Dec").
 */
const char* role_name(AngleRole role);

/**
 * @brief Outcome of converting an angle expression to radians.
 */
struct AngleResult {
  double radians{};
  ringsky::core::Status status{ringsky::core::Status::Ok};
  std::string detail{};
};

/**
 * @brief Outcome of validating an RA/Dec string.
 *
 * On success `value` is the input string, unchanged.
 */
struct NormalizedAngle {
  std::string value{};
  AngleRole role{AngleRole::RA};
  ringsky::core::Status status{ringsky::core::Status::Ok};
  std::string detail{};
};

/**
 * @brief Convert an angle expression to radians.
 *
 * Accepted forms (optional leading sign, surrounding whitespace ignored):
 * - `12h30m15.5s`, `12h30m`, `12.5h` (hours)
 * - `12:30:15.5`, `12:30` (hours)
 * - `-23d30m15.5s`, `-23d30m15.5`, `-23.5d` (degrees)
 * - `-23.30.15.5` (dotted degrees, at least two separators)
 * - `<decimal><unit>` with unit one of `rad`, `deg`, `arcmin`, `arcsec`, `mas`
 *
 * Minute/second fields must lie in [0, 60). A bare number without unit is rejected.
 * @return Result with `status == InvalidAngle` on malformed input.
 */
[[nodiscard]] AngleResult parse_angle(const std::string& text);

/**
 * @brief Validate an RA or Dec string without altering it.
 *
 * Declinations must additionally lie within [-90, +90] degrees.
 */
[[nodiscard]] NormalizedAngle normalize_angle(const std::string& value, AngleRole role);

/**
 * @brief Render a direction as `J2000 <ra>rad <dec>rad` for logs.
 */
std::string format_direction(const ringsky::core::Direction& dir);

}  // namespace ringsky::units

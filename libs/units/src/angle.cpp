/**
 * @file angle.cpp
 * @brief Angle string parsing implementation.
 * @author Watosn
 */

#include "ringsky/units/angle.hpp"

#include <cmath>
#include <cstdlib>
#include <regex>

#include <fmt/format.h>

#include "ringsky/core/constants.hpp"

namespace ringsky::units {
namespace {

using ringsky::core::Status;
namespace constants = ringsky::core::constants;

// Sexagesimal fields: only the last present field may carry a fraction.
const std::regex kHmsPattern(R"(^(\d+(?:\.\d*)?)h(?:(\d+(?:\.\d*)?)m(?:(\d+(?:\.\d*)?)s?)?)?$)");
const std::regex kDmsPattern(R"(^(\d+(?:\.\d*)?)d(?:(\d+(?:\.\d*)?)m(?:(\d+(?:\.\d*)?)s?)?)?$)");
const std::regex kColonPattern(R"(^(\d+):(\d+(?:\.\d*)?)(?::(\d+(?:\.\d*)?))?$)");
const std::regex kDottedPattern(R"(^(\d+)\.(\d+)\.(\d+(?:\.\d*)?)$)");
const std::regex kDecimalUnitPattern(R"(^((?:\d+(?:\.\d*)?|\.\d+)(?:[eE][+-]?\d+)?)\s*(rad|deg|arcmin|arcsec|mas)$)");
const std::regex kBareNumberPattern(R"(^(?:\d+(?:\.\d*)?|\.\d+)(?:[eE][+-]?\d+)?$)");

std::string trim(const std::string& text) {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

bool is_integral(const std::string& field) { return field.find('.') == std::string::npos; }

double to_double(const std::string& field) { return std::strtod(field.c_str(), nullptr); }

AngleResult invalid(const std::string& text, const char* reason) {
  return AngleResult{.radians = 0.0, .status = Status::InvalidAngle, .detail = fmt::format("{} ({})", text, reason)};
}

/**
 * @brief Combine up to three sexagesimal fields from a regex match into one value in the unit of the first field.
 */
bool combine_sexagesimal(const std::smatch& m, double& value, const char*& reason) {
  const bool has_min = m[2].matched;
  const bool has_sec = m[3].matched;
  if ((has_min && !is_integral(m[1].str())) || (has_sec && !is_integral(m[2].str()))) {
    reason = "only the last sexagesimal field may be fractional";
    return false;
  }
  const double whole = to_double(m[1].str());
  const double minutes = has_min ? to_double(m[2].str()) : 0.0;
  const double seconds = has_sec ? to_double(m[3].str()) : 0.0;
  if (minutes >= 60.0 || seconds >= 60.0) {
    reason = "minutes and seconds must be below 60";
    return false;
  }
  value = whole + minutes / 60.0 + seconds / 3600.0;
  return true;
}

double unit_scale(const std::string& unit) {
  if (unit == "rad") {
    return 1.0;
  }
  if (unit == "deg") {
    return constants::kDegToRad;
  }
  if (unit == "arcmin") {
    return constants::kArcminToRad;
  }
  if (unit == "arcsec") {
    return constants::kArcsecToRad;
  }
  return constants::kMilliarcsecToRad;
}

}  // namespace

const char* role_name(const AngleRole role) { return role == AngleRole::RA ? "RA" : "Dec"; }

AngleResult parse_angle(const std::string& text) {
  std::string body = trim(text);
  if (body.empty()) {
    return invalid(text, "empty angle");
  }

  double sign = 1.0;
  if (body.front() == '+' || body.front() == '-') {
    sign = (body.front() == '-') ? -1.0 : 1.0;
    body.erase(0, 1);
  }

  std::smatch m;
  double value = 0.0;
  double scale = 0.0;
  const char* reason = "";
  if (std::regex_match(body, m, kHmsPattern) || std::regex_match(body, m, kColonPattern)) {
    if (!combine_sexagesimal(m, value, reason)) {
      return invalid(text, reason);
    }
    scale = constants::kHourToRad;
  } else if (std::regex_match(body, m, kDmsPattern) || std::regex_match(body, m, kDottedPattern)) {
    if (!combine_sexagesimal(m, value, reason)) {
      return invalid(text, reason);
    }
    scale = constants::kDegToRad;
  } else if (std::regex_match(body, m, kDecimalUnitPattern)) {
    value = to_double(m[1].str());
    scale = unit_scale(m[2].str());
  } else if (std::regex_match(body, kBareNumberPattern)) {
    return invalid(text, "missing angle unit");
  } else {
    return invalid(text, "unrecognized angle syntax");
  }

  const double radians = sign * value * scale;
  if (!std::isfinite(radians)) {
    return invalid(text, "angle is not finite");
  }
  return AngleResult{.radians = radians, .status = Status::Ok, .detail = {}};
}

NormalizedAngle normalize_angle(const std::string& value, const AngleRole role) {
  const auto parsed = parse_angle(value);
  if (parsed.status != Status::Ok) {
    return NormalizedAngle{.value = value,
                           .role = role,
                           .status = Status::InvalidAngle,
                           .detail = fmt::format("invalid {} format: {}", role_name(role), parsed.detail)};
  }
  if (role == AngleRole::Dec && std::abs(parsed.radians) > 0.5 * constants::kPi) {
    return NormalizedAngle{.value = value,
                           .role = role,
                           .status = Status::InvalidAngle,
                           .detail = fmt::format("invalid Dec format: {} (declination beyond +/-90 deg)", value)};
  }
  return NormalizedAngle{.value = value, .role = role, .status = Status::Ok, .detail = {}};
}

std::string format_direction(const ringsky::core::Direction& dir) {
  return fmt::format("J2000 {:.9g}rad {:.9g}rad", dir.ra_rad, dir.dec_rad);
}

}  // namespace ringsky::units

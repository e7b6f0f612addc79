/**
 * @file types.hpp
 * @brief Core domain types for ringsky.
 * @author Watosn
 */
#pragma once

#include <cstdint>

namespace ringsky::core {

/**
 * @brief Standard status code used by every pipeline stage.
 */
enum class Status : std::uint8_t {
  Ok,
  InvalidAngle,
  InvalidFrequency,
  DegenerateRing,
  InvalidConfig,
  ConfigurationConflict,
  IoError,
  NumericalError
};

/**
 * @brief Short stable name for a status code (used in logs and CLI output).
 */
inline const char* status_name(const Status s) {
  switch (s) {
    case Status::Ok:
      return "Ok";
    case Status::InvalidAngle:
      return "InvalidAngle";
    case Status::InvalidFrequency:
      return "InvalidFrequency";
    case Status::DegenerateRing:
      return "DegenerateRing";
    case Status::InvalidConfig:
      return "InvalidConfig";
    case Status::ConfigurationConflict:
      return "ConfigurationConflict";
    case Status::IoError:
      return "IoError";
    case Status::NumericalError:
      return "NumericalError";
  }
  return "Unknown";
}

/**
 * @brief Celestial reference frames supported for directions.
 */
enum class DirectionFrame : std::uint8_t { J2000 };

/**
 * @brief Sky direction in radians.
 */
struct Direction {
  double ra_rad{};
  double dec_rad{};
  DirectionFrame frame{DirectionFrame::J2000};
};

/**
 * @brief Uniform-brightness disk component.
 *
 * `flux_jy` is signed; a negative value makes the disk subtract from the image.
 */
struct DiskComponent {
  Direction center{};
  double diameter_arcsec{};
  double flux_jy{};
  double freq_hz{};
  double position_angle_rad{};
};

/**
 * @brief Per-ring numeric summary reported to observers.
 */
struct RingSummary {
  int index{};
  double inner_radius_arcsec{};
  double outer_radius_arcsec{};
  double annulus_area_arcsec2{};
  double surface_brightness_jy_arcsec2{};
  double net_flux_jy{};
};

}  // namespace ringsky::core

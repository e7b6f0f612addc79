/**
 * @file coordinate_system.cpp
 * @brief SIN-projection world coordinate system implementation.
 * @author Watosn
 */

#include "ringsky/imaging/coordinate_system.hpp"

#include <cmath>

#include "ringsky/core/constants.hpp"

namespace ringsky::imaging {

bool CoordinateSystem::world_to_pixel(const ringsky::core::Direction& dir, double& px, double& py) const {
  const double sin_dec = std::sin(dir.dec_rad);
  const double cos_dec = std::cos(dir.dec_rad);
  const double sin_dec0 = std::sin(direction.ref_dec_rad);
  const double cos_dec0 = std::cos(direction.ref_dec_rad);
  const double dra = dir.ra_rad - direction.ref_ra_rad;
  const double cos_dra = std::cos(dra);

  const double cos_c = sin_dec * sin_dec0 + cos_dec * cos_dec0 * cos_dra;
  if (cos_c < 0.0) {
    return false;
  }
  const double l = cos_dec * std::sin(dra);
  const double m = sin_dec * cos_dec0 - cos_dec * sin_dec0 * cos_dra;

  px = direction.ref_pixel_x + l / direction.increment_x_rad;
  py = direction.ref_pixel_y + m / direction.increment_y_rad;
  return true;
}

bool CoordinateSystem::pixel_to_world(const double px, const double py, ringsky::core::Direction& dir) const {
  const double l = (px - direction.ref_pixel_x) * direction.increment_x_rad;
  const double m = (py - direction.ref_pixel_y) * direction.increment_y_rad;
  const double r2 = l * l + m * m;
  if (r2 > 1.0) {
    return false;
  }
  const double n = std::sqrt(1.0 - r2);
  const double sin_dec0 = std::sin(direction.ref_dec_rad);
  const double cos_dec0 = std::cos(direction.ref_dec_rad);

  dir.dec_rad = std::asin(m * cos_dec0 + n * sin_dec0);
  dir.ra_rad = direction.ref_ra_rad + std::atan2(l, n * cos_dec0 - m * sin_dec0);
  dir.frame = direction.frame;
  return true;
}

CoordinateSystem make_coordinate_system(const ImageShape& shape,
                                        const double cell_size_arcsec,
                                        const ringsky::core::Direction& center,
                                        const double freq_hz,
                                        const double spectral_increment_hz) {
  const double cell_rad = cell_size_arcsec * ringsky::core::constants::kArcsecToRad;
  CoordinateSystem cs{};
  cs.direction = DirectionAxes{
      .ref_ra_rad = center.ra_rad,
      .ref_dec_rad = center.dec_rad,
      .ref_pixel_x = static_cast<double>(shape.nx / 2),
      .ref_pixel_y = static_cast<double>(shape.ny / 2),
      .increment_x_rad = -cell_rad,
      .increment_y_rad = cell_rad,
      .frame = center.frame,
  };
  cs.spectral = SpectralAxis{.ref_freq_hz = freq_hz, .increment_hz = spectral_increment_hz, .ref_pixel = 0.0};
  return cs;
}

}  // namespace ringsky::imaging

/**
 * @file ring_geometry.cpp
 * @brief Ring radii/area and flux-normalization implementation.
 * @author Watosn
 */

#include "ringsky/geometry/ring_geometry.hpp"

#include <cmath>
#include <utility>

#include <fmt/format.h>

#include "ringsky/core/constants.hpp"

namespace ringsky::geometry {
namespace {

using ringsky::core::Status;

bool non_negative_finite(double v) { return std::isfinite(v) && v >= 0.0; }

RingResult failed(int index, Status status, std::string detail) {
  return RingResult{.index = index, .status = status, .detail = std::move(detail)};
}

}  // namespace

ringsky::core::RingSummary RingResult::summary() const {
  return ringsky::core::RingSummary{
      .index = index,
      .inner_radius_arcsec = inner_radius_arcsec,
      .outer_radius_arcsec = outer_radius_arcsec,
      .annulus_area_arcsec2 = annulus_area_arcsec2,
      .surface_brightness_jy_arcsec2 = surface_brightness_jy_arcsec2,
      .net_flux_jy = net_flux_jy(),
  };
}

RingResult compute_ring(const int index, const RingLayout& layout, const FluxSpec& flux, const double default_flux_jy) {
  if (index < 0) {
    return failed(index, Status::InvalidConfig, fmt::format("ring index must be >= 0, got {}", index));
  }
  if (!non_negative_finite(layout.central_diameter_arcsec) || !non_negative_finite(layout.ring_spacing_arcsec)
      || !std::isfinite(layout.ring_thickness_arcsec)) {
    return failed(index, Status::InvalidConfig, "central diameter and ring spacing must be finite and >= 0");
  }
  // Negative thickness means a negative annulus area.
  if (layout.ring_thickness_arcsec < 0.0) {
    return failed(index,
                  Status::DegenerateRing,
                  fmt::format("ring {} has negative thickness {}", index + 1, layout.ring_thickness_arcsec));
  }

  const double rc = layout.central_diameter_arcsec / 2.0;
  const double rin = rc + static_cast<double>(index) * (layout.ring_thickness_arcsec + layout.ring_spacing_arcsec);
  const double rout = rin + layout.ring_thickness_arcsec;

  const double a_out = ringsky::core::constants::kPi * rout * rout;
  const double a_in = ringsky::core::constants::kPi * rin * rin;
  const double a_ring = a_out - a_in;

  double intensity = 0.0;
  if (flux.mode == FluxMode::SurfaceBrightness) {
    if (!flux.value.has_value() || !std::isfinite(*flux.value)) {
      return failed(index, Status::InvalidConfig, "surface brightness mode requires a finite value");
    }
    intensity = *flux.value;
  } else {
    const double ring_flux = flux.value.value_or(default_flux_jy);
    if (!std::isfinite(ring_flux)) {
      return failed(index, Status::InvalidConfig, "ring flux must be finite");
    }
    if (!(a_ring > 0.0)) {
      return failed(index,
                    Status::DegenerateRing,
                    fmt::format("ring {} has non-positive annulus area {:.6e} arcsec^2 (thickness {})",
                                index + 1,
                                a_ring,
                                layout.ring_thickness_arcsec));
    }
    intensity = ring_flux / a_ring;
    if (!std::isfinite(intensity)) {
      return failed(index,
                    Status::DegenerateRing,
                    fmt::format("ring {} annulus area {:.6e} arcsec^2 too small for flux {}", index + 1, a_ring, ring_flux));
    }
  }

  const double outer_flux = intensity * a_out;
  const double inner_flux = intensity * a_in;
  if (!std::isfinite(outer_flux) || !std::isfinite(inner_flux)) {
    return failed(index,
                  Status::NumericalError,
                  fmt::format("ring {} disk flux overflows (I={:.3e} Jy/arcsec^2, Aout={:.3e} arcsec^2)", index + 1, intensity, a_out));
  }

  return RingResult{
      .index = index,
      .inner_radius_arcsec = rin,
      .outer_radius_arcsec = rout,
      .inner_area_arcsec2 = a_in,
      .outer_area_arcsec2 = a_out,
      .annulus_area_arcsec2 = a_ring,
      .surface_brightness_jy_arcsec2 = intensity,
      .outer_flux_jy = outer_flux,
      .inner_flux_jy = inner_flux,
      .status = Status::Ok,
      .detail = {},
  };
}

RingSetResult compute_rings(const int n_rings,
                            const RingLayout& layout,
                            const FluxSpec& flux,
                            const double default_flux_jy,
                            ringsky::core::ISkyModelObserver* observer) {
  RingSetResult out{};
  if (n_rings < 0) {
    out.status = Status::InvalidConfig;
    out.detail = fmt::format("n_rings must be >= 0, got {}", n_rings);
    return out;
  }
  out.rings.reserve(static_cast<std::size_t>(n_rings));
  for (int j = 0; j < n_rings; ++j) {
    auto ring = compute_ring(j, layout, flux, default_flux_jy);
    if (ring.status != Status::Ok) {
      out.status = ring.status;
      out.detail = ring.detail;
      return out;
    }
    if (observer != nullptr) {
      observer->on_ring(ring.summary());
    }
    out.rings.push_back(std::move(ring));
  }
  return out;
}

}  // namespace ringsky::geometry

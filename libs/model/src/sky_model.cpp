/**
 * @file sky_model.cpp
 * @brief Disk component list assembly implementation.
 * @author Watosn
 */

#include "ringsky/model/sky_model.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

namespace ringsky::model {

using ringsky::core::DiskComponent;
using ringsky::core::Status;

double SkyModel::total_flux_jy() const {
  double sum = 0.0;
  for (const auto& c : components) {
    sum += c.flux_jy;
  }
  return sum;
}

DiskComponent make_disk(const ringsky::core::Direction& center,
                        const double diameter_arcsec,
                        const double flux_jy,
                        const double freq_hz) {
  return DiskComponent{
      .center = center,
      .diameter_arcsec = diameter_arcsec,
      .flux_jy = flux_jy,
      .freq_hz = freq_hz,
      .position_angle_rad = 0.0,
  };
}

std::vector<DiskComponent> ring_components(const ringsky::core::Direction& center,
                                           const ringsky::geometry::RingResult& ring,
                                           const double freq_hz) {
  return {
      make_disk(center, 2.0 * ring.outer_radius_arcsec, ring.outer_flux_jy, freq_hz),
      make_disk(center, 2.0 * ring.inner_radius_arcsec, -ring.inner_flux_jy, freq_hz),
  };
}

AssemblyResult assemble(const ringsky::core::Direction& center,
                        const double central_diameter_arcsec,
                        const double central_flux_jy,
                        const std::vector<ringsky::geometry::RingResult>& rings,
                        const double freq_hz,
                        ringsky::core::ISkyModelObserver* observer) {
  AssemblyResult out{};
  if (!std::isfinite(central_flux_jy) || !std::isfinite(central_diameter_arcsec) || central_diameter_arcsec < 0.0) {
    out.status = Status::InvalidConfig;
    out.detail = "central disk diameter/flux must be finite (diameter >= 0)";
    return out;
  }

  std::vector<const ringsky::geometry::RingResult*> ordered{};
  ordered.reserve(rings.size());
  for (const auto& r : rings) {
    if (r.status != Status::Ok) {
      out.status = r.status;
      out.detail = fmt::format("ring {} unresolved: {}", r.index + 1, r.detail);
      return out;
    }
    ordered.push_back(&r);
  }
  std::stable_sort(ordered.begin(), ordered.end(), [](const auto* a, const auto* b) { return a->index < b->index; });

  out.model.components.reserve(1U + 2U * rings.size());
  out.model.components.push_back(make_disk(center, central_diameter_arcsec, central_flux_jy, freq_hz));
  for (const auto* r : ordered) {
    const auto pair = ring_components(center, *r, freq_hz);
    out.model.components.insert(out.model.components.end(), pair.begin(), pair.end());
  }

  if (observer != nullptr) {
    for (std::size_t i = 0; i < out.model.components.size(); ++i) {
      observer->on_component(i, out.model.components[i]);
    }
  }
  return out;
}

}  // namespace ringsky::model

/**
 * @file test_sky_model_assembly.cpp
 * @brief Component assembly order, signs and observer event tests.
 * @author Watosn
 */

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

#include <spdlog/spdlog.h>

#include "ringsky/geometry/ring_geometry.hpp"
#include "ringsky/model/sky_model.hpp"

namespace {

bool approx(double a, double b, double rel) { return std::abs(a - b) <= rel * std::max(1.0e-30, std::abs(b)); }

class CountingObserver final : public ringsky::core::ISkyModelObserver {
 public:
  void on_ring(const ringsky::core::RingSummary&) override { ++rings; }
  void on_component(std::size_t index, const ringsky::core::DiskComponent& component) override {
    indices.push_back(index);
    fluxes.push_back(component.flux_jy);
  }

  int rings{};
  std::vector<std::size_t> indices{};
  std::vector<double> fluxes{};
};

}  // namespace

int main() {
  using ringsky::core::Status;
  using ringsky::geometry::FluxSpec;

  const ringsky::core::Direction center{.ra_rad = 3.14159, .dec_rad = -0.4};
  const ringsky::geometry::RingLayout layout{
      .central_diameter_arcsec = 0.0045, .ring_thickness_arcsec = 0.0045, .ring_spacing_arcsec = 0.009};
  constexpr double kFreq = 343.5e9;

  for (int n = 0; n <= 4; ++n) {
    const auto rings = ringsky::geometry::compute_rings(n, layout, FluxSpec::total_flux(2.7e-4), 2.7e-4);
    const auto out = ringsky::model::assemble(center, 0.0045, 1.0e-3, rings.rings, kFreq);
    if (out.status != Status::Ok || out.model.size() != static_cast<std::size_t>(1 + 2 * n)) {
      spdlog::error("n_rings={} produced {} components", n, out.model.size());
      return 1;
    }
  }

  const auto rings = ringsky::geometry::compute_rings(3, layout, FluxSpec::total_flux(2.7e-4), 2.7e-4);
  CountingObserver observer;
  const auto out = ringsky::model::assemble(center, 0.0045, 1.0e-3, rings.rings, kFreq, &observer);
  if (out.status != Status::Ok) {
    spdlog::error("assemble failed: {}", out.detail);
    return 2;
  }
  const auto& c = out.model.components;
  if (!approx(c[0].diameter_arcsec, 0.0045, 1e-12) || !approx(c[0].flux_jy, 1.0e-3, 1e-12)) {
    spdlog::error("central disk not first");
    return 3;
  }
  for (std::size_t j = 0; j < rings.rings.size(); ++j) {
    const auto& ring = rings.rings[j];
    const auto& outer = c[1 + 2 * j];
    const auto& inner = c[2 + 2 * j];
    if (!approx(outer.diameter_arcsec, 2.0 * ring.outer_radius_arcsec, 1e-12) || !(outer.flux_jy > 0.0)
        || !approx(outer.flux_jy, ring.outer_flux_jy, 1e-12)) {
      spdlog::error("ring {} outer disk wrong", j);
      return 4;
    }
    if (!approx(inner.diameter_arcsec, 2.0 * ring.inner_radius_arcsec, 1e-12) || !(inner.flux_jy < 0.0)
        || !approx(inner.flux_jy, -ring.inner_flux_jy, 1e-12)) {
      spdlog::error("ring {} inner disk wrong", j);
      return 5;
    }
  }
  for (const auto& comp : c) {
    if (comp.center.ra_rad != center.ra_rad || comp.center.dec_rad != center.dec_rad || comp.freq_hz != kFreq
        || comp.position_angle_rad != 0.0 || comp.center.frame != ringsky::core::DirectionFrame::J2000) {
      spdlog::error("component does not share center/frequency/position angle");
      return 6;
    }
  }
  if (!approx(out.model.total_flux_jy(), 1.0e-3 + 3.0 * 2.7e-4, 1e-9)) {
    spdlog::error("total model flux {} differs from central + ring fluxes", out.model.total_flux_jy());
    return 7;
  }
  if (observer.indices.size() != c.size() || observer.indices.front() != 0U || observer.indices.back() != c.size() - 1U
      || observer.fluxes[2] != c[2].flux_jy || observer.rings != 0) {
    spdlog::error("observer did not see components in model order");
    return 8;
  }

  // Rings supplied out of order are emitted in ascending index.
  std::vector<ringsky::geometry::RingResult> shuffled{rings.rings[2], rings.rings[0], rings.rings[1]};
  const auto sorted = ringsky::model::assemble(center, 0.0045, 1.0e-3, shuffled, kFreq);
  if (sorted.status != Status::Ok || sorted.model.components[1].diameter_arcsec != c[1].diameter_arcsec
      || sorted.model.components[5].diameter_arcsec != c[5].diameter_arcsec) {
    spdlog::error("rings not emitted in ascending index");
    return 9;
  }

  auto bad = rings.rings;
  bad[1].status = Status::DegenerateRing;
  const auto rejected = ringsky::model::assemble(center, 0.0045, 1.0e-3, bad, kFreq);
  if (rejected.status != Status::DegenerateRing || !rejected.model.empty()) {
    spdlog::error("unresolved ring accepted");
    return 10;
  }
  if (ringsky::model::assemble(center, -1.0, 1.0e-3, rings.rings, kFreq).status != Status::InvalidConfig
      || ringsky::model::assemble(center, 0.0045, std::nan(""), rings.rings, kFreq).status != Status::InvalidConfig) {
    spdlog::error("invalid central disk accepted");
    return 11;
  }

  const auto pair = ringsky::model::ring_components(center, rings.rings[0], kFreq);
  if (pair.size() != 2U || !approx(pair[0].flux_jy + pair[1].flux_jy, 2.7e-4, 1e-9)) {
    spdlog::error("ring_components does not realize the ring flux");
    return 12;
  }

  return 0;
}

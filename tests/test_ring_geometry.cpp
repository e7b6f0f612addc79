/**
 * @file test_ring_geometry.cpp
 * @brief Ring radii, area and flux-normalization tests.
 * @author Watosn
 */

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <optional>
#include <vector>

#include <spdlog/spdlog.h>

#include "ringsky/core/constants.hpp"
#include "ringsky/geometry/ring_geometry.hpp"

namespace {

bool approx(double a, double b, double rel) {
  const double scale = std::max(1.0e-30, std::max(std::abs(a), std::abs(b)));
  return std::abs(a - b) <= rel * scale;
}

class RecordingObserver final : public ringsky::core::ISkyModelObserver {
 public:
  void on_ring(const ringsky::core::RingSummary& ring) override { rings.push_back(ring); }
  void on_component(std::size_t, const ringsky::core::DiskComponent&) override {}

  std::vector<ringsky::core::RingSummary> rings{};
};

}  // namespace

int main() {
  using ringsky::core::Status;
  using ringsky::geometry::FluxSpec;
  using ringsky::geometry::RingLayout;
  constexpr double kPi = ringsky::core::constants::kPi;

  const RingLayout layout{.central_diameter_arcsec = 0.0045, .ring_thickness_arcsec = 0.0045, .ring_spacing_arcsec = 0.009};

  // Net ring flux does not depend on the ring radius.
  for (const double flux : {2.7e-4, 5.0e-3, -1.0e-3}) {
    for (int j = 0; j < 6; ++j) {
      const auto r = ringsky::geometry::compute_ring(j, layout, FluxSpec::total_flux(flux), 0.0);
      if (r.status != Status::Ok || !approx(r.net_flux_jy(), flux, 1e-9)) {
        spdlog::error("flux invariance failed at j={} flux={}: net={}", j, flux, r.net_flux_jy());
        return 1;
      }
    }
  }

  // Unset total flux falls back to the default.
  const auto fallback = ringsky::geometry::compute_ring(2, layout, FluxSpec::total_flux(std::nullopt), 2.7e-4);
  if (fallback.status != Status::Ok || !approx(fallback.net_flux_jy(), 2.7e-4, 1e-9)) {
    spdlog::error("default flux fallback failed");
    return 2;
  }

  const auto sb = ringsky::geometry::compute_ring(1, layout, FluxSpec::surface_brightness(1.0), 2.7e-4);
  if (sb.status != Status::Ok || !approx(sb.net_flux_jy() / sb.annulus_area_arcsec2, 1.0, 1e-9)
      || !approx(sb.outer_flux_jy, sb.outer_area_arcsec2, 1e-12) || !approx(sb.inner_flux_jy, sb.inner_area_arcsec2, 1e-12)) {
    spdlog::error("surface brightness consistency failed");
    return 3;
  }

  const auto set = ringsky::geometry::compute_rings(5, layout, FluxSpec::total_flux(2.7e-4), 2.7e-4);
  if (set.status != Status::Ok || set.rings.size() != 5U) {
    spdlog::error("compute_rings failed");
    return 4;
  }
  for (std::size_t j = 0; j < set.rings.size(); ++j) {
    const auto& r = set.rings[j];
    if (!(r.inner_radius_arcsec < r.outer_radius_arcsec) || r.index != static_cast<int>(j)) {
      spdlog::error("ring {} radii not ordered", j);
      return 5;
    }
    if (j + 1 < set.rings.size()) {
      const auto& next = set.rings[j + 1];
      if (!(r.outer_radius_arcsec <= next.inner_radius_arcsec)
          || !approx(next.inner_radius_arcsec - r.outer_radius_arcsec, layout.ring_spacing_arcsec, 1e-9)) {
        spdlog::error("ring {} overlaps or mis-spaced against ring {}", j, j + 1);
        return 6;
      }
    }
  }
  if (!approx(set.rings[0].inner_radius_arcsec, 0.00225, 1e-12) || !approx(set.rings[0].outer_radius_arcsec, 0.00675, 1e-12)
      || !approx(set.rings[1].inner_radius_arcsec, 0.01575, 1e-12)) {
    spdlog::error("ring radii differ from Rc + j (thickness + spacing)");
    return 7;
  }

  // Zero thickness: total-flux mode rejects, surface-brightness mode accepts with zero net flux.
  const RingLayout flat{.central_diameter_arcsec = 0.0045, .ring_thickness_arcsec = 0.0, .ring_spacing_arcsec = 0.009};
  const auto degenerate = ringsky::geometry::compute_ring(0, flat, FluxSpec::total_flux(2.7e-4), 2.7e-4);
  if (degenerate.status != Status::DegenerateRing || std::isnan(degenerate.outer_flux_jy)) {
    spdlog::error("zero-thickness total-flux ring not rejected");
    return 8;
  }
  const auto flat_sb = ringsky::geometry::compute_ring(0, flat, FluxSpec::surface_brightness(1.0), 2.7e-4);
  if (flat_sb.status != Status::Ok || flat_sb.net_flux_jy() != 0.0 || flat_sb.annulus_area_arcsec2 != 0.0) {
    spdlog::error("zero-thickness surface-brightness ring rejected");
    return 9;
  }
  const RingLayout point{.central_diameter_arcsec = 0.0, .ring_thickness_arcsec = 0.0, .ring_spacing_arcsec = 0.0};
  const auto point_sb = ringsky::geometry::compute_ring(0, point, FluxSpec::surface_brightness(1.0), 0.0);
  if (point_sb.status != Status::Ok || point_sb.outer_flux_jy != 0.0 || point_sb.inner_flux_jy != 0.0) {
    spdlog::error("zero-radius surface-brightness ring not zero flux");
    return 10;
  }
  const auto set_degenerate = ringsky::geometry::compute_rings(3, flat, FluxSpec::total_flux(2.7e-4), 2.7e-4);
  if (set_degenerate.status != Status::DegenerateRing || !set_degenerate.rings.empty()) {
    spdlog::error("compute_rings did not stop at the degenerate ring");
    return 11;
  }

  // Reference numbers: Rin = 0.00225, Rout = 0.0045, F = 2.7e-4 Jy.
  const RingLayout reference{.central_diameter_arcsec = 0.0045, .ring_thickness_arcsec = 0.00225, .ring_spacing_arcsec = 0.009};
  const auto ref = ringsky::geometry::compute_ring(0, reference, FluxSpec::total_flux(2.7e-4), 2.7e-4);
  const double expected_area = kPi * (0.0045 * 0.0045 - 0.00225 * 0.00225);
  if (ref.status != Status::Ok || !approx(ref.inner_radius_arcsec, 0.00225, 1e-12) || !approx(ref.outer_radius_arcsec, 0.0045, 1e-12)
      || !approx(ref.annulus_area_arcsec2, expected_area, 1e-12) || !approx(ref.annulus_area_arcsec2, 4.77e-5, 1e-2)
      || !approx(ref.surface_brightness_jy_arcsec2, 5.66, 1e-2) || !approx(ref.outer_flux_jy, 3.60e-4, 1e-2)
      || !approx(ref.inner_flux_jy, 9.0e-5, 1e-2) || !approx(ref.net_flux_jy(), 2.7e-4, 1e-9)) {
    spdlog::error("reference ring values differ: A={} I={} Fout={} Finn={}",
                  ref.annulus_area_arcsec2,
                  ref.surface_brightness_jy_arcsec2,
                  ref.outer_flux_jy,
                  ref.inner_flux_jy);
    return 12;
  }

  if (ringsky::geometry::compute_ring(-1, layout, FluxSpec::total_flux(1.0), 1.0).status != Status::InvalidConfig
      || ringsky::geometry::compute_rings(-2, layout, FluxSpec::total_flux(1.0), 1.0).status != Status::InvalidConfig) {
    spdlog::error("negative index/count accepted");
    return 13;
  }
  const RingLayout negative{.central_diameter_arcsec = 0.0045, .ring_thickness_arcsec = -0.001, .ring_spacing_arcsec = 0.009};
  if (ringsky::geometry::compute_ring(0, negative, FluxSpec::total_flux(1.0), 1.0).status != Status::DegenerateRing
      || ringsky::geometry::compute_ring(0, negative, FluxSpec::surface_brightness(1.0), 1.0).status != Status::DegenerateRing) {
    spdlog::error("negative thickness not reported as a degenerate ring");
    return 14;
  }

  // Finite inputs whose disk fluxes overflow are rejected instead of emitting Inf/NaN.
  const RingLayout wide{.central_diameter_arcsec = 1000.0, .ring_thickness_arcsec = 1.0, .ring_spacing_arcsec = 0.0};
  const auto overflow = ringsky::geometry::compute_ring(0, wide, FluxSpec::total_flux(1.0e307), 0.0);
  if (overflow.status != Status::NumericalError || std::isinf(overflow.outer_flux_jy) || std::isnan(overflow.net_flux_jy())) {
    spdlog::error("overflowing total-flux ring accepted: Fout={}", overflow.outer_flux_jy);
    return 16;
  }
  const auto sb_overflow = ringsky::geometry::compute_ring(0, wide, FluxSpec::surface_brightness(1.0e305), 0.0);
  if (sb_overflow.status != Status::NumericalError) {
    spdlog::error("overflowing surface-brightness ring accepted");
    return 17;
  }
  const auto set_overflow = ringsky::geometry::compute_rings(2, wide, FluxSpec::total_flux(1.0e307), 0.0);
  if (set_overflow.status != Status::NumericalError || !set_overflow.rings.empty()) {
    spdlog::error("compute_rings did not stop at the overflowing ring");
    return 18;
  }

  RecordingObserver observer;
  const auto observed = ringsky::geometry::compute_rings(3, layout, FluxSpec::total_flux(2.7e-4), 2.7e-4, &observer);
  if (observed.status != Status::Ok || observer.rings.size() != 3U || observer.rings[2].index != 2
      || !approx(observer.rings[1].net_flux_jy, 2.7e-4, 1e-9)
      || !approx(observer.rings[0].outer_radius_arcsec, observed.rings[0].outer_radius_arcsec, 1e-15)) {
    spdlog::error("observer did not receive one summary per ring");
    return 15;
  }

  return 0;
}

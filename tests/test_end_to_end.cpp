/**
 * @file test_end_to_end.cpp
 * @brief End-to-end ring sky-model pipeline test.
 * @author Watosn
 */

#include <algorithm>
#include <cmath>
#include <memory>
#include <sstream>
#include <string>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

#include "ringsky/core/constants.hpp"
#include "ringsky/model/logging_observer.hpp"
#include "ringsky/pipeline/ring_sky_pipeline.hpp"

namespace {

bool approx(double a, double b, double rel) { return std::abs(a - b) <= rel * std::max(1.0e-30, std::abs(b)); }

}  // namespace

int main() {
  using namespace ringsky;
  using core::Status;

  std::ostringstream log_text;
  auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(log_text);
  auto logger = std::make_shared<spdlog::logger>("ringsky_test", sink);
  logger->set_level(spdlog::level::debug);
  model::LoggingSkyModelObserver observer(logger);

  const config::RunConfig defaults{};
  const auto out = pipeline::run_pipeline(defaults, &observer);
  if (out.status != Status::Ok) {
    spdlog::error("pipeline failed: {}", out.detail);
    return 1;
  }
  if (out.rings.size() != 3U || out.model.size() != 7U || out.clipped_components != 0U) {
    spdlog::error("unexpected model size {} / rings {}", out.model.size(), out.rings.size());
    return 2;
  }
  if (!approx(out.center.ra_rad, core::constants::kPi, 1e-12) || !approx(out.center.dec_rad, -23.0 * core::constants::kDegToRad, 1e-12)
      || out.freq_hz != 343.5e9) {
    spdlog::error("center or frequency wrong");
    return 3;
  }
  const double expected_total = 4.0 * 2.7e-4;
  if (!approx(out.model.total_flux_jy(), expected_total, 1e-9) || !approx(out.image.sum(), expected_total, 1e-9)) {
    spdlog::error("flux not conserved: model {} image {}", out.model.total_flux_jy(), out.image.sum());
    return 4;
  }
  if (out.image_name != "ringModel_decm2300m0000" || out.image.shape().nx != 160 || out.image.brightness_unit() != "Jy/pixel") {
    spdlog::error("unexpected image name or shape: {}", out.image_name);
    return 5;
  }
  logger->flush();
  const auto text = log_text.str();
  if (text.find("Ring 1: Rin=") == std::string::npos || text.find("Ring 3: Rin=") == std::string::npos
      || text.find("Jy/arcsec^2") == std::string::npos || text.find("component 6:") == std::string::npos) {
    spdlog::error("observer log lines missing");
    return 6;
  }

  // Reference ring: Rin = 0.00225", Rout = 0.0045", ring flux 2.7e-4 Jy.
  auto single = defaults;
  single.n_rings = 1;
  single.ring_thickness = 0.00225;
  single.ring_flux = 2.7e-4;
  const auto one = pipeline::run_pipeline(single);
  if (one.status != Status::Ok || one.model.size() != 3U) {
    spdlog::error("single ring run failed: {}", one.detail);
    return 7;
  }
  const auto& ring = one.rings.front();
  if (!approx(ring.inner_radius_arcsec, 0.00225, 1e-12) || !approx(ring.outer_radius_arcsec, 0.0045, 1e-12)
      || !approx(ring.annulus_area_arcsec2, 4.77e-5, 1e-2) || !approx(ring.surface_brightness_jy_arcsec2, 5.66, 1e-2)
      || !approx(ring.outer_flux_jy, 3.60e-4, 1e-2) || !approx(ring.inner_flux_jy, 9.0e-5, 1e-2)
      || !approx(ring.net_flux_jy(), 2.7e-4, 1e-9)) {
    spdlog::error("reference ring values differ");
    return 8;
  }
  if (!approx(one.model.components[1].flux_jy, ring.outer_flux_jy, 1e-15) || !approx(one.model.components[2].flux_jy, -ring.inner_flux_jy, 1e-15)) {
    spdlog::error("ring disks carry wrong signed flux");
    return 9;
  }

  // Precedence: ring_flux replaces flux for rings only.
  auto precedence = defaults;
  precedence.ring_flux = 5.0e-3;
  const auto prec = pipeline::run_pipeline(precedence);
  if (prec.status != Status::Ok || !approx(prec.rings[2].net_flux_jy(), 5.0e-3, 1e-9)
      || !approx(prec.model.components[0].flux_jy, 2.7e-4, 1e-15)) {
    spdlog::error("ring_flux precedence not applied");
    return 10;
  }
  precedence.ring_surface_brightness = 1.0;
  const auto sb = pipeline::run_pipeline(precedence);
  if (sb.status != Status::Ok || !approx(sb.rings[1].surface_brightness_jy_arcsec2, 1.0, 1e-15)
      || !approx(sb.rings[1].net_flux_jy(), sb.rings[1].annulus_area_arcsec2, 1e-9)) {
    spdlog::error("surface brightness precedence not applied");
    return 11;
  }

  auto degenerate = defaults;
  degenerate.ring_thickness = 0.0;
  const auto rejected = pipeline::run_pipeline(degenerate);
  if (rejected.status != Status::DegenerateRing || !rejected.model.empty() || rejected.image.sum() != 0.0) {
    spdlog::error("degenerate ring not rejected");
    return 12;
  }

  auto bad_dec = defaults;
  bad_dec.dec_center = "-23x00";
  const auto bad = pipeline::run_pipeline(bad_dec);
  if (bad.status != Status::InvalidAngle || bad.detail.find("Dec") == std::string::npos || !bad.rings.empty()) {
    spdlog::error("invalid declination not rejected before geometry");
    return 13;
  }

  auto no_rings = defaults;
  no_rings.n_rings = 0;
  const auto central_only = pipeline::run_pipeline(no_rings);
  if (central_only.status != Status::Ok || central_only.model.size() != 1U || !approx(central_only.image.sum(), 2.7e-4, 1e-9)) {
    spdlog::error("central-only model failed");
    return 14;
  }

  return 0;
}

/**
 * @file ring_sky_pipeline.cpp
 * @brief In-memory ring sky-model pipeline implementation.
 * @author Watosn
 */

#include "ringsky/pipeline/ring_sky_pipeline.hpp"

#include <utility>

#include "ringsky/imaging/naming.hpp"
#include "ringsky/imaging/rasterizer.hpp"
#include "ringsky/units/angle.hpp"
#include "ringsky/units/frequency.hpp"

namespace ringsky::pipeline {
namespace {

using ringsky::core::Status;

PipelineResult fail(PipelineResult out, Status status, std::string detail) {
  out.status = status;
  out.detail = std::move(detail);
  return out;
}

}  // namespace

PipelineResult run_pipeline(const ringsky::config::RunConfig& config, ringsky::core::ISkyModelObserver* observer) {
  PipelineResult out{};

  const auto valid = ringsky::config::validate(config);
  if (valid.status != Status::Ok) {
    return fail(std::move(out), valid.status, valid.detail);
  }

  // validate() has already accepted these strings.
  const auto ra = ringsky::units::parse_angle(config.ra_center);
  const auto dec = ringsky::units::parse_angle(config.dec_center);
  const auto freq = ringsky::units::parse_frequency(config.freq);
  const auto freq_inc = ringsky::units::parse_frequency(config.freq_increment);
  out.center = ringsky::core::Direction{.ra_rad = ra.radians, .dec_rad = dec.radians};
  out.freq_hz = freq.hz;

  auto rings = ringsky::geometry::compute_rings(config.n_rings,
                                                ringsky::config::ring_layout(config),
                                                ringsky::config::ring_flux_spec(config),
                                                config.flux,
                                                observer);
  if (rings.status != Status::Ok) {
    return fail(std::move(out), rings.status, rings.detail);
  }
  out.rings = std::move(rings.rings);

  auto assembled = ringsky::model::assemble(out.center,
                                            config.central_diameter,
                                            ringsky::config::central_flux(config),
                                            out.rings,
                                            out.freq_hz,
                                            observer);
  if (assembled.status != Status::Ok) {
    return fail(std::move(out), assembled.status, assembled.detail);
  }
  out.model = std::move(assembled.model);

  const ringsky::imaging::GridSpec grid{
      .shape = ringsky::imaging::ImageShape{.nx = config.im_shape[0], .ny = config.im_shape[1]},
      .cell_size_arcsec = config.cell_size,
      .center = out.center,
      .freq_hz = out.freq_hz,
      .spectral_increment_hz = freq_inc.hz,
  };
  auto image = ringsky::imaging::build_grid(grid, out.model, ringsky::imaging::RasterOptions{.oversample = config.oversample});
  if (image.status != Status::Ok) {
    return fail(std::move(out), image.status, image.detail);
  }
  out.image = std::move(image.image);
  out.clipped_components = image.clipped_components;
  out.image_name = ringsky::imaging::image_name(config.output_base, config.dec_center);
  return out;
}

}  // namespace ringsky::pipeline

/**
 * @file ring_sky_pipeline.hpp
 * @brief In-memory ring sky-model pipeline (validate -> rings -> components -> image).
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "ringsky/config/run_config.hpp"
#include "ringsky/core/interfaces.hpp"
#include "ringsky/core/types.hpp"
#include "ringsky/geometry/ring_geometry.hpp"
#include "ringsky/imaging/pixel_image.hpp"
#include "ringsky/model/sky_model.hpp"

namespace ringsky::pipeline {

/**
 * @brief Everything one run produces before export.
 *
 * When `status != Ok` the run stopped at the failing stage and later fields are empty.
 */
struct PipelineResult {
  ringsky::core::Direction center{};
  double freq_hz{};
  std::vector<ringsky::geometry::RingResult> rings{};
  ringsky::model::SkyModel model{};
  ringsky::imaging::PixelImage image{};
  std::string image_name{};
  std::size_t clipped_components{};
  ringsky::core::Status status{ringsky::core::Status::Ok};
  std::string detail{};
};

/**
 * @brief Run the full pipeline for one configuration without touching the filesystem.
 * @param config Run configuration (validated here first).
 * @param observer Optional sink for ring and component events.
 */
[[nodiscard]] PipelineResult run_pipeline(const ringsky::config::RunConfig& config,
                                          ringsky::core::ISkyModelObserver* observer = nullptr);

}  // namespace ringsky::pipeline

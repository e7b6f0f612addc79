/**
 * @file rasterizer.hpp
 * @brief Disk component stamping and image grid construction.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <string>

#include "ringsky/core/constants.hpp"
#include "ringsky/core/types.hpp"
#include "ringsky/imaging/pixel_image.hpp"
#include "ringsky/model/sky_model.hpp"

namespace ringsky::imaging {

/**
 * @brief Sub-pixel sampling controls.
 */
struct RasterOptions {
  int oversample{8};
};

/**
 * @brief Outcome of stamping one disk.
 */
struct StampResult {
  double deposited_flux_jy{};
  bool clipped{};
  ringsky::core::Status status{ringsky::core::Status::Ok};
};

/**
 * @brief Grid request: shape, pixel scale, phase centre and spectral reference.
 */
struct GridSpec {
  ImageShape shape{};
  double cell_size_arcsec{};
  ringsky::core::Direction center{};
  double freq_hz{};
  double spectral_increment_hz{ringsky::core::constants::kDefaultSpectralIncrementHz};
};

/**
 * @brief Image build output bundle.
 */
struct ImageResult {
  PixelImage image{};
  std::size_t clipped_components{};
  ringsky::core::Status status{ringsky::core::Status::Ok};
  std::string detail{};
};

/**
 * @brief Add one uniform disk to the image (signed flux).
 *
 * Each pixel receives flux proportional to the number of its oversample x oversample
 * sub-samples falling inside the disk. When the disk's bounding box lies fully inside the
 * image the weights are normalized by the total hit count, so the deposited flux equals the
 * component flux exactly; otherwise weights use the analytic disk area and flux beyond the
 * image edge is dropped. A disk that hits no sub-sample is deposited on its nearest pixel.
 */
StampResult stamp_disk(PixelImage& image, const ringsky::core::DiskComponent& disk, const RasterOptions& options = {});

/**
 * @brief Allocate the zeroed grid, attach its coordinate system and stamp every component.
 */
[[nodiscard]] ImageResult build_grid(const GridSpec& spec,
                                     const ringsky::model::SkyModel& model,
                                     const RasterOptions& options = {});

}  // namespace ringsky::imaging

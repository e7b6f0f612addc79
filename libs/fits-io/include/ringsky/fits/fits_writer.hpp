/**
 * @file fits_writer.hpp
 * @brief FITS export of the model image.
 * @author Watosn
 */
#pragma once

#include <filesystem>
#include <string>

#include "ringsky/core/types.hpp"
#include "ringsky/imaging/pixel_image.hpp"

namespace ringsky::fits {

/**
 * @brief FITS export options.
 */
struct FitsWriteOptions {
  bool overwrite{true};
  std::string object{"ring sky model"};
  std::string origin{"ringsky"};
};

/**
 * @brief FITS export outcome.
 */
struct FitsWriteResult {
  ringsky::core::Status status{ringsky::core::Status::Ok};
  std::string detail{};
};

/**
 * @brief Write a 4-axis (RA---SIN, DEC--SIN, STOKES, FREQ) single-precision image.
 *
 * Direction reference values and increments are written in degrees; CRPIX follows the
 * 1-based FITS convention (internal reference pixel + 1).
 *
 * The image is written to `<path>.partial` and renamed over `path` only after cfitsio closes
 * it cleanly. On any failure the partial file is deleted and an existing `path` is left as it
 * was.
 */
[[nodiscard]] FitsWriteResult write_fits(const ringsky::imaging::PixelImage& image,
                                         const std::filesystem::path& path,
                                         const FitsWriteOptions& options = {});

}  // namespace ringsky::fits

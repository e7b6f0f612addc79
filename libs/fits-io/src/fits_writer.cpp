/**
 * @file fits_writer.cpp
 * @brief FITS export of the model image via cfitsio.
 * @author Watosn
 */

#include "ringsky/fits/fits_writer.hpp"

#include <array>
#include <cmath>
#include <memory>
#include <system_error>
#include <vector>

#include <fitsio.h>
#include <fmt/format.h>

#include "ringsky/core/constants.hpp"

namespace ringsky::fits {
namespace {

using ringsky::core::Status;

// Deletes (rather than closes) a file that was not completed.
struct FitsDiscarder {
  void operator()(fitsfile* f) const {
    int status = 0;
    fits_delete_file(f, &status);
  }
};

using FitsHandle = std::unique_ptr<fitsfile, FitsDiscarder>;

std::string fits_error(int status) {
  std::array<char, FLEN_STATUS> text{};
  fits_get_errstatus(status, text.data());
  return std::string(text.data());
}

void write_string(fitsfile* f, const char* key, const std::string& value, const char* comment, int& status) {
  fits_write_key(f, TSTRING, key, const_cast<char*>(value.c_str()), comment, &status);
}

void write_double(fitsfile* f, const char* key, double value, const char* comment, int& status) {
  fits_write_key(f, TDOUBLE, key, &value, comment, &status);
}

double wrap_degrees(double deg) {
  const double wrapped = std::fmod(deg, 360.0);
  return wrapped < 0.0 ? wrapped + 360.0 : wrapped;
}

}  // namespace

FitsWriteResult write_fits(const ringsky::imaging::PixelImage& image,
                           const std::filesystem::path& path,
                           const FitsWriteOptions& options) {
  const auto& shape = image.shape();
  if (shape.nx <= 0 || shape.ny <= 0) {
    return FitsWriteResult{.status = Status::InvalidConfig, .detail = "cannot export an empty image"};
  }
  if (!options.overwrite && std::filesystem::exists(path)) {
    return FitsWriteResult{.status = Status::IoError, .detail = fmt::format("{} already exists", path.string())};
  }

  // Written next to the target and renamed once complete; the target is untouched on failure.
  std::filesystem::path partial = path;
  partial += ".partial";
  std::error_code ec;
  std::filesystem::remove(partial, ec);

  int status = 0;
  fitsfile* raw = nullptr;
  if (fits_create_file(&raw, partial.string().c_str(), &status) != 0) {
    return FitsWriteResult{.status = Status::IoError,
                           .detail = fmt::format("failed to create {}: {}", path.string(), fits_error(status))};
  }
  FitsHandle file(raw);

  auto full = image.full_shape();
  if (fits_create_img(file.get(), FLOAT_IMG, static_cast<int>(full.size()), full.data(), &status) != 0) {
    return FitsWriteResult{.status = Status::IoError, .detail = fmt::format("failed to create image HDU: {}", fits_error(status))};
  }

  const auto& cs = image.coordinates();
  constexpr double kRadToDeg = 1.0 / ringsky::core::constants::kDegToRad;

  write_string(file.get(), "OBJECT", options.object, "Source name", status);
  write_string(file.get(), "ORIGIN", options.origin, "Software", status);
  write_string(file.get(), "BTYPE", "Intensity", "", status);
  write_string(file.get(), "BUNIT", image.brightness_unit(), "Brightness (pixel) unit", status);
  write_double(file.get(), "EQUINOX", 2000.0, "Equinox of coordinates", status);
  write_string(file.get(), "RADESYS", "FK5", "", status);

  write_string(file.get(), "CTYPE1", "RA---SIN", "Coordinate type", status);
  write_double(file.get(), "CRPIX1", cs.direction.ref_pixel_x + 1.0, "Reference pixel", status);
  write_double(file.get(), "CRVAL1", wrap_degrees(cs.direction.ref_ra_rad * kRadToDeg), "Reference value (deg)", status);
  write_double(file.get(), "CDELT1", cs.direction.increment_x_rad * kRadToDeg, "Pixel size (deg)", status);
  write_string(file.get(), "CUNIT1", "deg", "Axis unit", status);

  write_string(file.get(), "CTYPE2", "DEC--SIN", "Coordinate type", status);
  write_double(file.get(), "CRPIX2", cs.direction.ref_pixel_y + 1.0, "Reference pixel", status);
  write_double(file.get(), "CRVAL2", cs.direction.ref_dec_rad * kRadToDeg, "Reference value (deg)", status);
  write_double(file.get(), "CDELT2", cs.direction.increment_y_rad * kRadToDeg, "Pixel size (deg)", status);
  write_string(file.get(), "CUNIT2", "deg", "Axis unit", status);

  write_string(file.get(), "CTYPE3", "STOKES", "Coordinate type", status);
  write_double(file.get(), "CRPIX3", 1.0, "Reference pixel", status);
  write_double(file.get(), "CRVAL3", 1.0, "Stokes I", status);
  write_double(file.get(), "CDELT3", 1.0, "Increment", status);

  write_string(file.get(), "CTYPE4", "FREQ", "Coordinate type", status);
  write_double(file.get(), "CRPIX4", cs.spectral.ref_pixel + 1.0, "Reference pixel", status);
  write_double(file.get(), "CRVAL4", cs.spectral.ref_freq_hz, "Reference value (Hz)", status);
  write_double(file.get(), "CDELT4", cs.spectral.increment_hz, "Channel width (Hz)", status);
  write_string(file.get(), "CUNIT4", "Hz", "Axis unit", status);
  write_string(file.get(), "SPECSYS", "LSRK", "Spectral reference frame", status);
  if (status != 0) {
    return FitsWriteResult{.status = Status::IoError, .detail = fmt::format("failed to write header: {}", fits_error(status))};
  }

  const auto& pixels = image.pixels();
  std::vector<float> data(static_cast<std::size_t>(pixels.size()));
  for (Eigen::Index i = 0; i < pixels.size(); ++i) {
    data[static_cast<std::size_t>(i)] = static_cast<float>(pixels.data()[i]);
  }
  std::array<long, 4> first_pixel{1, 1, 1, 1};
  if (fits_write_pix(file.get(), TFLOAT, first_pixel.data(), static_cast<LONGLONG>(data.size()), data.data(), &status) != 0) {
    return FitsWriteResult{.status = Status::IoError, .detail = fmt::format("failed to write pixels: {}", fits_error(status))};
  }

  fitsfile* closing = file.release();
  if (fits_close_file(closing, &status) != 0) {
    std::filesystem::remove(partial, ec);
    return FitsWriteResult{.status = Status::IoError, .detail = fmt::format("failed to close {}: {}", path.string(), fits_error(status))};
  }
  std::filesystem::rename(partial, path, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(partial, ignored);
    return FitsWriteResult{.status = Status::IoError,
                           .detail = fmt::format("failed to move {} into place: {}", path.string(), ec.message())};
  }
  return FitsWriteResult{};
}

}  // namespace ringsky::fits

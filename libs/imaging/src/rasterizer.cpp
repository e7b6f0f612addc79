/**
 * @file rasterizer.cpp
 * @brief Disk component stamping and image grid construction.
 * @author Watosn
 */

#include "ringsky/imaging/rasterizer.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

namespace ringsky::imaging {
namespace {

using ringsky::core::Status;

constexpr int kMaxOversample = 64;

// Index of the pixel whose cell [i - 0.5, i + 0.5) contains p, clamped to [lo, hi].
int nearest_pixel(const double p, const int lo, const int hi) {
  const double clamped = std::clamp(std::floor(p + 0.5), static_cast<double>(lo), static_cast<double>(hi));
  return static_cast<int>(clamped);
}

}  // namespace

StampResult stamp_disk(PixelImage& image, const ringsky::core::DiskComponent& disk, const RasterOptions& options) {
  StampResult out{};
  if (!std::isfinite(disk.flux_jy) || !std::isfinite(disk.diameter_arcsec) || disk.diameter_arcsec < 0.0) {
    out.status = Status::NumericalError;
    return out;
  }
  if (options.oversample < 1 || options.oversample > kMaxOversample) {
    out.status = Status::InvalidConfig;
    return out;
  }
  if (disk.flux_jy == 0.0) {
    return out;
  }

  const auto& cs = image.coordinates();
  double cx = 0.0;
  double cy = 0.0;
  if (!cs.world_to_pixel(disk.center, cx, cy)) {
    out.clipped = true;
    return out;
  }

  const double radius_rad = 0.5 * disk.diameter_arcsec * ringsky::core::constants::kArcsecToRad;
  const double rx = radius_rad / std::abs(cs.direction.increment_x_rad);
  const double ry = radius_rad / std::abs(cs.direction.increment_y_rad);
  const int nx = image.shape().nx;
  const int ny = image.shape().ny;

  // Bounding box in pixel indices, clamped one pixel beyond the image to keep int casts safe.
  const int x_lo = nearest_pixel(cx - rx, -1, nx);
  const int x_hi = nearest_pixel(cx + rx, -1, nx);
  const int y_lo = nearest_pixel(cy - ry, -1, ny);
  const int y_hi = nearest_pixel(cy + ry, -1, ny);
  const bool inside = x_lo >= 0 && y_lo >= 0 && x_hi < nx && y_hi < ny;

  const int bx_lo = std::max(x_lo, 0);
  const int bx_hi = std::min(x_hi, nx - 1);
  const int by_lo = std::max(y_lo, 0);
  const int by_hi = std::min(y_hi, ny - 1);
  if (bx_lo > bx_hi || by_lo > by_hi) {
    out.clipped = true;
    return out;
  }

  const int n = options.oversample;
  const double step = 1.0 / static_cast<double>(n);
  Eigen::MatrixXd hits = Eigen::MatrixXd::Zero(bx_hi - bx_lo + 1, by_hi - by_lo + 1);
  double total_hits = 0.0;
  if (rx > 0.0 && ry > 0.0) {
    for (int x = bx_lo; x <= bx_hi; ++x) {
      for (int y = by_lo; y <= by_hi; ++y) {
        int count = 0;
        for (int a = 0; a < n; ++a) {
          const double dx = (static_cast<double>(x) - 0.5 + (a + 0.5) * step - cx) / rx;
          for (int b = 0; b < n; ++b) {
            const double dy = (static_cast<double>(y) - 0.5 + (b + 0.5) * step - cy) / ry;
            if (dx * dx + dy * dy <= 1.0) {
              ++count;
            }
          }
        }
        hits(x - bx_lo, y - by_lo) = count;
        total_hits += count;
      }
    }
  }

  if (total_hits == 0.0) {
    // Unresolved disk: treat as a point source.
    const int px = static_cast<int>(std::floor(cx + 0.5));
    const int py = static_cast<int>(std::floor(cy + 0.5));
    if (!image.contains(px, py)) {
      out.clipped = true;
      return out;
    }
    image.at(px, py) += disk.flux_jy;
    out.deposited_flux_jy = disk.flux_jy;
    return out;
  }

  const double norm = inside ? total_hits : ringsky::core::constants::kPi * rx * ry * static_cast<double>(n * n);
  for (int x = bx_lo; x <= bx_hi; ++x) {
    for (int y = by_lo; y <= by_hi; ++y) {
      const double h = hits(x - bx_lo, y - by_lo);
      if (h == 0.0) {
        continue;
      }
      const double v = disk.flux_jy * h / norm;
      image.at(x, y) += v;
      out.deposited_flux_jy += v;
    }
  }
  out.clipped = !inside;
  return out;
}

ImageResult build_grid(const GridSpec& spec, const ringsky::model::SkyModel& model, const RasterOptions& options) {
  ImageResult out{};
  if (spec.shape.nx <= 0 || spec.shape.ny <= 0) {
    out.status = Status::InvalidConfig;
    out.detail = fmt::format("image shape must be positive, got {}x{}", spec.shape.nx, spec.shape.ny);
    return out;
  }
  if (!std::isfinite(spec.cell_size_arcsec) || spec.cell_size_arcsec <= 0.0) {
    out.status = Status::InvalidConfig;
    out.detail = fmt::format("cell size must be positive, got {}", spec.cell_size_arcsec);
    return out;
  }
  if (!std::isfinite(spec.freq_hz) || spec.freq_hz <= 0.0 || !std::isfinite(spec.spectral_increment_hz)) {
    out.status = Status::InvalidFrequency;
    out.detail = "reference frequency must be positive and spectral increment finite";
    return out;
  }
  if (options.oversample < 1 || options.oversample > kMaxOversample) {
    out.status = Status::InvalidConfig;
    out.detail = fmt::format("oversample must be in [1, {}], got {}", kMaxOversample, options.oversample);
    return out;
  }

  out.image = PixelImage(spec.shape,
                         make_coordinate_system(spec.shape, spec.cell_size_arcsec, spec.center, spec.freq_hz,
                                                spec.spectral_increment_hz));
  out.image.set_brightness_unit("Jy/pixel");

  for (std::size_t i = 0; i < model.components.size(); ++i) {
    const auto stamped = stamp_disk(out.image, model.components[i], options);
    if (stamped.status != Status::Ok) {
      out.status = stamped.status;
      out.detail = fmt::format("failed to stamp component {}", i);
      return out;
    }
    if (stamped.clipped) {
      ++out.clipped_components;
    }
  }
  return out;
}

}  // namespace ringsky::imaging

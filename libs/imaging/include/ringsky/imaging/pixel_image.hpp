/**
 * @file pixel_image.hpp
 * @brief In-memory model image with attached coordinate system.
 * @author Watosn
 */
#pragma once

#include <array>
#include <string>
#include <utility>

#include <Eigen/Dense>

#include "ringsky/imaging/coordinate_system.hpp"

namespace ringsky::imaging {

/**
 * @brief Model image of shape (nx, ny, 1, 1) in Jy/pixel.
 *
 * Pixels are stored column-major with x as the fastest axis, matching FITS order.
 */
class PixelImage final {
 public:
  PixelImage() = default;
  PixelImage(const ImageShape& shape, CoordinateSystem coordinates)
      : shape_(shape), coordinates_(std::move(coordinates)), pixels_(Eigen::MatrixXd::Zero(shape.nx, shape.ny)) {}

  [[nodiscard]] const ImageShape& shape() const { return shape_; }
  /**
   * @brief Full 4-axis shape (x, y, Stokes, frequency).
   */
  [[nodiscard]] std::array<long, 4> full_shape() const { return {shape_.nx, shape_.ny, 1L, 1L}; }
  [[nodiscard]] const CoordinateSystem& coordinates() const { return coordinates_; }

  [[nodiscard]] const std::string& brightness_unit() const { return brightness_unit_; }
  void set_brightness_unit(std::string unit) { brightness_unit_ = std::move(unit); }

  [[nodiscard]] bool contains(const int x, const int y) const { return x >= 0 && y >= 0 && x < shape_.nx && y < shape_.ny; }
  [[nodiscard]] double& at(const int x, const int y) { return pixels_(x, y); }
  [[nodiscard]] double at(const int x, const int y) const { return pixels_(x, y); }

  [[nodiscard]] const Eigen::MatrixXd& pixels() const { return pixels_; }
  [[nodiscard]] double sum() const { return pixels_.sum(); }

 private:
  ImageShape shape_{};
  CoordinateSystem coordinates_{};
  Eigen::MatrixXd pixels_{};
  std::string brightness_unit_{"Jy/pixel"};
};

}  // namespace ringsky::imaging

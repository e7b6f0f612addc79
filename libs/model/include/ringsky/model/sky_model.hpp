/**
 * @file sky_model.hpp
 * @brief Disk component list assembly for the central disk + ring model.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "ringsky/core/interfaces.hpp"
#include "ringsky/core/types.hpp"
#include "ringsky/geometry/ring_geometry.hpp"

namespace ringsky::model {

/**
 * @brief Ordered disk component list: central disk, then (outer, inner) per ring.
 */
struct SkyModel {
  std::vector<ringsky::core::DiskComponent> components{};

  [[nodiscard]] std::size_t size() const { return components.size(); }
  [[nodiscard]] bool empty() const { return components.empty(); }
  /**
   * @brief Sum of signed component fluxes (Jy).
   */
  [[nodiscard]] double total_flux_jy() const;
};

/**
 * @brief Assembly output bundle.
 */
struct AssemblyResult {
  SkyModel model{};
  ringsky::core::Status status{ringsky::core::Status::Ok};
  std::string detail{};
};

/**
 * @brief Build one disk component with position angle 0.
 */
ringsky::core::DiskComponent make_disk(const ringsky::core::Direction& center,
                                       double diameter_arcsec,
                                       double flux_jy,
                                       double freq_hz);

/**
 * @brief Components realizing one ring: outer disk (+Fout) followed by inner disk (-Finn).
 */
std::vector<ringsky::core::DiskComponent> ring_components(const ringsky::core::Direction& center,
                                                          const ringsky::geometry::RingResult& ring,
                                                          double freq_hz);

/**
 * @brief Assemble the full model: central disk first, then each ring in ascending index.
 *
 * Every ring must carry `Status::Ok`. The observer, when given, receives each emitted
 * component in model order.
 */
[[nodiscard]] AssemblyResult assemble(const ringsky::core::Direction& center,
                                      double central_diameter_arcsec,
                                      double central_flux_jy,
                                      const std::vector<ringsky::geometry::RingResult>& rings,
                                      double freq_hz,
                                      ringsky::core::ISkyModelObserver* observer = nullptr);

}  // namespace ringsky::model

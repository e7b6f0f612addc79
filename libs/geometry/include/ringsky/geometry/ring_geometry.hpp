/**
 * @file ring_geometry.hpp
 * @brief Ring radii/area and flux-normalization engine.
 * @author Watosn
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "ringsky/core/interfaces.hpp"
#include "ringsky/core/types.hpp"

namespace ringsky::geometry {

/**
 * @brief How ring flux is specified.
 */
enum class FluxMode : std::uint8_t { TotalFluxPerRing, SurfaceBrightness };

/**
 * @brief Tagged ring flux specification.
 *
 * In `TotalFluxPerRing` mode `value` is Jy per ring and may be unset, in which case the
 * caller-supplied default flux applies. In `SurfaceBrightness` mode `value` is Jy/arcsec^2
 * and is required.
 */
struct FluxSpec {
  FluxMode mode{FluxMode::TotalFluxPerRing};
  std::optional<double> value{};

  static FluxSpec total_flux(std::optional<double> flux_jy) {
    return FluxSpec{.mode = FluxMode::TotalFluxPerRing, .value = flux_jy};
  }
  static FluxSpec surface_brightness(double jy_per_arcsec2) {
    return FluxSpec{.mode = FluxMode::SurfaceBrightness, .value = jy_per_arcsec2};
  }
};

/**
 * @brief Uniform ring layout (all lengths in arcsec).
 *
 * `ring_spacing_arcsec` is the edge-to-edge gap between consecutive rings; the first ring
 * starts at the central disk edge.
 */
struct RingLayout {
  double central_diameter_arcsec{};
  double ring_thickness_arcsec{};
  double ring_spacing_arcsec{};
};

/**
 * @brief Resolved geometry and disk fluxes of one ring.
 *
 * The ring is realized as an outer disk of flux `outer_flux_jy` minus an inner disk of flux
 * `inner_flux_jy`; both share `surface_brightness_jy_arcsec2`.
 */
struct RingResult {
  int index{};
  double inner_radius_arcsec{};
  double outer_radius_arcsec{};
  double inner_area_arcsec2{};
  double outer_area_arcsec2{};
  double annulus_area_arcsec2{};
  double surface_brightness_jy_arcsec2{};
  double outer_flux_jy{};
  double inner_flux_jy{};
  ringsky::core::Status status{ringsky::core::Status::Ok};
  std::string detail{};

  [[nodiscard]] double net_flux_jy() const { return outer_flux_jy - inner_flux_jy; }
  [[nodiscard]] ringsky::core::RingSummary summary() const;
};

/**
 * @brief Result of resolving a full ring sequence.
 *
 * On failure `rings` holds the rings resolved before the failing index.
 */
struct RingSetResult {
  std::vector<RingResult> rings{};
  ringsky::core::Status status{ringsky::core::Status::Ok};
  std::string detail{};
};

/**
 * @brief Resolve radii, areas and signed disk fluxes for ring `index` (0-based).
 *
 * Rin = D/2 + j (thickness + spacing), Rout = Rin + thickness. Total-flux mode divides the
 * ring flux by the annulus area to obtain the shared surface brightness and reports
 * `DegenerateRing` when that area is not positive. Surface-brightness mode never divides and
 * accepts a zero-width ring (net flux 0). A negative thickness is `DegenerateRing` in both
 * modes; disk fluxes that overflow are `NumericalError`.
 * @param index Ring index, >= 0.
 * @param layout Central diameter, thickness and spacing.
 * @param flux Ring flux specification.
 * @param default_flux_jy Fallback total flux when `flux` is total-flux mode without value.
 */
[[nodiscard]] RingResult compute_ring(int index,
                                      const RingLayout& layout,
                                      const FluxSpec& flux,
                                      double default_flux_jy);

/**
 * @brief Resolve rings 0..n_rings-1 in ascending order, stopping at the first failure.
 * @param observer Optional sink notified once per resolved ring.
 */
[[nodiscard]] RingSetResult compute_rings(int n_rings,
                                          const RingLayout& layout,
                                          const FluxSpec& flux,
                                          double default_flux_jy,
                                          ringsky::core::ISkyModelObserver* observer = nullptr);

}  // namespace ringsky::geometry

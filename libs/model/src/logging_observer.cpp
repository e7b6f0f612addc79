/**
 * @file logging_observer.cpp
 * @brief spdlog-backed sky-model observer implementation.
 * @author Watosn
 */

#include "ringsky/model/logging_observer.hpp"

#include "ringsky/core/constants.hpp"

namespace ringsky::model {

void LoggingSkyModelObserver::on_ring(const ringsky::core::RingSummary& ring) {
  if (!logger_) {
    return;
  }
  logger_->info("Ring {}: Rin={:.4f}\" Rout={:.4f}\"  Aring={:.6f} arcsec^2  I={:.3e} Jy/arcsec^2  Flux={:.3e} Jy",
                ring.index + 1,
                ring.inner_radius_arcsec,
                ring.outer_radius_arcsec,
                ring.annulus_area_arcsec2,
                ring.surface_brightness_jy_arcsec2,
                ring.net_flux_jy);
}

void LoggingSkyModelObserver::on_component(const std::size_t index, const ringsky::core::DiskComponent& component) {
  if (!logger_) {
    return;
  }
  logger_->debug("component {}: disk diameter={:.6f}arcsec flux={:.6e} Jy freq={:.6e} Hz pa={:.1f}deg",
                 index,
                 component.diameter_arcsec,
                 component.flux_jy,
                 component.freq_hz,
                 component.position_angle_rad / ringsky::core::constants::kDegToRad);
}

}  // namespace ringsky::model

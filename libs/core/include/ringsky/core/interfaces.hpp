/**
 * @file interfaces.hpp
 * @brief Observer interface for sky-model construction events.
 * @author Watosn
 */
#pragma once

#include <cstddef>

#include "ringsky/core/types.hpp"

namespace ringsky::core {

/**
 * @brief Sink for per-ring and per-component events emitted while a model is built.
 *
 * Implementations must not throw; events are informational only.
 */
class ISkyModelObserver {
 public:
  virtual ~ISkyModelObserver() = default;
  /**
   * @brief Called once per ring after its radii and fluxes are resolved.
   * @param ring Numeric summary of the ring.
   */
  virtual void on_ring(const RingSummary& ring) = 0;
  /**
   * @brief Called once per emitted component, in model order.
   * @param index Position of the component in the model.
   * @param component Emitted component.
   */
  virtual void on_component(std::size_t index, const DiskComponent& component) = 0;
};

}  // namespace ringsky::core

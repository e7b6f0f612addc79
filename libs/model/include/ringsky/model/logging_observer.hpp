/**
 * @file logging_observer.hpp
 * @brief spdlog-backed sky-model observer.
 * @author Watosn
 */
#pragma once

#include <memory>
#include <utility>

#include <spdlog/spdlog.h>

#include "ringsky/core/interfaces.hpp"

namespace ringsky::model {

/**
 * @brief Forwards ring and component events to an injected spdlog logger.
 *
 * Rings are logged at info level, components at debug level.
 */
class LoggingSkyModelObserver final : public ringsky::core::ISkyModelObserver {
 public:
  explicit LoggingSkyModelObserver(std::shared_ptr<spdlog::logger> logger) : logger_(std::move(logger)) {}

  void on_ring(const ringsky::core::RingSummary& ring) override;
  void on_component(std::size_t index, const ringsky::core::DiskComponent& component) override;

 private:
  std::shared_ptr<spdlog::logger> logger_{};
};

}  // namespace ringsky::model

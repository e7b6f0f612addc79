/**
 * @file component_table.cpp
 * @brief CSV export of a disk component list.
 * @author Watosn
 */

#include "ringsky/model/component_table.hpp"

#include <fstream>

#include <fmt/format.h>

#include "ringsky/core/constants.hpp"

namespace ringsky::model {

std::string format_component_row(const std::size_t index, const ringsky::core::DiskComponent& component) {
  return fmt::format("{},Disk,{:.15e},{:.15e},J2000,{:.12e},{:.12e},{:.6f},{:.15e},{:.12e}",
                     index,
                     component.center.ra_rad,
                     component.center.dec_rad,
                     component.diameter_arcsec,
                     component.diameter_arcsec,
                     component.position_angle_rad / ringsky::core::constants::kDegToRad,
                     component.flux_jy,
                     component.freq_hz);
}

ringsky::core::Status write_component_table(const SkyModel& model, const std::filesystem::path& path) {
  std::ofstream out(path, std::ios::trunc);
  if (!out) {
    return ringsky::core::Status::IoError;
  }
  out << kComponentTableHeader << "\n";
  for (std::size_t i = 0; i < model.components.size(); ++i) {
    out << format_component_row(i, model.components[i]) << "\n";
  }
  out.flush();
  return out ? ringsky::core::Status::Ok : ringsky::core::Status::IoError;
}

}  // namespace ringsky::model

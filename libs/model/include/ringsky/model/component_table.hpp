/**
 * @file component_table.hpp
 * @brief CSV export of a disk component list.
 * @author Watosn
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

#include "ringsky/core/types.hpp"
#include "ringsky/model/sky_model.hpp"

namespace ringsky::model {

/**
 * @brief Header line of the component table (without trailing newline).
 */
inline constexpr const char* kComponentTableHeader =
    "index,shape,ra_rad,dec_rad,frame,major_arcsec,minor_arcsec,position_angle_deg,flux_jy,freq_hz";

/**
 * @brief Format one component as a CSV row (without trailing newline).
 */
std::string format_component_row(std::size_t index, const ringsky::core::DiskComponent& component);

/**
 * @brief Write header plus one row per component, overwriting `path`.
 * @return `IoError` when the file cannot be opened or written.
 */
[[nodiscard]] ringsky::core::Status write_component_table(const SkyModel& model, const std::filesystem::path& path);

}  // namespace ringsky::model

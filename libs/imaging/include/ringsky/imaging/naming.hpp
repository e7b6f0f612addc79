/**
 * @file naming.hpp
 * @brief Output artifact naming derived from the declination string.
 * @author Watosn
 */
#pragma once

#include <string>

namespace ringsky::imaging {

/**
 * @brief Filesystem-safe tag from a declination string.
 *
 * `-` becomes `m`, `+` becomes `p`, and every `d` and `.` is removed
 * (e.g. `-23d00m00.00` -> `m2300m0000`).
 */
std::string dec_tag(const std::string& dec);

/**
 * @brief Image base name `<output_base>_dec<tag>` (no extension).
 */
std::string image_name(const std::string& output_base, const std::string& dec);

}  // namespace ringsky::imaging

/**
 * @file run_config.hpp
 * @brief Typed run configuration, loading and validation.
 * @author Watosn
 */
#pragma once

#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "ringsky/core/types.hpp"
#include "ringsky/geometry/ring_geometry.hpp"

namespace YAML {
class Node;
}

namespace ringsky::config {

/**
 * @brief One ring-model run, lengths in arcsec and fluxes in Jy.
 *
 * Flux precedence for rings: `ring_surface_brightness` > `ring_flux` > `flux`.
 * Central disk: `central_flux` > `flux`.
 */
struct RunConfig {
  std::string ra_center{"12h00m00.00s"};
  std::string dec_center{"-23d00m00.00"};
  std::string freq{"343.5GHz"};
  std::string freq_increment{"7.5GHz"};

  int n_rings{3};
  double central_diameter{0.0045};
  double ring_thickness{0.0045};
  double ring_spacing{0.0090};

  double flux{2.7e-4};
  std::optional<double> central_flux{};
  std::optional<double> ring_flux{};
  std::optional<double> ring_surface_brightness{};
  bool reject_flux_conflict{false};

  std::array<int, 2> im_shape{160, 160};
  double cell_size{0.0009};
  int oversample{8};

  std::string output_base{"ringModel"};
  std::string log_file{};
  std::string component_table{};
};

/**
 * @brief Load/override outcome; `unknown_keys` lists keys that were ignored.
 */
struct LoadResult {
  RunConfig config{};
  std::vector<std::string> unknown_keys{};
  ringsky::core::Status status{ringsky::core::Status::Ok};
  std::string detail{};
};

/**
 * @brief Outcome of validating a configuration.
 */
struct ValidationResult {
  ringsky::core::Status status{ringsky::core::Status::Ok};
  std::string detail{};
};

/**
 * @brief Merge a YAML/JSON mapping into `base`.
 *
 * Missing keys keep their value in `base`; `null` clears optional fields.
 */
[[nodiscard]] LoadResult config_from_node(const YAML::Node& node, const RunConfig& base = {});

/**
 * @brief Parse a JSON or YAML document from text.
 */
[[nodiscard]] LoadResult load_config_text(const std::string& text, const RunConfig& base = {});

/**
 * @brief Parse a JSON or YAML document from a file.
 */
[[nodiscard]] LoadResult load_config_file(const std::filesystem::path& path, const RunConfig& base = {});

/**
 * @brief Apply one `key = values` override (command-line flag form).
 *
 * `im_shape` takes two values, every other key exactly one. The literal `none`
 * clears an optional field.
 */
[[nodiscard]] ringsky::core::Status apply_override(RunConfig& config,
                                                   const std::string& key,
                                                   const std::vector<std::string>& values,
                                                   std::string* detail = nullptr);

/**
 * @brief True when `key` names a configuration field.
 */
[[nodiscard]] bool is_known_key(const std::string& key);

/**
 * @brief Validate once before any geometry is computed.
 *
 * Checks RA/Dec syntax (`InvalidAngle`), frequencies (`InvalidFrequency`), numeric ranges
 * (`InvalidConfig`, or `DegenerateRing` for a negative ring thickness) and, when enabled, the
 * ring flux conflict (`ConfigurationConflict`).
 */
[[nodiscard]] ValidationResult validate(const RunConfig& config);

/**
 * @brief Ring flux specification after applying the precedence rules.
 */
[[nodiscard]] ringsky::geometry::FluxSpec ring_flux_spec(const RunConfig& config);

/**
 * @brief Central disk flux after applying the precedence rules.
 */
[[nodiscard]] double central_flux(const RunConfig& config);

/**
 * @brief True when both `ring_flux` and `ring_surface_brightness` are set.
 */
[[nodiscard]] bool has_ring_flux_conflict(const RunConfig& config);

/**
 * @brief Ring layout view of the configuration.
 */
[[nodiscard]] ringsky::geometry::RingLayout ring_layout(const RunConfig& config);

}  // namespace ringsky::config

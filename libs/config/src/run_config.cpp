/**
 * @file run_config.cpp
 * @brief Typed run configuration, loading and validation implementation.
 * @author Watosn
 */

#include "ringsky/config/run_config.hpp"

#include <cmath>
#include <utility>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include "ringsky/units/angle.hpp"
#include "ringsky/units/frequency.hpp"

namespace ringsky::config {
namespace {

using ringsky::core::Status;

constexpr int kMaxOversample = 64;

struct StringField {
  const char* key;
  std::string RunConfig::*member;
  bool nullable;
};

struct IntField {
  const char* key;
  int RunConfig::*member;
};

struct DoubleField {
  const char* key;
  double RunConfig::*member;
};

struct OptionalDoubleField {
  const char* key;
  std::optional<double> RunConfig::*member;
};

struct BoolField {
  const char* key;
  bool RunConfig::*member;
};

constexpr std::array kStringFields{
    StringField{"ra_center", &RunConfig::ra_center, false},
    StringField{"dec_center", &RunConfig::dec_center, false},
    StringField{"freq", &RunConfig::freq, false},
    StringField{"freq_increment", &RunConfig::freq_increment, false},
    StringField{"output_base", &RunConfig::output_base, false},
    StringField{"log_file", &RunConfig::log_file, true},
    StringField{"component_table", &RunConfig::component_table, true},
};

constexpr std::array kIntFields{
    IntField{"n_rings", &RunConfig::n_rings},
    IntField{"oversample", &RunConfig::oversample},
};

constexpr std::array kDoubleFields{
    DoubleField{"central_diameter", &RunConfig::central_diameter},
    DoubleField{"ring_thickness", &RunConfig::ring_thickness},
    DoubleField{"ring_spacing", &RunConfig::ring_spacing},
    DoubleField{"flux", &RunConfig::flux},
    DoubleField{"cell_size", &RunConfig::cell_size},
};

constexpr std::array kOptionalDoubleFields{
    OptionalDoubleField{"central_flux", &RunConfig::central_flux},
    OptionalDoubleField{"ring_flux", &RunConfig::ring_flux},
    OptionalDoubleField{"ring_surface_brightness", &RunConfig::ring_surface_brightness},
};

constexpr std::array kBoolFields{
    BoolField{"reject_flux_conflict", &RunConfig::reject_flux_conflict},
};

constexpr const char* kShapeKey = "im_shape";

template <typename Fields>
auto find_field(const Fields& fields, const std::string& key) -> const typename Fields::value_type* {
  for (const auto& f : fields) {
    if (key == f.key) {
      return &f;
    }
  }
  return nullptr;
}

/**
 * @brief Assign one field from a YAML value. Throws YAML::Exception on conversion errors.
 */
Status assign_field(RunConfig& config, const std::string& key, const YAML::Node& value, std::string& detail) {
  const bool is_null = !value.IsDefined() || value.IsNull();

  if (const auto* f = find_field(kOptionalDoubleFields, key)) {
    if (is_null) {
      config.*(f->member) = std::nullopt;
    } else {
      config.*(f->member) = value.as<double>();
    }
    return Status::Ok;
  }
  if (const auto* f = find_field(kStringFields, key)) {
    if (is_null) {
      if (!f->nullable) {
        detail = fmt::format("config key '{}' may not be null", key);
        return Status::InvalidConfig;
      }
      (config.*(f->member)).clear();
    } else {
      config.*(f->member) = value.as<std::string>();
    }
    return Status::Ok;
  }
  if (is_null) {
    detail = fmt::format("config key '{}' may not be null", key);
    return Status::InvalidConfig;
  }
  if (const auto* f = find_field(kIntFields, key)) {
    config.*(f->member) = value.as<int>();
    return Status::Ok;
  }
  if (const auto* f = find_field(kDoubleFields, key)) {
    config.*(f->member) = value.as<double>();
    return Status::Ok;
  }
  if (const auto* f = find_field(kBoolFields, key)) {
    config.*(f->member) = value.as<bool>();
    return Status::Ok;
  }
  if (key == kShapeKey) {
    if (!value.IsSequence() || value.size() != 2U) {
      detail = "config key 'im_shape' must be a list of two integers";
      return Status::InvalidConfig;
    }
    config.im_shape = {value[0].as<int>(), value[1].as<int>()};
    return Status::Ok;
  }
  detail = fmt::format("unknown config key '{}'", key);
  return Status::InvalidConfig;
}

bool finite_non_negative(double v) { return std::isfinite(v) && v >= 0.0; }

ValidationResult invalid(Status status, std::string detail) { return ValidationResult{.status = status, .detail = std::move(detail)}; }

}  // namespace

bool is_known_key(const std::string& key) {
  return key == kShapeKey || find_field(kStringFields, key) != nullptr || find_field(kIntFields, key) != nullptr
         || find_field(kDoubleFields, key) != nullptr || find_field(kOptionalDoubleFields, key) != nullptr
         || find_field(kBoolFields, key) != nullptr;
}

LoadResult config_from_node(const YAML::Node& node, const RunConfig& base) {
  LoadResult out{.config = base};
  if (!node.IsMap()) {
    out.status = Status::InvalidConfig;
    out.detail = "configuration document must be a mapping of keys to values";
    return out;
  }
  for (const auto& entry : node) {
    std::string key;
    try {
      key = entry.first.as<std::string>();
      if (!is_known_key(key)) {
        out.unknown_keys.push_back(key);
        continue;
      }
      std::string detail;
      const auto s = assign_field(out.config, key, entry.second, detail);
      if (s != Status::Ok) {
        out.status = s;
        out.detail = std::move(detail);
        return out;
      }
    } catch (const YAML::Exception& e) {
      out.status = Status::InvalidConfig;
      out.detail = fmt::format("config key '{}' has an invalid value: {}", key, e.what());
      return out;
    }
  }
  return out;
}

LoadResult load_config_text(const std::string& text, const RunConfig& base) {
  YAML::Node root;
  try {
    root = YAML::Load(text);
  } catch (const YAML::Exception& e) {
    return LoadResult{.config = base, .status = Status::InvalidConfig, .detail = fmt::format("config parse error: {}", e.what())};
  }
  return config_from_node(root, base);
}

LoadResult load_config_file(const std::filesystem::path& path, const RunConfig& base) {
  if (!std::filesystem::exists(path)) {
    return LoadResult{.config = base, .status = Status::IoError, .detail = fmt::format("config file not found: {}", path.string())};
  }
  YAML::Node root;
  try {
    root = YAML::LoadFile(path.string());
  } catch (const YAML::BadFile& e) {
    return LoadResult{.config = base, .status = Status::IoError, .detail = fmt::format("failed to read {}: {}", path.string(), e.what())};
  } catch (const YAML::Exception& e) {
    return LoadResult{.config = base, .status = Status::InvalidConfig, .detail = fmt::format("config parse error in {}: {}", path.string(), e.what())};
  }
  return config_from_node(root, base);
}

Status apply_override(RunConfig& config, const std::string& key, const std::vector<std::string>& values, std::string* detail) {
  std::string msg;
  Status status = Status::Ok;
  if (!is_known_key(key)) {
    msg = fmt::format("unknown option '--{}'", key);
    status = Status::InvalidConfig;
  } else if (values.size() != (key == kShapeKey ? 2U : 1U)) {
    msg = fmt::format("option '--{}' expects {} value(s), got {}", key, key == kShapeKey ? 2 : 1, values.size());
    status = Status::InvalidConfig;
  } else {
    YAML::Node value;
    if (key == kShapeKey) {
      value.push_back(values[0]);
      value.push_back(values[1]);
    } else if (values[0] == "none" || values[0] == "null") {
      value = YAML::Node(YAML::NodeType::Null);
    } else {
      value = YAML::Node(values[0]);
    }
    try {
      status = assign_field(config, key, value, msg);
    } catch (const YAML::Exception& e) {
      msg = fmt::format("option '--{}' has an invalid value: {}", key, e.what());
      status = Status::InvalidConfig;
    }
  }
  if (detail != nullptr) {
    *detail = std::move(msg);
  }
  return status;
}

ValidationResult validate(const RunConfig& config) {
  const auto ra = ringsky::units::normalize_angle(config.ra_center, ringsky::units::AngleRole::RA);
  if (ra.status != Status::Ok) {
    return invalid(ra.status, ra.detail);
  }
  const auto dec = ringsky::units::normalize_angle(config.dec_center, ringsky::units::AngleRole::Dec);
  if (dec.status != Status::Ok) {
    return invalid(dec.status, dec.detail);
  }

  const auto freq = ringsky::units::parse_frequency(config.freq);
  if (freq.status != Status::Ok || !(freq.hz > 0.0)) {
    return invalid(Status::InvalidFrequency, fmt::format("freq must be a positive frequency, got '{}'", config.freq));
  }
  const auto inc = ringsky::units::parse_frequency(config.freq_increment);
  if (inc.status != Status::Ok || inc.hz == 0.0) {
    return invalid(Status::InvalidFrequency,
                   fmt::format("freq_increment must be a non-zero frequency, got '{}'", config.freq_increment));
  }

  if (config.n_rings < 0) {
    return invalid(Status::InvalidConfig, fmt::format("n_rings must be >= 0, got {}", config.n_rings));
  }
  if (!finite_non_negative(config.central_diameter) || !finite_non_negative(config.ring_spacing)
      || !std::isfinite(config.ring_thickness)) {
    return invalid(Status::InvalidConfig, "central_diameter, ring_thickness and ring_spacing must be finite, diameter and spacing >= 0");
  }
  if (config.ring_thickness < 0.0) {
    return invalid(Status::DegenerateRing,
                   fmt::format("ring_thickness {} gives a negative annulus area", config.ring_thickness));
  }
  if (!std::isfinite(config.flux)) {
    return invalid(Status::InvalidConfig, "flux must be finite");
  }
  for (const auto& f : kOptionalDoubleFields) {
    const auto& v = config.*(f.member);
    if (v.has_value() && !std::isfinite(*v)) {
      return invalid(Status::InvalidConfig, fmt::format("{} must be finite", f.key));
    }
  }
  if (config.im_shape[0] <= 0 || config.im_shape[1] <= 0) {
    return invalid(Status::InvalidConfig,
                   fmt::format("im_shape must be positive, got [{}, {}]", config.im_shape[0], config.im_shape[1]));
  }
  if (!std::isfinite(config.cell_size) || config.cell_size <= 0.0) {
    return invalid(Status::InvalidConfig, fmt::format("cell_size must be positive, got {}", config.cell_size));
  }
  if (config.oversample < 1 || config.oversample > kMaxOversample) {
    return invalid(Status::InvalidConfig, fmt::format("oversample must be in [1, {}], got {}", kMaxOversample, config.oversample));
  }
  if (config.output_base.empty()) {
    return invalid(Status::InvalidConfig, "output_base must not be empty");
  }
  if (config.reject_flux_conflict && has_ring_flux_conflict(config)) {
    return invalid(Status::ConfigurationConflict, "both ring_flux and ring_surface_brightness are set");
  }
  return ValidationResult{};
}

ringsky::geometry::FluxSpec ring_flux_spec(const RunConfig& config) {
  if (config.ring_surface_brightness.has_value()) {
    return ringsky::geometry::FluxSpec::surface_brightness(*config.ring_surface_brightness);
  }
  return ringsky::geometry::FluxSpec::total_flux(config.ring_flux.has_value() ? config.ring_flux : std::optional<double>{config.flux});
}

double central_flux(const RunConfig& config) { return config.central_flux.value_or(config.flux); }

bool has_ring_flux_conflict(const RunConfig& config) {
  return config.ring_flux.has_value() && config.ring_surface_brightness.has_value();
}

ringsky::geometry::RingLayout ring_layout(const RunConfig& config) {
  return ringsky::geometry::RingLayout{
      .central_diameter_arcsec = config.central_diameter,
      .ring_thickness_arcsec = config.ring_thickness,
      .ring_spacing_arcsec = config.ring_spacing,
  };
}

}  // namespace ringsky::config

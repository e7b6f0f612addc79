/**
 * @file main.cpp
 * @brief ringsky command-line entrypoint: ring sky model -> FITS image.
 * @author Watosn
 */

#include <filesystem>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "ringsky/cli/cli_options.hpp"
#include "ringsky/fits/fits_writer.hpp"
#include "ringsky/model/component_table.hpp"
#include "ringsky/model/logging_observer.hpp"
#include "ringsky/pipeline/ring_sky_pipeline.hpp"
#include "ringsky/units/angle.hpp"

namespace {

using ringsky::core::Status;
namespace cli = ringsky::cli;

void print_usage() {
  spdlog::info("usage: ringsky_cli <config.json|config.yaml>");
  spdlog::info("       ringsky_cli [--config <file>] [--<key> <value> ...]");
  spdlog::info("keys: ra_center dec_center freq freq_increment n_rings central_diameter ring_thickness ring_spacing");
  spdlog::info("      flux central_flux ring_flux ring_surface_brightness reject_flux_conflict");
  spdlog::info("      im_shape <nx> <ny> cell_size oversample output_base log_file component_table");
  spdlog::info("optional values accept 'none' to clear them");
}

std::shared_ptr<spdlog::logger> make_logger(const std::string& log_file) {
  std::vector<spdlog::sink_ptr> sinks{std::make_shared<spdlog::sinks::stdout_color_sink_mt>()};
  if (!log_file.empty()) {
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
  }
  auto logger = std::make_shared<spdlog::logger>("ringsky", sinks.begin(), sinks.end());
  logger->set_pattern("%Y-%m-%d %H:%M:%S,%e - %l - %v");
  logger->set_level(spdlog::level::debug);
  logger->flush_on(spdlog::level::warn);
  return logger;
}

}  // namespace

int main(int argc, char** argv) {
  const auto invocation = cli::parse_command_line(std::vector<std::string>(argv + 1, argv + argc));
  if (invocation.mode == cli::CliMode::Help) {
    print_usage();
    return cli::exit_code_for(invocation);
  }
  const auto& loaded = invocation.loaded;
  if (loaded.status != Status::Ok) {
    spdlog::error("{}", loaded.detail);
    if (invocation.usage_error) {
      print_usage();
    }
    return cli::exit_code_for(invocation);
  }
  const auto& config = loaded.config;

  std::shared_ptr<spdlog::logger> logger;
  try {
    logger = make_logger(config.log_file);
  } catch (const spdlog::spdlog_ex& e) {
    spdlog::error("failed to open log file {}: {}", config.log_file, e.what());
    return cli::kExitConfig;
  }
  spdlog::set_default_logger(logger);

  for (const auto& key : loaded.unknown_keys) {
    logger->warn("ignoring unknown config key '{}'", key);
  }
  if (ringsky::config::has_ring_flux_conflict(config) && !config.reject_flux_conflict) {
    logger->debug("ring_surface_brightness takes precedence over ring_flux");
  }

  ringsky::model::LoggingSkyModelObserver observer(logger);
  auto result = ringsky::pipeline::run_pipeline(config, &observer);
  if (result.status != Status::Ok) {
    logger->error("{} ({})", result.detail, ringsky::core::status_name(result.status));
    return cli::exit_code_for(result.status);
  }
  logger->info("Center direction: {}", ringsky::units::format_direction(result.center));
  logger->info("Model: {} components, total flux {:.6e} Jy, image sum {:.6e} Jy/pixel",
               result.model.size(),
               result.model.total_flux_jy(),
               result.image.sum());
  if (result.clipped_components > 0) {
    logger->warn("{} component(s) extend beyond the {}x{} image; their outer flux was dropped",
                 result.clipped_components,
                 config.im_shape[0],
                 config.im_shape[1]);
  }

  const std::filesystem::path fits_path = result.image_name + ".fits";
  const auto written = ringsky::fits::write_fits(result.image, fits_path);
  if (written.status != Status::Ok) {
    logger->error("FITS export failed: {}", written.detail);
    return cli::kExitExport;
  }

  if (!config.component_table.empty()) {
    if (ringsky::model::write_component_table(result.model, config.component_table) != Status::Ok) {
      logger->error("failed to write component table {}", config.component_table);
      std::error_code ec;
      std::filesystem::remove(fits_path, ec);
      return cli::kExitExport;
    }
    logger->info("Wrote component table to {}", config.component_table);
  }

  logger->info("Saved ring sky model to {}", fits_path.string());
  logger->flush();
  return cli::kExitOk;
}

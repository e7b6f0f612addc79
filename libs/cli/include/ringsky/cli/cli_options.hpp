/**
 * @file cli_options.hpp
 * @brief Command-line parsing and exit-code mapping for ringsky_cli.
 * @author Watosn
 */
#pragma once

#include <string>
#include <vector>

#include "ringsky/config/run_config.hpp"
#include "ringsky/core/types.hpp"

namespace ringsky::cli {

inline constexpr int kExitOk = 0;
inline constexpr int kExitUsage = 1;
inline constexpr int kExitConfig = 2;
inline constexpr int kExitModel = 3;
inline constexpr int kExitExport = 5;

enum class CliMode {
  Help,
  ConfigFile,
  Flags,
};

/**
 * @brief Parsed command line.
 *
 * `usage_error` marks a malformed flag list (unknown key, wrong value count, unparsable
 * value); `loaded.status` then carries `InvalidConfig` and `loaded.detail` the reason.
 */
struct CliInvocation {
  CliMode mode{CliMode::Flags};
  ringsky::config::LoadResult loaded{};
  bool usage_error{false};
};

/**
 * @brief True when `arg` ends in `.json`, `.yaml` or `.yml`.
 */
[[nodiscard]] bool is_config_file_arg(const std::string& arg);

/**
 * @brief Parse the arguments after the program name.
 *
 * Forms: `--help`/`-h`; a single config file path; or an optional leading `--config <file>`
 * followed by `--<key> <value...>` overrides applied on top of it.
 */
[[nodiscard]] CliInvocation parse_command_line(const std::vector<std::string>& args);

[[nodiscard]] int exit_code_for(ringsky::core::Status status);

/**
 * @brief Exit code for a command line that did not reach the pipeline.
 *
 * Help is 0, a usage error 1, and a config file that failed to load 2. A successful parse
 * gives 0.
 */
[[nodiscard]] int exit_code_for(const CliInvocation& invocation);

}  // namespace ringsky::cli

/**
 * @file cli_options.cpp
 * @brief Command-line parsing and exit-code mapping for ringsky_cli.
 * @author Watosn
 */

#include "ringsky/cli/cli_options.hpp"

#include <cstddef>
#include <filesystem>
#include <utility>

#include <fmt/format.h>

namespace ringsky::cli {
namespace {

using ringsky::core::Status;

bool is_flag(const std::string& arg) { return arg.rfind("--", 0) == 0; }

CliInvocation usage_error(CliInvocation out, std::string detail) {
  out.usage_error = true;
  out.loaded.status = Status::InvalidConfig;
  out.loaded.detail = std::move(detail);
  return out;
}

}  // namespace

bool is_config_file_arg(const std::string& arg) {
  const auto ext = std::filesystem::path(arg).extension().string();
  return ext == ".json" || ext == ".yaml" || ext == ".yml";
}

CliInvocation parse_command_line(const std::vector<std::string>& args) {
  CliInvocation out{};
  if (!args.empty() && (args.front() == "--help" || args.front() == "-h")) {
    out.mode = CliMode::Help;
    return out;
  }
  if (args.size() == 1U && is_config_file_arg(args.front())) {
    out.mode = CliMode::ConfigFile;
    out.loaded = ringsky::config::load_config_file(args.front());
    return out;
  }

  std::size_t i = 0;
  if (!args.empty() && args.front() == "--config") {
    if (args.size() < 2U) {
      return usage_error(out, "--config needs a file");
    }
    out.loaded = ringsky::config::load_config_file(args[1]);
    if (out.loaded.status != Status::Ok) {
      return out;
    }
    i = 2;
  }
  while (i < args.size()) {
    const std::string& flag = args[i];
    if (!is_flag(flag) || flag.size() <= 2U) {
      return usage_error(out, fmt::format("unexpected argument '{}'", flag));
    }
    const std::string key = flag.substr(2);
    std::vector<std::string> values;
    ++i;
    // Values may start with a single '-' (negative numbers, southern declinations).
    while (i < args.size() && !is_flag(args[i])) {
      values.push_back(args[i]);
      ++i;
    }
    std::string detail;
    if (ringsky::config::apply_override(out.loaded.config, key, values, &detail) != Status::Ok) {
      return usage_error(out, detail);
    }
  }
  return out;
}

int exit_code_for(const Status status) {
  switch (status) {
    case Status::InvalidAngle:
    case Status::InvalidFrequency:
    case Status::InvalidConfig:
    case Status::ConfigurationConflict:
      return kExitConfig;
    case Status::DegenerateRing:
    case Status::NumericalError:
      return kExitModel;
    case Status::IoError:
      return kExitExport;
    case Status::Ok:
      return kExitOk;
  }
  return kExitModel;
}

int exit_code_for(const CliInvocation& invocation) {
  if (invocation.mode == CliMode::Help) {
    return kExitOk;
  }
  if (invocation.usage_error) {
    return kExitUsage;
  }
  return invocation.loaded.status == Status::Ok ? kExitOk : kExitConfig;
}

}  // namespace ringsky::cli

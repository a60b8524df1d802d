#include "hlid/cli/application.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "hlid/util/logging.hpp"

// Command includes
#include "hlid/cli/commands/new_command.hpp"
#include "hlid/cli/commands/inspect_command.hpp"
#include "hlid/cli/commands/verify_command.hpp"

namespace hlid::cli {

Application::Application()
    : app_("hlid", "Human-readable lexicographically sortable identifiers") {

  app_.set_version_flag("--version", hlid::getVersion().toString());
  app_.require_subcommand(1);
  // Subcommands inherit this, so global flags may follow the subcommand
  app_.fallthrough();

  setupGlobalOptions();
  setupCommands();
  setupHelp();
}

int Application::run(int argc, char* argv[]) {
  try {
    app_.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app_.exit(e);
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  // The command has already been executed by CLI11's callback system
  return 0;
}

void Application::setupGlobalOptions() {
  app_.add_flag("--json", global_options_.json, "Output in JSON format");
  app_.add_flag("-v,--verbose", global_options_.verbose, "Verbose logging (-vv for trace)");
  app_.add_flag("-q,--quiet", global_options_.quiet, "Only log errors");
  app_.add_option("--config", global_options_.config_file, "Path to config file");
}

void Application::setupCommands() {
  registerCommand(std::make_unique<NewCommand>(*this));
  registerCommand(std::make_unique<InspectCommand>(*this));
  registerCommand(std::make_unique<VerifyCommand>(*this));
}

void Application::setupHelp() {
  app_.get_formatter()->column_width(40);

  app_.footer(R"(Examples:
  hlid new                                  # 20241105-1108-5252-0000-8fa646f09a7e
  hlid new --user-data ff -n 3
  hlid new --secret "$HLID_SECRET" --at 2024-11-05T11:08:52.52Z
  hlid inspect 20241105-1108-5252-00ff-8fa646f09a7e --json
  hlid verify 20241105-1108-5252-0000-8f825cb24dc3 --secret "$HLID_SECRET"

For more information on a specific command, run:
  hlid <command> --help)");
}

void Application::registerCommand(std::unique_ptr<Command> command) {
  auto* cmd_ptr = command.get();

  // Create CLI11 subcommand
  auto* sub = app_.add_subcommand(cmd_ptr->name(), cmd_ptr->description());

  // Let the command setup its specific options
  cmd_ptr->setupCommand(sub);

  // Set callback to execute the command
  sub->callback([this, cmd_ptr]() {
    auto init_result = initializeServices();
    if (!init_result.has_value()) {
      reportError(init_result.error());
      throw CLI::RuntimeError(1);
    }

    auto result = cmd_ptr->execute(global_options_);
    if (!result.has_value()) {
      spdlog::debug("Command '{}' failed: {}", cmd_ptr->name(), result.error().message());
      reportError(result.error());
      throw CLI::RuntimeError(1);
    }
    if (*result != 0) {
      throw CLI::RuntimeError(*result);
    }
  });

  // Store the command
  commands_.push_back(std::move(command));
}

Result<void> Application::initializeServices() {
  if (config_) {
    return {};
  }

  std::optional<std::filesystem::path> config_path;
  if (!global_options_.config_file.empty()) {
    config_path = global_options_.config_file;
  }

  auto config_result = config::Config::fromFile(config_path);
  if (!config_result.has_value()) {
    return std::unexpected(config_result.error());
  }

  auto valid = config_result->validate();
  if (!valid.has_value()) {
    return valid;
  }

  auto level = util::Logging::parseLevel(config_result->log_level);
  if (!level.has_value()) {
    return std::unexpected(level.error());
  }

  auto effective_level = *level;
  if (global_options_.quiet) {
    effective_level = spdlog::level::err;
  } else if (global_options_.verbose >= 2) {
    effective_level = spdlog::level::trace;
  } else if (global_options_.verbose == 1) {
    effective_level = std::min(effective_level, spdlog::level::debug);
  }

  std::optional<std::filesystem::path> log_file;
  if (config_result->log_to_file) {
    log_file = util::Logging::defaultLogFile();
  }
  util::Logging::initialize(effective_level, log_file);

  config_ = std::move(*config_result);
  return {};
}

void Application::reportError(const Error& error) const {
  if (jsonOutput()) {
    nlohmann::json output = {
      {"error", error.message()},
      {"code", static_cast<int>(error.code())},
      {"kind", std::string(errorCodeToString(error.code()))}
    };
    std::cout << output.dump() << "\n";
  } else {
    std::cerr << "Error: " << error.message() << "\n";
  }
}

// Getters for services (to be used by commands)
const GlobalOptions& Application::globalOptions() const {
  return global_options_;
}

config::Config& Application::config() {
  if (!config_) {
    throw std::runtime_error("Configuration not initialized");
  }
  return *config_;
}

bool Application::jsonOutput() const {
  return global_options_.json ||
         (config_ && config_->output == config::Config::OutputFormat::kJson);
}

util::SensitiveString Application::resolveSecret(const std::string& cli_secret) const {
  if (!cli_secret.empty()) {
    return util::SensitiveString(cli_secret);
  }
  if (config_) {
    return util::SensitiveString(config_->resolvedSecret());
  }
  return util::SensitiveString();
}

} // namespace hlid::cli

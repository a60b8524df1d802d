#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "hlid/common.hpp"
#include "hlid/config/config.hpp"
#include "hlid/util/security.hpp"

namespace hlid::cli {

/**
 * @brief Global CLI options that are available to all commands
 */
struct GlobalOptions {
  bool json = false;           // --json: Output in JSON format
  int verbose = 0;             // --verbose: Verbose output level (can be repeated: -v, -vv)
  bool quiet = false;          // --quiet: Only log errors
  std::string config_file;     // --config: Path to config file
};

/**
 * @brief Base class for all CLI commands
 */
class Command {
public:
  virtual ~Command() = default;

  /**
   * @brief Execute the command with the given arguments
   * @param options Global CLI options
   * @return Result with exit code (0 = success)
   */
  virtual Result<int> execute(const GlobalOptions& options) = 0;

  /**
   * @brief Get the command name
   */
  virtual std::string name() const = 0;

  /**
   * @brief Get the command description
   */
  virtual std::string description() const = 0;

  /**
   * @brief Setup command-specific CLI options (optional override)
   */
  virtual void setupCommand(CLI::App* cmd) { (void)cmd; }
};

/**
 * @brief Main CLI application
 */
class Application {
public:
  Application();
  ~Application() = default;

  /**
   * @brief Run the application with command line arguments
   * @param argc Argument count
   * @param argv Argument vector
   * @return Exit code (0 = success)
   */
  int run(int argc, char* argv[]);

  const GlobalOptions& globalOptions() const;

  /**
   * @brief Loaded configuration; only valid once a command is executing
   */
  config::Config& config();

  /**
   * @brief True when output should be JSON (--json or output = "json")
   */
  bool jsonOutput() const;

  /**
   * @brief Pick the secret from the command line, falling back to the configuration
   * @return Empty SensitiveString when no secret is configured
   */
  util::SensitiveString resolveSecret(const std::string& cli_secret) const;

private:
  // Setup methods
  void setupGlobalOptions();
  void setupCommands();
  void setupHelp();

  // Command registration
  void registerCommand(std::unique_ptr<Command> command);

  // Load configuration and set up logging
  Result<void> initializeServices();

  // Report a failed command on stdout (JSON) or stderr (text)
  void reportError(const Error& error) const;

  // CLI framework
  CLI::App app_;
  GlobalOptions global_options_;

  std::optional<config::Config> config_;

  // Registered commands
  std::vector<std::unique_ptr<Command>> commands_;
};

} // namespace hlid::cli

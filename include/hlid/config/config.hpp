#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "hlid/common.hpp"

namespace hlid::config {

// Configuration for the hlid command-line tool
class Config {
 public:
  // Defaults only; nothing is read from disk
  Config() = default;

  // Load from the given file, or from the default location when it exists.
  // A missing default file is not an error; a missing explicit file is.
  static Result<Config> fromFile(const std::optional<std::filesystem::path>& config_path);

  // Default user-data byte for newly minted identifiers (two lowercase hex chars)
  std::string user_data = "00";

  // Secret for keyed identifiers; may be an "env:VARNAME" reference
  std::string secret;

  // Output configuration
  enum class OutputFormat {
    kText,
    kJson
  };
  OutputFormat output = OutputFormat::kText;

  // Logging configuration
  std::string log_level = "warn";
  bool log_to_file = false;

  // Load configuration from file
  Result<void> load(const std::filesystem::path& config_path);

  // Validate configuration
  Result<void> validate() const;

  // Secret with any env: reference resolved; empty when unset
  std::string resolvedSecret() const;

  // Get default config file path
  static std::filesystem::path defaultConfigPath();

  // Path the configuration was loaded from, empty for defaults
  const std::filesystem::path& configPath() const { return config_path_; }

  static std::string outputFormatToString(OutputFormat format);
  static std::optional<OutputFormat> stringToOutputFormat(const std::string& str);

 private:
  std::filesystem::path config_path_;

  // Resolve "env:VARNAME" references
  std::string resolveEnvVar(const std::string& value) const;
};

}  // namespace hlid::config

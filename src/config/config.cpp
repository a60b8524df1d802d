#include "hlid/config/config.hpp"

#include <cstdlib>

#include <spdlog/spdlog.h>
#include <toml++/toml.hpp>

#include "hlid/core/codec.hpp"
#include "hlid/util/logging.hpp"
#include "hlid/util/xdg.hpp"

namespace hlid::config {

Result<Config> Config::fromFile(const std::optional<std::filesystem::path>& config_path) {
  Config config;

  if (config_path) {
    auto result = config.load(*config_path);
    if (!result.has_value()) {
      return std::unexpected(result.error());
    }
    return config;
  }

  auto default_path = defaultConfigPath();
  if (std::filesystem::exists(default_path)) {
    auto result = config.load(default_path);
    if (!result.has_value()) {
      return std::unexpected(result.error());
    }
  }

  return config;
}

Result<void> Config::load(const std::filesystem::path& config_path) {
  if (!std::filesystem::exists(config_path)) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Config file not found: " + config_path.string()));
  }

  try {
    auto config_data = toml::parse_file(config_path.string());

    if (auto value = config_data["user_data"].value<std::string>()) {
      user_data = *value;
    }
    if (auto value = config_data["secret"].value<std::string>()) {
      secret = *value;
    }
    if (auto value = config_data["output"].value<std::string>()) {
      auto format = stringToOutputFormat(*value);
      if (!format) {
        return std::unexpected(makeError(ErrorCode::kConfigError,
                                         "Invalid output format: " + *value));
      }
      output = *format;
    }
    if (auto value = config_data["log_level"].value<std::string>()) {
      log_level = *value;
    }
    if (auto value = config_data["log_to_file"].value<bool>()) {
      log_to_file = *value;
    }

    config_path_ = config_path;
    spdlog::debug("Loaded configuration from {}", config_path.string());
    return {};

  } catch (const toml::parse_error& e) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "TOML parse error: " + std::string(e.what())));
  }
}

Result<void> Config::validate() const {
  auto user_data_byte = core::Codec::parseUserData(user_data);
  if (!user_data_byte.has_value()) {
    return std::unexpected(makeError(ErrorCode::kConfigError,
                                     "Invalid user_data: " + user_data_byte.error().message()));
  }

  auto level = util::Logging::parseLevel(log_level);
  if (!level.has_value()) {
    return std::unexpected(level.error());
  }

  return {};
}

std::string Config::resolvedSecret() const {
  return resolveEnvVar(secret);
}

std::filesystem::path Config::defaultConfigPath() {
  return util::Xdg::configFile();
}

std::string Config::outputFormatToString(OutputFormat format) {
  switch (format) {
    case OutputFormat::kText: return "text";
    case OutputFormat::kJson: return "json";
  }
  return "text";
}

std::optional<Config::OutputFormat> Config::stringToOutputFormat(const std::string& str) {
  if (str == "text") return OutputFormat::kText;
  if (str == "json") return OutputFormat::kJson;
  return std::nullopt;
}

std::string Config::resolveEnvVar(const std::string& value) const {
  if (value.substr(0, 4) == "env:") {
    std::string var_name = value.substr(4);
    const char* env_value = std::getenv(var_name.c_str());
    return env_value ? std::string(env_value) : "";
  }
  return value;
}

}  // namespace hlid::config

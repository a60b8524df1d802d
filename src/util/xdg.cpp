#include "hlid/util/xdg.hpp"

#include <cstdlib>

namespace hlid::util {

std::filesystem::path Xdg::configHome() {
  std::string xdg_config_home = getEnvVar("XDG_CONFIG_HOME", "");
  if (!xdg_config_home.empty()) {
    return std::filesystem::path(xdg_config_home) / "hlid";
  }

  std::string home = getEnvVar("HOME", "");
  if (home.empty()) {
    return std::filesystem::current_path() / ".hlid_config";
  }

  return std::filesystem::path(home) / ".config" / "hlid";
}

std::filesystem::path Xdg::stateHome() {
  std::string xdg_state_home = getEnvVar("XDG_STATE_HOME", "");
  if (!xdg_state_home.empty()) {
    return std::filesystem::path(xdg_state_home) / "hlid";
  }

  std::string home = getEnvVar("HOME", "");
  if (home.empty()) {
    return std::filesystem::current_path() / ".hlid_state";
  }

  return std::filesystem::path(home) / ".local" / "state" / "hlid";
}

std::filesystem::path Xdg::configFile() {
  return configHome() / "config.toml";
}

std::string Xdg::getEnvVar(const std::string& name, const std::string& default_value) {
  const char* value = std::getenv(name.c_str());
  return value ? std::string(value) : default_value;
}

}  // namespace hlid::util

#pragma once

#include <filesystem>
#include <string>

namespace hlid::util {

// XDG Base Directory Specification utilities
class Xdg {
 public:
  // Get XDG config home directory (~/.config/hlid)
  static std::filesystem::path configHome();

  // Get XDG state home directory (~/.local/state/hlid), used for logs
  static std::filesystem::path stateHome();

  // Get config file path
  static std::filesystem::path configFile();

 private:
  // Get environment variable with default
  static std::string getEnvVar(const std::string& name, const std::string& default_value);
};

}  // namespace hlid::util

#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include <spdlog/common.h>

#include "hlid/common.hpp"

namespace hlid::util {

// spdlog setup for the hlid binary
class Logging {
 public:
  // Install the default "hlid" logger: stderr sink, plus a rotating file sink when given a path
  static void initialize(spdlog::level::level_enum level,
                         const std::optional<std::filesystem::path>& log_file = std::nullopt);

  // Parse a level name (trace|debug|info|warn|error|critical|off)
  static Result<spdlog::level::level_enum> parseLevel(const std::string& name);

  // Default location of the rotating log file
  static std::filesystem::path defaultLogFile();
};

}  // namespace hlid::util

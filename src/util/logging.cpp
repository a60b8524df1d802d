#include "hlid/util/logging.hpp"

#include <algorithm>
#include <memory>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "hlid/util/xdg.hpp"

namespace hlid::util {

void Logging::initialize(spdlog::level::level_enum level,
                         const std::optional<std::filesystem::path>& log_file) {
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  console_sink->set_level(level);

  std::vector<spdlog::sink_ptr> sinks = {console_sink};
  std::string file_error;

  if (log_file) {
    try {
      std::filesystem::create_directories(log_file->parent_path());
      auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          log_file->string(), 1024 * 1024 * 5, 3);  // 5MB files, 3 backups
      file_sink->set_level(spdlog::level::debug);
      sinks.push_back(file_sink);
    } catch (const std::exception& e) {
      file_error = e.what();
    }
  }

  auto logger = std::make_shared<spdlog::logger>("hlid", sinks.begin(), sinks.end());
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
  logger->set_level(sinks.size() > 1 ? std::min(level, spdlog::level::debug) : level);

  spdlog::set_default_logger(logger);

  if (!file_error.empty()) {
    spdlog::warn("Failed to setup file logging: {}", file_error);
  }
}

Result<spdlog::level::level_enum> Logging::parseLevel(const std::string& name) {
  auto level = spdlog::level::from_str(name);
  // from_str maps unknown names to "off", so only accept "off" when asked for
  if (level == spdlog::level::off && name != "off") {
    return makeErrorResult<spdlog::level::level_enum>(ErrorCode::kConfigError,
                                                      "Unknown log level: " + name);
  }
  return level;
}

std::filesystem::path Logging::defaultLogFile() {
  return Xdg::stateHome() / "hlid.log";
}

}  // namespace hlid::util

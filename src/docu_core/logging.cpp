#include "docu_core/logging.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <filesystem>
#include <memory>
#include <vector>

#include "docu_core/errors.hpp"

namespace docu_core {

spdlog::level::level_enum parse_log_level(const std::string& level) {
  if (level == "trace")
    return spdlog::level::trace;
  if (level == "debug")
    return spdlog::level::debug;
  if (level == "info")
    return spdlog::level::info;
  if (level == "warn" || level == "warning")
    return spdlog::level::warn;
  if (level == "error")
    return spdlog::level::err;
  if (level == "critical")
    return spdlog::level::critical;
  if (level == "off")
    return spdlog::level::off;
  throw ConfigError("Unknown log level: " + level);
}

void init_logging(const LoggingSettings& settings) {
  const auto level = parse_log_level(settings.log_level);

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

  if (!settings.log_file.empty()) {
    try {
      std::filesystem::path log_path(settings.log_file);
      if (log_path.has_parent_path()) {
        std::filesystem::create_directories(log_path.parent_path());
      }
      const size_t max_bytes = static_cast<size_t>(settings.max_file_size_mb) * 1024 * 1024;
      sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          settings.log_file, max_bytes, static_cast<size_t>(settings.max_files)));
    } catch (const spdlog::spdlog_ex& e) {
      throw ConfigError("Failed to open log file '" + settings.log_file + "': " + e.what());
    } catch (const std::filesystem::filesystem_error& e) {
      throw ConfigError("Failed to create log directory for '" + settings.log_file +
                        "': " + e.what());
    }
  }

  auto logger = std::make_shared<spdlog::logger>("documind", sinks.begin(), sinks.end());
  logger->set_level(level);
  logger->set_pattern("%Y-%m-%d %H:%M:%S | %-8l | %v");
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(logger);
}

}  // namespace docu_core

#pragma once

#include <spdlog/spdlog.h>

#include <string>

#include "docu_core/config.hpp"

namespace docu_core {

// Throws ConfigError for names spdlog does not know
spdlog::level::level_enum parse_log_level(const std::string& level);

// Installs the "documind" logger (stderr + rotating file) as the spdlog default.
// Components log through spdlog::info/warn/... and never hold a logger of their own.
void init_logging(const LoggingSettings& settings);

}  // namespace docu_core

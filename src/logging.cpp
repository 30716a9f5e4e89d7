#include "logging.hpp"

#include "errors.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <vector>

void initLogging(const LoggingConfig& config) {
  spdlog::level::level_enum level = spdlog::level::from_str(config.level);
  // from_str maps anything unknown to off
  if (level == spdlog::level::off && config.level != "off") {
    throw ConfigError("unknown log level '" + config.level + "'");
  }

  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (!config.file.empty()) {
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file, false));
    } catch (const spdlog::spdlog_ex& ex) {
      throw ConfigError("cannot open log file '" + config.file + "': " + ex.what());
    }
  }

  auto logger = std::make_shared<spdlog::logger>("afyaplate", sinks.begin(), sinks.end());
  logger->set_level(level);
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(logger);
}

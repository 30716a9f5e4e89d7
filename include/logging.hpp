#pragma once

#include <string>

struct LoggingConfig {
  std::string level = "info";  // trace|debug|info|warn|error|critical|off
  std::string file;            // empty: console only
};

// Installs the default logger: colour console sink (stderr) plus an optional file sink.
// Throws ConfigError on an unknown level.
void initLogging(const LoggingConfig& config);

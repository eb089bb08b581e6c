#pragma once

#include <filesystem>
#include <string>
#include <log4cplus/logger.h>

log4cplus::Logger& core_logger();
log4cplus::Logger& client_logger();
log4cplus::Logger& config_logger();

void init_logging(const std::string& config_path);

/**
 * Send all further output of the root logger to `log_file`, truncating it.
 * "-" keeps the configured appenders. A relative path is placed under
 * base_dir when one is given.
 */
void set_log_file(const std::string& log_file, const std::filesystem::path& base_dir = {});

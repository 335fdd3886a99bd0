#pragma once

#include <string>
#include <log4cplus/logger.h>

log4cplus::Logger& core_logger();
log4cplus::Logger& plugin_logger();
log4cplus::Logger& host_logger();

/**
 * Load a log4cplus properties file, falling back to a console appender on
 * stderr. stdout is reserved for protocol lines and is never used for logs.
 */
void init_logging(const std::string& config_path);

#pragma once

#include <string>
#include <log4cplus/logger.h>

log4cplus::Logger& shell_logger();
log4cplus::Logger& bridge_logger();
log4cplus::Logger& router_logger();
void init_logging(const std::string& config_path);

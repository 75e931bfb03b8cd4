#include "logger.hpp"

#include <filesystem>
#include <system_error>

#include <log4cplus/configurator.h>
#include <log4cplus/helpers/loglog.h>

log4cplus::Logger& shell_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("anonymizer_shell"));
	return logger;
}

log4cplus::Logger& bridge_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("anonymizer_shell.bridge"));
	return logger;
}

log4cplus::Logger& router_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("anonymizer_shell.router"));
	return logger;
}

static std::filesystem::path resolve_config_path(const std::string& config_path, std::error_code& ec) {
	std::filesystem::path path(config_path);
	if (path.is_absolute()) {
		return path;
	}

	std::filesystem::path cwd = std::filesystem::current_path(ec);
	if (ec) {
		return path;
	}
	return cwd / path;
}

void init_logging(const std::string& config_path) {
	std::error_code ec;
	auto resolved = resolve_config_path(config_path, ec);
	if (ec) {
		log4cplus::helpers::LogLog::getLogLog()->warn(
			LOG4CPLUS_TEXT("Cannot resolve working directory: ") + LOG4CPLUS_STRING_TO_TSTRING(ec.message()));
	} else if (std::filesystem::exists(resolved, ec)) {
		std::filesystem::create_directories("logs", ec);
		if (ec) {
			log4cplus::helpers::LogLog::getLogLog()->warn(
				LOG4CPLUS_TEXT("Failed to create logs directory: ") + LOG4CPLUS_STRING_TO_TSTRING(ec.message()));
		}
		log4cplus::PropertyConfigurator::doConfigure(LOG4CPLUS_STRING_TO_TSTRING(resolved.string()));
		return;
	}

	log4cplus::helpers::LogLog::getLogLog()->warn(
		LOG4CPLUS_TEXT("Logging config not found, using console defaults: ") +
		LOG4CPLUS_STRING_TO_TSTRING(resolved.string()));

	// stdout carries response documents
	log4cplus::BasicConfigurator fallback(log4cplus::Logger::getDefaultHierarchy(), true);
	fallback.configure();
	log4cplus::Logger::getRoot().setLogLevel(log4cplus::INFO_LOG_LEVEL);
}

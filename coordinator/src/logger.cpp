#include "logger.hpp"

#include <log4cplus/configurator.h>
#include <log4cplus/fileappender.h>
#include <log4cplus/helpers/loglog.h>
#include <log4cplus/layout.h>

#include <memory>
#include <stdexcept>

log4cplus::Logger& core_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("coordinator"));
	return logger;
}

log4cplus::Logger& client_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("coordinator.client"));
	return logger;
}

log4cplus::Logger& config_logger() {
	static log4cplus::Logger logger = log4cplus::Logger::getInstance(LOG4CPLUS_TEXT("coordinator.config"));
	return logger;
}

static std::filesystem::path resolve_config_path(const std::string& config_path) {
	std::filesystem::path path(config_path);
	if (path.is_absolute()) {
		return path;
	}

	return std::filesystem::current_path() / path;
}

static std::filesystem::path resolve_log_path(const std::string& log_file, const std::filesystem::path& base_dir) {
	std::filesystem::path path(log_file);
	if (path.is_absolute() || base_dir.empty()) {
		return path;
	}

	std::filesystem::create_directories(base_dir);
	return base_dir / path;
}

static void redirect_to_file(const std::filesystem::path& path) {
	log4cplus::SharedAppenderPtr appender(
		new log4cplus::FileAppender(LOG4CPLUS_STRING_TO_TSTRING(path.string()), std::ios_base::trunc));
	appender->setName(LOG4CPLUS_TEXT("coordinator_file"));
	appender->setLayout(std::unique_ptr<log4cplus::Layout>(new log4cplus::PatternLayout(LOG4CPLUS_TEXT("%p - %m%n"))));

	log4cplus::Logger root = log4cplus::Logger::getRoot();
	root.removeAllAppenders();
	root.addAppender(appender);
}

void init_logging(const std::string& config_path) {
	try {
		auto resolved = resolve_config_path(config_path);
		if (!config_path.empty() && std::filesystem::exists(resolved)) {
			log4cplus::PropertyConfigurator::doConfigure(LOG4CPLUS_STRING_TO_TSTRING(resolved.string()));
			return;
		}
	} catch (const std::exception& exc) {
		log4cplus::helpers::LogLog::getLogLog()->error(
			LOG4CPLUS_TEXT("Failed to load logging config: ") + LOG4CPLUS_STRING_TO_TSTRING(std::string(exc.what())));
	}

	log4cplus::BasicConfigurator fallback;
	fallback.configure();
	log4cplus::Logger::getRoot().setLogLevel(log4cplus::INFO_LOG_LEVEL);
}

void set_log_file(const std::string& log_file, const std::filesystem::path& base_dir) {
	if (log_file.empty() || log_file == "-") {
		return;
	}

	redirect_to_file(resolve_log_path(log_file, base_dir));
}

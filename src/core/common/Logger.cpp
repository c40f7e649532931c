#include "Logger.hpp"
#include <spdlog/pattern_formatter.h>
#include <algorithm>
#include <cctype>
#include <vector>

namespace ReelSync {

namespace {
const char* kLoggerName = "reelsync";
}

Logger& Logger::instance() {
    static Logger instance;
    return instance;
}

void Logger::initialize(const std::string& logFilePath, Level level) {
    if (logger_) {
        spdlog::drop(logger_->name());
    }

    try {
        // stdout carries the sync preview and summary, so log lines go to stderr
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_pattern("[%H:%M:%S] [%^%l%$] %v");

        std::vector<spdlog::sink_ptr> sinks{console_sink};
        if (!logFilePath.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logFilePath, 1024 * 1024 * 5, 3); // 5MB, 3 files
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%f] [%l] [%t] %v");
            sinks.push_back(file_sink);
        }

        logger_ = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
        setLevel(level);
        spdlog::register_logger(logger_);

        if (!logFilePath.empty()) {
            REELSYNC_DEBUG("Logger initialized with file: {}", logFilePath);
        }
    } catch (const spdlog::spdlog_ex& ex) {
        logger_ = spdlog::stderr_color_mt("reelsync_fallback");
        setLevel(level);
        logger_->error("Logger initialization failed: {}", ex.what());
    }
}

void Logger::setLevel(Level level) {
    level_ = level;
    if (logger_) {
        logger_->set_level(static_cast<spdlog::level::level_enum>(level));
    }
}

bool Logger::parseLevel(const std::string& name, Level& out) {
    std::string l(name);
    std::transform(l.begin(), l.end(), l.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (l == "trace") out = Level::Trace;
    else if (l == "debug") out = Level::Debug;
    else if (l == "info") out = Level::Info;
    else if (l == "warn" || l == "warning") out = Level::Warn;
    else if (l == "error") out = Level::Error;
    else if (l == "critical") out = Level::Critical;
    else return false;
    return true;
}

bool Logger::setLevelFromString(const std::string& name) {
    Level parsed;
    if (!parseLevel(name, parsed)) {
        return false;
    }
    setLevel(parsed);
    return true;
}

spdlog::logger* Logger::logger() {
    if (!logger_) {
        initialize(std::string(), level_);
    }
    return logger_.get();
}

} // namespace ReelSync

#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <fmt/core.h>
#include <memory>
#include <string>

namespace ReelSync {

class Logger {
public:
    enum class Level {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warn = 3,
        Error = 4,
        Critical = 5
    };

    static Logger& instance();

    /**
     * @brief Set up the console sink (stderr) and, when logFilePath is not
     * empty, a rotating file sink. Safe to call more than once; the last call wins.
     */
    void initialize(const std::string& logFilePath = std::string(),
                    Level level = Level::Info);

    void setLevel(Level level);
    Level level() const { return level_; }

    // Accepts trace/debug/info/warn/error/critical, case-insensitive.
    // Returns false and leaves the level unchanged for anything else.
    bool setLevelFromString(const std::string& name);
    static bool parseLevel(const std::string& name, Level& out);

    template<typename... Args>
    void trace(fmt::format_string<Args...> format, Args&&... args) {
        logger()->trace(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(fmt::format_string<Args...> format, Args&&... args) {
        logger()->debug(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(fmt::format_string<Args...> format, Args&&... args) {
        logger()->info(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(fmt::format_string<Args...> format, Args&&... args) {
        logger()->warn(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(fmt::format_string<Args...> format, Args&&... args) {
        logger()->error(format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(fmt::format_string<Args...> format, Args&&... args) {
        logger()->critical(format, std::forward<Args>(args)...);
    }

private:
    Logger() = default;

    // Lazily falls back to a console logger so library code can log before initialize().
    spdlog::logger* logger();

    std::shared_ptr<spdlog::logger> logger_;
    Level level_ = Level::Info;
};

#define REELSYNC_TRACE(...) ReelSync::Logger::instance().trace(__VA_ARGS__)
#define REELSYNC_DEBUG(...) ReelSync::Logger::instance().debug(__VA_ARGS__)
#define REELSYNC_INFO(...) ReelSync::Logger::instance().info(__VA_ARGS__)
#define REELSYNC_WARN(...) ReelSync::Logger::instance().warn(__VA_ARGS__)
#define REELSYNC_ERROR(...) ReelSync::Logger::instance().error(__VA_ARGS__)
#define REELSYNC_CRITICAL(...) ReelSync::Logger::instance().critical(__VA_ARGS__)

} // namespace ReelSync

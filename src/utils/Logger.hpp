#pragma once
#include <atomic>
#include <string>
#include <mutex>
#include <memory>
#include <utility>

#include <fmt/format.h>

namespace spdlog {
class logger;
}

namespace whodat {

class Logger {
public:
    enum Level { LOG_DEBUG, LOG_INFO, LOG_WARNING, LOG_ERROR, LOG_FATAL };

    static Logger& getInstance();

    // Console goes to stderr so command output on stdout stays clean.
    // An empty filename disables the file sink.
    void initialize(const std::string& logFile = "", bool coloredOutput = true);

    // Reads Log.Level, Log.File and Log.Colored from Configs::Get() and
    // follows later changes to Log.Level
    void initializeWithConfig();

    void setLogFile(const std::string& filename);
    void setLogLevel(Level level);
    Level getLogLevel() const;
    void setColoredOutput(bool enabled);

    static Level parseLevel(const std::string& name, Level fallback = LOG_INFO);

    void debug(const std::string& message)   { log(LOG_DEBUG, message); }
    void info(const std::string& message)    { log(LOG_INFO, message); }
    void warning(const std::string& message) { log(LOG_WARNING, message); }
    void error(const std::string& message)   { log(LOG_ERROR, message); }
    void fatal(const std::string& message)   { log(LOG_FATAL, message); }

    /**
     * Formatted logging
     * Usage: Logger::getInstance().debug("Value: {}, Name: {}", 42, "test");
     */
    template<typename... Args>
    void debug(const std::string& format, Args&&... args) {
        logFormatted(LOG_DEBUG, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(const std::string& format, Args&&... args) {
        logFormatted(LOG_INFO, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warning(const std::string& format, Args&&... args) {
        logFormatted(LOG_WARNING, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(const std::string& format, Args&&... args) {
        logFormatted(LOG_ERROR, format, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void fatal(const std::string& format, Args&&... args) {
        logFormatted(LOG_FATAL, format, std::forward<Args>(args)...);
    }

private:
    Logger();
    ~Logger();
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    template<typename... Args>
    void logFormatted(Level level, const std::string& format, Args&&... args) {
        if (level < currentLevel) return;
        try {
            log(level, fmt::vformat(format, fmt::make_format_args(args...)));
        } catch (const std::exception& e) {
            log(LOG_ERROR, "Logger format error: " + std::string(e.what()) +
                          " | Original format: " + format);
        }
    }

    void log(Level level, const std::string& message);
    void rebuildLogger();

    mutable std::mutex mutex;
    std::shared_ptr<spdlog::logger> sink;
    std::atomic<Level> currentLevel{LOG_INFO};
    std::string logFile;
    bool coloredOutput = true;
    std::once_flag levelWatch;
};

inline void debug(const std::string& message) {
    Logger::getInstance().debug(message);
}
inline void info(const std::string& message) {
    Logger::getInstance().info(message);
}
inline void warning(const std::string& message) {
    Logger::getInstance().warning(message);
}
inline void error(const std::string& message) {
    Logger::getInstance().error(message);
}
template<typename... Args>
inline void debug(const std::string& format, Args&&... args) {
    Logger::getInstance().debug(format, std::forward<Args>(args)...);
}
template<typename... Args>
inline void info(const std::string& format, Args&&... args) {
    Logger::getInstance().info(format, std::forward<Args>(args)...);
}
template<typename... Args>
inline void warning(const std::string& format, Args&&... args) {
    Logger::getInstance().warning(format, std::forward<Args>(args)...);
}
template<typename... Args>
inline void error(const std::string& format, Args&&... args) {
    Logger::getInstance().error(format, std::forward<Args>(args)...);
}

} // namespace whodat

#include "Logger.hpp"
#include "core/ConfigManager.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace whodat {

namespace {

spdlog::level::level_enum toSpdlog(Logger::Level level) {
    switch (level) {
        case Logger::LOG_DEBUG: return spdlog::level::debug;
        case Logger::LOG_INFO: return spdlog::level::info;
        case Logger::LOG_WARNING: return spdlog::level::warn;
        case Logger::LOG_ERROR: return spdlog::level::err;
        case Logger::LOG_FATAL: return spdlog::level::critical;
    }
    return spdlog::level::info;
}

} // namespace

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    std::lock_guard<std::mutex> lock(mutex);
    rebuildLogger();
}

Logger::~Logger() {
    if (sink) {
        sink->flush();
    }
}

void Logger::initialize(const std::string& logFile, bool coloredOutput) {
    std::lock_guard<std::mutex> lock(mutex);
    this->logFile = logFile;
    this->coloredOutput = coloredOutput;
    rebuildLogger();
}

void Logger::initializeWithConfig() {
    auto& config = Configs::Get();
    setLogLevel(parseLevel(config.GetLogLevel()));
    initialize(config.GetLogFile(), config.GetLogColored());
    std::call_once(levelWatch, [this, &config]() {
        config.Watch<std::string>("Log.Level", [this](std::string, std::string level) {
            setLogLevel(parseLevel(level));
        });
    });
}

void Logger::setLogFile(const std::string& filename) {
    std::lock_guard<std::mutex> lock(mutex);
    logFile = filename;
    rebuildLogger();
}

void Logger::setLogLevel(Level level) {
    std::lock_guard<std::mutex> lock(mutex);
    currentLevel = level;
    if (sink) {
        sink->set_level(toSpdlog(level));
    }
}

Logger::Level Logger::getLogLevel() const {
    return currentLevel.load();
}

void Logger::setColoredOutput(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex);
    coloredOutput = enabled;
    rebuildLogger();
}

Logger::Level Logger::parseLevel(const std::string& name, Level fallback) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower == "debug") return LOG_DEBUG;
    if (lower == "info") return LOG_INFO;
    if (lower == "warning" || lower == "warn") return LOG_WARNING;
    if (lower == "error") return LOG_ERROR;
    if (lower == "fatal") return LOG_FATAL;
    return fallback;
}

void Logger::log(Level level, const std::string& message) {
    std::shared_ptr<spdlog::logger> current;
    {
        if (level < currentLevel.load()) return;
        std::lock_guard<std::mutex> lock(mutex);
        current = sink;
    }
    if (current) {
        current->log(toSpdlog(level), message);
    }
}

// Caller holds the mutex
void Logger::rebuildLogger() {
    std::vector<spdlog::sink_ptr> sinks;
    if (coloredOutput) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    } else {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_sink_mt>());
    }

    if (!logFile.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile));
        } catch (const spdlog::spdlog_ex& e) {
            std::cerr << "Failed to open log file " << logFile << ": " << e.what() << "\n";
        }
    }

    auto logger = std::make_shared<spdlog::logger>("whodat", sinks.begin(), sinks.end());
    logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v");
    logger->set_level(toSpdlog(currentLevel.load()));
    logger->flush_on(spdlog::level::warn);
    sink = std::move(logger);
}

} // namespace whodat

/**
 * @file oncall_logger.hpp
 * @brief Logging system for schedule computation
 * @version 1.0.0
 * @author Bennie Shearer
 * Copyright (c) 2025 Bennie Shearer - MIT License
 */
#ifndef ONCALL_LOGGER_HPP
#define ONCALL_LOGGER_HPP

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>

namespace oncall {

// Use LOG_ prefix to avoid Windows macro conflicts (ERROR is defined in WinGDI.h)
enum class LogLevel { LOG_TRACE, LOG_DEBUG, LOG_INFO, LOG_WARNING, LOG_ERROR, LOG_FATAL };

inline const char* logLevelToString(LogLevel level) {
    static const char* levels[] = {"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL"};
    return levels[static_cast<int>(level)];
}

/**
 * @brief Parse a level name (case-insensitive, WARNING accepted for WARN)
 */
inline std::optional<LogLevel> parseLogLevel(std::string name) {
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (name == "TRACE") return LogLevel::LOG_TRACE;
    if (name == "DEBUG") return LogLevel::LOG_DEBUG;
    if (name == "INFO") return LogLevel::LOG_INFO;
    if (name == "WARN" || name == "WARNING") return LogLevel::LOG_WARNING;
    if (name == "ERROR") return LogLevel::LOG_ERROR;
    if (name == "FATAL") return LogLevel::LOG_FATAL;
    return std::nullopt;
}

class Logger {
public:
    static Logger& instance() { static Logger l; return l; }

    /**
     * @brief Start writing to a timestamped file under dir
     * @return false if the directory or file cannot be created
     */
    bool initialize(const std::filesystem::path& dir) {
        std::lock_guard<std::mutex> lock(mtx_);
        dir_ = dir;
        std::error_code ec;
        if (!std::filesystem::exists(dir_, ec)) std::filesystem::create_directories(dir_, ec);
        if (ec) return false;
        openFile();
        init_ = file_.is_open();
        return init_;
    }

    void setLevel(LogLevel level) { level_ = level; }
    LogLevel getLevel() const { return level_; }
    void setConsoleOutput(bool enabled) { console_ = enabled; }

    void log(LogLevel level, const std::string& component, const std::string& message) {
        if (level < level_) return;
        std::lock_guard<std::mutex> lock(mtx_);
        std::string line = formatLine(level, component, message);
        if (init_ && file_.is_open()) { file_ << line << "\n"; file_.flush(); }
        // stdout carries schedule output, so console logging goes to clog
        if (console_) std::clog << line << "\n";
    }

    void trace(const std::string& comp, const std::string& msg) { log(LogLevel::LOG_TRACE, comp, msg); }
    void debug(const std::string& comp, const std::string& msg) { log(LogLevel::LOG_DEBUG, comp, msg); }
    void info(const std::string& comp, const std::string& msg) { log(LogLevel::LOG_INFO, comp, msg); }
    void warning(const std::string& comp, const std::string& msg) { log(LogLevel::LOG_WARNING, comp, msg); }
    void error(const std::string& comp, const std::string& msg) { log(LogLevel::LOG_ERROR, comp, msg); }
    void fatal(const std::string& comp, const std::string& msg) { log(LogLevel::LOG_FATAL, comp, msg); }

    void shutdown() {
        std::lock_guard<std::mutex> lock(mtx_);
        if (file_.is_open()) {
            file_.flush();
            file_.close();
        }
        init_ = false;
    }

private:
    Logger() = default;
    ~Logger() { if (file_.is_open()) file_.close(); }
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static std::tm localTime() {
        auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm tm{};
#ifdef _WIN32
        localtime_s(&tm, &t);
#else
        localtime_r(&t, &tm);
#endif
        return tm;
    }

    void openFile() {
        if (file_.is_open()) file_.close();
        std::tm tm = localTime();
        std::ostringstream fn;
        fn << "oncall_" << std::put_time(&tm, "%Y%m%d_%H%M%S") << ".log";
        file_.open(dir_ / fn.str(), std::ios::app);
    }

    std::string formatLine(LogLevel level, const std::string& comp, const std::string& msg) {
        std::tm tm = localTime();
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << " [" << logLevelToString(level)
            << "] [" << comp << "] " << msg;
        return oss.str();
    }

    mutable std::mutex mtx_;
    std::filesystem::path dir_;
    std::ofstream file_;
    LogLevel level_ = LogLevel::LOG_WARNING;
    bool init_ = false, console_ = false;
};

#define ONCALL_LOG_TRACE(comp, msg) oncall::Logger::instance().trace(comp, msg)
#define ONCALL_LOG_DEBUG(comp, msg) oncall::Logger::instance().debug(comp, msg)
#define ONCALL_LOG_INFO(comp, msg) oncall::Logger::instance().info(comp, msg)
#define ONCALL_LOG_WARNING(comp, msg) oncall::Logger::instance().warning(comp, msg)
#define ONCALL_LOG_ERROR(comp, msg) oncall::Logger::instance().error(comp, msg)
#define ONCALL_LOG_FATAL(comp, msg) oncall::Logger::instance().fatal(comp, msg)

} // namespace oncall
#endif // ONCALL_LOGGER_HPP

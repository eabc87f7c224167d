#pragma once

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace bitguard {
namespace utils {

enum class LogLevel {
    TRACE,
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL
};

class Logger {
public:
    static constexpr const char* LEVEL_ENV_VAR = "BITGUARD_LOG_LEVEL";

    static Logger& getInstance() {
        static Logger instance;
        return instance;
    }

    void setLevel(LogLevel level) {
        current_level_.store(level, std::memory_order_relaxed);
    }

    LogLevel getLevel() const {
        return current_level_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Redirect log lines (nullptr restores std::cout)
     */
    void setOutput(std::ostream* out) {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = out ? out : &std::cout;
    }

    bool isEnabled(LogLevel level) const {
        return level >= getLevel();
    }

    /**
     * @brief Apply BITGUARD_LOG_LEVEL if it names a known level
     * @return true if the level was changed
     */
    bool configureFromEnvironment() {
        const char* value = std::getenv(LEVEL_ENV_VAR);
        if (!value) return false;

        auto level = parseLevel(value);
        if (!level) {
            warn("Logger: Ignoring unknown ", LEVEL_ENV_VAR, " value '", value, "'");
            return false;
        }
        setLevel(*level);
        return true;
    }

    static std::optional<LogLevel> parseLevel(const std::string& name) {
        std::string lower;
        for (char c : name) {
            lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }

        if (lower == "trace") return LogLevel::TRACE;
        if (lower == "debug") return LogLevel::DEBUG;
        if (lower == "info")  return LogLevel::INFO;
        if (lower == "warn" || lower == "warning") return LogLevel::WARN;
        if (lower == "error") return LogLevel::ERROR;
        if (lower == "fatal") return LogLevel::FATAL;
        return std::nullopt;
    }

    template<typename... Args>
    void log(LogLevel level, const Args&... args) {
        if (!isEnabled(level)) return;

        // std::localtime shares static storage; format under the lock
        std::lock_guard<std::mutex> lock(mutex_);

        auto now = std::chrono::system_clock::now();
        auto time_t = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::ostringstream oss;
        oss << "[" << std::put_time(std::localtime(&time_t), "%H:%M:%S")
            << "." << std::setfill('0') << std::setw(3) << ms.count()
            << "] [" << levelToString(level) << "] ";

        ((oss << args), ...);
        oss << '\n';

        *out_ << oss.str() << std::flush;
    }

    template<typename... Args>
    void trace(const Args&... args) { log(LogLevel::TRACE, args...); }

    template<typename... Args>
    void debug(const Args&... args) { log(LogLevel::DEBUG, args...); }

    template<typename... Args>
    void info(const Args&... args) { log(LogLevel::INFO, args...); }

    template<typename... Args>
    void warn(const Args&... args) { log(LogLevel::WARN, args...); }

    template<typename... Args>
    void error(const Args&... args) { log(LogLevel::ERROR, args...); }

    template<typename... Args>
    void fatal(const Args&... args) { log(LogLevel::FATAL, args...); }

private:
    Logger() : current_level_(LogLevel::INFO), out_(&std::cout) {}

    static const char* levelToString(LogLevel level) {
        switch (level) {
            case LogLevel::TRACE: return "TRACE";
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::FATAL: return "FATAL";
            default: return "UNKNOWN";
        }
    }

    std::atomic<LogLevel> current_level_;
    std::ostream* out_;
    std::mutex mutex_;
};

// Convenience macros
#define LOG_TRACE(...) bitguard::utils::Logger::getInstance().trace(__VA_ARGS__)
#define LOG_DEBUG(...) bitguard::utils::Logger::getInstance().debug(__VA_ARGS__)
#define LOG_INFO(...)  bitguard::utils::Logger::getInstance().info(__VA_ARGS__)
#define LOG_WARN(...)  bitguard::utils::Logger::getInstance().warn(__VA_ARGS__)
#define LOG_ERROR(...) bitguard::utils::Logger::getInstance().error(__VA_ARGS__)
#define LOG_FATAL(...) bitguard::utils::Logger::getInstance().fatal(__VA_ARGS__)

} // namespace utils
} // namespace bitguard

// =============================================================================
// BLOCKFORGE - LOGGER
// Leveled category logger with an optional file sink and console echo
// =============================================================================
#pragma once

#include <cstdint>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace blockforge {

enum class LogLevel : std::uint8_t {
    Trace = 0,
    Info,
    Warn,
    Error,
    Off,
};

// "trace" / "info" / "warn" / "error" / "off"
[[nodiscard]] inline std::optional<LogLevel> log_level_from_name(std::string_view name) noexcept {
    if (name == "trace") return LogLevel::Trace;
    if (name == "info") return LogLevel::Info;
    if (name == "warn") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "off") return LogLevel::Off;
    return std::nullopt;
}

class Logger {
public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    bool open(const std::string& filename) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_file.is_open()) {
            m_file.close();
        }
        m_file.open(filename, std::ios::out | std::ios::trunc);
        if (m_file.is_open()) {
            m_file << "=== BLOCKFORGE LOG ===\n\n";
            m_file.flush();
            return true;
        }
        return false;
    }

    void close() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_file.is_open()) {
            m_file.close();
        }
    }

    // Messages below this level are dropped everywhere
    void set_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_level = level;
    }

    // Messages at or above this level are also echoed to stderr
    void set_console_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_console_level = level;
    }

    [[nodiscard]] bool enabled(LogLevel level) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return level >= m_level && (m_file.is_open() || level >= m_console_level);
    }

    template<typename... Args>
    void log(LogLevel level, const char* category, Args&&... args) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (level < m_level) return;

        const bool to_file = m_file.is_open();
        const bool to_console = level >= m_console_level;
        if (!to_file && !to_console) return;

        std::ostringstream line;
        line << "[" << category << "] ";
        if (level == LogLevel::Warn) line << "WARNING: ";
        if (level == LogLevel::Error) line << "ERROR: ";
        ((line << args), ...);
        line << "\n";

        if (to_file) {
            m_file << line.str();
            m_file.flush();
        }
        if (to_console) {
            std::cerr << line.str();
        }
    }

    void log_separator() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_file.is_open()) return;
        m_file << "----------------------------------------\n";
        m_file.flush();
    }

private:
    Logger() = default;
    ~Logger() { close(); }

    std::ofstream m_file;
    mutable std::mutex m_mutex;
    LogLevel m_level = LogLevel::Info;
    LogLevel m_console_level = LogLevel::Warn;
};

// Convenience macros
#define BLOCKFORGE_TRACE(...) ::blockforge::Logger::instance().log(::blockforge::LogLevel::Trace, __VA_ARGS__)
#define BLOCKFORGE_LOG(...)   ::blockforge::Logger::instance().log(::blockforge::LogLevel::Info, __VA_ARGS__)
#define BLOCKFORGE_WARN(...)  ::blockforge::Logger::instance().log(::blockforge::LogLevel::Warn, __VA_ARGS__)
#define BLOCKFORGE_ERROR(...) ::blockforge::Logger::instance().log(::blockforge::LogLevel::Error, __VA_ARGS__)
#define BLOCKFORGE_LOG_SEP()  ::blockforge::Logger::instance().log_separator()

} // namespace blockforge

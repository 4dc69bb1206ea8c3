#pragma once
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace hookgate::core::logging {

    // 1. Log levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    inline std::optional<LogLevel> parse_log_level(const std::string& text) {
        if (text == "debug") return LogLevel::DEBUG;
        if (text == "info")  return LogLevel::INFO;
        if (text == "warn")  return LogLevel::WARN;
        if (text == "error") return LogLevel::ERROR;
        return std::nullopt;
    }

    // 2. Global logger. Operator commands log to stdout; the hook path
    // redirects to a diagnostic file so stderr only carries block reasons.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_session_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            session_id_ = id;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        void set_stream(std::ostream& out) {
            std::lock_guard<std::mutex> lock(mutex_);
            file_.reset();
            out_ = &out;
        }

        // Returns false when the file cannot be opened; the previous sink stays active.
        bool set_file(const std::filesystem::path& path) {
            std::lock_guard<std::mutex> lock(mutex_);
            std::error_code ec;
            std::filesystem::create_directories(path.parent_path(), ec);
            auto file = std::make_unique<std::ofstream>(path, std::ios::app);
            if (!file->is_open()) {
                return false;
            }
            file_ = std::move(file);
            out_ = file_.get();
            return true;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level < min_level_) {
                return;
            }

            *out_ << "[" << level_to_string(level) << "] "
                  << (session_id_.empty() ? "" : "[" + session_id_ + "] ")
                  << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string session_id_;
        LogLevel min_level_ = LogLevel::INFO;
        std::ostream* out_ = &std::cout;
        std::unique_ptr<std::ofstream> file_;

        std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    // 3. Helper macros
    #define HOOKGATE_LOG_DEBUG(msg) hookgate::core::logging::Logger::get().log(hookgate::core::logging::LogLevel::DEBUG, msg)
    #define HOOKGATE_LOG_INFO(msg)  hookgate::core::logging::Logger::get().log(hookgate::core::logging::LogLevel::INFO, msg)
    #define HOOKGATE_LOG_WARN(msg)  hookgate::core::logging::Logger::get().log(hookgate::core::logging::LogLevel::WARN, msg)
    #define HOOKGATE_LOG_ERROR(msg) hookgate::core::logging::Logger::get().log(hookgate::core::logging::LogLevel::ERROR, msg)

} // namespace hookgate::core::logging

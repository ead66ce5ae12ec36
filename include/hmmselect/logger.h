#pragma once

#include <memory>
#include <string>
#include <fstream>
#include <mutex>
#include <chrono>
#include <sstream>
#include <vector>
#include <map>
#include <cstdio>

namespace hmmselect {
namespace diagnostics {

/**
 * @brief Log levels ordered by severity from lowest (DEBUG) to highest (FATAL)
 */
enum class LogLevel {
    DEBUG = 0,    ///< Per-candidate and per-fold detail
    INFO = 1,     ///< Selection and recognition summaries
    WARN = 2,     ///< Recovered failures and fallbacks
    ERROR = 3,    ///< Classes left without a model
    FATAL = 4     ///< Unrecoverable misuse
};

/**
 * @brief Log output destinations
 */
enum class LogOutput {
    NONE = 0,        ///< No output
    CONSOLE = 1,     ///< Console output
    FILE = 2,        ///< File output
    BOTH = 3         ///< Both console and file output
};

/**
 * @brief Log format configuration
 */
struct LogFormat {
    bool include_timestamp = true;     ///< Include timestamp in log messages
    bool include_level = true;         ///< Include log level in messages
    bool include_thread_id = false;    ///< Include thread ID in messages
    bool use_colors = true;            ///< Use ANSI color codes for console output
    std::string timestamp_format = "%Y-%m-%d %H:%M:%S"; ///< strftime format
};

/**
 * @brief Structured logger for model selection runs
 *
 * Multiple output destinations, level filtering, per-level counters and
 * printf-style helpers. One global instance is reachable through
 * instance() and the LOG_* macros; tests create their own.
 */
class Logger {
public:
    static Logger& instance();

    explicit Logger(const std::string& name = "hmmselect");
    ~Logger();

    // Configuration
    void set_level(LogLevel level) { min_level_ = level; }
    LogLevel level() const { return min_level_; }
    void set_output(LogOutput output) { output_dest_ = output; }
    void set_log_file(const std::string& file_path);
    void set_format(const LogFormat& format) { format_ = format; }

    void debug(const std::string& message);
    void info(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);
    void fatal(const std::string& message);

    template<typename... Args>
    void debug_f(const std::string& format, Args... args) {
        if (should_log(LogLevel::DEBUG)) {
            log(LogLevel::DEBUG, format_string(format, args...));
        }
    }

    template<typename... Args>
    void info_f(const std::string& format, Args... args) {
        if (should_log(LogLevel::INFO)) {
            log(LogLevel::INFO, format_string(format, args...));
        }
    }

    template<typename... Args>
    void warn_f(const std::string& format, Args... args) {
        if (should_log(LogLevel::WARN)) {
            log(LogLevel::WARN, format_string(format, args...));
        }
    }

    template<typename... Args>
    void error_f(const std::string& format, Args... args) {
        if (should_log(LogLevel::ERROR)) {
            log(LogLevel::ERROR, format_string(format, args...));
        }
    }

    void log(LogLevel level, const std::string& message);

    // Context-aware logging for selection runs
    void log_candidate(const std::string& selector, const std::string& class_label,
                       int num_states, bool success, double criterion);
    void log_selection(const std::string& selector, const std::string& class_label,
                       int chosen_states, bool used_fallback);
    void log_recognition(size_t num_items, size_t num_classes, size_t num_without_guess);

    void flush();
    void close();
    bool is_enabled(LogLevel level) const { return level >= min_level_; }

    struct LogStats {
        size_t debug_count = 0;
        size_t info_count = 0;
        size_t warn_count = 0;
        size_t error_count = 0;
        size_t fatal_count = 0;
        size_t total_bytes_written = 0;
        std::chrono::time_point<std::chrono::steady_clock> start_time;
    };

    LogStats get_stats() const;
    void reset_stats();

    class ScopedLevel {
    public:
        ScopedLevel(Logger& logger, LogLevel new_level);
        ~ScopedLevel();
    private:
        Logger& logger_;
        LogLevel original_level_;
    };

private:
    std::string logger_name_;
    LogLevel min_level_ = LogLevel::INFO;
    LogOutput output_dest_ = LogOutput::CONSOLE;
    LogFormat format_;

    std::string log_file_path_;
    std::unique_ptr<std::ofstream> file_stream_;
    mutable std::mutex log_mutex_;

    LogStats stats_;

    bool should_log(LogLevel level) const { return level >= min_level_; }
    std::string format_message(LogLevel level, const std::string& message);
    std::string get_timestamp();
    std::string get_level_string(LogLevel level);
    std::string get_level_color(LogLevel level);

    void write_to_console(const std::string& message, LogLevel level);
    void write_to_file(const std::string& message);

    template<typename... Args>
    std::string format_string(const std::string& format, Args... args) {
        int size = std::snprintf(nullptr, 0, format.c_str(), args...);
        if (size <= 0) {
            return format;
        }
        std::unique_ptr<char[]> buf(new char[size + 1]);
        std::snprintf(buf.get(), size + 1, format.c_str(), args...);
        return std::string(buf.get(), buf.get() + size);
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
};

#define LOG_DEBUG(msg) hmmselect::diagnostics::Logger::instance().debug(msg)
#define LOG_INFO(msg) hmmselect::diagnostics::Logger::instance().info(msg)
#define LOG_WARN(msg) hmmselect::diagnostics::Logger::instance().warn(msg)
#define LOG_ERROR(msg) hmmselect::diagnostics::Logger::instance().error(msg)
#define LOG_FATAL(msg) hmmselect::diagnostics::Logger::instance().fatal(msg)

#define LOG_DEBUG_F(fmt, ...) hmmselect::diagnostics::Logger::instance().debug_f(fmt, __VA_ARGS__)
#define LOG_INFO_F(fmt, ...) hmmselect::diagnostics::Logger::instance().info_f(fmt, __VA_ARGS__)
#define LOG_WARN_F(fmt, ...) hmmselect::diagnostics::Logger::instance().warn_f(fmt, __VA_ARGS__)
#define LOG_ERROR_F(fmt, ...) hmmselect::diagnostics::Logger::instance().error_f(fmt, __VA_ARGS__)

namespace LoggingUtils {
    /**
     * @brief Configure the global logger
     * @param log_file_path Path to log file (empty for console-only logging)
     * @param debug_mode Enable debug-level logging
     * @return true if the file (when requested) could be opened
     */
    bool initialize_logging(const std::string& log_file_path = "", bool debug_mode = false);

    LogLevel parse_level(const std::string& name, LogLevel fallback = LogLevel::INFO);
    std::string level_name(LogLevel level);
}

} // namespace diagnostics
} // namespace hmmselect

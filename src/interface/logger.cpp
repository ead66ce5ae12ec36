#include "hmmselect/logger.h"
#include <iostream>
#include <iomanip>
#include <filesystem>
#include <algorithm>
#include <cctype>
#include <thread>
#include <ctime>

namespace hmmselect {
namespace diagnostics {

namespace {
    const std::map<LogLevel, std::string> LEVEL_COLORS = {
        {LogLevel::DEBUG, "\033[36m"},    // Cyan
        {LogLevel::INFO, "\033[32m"},     // Green
        {LogLevel::WARN, "\033[33m"},     // Yellow
        {LogLevel::ERROR, "\033[31m"},    // Red
        {LogLevel::FATAL, "\033[35m"}     // Magenta
    };

    const std::string COLOR_RESET = "\033[0m";
}

Logger& Logger::instance() {
    static Logger global_instance("hmmselect");
    return global_instance;
}

Logger::Logger(const std::string& name)
    : logger_name_(name) {
    stats_.start_time = std::chrono::steady_clock::now();
}

Logger::~Logger() {
    close();
}

void Logger::set_log_file(const std::string& file_path) {
    std::lock_guard<std::mutex> lock(log_mutex_);

    if (file_stream_) {
        file_stream_->close();
        file_stream_.reset();
    }

    if (file_path.empty()) {
        return;
    }

    log_file_path_ = file_path;

    std::filesystem::path log_path(file_path);
    if (!log_path.parent_path().empty()) {
        std::error_code ec;
        std::filesystem::create_directories(log_path.parent_path(), ec);
    }

    file_stream_ = std::make_unique<std::ofstream>(file_path, std::ios::app);
    if (!file_stream_->is_open()) {
        std::cerr << "Warning: Failed to open log file: " << file_path << std::endl;
        file_stream_.reset();
    }
}

void Logger::debug(const std::string& message) {
    log(LogLevel::DEBUG, message);
}

void Logger::info(const std::string& message) {
    log(LogLevel::INFO, message);
}

void Logger::warn(const std::string& message) {
    log(LogLevel::WARN, message);
}

void Logger::error(const std::string& message) {
    log(LogLevel::ERROR, message);
}

void Logger::fatal(const std::string& message) {
    log(LogLevel::FATAL, message);
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!should_log(level)) return;

    std::lock_guard<std::mutex> lock(log_mutex_);

    switch (level) {
        case LogLevel::DEBUG: stats_.debug_count++; break;
        case LogLevel::INFO: stats_.info_count++; break;
        case LogLevel::WARN: stats_.warn_count++; break;
        case LogLevel::ERROR: stats_.error_count++; break;
        case LogLevel::FATAL: stats_.fatal_count++; break;
    }

    std::string formatted_message = format_message(level, message);
    stats_.total_bytes_written += formatted_message.size();

    if (output_dest_ == LogOutput::CONSOLE || output_dest_ == LogOutput::BOTH) {
        write_to_console(formatted_message, level);
    }

    if ((output_dest_ == LogOutput::FILE || output_dest_ == LogOutput::BOTH) && file_stream_) {
        write_to_file(formatted_message);
    }
}

void Logger::log_candidate(const std::string& selector, const std::string& class_label,
                           int num_states, bool success, double criterion) {
    if (success) {
        debug_f("%s: class '%s' n=%d criterion=%.4f", selector.c_str(), class_label.c_str(),
                num_states, criterion);
    } else {
        debug_f("%s: class '%s' n=%d unavailable", selector.c_str(), class_label.c_str(), num_states);
    }
}

void Logger::log_selection(const std::string& selector, const std::string& class_label,
                           int chosen_states, bool used_fallback) {
    if (chosen_states < 0) {
        error_f("%s: no model for class '%s'", selector.c_str(), class_label.c_str());
    } else if (used_fallback) {
        warn_f("%s: class '%s' fell back to n=%d", selector.c_str(), class_label.c_str(), chosen_states);
    } else {
        info_f("%s: class '%s' selected n=%d", selector.c_str(), class_label.c_str(), chosen_states);
    }
}

void Logger::log_recognition(size_t num_items, size_t num_classes, size_t num_without_guess) {
    info_f("Recognized %zu items against %zu class models", num_items, num_classes);
    if (num_without_guess > 0) {
        warn_f("%zu items could not be scored by any model", num_without_guess);
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(log_mutex_);
    std::cout.flush();
    std::cerr.flush();
    if (file_stream_) {
        file_stream_->flush();
    }
}

void Logger::close() {
    std::lock_guard<std::mutex> lock(log_mutex_);
    if (file_stream_) {
        file_stream_->close();
        file_stream_.reset();
    }
}

Logger::LogStats Logger::get_stats() const {
    std::lock_guard<std::mutex> lock(log_mutex_);
    return stats_;
}

void Logger::reset_stats() {
    std::lock_guard<std::mutex> lock(log_mutex_);
    stats_ = LogStats{};
    stats_.start_time = std::chrono::steady_clock::now();
}

std::string Logger::format_message(LogLevel level, const std::string& message) {
    std::ostringstream oss;

    if (format_.include_timestamp) {
        oss << "[" << get_timestamp() << "]";
    }

    if (format_.include_level) {
        oss << "[" << get_level_string(level) << "]";
    }

    if (format_.include_thread_id) {
        oss << "[" << std::this_thread::get_id() << "]";
    }

    if (!logger_name_.empty()) {
        oss << "[" << logger_name_ << "]";
    }

    oss << " " << message;

    return oss.str();
}

std::string Logger::get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&time_t, &local_tm);

    std::ostringstream oss;
    oss << std::put_time(&local_tm, format_.timestamp_format.c_str());
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::get_level_string(LogLevel level) {
    return LoggingUtils::level_name(level);
}

std::string Logger::get_level_color(LogLevel level) {
    auto it = LEVEL_COLORS.find(level);
    return (it != LEVEL_COLORS.end()) ? it->second : "";
}

void Logger::write_to_console(const std::string& message, LogLevel level) {
    std::ostream& stream = (level >= LogLevel::WARN) ? std::cerr : std::cout;

    if (format_.use_colors) {
        stream << get_level_color(level) << message << COLOR_RESET << std::endl;
    } else {
        stream << message << std::endl;
    }
}

void Logger::write_to_file(const std::string& message) {
    if (file_stream_ && file_stream_->is_open()) {
        *file_stream_ << message << std::endl;
    }
}

Logger::ScopedLevel::ScopedLevel(Logger& logger, LogLevel new_level)
    : logger_(logger), original_level_(logger.level()) {
    logger_.set_level(new_level);
}

Logger::ScopedLevel::~ScopedLevel() {
    logger_.set_level(original_level_);
}

namespace LoggingUtils {

bool initialize_logging(const std::string& log_file_path, bool debug_mode) {
    auto& logger = Logger::instance();

    logger.set_level(debug_mode ? LogLevel::DEBUG : LogLevel::INFO);

    if (log_file_path.empty()) {
        logger.set_output(LogOutput::CONSOLE);
        return true;
    }

    logger.set_log_file(log_file_path);
    logger.set_output(LogOutput::BOTH);

    std::ifstream existing(log_file_path);
    return existing.good();
}

LogLevel parse_level(const std::string& name, LogLevel fallback) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "FATAL") return LogLevel::FATAL;
    return fallback;
}

std::string level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default: return "UNKNOWN";
    }
}

} // namespace LoggingUtils

} // namespace diagnostics
} // namespace hmmselect

#pragma once

#include <string>
#include <vector>
#include <exception>
#include <functional>
#include <chrono>
#include <mutex>

namespace hmmselect {
namespace diagnostics {

/**
 * @brief Error codes for the selection and recognition pipeline
 */
enum class ErrorCode {
    SUCCESS = 0,
    TRAINING_FAILURE = 1,       // A candidate state count could not be fitted
    SCORING_FAILURE = 2,        // A fitted model could not evaluate the data
    SELECTION_EXHAUSTED = 3,    // Every candidate in the range failed
    FALLBACK_FAILED = 4,        // The default state count failed as well
    INVALID_DATA = 5,           // Malformed sequences, lengths or labels
    CONFIGURATION_ERROR = 6     // Invalid selector or trainer configuration
};

/**
 * @brief Error severity levels
 */
enum class ErrorSeverity {
    INFO,       // Informational - operation continues unchanged
    WARNING,    // Recovered locally (candidate skipped, fallback used)
    ERROR,      // A class or item ends up without a result
    FATAL       // Caller misuse, the operation cannot start
};

/**
 * @brief Error information carried by exceptions and diagnostics
 */
struct ErrorInfo {
    ErrorCode code;
    ErrorSeverity severity;
    std::string message;
    std::string class_label;        // Empty when not class specific
    int num_states;                 // -1 when not candidate specific
    std::chrono::system_clock::time_point timestamp;

    ErrorInfo(ErrorCode err_code, const std::string& msg = "",
              const std::string& label = "", int states = -1)
        : code(err_code), message(msg), class_label(label), num_states(states),
          timestamp(std::chrono::system_clock::now()) {
        classify_error();
    }

private:
    void classify_error();
};

/**
 * @brief Base exception for hmmselect errors
 */
class HmmSelectException : public std::exception {
public:
    explicit HmmSelectException(const ErrorInfo& info) : error_info_(info) {}
    explicit HmmSelectException(ErrorCode code, const std::string& message = "")
        : error_info_(code, message) {}

    const char* what() const noexcept override {
        return error_info_.message.c_str();
    }

    const ErrorInfo& get_error_info() const { return error_info_; }
    ErrorCode get_error_code() const { return error_info_.code; }
    ErrorSeverity get_severity() const { return error_info_.severity; }

private:
    ErrorInfo error_info_;
};

/// Raised by a ModelTrainer when a state count cannot produce a usable model.
class TrainingFailure : public HmmSelectException {
public:
    explicit TrainingFailure(const std::string& message, int num_states = -1)
        : HmmSelectException(ErrorInfo(ErrorCode::TRAINING_FAILURE, message, "", num_states)) {}
};

/// Raised by a SequenceModel that cannot evaluate the given data.
class ScoringFailure : public HmmSelectException {
public:
    explicit ScoringFailure(const std::string& message)
        : HmmSelectException(ErrorCode::SCORING_FAILURE, message) {}
};

class ConfigurationError : public HmmSelectException {
public:
    explicit ConfigurationError(const std::string& message)
        : HmmSelectException(ErrorCode::CONFIGURATION_ERROR, message) {}
};

class InvalidDataError : public HmmSelectException {
public:
    explicit InvalidDataError(const std::string& message)
        : HmmSelectException(ErrorCode::INVALID_DATA, message) {}
};

/**
 * @brief Structured diagnostic emitted on every recovered failure
 *
 * other_class is set when DIC excludes another class for a candidate.
 */
struct SelectionDiagnostic {
    ErrorCode code;
    std::string class_label;
    int num_states;
    std::string other_class;
    std::string message;

    SelectionDiagnostic(ErrorCode c, const std::string& label, int states,
                        const std::string& msg, const std::string& other = "")
        : code(c), class_label(label), num_states(states), other_class(other), message(msg) {}
};

using DiagnosticCallback = std::function<void(const SelectionDiagnostic&)>;

/**
 * @brief Thread-safe diagnostic sink with bounded history
 *
 * Subscribe it to selectors through as_callback(). Safe to share between
 * selections running on different threads.
 */
class DiagnosticRecorder {
public:
    explicit DiagnosticRecorder(size_t max_history_size = 1000);

    void record(const SelectionDiagnostic& diagnostic);
    DiagnosticCallback as_callback();

    size_t count(ErrorCode code) const;
    size_t count_for_class(const std::string& class_label) const;
    size_t total() const;
    std::vector<SelectionDiagnostic> recent(size_t max_count = 10) const;
    void clear();

    void set_log_diagnostics(bool enabled) { log_diagnostics_ = enabled; }

private:
    std::vector<SelectionDiagnostic> history_;
    size_t max_history_size_;
    size_t total_recorded_;
    bool log_diagnostics_;
    mutable std::mutex mutex_;
};

std::string error_code_to_string(ErrorCode code);
std::string format_diagnostic(const SelectionDiagnostic& diagnostic);

} // namespace diagnostics
} // namespace hmmselect

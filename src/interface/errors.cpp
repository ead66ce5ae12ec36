#include "hmmselect/errors.h"
#include "hmmselect/logger.h"
#include <algorithm>
#include <sstream>

namespace hmmselect {
namespace diagnostics {

void ErrorInfo::classify_error() {
    switch (code) {
        case ErrorCode::SUCCESS:
            severity = ErrorSeverity::INFO;
            break;

        case ErrorCode::TRAINING_FAILURE:
        case ErrorCode::SCORING_FAILURE:
        case ErrorCode::SELECTION_EXHAUSTED:
            severity = ErrorSeverity::WARNING;
            break;

        case ErrorCode::FALLBACK_FAILED:
            severity = ErrorSeverity::ERROR;
            break;

        case ErrorCode::INVALID_DATA:
        case ErrorCode::CONFIGURATION_ERROR:
            severity = ErrorSeverity::FATAL;
            break;

        default:
            severity = ErrorSeverity::ERROR;
            break;
    }
}

DiagnosticRecorder::DiagnosticRecorder(size_t max_history_size)
    : max_history_size_(max_history_size)
    , total_recorded_(0)
    , log_diagnostics_(false) {
}

void DiagnosticRecorder::record(const SelectionDiagnostic& diagnostic) {
    std::lock_guard<std::mutex> lock(mutex_);

    history_.push_back(diagnostic);
    if (history_.size() > max_history_size_) {
        history_.erase(history_.begin());
    }
    ++total_recorded_;

    if (log_diagnostics_) {
        LOG_DEBUG(format_diagnostic(diagnostic));
    }
}

DiagnosticCallback DiagnosticRecorder::as_callback() {
    return [this](const SelectionDiagnostic& diagnostic) { record(diagnostic); };
}

size_t DiagnosticRecorder::count(ErrorCode code) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::count_if(history_.begin(), history_.end(),
        [code](const SelectionDiagnostic& d) { return d.code == code; });
}

size_t DiagnosticRecorder::count_for_class(const std::string& class_label) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::count_if(history_.begin(), history_.end(),
        [&class_label](const SelectionDiagnostic& d) { return d.class_label == class_label; });
}

size_t DiagnosticRecorder::total() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_recorded_;
}

std::vector<SelectionDiagnostic> DiagnosticRecorder::recent(size_t max_count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t start_idx = (history_.size() > max_count) ? history_.size() - max_count : 0;
    return std::vector<SelectionDiagnostic>(history_.begin() + start_idx, history_.end());
}

void DiagnosticRecorder::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    history_.clear();
    total_recorded_ = 0;
}

std::string error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "SUCCESS";
        case ErrorCode::TRAINING_FAILURE: return "TRAINING_FAILURE";
        case ErrorCode::SCORING_FAILURE: return "SCORING_FAILURE";
        case ErrorCode::SELECTION_EXHAUSTED: return "SELECTION_EXHAUSTED";
        case ErrorCode::FALLBACK_FAILED: return "FALLBACK_FAILED";
        case ErrorCode::INVALID_DATA: return "INVALID_DATA";
        case ErrorCode::CONFIGURATION_ERROR: return "CONFIGURATION_ERROR";
        default: return "UNKNOWN";
    }
}

std::string format_diagnostic(const SelectionDiagnostic& diagnostic) {
    std::ostringstream oss;
    oss << "[" << error_code_to_string(diagnostic.code) << "] class '" << diagnostic.class_label << "'";
    if (diagnostic.num_states >= 0) {
        oss << " n=" << diagnostic.num_states;
    }
    if (!diagnostic.other_class.empty()) {
        oss << " other='" << diagnostic.other_class << "'";
    }
    if (!diagnostic.message.empty()) {
        oss << ": " << diagnostic.message;
    }
    return oss.str();
}

} // namespace diagnostics
} // namespace hmmselect

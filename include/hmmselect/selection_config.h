#pragma once

#include <string>
#include <vector>
#include <cJSON.h>
#include "model_selector.h"
#include "hmm_trainer.h"
#include "logger.h"

namespace hmmselect {
namespace config {

    /**
     * @brief Logging settings applied to the global Logger
     */
    struct LoggingConfig {
        std::string level;              // "debug", "info", "warn", "error" or "fatal"
        std::string log_file_path;      // Empty = console only
        bool timestamp_enabled;
        bool thread_id_enabled;
        bool use_colors;

        LoggingConfig()
            : level("info")
            , log_file_path("")
            , timestamp_enabled(true)
            , thread_id_enabled(false)
            , use_colors(true) {}
    };

    /**
     * @brief Complete run configuration
     */
    struct HmmSelectConfig {
        std::string config_version;
        std::string selector;                       // "constant", "bic", "dic" or "cv"
        int num_threads;                            // 1 = sequential, 0 = hardware concurrency

        selection::SelectorConfig selector_config;
        hmm::TrainingConfig training_config;
        LoggingConfig logging_config;

        HmmSelectConfig()
            : config_version("1.0")
            , selector("bic")
            , num_threads(1) {}
    };

    /**
     * @brief Configuration validation result
     */
    struct ValidationResult {
        bool is_valid;                          // Overall validation result
        std::vector<std::string> errors;        // Validation errors
        std::vector<std::string> warnings;      // Validation warnings

        ValidationResult() : is_valid(true) {}
    };

    /**
     * @brief Loads, saves and validates HmmSelectConfig as JSON
     *
     * Missing keys keep their default values; keys of the wrong type are
     * ignored.
     */
    class ConfigManager {
    public:
        ConfigManager() = default;

        bool load_config(const std::string& file_path, HmmSelectConfig& config);
        bool save_config(const std::string& file_path, const HmmSelectConfig& config);

        std::string config_to_json(const HmmSelectConfig& config);
        bool config_from_json(const std::string& json_str, HmmSelectConfig& config);

        ValidationResult validate_config(const HmmSelectConfig& config);

        HmmSelectConfig get_default_config();
        HmmSelectConfig get_fast_config();      // Narrow range, few EM iterations

        /// Configure the global Logger from config.logging_config.
        bool apply_logging_config(const LoggingConfig& config);

        /// Throws ConfigurationError for an unknown selector name.
        selection::SelectorType selector_type(const HmmSelectConfig& config);

        static constexpr const char* CURRENT_CONFIG_VERSION = "1.0";

    private:
        cJSON* selector_config_to_json(const selection::SelectorConfig& config);
        bool selector_config_from_json(const cJSON* json, selection::SelectorConfig& config);

        cJSON* training_config_to_json(const hmm::TrainingConfig& config);
        bool training_config_from_json(const cJSON* json, hmm::TrainingConfig& config);

        cJSON* logging_config_to_json(const LoggingConfig& config);
        bool logging_config_from_json(const cJSON* json, LoggingConfig& config);

        bool validate_selector_config(const selection::SelectorConfig& config, std::vector<std::string>& errors);
        bool validate_training_config(const hmm::TrainingConfig& config, std::vector<std::string>& errors);
    };

} // namespace config
} // namespace hmmselect

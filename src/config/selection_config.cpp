#include "hmmselect/selection_config.h"
#include "hmmselect/logger.h"

#include <fstream>
#include <sstream>
#include <filesystem>
#include <algorithm>
#include <cctype>

namespace hmmselect {
namespace config {

namespace {

    bool is_known_level(const std::string& name) {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return lower == "debug" || lower == "info" || lower == "warn" ||
               lower == "warning" || lower == "error" || lower == "fatal";
    }

} // namespace

bool ConfigManager::load_config(const std::string& file_path, HmmSelectConfig& config) {
    try {
        std::ifstream file(file_path);
        if (!file.is_open()) {
            LOG_ERROR("Cannot open configuration file: " + file_path);
            return false;
        }

        std::string json_content((std::istreambuf_iterator<char>(file)),
                                 std::istreambuf_iterator<char>());
        file.close();

        if (json_content.empty()) {
            LOG_ERROR("Configuration file is empty: " + file_path);
            return false;
        }

        bool success = config_from_json(json_content, config);
        if (success) {
            LOG_INFO("Loaded configuration from: " + file_path);
        } else {
            LOG_ERROR("Failed to parse configuration file: " + file_path);
        }
        return success;

    } catch (const std::exception& e) {
        LOG_ERROR("Exception loading configuration: " + std::string(e.what()));
        return false;
    }
}

bool ConfigManager::save_config(const std::string& file_path, const HmmSelectConfig& config) {
    try {
        auto validation = validate_config(config);
        if (!validation.is_valid) {
            LOG_ERROR("Cannot save invalid configuration");
            for (const auto& error : validation.errors) {
                LOG_ERROR("Validation error: " + error);
            }
            return false;
        }

        std::string json_str = config_to_json(config);
        if (json_str.empty()) {
            LOG_ERROR("Failed to serialize configuration to JSON");
            return false;
        }

        std::filesystem::path parent_dir = std::filesystem::path(file_path).parent_path();
        if (!parent_dir.empty()) {
            std::filesystem::create_directories(parent_dir);
        }

        std::ofstream file(file_path);
        if (!file.is_open()) {
            LOG_ERROR("Cannot create configuration file: " + file_path);
            return false;
        }

        file << json_str;
        file.close();

        LOG_INFO("Configuration saved to: " + file_path);
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("Exception saving configuration: " + std::string(e.what()));
        return false;
    }
}

std::string ConfigManager::config_to_json(const HmmSelectConfig& config) {
    cJSON* root = cJSON_CreateObject();
    if (!root) {
        return "";
    }

    cJSON_AddStringToObject(root, "config_version", config.config_version.c_str());
    cJSON_AddStringToObject(root, "selector", config.selector.c_str());
    cJSON_AddNumberToObject(root, "num_threads", config.num_threads);

    cJSON_AddItemToObject(root, "selector_config", selector_config_to_json(config.selector_config));
    cJSON_AddItemToObject(root, "training_config", training_config_to_json(config.training_config));
    cJSON_AddItemToObject(root, "logging_config", logging_config_to_json(config.logging_config));

    char* json_string = cJSON_Print(root);
    std::string result = json_string ? json_string : "";
    if (json_string) {
        cJSON_free(json_string);
    }
    cJSON_Delete(root);
    return result;
}

bool ConfigManager::config_from_json(const std::string& json_str, HmmSelectConfig& config) {
    cJSON* root = cJSON_Parse(json_str.c_str());
    if (!root) {
        const char* error_ptr = cJSON_GetErrorPtr();
        LOG_ERROR("JSON parse error near: " + std::string(error_ptr ? error_ptr : "unknown"));
        return false;
    }
    if (!cJSON_IsObject(root)) {
        LOG_ERROR("Configuration root must be a JSON object");
        cJSON_Delete(root);
        return false;
    }

    bool ok = true;

    cJSON* item = cJSON_GetObjectItem(root, "config_version");
    if (item && cJSON_IsString(item)) {
        config.config_version = item->valuestring;
    }

    item = cJSON_GetObjectItem(root, "selector");
    if (item && cJSON_IsString(item)) {
        config.selector = item->valuestring;
    }

    item = cJSON_GetObjectItem(root, "num_threads");
    if (item && cJSON_IsNumber(item)) {
        config.num_threads = item->valueint;
    }

    item = cJSON_GetObjectItem(root, "selector_config");
    if (item && cJSON_IsObject(item)) {
        ok = selector_config_from_json(item, config.selector_config) && ok;
    }

    item = cJSON_GetObjectItem(root, "training_config");
    if (item && cJSON_IsObject(item)) {
        ok = training_config_from_json(item, config.training_config) && ok;
    }

    item = cJSON_GetObjectItem(root, "logging_config");
    if (item && cJSON_IsObject(item)) {
        ok = logging_config_from_json(item, config.logging_config) && ok;
    }

    cJSON_Delete(root);
    return ok;
}

ValidationResult ConfigManager::validate_config(const HmmSelectConfig& config) {
    ValidationResult result;

    if (config.config_version.empty()) {
        result.errors.push_back("Configuration version is required");
    } else if (config.config_version != CURRENT_CONFIG_VERSION) {
        result.warnings.push_back("Configuration version mismatch. Current: " +
                                  std::string(CURRENT_CONFIG_VERSION) + ", Found: " + config.config_version);
    }

    try {
        selection::parse_selector_type(config.selector);
    } catch (const diagnostics::ConfigurationError& e) {
        result.errors.push_back(e.what());
    }

    if (config.num_threads < 0) {
        result.errors.push_back("Number of threads cannot be negative");
    } else if (config.num_threads > 64) {
        result.warnings.push_back("Very high thread count");
    }

    validate_selector_config(config.selector_config, result.errors);
    validate_training_config(config.training_config, result.errors);

    if (!is_known_level(config.logging_config.level)) {
        result.errors.push_back("Unknown log level: " + config.logging_config.level);
    }

    if (config.selector == "cv" && config.selector_config.cv_folds > 10) {
        result.warnings.push_back("Many folds leave little data per training split");
    }

    result.is_valid = result.errors.empty();
    return result;
}

HmmSelectConfig ConfigManager::get_default_config() {
    return HmmSelectConfig();
}

HmmSelectConfig ConfigManager::get_fast_config() {
    HmmSelectConfig config;
    config.selector_config.min_states = 2;
    config.selector_config.max_states = 5;
    config.training_config.max_iterations = 50;
    config.training_config.convergence_threshold = 1e-1;
    config.training_config.kmeans_iterations = 10;
    config.num_threads = 0;
    return config;
}

bool ConfigManager::apply_logging_config(const LoggingConfig& config) {
    auto& logger = diagnostics::Logger::instance();
    logger.set_level(diagnostics::LoggingUtils::parse_level(config.level));

    diagnostics::LogFormat format;
    format.include_timestamp = config.timestamp_enabled;
    format.include_thread_id = config.thread_id_enabled;
    format.use_colors = config.use_colors;
    logger.set_format(format);

    if (config.log_file_path.empty()) {
        logger.set_output(diagnostics::LogOutput::CONSOLE);
        return true;
    }

    logger.set_log_file(config.log_file_path);
    logger.set_output(diagnostics::LogOutput::BOTH);
    return std::filesystem::exists(config.log_file_path);
}

selection::SelectorType ConfigManager::selector_type(const HmmSelectConfig& config) {
    return selection::parse_selector_type(config.selector);
}

// JSON conversion helpers
cJSON* ConfigManager::selector_config_to_json(const selection::SelectorConfig& config) {
    cJSON* obj = cJSON_CreateObject();
    cJSON_AddNumberToObject(obj, "min_states", config.min_states);
    cJSON_AddNumberToObject(obj, "max_states", config.max_states);
    cJSON_AddNumberToObject(obj, "constant_states", config.constant_states);
    cJSON_AddNumberToObject(obj, "random_seed", config.random_seed);
    cJSON_AddNumberToObject(obj, "cv_folds", config.cv_folds);
    cJSON_AddBoolToObject(obj, "verbose", config.verbose);
    return obj;
}

bool ConfigManager::selector_config_from_json(const cJSON* json, selection::SelectorConfig& config) {
    cJSON* item = cJSON_GetObjectItem(json, "min_states");
    if (item && cJSON_IsNumber(item)) config.min_states = item->valueint;

    item = cJSON_GetObjectItem(json, "max_states");
    if (item && cJSON_IsNumber(item)) config.max_states = item->valueint;

    item = cJSON_GetObjectItem(json, "constant_states");
    if (item && cJSON_IsNumber(item)) config.constant_states = item->valueint;

    item = cJSON_GetObjectItem(json, "random_seed");
    if (item && cJSON_IsNumber(item)) {
        if (item->valuedouble < 0) {
            LOG_ERROR("random_seed cannot be negative");
            return false;
        }
        config.random_seed = static_cast<unsigned int>(item->valuedouble);
    }

    item = cJSON_GetObjectItem(json, "cv_folds");
    if (item && cJSON_IsNumber(item)) config.cv_folds = item->valueint;

    item = cJSON_GetObjectItem(json, "verbose");
    if (item && cJSON_IsBool(item)) config.verbose = cJSON_IsTrue(item);

    return true;
}

cJSON* ConfigManager::training_config_to_json(const hmm::TrainingConfig& config) {
    cJSON* obj = cJSON_CreateObject();
    cJSON_AddNumberToObject(obj, "max_iterations", config.max_iterations);
    cJSON_AddNumberToObject(obj, "convergence_threshold", config.convergence_threshold);
    cJSON_AddNumberToObject(obj, "min_variance", config.min_variance);
    cJSON_AddNumberToObject(obj, "kmeans_iterations", config.kmeans_iterations);
    cJSON_AddBoolToObject(obj, "require_convergence", config.require_convergence);
    cJSON_AddBoolToObject(obj, "verbose", config.verbose);
    return obj;
}

bool ConfigManager::training_config_from_json(const cJSON* json, hmm::TrainingConfig& config) {
    cJSON* item = cJSON_GetObjectItem(json, "max_iterations");
    if (item && cJSON_IsNumber(item)) config.max_iterations = item->valueint;

    item = cJSON_GetObjectItem(json, "convergence_threshold");
    if (item && cJSON_IsNumber(item)) config.convergence_threshold = item->valuedouble;

    item = cJSON_GetObjectItem(json, "min_variance");
    if (item && cJSON_IsNumber(item)) config.min_variance = item->valuedouble;

    item = cJSON_GetObjectItem(json, "kmeans_iterations");
    if (item && cJSON_IsNumber(item)) config.kmeans_iterations = item->valueint;

    item = cJSON_GetObjectItem(json, "require_convergence");
    if (item && cJSON_IsBool(item)) config.require_convergence = cJSON_IsTrue(item);

    item = cJSON_GetObjectItem(json, "verbose");
    if (item && cJSON_IsBool(item)) config.verbose = cJSON_IsTrue(item);

    return true;
}

cJSON* ConfigManager::logging_config_to_json(const LoggingConfig& config) {
    cJSON* obj = cJSON_CreateObject();
    cJSON_AddStringToObject(obj, "level", config.level.c_str());
    cJSON_AddStringToObject(obj, "log_file_path", config.log_file_path.c_str());
    cJSON_AddBoolToObject(obj, "timestamp_enabled", config.timestamp_enabled);
    cJSON_AddBoolToObject(obj, "thread_id_enabled", config.thread_id_enabled);
    cJSON_AddBoolToObject(obj, "use_colors", config.use_colors);
    return obj;
}

bool ConfigManager::logging_config_from_json(const cJSON* json, LoggingConfig& config) {
    cJSON* item = cJSON_GetObjectItem(json, "level");
    if (item && cJSON_IsString(item)) config.level = item->valuestring;

    item = cJSON_GetObjectItem(json, "log_file_path");
    if (item && cJSON_IsString(item)) config.log_file_path = item->valuestring;

    item = cJSON_GetObjectItem(json, "timestamp_enabled");
    if (item && cJSON_IsBool(item)) config.timestamp_enabled = cJSON_IsTrue(item);

    item = cJSON_GetObjectItem(json, "thread_id_enabled");
    if (item && cJSON_IsBool(item)) config.thread_id_enabled = cJSON_IsTrue(item);

    item = cJSON_GetObjectItem(json, "use_colors");
    if (item && cJSON_IsBool(item)) config.use_colors = cJSON_IsTrue(item);

    return true;
}

// Validation helpers
bool ConfigManager::validate_selector_config(const selection::SelectorConfig& config,
                                             std::vector<std::string>& errors) {
    bool valid = true;

    if (config.min_states < 1) {
        errors.push_back("min_states must be at least 1");
        valid = false;
    }
    if (config.max_states < config.min_states) {
        errors.push_back("max_states must not be below min_states");
        valid = false;
    }
    if (config.constant_states < 1) {
        errors.push_back("constant_states must be at least 1");
        valid = false;
    }
    if (config.cv_folds < 2) {
        errors.push_back("cv_folds must be at least 2");
        valid = false;
    }
    return valid;
}

bool ConfigManager::validate_training_config(const hmm::TrainingConfig& config,
                                             std::vector<std::string>& errors) {
    bool valid = true;

    if (config.max_iterations < 1) {
        errors.push_back("max_iterations must be at least 1");
        valid = false;
    }
    if (config.convergence_threshold <= 0.0) {
        errors.push_back("convergence_threshold must be positive");
        valid = false;
    }
    if (config.min_variance <= 0.0) {
        errors.push_back("min_variance must be positive");
        valid = false;
    }
    if (config.kmeans_iterations < 0) {
        errors.push_back("kmeans_iterations cannot be negative");
        valid = false;
    }
    return valid;
}

} // namespace config
} // namespace hmmselect

#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <format>
#include <stdexcept>

using namespace std::string_literals;

namespace piiguard {

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

// Expands every string reachable from node, through tables and arrays
void expand_env_vars_recursive(toml::node& node) {
    if (auto* str = node.as_string()) {
        auto expanded = expand_env_vars(str->get());
        if (expanded != str->get()) {
            *str = std::move(expanded);
        }
    } else if (auto* tbl = node.as_table()) {
        for (auto& [key, val] : *tbl) {
            expand_env_vars_recursive(val);
        }
    } else if (auto* arr = node.as_array()) {
        for (auto& elem : *arr) {
            expand_env_vars_recursive(elem);
        }
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);
    expand_env_vars_recursive(result);
    return result;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;
    const auto& l = *logging;

    cfg.level = l["level"].value_or("info"s);
    return cfg;
}

RedactionTelemetry::Config ConfigLoader::extract_telemetry(const toml::table& root) {
    RedactionTelemetry::Config cfg;
    const auto* telemetry = root["telemetry"].as_table();
    if (!telemetry) return cfg;
    const auto& t = *telemetry;

    cfg.enabled = t["enabled"].value_or(cfg.enabled);
    cfg.environment = t["environment"].value_or(cfg.environment);
    cfg.sample_rate = t["sample_rate"].value_or(cfg.sample_rate);
    cfg.deterministic = t["deterministic"].value_or(cfg.deterministic);
    return cfg;
}

LimitsConfig ConfigLoader::extract_limits(const toml::table& root) {
    LimitsConfig cfg;
    const auto* limits = root["limits"].as_table();
    if (!limits) return cfg;

    cfg.max_depth = (*limits)["max_depth"].value_or(cfg.max_depth);
    return cfg;
}

SanitizerConfig ConfigLoader::extract_all_sections(const toml::table& root) {
    SanitizerConfig config;
    config.logging = extract_logging(root);
    config.telemetry = extract_telemetry(root);
    config.limits = extract_limits(root);
    apply_env_overrides(config);
    return config;
}

void ConfigLoader::apply_env_overrides(SanitizerConfig& config) {
    if (const char* env = std::getenv("PIIGUARD_ENV"); env && *env) {
        config.telemetry.environment = env;
    }

    if (const char* rate = std::getenv("PII_REDACT_SAMPLING_RATE"); rate && *rate) {
        const auto parsed = utils::try_parse_double(utils::trim(rate));
        if (parsed) {
            config.telemetry.sample_rate = *parsed;
        } else {
            utils::log::warn(std::format(
                "Ignoring PII_REDACT_SAMPLING_RATE='{}': not a number", rate));
        }
    }
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(SanitizerConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return ConfigLoader::LoadResult::error(std::move(combined));
    }
    return ConfigLoader::LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const SanitizerConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level)) {
        errors.push_back(std::format(
            "logging.level must be one of info, warn, error; got '{}'", config.logging.level));
    }

    const double rate = config.telemetry.sample_rate;
    if (!(rate >= 0.0 && rate <= 1.0)) {
        errors.push_back(std::format("telemetry.sample_rate must be 0.0-1.0, got {}", rate));
    }

    if (config.limits.max_depth < 1) {
        errors.push_back(std::format("limits.max_depth must be >= 1, got {}", config.limits.max_depth));
    }

    return errors;
}

bool ConfigLoader::apply_logging(const LoggingConfig& logging) {
    const auto level = utils::log::parse_level(logging.level);
    if (!level) {
        return false;
    }
    utils::log::set_min_level(*level);
    return true;
}

} // namespace piiguard

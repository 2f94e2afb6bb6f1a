#pragma once

#include "audit/redaction_telemetry.hpp"
#include "sanitizer/depth_validator.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace piiguard {

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// Limits Config
// ============================================================================

struct LimitsConfig {
    int max_depth = DepthValidator::kDefaultMaxDepth;
};

// ============================================================================
// SanitizerConfig - Complete parsed configuration
//
// Covers ambient behaviour only. The pattern set is fixed at build time and
// has no configuration surface.
// ============================================================================

struct SanitizerConfig {
    LoggingConfig logging;
    RedactionTelemetry::Config telemetry;
    LimitsConfig limits;
};

// ============================================================================
// ConfigLoader - Extract typed config from TOML
// ============================================================================

class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        SanitizerConfig config;

        static LoadResult ok(SanitizerConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load config from a TOML file
     * @param config_path Path to piiguard.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load config from a TOML string
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Apply environment overrides
     *
     * PIIGUARD_ENV              -> telemetry.environment
     * PII_REDACT_SAMPLING_RATE  -> telemetry.sample_rate (ignored if unparsable)
     */
    static void apply_env_overrides(SanitizerConfig& config);

    /**
     * @brief Check value ranges
     * @return Human-readable errors; empty when valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const SanitizerConfig& config);

    /**
     * @brief Set the process-wide log level from logging.level
     *
     * Call once at startup, after loading. Sanitizer instances never change
     * the level themselves.
     * @return false (level untouched) when the name is not a known level
     */
    static bool apply_logging(const LoggingConfig& logging);

private:
    static SanitizerConfig extract_all_sections(const toml::table& root);
    static LoggingConfig extract_logging(const toml::table& root);
    static RedactionTelemetry::Config extract_telemetry(const toml::table& root);
    static LimitsConfig extract_limits(const toml::table& root);

    static LoadResult validate_and_return(SanitizerConfig config);
};

} // namespace piiguard

#pragma once

#include "audit/redaction_telemetry.hpp"
#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "core/value.hpp"
#include "sanitizer/depth_validator.hpp"
#include "sanitizer/structural_walker.hpp"

#include <string>
#include <string_view>

namespace piiguard {

struct SanitizeResult {
    Value value;
    SanitizeOutcome outcome;
};

/**
 * @brief Remove every field whose name marks PII or an authentication secret
 *
 * Pure and total: no I/O, no logging, no exceptions for any input. Returns
 * the input reference itself (same_ref) when nothing was removed. Cyclic
 * edges are replaced by "[Circular]". Safe to call concurrently.
 */
[[nodiscard]] Value sanitize(const Value& value);

/**
 * @brief sanitize() plus a record of what was removed, for audit logging
 */
[[nodiscard]] SanitizeResult sanitize_with_outcome(const Value& value);

/**
 * @brief Configured facade: sanitize() plus redaction telemetry and a JSON
 * text entry point for log pipelines
 *
 * Thread-safe: holds only immutable config and atomic counters. The log
 * level is process-wide and is not touched here; see ConfigLoader::apply_logging.
 */
class PiiSanitizer {
public:
    PiiSanitizer();
    explicit PiiSanitizer(SanitizerConfig config, RedactionTelemetry::Sink telemetry_sink = {});

    [[nodiscard]] Value sanitize(const Value& value) const;

    [[nodiscard]] SanitizeResult sanitize_with_outcome(const Value& value) const;

    /**
     * @brief Parse, depth-check, sanitize and re-serialize a JSON document
     * @return PARSE_ERROR for malformed JSON, DEPTH_LIMIT_ERROR when nested
     *         deeper than limits.max_depth
     */
    [[nodiscard]] Result<std::string> sanitize_json(std::string_view json_text) const;

    [[nodiscard]] const SanitizerConfig& config() const { return config_; }
    [[nodiscard]] const RedactionTelemetry& telemetry() const { return telemetry_; }

private:
    SanitizerConfig config_;
    RedactionTelemetry telemetry_;
    DepthValidator depth_validator_;
};

} // namespace piiguard

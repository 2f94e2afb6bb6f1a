#include "sanitizer/pii_sanitizer.hpp"
#include "classifier/pattern_registry.hpp"
#include "core/json_codec.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace piiguard {

namespace {

SanitizationContext run_walk(const Value& value, Value& out) {
    SanitizationContext ctx;
    auto walked = StructuralWalker::walk(value, ctx);
    out = std::move(walked.value);
    return ctx;
}

} // anonymous namespace

// ============================================================================
// Free functions
// ============================================================================

Value sanitize(const Value& value) {
    SanitizationContext ctx;
    return StructuralWalker::walk(value, ctx).value;
}

SanitizeResult sanitize_with_outcome(const Value& value) {
    SanitizeResult result;
    auto ctx = run_walk(value, result.value);
    result.outcome = std::move(ctx.outcome);
    return result;
}

// ============================================================================
// PiiSanitizer
// ============================================================================

PiiSanitizer::PiiSanitizer() : PiiSanitizer(SanitizerConfig{}) {}

PiiSanitizer::PiiSanitizer(SanitizerConfig config, RedactionTelemetry::Sink telemetry_sink)
    : config_(std::move(config)),
      telemetry_(config_.telemetry, std::move(telemetry_sink)),
      depth_validator_(config_.limits.max_depth) {
    // Forces registry construction (and its invariant check) up front
    size_t pattern_count = 0;
    try {
        pattern_count = PatternRegistry::all_patterns().size();
    } catch (const std::logic_error& e) {
        utils::log::error(std::format("PII pattern registry is malformed: {}", e.what()));
        throw;
    }

    if (telemetry_.is_active()) {
        utils::log::info(std::format(
            "PII sanitizer ready: {} patterns, redaction telemetry sampling {:.2f}%",
            pattern_count, config_.telemetry.sample_rate * 100.0));
    }
}

Value PiiSanitizer::sanitize(const Value& value) const {
    return sanitize_with_outcome(value).value;
}

SanitizeResult PiiSanitizer::sanitize_with_outcome(const Value& value) const {
    SanitizeResult result;
    auto ctx = run_walk(value, result.value);

    for (const auto& removed : ctx.removed_secrets) {
        telemetry_.record(removed.field_name, *removed.pattern);
    }

    result.outcome = std::move(ctx.outcome);
    return result;
}

Result<std::string> PiiSanitizer::sanitize_json(std::string_view json_text) const {
    // Depth is enforced by the parser so hostile nesting never reaches the walker
    auto parsed = json_codec::parse(json_text, depth_validator_.max_depth());
    if (parsed.is_error()) {
        if (parsed.error_category() == ErrorCategory::DEPTH_LIMIT_ERROR) {
            utils::log::warn(std::format("Rejected payload for sanitization ({}): {}",
                error_category_to_string(parsed.error_category()), parsed.error_message()));
        }
        return Result<std::string>::error(parsed.error_category(), parsed.error_message());
    }

    const auto sanitized = sanitize(parsed.value());
    return Result<std::string>::ok(json_codec::dump(sanitized));
}

} // namespace piiguard

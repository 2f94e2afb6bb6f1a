#pragma once

#include "classifier/pattern_registry.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace piiguard {

/**
 * @brief Sampled telemetry for removed authentication-secret fields
 *
 * Emits one JSON line per sampled removal:
 *   {"event":"PII_REDACTION","category":"auth_secret","fieldName":"tokenId"}
 *
 * Only field names are reported, never values. Regular PII removals are not
 * reported. Events are emitted only when enabled and running in the
 * "production" environment.
 */
class RedactionTelemetry {
public:
    struct Config {
        bool enabled = true;
        std::string environment = "development";
        double sample_rate = 0.01;     // 1.0 = every removal
        bool deterministic = false;    // Hash-based consistent sampling on field name
    };

    using Sink = std::function<void(const std::string&)>;

    /**
     * @param sink Receives formatted events; defaults to utils::log::event,
     *             which ignores the configured log level
     */
    explicit RedactionTelemetry(Config config, Sink sink = {});

    /**
     * @brief Report one removed field. Non-secret patterns are ignored.
     */
    void record(std::string_view field_name, const PiiPattern& pattern) const;

    [[nodiscard]] bool is_active() const;

    [[nodiscard]] const Config& config() const { return config_; }

    /**
     * @brief Event payload for a field name (no value is ever included)
     */
    [[nodiscard]] static std::string format_event(std::string_view field_name);

    struct Stats {
        uint64_t total_checked;
        uint64_t total_sampled;
        uint64_t total_dropped;
    };
    [[nodiscard]] Stats get_stats() const;

private:
    [[nodiscard]] bool should_sample(std::string_view field_name) const;

    Config config_;
    Sink sink_;
    mutable std::atomic<uint64_t> total_checked_{0};
    mutable std::atomic<uint64_t> total_sampled_{0};
};

} // namespace piiguard

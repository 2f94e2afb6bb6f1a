#include "audit/redaction_telemetry.hpp"
#include "core/utils.hpp"

#include <nlohmann/json.hpp>

#include <random>

namespace piiguard {

namespace {
constexpr std::string_view kProductionEnvironment = "production";
} // anonymous namespace

RedactionTelemetry::RedactionTelemetry(Config config, Sink sink)
    : config_(std::move(config)), sink_(std::move(sink)) {
    if (!sink_) {
        sink_ = [](const std::string& event) { utils::log::event(event); };
    }
}

bool RedactionTelemetry::is_active() const {
    return config_.enabled && utils::iequals(config_.environment, kProductionEnvironment);
}

void RedactionTelemetry::record(std::string_view field_name, const PiiPattern& pattern) const {
    if (!pattern.is_auth_secret() || !is_active()) {
        return;
    }

    total_checked_.fetch_add(1, std::memory_order_relaxed);
    if (!should_sample(field_name)) {
        return;
    }
    total_sampled_.fetch_add(1, std::memory_order_relaxed);

    sink_(format_event(field_name));
}

std::string RedactionTelemetry::format_event(std::string_view field_name) {
    nlohmann::ordered_json event;
    event["event"] = "PII_REDACTION";
    event["category"] = "auth_secret";
    event["fieldName"] = std::string(field_name);
    return event.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

bool RedactionTelemetry::should_sample(std::string_view field_name) const {
    const double rate = config_.sample_rate;
    if (rate >= 1.0) return true;
    if (rate <= 0.0) return false;

    if (config_.deterministic) {
        // Same field name always produces the same decision
        const auto bucket = static_cast<uint32_t>(std::hash<std::string_view>{}(field_name) % 10000);
        return bucket < static_cast<uint32_t>(rate * 10000);
    }

    static thread_local std::mt19937 rng(std::random_device{}());
    std::uniform_real_distribution<double> dist(0.0, 1.0);
    return dist(rng) < rate;
}

RedactionTelemetry::Stats RedactionTelemetry::get_stats() const {
    const uint64_t checked = total_checked_.load(std::memory_order_relaxed);
    const uint64_t sampled = total_sampled_.load(std::memory_order_relaxed);
    return {checked, sampled, checked - sampled};
}

} // namespace piiguard

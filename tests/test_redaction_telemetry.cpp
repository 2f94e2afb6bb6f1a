#include <catch2/catch_test_macros.hpp>
#include "audit/redaction_telemetry.hpp"
#include "core/utils.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace piiguard;

namespace {

RedactionTelemetry::Config active_config(double sample_rate) {
    RedactionTelemetry::Config config;
    config.enabled = true;
    config.environment = "production";
    config.sample_rate = sample_rate;
    return config;
}

const PiiPattern& pattern(std::string_view text) {
    const auto* p = PatternRegistry::find(text);
    REQUIRE(p != nullptr);
    return *p;
}

// Redirects std::cerr into a buffer for the lifetime of the object
class CerrCapture {
public:
    CerrCapture() : previous_(std::cerr.rdbuf(buffer_.rdbuf())) {}
    ~CerrCapture() { std::cerr.rdbuf(previous_); }

    CerrCapture(const CerrCapture&) = delete;
    CerrCapture& operator=(const CerrCapture&) = delete;

    std::string str() const { return buffer_.str(); }

private:
    std::ostringstream buffer_;
    std::streambuf* previous_;
};

} // anonymous namespace

TEST_CASE("RedactionTelemetry event format", "[telemetry]") {
    CHECK(RedactionTelemetry::format_event("tokenId") ==
          R"({"event":"PII_REDACTION","category":"auth_secret","fieldName":"tokenId"})");

    // Field names are escaped as JSON strings
    CHECK(RedactionTelemetry::format_event(R"(a"b)") ==
          R"({"event":"PII_REDACTION","category":"auth_secret","fieldName":"a\"b"})");
}

TEST_CASE("RedactionTelemetry activation", "[telemetry]") {
    SECTION("Defaults are inactive") {
        const RedactionTelemetry telemetry(RedactionTelemetry::Config{});
        CHECK_FALSE(telemetry.is_active());
        CHECK(telemetry.config().sample_rate == 0.01);
    }

    SECTION("Production is matched case-insensitively") {
        auto config = active_config(1.0);
        config.environment = "PRODUCTION";
        CHECK(RedactionTelemetry(config).is_active());
    }

    SECTION("Disabled in production") {
        auto config = active_config(1.0);
        config.enabled = false;
        CHECK_FALSE(RedactionTelemetry(config).is_active());
    }
}

TEST_CASE("RedactionTelemetry records only authentication secrets", "[telemetry]") {
    std::vector<std::string> events;
    const RedactionTelemetry telemetry(active_config(1.0),
        [&events](const std::string& e) { events.push_back(e); });

    telemetry.record("email", pattern("email"));
    telemetry.record("userPhone", pattern("phone"));
    telemetry.record("accessToken", pattern("token"));

    REQUIRE(events.size() == 1);
    CHECK(events[0].find("accessToken") != std::string::npos);

    const auto stats = telemetry.get_stats();
    CHECK(stats.total_checked == 1);
    CHECK(stats.total_sampled == 1);
    CHECK(stats.total_dropped == 0);
}

TEST_CASE("RedactionTelemetry sampling", "[telemetry]") {
    std::vector<std::string> events;
    auto sink = [&events](const std::string& e) { events.push_back(e); };

    SECTION("Rate 0 drops everything") {
        const RedactionTelemetry telemetry(active_config(0.0), sink);
        for (int i = 0; i < 100; ++i) telemetry.record("password", pattern("password"));
        CHECK(events.empty());
        CHECK(telemetry.get_stats().total_checked == 100);
        CHECK(telemetry.get_stats().total_dropped == 100);
    }

    SECTION("Rate 1 keeps everything") {
        const RedactionTelemetry telemetry(active_config(1.0), sink);
        for (int i = 0; i < 100; ++i) telemetry.record("password", pattern("password"));
        CHECK(events.size() == 100);
    }

    SECTION("Partial rate lands near the target") {
        const RedactionTelemetry telemetry(active_config(0.5), sink);
        for (int i = 0; i < 10000; ++i) telemetry.record("secret", pattern("secret"));
        const auto stats = telemetry.get_stats();
        CHECK(stats.total_checked == 10000);
        CHECK(stats.total_sampled > 4000);
        CHECK(stats.total_sampled < 6000);
        CHECK(stats.total_sampled + stats.total_dropped == stats.total_checked);
    }

    SECTION("Deterministic mode gives the same answer for the same field") {
        auto config = active_config(0.5);
        config.deterministic = true;
        const RedactionTelemetry telemetry(config, sink);

        for (int i = 0; i < 20; ++i) telemetry.record("clientSecret", pattern("secret"));
        CHECK((events.empty() || events.size() == 20));
    }
}

TEST_CASE("RedactionTelemetry default sink ignores the log level", "[telemetry]") {
    const auto saved_level = utils::log::min_level();
    utils::log::set_min_level(utils::log::Level::ERROR);

    std::string output;
    {
        CerrCapture capture;
        RedactionTelemetry telemetry(active_config(1.0));
        telemetry.record("apiKey", pattern("apikey"));
        utils::log::info("filtered out");
        output = capture.str();

        CHECK(telemetry.get_stats().total_sampled == 1);
    }
    utils::log::set_min_level(saved_level);

    CHECK(output == "{\"event\":\"PII_REDACTION\",\"category\":\"auth_secret\",\"fieldName\":\"apiKey\"}\n");
}

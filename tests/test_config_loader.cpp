#include <catch2/catch_test_macros.hpp>
#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <string>

using namespace piiguard;

namespace {

// Clears the override variables for the lifetime of a test
struct EnvGuard {
    EnvGuard() { clear(); }
    ~EnvGuard() { clear(); }

    static void clear() {
        ::unsetenv("PIIGUARD_ENV");
        ::unsetenv("PII_REDACT_SAMPLING_RATE");
    }
};

} // anonymous namespace

TEST_CASE("ConfigLoader: empty document yields defaults", "[config]") {
    EnvGuard env;

    auto result = ConfigLoader::load_from_string("");
    REQUIRE(result.success);
    CHECK(result.config.logging.level == "info");
    CHECK(result.config.telemetry.enabled);
    CHECK(result.config.telemetry.environment == "development");
    CHECK(result.config.telemetry.sample_rate == 0.01);
    CHECK_FALSE(result.config.telemetry.deterministic);
    CHECK(result.config.limits.max_depth == 10);
}

TEST_CASE("ConfigLoader: all sections", "[config]") {
    EnvGuard env;

    const std::string toml = R"(
[logging]
level = "warn"

[telemetry]
enabled = false
environment = "production"
sample_rate = 0.25
deterministic = true

[limits]
max_depth = 32
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK(result.config.logging.level == "warn");
    CHECK_FALSE(result.config.telemetry.enabled);
    CHECK(result.config.telemetry.environment == "production");
    CHECK(result.config.telemetry.sample_rate == 0.25);
    CHECK(result.config.telemetry.deterministic);
    CHECK(result.config.limits.max_depth == 32);
}

TEST_CASE("ConfigLoader: malformed TOML is a parse error", "[config]") {
    auto result = ConfigLoader::load_from_string("[telemetry\nenabled = ");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.starts_with("Failed to parse config:"));
}

TEST_CASE("ConfigLoader: missing file", "[config]") {
    auto result = ConfigLoader::load_from_file("/nonexistent/piiguard.toml");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.starts_with("Failed to load config:"));
}

TEST_CASE("ConfigLoader: load from file", "[config]") {
    EnvGuard env;

    const std::string path = "/tmp/piiguard_test_config.toml";
    {
        std::ofstream out(path);
        out << "[limits]\nmax_depth = 4\n";
    }

    auto result = ConfigLoader::load_from_file(path);
    REQUIRE(result.success);
    CHECK(result.config.limits.max_depth == 4);

    std::remove(path.c_str());
}

TEST_CASE("ConfigLoader: shipped sample config is valid", "[config]") {
    EnvGuard env;
    ::setenv("PIIGUARD_ENV", "production", 1);

    auto result = ConfigLoader::load_from_file(PIIGUARD_SOURCE_DIR "/config/piiguard.toml");
    REQUIRE(result.success);
    CHECK(result.config.telemetry.environment == "production");
    CHECK(result.config.telemetry.sample_rate == 0.01);
    CHECK(result.config.limits.max_depth == 10);
}

// ============================================================================
// Environment
// ============================================================================

TEST_CASE("ConfigLoader: expand env var in a string value", "[config][env]") {
    EnvGuard env;
    ::setenv("TEST_PIIGUARD_DEPLOY", "production", 1);

    const std::string toml = R"(
[telemetry]
environment = "${TEST_PIIGUARD_DEPLOY}"
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK(result.config.telemetry.environment == "production");

    ::unsetenv("TEST_PIIGUARD_DEPLOY");
}

TEST_CASE("ConfigLoader: missing env var expands to empty", "[config][env]") {
    EnvGuard env;
    ::unsetenv("NONEXISTENT_VAR_XYZ_12345");

    const std::string toml = R"(
[telemetry]
environment = "prod${NONEXISTENT_VAR_XYZ_12345}uction"
)";

    auto result = ConfigLoader::load_from_string(toml);
    REQUIRE(result.success);
    CHECK(result.config.telemetry.environment == "production");
}

TEST_CASE("ConfigLoader: unclosed ${ is parse error", "[config][env]") {
    const std::string toml = R"(
[logging]
level = "${UNCLOSED"
)";

    auto result = ConfigLoader::load_from_string(toml);
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("Unclosed env var") != std::string::npos);
}

TEST_CASE("ConfigLoader: env vars expand inside arrays and nested tables", "[config][env]") {
    SECTION("Unclosed reference inside an array") {
        auto result = ConfigLoader::load_from_string("[extra]\nlist = [\"ok\", [\"${UNCLOSED\"]]\n");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("Unclosed env var") != std::string::npos);
    }

    SECTION("Unclosed reference inside an inline table") {
        auto result = ConfigLoader::load_from_string("[extra]\nnested = { inner = \"${UNCLOSED\" }\n");
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("Unclosed env var") != std::string::npos);
    }
}

TEST_CASE("ConfigLoader: environment overrides", "[config][env]") {
    EnvGuard env;

    const std::string toml = R"(
[telemetry]
environment = "staging"
sample_rate = 0.1
)";

    SECTION("PIIGUARD_ENV replaces the environment") {
        ::setenv("PIIGUARD_ENV", "production", 1);
        auto result = ConfigLoader::load_from_string(toml);
        REQUIRE(result.success);
        CHECK(result.config.telemetry.environment == "production");
    }

    SECTION("PII_REDACT_SAMPLING_RATE replaces the rate") {
        ::setenv("PII_REDACT_SAMPLING_RATE", " 0.5 ", 1);
        auto result = ConfigLoader::load_from_string(toml);
        REQUIRE(result.success);
        CHECK(result.config.telemetry.sample_rate == 0.5);
    }

    SECTION("Unparsable rate is ignored") {
        ::setenv("PII_REDACT_SAMPLING_RATE", "often", 1);
        auto result = ConfigLoader::load_from_string(toml);
        REQUIRE(result.success);
        CHECK(result.config.telemetry.sample_rate == 0.1);
    }

    SECTION("Out-of-range rate fails validation") {
        ::setenv("PII_REDACT_SAMPLING_RATE", "2", 1);
        auto result = ConfigLoader::load_from_string(toml);
        CHECK_FALSE(result.success);
        CHECK(result.error_message.find("sample_rate") != std::string::npos);
    }

    SECTION("Empty variables are ignored") {
        ::setenv("PIIGUARD_ENV", "", 1);
        auto result = ConfigLoader::load_from_string(toml);
        REQUIRE(result.success);
        CHECK(result.config.telemetry.environment == "staging");
    }
}

// ============================================================================
// Validation
// ============================================================================

TEST_CASE("ConfigValidation: defaults are valid", "[config][validation]") {
    CHECK(ConfigLoader::validate_config(SanitizerConfig{}).empty());
}

TEST_CASE("ConfigValidation: each violation is reported", "[config][validation]") {
    SanitizerConfig config;

    SECTION("Unknown log level") {
        config.logging.level = "verbose";
        const auto errors = ConfigLoader::validate_config(config);
        REQUIRE(errors.size() == 1);
        CHECK(errors[0].find("logging.level") != std::string::npos);
    }

    SECTION("Negative sample rate") {
        config.telemetry.sample_rate = -0.1;
        CHECK(ConfigLoader::validate_config(config).size() == 1);
    }

    SECTION("Zero depth") {
        config.limits.max_depth = 0;
        const auto errors = ConfigLoader::validate_config(config);
        REQUIRE(errors.size() == 1);
        CHECK(errors[0].find("max_depth") != std::string::npos);
    }

    SECTION("All at once") {
        config.logging.level = "";
        config.telemetry.sample_rate = 1.5;
        config.limits.max_depth = -3;
        CHECK(ConfigLoader::validate_config(config).size() == 3);
    }
}

TEST_CASE("ConfigValidation: load rejects invalid values", "[config][validation]") {
    EnvGuard env;

    auto result = ConfigLoader::load_from_string("[limits]\nmax_depth = 0\n");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.starts_with("Config validation failed:"));
    CHECK(result.error_message.find("limits.max_depth") != std::string::npos);
}

TEST_CASE("ConfigValidation: log level accepts case variants", "[config][validation]") {
    SanitizerConfig config;
    for (const char* level : {"INFO", "Warn", "warning", "error"}) {
        INFO("level: " << level);
        config.logging.level = level;
        CHECK(ConfigLoader::validate_config(config).empty());
    }
}

TEST_CASE("ConfigLoader: apply_logging sets the process log level", "[config]") {
    const auto saved_level = utils::log::min_level();

    CHECK(ConfigLoader::apply_logging(LoggingConfig{"warn"}));
    CHECK(utils::log::min_level() == utils::log::Level::WARN);

    CHECK(ConfigLoader::apply_logging(LoggingConfig{"ERROR"}));
    CHECK(utils::log::min_level() == utils::log::Level::ERROR);

    // Unknown names leave the level as it was
    CHECK_FALSE(ConfigLoader::apply_logging(LoggingConfig{"verbose"}));
    CHECK(utils::log::min_level() == utils::log::Level::ERROR);

    utils::log::set_min_level(saved_level);
}

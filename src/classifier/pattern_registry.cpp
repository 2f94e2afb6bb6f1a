#include "classifier/pattern_registry.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <stdexcept>
#include <unordered_set>

namespace piiguard {

namespace {

// Whole field names the short "ip" token may match. Compared case-insensitively.
constexpr std::array<std::string_view, 11> kIpCompounds = {
    "ip",
    "ipaddress", "ip_address",
    "remoteip", "remote_ip",
    "clientip", "client_ip",
    "serverip", "server_ip",
    "sourceip", "source_ip",
};

constexpr PiiPattern secret(std::string_view text) {
    return PiiPattern{text, PiiCategory::AUTHENTICATION_SECRET,
                      MatchStrategy::WORD_BOUNDARY, {}, 0};
}

constexpr PiiPattern pii(std::string_view text, PiiCategory category) {
    return PiiPattern{text, category, MatchStrategy::WORD_BOUNDARY, {}, 1};
}

// Registration order. Ties in priority keep this order after sorting.
constexpr std::array kBuiltinPatterns = {
    // Authentication secrets
    secret("password"),
    secret("passwd"),
    secret("token"),
    secret("bearer"),
    secret("apikey"),
    secret("api_key"),
    secret("accesskey"),
    secret("access_key"),
    secret("secret"),
    secret("auth"),
    secret("credential"),
    secret("credentials"),
    secret("authorization"),

    // Contact
    pii("email", PiiCategory::CONTACT),
    pii("phone", PiiCategory::CONTACT),
    pii("address", PiiCategory::CONTACT),

    // Identity
    pii("name", PiiCategory::IDENTITY),
    pii("ssn", PiiCategory::IDENTITY),
    pii("dob", PiiCategory::IDENTITY),
    pii("birthdate", PiiCategory::IDENTITY),
    pii("dateofbirth", PiiCategory::IDENTITY),

    // Government IDs
    pii("passport", PiiCategory::GOVERNMENT_ID),
    pii("license", PiiCategory::GOVERNMENT_ID),
    pii("driverslicense", PiiCategory::GOVERNMENT_ID),
    pii("nationalid", PiiCategory::GOVERNMENT_ID),

    // Payment cards
    pii("card", PiiCategory::FINANCIAL),
    pii("cardnumber", PiiCategory::FINANCIAL),
    pii("pan", PiiCategory::FINANCIAL),
    pii("cvv", PiiCategory::FINANCIAL),
    pii("cvc", PiiCategory::FINANCIAL),
    pii("expiry", PiiCategory::FINANCIAL),

    // Bank accounts
    pii("account", PiiCategory::FINANCIAL),
    pii("bankaccount", PiiCategory::FINANCIAL),
    pii("routing", PiiCategory::FINANCIAL),
    pii("iban", PiiCategory::FINANCIAL),
    pii("swift", PiiCategory::FINANCIAL),

    // Tax identifiers
    pii("tin", PiiCategory::TAX_ID),
    pii("taxid", PiiCategory::TAX_ID),
    pii("vat", PiiCategory::TAX_ID),

    // Network identifiers: "ip" alone is too short for boundary matching
    // (zip, ship, tip, relationship), so it is scoped to known field names.
    PiiPattern{"ip", PiiCategory::NETWORK, MatchStrategy::SPECIFIC_COMPOUND,
               kIpCompounds, 1},
};

std::vector<PiiPattern> build_registry() {
    std::vector<PiiPattern> patterns(kBuiltinPatterns.begin(), kBuiltinPatterns.end());
    std::stable_sort(patterns.begin(), patterns.end(),
        [](const PiiPattern& a, const PiiPattern& b) { return a.priority < b.priority; });

    const auto errors = PatternRegistry::validate(patterns);
    if (!errors.empty()) {
        std::string joined;
        for (const auto& err : errors) {
            if (!joined.empty()) joined += "; ";
            joined += err;
        }
        throw std::logic_error(std::format("Invalid PII pattern registry: {}", joined));
    }
    return patterns;
}

} // anonymous namespace

const std::vector<PiiPattern>& PatternRegistry::all_patterns() {
    static const std::vector<PiiPattern> patterns = build_registry();
    return patterns;
}

const PiiPattern* PatternRegistry::find(std::string_view text) {
    for (const auto& pattern : all_patterns()) {
        if (pattern.text == text) {
            return &pattern;
        }
    }
    return nullptr;
}

std::vector<std::string> PatternRegistry::validate(std::span<const PiiPattern> patterns) {
    std::vector<std::string> errors;
    std::unordered_set<std::string_view> seen;

    uint8_t last_priority = 0;
    for (size_t i = 0; i < patterns.size(); ++i) {
        const auto& p = patterns[i];

        if (p.text.empty()) {
            errors.push_back(std::format("pattern #{} has an empty token", i));
            continue;
        }
        if (utils::to_lower(p.text) != p.text) {
            errors.push_back(std::format("pattern '{}' must be lowercase", p.text));
        }
        if (!seen.insert(p.text).second) {
            errors.push_back(std::format("pattern '{}' is registered twice", p.text));
        }

        const uint8_t expected = p.is_auth_secret() ? 0 : 1;
        if (p.priority != expected) {
            errors.push_back(std::format("pattern '{}' ({}) must have priority {}, got {}",
                p.text, pii_category_to_string(p.category), expected, p.priority));
        }

        if (i > 0 && p.priority < last_priority) {
            errors.push_back(std::format("pattern '{}' breaks priority ordering", p.text));
        }
        last_priority = p.priority;

        if (p.strategy == MatchStrategy::SPECIFIC_COMPOUND && p.allowed_compounds.empty()) {
            errors.push_back(std::format("pattern '{}' is SpecificCompound without compounds", p.text));
        }
        if (p.strategy == MatchStrategy::WORD_BOUNDARY && !p.allowed_compounds.empty()) {
            errors.push_back(std::format("pattern '{}' is WordBoundary but lists compounds", p.text));
        }
    }
    return errors;
}

} // namespace piiguard

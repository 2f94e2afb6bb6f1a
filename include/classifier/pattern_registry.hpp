#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace piiguard {

enum class PiiCategory {
    CONTACT,
    IDENTITY,
    FINANCIAL,
    AUTHENTICATION_SECRET,
    NETWORK,
    GOVERNMENT_ID,
    TAX_ID
};

enum class MatchStrategy {
    WORD_BOUNDARY,      // token anywhere, bounded on both sides
    SPECIFIC_COMPOUND   // whole field name must be in allowed_compounds
};

inline const char* pii_category_to_string(PiiCategory category) {
    switch (category) {
        case PiiCategory::CONTACT: return "contact";
        case PiiCategory::IDENTITY: return "identity";
        case PiiCategory::FINANCIAL: return "financial";
        case PiiCategory::AUTHENTICATION_SECRET: return "authentication_secret";
        case PiiCategory::NETWORK: return "network";
        case PiiCategory::GOVERNMENT_ID: return "government_id";
        case PiiCategory::TAX_ID: return "tax_id";
    }
    return "unknown";
}

inline const char* match_strategy_to_string(MatchStrategy strategy) {
    switch (strategy) {
        case MatchStrategy::WORD_BOUNDARY: return "WordBoundary";
        case MatchStrategy::SPECIFIC_COMPOUND: return "SpecificCompound";
    }
    return "unknown";
}

/**
 * @brief One sensitive field-name family
 *
 * Instances live in static storage for the lifetime of the program and are
 * shared read-only by every sanitize() call.
 */
struct PiiPattern {
    std::string_view text;
    PiiCategory category;
    MatchStrategy strategy;
    std::span<const std::string_view> allowed_compounds;  // SPECIFIC_COMPOUND only
    uint8_t priority;                                     // 0 = auth secret, 1 = other PII

    [[nodiscard]] bool is_auth_secret() const {
        return category == PiiCategory::AUTHENTICATION_SECRET;
    }
};

/**
 * @brief Immutable, ordered table of sensitive field-name patterns
 *
 * Ordered by priority ascending, ties broken by registration order, so the
 * first match found while iterating is always the highest-precedence one.
 */
class PatternRegistry {
public:
    /**
     * @brief All registered patterns in evaluation order
     *
     * Built once on first use. Invariant violations in the built-in table are
     * a programming error and raise std::logic_error from the first call.
     */
    [[nodiscard]] static const std::vector<PiiPattern>& all_patterns();

    /**
     * @brief Look up a pattern by its token text (case-sensitive)
     */
    [[nodiscard]] static const PiiPattern* find(std::string_view text);

    /**
     * @brief Check table invariants
     * @return Human-readable violations; empty when the table is well formed
     *
     * - authentication_secret patterns have priority 0, all others priority 1
     * - sequence is sorted by priority
     * - SPECIFIC_COMPOUND patterns carry a non-empty allow-list and
     *   WORD_BOUNDARY patterns carry none
     * - tokens are non-empty, lowercase and unique
     */
    [[nodiscard]] static std::vector<std::string> validate(std::span<const PiiPattern> patterns);
};

} // namespace piiguard

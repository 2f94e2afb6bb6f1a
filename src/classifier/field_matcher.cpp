#include "classifier/field_matcher.hpp"
#include "core/utils.hpp"

namespace piiguard {

using utils::ascii_lower;
using utils::is_ascii_digit;
using utils::is_ascii_lower;
using utils::is_ascii_upper;

bool FieldMatcher::matches(std::string_view field_name, const PiiPattern& pattern) {
    switch (pattern.strategy) {
        case MatchStrategy::WORD_BOUNDARY:
            return matches_word_boundary(field_name, pattern.text);
        case MatchStrategy::SPECIFIC_COMPOUND:
            return matches_compound(field_name, pattern.allowed_compounds);
    }
    return false;
}

const PiiPattern* FieldMatcher::field_is_sensitive(std::string_view field_name) {
    return field_is_sensitive(field_name, PatternRegistry::all_patterns());
}

const PiiPattern* FieldMatcher::field_is_sensitive(
    std::string_view field_name,
    std::span<const PiiPattern> patterns) {

    for (const auto& pattern : patterns) {
        if (matches(field_name, pattern)) {
            return &pattern;
        }
    }
    return nullptr;
}

bool FieldMatcher::matches_word_boundary(std::string_view field_name, std::string_view token) {
    const size_t n = field_name.size();
    const size_t m = token.size();
    if (m == 0 || m > n) {
        return false;
    }

    // Every occurrence is a candidate: "name_username" must still find the
    // leading "name" even though the later one is not bounded.
    for (size_t start = 0; start + m <= n; ++start) {
        size_t k = 0;
        while (k < m && ascii_lower(field_name[start + k]) == token[k]) {
            ++k;
        }
        if (k != m) {
            continue;
        }
        if (leading_boundary(field_name, start) && trailing_boundary(field_name, start + m)) {
            return true;
        }
    }
    return false;
}

bool FieldMatcher::matches_compound(std::string_view field_name,
                                    std::span<const std::string_view> compounds) {
    for (const auto& compound : compounds) {
        if (utils::iequals(field_name, compound)) {
            return true;
        }
    }
    return false;
}

bool FieldMatcher::leading_boundary(std::string_view field_name, size_t start) {
    if (start == 0) {
        return true;
    }
    const char prev = field_name[start - 1];
    if (prev == '_') {
        return true;
    }
    const char first = field_name[start];
    if (!is_ascii_upper(first)) {
        return false;
    }
    // camelCase: "userName" -> 'r' then 'N'
    if (is_ascii_lower(prev) || is_ascii_digit(prev)) {
        return true;
    }
    // Acronym split: "AWSSecret" -> the last capital of a run starts the next word
    return is_ascii_upper(prev) && start + 1 < field_name.size() &&
           is_ascii_lower(field_name[start + 1]);
}

bool FieldMatcher::trailing_boundary(std::string_view field_name, size_t end) {
    // Versioned suffix: skip a digit run and judge what follows it
    size_t pos = end;
    while (pos < field_name.size() && is_ascii_digit(field_name[pos])) {
        ++pos;
    }

    if (pos == field_name.size()) {
        return true;
    }
    const char next = field_name[pos];
    if (next == '_') {
        return true;
    }
    if (!is_ascii_upper(next)) {
        return false;
    }
    // camelCase: "tokenId" -> 'n' then 'I'. Digits count as the lowercase side.
    const char last = field_name[pos - 1];
    if (is_ascii_lower(last) || is_ascii_digit(last)) {
        return true;
    }
    // Acronym split: "PASSWORDHash" -> 'D' then "Ha"
    return pos + 1 < field_name.size() && is_ascii_lower(field_name[pos + 1]);
}

} // namespace piiguard

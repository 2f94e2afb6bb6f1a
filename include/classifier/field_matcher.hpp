#pragma once

#include "classifier/pattern_registry.hpp"

#include <span>
#include <string_view>

namespace piiguard {

/**
 * @brief Decides whether a field name belongs to a sensitive pattern family
 *
 * WORD_BOUNDARY: the token must occur (ASCII case-insensitively) with a
 * boundary on BOTH sides. A boundary is:
 *   - start or end of the field name
 *   - an underscore
 *   - a case transition: lowercase/digit followed by an uppercase letter
 *   - an acronym split: inside a run of capitals, the last capital starts a
 *     new word when a lowercase letter follows it (AWSSecretKey, PASSWORDHash)
 * A run of digits directly after the token is absorbed into the trailing
 * boundary when the run itself ends at one of the above (password1,
 * token_2, API_KEY_123, apiKey3). A digit run followed by a lowercase
 * letter is not a boundary (token9x does not match).
 *
 *   "userName", "first_name", "NAME", "name_backup_1"  -> match "name"
 *   "USERName", "NAMEField"                            -> match "name"
 *   "filename", "username", "hostname", "NAMES"        -> no match
 *   "USERNAME"                                         -> no match
 *
 * SPECIFIC_COMPOUND: case-insensitive membership of the whole field name in
 * the pattern's allow-list.
 */
class FieldMatcher {
public:
    [[nodiscard]] static bool matches(std::string_view field_name, const PiiPattern& pattern);

    /**
     * @brief First matching pattern in registry order, nullptr if none
     *
     * Authentication secrets are tried first, so a field matching both a
     * secret and a generic PII token is classified as a secret.
     */
    [[nodiscard]] static const PiiPattern* field_is_sensitive(std::string_view field_name);

    [[nodiscard]] static const PiiPattern* field_is_sensitive(
        std::string_view field_name,
        std::span<const PiiPattern> patterns);

private:
    static bool matches_word_boundary(std::string_view field_name, std::string_view token);
    static bool matches_compound(std::string_view field_name,
                                 std::span<const std::string_view> compounds);

    static bool leading_boundary(std::string_view field_name, size_t start);
    static bool trailing_boundary(std::string_view field_name, size_t end);
};

} // namespace piiguard

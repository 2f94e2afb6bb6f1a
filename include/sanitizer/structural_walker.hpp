#pragma once

#include "classifier/pattern_registry.hpp"
#include "core/value.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace piiguard {

inline constexpr std::string_view kCircularPlaceholder = "[Circular]";

/**
 * @brief What one sanitize() call removed
 */
struct SanitizeOutcome {
    bool did_sanitize = false;
    uint32_t fields_removed = 0;
    uint32_t circular_refs = 0;
    std::vector<std::string> matched_patterns;  // distinct tokens, first-match order
};

/**
 * @brief A removed authentication-secret field, kept for redaction telemetry
 */
struct RemovedSecretField {
    std::string field_name;
    const PiiPattern* pattern = nullptr;
};

/**
 * @brief Per-call transient state. Never shared across calls or threads.
 */
struct SanitizationContext {
    struct NameHash {
        using is_transparent = void;
        size_t operator()(std::string_view sv) const { return std::hash<std::string_view>{}(sv); }
    };

    // Containers on the current root-to-node path (pushed on entry, popped on exit)
    std::unordered_set<const void*> visited;

    // Field name -> matched pattern (nullptr = not sensitive)
    std::unordered_map<std::string, const PiiPattern*, NameHash, std::equal_to<>> field_cache;

    SanitizeOutcome outcome;
    std::vector<RemovedSecretField> removed_secrets;
};

struct WalkResult {
    Value value;
    bool changed = false;
};

/**
 * @brief Depth-first traversal that drops sensitive fields
 *
 * - scalars and specials come back unchanged (same reference for specials)
 * - arrays are rebuilt only when an element changed
 * - objects are rebuilt only when a field was dropped or a child changed;
 *   otherwise the original reference is returned
 * - a container already on the current path is replaced by "[Circular]"
 */
class StructuralWalker {
public:
    [[nodiscard]] static WalkResult walk(const Value& value, SanitizationContext& ctx);

private:
    static WalkResult walk_array(const Value& value, SanitizationContext& ctx);
    static WalkResult walk_object(const Value& value, SanitizationContext& ctx);

    static const PiiPattern* classify(std::string_view field_name, SanitizationContext& ctx);
    static void record_removal(std::string_view field_name, const PiiPattern& pattern,
                               SanitizationContext& ctx);
    static WalkResult circular(SanitizationContext& ctx);
};

} // namespace piiguard

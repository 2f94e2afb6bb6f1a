#include "sanitizer/structural_walker.hpp"
#include "classifier/field_matcher.hpp"

#include <algorithm>
#include <memory>

namespace piiguard {

namespace {

/**
 * @brief Keeps a container identity on the path for the guard's lifetime
 */
class PathGuard {
public:
    PathGuard(std::unordered_set<const void*>& visited, const void* id)
        : visited_(visited), id_(id) {}

    ~PathGuard() { visited_.erase(id_); }

    PathGuard(const PathGuard&) = delete;
    PathGuard& operator=(const PathGuard&) = delete;

private:
    std::unordered_set<const void*>& visited_;
    const void* id_;
};

} // anonymous namespace

WalkResult StructuralWalker::walk(const Value& value, SanitizationContext& ctx) {
    switch (value.type()) {
        case Value::Type::ARRAY:
            return walk_array(value, ctx);
        case Value::Type::OBJECT:
            return walk_object(value, ctx);
        case Value::Type::SPECIAL:
        case Value::Type::NUL:
        case Value::Type::BOOLEAN:
        case Value::Type::INTEGER:
        case Value::Type::NUMBER:
        case Value::Type::STRING:
            break;
    }
    return {value, false};
}

WalkResult StructuralWalker::walk_array(const Value& value, SanitizationContext& ctx) {
    const void* id = value.identity();
    if (!ctx.visited.insert(id).second) {
        return circular(ctx);
    }
    PathGuard guard(ctx.visited, id);

    const Array& items = value.as_array();
    std::shared_ptr<Array> rebuilt;

    for (size_t i = 0; i < items.size(); ++i) {
        auto walked = walk(items[i], ctx);
        if (!walked.changed) {
            continue;
        }
        if (!rebuilt) {
            rebuilt = std::make_shared<Array>(items);
        }
        (*rebuilt)[i] = std::move(walked.value);
    }

    if (!rebuilt) {
        return {value, false};
    }
    return {Value(std::move(rebuilt)), true};
}

WalkResult StructuralWalker::walk_object(const Value& value, SanitizationContext& ctx) {
    const void* id = value.identity();
    if (!ctx.visited.insert(id).second) {
        return circular(ctx);
    }
    PathGuard guard(ctx.visited, id);

    const Object& fields = value.as_object();
    std::shared_ptr<Object> rebuilt;

    // Copy the fields seen so far the first time something changes
    auto start_rebuild = [&](Object::const_iterator upto) {
        rebuilt = std::make_shared<Object>();
        rebuilt->reserve(fields.size());
        for (auto it = fields.begin(); it != upto; ++it) {
            rebuilt->append(it->first, it->second);
        }
    };

    for (auto it = fields.begin(); it != fields.end(); ++it) {
        const auto& [key, child] = *it;

        if (const auto* pattern = classify(key, ctx)) {
            record_removal(key, *pattern, ctx);
            if (!rebuilt) {
                start_rebuild(it);
            }
            continue;
        }

        auto walked = walk(child, ctx);
        if (walked.changed && !rebuilt) {
            start_rebuild(it);
        }
        if (rebuilt) {
            rebuilt->append(key, std::move(walked.value));
        }
    }

    if (!rebuilt) {
        return {value, false};
    }
    return {Value(std::move(rebuilt)), true};
}

const PiiPattern* StructuralWalker::classify(std::string_view field_name, SanitizationContext& ctx) {
    const auto cached = ctx.field_cache.find(field_name);
    if (cached != ctx.field_cache.end()) {
        return cached->second;
    }
    const auto* pattern = FieldMatcher::field_is_sensitive(field_name);
    ctx.field_cache.emplace(std::string(field_name), pattern);
    return pattern;
}

void StructuralWalker::record_removal(std::string_view field_name, const PiiPattern& pattern,
                                      SanitizationContext& ctx) {
    auto& outcome = ctx.outcome;
    outcome.did_sanitize = true;
    ++outcome.fields_removed;

    const bool seen = std::find(outcome.matched_patterns.begin(), outcome.matched_patterns.end(),
                                pattern.text) != outcome.matched_patterns.end();
    if (!seen) {
        outcome.matched_patterns.emplace_back(pattern.text);
    }

    if (pattern.is_auth_secret()) {
        ctx.removed_secrets.push_back({std::string(field_name), &pattern});
    }
}

WalkResult StructuralWalker::circular(SanitizationContext& ctx) {
    ctx.outcome.did_sanitize = true;
    ++ctx.outcome.circular_refs;
    return {Value(kCircularPlaceholder), true};
}

} // namespace piiguard

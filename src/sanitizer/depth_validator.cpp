#include "sanitizer/depth_validator.hpp"

#include <algorithm>
#include <format>
#include <stdexcept>
#include <unordered_set>

namespace piiguard {

namespace {

struct CircularReference {};

// Path-scoped: shared (non-cyclic) substructures are measured normally
size_t depth_of(const Value& value, std::unordered_set<const void*>& path) {
    if (!value.is_array() && !value.is_object()) {
        return 0;
    }

    const void* id = value.identity();
    if (!path.insert(id).second) {
        throw CircularReference{};
    }

    size_t deepest_child = 0;
    if (value.is_array()) {
        for (const auto& item : value.as_array()) {
            deepest_child = std::max(deepest_child, depth_of(item, path));
        }
    } else {
        for (const auto& [key, child] : value.as_object()) {
            deepest_child = std::max(deepest_child, depth_of(child, path));
        }
    }

    path.erase(id);
    return 1 + deepest_child;
}

} // anonymous namespace

DepthValidator::DepthValidator(int max_depth) : max_depth_(max_depth) {
    if (max_depth < 1) {
        throw std::invalid_argument(std::format("max_depth must be >= 1, got {}", max_depth));
    }
}

Result<size_t> DepthValidator::measure(const Value& value) {
    std::unordered_set<const void*> path;
    try {
        return Result<size_t>::ok(depth_of(value, path));
    } catch (const CircularReference&) {
        return Result<size_t>::error(ErrorCategory::CIRCULAR_REFERENCE_ERROR,
            "Circular reference detected in data structure");
    }
}

Result<size_t> DepthValidator::validate(const Value& value) const {
    auto depth = measure(value);
    if (depth.is_error()) {
        return depth;
    }
    if (depth.value() > static_cast<size_t>(max_depth_)) {
        return Result<size_t>::error(ErrorCategory::DEPTH_LIMIT_ERROR,
            std::format("JSON depth exceeds maximum allowed depth of {} (actual: {})",
                        max_depth_, depth.value()));
    }
    return depth;
}

} // namespace piiguard

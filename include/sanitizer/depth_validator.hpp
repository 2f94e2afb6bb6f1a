#pragma once

#include "core/error.hpp"
#include "core/value.hpp"

#include <cstddef>

namespace piiguard {

/**
 * @brief Rejects payloads nested deeper than a limit
 *
 * Depth counting:
 * - scalars and specials: 0
 * - empty array/object:   1
 * - non-empty container:  1 + max(child depths)
 *
 * So {"a": {"b": "c"}} has depth 2 and [] has depth 1.
 */
class DepthValidator {
public:
    static constexpr int kDefaultMaxDepth = 10;

    /**
     * @throws std::invalid_argument if max_depth < 1
     */
    explicit DepthValidator(int max_depth = kDefaultMaxDepth);

    /**
     * @return Depth on success; DEPTH_LIMIT_ERROR when deeper than the limit,
     *         CIRCULAR_REFERENCE_ERROR when a container contains itself
     */
    [[nodiscard]] Result<size_t> validate(const Value& value) const;

    /**
     * @brief Measure depth without a limit
     */
    [[nodiscard]] static Result<size_t> measure(const Value& value);

    [[nodiscard]] int max_depth() const { return max_depth_; }

private:
    int max_depth_;
};

} // namespace piiguard

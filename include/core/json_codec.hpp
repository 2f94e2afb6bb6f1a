#pragma once

#include "core/error.hpp"
#include "core/value.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace piiguard::json_codec {

/**
 * @brief Build a Value from a parsed JSON document (object order preserved)
 */
[[nodiscard]] Value from_json(const nlohmann::ordered_json& json);

inline constexpr int kMaxParseDepth = 512;

/**
 * @brief Parse JSON text, rejecting nesting deeper than max_depth
 *
 * Depth counts containers the way DepthValidator does: [] is 1, [[1]] is 2.
 * The limit is enforced while parsing, before any Value is built.
 *
 * @return PARSE_ERROR with the parser's message on malformed input,
 *         DEPTH_LIMIT_ERROR when nested deeper than max_depth
 */
[[nodiscard]] Result<Value> parse(std::string_view text, int max_depth = kMaxParseDepth);

/**
 * @brief Render a Value as JSON for log output
 *
 * Specials are rendered, not decomposed by the sanitizer:
 *   Date   -> "2024-03-01T12:00:00.000Z"
 *   Regex  -> "/source/flags"
 *   Map    -> object (non-string keys rendered as compact JSON)
 *   Set    -> array
 *   Opaque -> "[TypeName]"
 * A container already on the current path renders as "[Circular]".
 */
[[nodiscard]] nlohmann::ordered_json to_json(const Value& value);

/**
 * @brief to_json() serialized; invalid UTF-8 is replaced, never thrown
 */
[[nodiscard]] std::string dump(const Value& value, int indent = -1);

} // namespace piiguard::json_codec

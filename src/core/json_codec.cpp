#include "core/json_codec.hpp"
#include "core/utils.hpp"

#include <format>
#include <limits>
#include <memory>
#include <unordered_set>

namespace piiguard::json_codec {

using ordered_json = nlohmann::ordered_json;

namespace {

constexpr std::string_view kCircular = "[Circular]";

struct DepthLimitExceeded {};

std::string dump_compact(const ordered_json& json) {
    return json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

ordered_json render(const Value& value, std::unordered_set<const void*>& path);

ordered_json render_special(const Special& special, std::unordered_set<const void*>& path) {
    switch (special.kind()) {
        case SpecialKind::DATE:
            return utils::format_iso8601_utc(std::get<DateValue>(special.data).at);

        case SpecialKind::REGEX: {
            const auto& re = std::get<RegexValue>(special.data);
            return std::format("/{}/{}", re.source, re.flags);
        }

        case SpecialKind::MAP: {
            ordered_json out = ordered_json::object();
            for (const auto& [key, item] : std::get<MapValue>(special.data).entries) {
                const std::string name = key.is_string()
                    ? key.as_string()
                    : dump_compact(render(key, path));
                out[name] = render(item, path);
            }
            return out;
        }

        case SpecialKind::SET: {
            ordered_json out = ordered_json::array();
            for (const auto& item : std::get<SetValue>(special.data).items) {
                out.push_back(render(item, path));
            }
            return out;
        }

        case SpecialKind::OPAQUE:
            return std::format("[{}]", std::get<OpaqueValue>(special.data).type_name);
    }
    return nullptr;
}

ordered_json render(const Value& value, std::unordered_set<const void*>& path) {
    switch (value.type()) {
        case Value::Type::NUL:     return nullptr;
        case Value::Type::BOOLEAN: return value.as_bool();
        case Value::Type::INTEGER: return value.as_integer();
        case Value::Type::NUMBER:  return value.as_number();
        case Value::Type::STRING:  return value.as_string();
        default: break;
    }

    const void* id = value.identity();
    if (!path.insert(id).second) {
        return std::string(kCircular);
    }

    ordered_json out;
    if (value.is_array()) {
        out = ordered_json::array();
        for (const auto& item : value.as_array()) {
            out.push_back(render(item, path));
        }
    } else if (value.is_object()) {
        out = ordered_json::object();
        for (const auto& [key, child] : value.as_object()) {
            out[key] = render(child, path);
        }
    } else {
        out = render_special(value.as_special(), path);
    }

    path.erase(id);
    return out;
}

} // anonymous namespace

Value from_json(const ordered_json& json) {
    switch (json.type()) {
        case ordered_json::value_t::null:
        case ordered_json::value_t::discarded:
            return Value();

        case ordered_json::value_t::boolean:
            return Value(json.get<bool>());

        case ordered_json::value_t::number_integer:
            return Value(json.get<int64_t>());

        case ordered_json::value_t::number_unsigned: {
            const auto u = json.get<uint64_t>();
            if (u <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return Value(static_cast<int64_t>(u));
            }
            return Value(static_cast<double>(u));
        }

        case ordered_json::value_t::number_float:
            return Value(json.get<double>());

        case ordered_json::value_t::string:
            return Value(json.get<std::string>());

        case ordered_json::value_t::array: {
            Array items;
            items.reserve(json.size());
            for (const auto& item : json) {
                items.push_back(from_json(item));
            }
            return Value::array(std::move(items));
        }

        case ordered_json::value_t::object: {
            auto obj = std::make_shared<Object>();
            obj->reserve(json.size());
            for (const auto& [key, item] : json.items()) {
                // Keys from the parser are already unique
                obj->append(key, from_json(item));
            }
            return Value(std::move(obj));
        }

        case ordered_json::value_t::binary:
            return Value::opaque("Binary", std::format("{} bytes", json.get_binary().size()));
    }
    return Value();
}

Result<Value> parse(std::string_view text, int max_depth) {
    // The parser itself is iterative; from_json() is not, so nesting is capped
    // before conversion. depth is the number of enclosing containers.
    const ordered_json::parser_callback_t limit_depth =
        [max_depth](int depth, ordered_json::parse_event_t event, ordered_json&) {
            if ((event == ordered_json::parse_event_t::object_start ||
                 event == ordered_json::parse_event_t::array_start) &&
                depth >= max_depth) {
                throw DepthLimitExceeded{};
            }
            return true;
        };

    try {
        return Result<Value>::ok(from_json(ordered_json::parse(text, limit_depth)));
    } catch (const DepthLimitExceeded&) {
        return Result<Value>::error(ErrorCategory::DEPTH_LIMIT_ERROR,
            std::format("JSON depth exceeds maximum allowed depth of {}", max_depth));
    } catch (const nlohmann::json::exception& e) {
        return Result<Value>::error(ErrorCategory::PARSE_ERROR,
            std::format("Invalid JSON: {}", e.what()));
    }
}

ordered_json to_json(const Value& value) {
    std::unordered_set<const void*> path;
    return render(value, path);
}

std::string dump(const Value& value, int indent) {
    return to_json(value).dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace piiguard::json_codec

#include "core/value.hpp"

#include <algorithm>

namespace piiguard {

// ============================================================================
// Value
// ============================================================================

Value::Value(std::shared_ptr<Array> v) : data_(std::move(v)) {}
Value::Value(std::shared_ptr<Object> v) : data_(std::move(v)) {}
Value::Value(std::shared_ptr<const Special> v) : data_(std::move(v)) {}

Value Value::array(Array items) {
    return Value(std::make_shared<Array>(std::move(items)));
}

Value Value::object() {
    return Value(std::make_shared<Object>());
}

Value Value::object(std::initializer_list<std::pair<std::string, Value>> members) {
    auto obj = std::make_shared<Object>();
    obj->reserve(members.size());
    for (const auto& [key, value] : members) {
        obj->set(key, value);
    }
    return Value(std::move(obj));
}

Value Value::date(std::chrono::system_clock::time_point at) {
    return Value(std::make_shared<const Special>(Special{DateValue{at}}));
}

Value Value::regex(std::string source, std::string flags) {
    return Value(std::make_shared<const Special>(
        Special{RegexValue{std::move(source), std::move(flags)}}));
}

Value Value::map(std::vector<std::pair<Value, Value>> entries) {
    return Value(std::make_shared<const Special>(Special{MapValue{std::move(entries)}}));
}

Value Value::set(std::vector<Value> items) {
    return Value(std::make_shared<const Special>(Special{SetValue{std::move(items)}}));
}

Value Value::opaque(std::string type_name, std::string description) {
    return Value(std::make_shared<const Special>(
        Special{OpaqueValue{std::move(type_name), std::move(description)}}));
}

double Value::as_number() const {
    if (const auto* i = std::get_if<int64_t>(&data_)) {
        return static_cast<double>(*i);
    }
    return std::get<double>(data_);
}

const void* Value::identity() const {
    switch (type()) {
        case Type::ARRAY:   return array_ptr().get();
        case Type::OBJECT:  return object_ptr().get();
        case Type::SPECIAL: return special_ptr().get();
        default:            return nullptr;
    }
}

bool Value::same_ref(const Value& other) const {
    const void* lhs = identity();
    if (lhs != nullptr) {
        return lhs == other.identity();
    }
    if (other.identity() != nullptr) {
        return false;
    }
    return *this == other;
}

bool operator==(const Value& lhs, const Value& rhs) {
    if (lhs.is_number() && rhs.is_number()) {
        if (lhs.is_integer() && rhs.is_integer()) {
            return lhs.as_integer() == rhs.as_integer();
        }
        return lhs.as_number() == rhs.as_number();
    }
    if (lhs.type() != rhs.type()) {
        return false;
    }

    switch (lhs.type()) {
        case Value::Type::NUL:
            return true;
        case Value::Type::BOOLEAN:
            return lhs.as_bool() == rhs.as_bool();
        case Value::Type::STRING:
            return lhs.as_string() == rhs.as_string();
        case Value::Type::ARRAY:
            return lhs.identity() == rhs.identity() || lhs.as_array() == rhs.as_array();
        case Value::Type::OBJECT:
            return lhs.identity() == rhs.identity() || lhs.as_object() == rhs.as_object();
        case Value::Type::SPECIAL:
            return lhs.identity() == rhs.identity() || lhs.as_special() == rhs.as_special();
        case Value::Type::INTEGER:
        case Value::Type::NUMBER:
            break;  // handled above
    }
    return false;
}

const char* value_type_to_string(Value::Type type) {
    switch (type) {
        case Value::Type::NUL: return "null";
        case Value::Type::BOOLEAN: return "boolean";
        case Value::Type::INTEGER: return "integer";
        case Value::Type::NUMBER: return "number";
        case Value::Type::STRING: return "string";
        case Value::Type::ARRAY: return "array";
        case Value::Type::OBJECT: return "object";
        case Value::Type::SPECIAL: return "special";
    }
    return "unknown";
}

// ============================================================================
// Object
// ============================================================================

Object::Object(std::initializer_list<Member> members) {
    members_.reserve(members.size());
    for (const auto& [key, value] : members) {
        set(key, value);
    }
}

void Object::set(std::string key, Value value) {
    auto it = std::find_if(members_.begin(), members_.end(),
        [&key](const Member& m) { return m.first == key; });
    if (it != members_.end()) {
        it->second = std::move(value);
        return;
    }
    members_.emplace_back(std::move(key), std::move(value));
}

void Object::append(std::string key, Value value) {
    members_.emplace_back(std::move(key), std::move(value));
}

bool Object::erase(std::string_view key) {
    auto it = std::find_if(members_.begin(), members_.end(),
        [key](const Member& m) { return m.first == key; });
    if (it == members_.end()) {
        return false;
    }
    members_.erase(it);
    return true;
}

const Value* Object::find(std::string_view key) const {
    for (const auto& [name, value] : members_) {
        if (name == key) {
            return &value;
        }
    }
    return nullptr;
}

// ============================================================================
// Special
// ============================================================================

const char* special_kind_to_string(SpecialKind kind) {
    switch (kind) {
        case SpecialKind::DATE: return "Date";
        case SpecialKind::REGEX: return "RegExp";
        case SpecialKind::MAP: return "Map";
        case SpecialKind::SET: return "Set";
        case SpecialKind::OPAQUE: return "Opaque";
    }
    return "Unknown";
}

} // namespace piiguard

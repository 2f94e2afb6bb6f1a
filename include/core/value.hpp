#pragma once

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace piiguard {

class Value;
class Object;
struct Special;

using Array = std::vector<Value>;

/**
 * @brief Structured value: the shape produced by decoding a JSON payload plus
 * a handful of host "special" types (dates, regexes, maps, sets).
 *
 * Scalars are stored inline. Arrays, objects and specials are stored behind a
 * shared pointer, so copying a Value copies the reference: two Values that
 * share a container have the same identity() and same_ref() is true. This is
 * what lets sanitize() return the input unchanged when nothing was removed,
 * and what makes self-referencing graphs expressible (see Object::set).
 *
 * A cyclic graph is a shared_ptr cycle and is never freed on its own: the
 * owner must break it (for example erase the back-edge) before the last
 * outside reference goes away.
 */
class Value {
public:
    enum class Type {
        NUL,
        BOOLEAN,
        INTEGER,
        NUMBER,
        STRING,
        ARRAY,
        OBJECT,
        SPECIAL
    };

    // ===== Constructors =====

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool v) : data_(v) {}

    template<typename T>
        requires (std::is_integral_v<T> && !std::is_same_v<T, bool>)
    Value(T v) : data_(static_cast<int64_t>(v)) {}

    Value(double v) : data_(v) {}
    Value(const char* v) : data_(std::string(v)) {}
    Value(std::string v) : data_(std::move(v)) {}
    Value(std::string_view v) : data_(std::string(v)) {}

    Value(std::shared_ptr<Array> v);
    Value(std::shared_ptr<Object> v);
    Value(std::shared_ptr<const Special> v);

    // ===== Container Factories =====

    [[nodiscard]] static Value array(Array items = {});
    [[nodiscard]] static Value object();
    [[nodiscard]] static Value object(std::initializer_list<std::pair<std::string, Value>> members);

    // ===== Special Factories =====

    [[nodiscard]] static Value date(std::chrono::system_clock::time_point at);
    [[nodiscard]] static Value regex(std::string source, std::string flags = {});
    [[nodiscard]] static Value map(std::vector<std::pair<Value, Value>> entries);
    [[nodiscard]] static Value set(std::vector<Value> items);
    [[nodiscard]] static Value opaque(std::string type_name, std::string description = {});

    // ===== Type Checks =====

    [[nodiscard]] Type type() const { return static_cast<Type>(data_.index()); }

    [[nodiscard]] bool is_null() const { return type() == Type::NUL; }
    [[nodiscard]] bool is_boolean() const { return type() == Type::BOOLEAN; }
    [[nodiscard]] bool is_integer() const { return type() == Type::INTEGER; }
    [[nodiscard]] bool is_number() const {
        return type() == Type::NUMBER || type() == Type::INTEGER;
    }
    [[nodiscard]] bool is_string() const { return type() == Type::STRING; }
    [[nodiscard]] bool is_array() const { return type() == Type::ARRAY; }
    [[nodiscard]] bool is_object() const { return type() == Type::OBJECT; }
    [[nodiscard]] bool is_special() const { return type() == Type::SPECIAL; }

    // ===== Scalar Access (throws std::bad_variant_access on type mismatch) =====

    [[nodiscard]] bool as_bool() const { return std::get<bool>(data_); }
    [[nodiscard]] int64_t as_integer() const { return std::get<int64_t>(data_); }
    [[nodiscard]] double as_number() const;
    [[nodiscard]] const std::string& as_string() const { return std::get<std::string>(data_); }

    // ===== Container Access =====

    [[nodiscard]] const std::shared_ptr<Array>& array_ptr() const {
        return std::get<std::shared_ptr<Array>>(data_);
    }
    [[nodiscard]] const std::shared_ptr<Object>& object_ptr() const {
        return std::get<std::shared_ptr<Object>>(data_);
    }
    [[nodiscard]] const std::shared_ptr<const Special>& special_ptr() const {
        return std::get<std::shared_ptr<const Special>>(data_);
    }

    [[nodiscard]] const Array& as_array() const { return *array_ptr(); }
    [[nodiscard]] const Object& as_object() const { return *object_ptr(); }
    [[nodiscard]] const Special& as_special() const { return *special_ptr(); }

    /**
     * @brief Address of the referenced container, nullptr for scalars
     */
    [[nodiscard]] const void* identity() const;

    /**
     * @brief True when both values refer to the same container, or are equal
     * scalars. This is reference identity, not deep equality.
     */
    [[nodiscard]] bool same_ref(const Value& other) const;

    /**
     * @brief Deep structural equality. Containers sharing an identity compare
     * equal without descending, so a graph compares equal to itself even when
     * cyclic. Two distinct cyclic graphs must not be compared.
     */
    friend bool operator==(const Value& lhs, const Value& rhs);

private:
    std::variant<
        std::monostate,
        bool,
        int64_t,
        double,
        std::string,
        std::shared_ptr<Array>,
        std::shared_ptr<Object>,
        std::shared_ptr<const Special>> data_;
};

const char* value_type_to_string(Value::Type type);

/**
 * @brief Ordered map of named fields. Insertion order is preserved.
 */
class Object {
public:
    using Member = std::pair<std::string, Value>;
    using const_iterator = std::vector<Member>::const_iterator;

    Object() = default;
    Object(std::initializer_list<Member> members);

    /**
     * @brief Replace the value of an existing key, or append a new field
     */
    void set(std::string key, Value value);

    /**
     * @brief Append without checking for an existing key
     */
    void append(std::string key, Value value);

    bool erase(std::string_view key);

    [[nodiscard]] const Value* find(std::string_view key) const;
    [[nodiscard]] bool contains(std::string_view key) const { return find(key) != nullptr; }

    [[nodiscard]] size_t size() const { return members_.size(); }
    [[nodiscard]] bool empty() const { return members_.empty(); }
    void reserve(size_t n) { members_.reserve(n); }

    [[nodiscard]] const_iterator begin() const { return members_.begin(); }
    [[nodiscard]] const_iterator end() const { return members_.end(); }

    friend bool operator==(const Object& lhs, const Object& rhs) {
        return lhs.members_ == rhs.members_;
    }

private:
    std::vector<Member> members_;
};

// ============================================================================
// Special (atomic host) types
// ============================================================================

struct DateValue {
    std::chrono::system_clock::time_point at;
    bool operator==(const DateValue&) const = default;
};

struct RegexValue {
    std::string source;
    std::string flags;
    bool operator==(const RegexValue&) const = default;
};

struct MapValue {
    std::vector<std::pair<Value, Value>> entries;
    bool operator==(const MapValue&) const = default;
};

struct SetValue {
    std::vector<Value> items;
    bool operator==(const SetValue&) const = default;
};

struct OpaqueValue {
    std::string type_name;
    std::string description;
    bool operator==(const OpaqueValue&) const = default;
};

enum class SpecialKind {
    DATE,
    REGEX,
    MAP,
    SET,
    OPAQUE
};

const char* special_kind_to_string(SpecialKind kind);

/**
 * @brief A value the sanitizer must never decompose into named fields.
 * Alternative order matches SpecialKind.
 */
struct Special {
    std::variant<DateValue, RegexValue, MapValue, SetValue, OpaqueValue> data;

    [[nodiscard]] SpecialKind kind() const { return static_cast<SpecialKind>(data.index()); }

    bool operator==(const Special&) const = default;
};

} // namespace piiguard

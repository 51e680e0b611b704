#pragma once

#include "types.hpp"

#include <cstdint>
#include <map>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace snapglass {

// One decoded scalar. Integers keep their signedness, all floats widen to double.
using ScalarValue = std::variant<bool, int64_t, uint64_t, double>;

// Zero of the given scalar type (0, 0u, 0.0 or false)
ScalarValue zero_value(ScalarType t);

// JSON-like value tree: null, scalar, string, object or dense array.
// Null doubles as the "removed" marker inside a delta.
class Value {
public:
    using Object = std::map<std::string, Value>;
    using Array = std::vector<Value>;

    enum class Kind : uint8_t {
        Null = 0,
        Bool,
        Int,
        UInt,
        Float,
        String,
        Object,
        Array
    };

    Value() = default;
    Value(bool b) : data_(b) {}
    Value(double d) : data_(d) {}
    Value(float f) : data_(static_cast<double>(f)) {}
    Value(std::string s) : data_(std::move(s)) {}
    Value(const char* s) : data_(std::string(s)) {}
    Value(Object o) : data_(std::move(o)) {}
    Value(Array a) : data_(std::move(a)) {}
    Value(const ScalarValue& s);

    template<typename T>
        requires(std::is_integral_v<T> && !std::is_same_v<T, bool>)
    Value(T v) {
        if constexpr (std::is_signed_v<T>) {
            data_ = static_cast<int64_t>(v);
        } else {
            data_ = static_cast<uint64_t>(v);
        }
    }

    static Value object() { return Value(Object{}); }
    static Value array(size_t size = 0) { return Value(Array(size)); }

    Kind kind() const { return static_cast<Kind>(data_.index()); }
    bool is_null() const { return kind() == Kind::Null; }
    bool is_object() const { return kind() == Kind::Object; }
    bool is_array() const { return kind() == Kind::Array; }
    bool is_string() const { return kind() == Kind::String; }
    bool is_scalar() const { return !is_null() && !is_object() && !is_array(); }
    bool is_number() const { return kind() == Kind::Int || kind() == Kind::UInt || kind() == Kind::Float; }

    bool as_bool() const { return std::get<bool>(data_); }
    int64_t as_int() const { return std::get<int64_t>(data_); }
    uint64_t as_uint() const { return std::get<uint64_t>(data_); }
    double as_double() const { return std::get<double>(data_); }
    const std::string& as_string() const { return std::get<std::string>(data_); }

    // Any numeric kind (or bool) widened to double
    double number() const;

    Object& as_object() { return std::get<Object>(data_); }
    const Object& as_object() const { return std::get<Object>(data_); }
    Array& as_array() { return std::get<Array>(data_); }
    const Array& as_array() const { return std::get<Array>(data_); }

    // Object member access, converting a null value into an empty object
    Value& operator[](const std::string& key);
    const Value* find(std::string_view key) const;

    // Array element access
    Value& operator[](size_t index) { return as_array()[index]; }
    const Value& operator[](size_t index) const { return as_array()[index]; }

    size_t size() const;

    // Structural equality. Object key order never matters and NaN equals NaN,
    // so a tree always compares equal to itself.
    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    std::variant<std::monostate, bool, int64_t, uint64_t, double, std::string, Object, Array> data_;
};

const char* kind_name(Value::Kind kind);

// Compact human-readable rendering ("1.5", "[1, 2]", "{a: 3}")
std::string to_string(const Value& v);

// JSON rendering. Keys come out sorted; NaN and infinities become null.
std::string to_json(const Value& v, bool pretty = false);
void write_json(std::ostream& out, const Value& v, bool pretty = false, int indent = 0);

std::string json_escape(std::string_view s);

} // namespace snapglass

#include "snapglass/value.hpp"

#include <fmt/format.h>

#include <cmath>
#include <sstream>

namespace snapglass {

namespace {

// Shortest round-trip form, always carrying a decimal point so floats stay
// distinguishable from integers once serialized
std::string format_double(double d) {
    std::string s = fmt::format("{}", d);
    if (s.find_first_of(".eEn") == std::string::npos) {
        s += ".0";
    }
    return s;
}

bool doubles_equal(double a, double b) {
    if (std::isnan(a) && std::isnan(b)) return true;
    return a == b;
}

void write_indent(std::ostream& out, int indent) {
    for (int i = 0; i < indent; ++i) {
        out << "  ";
    }
}

} // anonymous namespace

ScalarValue zero_value(ScalarType t) {
    if (t == ScalarType::Bool) return false;
    if (is_float_type(t)) return 0.0;
    if (is_signed_type(t)) return int64_t{0};
    if (t == ScalarType::Unknown) return int64_t{0};
    return uint64_t{0};
}

Value::Value(const ScalarValue& s) {
    std::visit([this](const auto& v) { data_ = v; }, s);
}

double Value::number() const {
    switch (kind()) {
        case Kind::Bool: return as_bool() ? 1.0 : 0.0;
        case Kind::Int: return static_cast<double>(as_int());
        case Kind::UInt: return static_cast<double>(as_uint());
        case Kind::Float: return as_double();
        default: return 0.0;
    }
}

Value& Value::operator[](const std::string& key) {
    if (is_null()) {
        data_ = Object{};
    }
    return as_object()[key];
}

const Value* Value::find(std::string_view key) const {
    if (!is_object()) return nullptr;
    const auto& obj = as_object();
    auto it = obj.find(std::string(key));
    if (it == obj.end()) return nullptr;
    return &it->second;
}

size_t Value::size() const {
    switch (kind()) {
        case Kind::Object: return as_object().size();
        case Kind::Array: return as_array().size();
        case Kind::Null: return 0;
        default: return 1;
    }
}

bool Value::operator==(const Value& other) const {
    if (kind() != other.kind()) return false;

    switch (kind()) {
        case Kind::Null: return true;
        case Kind::Bool: return as_bool() == other.as_bool();
        case Kind::Int: return as_int() == other.as_int();
        case Kind::UInt: return as_uint() == other.as_uint();
        case Kind::Float: return doubles_equal(as_double(), other.as_double());
        case Kind::String: return as_string() == other.as_string();
        case Kind::Object: {
            const auto& a = as_object();
            const auto& b = other.as_object();
            if (a.size() != b.size()) return false;
            for (const auto& [key, value] : a) {
                auto it = b.find(key);
                if (it == b.end() || it->second != value) return false;
            }
            return true;
        }
        case Kind::Array: {
            const auto& a = as_array();
            const auto& b = other.as_array();
            if (a.size() != b.size()) return false;
            for (size_t i = 0; i < a.size(); ++i) {
                if (a[i] != b[i]) return false;
            }
            return true;
        }
    }
    return false;
}

const char* kind_name(Value::Kind kind) {
    switch (kind) {
        case Value::Kind::Null: return "null";
        case Value::Kind::Bool: return "bool";
        case Value::Kind::Int: return "int";
        case Value::Kind::UInt: return "uint";
        case Value::Kind::Float: return "float";
        case Value::Kind::String: return "string";
        case Value::Kind::Object: return "object";
        case Value::Kind::Array: return "array";
    }
    return "?";
}

std::string to_string(const Value& v) {
    switch (v.kind()) {
        case Value::Kind::Null: return "null";
        case Value::Kind::Bool: return v.as_bool() ? "true" : "false";
        case Value::Kind::Int: return std::to_string(v.as_int());
        case Value::Kind::UInt: return std::to_string(v.as_uint());
        case Value::Kind::Float: return fmt::format("{:.6g}", v.as_double());
        case Value::Kind::String: return v.as_string();
        case Value::Kind::Object: {
            std::string s = "{";
            bool first = true;
            for (const auto& [key, child] : v.as_object()) {
                if (!first) s += ", ";
                first = false;
                s += key + ": " + to_string(child);
            }
            return s + "}";
        }
        case Value::Kind::Array: {
            std::string s = "[";
            const auto& arr = v.as_array();
            for (size_t i = 0; i < arr.size(); ++i) {
                if (i > 0) s += ", ";
                s += to_string(arr[i]);
            }
            return s + "]";
        }
    }
    return "?";
}

std::string json_escape(std::string_view s) {
    std::string result;
    result.reserve(s.size() + 10);
    for (char c : s) {
        switch (c) {
            case '"': result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    result += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
                } else {
                    result += c;
                }
                break;
        }
    }
    return result;
}

void write_json(std::ostream& out, const Value& v, bool pretty, int indent) {
    const char* nl = pretty ? "\n" : "";
    const char* colon = pretty ? ": " : ":";

    switch (v.kind()) {
        case Value::Kind::Null:
            out << "null";
            break;
        case Value::Kind::Bool:
            out << (v.as_bool() ? "true" : "false");
            break;
        case Value::Kind::Int:
            out << v.as_int();
            break;
        case Value::Kind::UInt:
            out << v.as_uint();
            break;
        case Value::Kind::Float:
            if (std::isfinite(v.as_double())) {
                out << format_double(v.as_double());
            } else {
                out << "null";
            }
            break;
        case Value::Kind::String:
            out << "\"" << json_escape(v.as_string()) << "\"";
            break;
        case Value::Kind::Object: {
            const auto& obj = v.as_object();
            if (obj.empty()) {
                out << "{}";
                break;
            }
            out << "{" << nl;
            bool first = true;
            for (const auto& [key, child] : obj) {
                if (!first) out << "," << nl;
                first = false;
                if (pretty) write_indent(out, indent + 1);
                out << "\"" << json_escape(key) << "\"" << colon;
                write_json(out, child, pretty, indent + 1);
            }
            out << nl;
            if (pretty) write_indent(out, indent);
            out << "}";
            break;
        }
        case Value::Kind::Array: {
            const auto& arr = v.as_array();
            if (arr.empty()) {
                out << "[]";
                break;
            }
            // Arrays of scalars stay on one line even when pretty printing
            bool flat = true;
            for (const auto& child : arr) {
                if (child.is_object() || child.is_array()) {
                    flat = false;
                    break;
                }
            }
            if (flat || !pretty) {
                out << "[";
                for (size_t i = 0; i < arr.size(); ++i) {
                    if (i > 0) out << (pretty ? ", " : ",");
                    write_json(out, arr[i], pretty, indent);
                }
                out << "]";
                break;
            }
            out << "[" << nl;
            for (size_t i = 0; i < arr.size(); ++i) {
                if (i > 0) out << "," << nl;
                write_indent(out, indent + 1);
                write_json(out, arr[i], pretty, indent + 1);
            }
            out << nl;
            write_indent(out, indent);
            out << "]";
            break;
        }
    }
}

std::string to_json(const Value& v, bool pretty) {
    std::ostringstream out;
    write_json(out, v, pretty);
    return out.str();
}

} // namespace snapglass

#include "snapglass/nested.hpp"

#include <algorithm>

namespace snapglass {

namespace {

// Replace placeholders left behind by sparse inserts
void fill_holes(Value& node) {
    if (node.is_object()) {
        for (auto& [key, child] : node.as_object()) {
            if (child.is_null()) {
                child = Value(int64_t{0});
            } else {
                fill_holes(child);
            }
        }
        return;
    }

    if (!node.is_array()) {
        return;
    }

    auto& arr = node.as_array();
    const Value* sibling = nullptr;
    for (auto& child : arr) {
        if (child.is_null()) continue;
        fill_holes(child);
        if (!sibling) sibling = &child;
    }

    if (!sibling) return;
    Value filler = zeroed_like(*sibling);
    for (auto& child : arr) {
        if (child.is_null()) {
            child = filler;
        }
    }
}

} // anonymous namespace

Value zeroed_like(const Value& v) {
    switch (v.kind()) {
        case Value::Kind::Bool: return false;
        case Value::Kind::Int: return int64_t{0};
        case Value::Kind::UInt: return uint64_t{0};
        case Value::Kind::Float: return 0.0;
        case Value::Kind::String: return std::string();
        case Value::Kind::Object: {
            Value out = Value::object();
            for (const auto& [key, child] : v.as_object()) {
                out[key] = zeroed_like(child);
            }
            return out;
        }
        case Value::Kind::Array: {
            Value::Array out;
            out.reserve(v.as_array().size());
            for (const auto& child : v.as_array()) {
                out.push_back(zeroed_like(child));
            }
            return out;
        }
        case Value::Kind::Null:
            break;
    }
    return int64_t{0};
}

bool insert_at_path(Value& root, const std::vector<PathStep>& steps, Value leaf) {
    Value* node = &root;

    for (const auto& step : steps) {
        if (step.is_index) {
            if (node->is_null()) {
                *node = Value::array();
            }
            if (!node->is_array()) {
                return false;
            }
            auto& arr = node->as_array();
            if (arr.size() <= step.index) {
                arr.resize(static_cast<size_t>(step.index) + 1);
            }
            node = &arr[step.index];
        } else {
            if (node->is_null()) {
                *node = Value::object();
            }
            if (!node->is_object()) {
                return false;
            }
            node = &node->as_object()[step.key];
        }
    }

    if (node->is_object() || node->is_array()) {
        return false;
    }
    *node = std::move(leaf);
    return true;
}

Value rebuild_nested(const std::vector<FieldPath>& fields,
                     const std::vector<std::optional<ScalarValue>>& values) {
    Value root;
    size_t n = std::min(fields.size(), values.size());

    for (size_t i = 0; i < n; ++i) {
        // Failed fields keep their slot so the tree shape follows the schema
        ScalarValue value = values[i] ? *values[i] : zero_value(fields[i].type);
        insert_at_path(root, fields[i].steps, Value(value));
    }

    if (root.is_null()) {
        return Value::object();
    }
    fill_holes(root);
    return root;
}

Value rebuild_nested(const std::map<std::string, ScalarValue>& flat) {
    Value root;

    for (const auto& [name, value] : flat) {
        auto steps = parse_field_path(name);
        if (!steps) continue;
        insert_at_path(root, *steps, Value(value));
    }

    if (root.is_null()) {
        return Value::object();
    }
    fill_holes(root);
    return root;
}

} // namespace snapglass

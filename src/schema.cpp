#include "snapglass/schema.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace snapglass {

TypeNode TypeNode::make_scalar(ScalarType type, uint32_t rows, uint32_t columns,
                               uint32_t element_count, uint32_t array_stride) {
    TypeNode node;
    node.kind = NodeKind::Scalar;
    node.name = std::string(scalar_name(type));
    node.scalar = type;
    node.rows = rows;
    node.columns = columns;
    node.element_count = element_count;
    node.array_stride = array_stride;
    return node;
}

TypeNode TypeNode::make_composite(std::vector<Member> members, uint32_t element_count,
                                  uint32_t array_stride, std::string name) {
    TypeNode node;
    node.kind = NodeKind::Composite;
    node.name = std::move(name);
    node.element_count = element_count;
    node.array_stride = array_stride;
    node.members = std::move(members);
    return node;
}

uint32_t element_extent(const TypeNode& node) {
    if (!node.is_composite()) {
        return node.components() * scalar_width(node.scalar);
    }

    uint32_t end = 0;
    for (const auto& m : node.members) {
        end = std::max(end, m.offset + extent(m.type));
    }
    return end;
}

uint32_t extent(const TypeNode& node) {
    uint32_t element = element_extent(node);
    if (node.element_count <= 1) {
        return element;
    }
    uint32_t stride = node.array_stride != 0 ? node.array_stride : element;
    return (node.element_count - 1) * stride + element;
}

bool normalize(TypeNode& node) {
    node.rows = std::max(node.rows, 1u);
    node.columns = std::max(node.columns, 1u);
    node.element_count = std::max(node.element_count, 1u);

    bool decodable = false;
    if (node.is_composite()) {
        for (auto& m : node.members) {
            if (normalize(m.type)) {
                decodable = true;
            }
        }
    } else {
        decodable = is_decodable(node.scalar);
    }

    return decodable;
}

std::string describe_scalar(const TypeNode& node) {
    std::string base(scalar_name(node.scalar));
    uint32_t rows = std::max(node.rows, 1u);
    uint32_t cols = std::max(node.columns, 1u);

    std::string core;
    if (rows > 1 && cols > 1) {
        core = fmt::format("{}[{}][{}]", base, rows, cols);
    } else if (cols > 1) {
        core = fmt::format("{}[{}]", base, cols);
    } else if (rows > 1) {
        core = fmt::format("{}[{}]", base, rows);
    } else {
        core = base;
    }

    if (node.element_count > 1) {
        if (core == base) {
            return fmt::format("{}[{}]", core, node.element_count);
        }
        return fmt::format("{} x {}", core, node.element_count);
    }
    return core;
}

namespace {

Value describe_members(const std::vector<Member>& members) {
    Value schema = Value::object();
    for (const auto& m : members) {
        if (!m.type.is_composite()) {
            schema[m.name] = describe_scalar(m.type);
            continue;
        }

        Value inner = describe_members(m.type.members);
        if (m.type.element_count > 1) {
            Value arr = Value::object();
            arr["_array"] = m.type.element_count;
            arr["_element"] = std::move(inner);
            schema[m.name] = std::move(arr);
        } else {
            schema[m.name] = std::move(inner);
        }
    }
    return schema;
}

} // anonymous namespace

Value describe_schema(const TypeNode& node) {
    if (!node.is_composite()) {
        return describe_scalar(node);
    }
    return describe_members(node.members);
}

} // namespace snapglass

#pragma once

#include "types.hpp"
#include "value.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace snapglass {

struct Member;

enum class NodeKind : uint8_t {
    Scalar = 0,
    Composite = 1
};

// Layout of a record, or of one member of a record.
//
// A Scalar node is `scalar` shaped rows x columns (vector or matrix), repeated
// element_count times at array_stride bytes apart. A Composite node is an
// ordered list of members at relative offsets and may repeat the same way.
// Nodes are built once per schema and only read afterwards.
struct TypeNode {
    NodeKind kind = NodeKind::Scalar;
    std::string name;                   // Type name, informational only
    ScalarType scalar = ScalarType::Unknown;
    uint32_t rows = 1;
    uint32_t columns = 1;
    uint32_t element_count = 1;
    uint32_t array_stride = 0;          // 0 = not declared
    std::vector<Member> members;

    bool is_composite() const { return kind == NodeKind::Composite; }
    bool is_array() const { return element_count > 1; }
    bool is_matrix() const { return rows > 1 && columns > 1; }
    uint32_t components() const { return rows * columns; }

    static TypeNode make_scalar(ScalarType type, uint32_t rows = 1, uint32_t columns = 1,
                                uint32_t element_count = 1, uint32_t array_stride = 0);
    static TypeNode make_composite(std::vector<Member> members, uint32_t element_count = 1,
                                   uint32_t array_stride = 0, std::string name = {});
};

struct Member {
    std::string name;
    uint32_t offset = 0;                // Relative to the enclosing composite
    TypeNode type;
};

// Bytes covered by one element of the node (max leaf end), ignoring its own array repeat
uint32_t element_extent(const TypeNode& node);

// Bytes covered by the whole node including every array element
uint32_t extent(const TypeNode& node);

// Clamp zero counts/shapes to one. Undeclared array strides stay 0 so that
// flatten can tell them from declared ones.
// Returns false if the tree contains no decodable scalar at all.
bool normalize(TypeNode& node);

// Compact type summary: composites become objects, arrayed composites become
// {"_array": N, "_element": {...}}, scalars become strings such as "float[4]".
Value describe_schema(const TypeNode& node);

// Type string for a scalar node ("float", "float[4][4]", "uint[8]", "float[4] x 8")
std::string describe_scalar(const TypeNode& node);

} // namespace snapglass

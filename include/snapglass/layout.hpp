#pragma once

#include "schema.hpp"
#include "types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace snapglass {

// One step of a field path: an object member or an array element
struct PathStep {
    std::string key;
    uint32_t index = 0;
    bool is_index = false;

    static PathStep member(std::string key) { return PathStep{std::move(key), 0, false}; }
    static PathStep element(uint32_t index) { return PathStep{{}, index, true}; }

    bool operator==(const PathStep& other) const = default;
};

// A flattened leaf scalar of a record
struct FieldPath {
    std::vector<PathStep> steps;
    uint32_t offset = 0;               // Absolute offset within one record
    ScalarType type = ScalarType::Unknown;

    uint32_t width() const { return scalar_width(type); }

    // Dotted/bracketed name, e.g. "a.b[2].c[0][1]"
    std::string name() const;
};

// Flattened schema: ordered leaf fields plus the record stride
struct Layout {
    std::vector<FieldPath> fields;
    uint32_t stride = 0;

    bool empty() const { return fields.empty(); }
    const FieldPath* find(std::string_view name) const;

    // End of the furthest field. Exceeds stride when an unwrapped array
    // spans several strides.
    uint32_t field_extent() const;
};

std::string format_path(const std::vector<PathStep>& steps);

// Parse "a.b[2].c" into steps. Returns nullopt on malformed input.
std::optional<std::vector<PathStep>> parse_field_path(std::string_view name);

// Flatten one node below `prefix` starting at `base_offset`. Composites recurse
// into members, arrays repeat per index, vectors and matrices expand per
// component. Scalars without a decode rule are skipped.
void flatten_node(const TypeNode& node, const std::vector<PathStep>& prefix,
                  uint32_t base_offset, std::vector<FieldPath>& out);

// Flatten a record schema.
//
// A top-level composite whose only member is itself a composite is treated as a
// wrapper: flattening starts from that member instead, at the wrapper's offset.
// This happens once, never recursively.
//
// Stride precedence: the outer type's declared array stride, then the unwrapped
// member's declared array stride, then max(leaf offset) + width of that leaf.
// An empty field list means no structured layout is available.
Layout flatten(const TypeNode& root, std::string_view name_prefix = {}, uint32_t base_offset = 0);

} // namespace snapglass

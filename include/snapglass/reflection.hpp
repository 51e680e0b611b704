#pragma once

#include "schema.hpp"
#include "types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace snapglass {

struct ReflectedVariable;

// Type description as reported by shader reflection
struct ReflectedType {
    std::string name;
    std::optional<ScalarType> base_type;    // Absent: no decode rule for this type
    uint32_t rows = 1;                      // 0 is accepted and treated as 1
    uint32_t columns = 1;
    uint32_t elements = 1;
    uint32_t array_byte_stride = 0;
    std::vector<ReflectedVariable> members;
};

struct ReflectedVariable {
    std::string name;
    uint32_t byte_offset = 0;
    ReflectedType type;
};

// One shader resource slot (storage buffer, constant block, ...)
struct ReflectedResource {
    std::string name;
    std::optional<uint32_t> bind_slot;      // Absent: binding slot unknown
    uint32_t index = 0;                     // Position in the shader's resource list
    ReflectedType variable_type;

    uint32_t binding() const { return bind_slot.value_or(index); }
};

// A resource as referenced by a particular shader
struct ReflectedBinding {
    uint64_t shader_id = 0;
    ReflectedResource resource;
};

// Reflection lookup supplied by the replay host
class ReflectionSource {
public:
    virtual ~ReflectionSource() = default;

    // First shader binding that references `resource_id`, or nullopt if no
    // shader references it
    virtual std::optional<ReflectedBinding> find_resource(uint64_t resource_id) = 0;

    // Fallback when find_resource has no descriptor match: the host's name
    // for the resource and the resources reflected by the shader it is used
    // with. Both default to nothing, which disables name matching.
    virtual std::string resource_name(uint64_t /*resource_id*/) { return {}; }
    virtual std::vector<ReflectedBinding> candidate_resources(uint64_t /*resource_id*/) { return {}; }
};

// Convert reflection data into a normalized TypeNode. Fails with
// SchemaUnavailable when the resource is not a structured buffer (its variable
// type has no members). A schema with no decodable scalar is still returned;
// flattening it yields an empty layout.
std::optional<TypeNode> build_schema(const ReflectedResource& resource, Error* error = nullptr);

// Best-effort pick of the reflected resource a bound resource corresponds to
// when no direct descriptor match is available. Heuristic, in order: exact
// name match, case-insensitive match, case-insensitive substring match in
// either direction, then the only candidate if there is exactly one. Returns
// nullptr if none of these is unambiguous.
const ReflectedResource* match_resource_by_name(std::string_view resource_name,
                                                const std::vector<ReflectedResource>& candidates);

} // namespace snapglass

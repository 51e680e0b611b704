#pragma once

#include "layout.hpp"
#include "reflection.hpp"
#include "schema.hpp"
#include "types.hpp"
#include "value.hpp"

#include <cstdint>
#include <compare>
#include <map>
#include <mutex>

namespace snapglass {

// Identifies one schema: the shader that declares it and the binding it sits at
struct SchemaKey {
    uint64_t shader_id = 0;
    uint32_t binding = 0;

    auto operator<=>(const SchemaKey&) const = default;
};

// A schema built once from reflection, flattened and described
struct CachedSchema {
    SchemaKey key;
    TypeNode type;
    Layout layout;
    Value description;
};

// Schema cache keyed by SchemaKey. Entries are never modified once inserted,
// and pointers returned by find()/insert() stay valid until clear().
class SchemaRegistry {
public:
    SchemaRegistry() = default;

    SchemaRegistry(const SchemaRegistry&) = delete;
    SchemaRegistry& operator=(const SchemaRegistry&) = delete;

    const CachedSchema* find(const SchemaKey& key) const;

    // Flatten and describe `type` under `key`. Returns the existing entry if
    // the key is already registered.
    const CachedSchema* insert(const SchemaKey& key, TypeNode type);

    // Schema for `resource_id`, built from `source` on first use. When the
    // source has no direct binding, the resource is matched by name against
    // the source's candidate resources.
    // Fails with SchemaUnavailable when no shader references the resource or
    // it is not a structured buffer, and with NoScalarFields when the schema
    // has nothing decodable. A failed lookup never produces an empty layout.
    const CachedSchema* get_or_build(ReflectionSource& source, uint64_t resource_id,
                                     Error* error = nullptr);

    size_t size() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::map<SchemaKey, CachedSchema> schemas_;
};

} // namespace snapglass

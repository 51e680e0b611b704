#include "snapglass/registry.hpp"

namespace snapglass {

const CachedSchema* SchemaRegistry::find(const SchemaKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = schemas_.find(key);
    if (it != schemas_.end()) {
        return &it->second;
    }
    return nullptr;
}

const CachedSchema* SchemaRegistry::insert(const SchemaKey& key, TypeNode type) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Check if already registered
    auto it = schemas_.find(key);
    if (it != schemas_.end()) {
        return &it->second;
    }

    CachedSchema entry;
    entry.key = key;
    entry.layout = flatten(type);
    entry.description = describe_schema(type);
    entry.type = std::move(type);

    auto [pos, inserted] = schemas_.emplace(key, std::move(entry));
    return &pos->second;
}

namespace {

std::optional<ReflectedBinding> match_by_name(ReflectionSource& source, uint64_t resource_id) {
    std::vector<ReflectedBinding> bindings = source.candidate_resources(resource_id);

    std::vector<ReflectedResource> resources;
    resources.reserve(bindings.size());
    for (const auto& b : bindings) {
        resources.push_back(b.resource);
    }

    const ReflectedResource* match = match_resource_by_name(source.resource_name(resource_id), resources);
    if (!match) {
        return std::nullopt;
    }
    return bindings[static_cast<size_t>(match - resources.data())];
}

} // anonymous namespace

const CachedSchema* SchemaRegistry::get_or_build(ReflectionSource& source, uint64_t resource_id,
                                                 Error* error) {
    auto binding = source.find_resource(resource_id);
    if (!binding) {
        binding = match_by_name(source, resource_id);
    }
    if (!binding) {
        set_error(error, Error::SchemaUnavailable);
        return nullptr;
    }

    SchemaKey key{binding->shader_id, binding->resource.binding()};
    const CachedSchema* cached = find(key);

    if (!cached) {
        auto type = build_schema(binding->resource, error);
        if (!type) {
            return nullptr;
        }
        cached = insert(key, std::move(*type));
    }

    if (cached->layout.empty()) {
        set_error(error, Error::NoScalarFields);
        return nullptr;
    }

    set_error(error, Error::None);
    return cached;
}

size_t SchemaRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return schemas_.size();
}

void SchemaRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    schemas_.clear();
}

} // namespace snapglass

#include "snapglass/reflection.hpp"

#include <algorithm>
#include <cctype>

namespace snapglass {

namespace {

TypeNode convert_type(const ReflectedType& type) {
    if (!type.members.empty()) {
        std::vector<Member> members;
        members.reserve(type.members.size());
        for (const auto& var : type.members) {
            members.push_back(Member{var.name, var.byte_offset, convert_type(var.type)});
        }
        return TypeNode::make_composite(std::move(members), type.elements,
                                        type.array_byte_stride, type.name);
    }

    TypeNode node = TypeNode::make_scalar(type.base_type.value_or(ScalarType::Unknown),
                                          type.rows, type.columns,
                                          type.elements, type.array_byte_stride);
    node.name = type.name;
    return node;
}

std::string lowercase(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Single candidate satisfying `pred`, nullptr if none or several do
template<typename Pred>
const ReflectedResource* unique_match(const std::vector<ReflectedResource>& candidates, Pred pred) {
    const ReflectedResource* found = nullptr;
    for (const auto& c : candidates) {
        if (!pred(c)) continue;
        if (found) return nullptr;
        found = &c;
    }
    return found;
}

} // anonymous namespace

std::optional<TypeNode> build_schema(const ReflectedResource& resource, Error* error) {
    if (resource.variable_type.members.empty()) {
        set_error(error, Error::SchemaUnavailable);
        return std::nullopt;
    }

    TypeNode root = convert_type(resource.variable_type);
    if (root.name.empty()) {
        root.name = resource.name;
    }

    // Layout without a decodable scalar is still a valid schema
    normalize(root);
    set_error(error, Error::None);
    return root;
}

const ReflectedResource* match_resource_by_name(std::string_view resource_name,
                                                const std::vector<ReflectedResource>& candidates) {
    if (candidates.empty()) {
        return nullptr;
    }

    if (!resource_name.empty()) {
        if (auto* r = unique_match(candidates, [&](const ReflectedResource& c) {
                return c.name == resource_name;
            })) {
            return r;
        }

        std::string wanted = lowercase(resource_name);
        if (auto* r = unique_match(candidates, [&](const ReflectedResource& c) {
                return lowercase(c.name) == wanted;
            })) {
            return r;
        }

        if (auto* r = unique_match(candidates, [&](const ReflectedResource& c) {
                std::string name = lowercase(c.name);
                if (name.empty()) return false;
                return name.find(wanted) != std::string::npos ||
                       wanted.find(name) != std::string::npos;
            })) {
            return r;
        }
    }

    if (candidates.size() == 1) {
        return &candidates.front();
    }
    return nullptr;
}

} // namespace snapglass

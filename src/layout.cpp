#include "snapglass/layout.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>

namespace snapglass {

namespace {

bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

std::vector<PathStep> with_step(const std::vector<PathStep>& prefix, PathStep step) {
    std::vector<PathStep> path = prefix;
    path.push_back(std::move(step));
    return path;
}

void flatten_scalar(const TypeNode& node, const std::vector<PathStep>& path,
                    uint32_t base, std::vector<FieldPath>& out) {
    uint32_t width = scalar_width(node.scalar);
    uint32_t rows = std::max(node.rows, 1u);
    uint32_t cols = std::max(node.columns, 1u);

    if (rows * cols == 1) {
        out.push_back(FieldPath{path, base, node.scalar});
        return;
    }

    // Row-major components, packed at scalar width
    bool matrix = rows > 1 && cols > 1;
    for (uint32_t r = 0; r < rows; ++r) {
        for (uint32_t c = 0; c < cols; ++c) {
            uint32_t component = r * cols + c;
            FieldPath field;
            field.steps = path;
            if (matrix) {
                field.steps.push_back(PathStep::element(r));
                field.steps.push_back(PathStep::element(c));
            } else {
                field.steps.push_back(PathStep::element(component));
            }
            field.offset = base + component * width;
            field.type = node.scalar;
            out.push_back(std::move(field));
        }
    }
}

} // anonymous namespace

std::string FieldPath::name() const {
    return format_path(steps);
}

const FieldPath* Layout::find(std::string_view name) const {
    for (const auto& field : fields) {
        if (field.name() == name) {
            return &field;
        }
    }
    return nullptr;
}

uint32_t Layout::field_extent() const {
    uint32_t end = 0;
    for (const auto& field : fields) {
        end = std::max(end, field.offset + field.width());
    }
    return end;
}

std::string format_path(const std::vector<PathStep>& steps) {
    std::string name;
    for (const auto& step : steps) {
        if (step.is_index) {
            name += fmt::format("[{}]", step.index);
        } else {
            if (!name.empty()) name += '.';
            name += step.key;
        }
    }
    return name;
}

std::optional<std::vector<PathStep>> parse_field_path(std::string_view name) {
    std::vector<PathStep> steps;
    size_t i = 0;
    bool expect_ident = true;

    while (i < name.size()) {
        char c = name[i];

        if (c == '[') {
            size_t close = name.find(']', i + 1);
            if (close == std::string_view::npos || close == i + 1) {
                return std::nullopt;
            }
            uint64_t index = 0;
            for (size_t j = i + 1; j < close; ++j) {
                if (!std::isdigit(static_cast<unsigned char>(name[j]))) {
                    return std::nullopt;
                }
                index = index * 10 + static_cast<uint64_t>(name[j] - '0');
                if (index > UINT32_MAX) {
                    return std::nullopt;
                }
            }
            steps.push_back(PathStep::element(static_cast<uint32_t>(index)));
            i = close + 1;
            expect_ident = false;
            continue;
        }

        if (c == '.') {
            if (steps.empty() || expect_ident) {
                return std::nullopt;
            }
            expect_ident = true;
            ++i;
            continue;
        }

        if (!is_ident_start(c)) {
            return std::nullopt;
        }
        // Identifiers must start the path or follow a dot
        if (!expect_ident && !steps.empty()) {
            return std::nullopt;
        }
        size_t start = i;
        while (i < name.size() && is_ident_char(name[i])) {
            ++i;
        }
        steps.push_back(PathStep::member(std::string(name.substr(start, i - start))));
        expect_ident = false;
    }

    if (expect_ident && !steps.empty()) {
        return std::nullopt;  // Trailing dot
    }
    return steps;
}

void flatten_node(const TypeNode& node, const std::vector<PathStep>& prefix,
                  uint32_t base_offset, std::vector<FieldPath>& out) {
    if (!node.is_composite() && !is_decodable(node.scalar)) {
        return;
    }

    uint32_t count = std::max(node.element_count, 1u);
    uint32_t stride = node.array_stride != 0 ? node.array_stride : element_extent(node);

    for (uint32_t i = 0; i < count; ++i) {
        const std::vector<PathStep>& path = count > 1 ? with_step(prefix, PathStep::element(i)) : prefix;
        uint32_t element_base = base_offset + i * stride;

        if (!node.is_composite()) {
            flatten_scalar(node, path, element_base, out);
            continue;
        }

        for (const auto& m : node.members) {
            flatten_node(m.type, with_step(path, PathStep::member(m.name)),
                         element_base + m.offset, out);
        }
    }
}

Layout flatten(const TypeNode& root, std::string_view name_prefix, uint32_t base_offset) {
    std::vector<PathStep> prefix;
    if (!name_prefix.empty()) {
        auto parsed = parse_field_path(name_prefix);
        if (parsed) {
            prefix = std::move(*parsed);
        } else {
            prefix.push_back(PathStep::member(std::string(name_prefix)));
        }
    }

    Layout layout;
    const TypeNode* unwrapped = nullptr;

    if (root.is_composite() && root.members.size() == 1 && root.members[0].type.is_composite()) {
        const Member& inner = root.members[0];
        unwrapped = &inner.type;
        flatten_node(inner.type, with_step(prefix, PathStep::member(inner.name)),
                     base_offset, layout.fields);
    } else {
        flatten_node(root, prefix, base_offset, layout.fields);
    }

    if (root.array_stride > 0) {
        layout.stride = root.array_stride;
    } else if (unwrapped && unwrapped->array_stride > 0) {
        layout.stride = unwrapped->array_stride;
    } else if (!layout.fields.empty()) {
        auto last = std::max_element(layout.fields.begin(), layout.fields.end(),
            [](const FieldPath& a, const FieldPath& b) { return a.offset < b.offset; });
        layout.stride = last->offset + last->width();
    }

    return layout;
}

} // namespace snapglass

#include "snapglass/diff.hpp"
#include "snapglass/decoder.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <bit>
#include <cmath>
#include <charconv>

namespace snapglass {

namespace {

std::string to_hex(std::span<const uint8_t> bytes) {
    std::string s;
    s.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        s += fmt::format("{:02x}", b);
    }
    return s;
}

uint32_t load_word(std::span<const uint8_t> data, uint64_t offset) {
    // Bytes past the end read as zero padding
    uint32_t v = 0;
    for (uint32_t i = 0; i < 4; ++i) {
        uint64_t pos = offset + i;
        uint8_t b = pos < data.size() ? data[pos] : 0;
        v |= static_cast<uint32_t>(b) << (8 * i);
    }
    return v;
}

std::optional<Value> diff_objects(const Value::Object& old_obj, const Value::Object& new_obj) {
    Value patch = Value::object();

    for (const auto& [key, new_child] : new_obj) {
        auto it = old_obj.find(key);
        if (it == old_obj.end()) {
            patch[key] = new_child;
            continue;
        }
        if (auto sub = diff_nested(it->second, new_child)) {
            patch[key] = std::move(*sub);
        }
    }

    for (const auto& [key, old_child] : old_obj) {
        if (new_obj.find(key) == new_obj.end()) {
            patch[key] = Value();
        }
    }

    if (patch.size() == 0) {
        return std::nullopt;
    }
    return patch;
}

std::optional<Value> diff_arrays(const Value::Array& old_arr, const Value::Array& new_arr) {
    if (old_arr.size() != new_arr.size()) {
        return Value(new_arr);
    }

    Value patch = Value::object();
    bool replaced_outright = !new_arr.empty();

    for (size_t i = 0; i < old_arr.size(); ++i) {
        auto sub = diff_nested(old_arr[i], new_arr[i]);
        if (!sub) {
            replaced_outright = false;
            continue;
        }
        if (*sub != new_arr[i]) {
            replaced_outright = false;
        }
        patch[std::to_string(i)] = std::move(*sub);
    }

    if (patch.size() == 0) {
        return std::nullopt;
    }
    if (replaced_outright) {
        return Value(new_arr);
    }
    return patch;
}

} // anonymous namespace

std::optional<Value> diff_nested(const Value& old_value, const Value& new_value) {
    if (old_value.kind() != new_value.kind()) {
        return new_value;
    }

    switch (old_value.kind()) {
        case Value::Kind::Object:
            return diff_objects(old_value.as_object(), new_value.as_object());
        case Value::Kind::Array:
            return diff_arrays(old_value.as_array(), new_value.as_array());
        default:
            if (old_value != new_value) {
                return new_value;
            }
            return std::nullopt;
    }
}

Value apply_patch(const Value& base, const Value& patch) {
    if (!patch.is_object()) {
        return patch;
    }

    if (base.is_array()) {
        // An index patch only names in-range positions; anything else is an
        // object that replaced the array
        std::vector<std::pair<size_t, const Value*>> indexed;
        for (const auto& [key, sub] : patch.as_object()) {
            size_t index = 0;
            auto [ptr, ec] = std::from_chars(key.data(), key.data() + key.size(), index);
            if (ec != std::errc() || ptr != key.data() + key.size() || index >= base.size()) {
                return patch;
            }
            indexed.emplace_back(index, &sub);
        }

        Value result = base;
        auto& arr = result.as_array();
        for (const auto& [index, sub] : indexed) {
            arr[index] = apply_patch(arr[index], *sub);
        }
        return result;
    }

    if (!base.is_object()) {
        return patch;
    }

    Value result = base;
    auto& obj = result.as_object();
    for (const auto& [key, sub] : patch.as_object()) {
        if (sub.is_null()) {
            obj.erase(key);
            continue;
        }
        auto it = obj.find(key);
        if (it == obj.end()) {
            obj[key] = sub;
        } else {
            it->second = apply_patch(it->second, sub);
        }
    }
    return result;
}

std::vector<ElementChange> diff_records(const Layout& layout,
                                        std::span<const uint8_t> old_data,
                                        std::span<const uint8_t> new_data,
                                        size_t max_changed) {
    std::vector<ElementChange> changed;
    if (layout.empty() || layout.stride == 0) {
        return changed;
    }

    uint64_t count = std::min(old_data.size(), new_data.size()) / layout.stride;

    for (uint64_t i = 0; i < count && changed.size() < max_changed; ++i) {
        auto old_nested = decode_nested(old_data, layout, i);
        auto new_nested = decode_nested(new_data, layout, i);
        if (!old_nested || !new_nested) {
            continue;
        }

        if (auto delta = diff_nested(*old_nested, *new_nested)) {
            changed.push_back(ElementChange{i, std::move(*delta)});
        }
    }

    return changed;
}

std::vector<ByteRegion> diff_bytes(std::span<const uint8_t> old_data,
                                   std::span<const uint8_t> new_data,
                                   size_t max_regions, size_t display_bytes) {
    std::vector<ByteRegion> regions;
    size_t min_len = std::min(old_data.size(), new_data.size());
    size_t i = 0;

    while (i < min_len && regions.size() < max_regions) {
        if (old_data[i] == new_data[i]) {
            ++i;
            continue;
        }

        size_t start = i;
        while (i < min_len && old_data[i] != new_data[i]) {
            ++i;
        }

        size_t shown = std::min(i - start, display_bytes);
        ByteRegion region;
        region.offset = start;
        region.length = i - start;
        region.old_hex = to_hex(old_data.subspan(start, shown));
        region.new_hex = to_hex(new_data.subspan(start, shown));
        regions.push_back(std::move(region));
    }

    if (old_data.size() != new_data.size() && regions.size() < max_regions) {
        ByteRegion region;
        region.size_changed = true;
        region.offset = min_len;
        region.length = std::max(old_data.size(), new_data.size()) - min_len;
        region.old_size = old_data.size();
        region.new_size = new_data.size();
        regions.push_back(std::move(region));
    }

    return regions;
}

ByteSummary summarize_bytes(std::span<const uint8_t> old_data,
                            std::span<const uint8_t> new_data,
                            size_t max_diffs) {
    ByteSummary summary;
    size_t min_len = std::min(old_data.size(), new_data.size());
    size_t max_len = std::max(old_data.size(), new_data.size());

    summary.compared = min_len;
    summary.old_size = old_data.size();
    summary.new_size = new_data.size();

    for (size_t i = 0; i < min_len; ++i) {
        if (old_data[i] == new_data[i]) continue;
        summary.changed++;
        if (summary.first_diffs.size() < max_diffs) {
            summary.first_diffs.push_back(ByteChange{i, old_data[i], new_data[i]});
        }
    }

    summary.changed += max_len - min_len;
    for (size_t i = min_len; i < max_len && summary.first_diffs.size() < max_diffs; ++i) {
        ByteChange change;
        change.offset = i;
        if (i < old_data.size()) change.old_byte = old_data[i];
        if (i < new_data.size()) change.new_byte = new_data[i];
        summary.first_diffs.push_back(change);
    }

    summary.identical = summary.changed == 0;
    return summary;
}

bool is_plausible_float(float f, const Config& config) {
    if (std::isnan(f) || std::isinf(f)) {
        return false;
    }
    if (f == 0.0f) {
        return true;
    }
    double magnitude = std::fabs(static_cast<double>(f));
    return magnitude >= config.plausible_float_min && magnitude <= config.plausible_float_max;
}

WordSummary diff_words(std::span<const uint8_t> old_data,
                       std::span<const uint8_t> new_data,
                       const Config& config) {
    WordSummary summary;
    summary.old_words = (old_data.size() + 3) / 4;
    summary.new_words = (new_data.size() + 3) / 4;
    summary.compared = std::min(summary.old_words, summary.new_words);

    for (uint64_t i = 0; i < summary.compared; ++i) {
        uint64_t offset = i * 4;
        uint32_t old_word = load_word(old_data, offset);
        uint32_t new_word = load_word(new_data, offset);
        if (old_word == new_word) continue;

        summary.changed++;
        if (summary.first_diffs.size() >= config.max_word_diffs) continue;

        WordChange change;
        change.index = i;
        change.offset = offset;
        change.old_u32 = old_word;
        change.new_u32 = new_word;

        float old_f = std::bit_cast<float>(old_word);
        float new_f = std::bit_cast<float>(new_word);
        bool old_ok = is_plausible_float(old_f, config);
        bool new_ok = is_plausible_float(new_f, config);
        if (old_ok || new_ok) {
            change.has_float = true;
            if (old_ok) change.old_f32 = old_f;
            if (new_ok) change.new_f32 = new_f;
        }
        summary.first_diffs.push_back(change);
    }

    uint64_t longer = std::max(summary.old_words, summary.new_words);
    summary.changed += longer - summary.compared;
    summary.identical = summary.changed == 0;
    return summary;
}

ResourceDelta diff_resource(const Layout* layout,
                            std::span<const uint8_t> old_data,
                            std::span<const uint8_t> new_data,
                            const Config& config) {
    ResourceDelta delta;
    if (old_data.size() == new_data.size() &&
        std::equal(old_data.begin(), old_data.end(), new_data.begin())) {
        return delta;
    }

    if (layout && !layout->empty() && layout->stride > 0) {
        delta.elements = diff_records(*layout, old_data, new_data, config.max_changed_elements);
        if (!delta.elements.empty()) {
            delta.kind = ResourceDelta::Kind::Elements;
            delta.total_elements = new_data.size() / layout->stride;
            return delta;
        }
    }

    delta.kind = ResourceDelta::Kind::ByteRegions;
    delta.regions = diff_bytes(old_data, new_data, config.max_byte_regions, config.region_display_bytes);
    return delta;
}

} // namespace snapglass

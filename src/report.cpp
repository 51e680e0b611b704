#include "snapglass/report.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace snapglass {

namespace {

Value optional_byte(const std::optional<uint8_t>& b) {
    if (!b) return Value();
    return static_cast<uint64_t>(*b);
}

std::string format_byte(const std::optional<uint8_t>& b) {
    return b ? fmt::format("{:02x}", *b) : std::string("--");
}

std::string format_float(const std::optional<float>& f) {
    return f ? fmt::format("{:.6g}", *f) : std::string("?");
}

} // anonymous namespace

std::string hex_string(std::span<const uint8_t> bytes) {
    std::string s;
    s.reserve(bytes.size() * 2);
    for (uint8_t b : bytes) {
        s += fmt::format("{:02x}", b);
    }
    return s;
}

Value to_value(const ByteRegion& region) {
    Value v = Value::object();
    v["offset"] = region.offset;
    v["length"] = region.length;
    if (region.size_changed) {
        v["size_changed"] = true;
        v["old_size"] = region.old_size;
        v["new_size"] = region.new_size;
    } else {
        v["old_hex"] = region.old_hex;
        v["new_hex"] = region.new_hex;
    }
    return v;
}

Value to_value(const ByteSummary& summary) {
    Value v = Value::object();
    v["bytes_compared"] = summary.compared;
    v["old_size"] = summary.old_size;
    v["new_size"] = summary.new_size;
    v["changed_bytes"] = summary.changed;
    v["identical"] = summary.identical;

    Value diffs = Value::array();
    for (const auto& c : summary.first_diffs) {
        Value d = Value::object();
        d["offset"] = c.offset;
        d["old"] = optional_byte(c.old_byte);
        d["new"] = optional_byte(c.new_byte);
        diffs.as_array().push_back(std::move(d));
    }
    v["first_diffs"] = std::move(diffs);
    return v;
}

Value to_value(const WordSummary& summary) {
    Value v = Value::object();
    v["words_compared"] = summary.compared;
    v["old_words"] = summary.old_words;
    v["new_words"] = summary.new_words;
    v["changed_words"] = summary.changed;
    v["identical"] = summary.identical;

    Value diffs = Value::array();
    for (const auto& c : summary.first_diffs) {
        Value d = Value::object();
        d["index"] = c.index;
        d["offset"] = c.offset;
        d["old_u32"] = static_cast<uint64_t>(c.old_u32);
        d["new_u32"] = static_cast<uint64_t>(c.new_u32);
        if (c.has_float) {
            d["old_f32"] = c.old_f32 ? Value(*c.old_f32) : Value();
            d["new_f32"] = c.new_f32 ? Value(*c.new_f32) : Value();
        }
        diffs.as_array().push_back(std::move(d));
    }
    v["first_diffs"] = std::move(diffs);
    return v;
}

Value to_value(const ResourceDelta& delta) {
    Value v = Value::object();
    switch (delta.kind) {
        case ResourceDelta::Kind::None:
            v["changed"] = false;
            break;
        case ResourceDelta::Kind::Elements: {
            v["changed"] = true;
            v["total_elements"] = delta.total_elements;
            Value elements = Value::array();
            for (const auto& e : delta.elements) {
                Value item = Value::object();
                item["element"] = e.element;
                item["delta"] = e.delta;
                elements.as_array().push_back(std::move(item));
            }
            v["changed_elements"] = std::move(elements);
            break;
        }
        case ResourceDelta::Kind::ByteRegions: {
            v["changed"] = true;
            Value regions = Value::array();
            for (const auto& r : delta.regions) {
                regions.as_array().push_back(to_value(r));
            }
            v["changed_regions"] = std::move(regions);
            break;
        }
    }
    return v;
}

Value to_value(const InstanceLog& log) {
    Value v = Value::object();
    v["label"] = log.instance.label;
    v["offset"] = log.instance.byte_offset;
    v["initial_point"] = log.initial_point;
    if (log.initial_bytes.empty()) {
        v["initial_state"] = log.initial_state;
    } else {
        v["initial_state"] = hex_string(log.initial_bytes);
    }

    Value changes = Value::array();
    for (const auto& delta : log.changes) {
        Value c = Value::object();
        c["point"] = delta.point;
        if (delta.regions.empty()) {
            c["delta"] = delta.patch;
        } else {
            Value regions = Value::array();
            for (const auto& r : delta.regions) {
                regions.as_array().push_back(to_value(r));
            }
            c["regions"] = std::move(regions);
        }
        changes.as_array().push_back(std::move(c));
    }
    v["changes"] = std::move(changes);
    return v;
}

Value to_value(const TimelineReport& report) {
    Value v = Value::object();
    v["resource"] = report.resource_name;
    v["schema"] = report.schema;
    v["stride"] = report.stride;
    v["total_changes"] = report.total_changes;

    Value tracked = Value::array();
    for (const auto& t : report.tracked) {
        tracked.as_array().push_back(Value(t.label));
    }
    v["tracked"] = std::move(tracked);

    Value instances = Value::array();
    for (const auto& log : report.instances) {
        instances.as_array().push_back(to_value(log));
    }
    v["instances"] = std::move(instances);
    return v;
}

void write_timeline_json(std::ostream& out, const TimelineReport& report, bool pretty) {
    write_json(out, to_value(report), pretty);
    out << "\n";
}

void write_timeline_text(std::ostream& out, const TimelineReport& report) {
    out << fmt::format("{}: {} tracked, {} observed, {} changes over {} points\n",
                       report.resource_name, report.tracked.size(), report.instances.size(),
                       report.total_changes, report.points_visited);

    for (const auto& log : report.instances) {
        if (log.initial_bytes.empty()) {
            out << fmt::format("{} @{}: {}\n", log.instance.label, log.initial_point,
                               to_json(log.initial_state));
        } else {
            out << fmt::format("{} @{}: {} bytes\n", log.instance.label, log.initial_point,
                               log.initial_bytes.size());
        }

        for (const auto& delta : log.changes) {
            if (delta.regions.empty()) {
                out << fmt::format("  @{}: {}\n", delta.point, to_json(delta.patch));
            } else {
                out << fmt::format("  @{}:\n", delta.point);
                write_regions_text(out, delta.regions);
            }
        }
    }
}

void write_regions_text(std::ostream& out, const std::vector<ByteRegion>& regions) {
    for (const auto& r : regions) {
        if (r.size_changed) {
            out << fmt::format("    size {} -> {}\n", r.old_size, r.new_size);
            continue;
        }
        std::string more = r.length * 2 > r.old_hex.size() ? "..." : "";
        out << fmt::format("    +{:#x} len {}: {}{} -> {}{}\n",
                           r.offset, r.length, r.old_hex, more, r.new_hex, more);
    }
}

void write_byte_summary_text(std::ostream& out, const ByteSummary& summary) {
    if (summary.identical) {
        out << fmt::format("identical ({} bytes)\n", summary.compared);
        return;
    }

    out << fmt::format("{} of {} bytes differ (sizes {} -> {})\n",
                       summary.changed, std::max(summary.old_size, summary.new_size),
                       summary.old_size, summary.new_size);
    for (const auto& c : summary.first_diffs) {
        out << fmt::format("    +{:#x}: {} -> {}\n", c.offset,
                           format_byte(c.old_byte), format_byte(c.new_byte));
    }
}

void write_word_summary_text(std::ostream& out, const WordSummary& summary) {
    if (summary.identical) {
        out << fmt::format("identical ({} words)\n", summary.compared);
        return;
    }

    out << fmt::format("{} words differ (words {} -> {})\n",
                       summary.changed, summary.old_words, summary.new_words);
    for (const auto& c : summary.first_diffs) {
        out << fmt::format("    [{}] +{:#x}: {:#010x} -> {:#010x}", c.index, c.offset,
                           c.old_u32, c.new_u32);
        if (c.has_float) {
            out << fmt::format("  ({} -> {})", format_float(c.old_f32), format_float(c.new_f32));
        }
        out << "\n";
    }
}

void write_resource_delta_text(std::ostream& out, const ResourceDelta& delta) {
    switch (delta.kind) {
        case ResourceDelta::Kind::None:
            out << "no change\n";
            break;
        case ResourceDelta::Kind::Elements:
            out << fmt::format("{} changed elements (of {})\n",
                               delta.elements.size(), delta.total_elements);
            for (const auto& e : delta.elements) {
                out << fmt::format("  [{}] {}\n", e.element, to_json(e.delta));
            }
            break;
        case ResourceDelta::Kind::ByteRegions:
            out << fmt::format("{} changed regions\n", delta.regions.size());
            write_regions_text(out, delta.regions);
            break;
    }
}

} // namespace snapglass

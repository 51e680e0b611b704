#pragma once

#include "diff.hpp"
#include "layout.hpp"
#include "types.hpp"
#include "value.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace snapglass {

// One record, texel or region followed across the timeline
struct TrackedInstance {
    std::string label;
    uint64_t byte_offset = 0;       // Where the instance starts in the resource
};

// Instances for buffer elements: label "[i]", offset i * stride
std::vector<TrackedInstance> buffer_instances(const std::vector<uint64_t>& indices, uint32_t stride);

// One change of an instance. Schema mode fills `patch`, byte mode fills `regions`.
struct Delta {
    uint64_t point = 0;
    Value patch;
    std::vector<ByteRegion> regions;
};

// Change log of one instance: the first observation plus every later change
struct InstanceLog {
    TrackedInstance instance;
    uint64_t initial_point = 0;
    Value initial_state;                    // Schema mode
    std::vector<uint8_t> initial_bytes;     // Byte mode
    std::vector<Delta> changes;
};

// Replay host: ordered observation points and resource reads at the current one
class ReplaySource {
public:
    virtual ~ReplaySource() = default;

    // Observation point ids in replay order
    virtual std::vector<uint64_t> observation_points() = 0;

    // Move replay to `point`. Returns false if the point cannot be reached.
    virtual bool seek(uint64_t point) = 0;

    // Up to `size` bytes of `resource` starting at `offset`, as of the current
    // point. May return fewer bytes near the end of the resource.
    virtual std::optional<std::vector<uint8_t>> read(uint64_t resource, uint64_t offset, uint64_t size) = 0;

    // Human-readable name, used only to label output
    virtual std::optional<std::string> resource_name(uint64_t /*resource*/) { return std::nullopt; }
};

// Per-instance change tracking over an ordered sequence of observation points.
//
// With a layout the tracker decodes every observation into a nested value and
// records sparse patches. Without one (nullptr or empty layout) it compares raw
// bytes and records changed byte regions. Only the last value of each instance
// is retained.
class TimelineTracker {
public:
    // `record_size` is the number of bytes read per instance; 0 selects the
    // larger of the layout stride and its field extent, or
    // Config::max_read_bytes in byte mode.
    TimelineTracker(std::vector<TrackedInstance> instances, const Layout* layout,
                    uint64_t record_size = 0, const Config& config = {});

    // Feed the bytes of instance `index` at `point`. Returns true if the
    // observation was taken (initial snapshot or compared against the last one).
    // Observations that fail to decode, or arrive at a point not after the
    // instance's last one, are skipped and leave the instance unchanged.
    bool observe(uint64_t point, size_t index, std::span<const uint8_t> bytes,
                 Error* error = nullptr);

    // Observe every instance within one buffer snapshot, reading each at its
    // byte offset
    void observe_buffer(uint64_t point, std::span<const uint8_t> buffer);

    // Read every instance of `resource` from `source` at the current point and
    // observe it. The caller has already seeked to `point`.
    void step(ReplaySource& source, uint64_t resource, uint64_t point);

    // Logs of instances observed at least once, in instance order
    std::vector<InstanceLog> results() const;

    const std::vector<TrackedInstance>& instances() const { return instances_; }
    uint64_t total_changes() const { return total_changes_; }
    uint64_t record_size() const { return record_size_; }
    bool schema_mode() const { return layout_ != nullptr; }

private:
    struct State {
        bool seen = false;
        uint64_t last_point = 0;
        Value last_value;
        std::vector<uint8_t> last_bytes;
        InstanceLog log;
    };

    std::vector<TrackedInstance> instances_;
    const Layout* layout_ = nullptr;
    uint64_t record_size_ = 0;
    Config config_;
    std::vector<State> states_;
    uint64_t total_changes_ = 0;
};

// Everything a timeline run produces
struct TimelineReport {
    std::string resource_name;
    Value schema;                       // describe_schema output, null in byte mode
    uint64_t stride = 0;
    std::vector<TrackedInstance> tracked;
    std::vector<InstanceLog> instances; // Observed instances only
    uint64_t total_changes = 0;
    uint64_t points_visited = 0;
};

// Called once per observation point: (point, position, total)
using ProgressFn = std::function<void(uint64_t, size_t, size_t)>;

// Single pass over `points`: one seek per point, then one read per instance.
// Points that cannot be seeked to are skipped for every instance.
TimelineReport track_timeline(ReplaySource& source, uint64_t resource,
                              const std::vector<uint64_t>& points,
                              std::vector<TrackedInstance> instances,
                              const Layout* layout, uint64_t record_size = 0,
                              const Config& config = {}, const ProgressFn& progress = {});

// Same, over the source's own observation points
TimelineReport track_timeline(ReplaySource& source, uint64_t resource,
                              std::vector<TrackedInstance> instances,
                              const Layout* layout, uint64_t record_size = 0,
                              const Config& config = {}, const ProgressFn& progress = {});

} // namespace snapglass

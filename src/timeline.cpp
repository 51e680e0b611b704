#include "snapglass/timeline.hpp"
#include "snapglass/decoder.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace snapglass {

std::vector<TrackedInstance> buffer_instances(const std::vector<uint64_t>& indices, uint32_t stride) {
    std::vector<TrackedInstance> out;
    out.reserve(indices.size());
    for (uint64_t i : indices) {
        out.push_back(TrackedInstance{fmt::format("[{}]", i), i * stride});
    }
    return out;
}

// TimelineTracker implementation

TimelineTracker::TimelineTracker(std::vector<TrackedInstance> instances, const Layout* layout,
                                 uint64_t record_size, const Config& config)
    : instances_(std::move(instances))
    , layout_(layout)
    , record_size_(record_size)
    , config_(config)
{
    if (layout_ && (layout_->empty() || layout_->stride == 0)) {
        layout_ = nullptr;
    }

    if (record_size_ == 0) {
        record_size_ = layout_ ? std::max<uint64_t>(layout_->stride, layout_->field_extent())
                               : config_.max_read_bytes;
    }

    states_.resize(instances_.size());
    for (size_t i = 0; i < instances_.size(); ++i) {
        states_[i].log.instance = instances_[i];
    }
}

bool TimelineTracker::observe(uint64_t point, size_t index, std::span<const uint8_t> bytes,
                              Error* error) {
    if (index >= states_.size()) {
        set_error(error, Error::ReadFailed);
        return false;
    }

    State& state = states_[index];
    if (state.seen && point <= state.last_point) {
        set_error(error, Error::None);
        return false;
    }

    if (bytes.size() > record_size_) {
        bytes = bytes.first(record_size_);
    }

    // Identical bytes always decode to an identical value
    if (state.seen && std::equal(bytes.begin(), bytes.end(),
                                 state.last_bytes.begin(), state.last_bytes.end())) {
        state.last_point = point;
        set_error(error, Error::None);
        return true;
    }

    if (!layout_) {
        if (bytes.empty()) {
            set_error(error, Error::ReadFailed);
            return false;
        }

        if (!state.seen) {
            state.log.initial_point = point;
            state.log.initial_bytes.assign(bytes.begin(), bytes.end());
        } else {
            Delta delta;
            delta.point = point;
            delta.regions = diff_bytes(state.last_bytes, bytes,
                                       config_.max_byte_regions, config_.region_display_bytes);
            state.log.changes.push_back(std::move(delta));
            total_changes_++;
        }

        state.seen = true;
        state.last_point = point;
        state.last_bytes.assign(bytes.begin(), bytes.end());
        set_error(error, Error::None);
        return true;
    }

    auto current = decode_nested(bytes, *layout_, 0, error);
    if (!current) {
        return false;
    }

    if (!state.seen) {
        state.log.initial_point = point;
        state.log.initial_state = *current;
    } else if (auto patch = diff_nested(state.last_value, *current)) {
        state.log.changes.push_back(Delta{point, std::move(*patch), {}});
        total_changes_++;
    }

    state.seen = true;
    state.last_point = point;
    state.last_value = std::move(*current);
    state.last_bytes.assign(bytes.begin(), bytes.end());
    return true;
}

void TimelineTracker::observe_buffer(uint64_t point, std::span<const uint8_t> buffer) {
    for (size_t i = 0; i < instances_.size(); ++i) {
        uint64_t offset = instances_[i].byte_offset;
        if (offset >= buffer.size()) {
            continue;
        }
        size_t available = static_cast<size_t>(std::min<uint64_t>(record_size_, buffer.size() - offset));
        observe(point, i, buffer.subspan(offset, available));
    }
}

void TimelineTracker::step(ReplaySource& source, uint64_t resource, uint64_t point) {
    for (size_t i = 0; i < instances_.size(); ++i) {
        auto bytes = source.read(resource, instances_[i].byte_offset, record_size_);
        if (!bytes) {
            continue;
        }
        observe(point, i, *bytes);
    }
}

std::vector<InstanceLog> TimelineTracker::results() const {
    std::vector<InstanceLog> out;
    for (const auto& state : states_) {
        if (state.seen) {
            out.push_back(state.log);
        }
    }
    return out;
}

// Timeline driver

TimelineReport track_timeline(ReplaySource& source, uint64_t resource,
                              const std::vector<uint64_t>& points,
                              std::vector<TrackedInstance> instances,
                              const Layout* layout, uint64_t record_size,
                              const Config& config, const ProgressFn& progress) {
    TimelineTracker tracker(std::move(instances), layout, record_size, config);

    TimelineReport report;
    report.resource_name = source.resource_name(resource).value_or(fmt::format("{}", resource));
    report.stride = tracker.schema_mode() ? layout->stride : 0;
    report.tracked = tracker.instances();

    for (size_t i = 0; i < points.size(); ++i) {
        uint64_t point = points[i];
        if (progress) {
            progress(point, i, points.size());
        }
        if (!source.seek(point)) {
            continue;
        }
        tracker.step(source, resource, point);
        report.points_visited++;
    }

    report.instances = tracker.results();
    report.total_changes = tracker.total_changes();
    return report;
}

TimelineReport track_timeline(ReplaySource& source, uint64_t resource,
                              std::vector<TrackedInstance> instances,
                              const Layout* layout, uint64_t record_size,
                              const Config& config, const ProgressFn& progress) {
    return track_timeline(source, resource, source.observation_points(), std::move(instances),
                          layout, record_size, config, progress);
}

} // namespace snapglass

#include <gtest/gtest.h>
#include <snapglass/timeline.hpp>
#include <snapglass/report.hpp>

#include <cstring>
#include <algorithm>
#include <map>
#include <set>
#include <sstream>

using namespace snapglass;

namespace {

std::vector<uint8_t> floats(std::initializer_list<float> values) {
    std::vector<uint8_t> out(values.size() * 4);
    size_t i = 0;
    for (float f : values) {
        std::memcpy(out.data() + i * 4, &f, 4);
        ++i;
    }
    return out;
}

Layout vec3_layout() {
    auto root = TypeNode::make_composite({
        {"v", 0, TypeNode::make_scalar(ScalarType::Float32, 3)},
    });
    return flatten(root);
}

// Replay over a fixed set of buffer snapshots, one per observation point
class FakeReplay : public ReplaySource {
public:
    std::vector<uint64_t> observation_points() override {
        std::vector<uint64_t> points;
        for (const auto& [point, bytes] : snapshots) {
            points.push_back(point);
        }
        return points;
    }

    bool seek(uint64_t point) override {
        seeks++;
        auto it = snapshots.find(point);
        if (it == snapshots.end() || unreachable.count(point)) {
            return false;
        }
        current = &it->second;
        return true;
    }

    std::optional<std::vector<uint8_t>> read(uint64_t resource, uint64_t offset, uint64_t size) override {
        reads++;
        if (!current || resource != resource_id || offset >= current->size()) {
            return std::nullopt;
        }
        uint64_t end = std::min<uint64_t>(current->size(), offset + size);
        return std::vector<uint8_t>(current->begin() + offset, current->begin() + end);
    }

    std::map<uint64_t, std::vector<uint8_t>> snapshots;
    std::set<uint64_t> unreachable;
    const std::vector<uint8_t>* current = nullptr;
    uint64_t resource_id = 5;
    int seeks = 0;
    int reads = 0;
};

} // anonymous namespace

class TimelineTest : public ::testing::Test {
protected:
    Layout layout = vec3_layout();
    FakeReplay source;
};

TEST_F(TimelineTest, InitialStateThenDelta) {
    source.snapshots[0] = floats({0.0f, 0.0f, 0.0f});
    source.snapshots[1] = floats({1.0f, 2.0f, 3.0f});

    auto report = track_timeline(source, 5, buffer_instances({0}, layout.stride), &layout);

    EXPECT_EQ(report.points_visited, 2u);
    EXPECT_EQ(report.total_changes, 1u);
    ASSERT_EQ(report.instances.size(), 1u);

    const auto& log = report.instances[0];
    EXPECT_EQ(log.instance.label, "[0]");
    EXPECT_EQ(log.initial_point, 0u);
    EXPECT_EQ(to_json(log.initial_state), R"({"v":[0.0,0.0,0.0]})");
    ASSERT_EQ(log.changes.size(), 1u);
    EXPECT_EQ(log.changes[0].point, 1u);
    EXPECT_EQ(to_json(log.changes[0].patch), R"({"v":[1.0,2.0,3.0]})");
}

TEST_F(TimelineTest, UnchangedPointsRecordNothing) {
    source.snapshots[10] = floats({1.0f, 2.0f, 3.0f});
    source.snapshots[20] = floats({1.0f, 2.0f, 3.0f});
    source.snapshots[30] = floats({1.0f, 5.0f, 3.0f});

    auto report = track_timeline(source, 5, buffer_instances({0}, layout.stride), &layout);
    ASSERT_EQ(report.instances.size(), 1u);

    const auto& changes = report.instances[0].changes;
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].point, 30u);
    EXPECT_EQ(to_json(changes[0].patch), R"({"v":{"1":5.0}})");
}

TEST_F(TimelineTest, SinglePassOverPoints) {
    source.snapshots[0] = floats({0, 0, 0, 0, 0, 0});
    source.snapshots[1] = floats({1, 0, 0, 0, 0, 0});
    source.snapshots[2] = floats({1, 0, 0, 0, 0, 2});

    auto report = track_timeline(source, 5, buffer_instances({0, 1}, layout.stride), &layout);

    // One seek per point, one read per instance per point
    EXPECT_EQ(source.seeks, 3);
    EXPECT_EQ(source.reads, 6);

    ASSERT_EQ(report.instances.size(), 2u);
    EXPECT_EQ(report.instances[0].changes.size(), 1u);
    EXPECT_EQ(report.instances[1].changes.size(), 1u);
    EXPECT_EQ(report.instances[1].instance.byte_offset, 12u);
    EXPECT_EQ(to_json(report.instances[1].changes[0].patch), R"({"v":{"2":2.0}})");
    EXPECT_EQ(report.total_changes, 2u);
}

TEST_F(TimelineTest, UnseenInstanceOmitted) {
    source.snapshots[0] = floats({0, 0, 0});
    source.snapshots[1] = floats({0, 0, 1});

    auto report = track_timeline(source, 5, buffer_instances({0, 4}, layout.stride), &layout);

    ASSERT_EQ(report.tracked.size(), 2u);
    ASSERT_EQ(report.instances.size(), 1u);
    EXPECT_EQ(report.instances[0].instance.label, "[0]");
}

TEST_F(TimelineTest, ShortReadSkipped) {
    // Second point truncates the buffer below one record
    source.snapshots[0] = floats({1, 2, 3});
    source.snapshots[1] = floats({4, 5});
    source.snapshots[2] = floats({1, 2, 7});

    auto report = track_timeline(source, 5, buffer_instances({0}, layout.stride), &layout);
    ASSERT_EQ(report.instances.size(), 1u);

    const auto& changes = report.instances[0].changes;
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].point, 2u);
    EXPECT_EQ(to_json(changes[0].patch), R"({"v":{"2":7.0}})");
}

TEST_F(TimelineTest, SeekFailureSkipsPoint) {
    source.snapshots[0] = floats({0, 0, 0});
    source.snapshots[1] = floats({9, 9, 9});
    source.unreachable.insert(1);

    auto report = track_timeline(source, 5, buffer_instances({0}, layout.stride), &layout);

    EXPECT_EQ(report.points_visited, 1u);
    EXPECT_EQ(report.total_changes, 0u);
    EXPECT_EQ(source.reads, 1);
}

TEST_F(TimelineTest, ExplicitPointsAndProgress) {
    source.snapshots[0] = floats({0, 0, 0});
    source.snapshots[1] = floats({1, 0, 0});
    source.snapshots[2] = floats({2, 0, 0});

    std::vector<uint64_t> seen;
    auto progress = [&](uint64_t point, size_t position, size_t total) {
        EXPECT_EQ(total, 2u);
        EXPECT_EQ(position, seen.size());
        seen.push_back(point);
    };

    auto report = track_timeline(source, 5, {0, 2}, buffer_instances({0}, layout.stride),
                                 &layout, 0, Config{}, progress);

    EXPECT_EQ(seen, (std::vector<uint64_t>{0, 2}));
    ASSERT_EQ(report.instances.size(), 1u);
    ASSERT_EQ(report.instances[0].changes.size(), 1u);
    EXPECT_EQ(report.instances[0].changes[0].point, 2u);
}

TEST_F(TimelineTest, ReportJson) {
    source.snapshots[0] = floats({0, 0, 0});
    source.snapshots[1] = floats({1, 2, 3});

    auto report = track_timeline(source, 5, buffer_instances({0}, layout.stride), &layout);
    EXPECT_EQ(report.resource_name, "5");

    std::ostringstream out;
    write_timeline_json(out, report);
    EXPECT_EQ(out.str(),
              R"({"instances":[{"changes":[{"delta":{"v":[1.0,2.0,3.0]},"point":1}],)"
              R"("initial_point":0,"initial_state":{"v":[0.0,0.0,0.0]},"label":"[0]","offset":0}],)"
              R"("resource":"5","schema":null,"stride":12,"total_changes":1,"tracked":["[0]"]})"
              "\n");
}

// ============================================================================
// Tracker
// ============================================================================

TEST_F(TimelineTest, ObservationOrder) {
    TimelineTracker tracker(buffer_instances({0}, layout.stride), &layout);

    EXPECT_TRUE(tracker.observe(5, 0, floats({1, 1, 1})));
    EXPECT_FALSE(tracker.observe(3, 0, floats({2, 2, 2})));
    EXPECT_FALSE(tracker.observe(5, 0, floats({2, 2, 2})));
    EXPECT_TRUE(tracker.observe(6, 0, floats({2, 2, 2})));

    auto logs = tracker.results();
    ASSERT_EQ(logs.size(), 1u);
    EXPECT_EQ(logs[0].initial_point, 5u);
    ASSERT_EQ(logs[0].changes.size(), 1u);
    EXPECT_EQ(logs[0].changes[0].point, 6u);
}

TEST_F(TimelineTest, DecodeFailureLeavesStateAlone) {
    TimelineTracker tracker(buffer_instances({0}, layout.stride), &layout);

    Error err = Error::None;
    std::vector<uint8_t> short_bytes(8, 0);
    EXPECT_FALSE(tracker.observe(0, 0, short_bytes, &err));
    EXPECT_EQ(err, Error::InsufficientData);
    EXPECT_TRUE(tracker.results().empty());

    err = Error::None;
    EXPECT_FALSE(tracker.observe(0, 3, floats({1, 2, 3}), &err));
    EXPECT_EQ(err, Error::ReadFailed);
}

TEST_F(TimelineTest, ObserveBuffer) {
    auto instances = buffer_instances({0, 1, 9}, layout.stride);
    TimelineTracker tracker(instances, &layout);

    tracker.observe_buffer(0, floats({0, 0, 0, 0, 0, 0}));
    tracker.observe_buffer(1, floats({0, 0, 0, 0, 4, 0}));

    auto logs = tracker.results();
    ASSERT_EQ(logs.size(), 2u);
    EXPECT_TRUE(logs[0].changes.empty());
    ASSERT_EQ(logs[1].changes.size(), 1u);
    EXPECT_EQ(to_json(logs[1].changes[0].patch), R"({"v":{"1":4.0}})");
    EXPECT_EQ(tracker.total_changes(), 1u);
}

TEST_F(TimelineTest, ByteModeWithoutLayout) {
    source.snapshots[0] = {0x00, 0x01, 0x02, 0x03};
    source.snapshots[1] = {0x00, 0xFF, 0x02, 0x03};

    auto report = track_timeline(source, 5, {TrackedInstance{"buffer", 0}}, nullptr, 4);
    EXPECT_EQ(report.stride, 0u);
    ASSERT_EQ(report.instances.size(), 1u);

    const auto& log = report.instances[0];
    EXPECT_EQ(log.initial_bytes, (std::vector<uint8_t>{0x00, 0x01, 0x02, 0x03}));
    ASSERT_EQ(log.changes.size(), 1u);
    ASSERT_EQ(log.changes[0].regions.size(), 1u);
    EXPECT_EQ(log.changes[0].regions[0].offset, 1u);
    EXPECT_EQ(log.changes[0].regions[0].old_hex, "01");
    EXPECT_EQ(log.changes[0].regions[0].new_hex, "ff");

    EXPECT_EQ(to_json(to_value(log)),
              R"({"changes":[{"point":1,"regions":[{"length":1,"new_hex":"ff","offset":1,"old_hex":"01"}]}],)"
              R"("initial_point":0,"initial_state":"00010203","label":"buffer","offset":0})");
}

TEST_F(TimelineTest, EmptyLayoutFallsBackToBytes) {
    Layout empty;
    TimelineTracker tracker({TrackedInstance{"all", 0}}, &empty);
    EXPECT_FALSE(tracker.schema_mode());
    EXPECT_EQ(tracker.record_size(), Config{}.max_read_bytes);

    TimelineTracker typed({TrackedInstance{"all", 0}}, &layout);
    EXPECT_TRUE(typed.schema_mode());
    EXPECT_EQ(typed.record_size(), 12u);
}

TEST_F(TimelineTest, ReadsWholeUnwrappedRecord) {
    auto item = TypeNode::make_composite({
        {"x", 0, TypeNode::make_scalar(ScalarType::UInt32)},
    }, 2, 4, "Item");
    Layout wrapped = flatten(TypeNode::make_composite({{"items", 0, item}}));
    ASSERT_EQ(wrapped.stride, 4u);

    source.snapshots[0] = {1, 0, 0, 0, 2, 0, 0, 0};
    source.snapshots[1] = {1, 0, 0, 0, 3, 0, 0, 0};

    auto report = track_timeline(source, 5, {TrackedInstance{"[0]", 0}}, &wrapped);
    ASSERT_EQ(report.instances.size(), 1u);

    const auto& log = report.instances[0];
    EXPECT_EQ(to_json(log.initial_state), R"({"items":[{"x":1},{"x":2}]})");
    ASSERT_EQ(log.changes.size(), 1u);
    EXPECT_EQ(to_json(log.changes[0].patch), R"({"items":{"1":{"x":3}}})");
}

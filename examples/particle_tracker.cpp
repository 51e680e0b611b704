// Example: follow simulated particles through a replayed frame
// An in-memory replay host stands in for a GPU capture: each event runs one
// integration step over a storage buffer of particles.
#include <snapglass/snapglass.hpp>

#include <fmt/format.h>
#include <algorithm>
#include <cstddef>
#include <cstring>
#include <iostream>
#include <map>

namespace {

constexpr uint64_t PARTICLE_BUFFER = 42;
constexpr uint64_t SIM_SHADER = 7;
constexpr uint32_t PARTICLE_COUNT = 8;

struct Particle {
    float position[3];
    uint32_t flags;
    float velocity[3];
    float age;
};
static_assert(sizeof(Particle) == 32);

// Reflection for: struct Particle {...}; buffer Particles { Particle items[]; };
// The simulated capture records no descriptor for the particle buffer, so the
// registry matches it by name against the shader's resources.
class SimReflection : public snapglass::ReflectionSource {
public:
    std::optional<snapglass::ReflectedBinding> find_resource(uint64_t) override {
        return std::nullopt;
    }

    std::string resource_name(uint64_t resource_id) override {
        return resource_id == PARTICLE_BUFFER ? "particles_ssbo" : "";
    }

    std::vector<snapglass::ReflectedBinding> candidate_resources(uint64_t resource_id) override {
        if (resource_id != PARTICLE_BUFFER) {
            return {};
        }

        auto scalar = [](snapglass::ScalarType t, uint32_t columns = 1) {
            snapglass::ReflectedType type;
            type.name = std::string(snapglass::scalar_name(t));
            type.base_type = t;
            type.columns = columns;
            return type;
        };

        snapglass::ReflectedResource params;
        params.name = "SimParams";
        params.bind_slot = 0;
        params.variable_type.name = "SimParams";
        params.variable_type.members = {
            {"dt", 0, scalar(snapglass::ScalarType::Float32)},
            {"gravity", 4, scalar(snapglass::ScalarType::Float32)},
        };

        snapglass::ReflectedType particle;
        particle.name = "Particle";
        particle.elements = 0;              // Runtime-sized array
        particle.array_byte_stride = sizeof(Particle);
        particle.members = {
            {"position", offsetof(Particle, position), scalar(snapglass::ScalarType::Float32, 3)},
            {"flags", offsetof(Particle, flags), scalar(snapglass::ScalarType::UInt32)},
            {"velocity", offsetof(Particle, velocity), scalar(snapglass::ScalarType::Float32, 3)},
            {"age", offsetof(Particle, age), scalar(snapglass::ScalarType::Float32)},
        };

        snapglass::ReflectedResource particles;
        particles.name = "Particles";
        particles.bind_slot = 2;
        particles.index = 1;
        particles.variable_type.name = "Particles";
        particles.variable_type.members = {{"items", 0, particle}};

        return {snapglass::ReflectedBinding{SIM_SHADER, params},
                snapglass::ReflectedBinding{SIM_SHADER, particles}};
    }
};

// Replays a short frame: event 10 clears, events 20..50 each integrate
class SimReplay : public snapglass::ReplaySource {
public:
    SimReplay() {
        for (uint64_t eid : {10, 20, 30, 40, 50}) {
            states_[eid] = simulate(eid);
        }
    }

    std::vector<uint64_t> observation_points() override {
        std::vector<uint64_t> points;
        for (const auto& [eid, _] : states_) {
            points.push_back(eid);
        }
        return points;
    }

    bool seek(uint64_t point) override {
        auto it = states_.find(point);
        if (it == states_.end()) return false;
        current_ = &it->second;
        return true;
    }

    std::optional<std::vector<uint8_t>> read(uint64_t resource, uint64_t offset, uint64_t size) override {
        if (resource != PARTICLE_BUFFER || !current_ || offset >= current_->size()) {
            return std::nullopt;
        }
        uint64_t end = std::min<uint64_t>(current_->size(), offset + size);
        return std::vector<uint8_t>(current_->begin() + offset, current_->begin() + end);
    }

    std::optional<std::string> resource_name(uint64_t resource) override {
        if (resource == PARTICLE_BUFFER) return "ParticleBuffer";
        return std::nullopt;
    }

private:
    static std::vector<uint8_t> simulate(uint64_t eid) {
        Particle particles[PARTICLE_COUNT] = {};
        int steps = static_cast<int>(eid / 10) - 1;

        for (uint32_t i = 0; i < PARTICLE_COUNT; ++i) {
            Particle& p = particles[i];
            p.velocity[1] = static_cast<float>(i);
            for (int s = 0; s < steps; ++s) {
                // Only even particles are alive
                if (i % 2 != 0) continue;
                p.position[1] += p.velocity[1] * 0.5f;
                p.age += 0.5f;
                p.flags = 1;
            }
        }

        std::vector<uint8_t> bytes(sizeof(particles));
        std::memcpy(bytes.data(), particles, sizeof(particles));
        return bytes;
    }

    std::map<uint64_t, std::vector<uint8_t>> states_;
    const std::vector<uint8_t>* current_ = nullptr;
};

} // anonymous namespace

int main() {
    SimReflection reflection;
    SimReplay replay;
    snapglass::SchemaRegistry schemas;

    snapglass::Error err = snapglass::Error::None;
    const auto* schema = schemas.get_or_build(reflection, PARTICLE_BUFFER, &err);
    if (!schema) {
        std::cerr << "No schema for buffer: " << snapglass::to_string(err) << "\n";
        return 1;
    }

    std::cout << fmt::format("Schema ({} fields, stride {}):\n",
                             schema->layout.fields.size(), schema->layout.stride);
    for (const auto& field : schema->layout.fields) {
        std::cout << fmt::format("  {:<16} @ {:>3}  {}\n", field.name(), field.offset,
                                 snapglass::scalar_name(field.type));
    }
    std::cout << "\n";

    auto instances = snapglass::buffer_instances({0, 1, 2}, schema->layout.stride);
    auto report = snapglass::track_timeline(replay, PARTICLE_BUFFER, std::move(instances),
                                            &schema->layout);
    report.schema = schema->description;

    snapglass::write_timeline_text(std::cout, report);
    std::cout << "\n";
    snapglass::write_timeline_json(std::cout, report, true);
    return 0;
}

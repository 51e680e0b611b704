#pragma once

#include "timeline.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace snapglass {

// Read a whole file into memory. Returns nullopt if it cannot be opened or read.
std::optional<std::vector<uint8_t>> read_file(const std::string& path);

// Replay source over binary dumps of one resource, one file per observation
// point. Point ids are the file positions 0..N-1; the resource id is ignored.
class DumpSequenceSource : public ReplaySource {
public:
    explicit DumpSequenceSource(std::vector<std::string> paths, std::string name = {});

    std::vector<uint64_t> observation_points() override;
    bool seek(uint64_t point) override;
    std::optional<std::vector<uint8_t>> read(uint64_t resource, uint64_t offset, uint64_t size) override;
    std::optional<std::string> resource_name(uint64_t resource) override;

    const std::vector<std::string>& paths() const { return paths_; }

    // Path of the dump currently loaded, empty before the first seek
    const std::string& current_path() const;

private:
    std::vector<std::string> paths_;
    std::string name_;
    std::optional<uint64_t> current_;
    std::vector<uint8_t> data_;
};

} // namespace snapglass

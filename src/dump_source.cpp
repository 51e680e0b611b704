#include "snapglass/dump_source.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>

namespace snapglass {

std::optional<std::vector<uint8_t>> read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::nullopt;
    }

    std::vector<uint8_t> data((std::istreambuf_iterator<char>(in)),
                              std::istreambuf_iterator<char>());
    if (in.bad()) {
        return std::nullopt;
    }
    return data;
}

DumpSequenceSource::DumpSequenceSource(std::vector<std::string> paths, std::string name)
    : paths_(std::move(paths))
    , name_(std::move(name))
{
}

std::vector<uint64_t> DumpSequenceSource::observation_points() {
    std::vector<uint64_t> points(paths_.size());
    for (size_t i = 0; i < points.size(); ++i) {
        points[i] = i;
    }
    return points;
}

bool DumpSequenceSource::seek(uint64_t point) {
    if (current_ && *current_ == point) {
        return true;
    }

    current_.reset();
    data_.clear();

    if (point >= paths_.size()) {
        return false;
    }

    auto data = read_file(paths_[point]);
    if (!data) {
        return false;
    }

    data_ = std::move(*data);
    current_ = point;
    return true;
}

std::optional<std::vector<uint8_t>> DumpSequenceSource::read(uint64_t /*resource*/, uint64_t offset,
                                                             uint64_t size) {
    if (!current_ || offset >= data_.size()) {
        return std::nullopt;
    }

    uint64_t end = std::min<uint64_t>(data_.size(), offset + size);
    return std::vector<uint8_t>(data_.begin() + static_cast<std::ptrdiff_t>(offset),
                                data_.begin() + static_cast<std::ptrdiff_t>(end));
}

std::optional<std::string> DumpSequenceSource::resource_name(uint64_t /*resource*/) {
    if (!name_.empty()) {
        return name_;
    }
    return std::nullopt;
}

const std::string& DumpSequenceSource::current_path() const {
    static const std::string empty;
    if (!current_) {
        return empty;
    }
    return paths_[*current_];
}

} // namespace snapglass

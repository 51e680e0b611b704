#include "snapglass/texel.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace snapglass {

namespace {

constexpr const char* CHANNEL_NAMES[] = {"r", "g", "b", "a"};

uint32_t mip_extent(uint32_t size, uint32_t mip) {
    return std::max(1u, size >> mip);
}

uint32_t channel_count(const TextureDesc& desc) {
    return std::clamp(desc.channels, 1u, 4u);
}

} // anonymous namespace

uint32_t texel_size(const TextureDesc& desc) {
    return channel_count(desc) * scalar_width(desc.channel_type);
}

uint64_t subresource_size(const TextureDesc& desc, uint32_t mip) {
    return static_cast<uint64_t>(mip_extent(desc.width, mip)) *
           mip_extent(desc.height, mip) *
           mip_extent(desc.depth, mip) *
           texel_size(desc);
}

uint64_t texel_offset(const TextureDesc& desc, const TexelCoord& coord) {
    uint32_t mips = std::max(desc.mips, 1u);
    uint32_t mip = std::min(coord.mip, mips - 1);
    uint32_t slice = std::min(coord.slice, std::max(desc.array_size, 1u) - 1);

    // Every full slice, then the lower mips of this slice
    uint64_t slice_bytes = 0;
    for (uint32_t m = 0; m < mips; ++m) {
        slice_bytes += subresource_size(desc, m);
    }
    uint64_t base = slice * slice_bytes;
    for (uint32_t m = 0; m < mip; ++m) {
        base += subresource_size(desc, m);
    }

    uint32_t w = mip_extent(desc.width, mip);
    uint32_t h = mip_extent(desc.height, mip);
    uint32_t d = mip_extent(desc.depth, mip);
    uint64_t x = std::min(coord.x, w - 1);
    uint64_t y = std::min(coord.y, h - 1);
    uint64_t z = std::min(coord.z, d - 1);

    uint64_t row_pitch = static_cast<uint64_t>(w) * texel_size(desc);
    return base + (z * h + y) * row_pitch + x * texel_size(desc);
}

TypeNode texel_schema(const TextureDesc& desc) {
    uint32_t width = scalar_width(desc.channel_type);

    std::vector<Member> members;
    for (uint32_t c = 0; c < channel_count(desc); ++c) {
        members.push_back(Member{CHANNEL_NAMES[c], c * width, TypeNode::make_scalar(desc.channel_type)});
    }

    TypeNode node = TypeNode::make_composite(std::move(members), 1, texel_size(desc), "texel");
    normalize(node);
    return node;
}

TrackedInstance texel_instance(const TextureDesc& desc, const TexelCoord& coord) {
    return TrackedInstance{to_string(coord), texel_offset(desc, coord)};
}

std::string to_string(const TexelCoord& coord) {
    return fmt::format("({},{},{}) mip {} slice {}", coord.x, coord.y, coord.z, coord.mip, coord.slice);
}

} // namespace snapglass

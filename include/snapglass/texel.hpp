#pragma once

#include "schema.hpp"
#include "timeline.hpp"
#include "types.hpp"

#include <cstdint>
#include <string>

namespace snapglass {

// Uncompressed texture stored as consecutive subresources, slice-major:
// subresource (mip, slice) is number mip + slice * mips.
struct TextureDesc {
    uint32_t width = 1;
    uint32_t height = 1;
    uint32_t depth = 1;
    uint32_t mips = 1;
    uint32_t array_size = 1;
    uint32_t channels = 4;              // 1..4, named r, g, b, a
    ScalarType channel_type = ScalarType::UInt8;
};

struct TexelCoord {
    uint32_t x = 0;
    uint32_t y = 0;
    uint32_t z = 0;
    uint32_t mip = 0;
    uint32_t slice = 0;

    bool operator==(const TexelCoord&) const = default;
};

uint32_t texel_size(const TextureDesc& desc);

// Bytes of one mip level of one slice
uint64_t subresource_size(const TextureDesc& desc, uint32_t mip);

// Byte offset of a texel. Coordinates past the mip extent are clamped to the
// last texel, and mip/slice to the last level/slice.
uint64_t texel_offset(const TextureDesc& desc, const TexelCoord& coord);

// Composite with one scalar member per channel, so texels decode, rebuild and
// diff like buffer records
TypeNode texel_schema(const TextureDesc& desc);

TrackedInstance texel_instance(const TextureDesc& desc, const TexelCoord& coord);

std::string to_string(const TexelCoord& coord);

} // namespace snapglass

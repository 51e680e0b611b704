#pragma once

#include "layout.hpp"
#include "types.hpp"
#include "value.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace snapglass {

// ============================================================================
// Schema-aware diff
// ============================================================================

// Sparse patch turning `old_value` into `new_value`, or nullopt if they are equal.
//
//  - different kinds, or arrays of different length: the whole new value
//  - objects: changed members recurse, added members copy through, removed
//    members map to null; unchanged members are omitted
//  - arrays: object keyed by stringified index holding the changed elements,
//    or the whole new array when every element was replaced outright
//  - scalars: the new value
std::optional<Value> diff_nested(const Value& old_value, const Value& new_value);

// Apply a patch produced by diff_nested. Used to replay a change log.
Value apply_patch(const Value& base, const Value& patch);

// One changed record found by diff_records
struct ElementChange {
    uint64_t element = 0;
    Value delta;
};

// Per-record diff over two buffers sharing a layout. Scans
// min(old, new) / stride records and stops after `max_changed` changed ones.
std::vector<ElementChange> diff_records(const Layout& layout,
                                        std::span<const uint8_t> old_data,
                                        std::span<const uint8_t> new_data,
                                        size_t max_changed);

// ============================================================================
// Byte-level fallback
// ============================================================================

struct ByteRegion {
    uint64_t offset = 0;
    uint64_t length = 0;            // Full run length, may exceed the hex shown
    std::string old_hex;
    std::string new_hex;

    // Trailing length mismatch
    bool size_changed = false;
    uint64_t old_size = 0;
    uint64_t new_size = 0;
};

// Contiguous changed runs over the overlapping range, at most `max_regions`,
// each showing at most `display_bytes` bytes of hex. A length mismatch adds
// one size-changed region if room is left.
std::vector<ByteRegion> diff_bytes(std::span<const uint8_t> old_data,
                                   std::span<const uint8_t> new_data,
                                   size_t max_regions, size_t display_bytes = 16);

struct ByteChange {
    uint64_t offset = 0;
    std::optional<uint8_t> old_byte;    // Absent past the end of the old buffer
    std::optional<uint8_t> new_byte;    // Absent past the end of the new buffer
};

struct ByteSummary {
    uint64_t compared = 0;
    uint64_t old_size = 0;
    uint64_t new_size = 0;
    uint64_t changed = 0;               // Length difference counts as changed bytes
    bool identical = true;
    std::vector<ByteChange> first_diffs;
};

ByteSummary summarize_bytes(std::span<const uint8_t> old_data,
                            std::span<const uint8_t> new_data,
                            size_t max_diffs);

struct WordChange {
    uint64_t index = 0;
    uint64_t offset = 0;
    uint32_t old_u32 = 0;
    uint32_t new_u32 = 0;
    // Float reinterpretation, present only when at least one side is plausible
    bool has_float = false;
    std::optional<float> old_f32;
    std::optional<float> new_f32;
};

struct WordSummary {
    uint64_t compared = 0;
    uint64_t old_words = 0;
    uint64_t new_words = 0;
    uint64_t changed = 0;               // Word count difference counts as changed words
    bool identical = true;
    std::vector<WordChange> first_diffs;
};

// Not NaN/Inf and magnitude within [min, max], or exactly zero
bool is_plausible_float(float f, const Config& config = {});

// 32-bit word diff. Both buffers are zero-padded to a 4-byte boundary.
WordSummary diff_words(std::span<const uint8_t> old_data,
                       std::span<const uint8_t> new_data,
                       const Config& config = {});

// ============================================================================
// Whole-resource policy
// ============================================================================

struct ResourceDelta {
    enum class Kind : uint8_t {
        None = 0,           // Contents identical
        Elements,           // Schema-aware per-record changes
        ByteRegions         // No usable layout, or records showed no change
    };

    Kind kind = Kind::None;
    uint64_t total_elements = 0;
    std::vector<ElementChange> elements;
    std::vector<ByteRegion> regions;
};

// Per-record diff when a layout with a stride is known, byte regions otherwise
ResourceDelta diff_resource(const Layout* layout,
                            std::span<const uint8_t> old_data,
                            std::span<const uint8_t> new_data,
                            const Config& config = {});

} // namespace snapglass

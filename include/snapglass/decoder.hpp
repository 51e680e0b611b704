#pragma once

#include "layout.hpp"
#include "types.hpp"
#include "value.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace snapglass {

// Decode one little-endian scalar at `offset`. Returns nullopt when the read
// would run past the end of `bytes` or the type has no decode rule. Any bit
// pattern decodes to some value, NaN and infinities included.
std::optional<ScalarValue> decode_scalar(ScalarType type, std::span<const uint8_t> bytes, size_t offset);

// IEEE 754 binary16 to double, subnormals, infinities and NaN included
double half_to_double(uint16_t bits);

// Values for one record instance, parallel to Layout::fields.
// A missing entry is a field whose read overran the buffer.
struct DecodedRecord {
    std::vector<std::optional<ScalarValue>> values;
    size_t failed_fields = 0;

    bool complete() const { return failed_fields == 0; }
};

// Decode record `index` (base = index * stride). Fails with InsufficientData if
// the buffer does not hold the whole record; individual field overruns only
// drop that field and set PartialFieldDecode.
std::optional<DecodedRecord> decode_instance(std::span<const uint8_t> bytes, const Layout& layout,
                                             uint64_t index, Error* error = nullptr);

// decode_instance followed by rebuild_nested
std::optional<Value> decode_nested(std::span<const uint8_t> bytes, const Layout& layout,
                                   uint64_t index, Error* error = nullptr);

} // namespace snapglass

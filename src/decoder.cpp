#include "snapglass/decoder.hpp"
#include "snapglass/nested.hpp"

#include <bit>
#include <cmath>
#include <limits>

namespace snapglass {

namespace {

uint64_t load_le(const uint8_t* p, uint32_t width) {
    uint64_t v = 0;
    for (uint32_t i = 0; i < width; ++i) {
        v |= static_cast<uint64_t>(p[i]) << (8 * i);
    }
    return v;
}

} // anonymous namespace

double half_to_double(uint16_t bits) {
    uint32_t sign = (bits >> 15) & 0x1;
    uint32_t exponent = (bits >> 10) & 0x1F;
    uint32_t mantissa = bits & 0x3FF;

    double value;
    if (exponent == 0) {
        value = std::ldexp(static_cast<double>(mantissa), -24);
    } else if (exponent == 0x1F) {
        value = mantissa == 0 ? std::numeric_limits<double>::infinity()
                              : std::numeric_limits<double>::quiet_NaN();
    } else {
        value = std::ldexp(static_cast<double>(mantissa | 0x400), static_cast<int>(exponent) - 25);
    }
    return sign ? -value : value;
}

std::optional<ScalarValue> decode_scalar(ScalarType type, std::span<const uint8_t> bytes, size_t offset) {
    uint32_t width = scalar_width(type);
    if (width == 0 || offset > bytes.size() || bytes.size() - offset < width) {
        return std::nullopt;
    }

    uint64_t raw = load_le(bytes.data() + offset, width);

    switch (type) {
        case ScalarType::Bool: return raw != 0;
        case ScalarType::Int8: return static_cast<int64_t>(static_cast<int8_t>(raw));
        case ScalarType::UInt8: return static_cast<uint64_t>(static_cast<uint8_t>(raw));
        case ScalarType::Int16: return static_cast<int64_t>(static_cast<int16_t>(raw));
        case ScalarType::UInt16: return static_cast<uint64_t>(static_cast<uint16_t>(raw));
        case ScalarType::Int32: return static_cast<int64_t>(static_cast<int32_t>(raw));
        case ScalarType::UInt32: return static_cast<uint64_t>(static_cast<uint32_t>(raw));
        case ScalarType::Int64: return static_cast<int64_t>(raw);
        case ScalarType::UInt64: return raw;
        case ScalarType::Float16: return half_to_double(static_cast<uint16_t>(raw));
        case ScalarType::Float32: return static_cast<double>(std::bit_cast<float>(static_cast<uint32_t>(raw)));
        case ScalarType::Float64: return std::bit_cast<double>(raw);
        default: return std::nullopt;
    }
}

std::optional<DecodedRecord> decode_instance(std::span<const uint8_t> bytes, const Layout& layout,
                                             uint64_t index, Error* error) {
    uint64_t base = index * layout.stride;
    if (bytes.size() < base + layout.stride) {
        set_error(error, Error::InsufficientData);
        return std::nullopt;
    }

    DecodedRecord record;
    record.values.reserve(layout.fields.size());

    for (const auto& field : layout.fields) {
        auto value = decode_scalar(field.type, bytes, base + field.offset);
        if (!value) {
            record.failed_fields++;
        }
        record.values.push_back(value);
    }

    set_error(error, record.complete() ? Error::None : Error::PartialFieldDecode);
    return record;
}

std::optional<Value> decode_nested(std::span<const uint8_t> bytes, const Layout& layout,
                                   uint64_t index, Error* error) {
    auto record = decode_instance(bytes, layout, index, error);
    if (!record) {
        return std::nullopt;
    }
    return rebuild_nested(layout.fields, record->values);
}

} // namespace snapglass

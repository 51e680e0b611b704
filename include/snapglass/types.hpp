#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <type_traits>

namespace snapglass {

// Scalar kinds a record field can decode to
enum class ScalarType : uint32_t {
    Unknown = 0,
    Bool = 1,
    Int8 = 2,
    UInt8 = 3,
    Int16 = 4,
    UInt16 = 5,
    Int32 = 6,
    UInt32 = 7,
    Int64 = 8,
    UInt64 = 9,
    Float16 = 10,
    Float32 = 11,
    Float64 = 12
};

// Byte width of one scalar. Bool follows the GPU convention of a 32-bit word.
constexpr uint32_t scalar_width(ScalarType t) {
    switch (t) {
        case ScalarType::Int8:
        case ScalarType::UInt8:
            return 1;
        case ScalarType::Int16:
        case ScalarType::UInt16:
        case ScalarType::Float16:
            return 2;
        case ScalarType::Bool:
        case ScalarType::Int32:
        case ScalarType::UInt32:
        case ScalarType::Float32:
            return 4;
        case ScalarType::Int64:
        case ScalarType::UInt64:
        case ScalarType::Float64:
            return 8;
        default:
            return 0;
    }
}

// GLSL-style display name used in schema descriptions
constexpr std::string_view scalar_name(ScalarType t) {
    switch (t) {
        case ScalarType::Bool: return "bool";
        case ScalarType::Int8: return "sbyte";
        case ScalarType::UInt8: return "ubyte";
        case ScalarType::Int16: return "short";
        case ScalarType::UInt16: return "ushort";
        case ScalarType::Int32: return "int";
        case ScalarType::UInt32: return "uint";
        case ScalarType::Int64: return "int64";
        case ScalarType::UInt64: return "uint64";
        case ScalarType::Float16: return "half";
        case ScalarType::Float32: return "float";
        case ScalarType::Float64: return "double";
        default: return "unknown";
    }
}

constexpr bool is_decodable(ScalarType t) {
    return scalar_width(t) != 0;
}

constexpr bool is_float_type(ScalarType t) {
    return t == ScalarType::Float16 || t == ScalarType::Float32 || t == ScalarType::Float64;
}

constexpr bool is_signed_type(ScalarType t) {
    return t == ScalarType::Int8 || t == ScalarType::Int16 ||
           t == ScalarType::Int32 || t == ScalarType::Int64;
}

// Failure reasons reported through out-parameters and tool exit paths
enum class Error : uint32_t {
    None = 0,
    SchemaUnavailable,    // No reflection data describes the resource
    NoScalarFields,       // Schema exists but nothing in it can be decoded
    InsufficientData,     // Buffer shorter than the requested record
    PartialFieldDecode,   // Some fields of a record overran the buffer
    InvalidLayoutSpec,    // Layout text could not be parsed
    ReadFailed            // Collaborator could not supply bytes
};

constexpr const char* to_string(Error e) {
    switch (e) {
        case Error::None: return "none";
        case Error::SchemaUnavailable: return "schema unavailable";
        case Error::NoScalarFields: return "no decodable scalar fields";
        case Error::InsufficientData: return "insufficient data";
        case Error::PartialFieldDecode: return "partial field decode";
        case Error::InvalidLayoutSpec: return "invalid layout spec";
        case Error::ReadFailed: return "read failed";
    }
    return "unknown";
}

inline void set_error(Error* out, Error e) {
    if (out) *out = e;
}

// Configuration
struct Config {
    size_t max_changed_elements = 3;     // Per-record diff stops after this many changed records
    size_t max_byte_regions = 3;         // Changed byte runs reported by diff_bytes
    size_t region_display_bytes = 16;    // Hex bytes shown per region
    size_t max_word_diffs = 8;           // Word entries reported by diff_words
    size_t max_byte_diffs = 8;           // Byte entries reported by summarize_bytes
    double plausible_float_min = 1e-10;
    double plausible_float_max = 1e10;
    size_t max_read_bytes = 64 * 1024;   // Read size for whole-resource byte tracking
};

// Helper to map C++ types to ScalarType
template<typename T>
constexpr ScalarType scalar_type_of() {
    if constexpr (std::is_same_v<T, bool>) return ScalarType::Bool;
    else if constexpr (std::is_same_v<T, int8_t>) return ScalarType::Int8;
    else if constexpr (std::is_same_v<T, uint8_t>) return ScalarType::UInt8;
    else if constexpr (std::is_same_v<T, int16_t>) return ScalarType::Int16;
    else if constexpr (std::is_same_v<T, uint16_t>) return ScalarType::UInt16;
    else if constexpr (std::is_same_v<T, int32_t>) return ScalarType::Int32;
    else if constexpr (std::is_same_v<T, uint32_t>) return ScalarType::UInt32;
    else if constexpr (std::is_same_v<T, int64_t>) return ScalarType::Int64;
    else if constexpr (std::is_same_v<T, uint64_t>) return ScalarType::UInt64;
    else if constexpr (std::is_same_v<T, float>) return ScalarType::Float32;
    else if constexpr (std::is_same_v<T, double>) return ScalarType::Float64;
    else return ScalarType::Unknown;
}

} // namespace snapglass

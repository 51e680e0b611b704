#include <gtest/gtest.h>
#include <snapglass/decoder.hpp>

#include <cmath>
#include <cstring>
#include <limits>

using namespace snapglass;

namespace {

template<typename T>
void put(std::vector<uint8_t>& buf, size_t offset, T value) {
    if (buf.size() < offset + sizeof(T)) {
        buf.resize(offset + sizeof(T));
    }
    std::memcpy(buf.data() + offset, &value, sizeof(T));
}

Layout vec3_layout() {
    auto root = TypeNode::make_composite({
        {"v", 0, TypeNode::make_scalar(ScalarType::Float32, 1, 3)},
    }, 1, 12);
    return flatten(root);
}

} // anonymous namespace

TEST(DecoderTest, LittleEndianIntegers) {
    std::vector<uint8_t> bytes = {0x01, 0x02, 0x03, 0x04, 0xFF, 0xFF, 0x80, 0x00};

    EXPECT_EQ(decode_scalar(ScalarType::UInt32, bytes, 0), ScalarValue{uint64_t{0x04030201}});
    EXPECT_EQ(decode_scalar(ScalarType::UInt16, bytes, 2), ScalarValue{uint64_t{0x0403}});
    EXPECT_EQ(decode_scalar(ScalarType::Int16, bytes, 4), ScalarValue{int64_t{-1}});
    EXPECT_EQ(decode_scalar(ScalarType::Int8, bytes, 6), ScalarValue{int64_t{-128}});
    EXPECT_EQ(decode_scalar(ScalarType::UInt8, bytes, 6), ScalarValue{uint64_t{128}});
    EXPECT_EQ(decode_scalar(ScalarType::UInt64, bytes, 0), ScalarValue{uint64_t{0x0080FFFF04030201ull}});
}

TEST(DecoderTest, SignedWidths) {
    std::vector<uint8_t> bytes;
    put<int32_t>(bytes, 0, -123456);
    put<int64_t>(bytes, 4, -9876543210ll);

    EXPECT_EQ(decode_scalar(ScalarType::Int32, bytes, 0), ScalarValue{int64_t{-123456}});
    EXPECT_EQ(decode_scalar(ScalarType::Int64, bytes, 4), ScalarValue{int64_t{-9876543210ll}});
}

TEST(DecoderTest, BoolIsNonzeroWord) {
    std::vector<uint8_t> bytes = {0, 0, 0, 0, 0, 0, 0, 1};
    EXPECT_EQ(decode_scalar(ScalarType::Bool, bytes, 0), ScalarValue{false});
    EXPECT_EQ(decode_scalar(ScalarType::Bool, bytes, 4), ScalarValue{true});
}

TEST(DecoderTest, Floats) {
    std::vector<uint8_t> bytes;
    put<float>(bytes, 0, 1.5f);
    put<double>(bytes, 4, -0.25);

    EXPECT_EQ(decode_scalar(ScalarType::Float32, bytes, 0), ScalarValue{1.5});
    EXPECT_EQ(decode_scalar(ScalarType::Float64, bytes, 4), ScalarValue{-0.25});
}

TEST(DecoderTest, AnyBitPatternDecodes) {
    std::vector<uint8_t> bytes = {0xFF, 0xFF, 0xFF, 0xFF};
    auto v = decode_scalar(ScalarType::Float32, bytes, 0);
    ASSERT_TRUE(v.has_value());
    EXPECT_TRUE(std::isnan(std::get<double>(*v)));
}

TEST(DecoderTest, HalfFloat) {
    EXPECT_EQ(half_to_double(0x3C00), 1.0);
    EXPECT_EQ(half_to_double(0xC000), -2.0);
    EXPECT_EQ(half_to_double(0x3800), 0.5);
    EXPECT_EQ(half_to_double(0x0000), 0.0);
    EXPECT_EQ(half_to_double(0x0001), std::ldexp(1.0, -24));
    EXPECT_EQ(half_to_double(0x7BFF), 65504.0);
    EXPECT_EQ(half_to_double(0x7C00), std::numeric_limits<double>::infinity());
    EXPECT_EQ(half_to_double(0xFC00), -std::numeric_limits<double>::infinity());
    EXPECT_TRUE(std::isnan(half_to_double(0x7E00)));

    std::vector<uint8_t> bytes = {0x00, 0x3C};
    EXPECT_EQ(decode_scalar(ScalarType::Float16, bytes, 0), ScalarValue{1.0});
}

TEST(DecoderTest, OverrunFails) {
    std::vector<uint8_t> bytes = {1, 2, 3};
    EXPECT_FALSE(decode_scalar(ScalarType::UInt32, bytes, 0).has_value());
    EXPECT_FALSE(decode_scalar(ScalarType::UInt8, bytes, 3).has_value());
    EXPECT_FALSE(decode_scalar(ScalarType::UInt8, bytes, 100).has_value());
    EXPECT_FALSE(decode_scalar(ScalarType::Unknown, bytes, 0).has_value());
}

TEST(DecoderTest, DecodeInstance) {
    Layout layout = vec3_layout();
    std::vector<uint8_t> bytes(24, 0);
    put<float>(bytes, 12, 1.0f);
    put<float>(bytes, 16, 2.0f);
    put<float>(bytes, 20, 3.0f);

    Error err = Error::ReadFailed;
    auto record = decode_instance(bytes, layout, 1, &err);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(err, Error::None);
    EXPECT_TRUE(record->complete());
    ASSERT_EQ(record->values.size(), 3u);
    EXPECT_EQ(record->values[0], ScalarValue{1.0});
    EXPECT_EQ(record->values[2], ScalarValue{3.0});
}

TEST(DecoderTest, InsufficientData) {
    Layout layout = vec3_layout();
    std::vector<uint8_t> bytes(20, 0);

    Error err = Error::None;
    EXPECT_TRUE(decode_instance(bytes, layout, 0, &err).has_value());
    EXPECT_FALSE(decode_instance(bytes, layout, 1, &err).has_value());
    EXPECT_EQ(err, Error::InsufficientData);
}

TEST(DecoderTest, PartialFieldDecode) {
    Layout layout;
    layout.fields.push_back(FieldPath{{PathStep::member("a")}, 0, ScalarType::UInt32});
    layout.fields.push_back(FieldPath{{PathStep::member("b")}, 8, ScalarType::UInt32});
    layout.stride = 8;

    std::vector<uint8_t> bytes = {7, 0, 0, 0, 0, 0, 0, 0};

    Error err = Error::None;
    auto record = decode_instance(bytes, layout, 0, &err);
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(err, Error::PartialFieldDecode);
    EXPECT_EQ(record->failed_fields, 1u);
    EXPECT_EQ(record->values[0], ScalarValue{uint64_t{7}});
    EXPECT_FALSE(record->values[1].has_value());

    // The failed field is zero-filled so the shape does not depend on the buffer size
    auto nested = decode_nested(bytes, layout, 0);
    ASSERT_TRUE(nested.has_value());
    EXPECT_EQ(to_json(*nested), R"({"a":7,"b":0})");
}

TEST(DecoderTest, ShortBufferKeepsArrayShape) {
    auto item = TypeNode::make_composite({
        {"x", 0, TypeNode::make_scalar(ScalarType::UInt32)},
    }, 2, 4, "Item");
    auto wrapper = TypeNode::make_composite({{"items", 0, item}}, 1, 0, "Wrapper");
    Layout layout = flatten(wrapper);
    ASSERT_EQ(layout.stride, 4u);

    std::vector<uint8_t> bytes = {7, 0, 0, 0};

    Error err = Error::None;
    auto nested = decode_nested(bytes, layout, 0, &err);
    ASSERT_TRUE(nested.has_value());
    EXPECT_EQ(err, Error::PartialFieldDecode);
    EXPECT_EQ(to_json(*nested), R"({"items":[{"x":7},{"x":0}]})");
}

TEST(DecoderTest, DecodeNested) {
    Layout layout = vec3_layout();
    std::vector<uint8_t> bytes(12, 0);
    put<float>(bytes, 4, 2.0f);

    auto nested = decode_nested(bytes, layout, 0);
    ASSERT_TRUE(nested.has_value());
    EXPECT_EQ(to_json(*nested), R"({"v":[0.0,2.0,0.0]})");
}

TEST(DecoderTest, RoundTripLeafValues) {
    auto root = TypeNode::make_composite({
        {"id", 0, TypeNode::make_scalar(ScalarType::UInt32)},
        {"pos", 4, TypeNode::make_scalar(ScalarType::Float32, 1, 2)},
        {"m", 12, TypeNode::make_scalar(ScalarType::Int16, 2, 2)},
    });
    Layout layout = flatten(root);

    std::vector<uint8_t> bytes;
    put<uint32_t>(bytes, 0, 42);
    put<float>(bytes, 4, -1.5f);
    put<float>(bytes, 8, 8.0f);
    put<int16_t>(bytes, 12, -1);
    put<int16_t>(bytes, 14, 2);
    put<int16_t>(bytes, 16, -3);
    put<int16_t>(bytes, 18, 4);
    ASSERT_EQ(layout.stride, bytes.size());

    auto record = decode_instance(bytes, layout, 0);
    auto nested = decode_nested(bytes, layout, 0);
    ASSERT_TRUE(record.has_value());
    ASSERT_TRUE(nested.has_value());

    // Every leaf in the tree equals the decoded value at the same path
    for (size_t i = 0; i < layout.fields.size(); ++i) {
        const Value* node = &*nested;
        for (const auto& step : layout.fields[i].steps) {
            node = step.is_index ? &(*node)[static_cast<size_t>(step.index)] : node->find(step.key);
            ASSERT_NE(node, nullptr);
        }
        EXPECT_EQ(*node, Value(*record->values[i])) << layout.fields[i].name();
    }
}

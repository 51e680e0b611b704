#include <gtest/gtest.h>
#include <snapglass/nested.hpp>

using namespace snapglass;

namespace {

FieldPath field(const char* name, ScalarType type = ScalarType::Float32) {
    FieldPath f;
    f.steps = *parse_field_path(name);
    f.type = type;
    return f;
}

} // anonymous namespace

TEST(NestedTest, RebuildFromFields) {
    std::vector<FieldPath> fields = {field("pos[0]"), field("pos[1]"), field("id", ScalarType::UInt32)};
    std::vector<std::optional<ScalarValue>> values = {1.0, 2.0, uint64_t{9}};

    Value v = rebuild_nested(fields, values);
    EXPECT_EQ(to_json(v), R"({"id":9,"pos":[1.0,2.0]})");
}

TEST(NestedTest, RebuildFromFlatMap) {
    std::map<std::string, ScalarValue> flat = {
        {"a.b[0].c", uint64_t{1}},
        {"a.b[1].c", uint64_t{2}},
        {"a.flag", true},
    };

    Value v = rebuild_nested(flat);
    EXPECT_EQ(to_json(v), R"({"a":{"b":[{"c":1},{"c":2}],"flag":true}})");
}

TEST(NestedTest, HolesFilledWithZeroedSibling) {
    std::map<std::string, ScalarValue> flat = {
        {"a.b[0].c", uint64_t{1}},
        {"a.b[2].c", uint64_t{5}},
    };

    Value v = rebuild_nested(flat);
    EXPECT_EQ(to_json(v), R"({"a":{"b":[{"c":1},{"c":0},{"c":5}]}})");
}

TEST(NestedTest, MissingValueBecomesZero) {
    std::vector<FieldPath> fields = {field("v[0]"), field("v[1]"), field("v[2]")};
    std::vector<std::optional<ScalarValue>> values = {1.0, std::nullopt, 3.0};

    Value v = rebuild_nested(fields, values);
    EXPECT_EQ(to_json(v), R"({"v":[1.0,0.0,3.0]})");
}

TEST(NestedTest, MissingValuesKeepShape) {
    std::vector<FieldPath> fields = {
        field("items[0].x", ScalarType::Int32),
        field("items[1].x", ScalarType::Int32),
        field("flag", ScalarType::Bool),
        field("count", ScalarType::UInt16),
    };
    std::vector<std::optional<ScalarValue>> values = {int64_t{-2}, std::nullopt, std::nullopt, std::nullopt};

    Value v = rebuild_nested(fields, values);
    EXPECT_EQ(to_json(v), R"({"count":0,"flag":false,"items":[{"x":-2},{"x":0}]})");
}

TEST(NestedTest, MatrixRows) {
    std::vector<FieldPath> fields = {field("m[0][0]"), field("m[0][1]"), field("m[1][0]"), field("m[1][1]")};
    std::vector<std::optional<ScalarValue>> values = {1.0, 2.0, 3.0, 4.0};

    Value v = rebuild_nested(fields, values);
    EXPECT_EQ(to_json(v), R"({"m":[[1.0,2.0],[3.0,4.0]]})");
}

TEST(NestedTest, Deterministic) {
    std::vector<FieldPath> fields = {field("x.y[3]"), field("x.z"), field("x.y[0]")};
    std::vector<std::optional<ScalarValue>> values = {4.0, int64_t{-1}, 1.0};

    EXPECT_EQ(rebuild_nested(fields, values), rebuild_nested(fields, values));
}

TEST(NestedTest, EmptyInputGivesEmptyObject) {
    Value v = rebuild_nested(std::vector<FieldPath>{}, std::vector<std::optional<ScalarValue>>{});
    EXPECT_TRUE(v.is_object());
    EXPECT_EQ(v.size(), 0u);

    std::map<std::string, ScalarValue> bad = {{"a..b", 1.0}};
    EXPECT_EQ(to_json(rebuild_nested(bad)), "{}");
}

TEST(NestedTest, InsertConflict) {
    Value root;
    ASSERT_TRUE(insert_at_path(root, *parse_field_path("a"), Value(int64_t{1})));
    EXPECT_FALSE(insert_at_path(root, *parse_field_path("a[0]"), Value(int64_t{2})));
    EXPECT_FALSE(insert_at_path(root, *parse_field_path("a.b"), Value(int64_t{2})));

    ASSERT_TRUE(insert_at_path(root, *parse_field_path("c[1]"), Value(int64_t{3})));
    EXPECT_FALSE(insert_at_path(root, *parse_field_path("c.d"), Value(int64_t{4})));
    EXPECT_FALSE(insert_at_path(root, *parse_field_path("c"), Value(int64_t{5})));
}

TEST(NestedTest, ZeroedLike) {
    Value v = Value::object();
    v["f"] = 2.5;
    v["i"] = int64_t{-3};
    v["u"] = uint64_t{3};
    v["b"] = true;
    v["arr"] = Value::Array{Value(1.0), Value(2.0)};

    EXPECT_EQ(to_json(zeroed_like(v)), R"({"arr":[0.0,0.0],"b":false,"f":0.0,"i":0,"u":0})");
}

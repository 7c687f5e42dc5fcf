/**
 * @file test_patch.cpp
 * @brief Tests for patch decoding and encoding
 */

#include <gtest/gtest.h>
#include "treepatch/Patch.hpp"

using namespace treepatch;

// ============================================================================
// Operation names
// ============================================================================

TEST(PatchOp, NamesRoundTrip) {
    for (Op op : {Op::Add, Op::Replace, Op::Insert, Op::Remove, Op::Copy, Op::Move, Op::Test}) {
        auto parsed = parse_op(op_name(op));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, op);
    }
    EXPECT_FALSE(parse_op("merge").has_value());
    EXPECT_FALSE(parse_op("ADD").has_value());
}

// ============================================================================
// decode_patch
// ============================================================================

TEST(DecodePatch, FullAddPatch) {
    Patch p;
    Result r = decode_patch(Value::parse(
        R"({"op": "add", "path": "/a:3", "value": {"x": 1}, "fill": 0, "silent": true})"), p);
    ASSERT_TRUE(r.ok()) << r.message();
    EXPECT_EQ(p.op, Op::Add);
    EXPECT_EQ(p.path, "/a:3");
    ASSERT_TRUE(p.value.has_value());
    EXPECT_EQ((*p.value)["x"], 1);
    ASSERT_TRUE(p.fill.has_value());
    EXPECT_EQ(*p.fill, 0);
    EXPECT_TRUE(p.silent);
}

TEST(DecodePatch, MoveWithMode) {
    Patch p;
    Result r = decode_patch(Value::parse(
        R"({"op": "move", "from": "/a", "path": "/b", "mode": "insert"})"), p);
    ASSERT_TRUE(r.ok()) << r.message();
    EXPECT_EQ(p.op, Op::Move);
    ASSERT_TRUE(p.from.has_value());
    EXPECT_EQ(*p.from, "/a");
    EXPECT_EQ(p.mode, Op::Insert);
}

TEST(DecodePatch, TestDefaultsToStrict) {
    Patch p;
    ASSERT_TRUE(decode_patch(Value::parse(R"({"op": "test", "path": "/a", "value": 1})"), p).ok());
    EXPECT_TRUE(p.strict);
    ASSERT_TRUE(decode_patch(
        Value::parse(R"({"op": "test", "path": "/a", "value": 1, "strict": false})"), p).ok());
    EXPECT_FALSE(p.strict);
}

TEST(DecodePatch, NullValueIsPresent) {
    Patch p;
    ASSERT_TRUE(decode_patch(Value::parse(R"({"op": "add", "path": "/a", "value": null})"), p).ok());
    ASSERT_TRUE(p.value.has_value());
    EXPECT_TRUE(p.value->is_null());
}

TEST(DecodePatch, NotAnObject) {
    Patch p;
    Result r = decode_patch(Value::parse("[1]"), p);
    EXPECT_EQ(r.code(), 400);
    EXPECT_EQ(r.message(), "Malformed patch object");
}

TEST(DecodePatch, MissingOpOrPath) {
    Patch p;
    Result r = decode_patch(Value::parse(R"({"path": "/a"})"), p);
    EXPECT_EQ(r.code(), 400);
    EXPECT_EQ(r.message(), "Missing required property [op]");

    r = decode_patch(Value::parse(R"({"op": "remove"})"), p);
    EXPECT_EQ(r.code(), 400);
    EXPECT_EQ(r.message(), "Missing required property [path]");
}

TEST(DecodePatch, UnsupportedOperation) {
    Patch p;
    Result r = decode_patch(Value::parse(R"({"op": "merge", "path": "/a"})"), p);
    EXPECT_EQ(r.code(), 422);
    EXPECT_EQ(r.message(), "Unsupported operation");
}

TEST(DecodePatch, UnsupportedMode) {
    Patch p;
    Result r = decode_patch(
        Value::parse(R"({"op": "copy", "from": "/a", "path": "/b", "mode": "remove"})"), p);
    EXPECT_EQ(r.code(), 422);
}

TEST(DecodePatch, WrongTypes) {
    Patch p;
    EXPECT_EQ(decode_patch(Value::parse(R"({"op": "add", "path": 3, "value": 1})"), p).code(), 400);
    EXPECT_EQ(decode_patch(Value::parse(R"({"op": "copy", "path": "/a", "from": 1})"), p).code(), 400);
    EXPECT_EQ(decode_patch(Value::parse(R"({"op": "add", "path": "/a", "value": 1, "silent": "yes"})"), p).code(), 400);
}

// ============================================================================
// Encoding and constructors
// ============================================================================

TEST(PatchJson, NamedConstructorsEncode) {
    EXPECT_EQ(to_json(Patch::add("/a", 1)),
              Value::parse(R"({"op": "add", "path": "/a", "value": 1})"));
    EXPECT_EQ(to_json(Patch::move("/a", "/b")),
              Value::parse(R"({"op": "move", "path": "/b", "from": "/a"})"));
    EXPECT_EQ(to_json(Patch::test("/a", "1", false)),
              Value::parse(R"({"op": "test", "path": "/a", "value": "1", "strict": false})"));
}

TEST(PatchJson, EncodedPatchDecodesBack) {
    Patch original = Patch::copy("/src", "/dst");
    original.mode = Op::Replace;
    original.silent = true;

    Patch decoded;
    ASSERT_TRUE(decode_patch(to_json(original), decoded).ok());
    EXPECT_EQ(decoded.op, Op::Copy);
    EXPECT_EQ(*decoded.from, "/src");
    EXPECT_EQ(decoded.mode, Op::Replace);
    EXPECT_TRUE(decoded.silent);
}

TEST(PatchJson, WritesClassification) {
    EXPECT_TRUE(Patch::add("/a", 1).writes());
    EXPECT_TRUE(Patch::insert("/a", 1).writes());
    EXPECT_TRUE(Patch::copy("/a", "/b").writes());
    EXPECT_FALSE(Patch::remove("/a").writes());
    EXPECT_FALSE(Patch::test("/a", 1).writes());
}

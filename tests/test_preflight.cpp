/**
 * @file test_preflight.cpp
 * @brief Tests for preflight checks (GoogleTest)
 *
 * Tests cover:
 * - structural checks on path, from and value
 * - read/write/delete restrictions on path and from
 * - validators (pass, reject, misbehave, unresolvable)
 * - existence checks for replace and test
 * - recursive checks of nested values
 */

#include <gtest/gtest.h>
#include "treepatch/Engine.hpp"
#include "treepatch/Errors.hpp"

using namespace treepatch;

// ============================================================================
// Structure
// ============================================================================

class PreflightStructureTest : public ::testing::Test {
protected:
    Engine engine{Value::parse(R"({"a": 1})"), Value::array()};
};

TEST_F(PreflightStructureTest, InvalidPath) {
    Result r = engine.preflight(Patch::add("/a/", 1), "2");
    EXPECT_EQ(r.code(), 400);
    EXPECT_EQ(r.message().rfind("Patch 2: Invalid path [/a/]", 0), 0u) << r.message();
}

TEST_F(PreflightStructureTest, InvalidFrom) {
    Result r = engine.preflight(Patch::copy("/a:01", "/b"));
    EXPECT_EQ(r.code(), 400);
    EXPECT_NE(r.message().find("Invalid from [/a:01]"), std::string::npos);
}

TEST_F(PreflightStructureTest, MissingFrom) {
    Patch p = Patch::copy("/a", "/b");
    p.from.reset();
    Result r = engine.preflight(p);
    EXPECT_EQ(r.code(), 400);
    EXPECT_EQ(r.message(), "Patch 0: Missing required property [from]");
}

TEST_F(PreflightStructureTest, MissingValue) {
    for (Op op : {Op::Add, Op::Replace, Op::Insert, Op::Test}) {
        Patch p;
        p.op = op;
        p.path = "/a";
        EXPECT_EQ(engine.preflight(p).code(), 400) << op_name(op);
    }
    EXPECT_TRUE(engine.preflight(Patch::remove("/a")).ok());
}

TEST_F(PreflightStructureTest, DoesNotMutate) {
    ASSERT_TRUE(engine.preflight(Patch::add("/x/y", Value{{"z", 1}})).ok());
    EXPECT_EQ(engine.document(), Value::parse(R"({"a": 1})"));
}

// ============================================================================
// Restrictions
// ============================================================================

class RestrictionTest : public ::testing::Test {
protected:
    Engine engine{Value::parse(R"({"locked": {"v": 1}, "open": 2})"), Value::array()};
};

TEST_F(RestrictionTest, WriteRestrictionBlocksWrites) {
    engine.restrict("^/locked", "w");
    EXPECT_EQ(engine.preflight(Patch::add("/locked/v", 3)).code(), 403);
    EXPECT_EQ(engine.preflight(Patch::replace("/locked/v", 3)).code(), 403);
    EXPECT_EQ(engine.preflight(Patch::insert("/locked/w", 3)).code(), 403);
    EXPECT_EQ(engine.preflight(Patch::copy("/open", "/locked/w")).code(), 403);
    EXPECT_EQ(engine.preflight(Patch::move("/open", "/locked/w")).code(), 403);
}

TEST_F(RestrictionTest, WriteRestrictionAllowsRemoveAndTest) {
    engine.restrict("^/locked", "w");
    EXPECT_TRUE(engine.preflight(Patch::remove("/locked/v")).ok());
    EXPECT_TRUE(engine.preflight(Patch::test("/locked/v", 1)).ok());
}

TEST_F(RestrictionTest, MessageNamesThePath) {
    engine.restrict("^/locked", "w");
    Result r = engine.preflight(Patch::add("/locked/v", 3), "5");
    EXPECT_EQ(r.message(), "Patch 5: Writing to [/locked/v] not allowed");
}

TEST_F(RestrictionTest, DeleteRestriction) {
    engine.restrict("^/locked/v$", "d");
    Result r = engine.preflight(Patch::remove("/locked/v"));
    EXPECT_EQ(r.code(), 403);
    EXPECT_EQ(r.message(), "Patch 0: Removing [/locked/v] not allowed");
    // the parent can still be removed
    EXPECT_TRUE(engine.preflight(Patch::remove("/locked")).ok());
}

TEST_F(RestrictionTest, ReadRestriction) {
    engine.restrict("^/locked", "r");
    EXPECT_EQ(engine.preflight(Patch::test("/locked/v", 1)).code(), 403);
    EXPECT_EQ(engine.preflight(Patch::copy("/locked/v", "/x")).code(), 403);
    EXPECT_TRUE(engine.preflight(Patch::add("/locked/z", 1)).ok());
}

TEST_F(RestrictionTest, MoveNeedsDeleteOnSource) {
    engine.restrict("^/locked", "d");
    Result r = engine.preflight(Patch::move("/locked/v", "/x"));
    EXPECT_EQ(r.code(), 403);
    EXPECT_EQ(r.message(), "Patch 0: Removing [/locked/v] not allowed");
    EXPECT_TRUE(engine.preflight(Patch::copy("/locked/v", "/x")).ok());
}

TEST_F(RestrictionTest, MoveNeedsReadOnSource) {
    engine.restrict("^/locked", "r");
    Result r = engine.preflight(Patch::move("/locked/v", "/x"));
    EXPECT_EQ(r.code(), 403);
    EXPECT_EQ(r.message(), "Patch 0: Reading [/locked/v] not allowed");
}

TEST_F(RestrictionTest, UnrestrictedPathsPass) {
    engine.restrict("^/locked", "rwd");
    EXPECT_TRUE(engine.preflight(Patch::add("/open", 5)).ok());
    EXPECT_TRUE(engine.preflight(Patch::remove("/open")).ok());
}

TEST_F(RestrictionTest, BadRegistrationThrows) {
    EXPECT_THROW(engine.restrict("^/x", "rx"), RegistrationError);
    EXPECT_THROW(engine.restrict("(", "r"), RegistrationError);
}

// ============================================================================
// Nested values
// ============================================================================

TEST(PreflightNested, CompositeCannotBypassRestriction) {
    Engine engine(Value::object(), Value::array());
    engine.restrict("/secret", "w");

    Result r = engine.preflight(Patch::add("/x", Value::parse(R"({"secret": {"y": 1}})")));
    EXPECT_EQ(r.code(), 403);
    EXPECT_EQ(r.message(), "Patch 0/secret: Writing to [/x/secret] not allowed");
}

TEST(PreflightNested, SequenceChildrenUseIndexSeparator) {
    Engine engine(Value::object(), Value::array());
    engine.restrict("^/list:1$", "w");

    Result r = engine.preflight(Patch::add("/list", Value::parse("[1, 2, 3]")));
    EXPECT_EQ(r.code(), 403);
    EXPECT_EQ(r.message(), "Patch 0:1: Writing to [/list:1] not allowed");
}

TEST(PreflightNested, CopiedCompositeIsChecked) {
    Engine engine(Value::parse(R"({"src": {"secret": 1}})"), Value::array());
    engine.restrict("^/dst/secret", "w");
    EXPECT_EQ(engine.preflight(Patch::copy("/src", "/dst")).code(), 403);
    EXPECT_EQ(engine.preflight(Patch::move("/src", "/dst")).code(), 403);
}

TEST(PreflightNested, EscapedChildKeys) {
    Engine engine(Value::object(), Value::array());
    engine.restrict("^/x/a~1b$", "w");
    Result r = engine.preflight(Patch::add("/x", Value{{"a/b", 1}}));
    EXPECT_EQ(r.code(), 403);
}

TEST(PreflightNested, DeeplyNestedValueChecked) {
    Engine engine(Value::object(), Value::array());
    engine.restrict("/deny$", "w");
    Value v = Value::parse(R"({"a": [{"b": {"deny": 0}}]})");
    Result r = engine.preflight(Patch::add("/root", v));
    EXPECT_EQ(r.code(), 403);
    EXPECT_EQ(r.message(), "Patch 0/a:0/b/deny: Writing to [/root/a:0/b/deny] not allowed");
}

// ============================================================================
// Validators
// ============================================================================

namespace {

Value positive_numbers(const Value& v, const Value&) {
    if (!v.is_number()) return true;
    if (v.get<double>() > 0) return true;
    return "must be positive";
}

} // namespace

TEST(PreflightValidate, PassAndReject) {
    Engine engine(Value::object(), Value::array());
    engine.validate("^/n", positive_numbers);

    EXPECT_TRUE(engine.preflight(Patch::add("/n", 3)).ok());

    Result r = engine.preflight(Patch::add("/n", -1));
    EXPECT_EQ(r.code(), 403);
    EXPECT_EQ(r.message(), "Patch 0: [/n] failed validation: must be positive");
}

TEST(PreflightValidate, OptionsArePassed) {
    Engine engine(Value::object(), Value::array());
    engine.validate("^/s$", [](const Value& v, const Value& opts) -> Value {
        if (v.get<std::string>().size() <= opts["max"].get<std::size_t>()) return true;
        return "too long";
    }, Value{{"max", 3}});

    EXPECT_TRUE(engine.preflight(Patch::add("/s", "abc")).ok());
    EXPECT_EQ(engine.preflight(Patch::add("/s", "abcd")).code(), 403);
}

TEST(PreflightValidate, MisbehavingValidator) {
    Engine engine(Value::object(), Value::array());
    engine.validate("^/x", [](const Value&, const Value&) -> Value { return 42; });
    Result r = engine.preflight(Patch::add("/x", 1));
    EXPECT_EQ(r.code(), 422);
    EXPECT_EQ(r.message(), "Patch 0: [/x] validator error");

    Engine falsy(Value::object(), Value::array());
    falsy.validate("^/x", [](const Value&, const Value&) -> Value { return false; });
    EXPECT_EQ(falsy.preflight(Patch::add("/x", 1)).code(), 422);
}

TEST(PreflightValidate, ThrowingValidatorIsInternalError) {
    Engine engine(Value::object(), Value::array());
    engine.validate("^/x", [](const Value&, const Value&) -> Value {
        throw std::runtime_error("boom");
    });
    EXPECT_EQ(engine.preflight(Patch::add("/x", 1)).code(), 500);
}

TEST(PreflightValidate, CopyValidatesSourceValue) {
    Engine engine(Value::parse(R"({"neg": -5, "pos": 5})"), Value::array());
    engine.validate("^/target", positive_numbers);
    EXPECT_EQ(engine.preflight(Patch::copy("/neg", "/target")).code(), 403);
    EXPECT_TRUE(engine.preflight(Patch::copy("/pos", "/target")).ok());
    EXPECT_EQ(engine.preflight(Patch::move("/missing", "/target")).code(), 404);
}

TEST(PreflightValidate, NestedValuesAreValidated) {
    Engine engine(Value::object(), Value::array());
    engine.validate("/n$", positive_numbers);
    Result r = engine.preflight(Patch::add("/obj", Value::parse(R"({"n": -2})")));
    EXPECT_EQ(r.code(), 403);
}

TEST(PreflightValidate, UnknownNamedValidatorIsInternalError) {
    Engine engine(Value::object(), Value::array());
    engine.validate_named("^/x", "does_not_exist");
    Result r = engine.preflight(Patch::add("/x", 1));
    EXPECT_EQ(r.code(), 500);
}

TEST(PreflightValidate, NamedValidatorFromRegistry) {
    auto registry = std::make_shared<CallbackRegistry>();
    registry->add_validator("positive", positive_numbers);

    Engine engine(Value::object(), Value::array());
    engine.set_registry(registry);
    engine.validate_named("^/x", "positive");
    EXPECT_TRUE(engine.preflight(Patch::add("/x", 1)).ok());
    EXPECT_EQ(engine.preflight(Patch::add("/x", -1)).code(), 403);
}

TEST(PreflightValidate, EmptyCallableRejectedAtRegistration) {
    Engine engine(Value::object(), Value::array());
    EXPECT_THROW(engine.validate("^/x", ValidatorFn()), RegistrationError);
    EXPECT_THROW(engine.validate_named("^/x", ""), RegistrationError);
}

// ============================================================================
// Existence
// ============================================================================

TEST(PreflightExistence, ReplaceNeedsTarget) {
    Engine engine(Value::parse(R"({"a": 1})"), Value::array());
    Result r = engine.preflight(Patch::replace("/b", 2));
    EXPECT_EQ(r.code(), 404);
    EXPECT_EQ(r.message(), "Patch 0: [/b] not found");

    Patch silent = Patch::replace("/b", 2);
    silent.silent = true;
    EXPECT_TRUE(engine.preflight(silent).ok());
}

TEST(PreflightExistence, TestNeedsTarget) {
    Engine engine(Value::parse(R"({"a": 1})"), Value::array());
    EXPECT_EQ(engine.preflight(Patch::test("/b", 1)).code(), 404);
    EXPECT_EQ(engine.preflight(Patch::test("/a/deeper", 1)).code(), 422);
}

// ============================================================================
// Through process()
// ============================================================================

TEST(PreflightProcess, FailureStopsBeforeAnyMutation) {
    Engine engine = Engine::from_text("{}", R"([
        {"op": "add", "path": "/x", "value": {"secret": {"y": 1}}}
    ])");
    engine.restrict("/secret", "w");

    Result r = engine.process();
    EXPECT_EQ(r.code(), 403);
    EXPECT_TRUE(engine.document().empty());
}

/**
 * @file test_field_search.cpp
 * @brief Unit tests for recursive field search (GoogleTest)
 */

#include <gtest/gtest.h>
#include "deepcol/Accessor.hpp"
#include "deepcol/PathParser.hpp"
#include "GraphView.hpp"

#include <string>
#include <vector>

using namespace deepcol;
using test_support::GraphNode;
using test_support::GraphView;

namespace {

std::vector<std::string> paths_of(const Value& root, const Path& field) {
    std::vector<std::string> out;
    FieldSearch cursor = paths_to_field(root, field);
    while (auto m = cursor.next()) {
        out.push_back(format_path(m->path));
    }
    return out;
}

using Paths = std::vector<std::string>;

} // namespace

// ============================================================================
// Simple field
// ============================================================================

TEST(PathsToFieldTest, TopLevelKey) {
    EXPECT_EQ(paths_of(Value::parse(R"({"x": "value"})"), "x"), (Paths{"x"}));
}

TEST(PathsToFieldTest, NestedKey) {
    EXPECT_EQ(paths_of(Value::parse(R"({"x": {"y": "value"}})"), "y"), (Paths{"x.y"}));
}

TEST(PathsToFieldTest, NoMatch) {
    EXPECT_TRUE(paths_of(Value::parse(R"(["value"])"), "x").empty());
}

TEST(PathsToFieldTest, InsideSequences) {
    EXPECT_EQ(paths_of(Value::parse(R"([{"x": "value"}])"), "x"), (Paths{"[0].x"}));
    EXPECT_EQ(paths_of(Value::parse(R"({"x": ["a", "b", {"y": "value"}]})"), "y"),
              (Paths{"x[2].y"}));
}

TEST(PathsToFieldTest, KeepsDescendingAfterMatch) {
    Value data = Value::parse(R"([{"x": {"y": "value", "z": {"y": "asdf"}}}])");
    EXPECT_EQ(paths_of(data, "y"), (Paths{"[0].x.y", "[0].x.z.y"}));

    Value nested = Value::parse(R"({"y": {"y": 1}})");
    EXPECT_EQ(paths_of(nested, "y"), (Paths{"y", "y.y"}));
}

TEST(PathsToFieldTest, ScalarSequenceElementsEqualToField) {
    Value data = Value::parse(R"({"tags": ["x", "prod", "x"], "x": 1})");
    EXPECT_EQ(paths_of(data, "x"), (Paths{"tags[0]", "tags[2]", "x"}));
}

TEST(PathsToFieldTest, ScalarsAreNotSearched) {
    // A string containing the field is not a match
    Value data = Value::parse(R"({"a": "xyz", "b": [1, "y"]})");
    EXPECT_TRUE(paths_of(data, "x").empty());
}

TEST(PathsToFieldTest, DocumentOrder) {
    Value data = Value::parse(R"({"b": {"id": 2}, "a": [{"id": 3}, {"id": 4}], "id": 1})");
    EXPECT_EQ(paths_of(data, "id"), (Paths{"b.id", "a[0].id", "a[1].id", "id"}));
}

// ============================================================================
// Compound field
// ============================================================================

TEST(PathsToFieldTest, CompoundField) {
    Value data = Value::parse(R"([{"x": {"y": "value", "z": {"y": "asdf"}}}])");
    EXPECT_EQ(paths_of(data, Path::from_segments({"x", "y"})), (Paths{"[0].x.y"}));
}

TEST(PathsToFieldTest, CompoundMatchStopsDescent) {
    Value data = Value::parse(R"({"x": {"a": {"b": {"a": {"b": 1}}}}, "c": [{"a": {"b": 2}}]})");
    EXPECT_EQ(paths_of(data, "a.b"), (Paths{"x.a.b", "c[0].a.b"}));

    // A match at a container ends the search of that whole container
    Value at_root = Value::parse(R"({"a": {"b": 1}, "c": [{"a": {"b": 2}}]})");
    EXPECT_EQ(paths_of(at_root, "a.b"), (Paths{"a.b"}));
}

TEST(PathsToFieldTest, CompoundWithIndex) {
    Value data = Value::parse(R"({"p": {"xs": [5, 6]}, "q": {"xs": []}})");
    EXPECT_EQ(paths_of(data, "xs[-1]"), (Paths{"p.xs[-1]"}));
}

TEST(PathsToFieldTest, SingleSegmentListIsSimple) {
    Value data = Value::parse(R"({"x": {"y": "value"}})");
    EXPECT_EQ(paths_of(data, Path::from_segments({"y"})), (Paths{"x.y"}));
}

// ============================================================================
// Errors
// ============================================================================

TEST(PathsToFieldErrorTest, ScalarRootRejected) {
    const Value scalar = 5;
    EXPECT_THROW(paths_to_field(scalar, "x"), TypeMismatch);
}

TEST(PathsToFieldErrorTest, EmptyOrPatternFieldRejected) {
    Value data = {{"a", 1}};
    EXPECT_THROW(paths_to_field(data, Path()), InvalidPathSyntax);
    EXPECT_THROW(paths_to_field(data, "a.*"), InvalidPathSyntax);
}

TEST(PathsToFieldErrorTest, CycleDetected) {
    auto root = GraphNode::mapping();
    auto inner = GraphNode::mapping();
    root->add("inner", inner);
    inner->add("back", root);
    GraphView view(root);

    EXPECT_THROW(paths_to_field(view, "missing").collect(), CyclicStructure);
    inner->entries.clear();
}

// ============================================================================
// values_for_field / deduped_values_for_field
// ============================================================================

TEST(ValuesForFieldTest, ValuesInOrder) {
    Value data = Value::parse(R"([{"x": {"y": "value", "z": {"y": "value"}}, "y": {"1": 2}}])");
    EXPECT_EQ(values_for_field(data, "y"),
              (std::vector<Value>{"value", "value", Value::parse(R"({"1": 2})")}));
}

TEST(ValuesForFieldTest, Deduped) {
    Value data = Value::parse(R"([{"x": {"y": "v", "z": {"y": "v"}}, "y": {"1": 2}}])");
    EXPECT_EQ(deduped_values_for_field(data, "y"),
              (std::vector<Value>{"v", Value::parse(R"({"1": 2})")}));
}

TEST(ValuesForFieldTest, DedupedKeepsFirstOccurrence) {
    Value data = Value::parse(R"({"k": [
        {"f": "a"}, {"f": {"1": {"2": 4}}}, {"f": [4]}, {"f": {"1": {"2": 4}}},
        {"f": [4]}, {"f": 1}, {"f": 1}, {"f": "a"}, {"f": {"1": {"2": 7}}}
    ]})");
    EXPECT_EQ(deduped_values_for_field(data, "f"),
              (std::vector<Value>{"a", Value::parse(R"({"1": {"2": 4}})"),
                                  Value::parse("[4]"), 1,
                                  Value::parse(R"({"1": {"2": 7}})")}));
}

TEST(ValuesForFieldTest, ThroughGraphView) {
    GraphView view(GraphNode::from_value(Value::parse(R"({"a": {"id": 1}, "b": [{"id": 2}]})")));
    EXPECT_EQ(values_for_field(view, "id"), (std::vector<Value>{1, 2}));
}

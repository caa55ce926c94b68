/**
 * @file test_path_parser.cpp
 * @brief Unit tests for path text parsing and formatting (GoogleTest)
 *
 * Tests cover:
 * - keys, bracketed indices, wildcards and slices
 * - escapes, quoted bracket keys and custom delimiters
 * - rejection of malformed paths with an offset
 * - format_path() producing text that parses back to the same steps
 * - Path::from_segments() bypassing the grammar
 */

#include <gtest/gtest.h>
#include "deepcol/PathParser.hpp"
#include "deepcol/Errors.hpp"

using namespace deepcol;

// ============================================================================
// parse_path - well-formed paths
// ============================================================================

TEST(ParsePathTest, EmptyTextIsRoot) {
    Path p = parse_path("");
    EXPECT_TRUE(p.empty());
    EXPECT_EQ(p.size(), 0u);
}

TEST(ParsePathTest, DottedKeys) {
    Path p = parse_path("a.b.c");
    ASSERT_EQ(p.size(), 3u);
    EXPECT_EQ(p[0], Step::of_key("a"));
    EXPECT_EQ(p[1], Step::of_key("b"));
    EXPECT_EQ(p[2], Step::of_key("c"));
}

TEST(ParsePathTest, BracketedIndices) {
    Path p = parse_path("servers[0].hosts[-1]");
    ASSERT_EQ(p.size(), 4u);
    EXPECT_EQ(p[0], Step::of_key("servers"));
    EXPECT_EQ(p[1], Step::of_index(0));
    EXPECT_EQ(p[2], Step::of_key("hosts"));
    EXPECT_EQ(p[3], Step::of_index(-1));
}

TEST(ParsePathTest, LeadingBracket) {
    Path p = parse_path("[2][3].x");
    ASSERT_EQ(p.size(), 3u);
    EXPECT_EQ(p[0], Step::of_index(2));
    EXPECT_EQ(p[1], Step::of_index(3));
    EXPECT_EQ(p[2], Step::of_key("x"));
}

TEST(ParsePathTest, SignedIndex) {
    EXPECT_EQ(parse_path("a[+4]")[1], Step::of_index(4));
}

TEST(ParsePathTest, DigitSegmentIsKey) {
    Path p = parse_path("a.0");
    ASSERT_EQ(p.size(), 2u);
    EXPECT_TRUE(p[1].is_key());
    EXPECT_EQ(p[1].key(), "0");
}

TEST(ParsePathTest, Wildcards) {
    Path p = parse_path("a.*.b[*]");
    ASSERT_EQ(p.size(), 4u);
    EXPECT_EQ(p[1].kind(), StepKind::Wildcard);
    EXPECT_EQ(p[3].kind(), StepKind::Wildcard);
    EXPECT_TRUE(p.has_pattern());
}

TEST(ParsePathTest, StarInsideKeyIsLiteral) {
    Path p = parse_path("a*.b*c");
    EXPECT_EQ(p[0], Step::of_key("a*"));
    EXPECT_EQ(p[1], Step::of_key("b*c"));
    EXPECT_FALSE(p.has_pattern());
}

TEST(ParsePathTest, Slices) {
    Path p = parse_path("a[1:4][::2][-2:][:3:-1]");
    ASSERT_EQ(p.size(), 5u);
    EXPECT_EQ(p[1], Step::of_slice(1, 4));
    EXPECT_EQ(p[2], Step::of_slice(std::nullopt, std::nullopt, 2));
    EXPECT_EQ(p[3], Step::of_slice(-2, std::nullopt));
    EXPECT_EQ(p[4], Step::of_slice(std::nullopt, 3, -1));
}

TEST(ParsePathTest, EscapedDelimiterInKey) {
    Path p = parse_path("a\\.b.c");
    ASSERT_EQ(p.size(), 2u);
    EXPECT_EQ(p[0], Step::of_key("a.b"));
    EXPECT_EQ(p[1], Step::of_key("c"));
}

TEST(ParsePathTest, EscapedSpecialCharacters) {
    EXPECT_EQ(parse_path("\\*")[0], Step::of_key("*"));
    EXPECT_EQ(parse_path("x\\[0\\]")[0], Step::of_key("x[0]"));
    EXPECT_EQ(parse_path("back\\\\slash")[0], Step::of_key("back\\slash"));
}

TEST(ParsePathTest, QuotedBracketKeys) {
    EXPECT_EQ(parse_path("a[\"\"]"), Path::from_segments({"a", ""}));
    EXPECT_EQ(parse_path("[\"\"].x"), Path::from_segments({"", "x"}));
    EXPECT_EQ(parse_path("[\"x.y\"][0]"), Path::from_segments({"x.y", 0}));
    EXPECT_EQ(parse_path("[\"say \\\"hi\\\"\"]"), Path::from_segments({"say \"hi\""}));

    // Quoted text is always a literal key
    Path star = parse_path("a[\"*\"]");
    EXPECT_EQ(star[1], Step::of_key("*"));
    EXPECT_FALSE(star.has_pattern());
}

TEST(ParsePathTest, CustomDelimiter) {
    Path p = parse_path("etc/hosts.allow[0]", '/');
    ASSERT_EQ(p.size(), 3u);
    EXPECT_EQ(p[0], Step::of_key("etc"));
    EXPECT_EQ(p[1], Step::of_key("hosts.allow"));
    EXPECT_EQ(p[2], Step::of_index(0));
}

TEST(ParsePathTest, Deterministic) {
    EXPECT_EQ(parse_path("a.b[3].*"), parse_path("a.b[3].*"));
}

// ============================================================================
// parse_path - malformed paths
// ============================================================================

TEST(ParsePathErrorTest, NonIntegerIndex) {
    EXPECT_THROW(parse_path("a[x]"), InvalidPathSyntax);
}

TEST(ParsePathErrorTest, ReportsOffsetAndText) {
    try {
        parse_path("abc[1x]");
        FAIL() << "expected InvalidPathSyntax";
    } catch (const InvalidPathSyntax& e) {
        EXPECT_EQ(e.path(), "abc[1x]");
        EXPECT_EQ(e.position(), 5u);
        EXPECT_FALSE(e.reason().empty());
    }
}

TEST(ParsePathErrorTest, EmptySegments) {
    EXPECT_THROW(parse_path(".a"), InvalidPathSyntax);
    EXPECT_THROW(parse_path("a."), InvalidPathSyntax);
    EXPECT_THROW(parse_path("a..b"), InvalidPathSyntax);
    EXPECT_THROW(parse_path("a.[0]"), InvalidPathSyntax);
}

TEST(ParsePathErrorTest, BadBrackets) {
    EXPECT_THROW(parse_path("a[]"), InvalidPathSyntax);
    EXPECT_THROW(parse_path("a[0"), InvalidPathSyntax);
    EXPECT_THROW(parse_path("a]"), InvalidPathSyntax);
    EXPECT_THROW(parse_path("a[ 0]"), InvalidPathSyntax);
    EXPECT_THROW(parse_path("a[-]"), InvalidPathSyntax);
    EXPECT_THROW(parse_path("a[0]b"), InvalidPathSyntax);
}

TEST(ParsePathErrorTest, BadSlices) {
    EXPECT_THROW(parse_path("a[1:2:0]"), InvalidPathSyntax);
    EXPECT_THROW(parse_path("a[1:2:3:4]"), InvalidPathSyntax);
    EXPECT_THROW(parse_path("a[1:x]"), InvalidPathSyntax);
}

TEST(ParsePathErrorTest, IndexOverflow) {
    EXPECT_THROW(parse_path("a[99999999999999999999]"), InvalidPathSyntax);
}

TEST(ParsePathErrorTest, DanglingEscape) {
    EXPECT_THROW(parse_path("a\\"), InvalidPathSyntax);
}

TEST(ParsePathErrorTest, BadQuotedKeys) {
    EXPECT_THROW(parse_path("a[\"x"), InvalidPathSyntax);
    EXPECT_THROW(parse_path("a[\"x\""), InvalidPathSyntax);
    EXPECT_THROW(parse_path("a[\"x\"y]"), InvalidPathSyntax);
    EXPECT_THROW(parse_path("a[\"x\\"), InvalidPathSyntax);
    EXPECT_THROW(parse_path("a.[\"x\"]"), InvalidPathSyntax);

    try {
        parse_path("a[\"open");
        FAIL() << "expected InvalidPathSyntax";
    } catch (const InvalidPathSyntax& e) {
        EXPECT_EQ(e.position(), 1u);
    }
}

TEST(ParsePathErrorTest, ReservedDelimiter) {
    EXPECT_THROW(parse_path("a", '['), InvalidPathSyntax);
    EXPECT_THROW(parse_path("a", '*'), InvalidPathSyntax);
    EXPECT_THROW(parse_path("a", '\\'), InvalidPathSyntax);
}

// ============================================================================
// format_path
// ============================================================================

TEST(FormatPathTest, Canonical) {
    EXPECT_EQ(format_path(parse_path("a[0].x")), "a[0].x");
    EXPECT_EQ(format_path(parse_path("[1].a.*[2:]")), "[1].a.*[2:]");
    EXPECT_EQ(format_path(Path()), "");
}

TEST(FormatPathTest, EscapesKeys) {
    Path p = Path::from_segments({"a.b", "*", "c[0]"});
    EXPECT_EQ(format_path(p), "a\\.b.\\*.c\\[0\\]");
}

TEST(FormatPathTest, RoundTrip) {
    const std::vector<Path> paths = {
        Path::from_segments({"a.b", 3, "*", "back\\slash", -1}),
        parse_path("x.*[1:5:2][*].y"),
        parse_path("[0][::-1]"),
    };
    for (const auto& p : paths) {
        EXPECT_EQ(parse_path(format_path(p)), p) << format_path(p);
    }
}

TEST(FormatPathTest, EmptyKeys) {
    EXPECT_EQ(format_path(Path::from_segments({"a", ""})), "a[\"\"]");
    EXPECT_EQ(format_path(Path::from_segments({"", "x", 0})), "[\"\"].x[0]");
    EXPECT_EQ(format_path(Path::from_segments({""})), "[\"\"]");

    const std::vector<Path> paths = {
        Path::from_segments({"a", ""}),
        Path::from_segments({""}),
        Path::from_segments({"", ""}),
        Path::from_segments({"", 2, "", "b"}),
    };
    for (const auto& p : paths) {
        EXPECT_EQ(parse_path(format_path(p)), p) << format_path(p);
        EXPECT_EQ(parse_path(format_path(p, '/'), '/'), p) << format_path(p, '/');
    }
}

TEST(FormatPathTest, RoundTripCustomDelimiter) {
    Path p = Path::from_segments({"a/b", "c.d", 2});
    EXPECT_EQ(parse_path(format_path(p, '/'), '/'), p);
}

// ============================================================================
// Path construction
// ============================================================================

TEST(PathTest, FromSegmentsKeepsKeysLiteral) {
    Path p = Path::from_segments({"servers", 0, "*", ""});
    ASSERT_EQ(p.size(), 4u);
    EXPECT_EQ(p[0], Step::of_key("servers"));
    EXPECT_EQ(p[1], Step::of_index(0));
    EXPECT_EQ(p[2], Step::of_key("*"));
    EXPECT_EQ(p[3], Step::of_key(""));
    EXPECT_FALSE(p.has_pattern());
}

TEST(PathTest, ImplicitFromText) {
    Path p = "a.b[1]";
    EXPECT_EQ(p, parse_path("a.b[1]"));
    EXPECT_EQ(p.to_string(), "a.b[1]");
}

TEST(PathTest, ChildConcatPrefix) {
    Path p = "a.b";
    EXPECT_EQ(p.child(Step::of_index(2)), parse_path("a.b[2]"));
    EXPECT_EQ(p.concat("c.d"), parse_path("a.b.c.d"));
    EXPECT_EQ(parse_path("a.b.c").prefix(2), p);
    EXPECT_EQ(p.prefix(10), p);
}

TEST(StepTest, ToString) {
    EXPECT_EQ(Step::of_key("host").to_string(), "host");
    EXPECT_EQ(Step::of_index(3).to_string(), "[3]");
    EXPECT_EQ(Step::wildcard().to_string(), "*");
    EXPECT_EQ(Step::of_slice(1, 4, 2).to_string(), "[1:4:2]");
    EXPECT_EQ(Step::of_slice(std::nullopt, std::nullopt).to_string(), "[:]");
}

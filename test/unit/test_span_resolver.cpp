// test/unit/test_span_resolver.cpp
// -----------------------------------------------------------
// Overlap resolution between model-origin and pattern-origin spans.

#include <gtest/gtest.h>

#include <string>
#include <unordered_set>
#include <vector>

#include "core/span.hpp"
#include "core/span_resolver.hpp"
#include "core/redactor.hpp"

namespace {

using piiguard::core::OverlapPolicy;
using piiguard::core::PiiTypeFilter;
using piiguard::core::ResolvedSpanSet;
using piiguard::core::Span;
using piiguard::core::SpanResolver;
using piiguard::core::SpanSource;

Span makeSpan(std::size_t start, std::size_t end, const std::string& label, SpanSource source,
              std::size_t order = 0) {
    Span s;
    s.start = start;
    s.end = end;
    s.label = label;
    s.source = source;
    s.replacementToken = "[" + label + "]";
    s.detectorOrder = order;
    return s;
}

void expectDisjointAndSorted(const ResolvedSpanSet& set) {
    for (std::size_t i = 1; i < set.size(); ++i) {
        EXPECT_LE(set[i - 1].end, set[i].start) << "spans " << (i - 1) << " and " << i << " overlap";
    }
}

TEST(SpanResolverTest, EmptyInputsGiveEmptySet) {
    SpanResolver resolver;
    auto set = resolver.resolve({}, {}, std::nullopt);
    EXPECT_TRUE(set.empty());
}

TEST(SpanResolverTest, DisjointSpansAreKeptAndSortedByStart) {
    SpanResolver resolver;
    std::vector<Span> model = {makeSpan(20, 25, "PERSON", SpanSource::Model)};
    std::vector<Span> patterns = {makeSpan(30, 40, "EMAIL", SpanSource::Pattern),
                                  makeSpan(0, 5, "PHONE", SpanSource::Pattern)};
    auto set = resolver.resolve(model, patterns, std::nullopt);
    ASSERT_EQ(set.size(), 3u);
    EXPECT_EQ(set[0].label, "PHONE");
    EXPECT_EQ(set[1].label, "PERSON");
    EXPECT_EQ(set[2].label, "EMAIL");
    expectDisjointAndSorted(set);
}

TEST(SpanResolverTest, ModelWinsOverlapByDefault) {
    SpanResolver resolver;
    std::vector<Span> model = {makeSpan(10, 20, "PERSON", SpanSource::Model)};
    std::vector<Span> patterns = {makeSpan(5, 30, "EMAIL", SpanSource::Pattern)};
    auto set = resolver.resolve(model, patterns, std::nullopt);
    ASSERT_EQ(set.size(), 1u);
    EXPECT_EQ(set[0].label, "PERSON");
    EXPECT_EQ(set[0].source, SpanSource::Model);
}

TEST(SpanResolverTest, PatternWinsPolicyInvertsPriority) {
    SpanResolver resolver(OverlapPolicy::PatternWins);
    std::vector<Span> model = {makeSpan(10, 20, "PERSON", SpanSource::Model)};
    std::vector<Span> patterns = {makeSpan(5, 30, "EMAIL", SpanSource::Pattern)};
    auto set = resolver.resolve(model, patterns, std::nullopt);
    ASSERT_EQ(set.size(), 1u);
    EXPECT_EQ(set[0].label, "EMAIL");
}

TEST(SpanResolverTest, EqualPriorityPrefersEarlierStartThenLongerSpan) {
    SpanResolver resolver;
    std::vector<Span> patterns = {makeSpan(4, 12, "B", SpanSource::Pattern, 1),
                                  makeSpan(2, 6, "A", SpanSource::Pattern, 0)};
    auto set = resolver.resolve({}, patterns, std::nullopt);
    ASSERT_EQ(set.size(), 1u);
    EXPECT_EQ(set[0].label, "A");

    std::vector<Span> sameStart = {makeSpan(0, 4, "SHORT", SpanSource::Model),
                                   makeSpan(0, 9, "LONG", SpanSource::Model)};
    set = resolver.resolve(sameStart, {}, std::nullopt);
    ASSERT_EQ(set.size(), 1u);
    EXPECT_EQ(set[0].label, "LONG");
}

TEST(SpanResolverTest, IdenticalRangesFallBackToDetectorOrder) {
    SpanResolver resolver;
    std::vector<Span> patterns = {makeSpan(0, 11, "SSN", SpanSource::Pattern, 2),
                                  makeSpan(0, 11, "PHONE", SpanSource::Pattern, 1)};
    auto set = resolver.resolve({}, patterns, std::nullopt);
    ASSERT_EQ(set.size(), 1u);
    EXPECT_EQ(set[0].label, "PHONE");
}

TEST(SpanResolverTest, LosingSpanDoesNotSuppressThirdSpan) {
    // Pattern A [0,10) beats B [5,8) on start, but loses to model C [9,12).
    // B overlaps only A, so it must survive once A is gone.
    SpanResolver resolver;
    std::vector<Span> model = {makeSpan(9, 12, "C", SpanSource::Model)};
    std::vector<Span> patterns = {makeSpan(0, 10, "A", SpanSource::Pattern),
                                  makeSpan(5, 8, "B", SpanSource::Pattern)};
    auto set = resolver.resolve(model, patterns, std::nullopt);
    ASSERT_EQ(set.size(), 2u);
    EXPECT_EQ(set[0].label, "B");
    EXPECT_EQ(set[1].label, "C");
}

TEST(SpanResolverTest, AdjacentSpansDoNotOverlap) {
    SpanResolver resolver;
    std::vector<Span> patterns = {makeSpan(0, 5, "A", SpanSource::Pattern),
                                  makeSpan(5, 10, "B", SpanSource::Pattern)};
    auto set = resolver.resolve({}, patterns, std::nullopt);
    EXPECT_EQ(set.size(), 2u);
}

TEST(SpanResolverTest, FilterRemovesUnrequestedLabelsBeforeResolution) {
    SpanResolver resolver;
    std::vector<Span> model = {makeSpan(0, 8, "PERSON", SpanSource::Model),
                               makeSpan(10, 14, "ORG", SpanSource::Model)};
    std::vector<Span> patterns = {makeSpan(9, 13, "PHONE", SpanSource::Pattern)};
    PiiTypeFilter onlyPhone = std::unordered_set<std::string>{"PHONE"};
    auto set = resolver.resolve(model, patterns, onlyPhone);
    ASSERT_EQ(set.size(), 1u);
    EXPECT_EQ(set[0].label, "PHONE");
}

TEST(SpanResolverTest, DenseOverlapsAlwaysYieldDisjointSet) {
    SpanResolver resolver;
    std::vector<Span> model;
    std::vector<Span> patterns;
    for (std::size_t i = 0; i < 40; ++i) {
        model.push_back(makeSpan(i * 3, i * 3 + 7, "M", SpanSource::Model));
        patterns.push_back(makeSpan(i * 2, i * 2 + 5, "P", SpanSource::Pattern, i % 3));
    }
    auto set = resolver.resolve(model, patterns, std::nullopt);
    EXPECT_FALSE(set.empty());
    expectDisjointAndSorted(set);
}

TEST(SpanResolverTest, ResolvedSpansKeepOriginalOffsets) {
    SpanResolver resolver;
    std::vector<Span> patterns = {makeSpan(17, 29, "EMAIL", SpanSource::Pattern)};
    auto set = resolver.resolve({}, patterns, std::nullopt);
    ASSERT_EQ(set.size(), 1u);
    EXPECT_EQ(set[0].start, 17u);
    EXPECT_EQ(set[0].end, 29u);
}

TEST(SpanResolverTest, ExtendKeepsBaseAndAddsOnlyFreeSpans) {
    SpanResolver resolver;
    auto base = resolver.resolve({makeSpan(0, 5, "PERSON", SpanSource::Model)},
                                 {makeSpan(10, 15, "EMAIL", SpanSource::Pattern)}, std::nullopt);
    ASSERT_EQ(base.size(), 2u);

    auto set = resolver.extend(base, {
        makeSpan(3, 8, "EMAIL", SpanSource::Pattern),
        makeSpan(5, 10, "PHONE", SpanSource::Pattern, 1),
        makeSpan(20, 22, "EMAIL", SpanSource::Pattern),
        makeSpan(20, 25, "EMAIL", SpanSource::Pattern),
        makeSpan(24, 30, "PHONE", SpanSource::Pattern, 1),
        makeSpan(40, 40, "EMAIL", SpanSource::Pattern),
    });

    ASSERT_EQ(set.size(), 4u);
    expectDisjointAndSorted(set);
    EXPECT_EQ(set[0].label, "PERSON");
    EXPECT_EQ(set[1].start, 5u);
    EXPECT_EQ(set[1].label, "PHONE");
    EXPECT_EQ(set[2].start, 10u);
    EXPECT_EQ(set[3].start, 20u);
    EXPECT_EQ(set[3].end, 25u);
}

} // anonymous namespace

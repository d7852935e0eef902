/**
 * @file test_candidates.cpp
 * @brief Tests for the priority-ordered candidate list builder.
 */

#include <gtest/gtest.h>

#include "skufall/provision/candidate.hpp"

using skufall::provision::Candidate;
using skufall::provision::CandidateList;
using skufall::provision::CandidateSpec;
using skufall::provision::build_candidates;
using skufall::provision::check_candidates;
using skufall::provision::join_ids;

/**
 * @test Builder_PrimaryOnly
 * @brief No fallbacks configured → exactly one candidate at rank 1.
 */
TEST(CandidateBuilder, Builder_PrimaryOnly) {
  auto list = build_candidates("Standard_E16s_v5");
  ASSERT_TRUE(list);
  ASSERT_EQ(list->size(), 1u);
  EXPECT_EQ((*list)[0], (Candidate{"Standard_E16s_v5", 1}));
}

TEST(CandidateBuilder, Builder_FullList_FixedOrder) {
  auto list = build_candidates("A", "B", "C");
  ASSERT_TRUE(list);
  const CandidateList expected{{"A", 1}, {"B", 2}, {"C", 3}};
  EXPECT_EQ(*list, expected);
}

TEST(CandidateBuilder, Builder_PrimaryAndSecondary) {
  auto list = build_candidates("A", "B");
  ASSERT_TRUE(list);
  const CandidateList expected{{"A", 1}, {"B", 2}};
  EXPECT_EQ(*list, expected);
}

/**
 * @test Builder_EmptySecondary_IsOmitted
 * @brief Empty fallbacks are skipped, not attempted; the tertiary keeps its slot rank.
 */
TEST(CandidateBuilder, Builder_EmptySecondary_IsOmitted) {
  auto list = build_candidates("A", "", "C");
  ASSERT_TRUE(list);
  const CandidateList expected{{"A", 1}, {"C", 3}};
  EXPECT_EQ(*list, expected);
}

TEST(CandidateBuilder, Builder_LengthIsOnePlusNonEmptyFallbacks) {
  struct Case { const char* s; const char* t; std::size_t n; };
  const Case cases[] = {{"", "", 1}, {"B", "", 2}, {"", "C", 2}, {"B", "C", 3}};
  for (const auto& c : cases) {
    auto list = build_candidates("A", c.s, c.t);
    ASSERT_TRUE(list);
    EXPECT_EQ(list->size(), c.n) << "secondary='" << c.s << "' tertiary='" << c.t << "'";
    EXPECT_EQ(list->front().id, "A");
  }
}

/**
 * @test Builder_EmptyPrimary_IsConfigurationError
 * @brief The only validation the builder performs.
 */
TEST(CandidateBuilder, Builder_EmptyPrimary_IsConfigurationError) {
  auto list = build_candidates("", "B", "C");
  ASSERT_FALSE(list);
  EXPECT_EQ(list.error().field, "sku-primary");
}

TEST(CandidateBuilder, Builder_RepeatedFallback_IsDropped) {
  auto list = build_candidates("A", "A", "B");
  ASSERT_TRUE(list);
  const CandidateList expected{{"A", 1}, {"B", 3}};
  EXPECT_EQ(*list, expected);

  auto same = build_candidates("A", "B", "B");
  ASSERT_TRUE(same);
  EXPECT_EQ(same->size(), 2u);
}

TEST(CandidateBuilder, Builder_SpecOverload_MatchesStrings) {
  const CandidateSpec spec{"A", "", "C"};
  EXPECT_EQ(*build_candidates(spec), *build_candidates("A", "", "C"));
}

// --------------------------- invariant checks ------------------------------

TEST(CandidateBuilder, Check_AcceptsBuiltLists) {
  auto list = build_candidates("A", "B", "C");
  ASSERT_TRUE(list);
  auto n = check_candidates(*list);
  ASSERT_TRUE(n);
  EXPECT_EQ(*n, 3u);
}

TEST(CandidateBuilder, Check_RejectsHandBuiltViolations) {
  EXPECT_FALSE(check_candidates(CandidateList{}));
  EXPECT_FALSE(check_candidates(CandidateList{{"", 1}}));
  EXPECT_FALSE(check_candidates(CandidateList{{"A", 2}, {"B", 1}}));
  EXPECT_FALSE(check_candidates(CandidateList{{"A", 1}, {"B", 1}}));
  EXPECT_FALSE(check_candidates(CandidateList{{"A", 1}, {"A", 2}}));
  EXPECT_FALSE(check_candidates(CandidateList{{"A", 1}, {"", 2}}));
}

TEST(CandidateBuilder, JoinIds_SpaceSeparated) {
  EXPECT_EQ(join_ids(CandidateList{{"A", 1}, {"B", 2}, {"C", 3}}), "A B C");
  EXPECT_EQ(join_ids(CandidateList{}), "");
}

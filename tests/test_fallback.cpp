/**
 * @file test_fallback.cpp
 * @brief Tests for the ordered fallback executor.
 *
 * Validates:
 *  - First success wins; later candidates are never invoked
 *  - Any failure falls through to the next candidate, diagnostics kept verbatim
 *  - Exhaustion carries one log entry per candidate, in order
 *  - Configuration errors are raised before any invocation
 *  - Same outcome sequence → same result (determinism)
 */

#include <gtest/gtest.h>

#include "skufall/provision/candidate.hpp"
#include "skufall/provision/fallback_executor.hpp"
#include "test_support.hpp"

using skufall::obs::AttemptPhase;
using skufall::provision::AttemptOutcome;
using skufall::provision::Candidate;
using skufall::provision::CandidateList;
using skufall::provision::EngineErrc;
using skufall::provision::FailureClass;
using skufall::provision::FallbackExecutor;
using skufall::provision::RunState;
using skufall::provision::build_candidates;
using skufall::testing::RecordingObserver;
using skufall::testing::ScriptedProvisioner;
using skufall::testing::fail;
using skufall::testing::ok;
using skufall::testing::sample_pool;

static CandidateList abc() { return *build_candidates("A", "B", "C"); }

// --------------------------- success paths ---------------------------------

/**
 * @test Run_PrimarySucceeds_NoFallbackInvoked
 * @brief One attempt, Provisioned(primary), fallbacks untouched.
 */
TEST(FallbackExecutor, Run_PrimarySucceeds_NoFallbackInvoked) {
  ScriptedProvisioner prov({ok("created A")});
  FallbackExecutor exec(prov);

  auto r = exec.run(abc(), sample_pool());
  ASSERT_TRUE(r);
  EXPECT_EQ(r->candidate, (Candidate{"A", 1}));
  EXPECT_EQ(r->output, "created A");
  ASSERT_EQ(r->attempts.size(), 1u);
  EXPECT_TRUE(r->attempts[0].outcome.succeeded());
  EXPECT_EQ(prov.calls(), 1u);
  EXPECT_EQ(exec.state(), RunState::Provisioned);
}

/**
 * @test Run_PrimaryFails_SecondarySucceeds
 * @brief A fails "capacity", B succeeds "ok" → Provisioned(B, "ok"), log [A:F, B:S].
 */
TEST(FallbackExecutor, Run_PrimaryFails_SecondarySucceeds) {
  ScriptedProvisioner prov({fail("capacity"), ok("ok")});
  FallbackExecutor exec(prov);

  auto r = exec.run(abc(), sample_pool());
  ASSERT_TRUE(r);
  EXPECT_EQ(r->candidate.id, "B");
  EXPECT_EQ(r->output, "ok");

  ASSERT_EQ(r->attempts.size(), 2u);
  EXPECT_EQ(r->attempts[0].candidate.id, "A");
  EXPECT_EQ(r->attempts[0].outcome, AttemptOutcome::failure("capacity"));
  EXPECT_EQ(r->attempts[1].candidate.id, "B");
  EXPECT_EQ(r->attempts[1].outcome, AttemptOutcome::success("ok"));

  // C is never tried
  EXPECT_EQ(prov.calls(), 2u);
}

TEST(FallbackExecutor, Run_TertiaryRescuesRun) {
  ScriptedProvisioner prov({fail("SkuNotAvailable"), fail("QuotaExceeded"), ok("{\"provisioningState\":\"Succeeded\"}")});
  FallbackExecutor exec(prov);

  auto r = exec.run(abc(), sample_pool());
  ASSERT_TRUE(r);
  EXPECT_EQ(r->candidate, (Candidate{"C", 3}));
  EXPECT_EQ(r->attempts.size(), 3u);
  EXPECT_EQ(r->attempts.failures(), 2u);
}

// --------------------------- exhaustion ------------------------------------

/**
 * @test Run_AllFail_Exhausted
 * @brief Every diagnostic is preserved verbatim, one entry per candidate, in order.
 */
TEST(FallbackExecutor, Run_AllFail_Exhausted) {
  const std::string diag_a = "ERROR: (AllocationFailed) capacity\nline two";
  const std::string diag_b = "ERROR: quota";
  const std::string diag_c = "ERROR: (InvalidParameter) bad label syntax";
  ScriptedProvisioner prov({fail(diag_a), fail(diag_b, 2), fail(diag_c, 3)});
  FallbackExecutor exec(prov);

  auto r = exec.run(abc(), sample_pool());
  ASSERT_FALSE(r);
  const auto& err = r.error();
  EXPECT_EQ(err.code, EngineErrc::Exhausted);
  EXPECT_EQ(err.message, "All SKU attempts failed: A B C");
  ASSERT_EQ(err.attempts.size(), 3u);
  EXPECT_EQ(err.attempts[0].candidate.id, "A");
  EXPECT_EQ(err.attempts[0].outcome.output(), diag_a);
  EXPECT_EQ(err.attempts[1].candidate.id, "B");
  EXPECT_EQ(err.attempts[1].outcome.output(), diag_b);
  EXPECT_EQ(err.attempts[2].candidate.id, "C");
  EXPECT_EQ(err.attempts[2].outcome.output(), diag_c);
  for (const auto& rec : err.attempts) {
    EXPECT_FALSE(rec.outcome.succeeded());
    EXPECT_EQ(rec.outcome.failure_class(), FailureClass::Uniform);
  }
  EXPECT_EQ(exec.state(), RunState::Exhausted);
}

TEST(FallbackExecutor, Run_SingleCandidate_Fails) {
  ScriptedProvisioner prov({fail("capacity")});
  FallbackExecutor exec(prov);

  auto r = exec.run(*build_candidates("A"), sample_pool());
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().code, EngineErrc::Exhausted);
  ASSERT_EQ(r.error().attempts.size(), 1u);
  EXPECT_EQ(r.error().attempts[0].outcome.output(), "capacity");
}

TEST(FallbackExecutor, Run_TimeoutIsAFailureLikeAnyOther) {
  ScriptedProvisioner prov({fail("timed out after 600s", 124, true), ok("ok")});
  FallbackExecutor exec(prov);

  auto r = exec.run(*build_candidates("A", "B"), sample_pool());
  ASSERT_TRUE(r);
  EXPECT_EQ(r->candidate.id, "B");
  EXPECT_EQ(r->attempts[0].outcome.failure_class(), FailureClass::TimedOut);
}

// --------------------------- configuration errors --------------------------

/**
 * @test Run_InvalidParameters_NoInvocation
 * @brief Rejected before the first attempt; the log stays empty.
 */
TEST(FallbackExecutor, Run_InvalidParameters_NoInvocation) {
  ScriptedProvisioner prov({});
  RecordingObserver rec;
  FallbackExecutor exec(prov, &rec);

  auto p = sample_pool();
  p.min_count = 10;
  auto r = exec.run(abc(), p);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().code, EngineErrc::Configuration);
  EXPECT_EQ(r.error().field, "min-count");
  EXPECT_TRUE(r.error().attempts.empty());
  EXPECT_EQ(prov.calls(), 0u);
  EXPECT_TRUE(rec.attempts.empty());
  EXPECT_TRUE(rec.runs.empty());
  EXPECT_EQ(exec.state(), RunState::Pending);
}

TEST(FallbackExecutor, Run_EmptyPrimary_NoInvocation) {
  ScriptedProvisioner prov({});
  FallbackExecutor exec(prov);

  // Builder rejects it first...
  auto built = build_candidates("", "B");
  ASSERT_FALSE(built);
  EXPECT_EQ(built.error().field, "sku-primary");

  // ...and the executor refuses hand-made lists that skip the builder.
  auto r = exec.run(CandidateList{{"", 1}, {"B", 2}}, sample_pool());
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().code, EngineErrc::Configuration);
  EXPECT_TRUE(r.error().attempts.empty());

  auto empty = exec.run(CandidateList{}, sample_pool());
  ASSERT_FALSE(empty);
  EXPECT_EQ(empty.error().code, EngineErrc::Configuration);
  EXPECT_EQ(prov.calls(), 0u);
}

TEST(FallbackExecutor, Run_DuplicateCandidates_Rejected) {
  ScriptedProvisioner prov({});
  FallbackExecutor exec(prov);

  auto r = exec.run(CandidateList{{"A", 1}, {"A", 2}}, sample_pool());
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().code, EngineErrc::Configuration);
  EXPECT_EQ(prov.calls(), 0u);
}

// --------------------------- requests & events -----------------------------

/**
 * @test Run_RequestsCarryFixedParameters
 * @brief Each invocation gets the fixed parameters plus its own candidate.
 */
TEST(FallbackExecutor, Run_RequestsCarryFixedParameters) {
  auto p = sample_pool();
  p.zones = {"1", "2", "3"};
  p.labels = "workload=memory";
  ScriptedProvisioner prov({fail("x"), fail("y"), fail("z")});
  FallbackExecutor exec(prov);

  (void)exec.run(abc(), p);
  ASSERT_EQ(prov.requests().size(), 3u);
  const char* expected[] = {"A", "B", "C"};
  for (std::size_t i = 0; i < 3; ++i) {
    EXPECT_EQ(prov.requests()[i].sku(), expected[i]);
    EXPECT_EQ(prov.requests()[i].pool(), p);
  }
}

TEST(FallbackExecutor, Run_EmitsOrderedEvents) {
  ScriptedProvisioner prov({fail("capacity"), ok("ok")});
  RecordingObserver rec;
  FallbackExecutor exec(prov, &rec);

  ASSERT_TRUE(exec.run(abc(), sample_pool()));

  ASSERT_EQ(rec.attempts.size(), 4u);
  EXPECT_EQ(rec.attempts[0].phase, AttemptPhase::Started);
  EXPECT_EQ(rec.attempts[0].candidate.id, "A");
  EXPECT_EQ(rec.attempts[1].phase, AttemptPhase::Failed);
  EXPECT_EQ(rec.attempts[1].diagnostic, "capacity");
  EXPECT_TRUE(rec.attempts[1].has_next);
  EXPECT_EQ(rec.attempts[2].phase, AttemptPhase::Started);
  EXPECT_EQ(rec.attempts[2].candidate.id, "B");
  EXPECT_EQ(rec.attempts[3].phase, AttemptPhase::Succeeded);
  EXPECT_EQ(rec.attempts[3].run_id, "aks-prod/memnp");
  EXPECT_EQ(rec.attempts[3].pool_name, "memnp");

  ASSERT_EQ(rec.runs.size(), 1u);
  EXPECT_EQ(rec.runs[0].state, RunState::Provisioned);
  EXPECT_EQ(rec.runs[0].selected, "B");
  EXPECT_EQ(rec.runs[0].tried, "A B");
  EXPECT_EQ(rec.runs[0].attempts, 2u);

  const auto c = rec.snapshot();
  EXPECT_EQ(c.attempts, 2u);
  EXPECT_EQ(c.failures, 1u);
  EXPECT_EQ(c.fallbacks, 1u);
  EXPECT_EQ(c.successes, 1u);
  EXPECT_EQ(c.runs, 1u);
  EXPECT_EQ(c.exhausted, 0u);
}

TEST(FallbackExecutor, Run_LastFailureHasNoNext) {
  ScriptedProvisioner prov({fail("a"), fail("b")});
  RecordingObserver rec;
  FallbackExecutor exec(prov, &rec);

  ASSERT_FALSE(exec.run(*build_candidates("A", "B"), sample_pool()));
  ASSERT_EQ(rec.attempts.size(), 4u);
  EXPECT_TRUE(rec.attempts[1].has_next);
  EXPECT_FALSE(rec.attempts[3].has_next);
  ASSERT_EQ(rec.runs.size(), 1u);
  EXPECT_EQ(rec.runs[0].state, RunState::Exhausted);
  EXPECT_EQ(rec.snapshot().exhausted, 1u);
  EXPECT_EQ(rec.snapshot().fallbacks, 1u);
}

/**
 * @test Run_Deterministic
 * @brief Same candidates + same outcome sequence → identical result and log.
 */
TEST(FallbackExecutor, Run_Deterministic) {
  const std::vector<skufall::provision::ProvisionResult> script{fail("capacity"), fail("quota"), ok("ok")};

  ScriptedProvisioner p1(script), p2(script);
  FallbackExecutor e1(p1), e2(p2);
  auto r1 = e1.run(abc(), sample_pool());
  auto r2 = e2.run(abc(), sample_pool());

  ASSERT_TRUE(r1);
  ASSERT_TRUE(r2);
  EXPECT_EQ(r1->candidate, r2->candidate);
  EXPECT_EQ(r1->output, r2->output);
  EXPECT_EQ(r1->attempts, r2->attempts);
}

TEST(FallbackExecutor, Run_ExecutorIsReusable) {
  ScriptedProvisioner prov({fail("a"), ok("b"), ok("a2")});
  FallbackExecutor exec(prov);

  auto first = exec.run(*build_candidates("A", "B"), sample_pool());
  ASSERT_TRUE(first);
  EXPECT_EQ(first->attempts.size(), 2u);

  // A fresh run starts with a fresh log.
  auto second = exec.run(*build_candidates("A"), sample_pool());
  ASSERT_TRUE(second);
  EXPECT_EQ(second->attempts.size(), 1u);
  EXPECT_EQ(second->output, "a2");
}

/**
 * @test Run_NewerOsSku_ReachesProvisioner
 * @brief Image families are opaque: a current az value is attempted, not rejected up front.
 */
TEST(FallbackExecutor, Run_NewerOsSku_ReachesProvisioner) {
  for (const char* os : {"Ubuntu2204", "AzureLinux3", "Windows2025", "Mariner"}) {
    auto p = sample_pool();
    p.os_sku = os;
    ScriptedProvisioner prov({ok("ok")});
    FallbackExecutor exec(prov);

    auto r = exec.run(*build_candidates("A"), p);
    ASSERT_TRUE(r) << os;
    ASSERT_EQ(prov.calls(), 1u) << os;
    EXPECT_EQ(prov.requests()[0].pool().os_sku, os);
  }
}

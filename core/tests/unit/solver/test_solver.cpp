// tests/unit/solver/test_solver.cpp - Unit tests for the checker-facing facade
//
#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

#include "tscore/test_support/type_builders.hpp"

using namespace tscore;
using tscore::test_support::TypeWorld;

// ============================================================================
// Diagnostics
// ============================================================================

TEST(SolverExplain, ReportsOneErrorWithNotes)
{
  TypeWorld w;
  const TypeId src = w.obj({{"inner", w.obj({{"a", k_string}})}});
  const TypeId dst = w.obj({{"inner", w.obj({{"a", k_number}})}});

  DiagnosticBag diags;
  const Assignability result = w.solver->explain(src, dst, diags);
  EXPECT_FALSE(result.ok);

  ASSERT_EQ(diags.size(), 1u);
  const Diagnostic & d = diags.all()[0];
  EXPECT_EQ(d.severity, Severity::Error);
  EXPECT_EQ(d.code, "E2322");
  EXPECT_NE(d.message.find("is not assignable to type"), std::string::npos);
  EXPECT_EQ(d.notes.size(), result.reason->chain_length());
  EXPECT_FALSE(d.help_message.has_value());
}

TEST(SolverExplain, CodeFollowsInnermostReason)
{
  TypeWorld w;
  DiagnosticBag diags;
  (void)w.solver->explain(w.obj({}), w.obj({{"id", k_number}}), diags);
  (void)w.solver->explain(
    w.literal_obj({{"id", w.num(1)}, {"extra", k_string}}), w.obj({{"id", k_number}}), diags);
  (void)w.solver->explain(w.fn({k_string, k_string}, k_void), w.fn({k_string}, k_void), diags);

  ASSERT_EQ(diags.size(), 3u);
  EXPECT_EQ(diags.all()[0].code, "E2741");
  EXPECT_EQ(diags.all()[1].code, "E2353");
  EXPECT_EQ(diags.all()[2].code, "E2554");
}

TEST(SolverExplain, HoldingRelationReportsNothing)
{
  TypeWorld w;
  DiagnosticBag diags;
  EXPECT_TRUE(w.solver->explain(w.str("a"), k_string, diags).ok);
  EXPECT_TRUE(diags.empty());
}

TEST(SolverExplain, TruncationAddsHelp)
{
  SolverConfig config;
  config.limits.max_subtype_depth = 2;
  TypeWorld w(config);

  const TypeId deep = w.obj({{"a", w.obj({{"b", w.obj({{"c", k_string}})}})}});
  const TypeId other = w.obj({{"a", w.obj({{"b", w.obj({{"c", k_number}})}})}});

  DiagnosticBag diags;
  const Assignability result = w.solver->explain(deep, other, diags);
  EXPECT_FALSE(result.ok);
  EXPECT_TRUE(result.truncated);
  EXPECT_TRUE(diags.has_code("W0001"));

  bool saw_help = false;
  for (const auto & d : diags.all()) saw_help = saw_help || d.help_message.has_value();
  EXPECT_TRUE(saw_help);
}

// ============================================================================
// Relations
// ============================================================================

TEST(SolverRelations, SubtypeAndIdenticalReportTruncation)
{
  SolverConfig config;
  config.limits.max_subtype_depth = 2;
  TypeWorld w(config);

  const TypeId deep = w.obj({{"a", w.obj({{"b", w.obj({{"c", k_string}})}})}});
  const TypeId copy = w.obj({{"a", w.obj({{"b", w.obj({{"c", w.alias("Text", k_string)}})}})}});
  const TypeId wide = w.obj({{"a", w.obj({{"b", w.obj({{"c", w.un({k_string, k_number})}})}})}});

  const RelationResult sub = w.solver->subtype(deep, wide);
  EXPECT_FALSE(sub.ok);
  EXPECT_TRUE(sub.truncated);

  const RelationResult same = w.solver->identical(deep, copy);
  EXPECT_FALSE(same.ok);
  EXPECT_TRUE(same.truncated);

  const RelationResult shallow = w.solver->subtype(w.str("a"), k_string);
  EXPECT_TRUE(shallow.ok);
  EXPECT_FALSE(shallow.truncated);
  EXPECT_TRUE(static_cast<bool>(shallow));
}

TEST(SolverFailureCodes, Mapping)
{
  EXPECT_STREQ(failure_code(FailureKind::PropertyMissing), "E2741");
  EXPECT_STREQ(failure_code(FailureKind::ExcessProperty), "E2353");
  EXPECT_STREQ(failure_code(FailureKind::WeakTypeNoOverlap), "E2559");
  EXPECT_STREQ(failure_code(FailureKind::ArityMismatch), "E2554");
  EXPECT_STREQ(failure_code(FailureKind::UnresolvedReference), "E2304");
  EXPECT_STREQ(failure_code(FailureKind::TypeMismatch), "E2322");
  EXPECT_STREQ(failure_code(FailureKind::EnumOpacityViolation), "E2322");
}

// ============================================================================
// Configuration
// ============================================================================

TEST(SolverConfigured, ProfileFromConfig)
{
  SolverConfig config;
  config.compat = CompatProfile::legacy();
  TypeWorld w(config);
  EXPECT_TRUE(w.assignable(k_null, k_string));
  EXPECT_FALSE(w.solver->assignable(k_null, k_string, CompatProfile{}).ok);
  EXPECT_FALSE(w.solver->config().compat.strict_null_checks);
}

// ============================================================================
// Concurrency
// ============================================================================

TEST(SolverConcurrency, ParallelQueriesAgree)
{
  TypeWorld w;
  const DefId list_id = w.reserve();
  const TypeId list = w.define_interface(
    list_id, "List", w.obj({{"value", k_number}, {"next", w.interner.lazy(list_id), true}}));
  const TypeId literal = w.literal_obj({{"value", w.num(1)}});
  const TypeId excess = w.literal_obj({{"value", w.num(1)}, {"extra", k_string}});
  const auto color = w.enumeration("Color", EnumKind::Numeric, {w.num(0), w.num(1)});

  constexpr int k_threads = 8;
  constexpr int k_rounds = 200;
  std::atomic<int> mismatches{0};
  std::vector<std::thread> workers;
  for (int t = 0; t < k_threads; ++t) {
    workers.emplace_back([&] {
      for (int i = 0; i < k_rounds; ++i) {
        if (!w.assignable(literal, list)) ++mismatches;
        if (w.assignable(excess, list)) ++mismatches;
        if (!w.assignable(color.members[0], color.type)) ++mismatches;
        if (w.assignable(k_number, color.type)) ++mismatches;
        // Each round builds a new union, so the interner is written concurrently.
        const TypeId u = w.un({w.num(static_cast<double>(i)), k_string});
        if (!w.subtype(k_string, u)) ++mismatches;
      }
    });
  }
  for (auto & worker : workers) worker.join();
  EXPECT_EQ(mismatches.load(), 0);
}

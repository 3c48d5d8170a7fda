// tscore/judge/judge.hpp - Strict structural relation engine
//
// The Judge decides identity and subtyping by shape alone. It knows nothing
// about the reference language's leniencies; those are layered on through a
// RelationHooks implementation attached to the query.
//
#pragma once

#include <optional>

#include "tscore/env/environment.hpp"
#include "tscore/guard/query_context.hpp"
#include "tscore/judge/failure_reason.hpp"
#include "tscore/types/interner.hpp"

namespace tscore
{

/**
 * Structural relation engine.
 *
 * Stateless apart from the shared Interner / Environment; all per-query state
 * is in the QueryContext, so one Judge serves any number of threads.
 *
 * Cycles: every (source, target, kind) pair is memoized per query; meeting a
 * pair that is still in progress assumes it holds (coinduction). Results
 * that relied on such an assumption are not cached until the assumed pair
 * itself completes.
 */
class Judge
{
public:
  explicit Judge(Environment & env);

  // ===========================================================================
  // Top-level Queries
  // ===========================================================================

  /// Strict subtype relation; policy hooks are detached for the call.
  [[nodiscard]] bool subtype(TypeId source, TypeId target, QueryContext & ctx);

  /// Same type after resolution and evaluation, or mutual strict subtypes.
  [[nodiscard]] bool identical(TypeId a, TypeId b, QueryContext & ctx);

  /**
   * Re-walk a relation and describe why it fails (under the query's hooks).
   *
   * @return nullopt if the relation holds
   */
  [[nodiscard]] std::optional<FailureReason> explain(
    TypeId source, TypeId target, QueryContext & ctx);

  // ===========================================================================
  // Relation Step
  // ===========================================================================

  /**
   * One relation step, honoring the query's hooks, memo and budgets.
   *
   * Policy rules call back into this for nested comparisons.
   *
   * @param why filled with the failure when non-null and the result is false
   */
  bool relate(TypeId source, TypeId target, QueryContext & ctx, FailureReason * why = nullptr);

  /**
   * Structural form of a type: Lazy and typeof references resolved, derived
   * types reduced through the query's reducer. Recursive references that are
   * being expanded by the same query are returned unchanged.
   */
  TypeId normalize(TypeId id, QueryContext & ctx);

  [[nodiscard]] Environment & environment() noexcept { return env_; }
  [[nodiscard]] TypeInterner & interner() noexcept { return interner_; }

private:
  Environment & env_;
  TypeInterner & interner_;

  bool relate_step(TypeId source, TypeId target, QueryContext & ctx, FailureReason * why);
  bool relate_structural(TypeId source, TypeId target, QueryContext & ctx, FailureReason * why);

  bool relate_intersection_source(
    TypeId source, gsl::span<const TypeId> members, TypeId target, QueryContext & ctx);

  bool relate_object(
    TypeId source, const ObjectShape & s, TypeId target, const ObjectShape & t,
    QueryContext & ctx, FailureReason * why);

  bool relate_index_signatures(
    TypeId source, const ObjectShape & s, TypeId target, const ObjectShape & t,
    QueryContext & ctx, FailureReason * why);

  bool relate_signature(
    TypeId source, const FunctionShape & s, TypeId target, const FunctionShape & t,
    QueryContext & ctx, FailureReason * why);

  bool relate_tuple(
    TypeId source, gsl::span<const TupleElement> s, TypeId target,
    gsl::span<const TupleElement> t, QueryContext & ctx, FailureReason * why);

  bool relate_elements_to(
    TypeId source, TypeId element_target, QueryContext & ctx, FailureReason * why);

  /// `T | undefined` when optional properties include undefined under the query's policy.
  TypeId optional_read_type(TypeId type, bool optional, const QueryContext & ctx);

  /// Element type of a rest position (`T[]` -> T, tuple -> union of elements).
  TypeId rest_element_type(TypeId rest_type);
};

}  // namespace tscore

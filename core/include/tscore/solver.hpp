// tscore/solver.hpp - Checker-facing type solver
//
// One facade over Interner / Environment / Judge / Evaluator / Lawyer.
// Every request runs as its own query with private memo tables, so a Solver
// may be called from many threads at once (after configuration).
//
#pragma once

#include <gsl/span>
#include <memory>
#include <optional>

#include "tscore/basic/diagnostic.hpp"
#include "tscore/config/solver_config.hpp"
#include "tscore/env/environment.hpp"
#include "tscore/eval/evaluator.hpp"
#include "tscore/guard/query_context.hpp"
#include "tscore/judge/judge.hpp"
#include "tscore/lawyer/lawyer.hpp"

namespace tscore
{

/// Outcome of a strict relation request.
struct RelationResult
{
  bool ok = false;
  bool truncated = false;  ///< a budget was hit; `ok` is the conservative answer

  explicit operator bool() const noexcept { return ok; }
};

/// A reduced type and whether a budget cut the reduction short.
struct Evaluation
{
  TypeId type;
  bool truncated = false;
};

class Solver
{
public:
  explicit Solver(Environment & env, SolverConfig config = SolverConfig{});

  Solver(const Solver &) = delete;
  Solver & operator=(const Solver &) = delete;

  // ===========================================================================
  // Relations
  // ===========================================================================

  /// Assignability under the configured profile.
  [[nodiscard]] Assignability assignable(
    TypeId source, TypeId target, DiagnosticBag * diags = nullptr) const;

  /// Assignability under an explicit profile (the configured rule set is kept).
  [[nodiscard]] Assignability assignable(
    TypeId source, TypeId target, const CompatProfile & profile,
    DiagnosticBag * diags = nullptr) const;

  /// Strict structural subtype (no compatibility rules).
  [[nodiscard]] RelationResult subtype(
    TypeId source, TypeId target, DiagnosticBag * diags = nullptr) const;

  [[nodiscard]] RelationResult identical(TypeId a, TypeId b, DiagnosticBag * diags = nullptr) const;

  /**
   * Check assignability and, when it fails, report it to `diags` as one
   * Error diagnostic with a note per step of the reason chain.
   *
   * @return the assignability result
   */
  Assignability explain(TypeId source, TypeId target, DiagnosticBag & diags) const;

  // ===========================================================================
  // Evaluation
  // ===========================================================================

  [[nodiscard]] Evaluation evaluate(TypeId id, DiagnosticBag * diags = nullptr) const;

  [[nodiscard]] Evaluation instantiate(
    TypeId generic, gsl::span<const TypeId> args, DiagnosticBag * diags = nullptr) const;

  /// Object interface a primitive (or other non-object type) is compared against.
  [[nodiscard]] TypeId apparent_type(TypeId id, DiagnosticBag * diags = nullptr) const;

  // ===========================================================================
  // Components
  // ===========================================================================

  /// Fresh per-query context for driving the components directly.
  [[nodiscard]] std::unique_ptr<QueryContext> new_query(DiagnosticBag * diags = nullptr) const;

  [[nodiscard]] Environment & environment() noexcept { return env_; }
  [[nodiscard]] TypeInterner & interner() noexcept { return env_.interner(); }
  [[nodiscard]] Judge & judge() noexcept { return *judge_; }
  [[nodiscard]] Evaluator & evaluator() noexcept { return *evaluator_; }
  [[nodiscard]] Lawyer & lawyer() noexcept { return *lawyer_; }
  [[nodiscard]] const SolverConfig & config() const noexcept { return config_; }

private:
  Environment & env_;
  SolverConfig config_;
  std::unique_ptr<Judge> judge_;
  std::unique_ptr<Evaluator> evaluator_;
  std::unique_ptr<Lawyer> lawyer_;
};

/// Diagnostic code the checker reports for a failure of this kind ("E2322", ...).
[[nodiscard]] const char * failure_code(FailureKind kind) noexcept;

}  // namespace tscore

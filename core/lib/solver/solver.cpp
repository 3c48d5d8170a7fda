// tscore/solver/solver.cpp - Checker-facing type solver
//
#include "tscore/solver.hpp"

#include <string>
#include <utility>

#include "tscore/types/type_printer.hpp"

namespace tscore
{

const char * failure_code(FailureKind kind) noexcept
{
  switch (kind) {
    case FailureKind::PropertyMissing:
      return "E2741";
    case FailureKind::ExcessProperty:
      return "E2353";
    case FailureKind::WeakTypeNoOverlap:
      return "E2559";
    case FailureKind::ArityMismatch:
      return "E2554";
    case FailureKind::UnresolvedReference:
      return "E2304";
    default:
      return "E2322";
  }
}

Solver::Solver(Environment & env, SolverConfig config)
: env_(env),
  config_(std::move(config)),
  judge_(std::make_unique<Judge>(env)),
  evaluator_(std::make_unique<Evaluator>(env, *judge_)),
  lawyer_(std::make_unique<Lawyer>(*judge_, *evaluator_, config_.compat))
{
}

std::unique_ptr<QueryContext> Solver::new_query(DiagnosticBag * diags) const
{
  auto ctx = std::make_unique<QueryContext>(config_.limits, diags);
  ctx->reducer = evaluator_.get();
  return ctx;
}

// ============================================================================
// Relations
// ============================================================================

Assignability Solver::assignable(TypeId source, TypeId target, DiagnosticBag * diags) const
{
  auto ctx = new_query(diags);
  return lawyer_->assignable(source, target, *ctx);
}

Assignability Solver::assignable(
  TypeId source, TypeId target, const CompatProfile & profile, DiagnosticBag * diags) const
{
  Lawyer scoped(*judge_, *evaluator_, profile);
  scoped.rules() = lawyer_->rules();
  auto ctx = new_query(diags);
  return scoped.assignable(source, target, *ctx);
}

RelationResult Solver::subtype(TypeId source, TypeId target, DiagnosticBag * diags) const
{
  auto ctx = new_query(diags);
  const bool ok = judge_->subtype(source, target, *ctx);
  return RelationResult{ok, ctx->truncated()};
}

RelationResult Solver::identical(TypeId a, TypeId b, DiagnosticBag * diags) const
{
  auto ctx = new_query(diags);
  const bool ok = judge_->identical(a, b, *ctx);
  return RelationResult{ok, ctx->truncated()};
}

Assignability Solver::explain(TypeId source, TypeId target, DiagnosticBag & diags) const
{
  auto ctx = new_query(&diags);
  ctx->explaining = true;
  Assignability result = lawyer_->assignable(source, target, *ctx);
  if (result.ok || !result.reason) return result;

  const TypeInterner & interner = env_.interner();
  const FailureReason & top = *result.reason;
  auto builder = diags.report_error(
    "Type '" + to_string(interner, source, &env_) + "' is not assignable to type '" +
    to_string(interner, target, &env_) + "'.");
  builder.with_code(failure_code(top.innermost().kind));
  for (const FailureReason * r = &top; r; r = r->nested.get()) {
    builder.with_note(describe(interner, *r));
  }
  if (result.truncated) {
    builder.with_help("a recursion or expansion budget was reached; the result is conservative");
  }
  return result;
}

// ============================================================================
// Evaluation
// ============================================================================

Evaluation Solver::evaluate(TypeId id, DiagnosticBag * diags) const
{
  auto ctx = new_query(diags);
  const TypeId type = evaluator_->evaluate(id, *ctx);
  return Evaluation{type, ctx->truncated()};
}

Evaluation Solver::instantiate(
  TypeId generic, gsl::span<const TypeId> args, DiagnosticBag * diags) const
{
  auto ctx = new_query(diags);
  const TypeId type = evaluator_->instantiate(generic, args, *ctx);
  return Evaluation{type, ctx->truncated()};
}

TypeId Solver::apparent_type(TypeId id, DiagnosticBag * diags) const
{
  auto ctx = new_query(diags);
  return evaluator_->apparent_type(id, *ctx);
}

}  // namespace tscore

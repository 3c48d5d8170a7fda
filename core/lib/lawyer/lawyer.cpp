// tscore/lawyer/lawyer.cpp - Reference-language assignability
//
#include "tscore/lawyer/lawyer.hpp"

#include <utility>

#include "tscore/eval/evaluator.hpp"

namespace tscore
{

namespace
{

/// Attaches a Lawyer to the query for the duration of one check.
class PolicyScope
{
public:
  PolicyScope(QueryContext & ctx, RelationHooks * hooks, const CompatProfile * profile, TypeReducer * reducer)
  : ctx_(ctx), saved_hooks_(ctx.hooks), saved_profile_(ctx.profile), saved_reducer_(ctx.reducer)
  {
    ctx_.hooks = hooks;
    ctx_.profile = profile;
    if (!ctx_.reducer) ctx_.reducer = reducer;
  }

  ~PolicyScope()
  {
    ctx_.hooks = saved_hooks_;
    ctx_.profile = saved_profile_;
    ctx_.reducer = saved_reducer_;
  }

  PolicyScope(const PolicyScope &) = delete;
  PolicyScope & operator=(const PolicyScope &) = delete;

private:
  QueryContext & ctx_;
  RelationHooks * saved_hooks_;
  const CompatProfile * saved_profile_;
  TypeReducer * saved_reducer_;
};

}  // namespace

Lawyer::Lawyer(Judge & judge, Evaluator & evaluator, CompatProfile profile)
: judge_(judge), evaluator_(evaluator), profile_(std::move(profile)), rules_(RuleSet::defaults())
{
}

Assignability Lawyer::assignable(TypeId source, TypeId target, QueryContext & ctx)
{
  PolicyScope scope(ctx, this, &profile_, &evaluator_);

  Assignability result;
  FailureReason why = FailureReason::make(FailureKind::TypeMismatch, source, target);
  result.ok = judge_.relate(source, target, ctx, &why);
  if (!result.ok) result.reason = std::move(why);
  result.truncated = ctx.truncated();
  return result;
}

// ============================================================================
// RelationHooks
// ============================================================================

RuleOutcome Lawyer::run_stage(
  RuleStage stage, TypeId source, TypeId target, bool method_like, QueryContext & ctx)
{
  RuleContext rc{judge_,   evaluator_, judge_.environment(), judge_.interner(), profile_, ctx,
                 source,   target,     method_like};
  for (const auto & rule : rules_.rules()) {
    if (rule.stage != stage || !rule.fn || !rule.enabled(profile_)) continue;
    RuleOutcome outcome = rule.fn(rc);
    if (outcome.decided()) return outcome;
  }
  return RuleOutcome::defer();
}

RuleOutcome Lawyer::before_relate(Judge &, TypeId source, TypeId target, QueryContext & ctx)
{
  return run_stage(RuleStage::Relation, source, target, false, ctx);
}

bool Lawyer::relate_parameter(
  Judge & judge, TypeId source_param, TypeId target_param, bool method_like, QueryContext & ctx,
  FailureReason * why)
{
  const RuleOutcome outcome =
    run_stage(RuleStage::Parameter, source_param, target_param, method_like, ctx);
  if (outcome.verdict == RuleVerdict::Pass) return true;
  if (outcome.verdict == RuleVerdict::Fail) {
    if (why && outcome.reason) *why = *outcome.reason;
    return false;
  }
  return judge.relate(target_param, source_param, ctx, why);
}

bool Lawyer::relate_return(
  Judge & judge, TypeId source_return, TypeId target_return, QueryContext & ctx,
  FailureReason * why)
{
  const RuleOutcome outcome = run_stage(RuleStage::Return, source_return, target_return, false, ctx);
  if (outcome.verdict == RuleVerdict::Pass) return true;
  if (outcome.verdict == RuleVerdict::Fail) {
    if (why && outcome.reason) *why = *outcome.reason;
    return false;
  }
  return judge.relate(source_return, target_return, ctx, why);
}

bool Lawyer::allow_readonly_to_mutable() const
{
  return profile_.readonly_property_laxity && !profile_.is_disabled("readonly-property-laxity");
}

bool Lawyer::optional_includes_undefined() const { return !profile_.exact_optional_property_types; }

}  // namespace tscore

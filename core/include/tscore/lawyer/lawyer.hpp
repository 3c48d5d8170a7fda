// tscore/lawyer/lawyer.hpp - Reference-language assignability
//
// The Lawyer layers the named compatibility rules over the strict Judge.
// It attaches itself to a query as the RelationHooks, so every nested
// relation step of an assignability check consults the rules first.
//
#pragma once

#include <optional>
#include <utility>

#include "tscore/judge/judge.hpp"
#include "tscore/judge/relation_hooks.hpp"
#include "tscore/lawyer/compat_profile.hpp"
#include "tscore/lawyer/compat_rules.hpp"

namespace tscore
{

class Evaluator;

/// Result of an assignability check.
struct Assignability
{
  bool ok = false;
  std::optional<FailureReason> reason;
  bool truncated = false;  ///< a budget was hit; `ok` is the conservative answer

  explicit operator bool() const noexcept { return ok; }
};

/**
 * Compatibility policy layer.
 *
 * The profile and rule set are configured before use and only read while
 * checking, so one Lawyer may serve concurrent queries. Results are
 * memoized per (source, target) in the query's relation table.
 */
class Lawyer : public RelationHooks
{
public:
  Lawyer(Judge & judge, Evaluator & evaluator, CompatProfile profile = CompatProfile{});

  /// Is `source` assignable to `target` under the profile?
  Assignability assignable(TypeId source, TypeId target, QueryContext & ctx);

  [[nodiscard]] const CompatProfile & profile() const noexcept { return profile_; }
  void set_profile(CompatProfile profile) { profile_ = std::move(profile); }

  [[nodiscard]] RuleSet & rules() noexcept { return rules_; }
  [[nodiscard]] const RuleSet & rules() const noexcept { return rules_; }

  // RelationHooks
  RuleOutcome before_relate(Judge & judge, TypeId source, TypeId target, QueryContext & ctx) override;
  bool relate_parameter(
    Judge & judge, TypeId source_param, TypeId target_param, bool method_like, QueryContext & ctx,
    FailureReason * why) override;
  bool relate_return(
    Judge & judge, TypeId source_return, TypeId target_return, QueryContext & ctx,
    FailureReason * why) override;
  [[nodiscard]] bool allow_readonly_to_mutable() const override;
  [[nodiscard]] bool optional_includes_undefined() const override;

private:
  Judge & judge_;
  Evaluator & evaluator_;
  CompatProfile profile_;
  RuleSet rules_;

  /// First decided outcome among the enabled rules of `stage`.
  RuleOutcome run_stage(
    RuleStage stage, TypeId source, TypeId target, bool method_like, QueryContext & ctx);
};

}  // namespace tscore

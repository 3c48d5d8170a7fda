// tscore/judge/relation_hooks.hpp - Policy seam consulted by the Judge
//
// The Judge alone is strict. A RelationHooks implementation attached to the
// query (the Lawyer) is consulted at every nested relation step and may
// decide a step before the structural rules run, or relax how parameters,
// returns and property modifiers are compared.
//
#pragma once

#include <memory>

#include "tscore/judge/failure_reason.hpp"
#include "tscore/types/type_id.hpp"

namespace tscore
{

class Judge;
struct QueryContext;

enum class RuleVerdict : uint8_t {
  Defer,  ///< no opinion; later rules / structural comparison decide
  Pass,
  Fail,
};

/// Result of one policy rule.
struct RuleOutcome
{
  RuleVerdict verdict = RuleVerdict::Defer;
  std::shared_ptr<const FailureReason> reason;

  [[nodiscard]] static RuleOutcome pass() { return RuleOutcome{RuleVerdict::Pass, nullptr}; }
  [[nodiscard]] static RuleOutcome defer() { return RuleOutcome{RuleVerdict::Defer, nullptr}; }
  [[nodiscard]] static RuleOutcome fail(FailureReason reason)
  {
    return RuleOutcome{RuleVerdict::Fail, std::make_shared<const FailureReason>(std::move(reason))};
  }

  [[nodiscard]] bool decided() const noexcept { return verdict != RuleVerdict::Defer; }
};

class RelationHooks
{
public:
  virtual ~RelationHooks() = default;

  /// Consulted before the structural rules of every relation step.
  virtual RuleOutcome before_relate(Judge & judge, TypeId source, TypeId target, QueryContext & ctx) = 0;

  /**
   * Relate one parameter pair. The strict rule is contravariance:
   * `judge.relate(target_param, source_param)`.
   *
   * @param method_like true when either signature is declared as a method
   */
  virtual bool relate_parameter(
    Judge & judge, TypeId source_param, TypeId target_param, bool method_like, QueryContext & ctx,
    FailureReason * why) = 0;

  /// Relate return types. The strict rule is covariance.
  virtual bool relate_return(
    Judge & judge, TypeId source_return, TypeId target_return, QueryContext & ctx,
    FailureReason * why) = 0;

  /// A readonly source property may satisfy a mutable target property.
  [[nodiscard]] virtual bool allow_readonly_to_mutable() const = 0;

  /// Optional properties read as `T | undefined` (false under exact optional property types).
  [[nodiscard]] virtual bool optional_includes_undefined() const = 0;
};

}  // namespace tscore

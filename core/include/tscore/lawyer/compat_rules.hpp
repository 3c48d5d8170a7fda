// tscore/lawyer/compat_rules.hpp - Named assignability rules
//
// Each rule is a free function deciding one relation step (pass / fail with
// a reason) or deferring to the next rule and finally to the Judge's
// structural comparison. A RuleSet holds them in their documented order.
//
#pragma once

#include <functional>
#include <gsl/span>
#include <string>
#include <string_view>
#include <vector>

#include "tscore/judge/relation_hooks.hpp"
#include "tscore/lawyer/compat_profile.hpp"

namespace tscore
{

class Environment;
class Evaluator;
class Judge;
class TypeInterner;
struct QueryContext;

/// Where a rule is consulted.
enum class RuleStage : uint8_t {
  Relation,   ///< before the structural rules of every relation step
  Parameter,  ///< when relating one parameter pair of two signatures
  Return,     ///< when relating the return types of two signatures
};

/// Everything a rule may look at for one step.
struct RuleContext
{
  Judge & judge;
  Evaluator & evaluator;
  Environment & env;
  TypeInterner & interner;
  const CompatProfile & profile;
  QueryContext & ctx;
  TypeId source;
  TypeId target;
  bool method_like = false;  ///< Parameter stage: either signature is a method
};

using RuleFn = std::function<RuleOutcome(RuleContext &)>;

struct CompatRule
{
  std::string name;
  RuleStage stage = RuleStage::Relation;
  RuleFn fn;
  /// Profile toggle gating the rule; nullptr means always on.
  bool CompatProfile::*toggle = nullptr;

  [[nodiscard]] bool enabled(const CompatProfile & profile) const
  {
    if (profile.is_disabled(name)) return false;
    return toggle == nullptr || profile.*toggle;
  }
};

// ============================================================================
// Rule Set
// ============================================================================

/// Ordered, editable list of rules.
class RuleSet
{
public:
  /// The default rules in their documented order.
  [[nodiscard]] static RuleSet defaults();

  void append(CompatRule rule);

  /// Insert next to an existing rule. false if `anchor` is not in the set.
  bool insert_before(std::string_view anchor, CompatRule rule);
  bool insert_after(std::string_view anchor, CompatRule rule);

  bool remove(std::string_view name);

  [[nodiscard]] const CompatRule * find(std::string_view name) const;
  [[nodiscard]] std::vector<std::string> names() const;
  [[nodiscard]] gsl::span<const CompatRule> rules() const { return rules_; }

private:
  std::vector<CompatRule> rules_;

  [[nodiscard]] std::vector<CompatRule>::iterator position_of(std::string_view name);
};

// ============================================================================
// Default Rules
// ============================================================================

RuleOutcome rule_identity(RuleContext & rc);
RuleOutcome rule_error_poisoning(RuleContext & rc);
RuleOutcome rule_any_propagation(RuleContext & rc);
RuleOutcome rule_unknown_top_never_bottom(RuleContext & rc);
RuleOutcome rule_legacy_null_undefined(RuleContext & rc);
RuleOutcome rule_enum_nominality(RuleContext & rc);
RuleOutcome rule_string_enum_opacity(RuleContext & rc);
RuleOutcome rule_numeric_enum_openness(RuleContext & rc);
RuleOutcome rule_global_function_type(RuleContext & rc);
RuleOutcome rule_base_constraint(RuleContext & rc);
RuleOutcome rule_weak_type(RuleContext & rc);
RuleOutcome rule_excess_property(RuleContext & rc);
RuleOutcome rule_root_object(RuleContext & rc);
RuleOutcome rule_apparent_primitive_members(RuleContext & rc);

/// Return stage: anything may be returned where `void` is expected.
RuleOutcome rule_void_return(RuleContext & rc);

/// Parameter stage: bivariant parameters for methods (or everywhere without strict function types).
RuleOutcome rule_method_bivariance(RuleContext & rc);

}  // namespace tscore

// tests/unit/lawyer/test_lawyer.cpp - Unit tests for compatibility rules
//
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "tscore/test_support/type_builders.hpp"

using namespace tscore;
using tscore::test_support::TypeWorld;

namespace
{

FailureKind failure_of(TypeWorld & w, TypeId source, TypeId target)
{
  const Assignability result = w.solver->assignable(source, target);
  EXPECT_FALSE(result.ok);
  return result.reason ? result.reason->kind : FailureKind::TypeMismatch;
}

}  // namespace

// ============================================================================
// Top, Bottom, Sentinels
// ============================================================================

TEST(LawyerSentinels, AnyIsBothWays)
{
  TypeWorld w;
  EXPECT_TRUE(w.assignable(k_any, k_number));
  EXPECT_TRUE(w.assignable(k_number, k_any));
  EXPECT_TRUE(w.assignable(k_any, w.obj({{"a", k_string}})));
  EXPECT_FALSE(w.assignable(k_any, k_never));
}

TEST(LawyerSentinels, UnknownIsOnlyTop)
{
  TypeWorld w;
  EXPECT_TRUE(w.assignable(k_number, k_unknown));
  EXPECT_FALSE(w.assignable(k_unknown, k_number));
  EXPECT_TRUE(w.assignable(k_unknown, k_any));
  EXPECT_TRUE(w.assignable(k_never, k_number));
}

TEST(LawyerSentinels, AnyPropagationCanBeSwitchedOff)
{
  TypeWorld w;
  CompatProfile profile;
  profile.any_propagation = false;
  EXPECT_FALSE(w.solver->assignable(k_any, k_number, profile).ok);
  EXPECT_TRUE(w.solver->assignable(k_number, k_any, profile).ok);
}

TEST(LawyerSentinels, UnresolvedPoisonsButDoesNotCascade)
{
  TypeWorld w;
  const TypeId missing = w.interner.lazy(w.reserve());
  EXPECT_EQ(failure_of(w, missing, k_string), FailureKind::UnresolvedReference);
  EXPECT_TRUE(w.assignable(missing, k_any));
}

// ============================================================================
// Enums
// ============================================================================

TEST(LawyerEnums, NumericMembersWidenButNumberDoesNotNarrow)
{
  TypeWorld w;
  const auto color = w.enumeration("Color", EnumKind::Numeric, {w.num(0), w.num(1)});
  const TypeId red = color.members[0];
  const TypeId green = color.members[1];

  EXPECT_TRUE(w.assignable(red, color.type));
  EXPECT_TRUE(w.assignable(red, k_number));
  EXPECT_TRUE(w.assignable(color.type, k_number));
  EXPECT_FALSE(w.assignable(k_number, color.type));
  EXPECT_FALSE(w.assignable(color.type, red));
  EXPECT_EQ(failure_of(w, red, green), FailureKind::EnumOpacityViolation);
  EXPECT_EQ(failure_of(w, k_number, color.type), FailureKind::EnumOpacityViolation);
}

TEST(LawyerEnums, NumericLiteralFitsItsEnum)
{
  TypeWorld w;
  const auto color = w.enumeration("Color", EnumKind::Numeric, {w.num(0), w.num(1)});
  EXPECT_TRUE(w.assignable(w.num(1), color.type));
  EXPECT_FALSE(w.assignable(w.num(7), color.type));
}

TEST(LawyerEnums, DistinctEnumsAreNominal)
{
  TypeWorld w;
  const auto a = w.enumeration("A", EnumKind::Numeric, {w.num(0)});
  const auto b = w.enumeration("B", EnumKind::Numeric, {w.num(0)});
  EXPECT_EQ(failure_of(w, a.type, b.type), FailureKind::EnumOpacityViolation);
  EXPECT_EQ(failure_of(w, a.members[0], b.members[0]), FailureKind::EnumOpacityViolation);

  // Structurally they agree.
  EXPECT_TRUE(w.subtype(a.type, b.type));
}

TEST(LawyerEnums, StringEnumsAreOpaqueBothWays)
{
  TypeWorld w;
  const auto dir = w.enumeration("Dir", EnumKind::String, {w.str("up"), w.str("down")});
  const TypeId up = dir.members[0];

  EXPECT_TRUE(w.assignable(up, dir.type));
  EXPECT_EQ(failure_of(w, up, k_string), FailureKind::EnumOpacityViolation);
  EXPECT_EQ(failure_of(w, k_string, dir.type), FailureKind::EnumOpacityViolation);
  EXPECT_EQ(failure_of(w, w.str("up"), up), FailureKind::EnumOpacityViolation);

  CompatProfile open;
  open.string_enum_opacity = false;
  EXPECT_TRUE(w.solver->assignable(up, k_string, open).ok);
}

// ============================================================================
// Object Literals
// ============================================================================

TEST(LawyerObjects, EmptyLiteralFitsRootObject)
{
  TypeWorld w;
  const TypeId root =
    w.interface("Object", w.obj({{"toString", w.fn({}, k_string, true), false, false, true}}));
  w.env.set_root_object(root);

  EXPECT_TRUE(w.assignable(w.literal_obj({}), root));
  EXPECT_TRUE(w.assignable(k_number, root));
  EXPECT_FALSE(w.assignable(k_null, root));
  // The structural relation knows nothing about the root object.
  EXPECT_FALSE(w.subtype(w.obj({}), root));
}

TEST(LawyerObjects, WeakTypeNeedsOverlap)
{
  TypeWorld w;
  const TypeId options = w.obj({{"a", k_number, true}, {"b", k_string, true}});

  EXPECT_EQ(failure_of(w, w.obj({{"c", k_number}}), options), FailureKind::WeakTypeNoOverlap);
  EXPECT_TRUE(w.assignable(w.obj({{"a", k_number}, {"c", k_number}}), options));
  EXPECT_TRUE(w.assignable(w.obj({}), options));

  CompatProfile lax;
  lax.weak_type_detection = false;
  EXPECT_TRUE(w.solver->assignable(w.obj({{"c", k_number}}), options, lax).ok);
}

TEST(LawyerObjects, ExcessPropertyOnFreshLiteral)
{
  TypeWorld w;
  const TypeId target = w.obj({{"a", k_number}});
  const TypeId literal = w.literal_obj({{"a", w.num(1)}, {"b", k_string}});

  const Assignability result = w.solver->assignable(literal, target);
  ASSERT_FALSE(result.ok);
  ASSERT_TRUE(result.reason.has_value());
  EXPECT_EQ(result.reason->kind, FailureKind::ExcessProperty);
  EXPECT_EQ(result.reason->member, "b");

  // The same shape held in a variable is not fresh.
  EXPECT_TRUE(w.assignable(w.obj({{"a", w.num(1)}, {"b", k_string}}), target));
}

TEST(LawyerObjects, MemberMismatchOutranksExcess)
{
  TypeWorld w;
  const TypeId target = w.obj({{"a", k_number}});
  const TypeId literal = w.literal_obj({{"a", k_string}, {"b", k_string}});

  const Assignability result = w.solver->assignable(literal, target);
  ASSERT_TRUE(result.reason.has_value());
  EXPECT_EQ(result.reason->kind, FailureKind::PropertyTypeMismatch);
  EXPECT_EQ(result.reason->member, "a");
}

TEST(LawyerObjects, ExcessAgainstUnionTarget)
{
  TypeWorld w;
  const TypeId target = w.un({w.obj({{"a", k_number}}), w.obj({{"b", k_string}})});
  EXPECT_TRUE(w.assignable(w.literal_obj({{"a", w.num(1)}, {"b", w.str("x")}}), target));
  EXPECT_EQ(
    failure_of(w, w.literal_obj({{"a", w.num(1)}, {"c", k_number}}), target),
    FailureKind::ExcessProperty);
}

TEST(LawyerObjects, IndexSignatureAcceptsAnyMember)
{
  TypeWorld w;
  ObjectShape dict;
  dict.string_index = IndexSignature{k_string, k_number, false};
  const TypeId target = w.interner.object(std::move(dict));
  EXPECT_TRUE(w.assignable(w.literal_obj({{"x", w.num(1)}, {"y", w.num(2)}}), target));
}

TEST(LawyerObjects, NestedLiteralsStayFresh)
{
  TypeWorld w;
  const TypeId target = w.obj({{"inner", w.obj({{"a", k_number}})}});
  const TypeId literal =
    w.literal_obj({{"inner", w.literal_obj({{"a", w.num(1)}, {"extra", k_number}})}});
  EXPECT_FALSE(w.assignable(literal, target));
}

TEST(LawyerObjects, ExcessCheckCanBeDisabledByName)
{
  TypeWorld w;
  CompatProfile profile;
  profile.disabled_rules.insert("excess-property");
  const TypeId literal = w.literal_obj({{"a", w.num(1)}, {"b", k_string}});
  EXPECT_TRUE(w.solver->assignable(literal, w.obj({{"a", k_number}}), profile).ok);
}

TEST(LawyerObjects, ReadonlyLaxityFollowsProfile)
{
  TypeWorld w;
  const TypeId ro = w.obj({{"a", k_number, false, true}});
  const TypeId rw = w.obj({{"a", k_number}});
  EXPECT_TRUE(w.assignable(ro, rw));
  EXPECT_FALSE(w.solver->assignable(ro, rw, CompatProfile::strict()).ok);
}

TEST(LawyerObjects, ExactOptionalPropertiesFollowProfile)
{
  TypeWorld w;
  const TypeId target = w.obj({{"a", k_number, true}});
  const TypeId explicit_undefined = w.obj({{"a", k_undefined}});
  EXPECT_TRUE(w.assignable(explicit_undefined, target));
  EXPECT_FALSE(w.solver->assignable(explicit_undefined, target, CompatProfile::strict()).ok);
}

// ============================================================================
// Signatures
// ============================================================================

TEST(LawyerSignatures, AnythingReturnsToVoid)
{
  TypeWorld w;
  const TypeId returns_number = w.fn({}, k_number);
  const TypeId returns_void = w.fn({}, k_void);
  EXPECT_TRUE(w.assignable(returns_number, returns_void));
  EXPECT_FALSE(w.subtype(returns_number, returns_void));

  CompatProfile profile;
  profile.disabled_rules.insert("void-return");
  EXPECT_FALSE(w.solver->assignable(returns_number, returns_void, profile).ok);
}

TEST(LawyerSignatures, MethodParametersAreBivariant)
{
  TypeWorld w;
  const TypeId narrow = w.fn({w.str("a")}, k_void, true);
  const TypeId wide = w.fn({k_string}, k_void, true);
  EXPECT_TRUE(w.assignable(narrow, wide));
  EXPECT_FALSE(w.solver->assignable(narrow, wide, CompatProfile::strict()).ok);
}

TEST(LawyerSignatures, FunctionParametersAreContravariant)
{
  TypeWorld w;
  const TypeId narrow = w.fn({w.str("a")}, k_void);
  const TypeId wide = w.fn({k_string}, k_void);
  EXPECT_TRUE(w.assignable(wide, narrow));

  const Assignability result = w.solver->assignable(narrow, wide);
  ASSERT_FALSE(result.ok);
  EXPECT_EQ(result.reason->kind, FailureKind::ParameterIncompatible);
  EXPECT_EQ(result.reason->index, 0u);

  EXPECT_TRUE(w.solver->assignable(narrow, wide, CompatProfile::legacy()).ok);
}

TEST(LawyerSignatures, MethodMembersOfObjects)
{
  TypeWorld w;
  const TypeId handler = w.obj({{"on", w.fn({w.str("click")}, k_void, true), false, false, true}});
  const TypeId general = w.obj({{"on", w.fn({k_string}, k_void, true), false, false, true}});
  EXPECT_TRUE(w.assignable(handler, general));
}

TEST(LawyerSignatures, GlobalFunctionAcceptsCallables)
{
  TypeWorld w;
  const TypeId function_iface =
    w.interface("Function", w.obj({{"apply", w.fn({}, k_any, true), false, false, true}}));
  w.env.set_global_function(function_iface);

  EXPECT_TRUE(w.assignable(w.fn({k_string}, k_number), function_iface));
  EXPECT_TRUE(w.assignable(k_function, function_iface));
  EXPECT_FALSE(w.assignable(k_string, function_iface));
}

// ============================================================================
// Generics and Primitives
// ============================================================================

TEST(LawyerGenerics, TypeParameterUsesItsConstraint)
{
  TypeWorld w;
  const auto t = w.type_param("T", k_string);
  const TypeId param = w.param_type(t);
  EXPECT_TRUE(w.assignable(param, k_string));
  EXPECT_FALSE(w.assignable(param, k_number));
  EXPECT_FALSE(w.subtype(param, k_string));
}

TEST(LawyerPrimitives, ApparentMembers)
{
  TypeWorld w;
  EXPECT_TRUE(w.assignable(k_string, w.obj({{"length", k_number}})));
  EXPECT_TRUE(w.assignable(w.str("abc"), w.obj({{"length", k_number}})));
  EXPECT_FALSE(w.assignable(k_number, w.obj({{"length", k_number}})));
  EXPECT_FALSE(w.subtype(k_string, w.obj({{"length", k_number}})));
}

TEST(LawyerProfiles, LegacyNullAndUndefined)
{
  TypeWorld w;
  EXPECT_FALSE(w.assignable(k_null, k_string));
  EXPECT_TRUE(w.solver->assignable(k_null, k_string, CompatProfile::legacy()).ok);
  EXPECT_TRUE(w.solver->assignable(k_undefined, w.obj({{"a", k_number}}), CompatProfile::legacy()).ok);
}

TEST(LawyerProfiles, Presets)
{
  const CompatProfile strict = CompatProfile::strict();
  EXPECT_TRUE(strict.exact_optional_property_types);
  EXPECT_FALSE(strict.bivariant_method_check);
  EXPECT_FALSE(strict.readonly_property_laxity);

  const CompatProfile legacy = CompatProfile::legacy();
  EXPECT_FALSE(legacy.strict_null_checks);
  EXPECT_FALSE(legacy.strict_function_types);

  const CompatProfile def = CompatProfile::reference_default();
  EXPECT_TRUE(def.strict_null_checks);
  EXPECT_TRUE(def.disabled_rules.empty());
}

// ============================================================================
// Rule Set
// ============================================================================

TEST(LawyerRuleSet, DefaultOrder)
{
  const RuleSet rules = RuleSet::defaults();
  const std::vector<std::string> names = rules.names();
  ASSERT_EQ(names.size(), 16u);
  EXPECT_EQ(names.front(), "identity");
  EXPECT_EQ(names[1], "error-poisoning");
  EXPECT_EQ(names[10], "weak-type");
  EXPECT_EQ(names[11], "excess-property");
  EXPECT_EQ(names.back(), "method-bivariance");

  const CompatRule * void_return = rules.find("void-return");
  ASSERT_NE(void_return, nullptr);
  EXPECT_EQ(void_return->stage, RuleStage::Return);
  EXPECT_EQ(rules.find("no-such-rule"), nullptr);
}

TEST(LawyerRuleSet, InsertAndRemove)
{
  RuleSet rules = RuleSet::defaults();
  const auto noop = [](RuleContext &) { return RuleOutcome::defer(); };

  EXPECT_TRUE(rules.insert_before("weak-type", {"before-weak", RuleStage::Relation, noop}));
  EXPECT_TRUE(rules.insert_after("weak-type", {"after-weak", RuleStage::Relation, noop}));
  EXPECT_FALSE(rules.insert_after("missing", {"orphan", RuleStage::Relation, noop}));

  const auto names = rules.names();
  EXPECT_EQ(names[10], "before-weak");
  EXPECT_EQ(names[11], "weak-type");
  EXPECT_EQ(names[12], "after-weak");

  EXPECT_TRUE(rules.remove("before-weak"));
  EXPECT_FALSE(rules.remove("before-weak"));
  EXPECT_EQ(rules.names().size(), 17u);
}

TEST(LawyerRuleSet, CustomRuleRunsInOrder)
{
  TypeWorld w;
  // Treat bigint as incompatible with everything except itself.
  w.solver->lawyer().rules().insert_after(
    "identity", {"no-bigint", RuleStage::Relation, [](RuleContext & rc) {
                   if (rc.source == k_bigint) {
                     return RuleOutcome::fail(
                       FailureReason::make(FailureKind::TypeMismatch, rc.source, rc.target));
                   }
                   return RuleOutcome::defer();
                 }});

  EXPECT_FALSE(w.assignable(k_bigint, k_any));
  EXPECT_TRUE(w.assignable(k_bigint, k_bigint));
  EXPECT_TRUE(w.assignable(k_number, k_any));

  CompatProfile profile;
  profile.disabled_rules.insert("no-bigint");
  EXPECT_TRUE(w.solver->assignable(k_bigint, k_any, profile).ok);
}

TEST(LawyerRuleSet, ToggleGatesRule)
{
  CompatRule rule{"gated", RuleStage::Relation, rule_identity, &CompatProfile::enum_nominality};
  CompatProfile profile;
  EXPECT_TRUE(rule.enabled(profile));
  profile.enum_nominality = false;
  EXPECT_FALSE(rule.enabled(profile));

  CompatRule always{"always", RuleStage::Relation, rule_identity};
  profile.disabled_rules.insert("always");
  EXPECT_FALSE(always.enabled(profile));
}

// tscore/lawyer/compat_rules.cpp - Named assignability rules
//
// Rules see the normalized (resolved, reduced) source and target of one
// relation step. Nested comparisons go back through Judge::relate so that
// the query's memo, budgets and rules apply to them too.
//
#include "tscore/lawyer/compat_rules.hpp"

#include <algorithm>
#include <optional>
#include <utility>

#include "tscore/basic/casting.hpp"
#include "tscore/env/environment.hpp"
#include "tscore/eval/evaluator.hpp"
#include "tscore/judge/judge.hpp"

namespace tscore
{

namespace
{

RuleOutcome fail_with(FailureKind kind, const RuleContext & rc)
{
  return RuleOutcome::fail(FailureReason::make(kind, rc.source, rc.target));
}

/// Pass if `source` relates to `target`, else fail with the nested reason.
RuleOutcome relate_or_fail(RuleContext & rc, TypeId source, TypeId target)
{
  FailureReason inner = FailureReason::make(FailureKind::TypeMismatch, source, target);
  if (rc.judge.relate(source, target, rc.ctx, &inner)) return RuleOutcome::pass();
  return RuleOutcome::fail(std::move(inner));
}

const TypeKey * key_of(const RuleContext & rc, TypeId id)
{
  if (!id.is_valid() || id.is_intrinsic()) return nullptr;
  return &rc.interner.lookup(id);
}

const EnumKey * enum_of(const RuleContext & rc, TypeId id)
{
  const TypeKey * key = key_of(rc, id);
  return key ? dyn_cast<EnumKey>(*key) : nullptr;
}

/// The enum declaring `def` (the enum itself for an enum DefId).
DefId enum_owner(const Environment & env, DefId def)
{
  const DefinitionInfo * info = env.find(def);
  if (info && info->kind == DefKind::EnumMember && info->parent.is_valid()) return info->parent;
  return def;
}

/// Literal kind shared by every member, nullopt for a mixed enum.
std::optional<LiteralKind> enum_literal_kind(const RuleContext & rc, const EnumKey & e)
{
  std::optional<LiteralKind> kind;
  for (TypeId m : rc.interner.type_list(e.members)) {
    const LiteralValue * v = rc.interner.literal_value(m);
    if (!v) return std::nullopt;
    if (kind && *kind != v->kind) return std::nullopt;
    kind = v->kind;
  }
  if (!kind) {
    if (e.kind == EnumKind::String) return LiteralKind::String;
    if (e.kind == EnumKind::Numeric) return LiteralKind::Number;
  }
  return kind;
}

bool is_string_like(const RuleContext & rc, TypeId id)
{
  if (id == k_string) return true;
  if (const LiteralValue * v = rc.interner.literal_value(id)) return v->kind == LiteralKind::String;
  const TypeKey * key = key_of(rc, id);
  return key && (isa<TemplateLiteralKey>(*key) || isa<StringIntrinsicKey>(*key));
}

bool is_nullish(TypeId id) { return id == k_null || id == k_undefined || id == k_void; }

/// Matches either the library slot's id or its resolved form.
bool is_slot(RuleContext & rc, TypeId id, TypeId slot)
{
  if (!slot.is_valid()) return false;
  return id == slot || id == rc.judge.normalize(slot, rc.ctx);
}

const ObjectShape * target_shape(const RuleContext & rc)
{
  const TypeKey * key = key_of(rc, rc.target);
  if (!key) return nullptr;
  if (const auto * obj = dyn_cast<ObjectKey>(*key)) return &rc.interner.object_shape(obj->shape);
  return nullptr;
}

bool is_weak(const ObjectShape & shape)
{
  if (shape.properties.empty() || shape.string_index || shape.number_index) return false;
  return std::all_of(shape.properties.begin(), shape.properties.end(), [](const PropertyInfo & p) {
    return p.optional;
  });
}

bool is_numeric_name(const std::string & name)
{
  return !name.empty() &&
         std::all_of(name.begin(), name.end(), [](char c) { return c >= '0' && c <= '9'; });
}

/// Object members of the target that a fresh literal is checked against.
/// Returns false when the target accepts arbitrary member names.
bool collect_target_shapes(RuleContext & rc, std::vector<const ObjectShape *> & out)
{
  std::vector<TypeId> pending = rc.interner.union_members(rc.target);
  while (!pending.empty()) {
    const TypeId m = rc.judge.normalize(pending.back(), rc.ctx);
    pending.pop_back();
    if (m == k_any || m == k_unknown || m == k_object) return false;
    const TypeKey * key = key_of(rc, m);
    if (!key) continue;
    if (const auto * obj = dyn_cast<ObjectKey>(*key)) {
      const ObjectShape & shape = rc.interner.object_shape(obj->shape);
      if (shape.empty() || shape.string_index) return false;
      out.push_back(&shape);
    } else if (const auto * inter = dyn_cast<IntersectionKey>(*key)) {
      for (TypeId part : rc.interner.type_list(inter->members)) pending.push_back(part);
    } else if (isa<TypeParameterKey>(*key) || isa<MappedKey>(*key)) {
      return false;
    }
  }
  return true;
}

}  // namespace

// ============================================================================
// Rule Set
// ============================================================================

RuleSet RuleSet::defaults()
{
  RuleSet set;
  set.append({"identity", RuleStage::Relation, rule_identity});
  set.append({"error-poisoning", RuleStage::Relation, rule_error_poisoning});
  set.append(
    {"any-propagation", RuleStage::Relation, rule_any_propagation, &CompatProfile::any_propagation});
  set.append({"unknown-top-never-bottom", RuleStage::Relation, rule_unknown_top_never_bottom});
  set.append({"legacy-null-undefined", RuleStage::Relation, rule_legacy_null_undefined});
  set.append(
    {"enum-nominality", RuleStage::Relation, rule_enum_nominality, &CompatProfile::enum_nominality});
  set.append({"string-enum-opacity", RuleStage::Relation, rule_string_enum_opacity,
              &CompatProfile::string_enum_opacity});
  set.append({"numeric-enum-openness", RuleStage::Relation, rule_numeric_enum_openness,
              &CompatProfile::enum_nominality});
  set.append({"global-function-type", RuleStage::Relation, rule_global_function_type,
              &CompatProfile::global_function_type});
  set.append({"base-constraint", RuleStage::Relation, rule_base_constraint,
              &CompatProfile::base_constraint_assignability});
  set.append(
    {"weak-type", RuleStage::Relation, rule_weak_type, &CompatProfile::weak_type_detection});
  set.append({"excess-property", RuleStage::Relation, rule_excess_property,
              &CompatProfile::excess_property_check});
  set.append({"root-object", RuleStage::Relation, rule_root_object,
              &CompatProfile::root_object_accepts_all});
  set.append({"apparent-primitive-members", RuleStage::Relation, rule_apparent_primitive_members,
              &CompatProfile::apparent_primitive_members});
  set.append(
    {"void-return", RuleStage::Return, rule_void_return, &CompatProfile::void_return_exception});
  set.append({"method-bivariance", RuleStage::Parameter, rule_method_bivariance});
  return set;
}

void RuleSet::append(CompatRule rule) { rules_.push_back(std::move(rule)); }

std::vector<CompatRule>::iterator RuleSet::position_of(std::string_view name)
{
  return std::find_if(
    rules_.begin(), rules_.end(), [&](const CompatRule & r) { return r.name == name; });
}

bool RuleSet::insert_before(std::string_view anchor, CompatRule rule)
{
  auto it = position_of(anchor);
  if (it == rules_.end()) return false;
  rules_.insert(it, std::move(rule));
  return true;
}

bool RuleSet::insert_after(std::string_view anchor, CompatRule rule)
{
  auto it = position_of(anchor);
  if (it == rules_.end()) return false;
  rules_.insert(it + 1, std::move(rule));
  return true;
}

bool RuleSet::remove(std::string_view name)
{
  auto it = position_of(name);
  if (it == rules_.end()) return false;
  rules_.erase(it);
  return true;
}

const CompatRule * RuleSet::find(std::string_view name) const
{
  for (const auto & r : rules_) {
    if (r.name == name) return &r;
  }
  return nullptr;
}

std::vector<std::string> RuleSet::names() const
{
  std::vector<std::string> out;
  out.reserve(rules_.size());
  for (const auto & r : rules_) out.push_back(r.name);
  return out;
}

// ============================================================================
// Sentinels
// ============================================================================

RuleOutcome rule_identity(RuleContext & rc)
{
  return rc.source == rc.target ? RuleOutcome::pass() : RuleOutcome::defer();
}

RuleOutcome rule_error_poisoning(RuleContext & rc)
{
  if (rc.source != k_unresolved && rc.target != k_unresolved) return RuleOutcome::defer();
  if (rc.source == k_any || rc.target == k_any) return RuleOutcome::pass();
  return fail_with(FailureKind::UnresolvedReference, rc);
}

RuleOutcome rule_any_propagation(RuleContext & rc)
{
  if (rc.target == k_any) return RuleOutcome::pass();
  if (rc.source != k_any) return RuleOutcome::defer();
  if (rc.target == k_never) return fail_with(FailureKind::TypeMismatch, rc);
  return RuleOutcome::pass();
}

RuleOutcome rule_unknown_top_never_bottom(RuleContext & rc)
{
  if (rc.target == k_unknown || rc.source == k_never) return RuleOutcome::pass();
  if (rc.source == k_unknown || rc.target == k_never) {
    return fail_with(FailureKind::TypeMismatch, rc);
  }
  return RuleOutcome::defer();
}

RuleOutcome rule_legacy_null_undefined(RuleContext & rc)
{
  if (rc.profile.strict_null_checks) return RuleOutcome::defer();
  if (rc.source == k_null || rc.source == k_undefined) return RuleOutcome::pass();
  return RuleOutcome::defer();
}

// ============================================================================
// Enums
// ============================================================================

RuleOutcome rule_enum_nominality(RuleContext & rc)
{
  const EnumKey * se = enum_of(rc, rc.source);
  const EnumKey * te = enum_of(rc, rc.target);
  if (!se || !te) return RuleOutcome::defer();

  const DefId owner = enum_owner(rc.env, se->def);
  if (owner != enum_owner(rc.env, te->def)) return fail_with(FailureKind::EnumOpacityViolation, rc);

  // Same enum: a member fits the whole enum, distinct members never fit each other.
  if (te->def == owner) return RuleOutcome::pass();
  return fail_with(FailureKind::EnumOpacityViolation, rc);
}

RuleOutcome rule_string_enum_opacity(RuleContext & rc)
{
  const EnumKey * se = enum_of(rc, rc.source);
  const EnumKey * te = enum_of(rc, rc.target);

  if (se && !te && enum_literal_kind(rc, *se) == LiteralKind::String &&
      is_string_like(rc, rc.target)) {
    return fail_with(FailureKind::EnumOpacityViolation, rc);
  }
  if (te && !se && enum_literal_kind(rc, *te) == LiteralKind::String &&
      is_string_like(rc, rc.source)) {
    return fail_with(FailureKind::EnumOpacityViolation, rc);
  }
  return RuleOutcome::defer();
}

RuleOutcome rule_numeric_enum_openness(RuleContext & rc)
{
  // Members widen to number structurally; only the way back is closed.
  if (rc.source != k_number) return RuleOutcome::defer();
  const EnumKey * te = enum_of(rc, rc.target);
  if (te && enum_literal_kind(rc, *te) == LiteralKind::Number) {
    return fail_with(FailureKind::EnumOpacityViolation, rc);
  }
  return RuleOutcome::defer();
}

// ============================================================================
// Library Types
// ============================================================================

RuleOutcome rule_global_function_type(RuleContext & rc)
{
  const TypeId global = rc.env.global_function();
  if (!global.is_valid()) return RuleOutcome::defer();

  if (is_slot(rc, rc.target, global)) {
    if (rc.source == k_function) return RuleOutcome::pass();
    const TypeKey * sk = key_of(rc, rc.source);
    if (sk && (isa<FunctionKey>(*sk) || isa<ConstructorKey>(*sk))) return RuleOutcome::pass();
  }
  if (rc.target == k_function && is_slot(rc, rc.source, global)) return RuleOutcome::pass();
  return RuleOutcome::defer();
}

RuleOutcome rule_base_constraint(RuleContext & rc)
{
  const TypeKey * sk = key_of(rc, rc.source);
  const auto * tp = sk ? dyn_cast<TypeParameterKey>(*sk) : nullptr;
  if (!tp) return RuleOutcome::defer();

  TypeId constraint = tp->info.constraint;
  if (!constraint.is_valid()) constraint = rc.env.type_param_constraint(tp->info.def);
  if (!constraint.is_valid() || constraint == rc.source) return RuleOutcome::defer();
  return relate_or_fail(rc, constraint, rc.target);
}

RuleOutcome rule_root_object(RuleContext & rc)
{
  if (!is_slot(rc, rc.target, rc.env.root_object())) return RuleOutcome::defer();
  if (is_nullish(rc.source)) return RuleOutcome::defer();
  return RuleOutcome::pass();
}

RuleOutcome rule_apparent_primitive_members(RuleContext & rc)
{
  if (!target_shape(rc)) return RuleOutcome::defer();

  const TypeKey & sk = rc.interner.lookup(rc.source);
  bool primitive_like = isa<LiteralKey>(sk) || isa<TemplateLiteralKey>(sk) ||
                        isa<StringIntrinsicKey>(sk) || isa<EnumKey>(sk);
  if (const auto * intr = dyn_cast<IntrinsicKey>(sk)) primitive_like = is_primitive_kind(intr->kind);
  if (!primitive_like) return RuleOutcome::defer();

  const TypeId apparent = rc.evaluator.apparent_type(rc.source, rc.ctx);
  if (apparent == rc.source || !apparent.is_valid()) return RuleOutcome::defer();
  return relate_or_fail(rc, apparent, rc.target);
}

// ============================================================================
// Object Literals
// ============================================================================

RuleOutcome rule_weak_type(RuleContext & rc)
{
  const ObjectShape * t = target_shape(rc);
  if (!t || !is_weak(*t)) return RuleOutcome::defer();

  const TypeKey * sk = key_of(rc, rc.source);
  if (!sk || !isa<ObjectKey>(*sk)) return RuleOutcome::defer();
  const ObjectShape & s = rc.interner.object_shape(cast<ObjectKey>(*sk).shape);
  if (s.properties.empty()) return RuleOutcome::defer();

  for (const auto & p : s.properties) {
    if (t->find(p.name)) return RuleOutcome::defer();
  }
  return fail_with(FailureKind::WeakTypeNoOverlap, rc);
}

RuleOutcome rule_excess_property(RuleContext & rc)
{
  const TypeKey * sk = key_of(rc, rc.source);
  const auto * sobj = sk ? dyn_cast<ObjectKey>(*sk) : nullptr;
  if (!sobj) return RuleOutcome::defer();
  const ObjectShape & s = rc.interner.object_shape(sobj->shape);
  if (!s.is_fresh) return RuleOutcome::defer();

  // Freshness is consumed here: the rest of the step compares the regular type.
  const TypeId regular = rc.interner.widen_freshness(rc.source);

  std::vector<const ObjectShape *> shapes;
  if (!collect_target_shapes(rc, shapes) || shapes.empty()) {
    return relate_or_fail(rc, regular, rc.target);
  }

  const PropertyInfo * excess = nullptr;
  for (const auto & p : s.properties) {
    const bool known = std::any_of(shapes.begin(), shapes.end(), [&](const ObjectShape * t) {
      return t->find(p.name) || (t->number_index && is_numeric_name(p.name));
    });
    if (!known) {
      excess = &p;
      break;
    }
  }
  if (!excess) return relate_or_fail(rc, regular, rc.target);

  // A mismatch on a member both sides declare outranks the excess member.
  if (shapes.size() == 1) {
    for (const auto & p : s.properties) {
      const PropertyInfo * tp = shapes.front()->find(p.name);
      if (!tp) continue;
      TypeId expected = tp->read_type;
      if (tp->optional && !rc.profile.exact_optional_property_types) {
        expected = rc.interner.union_of({expected, k_undefined});
      }
      FailureReason inner = FailureReason::make(FailureKind::TypeMismatch, p.read_type, expected);
      if (!rc.judge.relate(p.read_type, expected, rc.ctx, &inner)) {
        FailureReason reason =
          FailureReason::make(FailureKind::PropertyTypeMismatch, rc.source, rc.target);
        reason.with_member(p.name).with_nested(std::move(inner));
        return RuleOutcome::fail(std::move(reason));
      }
    }
  }

  FailureReason reason = FailureReason::make(FailureKind::ExcessProperty, rc.source, rc.target);
  reason.with_member(excess->name);
  return RuleOutcome::fail(std::move(reason));
}

// ============================================================================
// Signature Hooks
// ============================================================================

RuleOutcome rule_void_return(RuleContext & rc)
{
  return rc.target == k_void ? RuleOutcome::pass() : RuleOutcome::defer();
}

RuleOutcome rule_method_bivariance(RuleContext & rc)
{
  const bool bivariant = !rc.profile.strict_function_types ||
                         (rc.method_like && rc.profile.bivariant_method_check);
  if (!bivariant) return RuleOutcome::defer();

  FailureReason inner = FailureReason::make(FailureKind::TypeMismatch, rc.target, rc.source);
  if (rc.judge.relate(rc.target, rc.source, rc.ctx, &inner)) return RuleOutcome::pass();
  if (rc.judge.relate(rc.source, rc.target, rc.ctx)) return RuleOutcome::pass();
  return RuleOutcome::fail(std::move(inner));
}

}  // namespace tscore

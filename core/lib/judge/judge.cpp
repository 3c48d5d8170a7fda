// tscore/judge/judge.cpp - Structural relation engine
//
#include "tscore/judge/judge.hpp"

#include <algorithm>
#include <limits>
#include <string>
#include <utility>

#include "tscore/basic/casting.hpp"
#include "tscore/basic/number_format.hpp"
#include "tscore/eval/type_reducer.hpp"
#include "tscore/judge/relation_hooks.hpp"
#include "tscore/judge/template_match.hpp"

namespace tscore
{

namespace
{

bool fail(FailureReason * why, FailureReason reason)
{
  if (why) *why = std::move(reason);
  return false;
}

bool fail_mismatch(FailureReason * why, TypeId source, TypeId target)
{
  return fail(why, FailureReason::make(FailureKind::TypeMismatch, source, target));
}

bool fail_budget(FailureReason * why, TypeId source, TypeId target)
{
  return fail(why, FailureReason::make(FailureKind::BudgetExceeded, source, target));
}

bool is_derived(const TypeKey & key)
{
  return isa<ApplicationKey>(key) || isa<ConditionalKey>(key) || isa<MappedKey>(key) ||
         isa<KeyOfKey>(key) || isa<IndexAccessKey>(key) || isa<StringIntrinsicKey>(key);
}

bool is_object_like(const TypeKey & key)
{
  return isa<ObjectKey>(key) || isa<ArrayKey>(key) || isa<ReadonlyArrayKey>(key) ||
         isa<TupleKey>(key) || isa<FunctionKey>(key) || isa<ConstructorKey>(key) ||
         isa<MappedKey>(key);
}

/// Primitive values, which reach object targets through their apparent type.
bool is_primitive_like(const TypeKey & key)
{
  if (const auto * intr = dyn_cast<IntrinsicKey>(key)) return is_primitive_kind(intr->kind);
  return isa<LiteralKey>(key) || isa<TemplateLiteralKey>(key) || isa<StringIntrinsicKey>(key);
}

/// Parameter type at position `i`, looking through a trailing rest parameter.
TypeId param_type_at(gsl::span<const ParamInfo> params, size_t i, TypeId rest_element)
{
  if (i < params.size() && !params[i].rest) return params[i].type;
  if (!params.empty() && params.back().rest && i >= params.size() - 1) return rest_element;
  return k_invalid_type;
}

}  // namespace

Judge::Judge(Environment & env) : env_(env), interner_(env.interner()) {}

// ============================================================================
// Top-level Queries
// ============================================================================

bool Judge::subtype(TypeId source, TypeId target, QueryContext & ctx)
{
  StrictScope strict(ctx);
  return relate(source, target, ctx);
}

bool Judge::identical(TypeId a, TypeId b, QueryContext & ctx)
{
  if (a == b) return true;
  StrictScope strict(ctx);
  const TypeId na = normalize(a, ctx);
  const TypeId nb = normalize(b, ctx);
  if (na == nb) return true;
  return relate(a, b, ctx) && relate(b, a, ctx);
}

std::optional<FailureReason> Judge::explain(TypeId source, TypeId target, QueryContext & ctx)
{
  const bool saved = ctx.explaining;
  ctx.explaining = true;
  FailureReason why = FailureReason::make(FailureKind::TypeMismatch, source, target);
  const bool ok = relate(source, target, ctx, &why);
  ctx.explaining = saved;
  if (ok) return std::nullopt;
  return why;
}

// ============================================================================
// Relation Step
// ============================================================================

bool Judge::relate(TypeId source, TypeId target, QueryContext & ctx, FailureReason * why)
{
  if (source == target) return true;
  if (!source.is_valid() || !target.is_valid()) return fail_mismatch(why, source, target);

  if (!ctx.guard.consume_operation()) return fail_budget(why, source, target);

  QueryGuard::DepthScope depth(ctx.guard, BudgetKind::RelationDepth);
  if (!depth.ok()) return fail_budget(why, source, target);

  const RelationKey key{source, target, ctx.relation_kind()};
  if (auto it = ctx.relations.find(key); it != ctx.relations.end()) {
    switch (it->second.state) {
      case MemoState::InProgress:
        ctx.assumption_floor = std::min(ctx.assumption_floor, it->second.depth);
        return true;
      case MemoState::Holds:
        return true;
      case MemoState::Fails:
        // A cached failure carries no reason; re-walk it when one is wanted.
        if (!why) return false;
        break;
    }
  }

  if (ctx.in_progress >= ctx.guard.limits().max_in_progress_pairs) {
    ctx.guard.record_truncation(
      BudgetKind::InProgressPairs,
      "limit " + std::to_string(ctx.guard.limits().max_in_progress_pairs));
    return fail_budget(why, source, target);
  }

  const uint32_t my_depth = ++ctx.relation_depth;
  ctx.relations[key] = RelationMemoEntry{MemoState::InProgress, my_depth};
  ++ctx.in_progress;
  const uint32_t truncations_before = ctx.guard.truncation_count();

  const bool result = relate_step(source, target, ctx, why);

  --ctx.in_progress;
  --ctx.relation_depth;

  if (ctx.guard.truncation_count() != truncations_before) {
    // A budget ran out below this pair; the answer is conservative, not proven.
    ctx.relations.erase(key);
    if (ctx.assumption_floor >= my_depth) {
      ctx.assumption_floor = std::numeric_limits<uint32_t>::max();
    }
  } else if (!result) {
    // Assumptions only ever make more pairs hold, so a failure is final.
    ctx.relations[key].state = MemoState::Fails;
  } else if (ctx.assumption_floor < my_depth) {
    // Provisional: depends on an enclosing pair that has not completed yet.
    ctx.relations.erase(key);
  } else {
    ctx.relations[key].state = MemoState::Holds;
    if (ctx.assumption_floor == my_depth) {
      ctx.assumption_floor = std::numeric_limits<uint32_t>::max();
    }
  }
  return result;
}

bool Judge::relate_step(TypeId source, TypeId target, QueryContext & ctx, FailureReason * why)
{
  const TypeId ns = normalize(source, ctx);
  const TypeId nt = normalize(target, ctx);
  if (ns != source || nt != target) {
    if (ns == nt) return true;
    return relate(ns, nt, ctx, why);
  }

  if (ctx.hooks) {
    const RuleOutcome outcome = ctx.hooks->before_relate(*this, source, target, ctx);
    if (outcome.verdict == RuleVerdict::Pass) return true;
    if (outcome.verdict == RuleVerdict::Fail) {
      if (outcome.reason) {
        return fail(why, *outcome.reason);
      }
      return fail_mismatch(why, source, target);
    }
  }

  return relate_structural(source, target, ctx, why);
}

TypeId Judge::normalize(TypeId id, QueryContext & ctx)
{
  const uint32_t max_steps = ctx.guard.limits().max_evaluation_depth;
  for (uint32_t step = 0; step < max_steps; ++step) {
    if (id.is_intrinsic() || !id.is_valid()) return id;
    const TypeKey & key = interner_.lookup(id);

    if (const auto * lazy = dyn_cast<LazyKey>(key)) {
      const Resolution r = env_.resolve(lazy->def, ctx.resolution, ctx.diagnostics());
      if (r.status == ResolveStatus::InProgress) return id;
      id = r.type;
      continue;
    }
    if (const auto * query = dyn_cast<TypeQueryKey>(key)) {
      const Resolution r = env_.resolve(query->def, ctx.resolution, ctx.diagnostics());
      if (!r.info || !r.info->value_type.is_valid()) return k_unresolved;
      id = r.info->value_type;
      continue;
    }
    if (is_derived(key)) {
      if (!ctx.reducer) return id;
      const TypeId reduced = ctx.reducer->reduce(id, ctx);
      if (reduced == id) return id;
      id = reduced;
      continue;
    }
    return id;
  }
  return id;
}

// ============================================================================
// Structural Rules
// ============================================================================

bool Judge::relate_structural(
  TypeId source, TypeId target, QueryContext & ctx, FailureReason * why)
{
  // Unresolved references relate only to themselves and any.
  if (target == k_unresolved || source == k_unresolved) {
    if (source == k_any || target == k_any) return true;
    return fail(why, FailureReason::make(FailureKind::UnresolvedReference, source, target));
  }
  if (target == k_any || target == k_unknown) return true;
  if (source == k_never) return true;
  if (source == k_any && ctx.extends_check) return true;
  if (source == k_any || target == k_never) return fail_mismatch(why, source, target);

  const TypeKey & ks = interner_.lookup(source);
  const TypeKey & kt = interner_.lookup(target);

  // ---------------------------------------------------------------------------
  // Unions and intersections
  // ---------------------------------------------------------------------------

  if (const auto * u = dyn_cast<UnionKey>(ks)) {
    for (TypeId m : interner_.type_list(u->members)) {
      if (!relate(m, target, ctx, why)) return false;
    }
    return true;
  }

  if (const auto * i = dyn_cast<IntersectionKey>(kt)) {
    for (TypeId m : interner_.type_list(i->members)) {
      if (!relate(source, m, ctx, why)) return false;
    }
    return true;
  }

  if (const auto * u = dyn_cast<UnionKey>(kt)) {
    for (TypeId m : interner_.type_list(u->members)) {
      if (relate(source, m, ctx)) return true;
    }
    if (const auto * i = dyn_cast<IntersectionKey>(ks)) {
      if (relate_intersection_source(source, interner_.type_list(i->members), target, ctx)) {
        return true;
      }
    }
    return fail_mismatch(why, source, target);
  }

  if (const auto * i = dyn_cast<IntersectionKey>(ks)) {
    if (relate_intersection_source(source, interner_.type_list(i->members), target, ctx)) {
      return true;
    }
    return fail_mismatch(why, source, target);
  }

  // ---------------------------------------------------------------------------
  // Type parameters and other opaque forms relate only to themselves
  // ---------------------------------------------------------------------------

  if (isa<TypeParameterKey>(ks) || isa<TypeParameterKey>(kt) || isa<InferKey>(ks) ||
      isa<InferKey>(kt) || isa<ThisTypeKey>(ks) || isa<ThisTypeKey>(kt)) {
    return fail_mismatch(why, source, target);
  }

  // ---------------------------------------------------------------------------
  // Enums relate through their member union
  // ---------------------------------------------------------------------------

  if (const auto * e = dyn_cast<EnumKey>(ks)) {
    const auto members = interner_.type_list(e->members);
    const TypeId as_union = interner_.union_of({members.begin(), members.end()});
    if (as_union == source) return fail_mismatch(why, source, target);
    return relate(as_union, target, ctx, why);
  }
  if (const auto * e = dyn_cast<EnumKey>(kt)) {
    const auto members = interner_.type_list(e->members);
    const TypeId as_union = interner_.union_of({members.begin(), members.end()});
    if (as_union == target) return fail_mismatch(why, source, target);
    return relate(source, as_union, ctx, why);
  }

  // ---------------------------------------------------------------------------
  // Primitive source against an object target (conditional extends only)
  // ---------------------------------------------------------------------------

  if (ctx.extends_check && is_primitive_like(ks)) {
    if (const auto * tobj = dyn_cast<ObjectKey>(kt)) {
      const TypeId root = env_.root_object();
      if (root.is_valid() && target == normalize(root, ctx)) return true;
      if (interner_.object_shape(tobj->shape).empty()) return true;
      if (ctx.reducer) {
        const TypeId apparent = ctx.reducer->apparent_type(source, ctx);
        if (apparent.is_valid() && apparent != source) return relate(apparent, target, ctx, why);
      }
      return fail_mismatch(why, source, target);
    }
  }

  // ---------------------------------------------------------------------------
  // Intrinsic source
  // ---------------------------------------------------------------------------

  if (const auto * intr = dyn_cast<IntrinsicKey>(ks)) {
    switch (intr->kind) {
      case IntrinsicKind::Undefined:
        if (target == k_void) return true;
        break;
      case IntrinsicKind::Object:
      case IntrinsicKind::Function:
        if (target == k_object) return true;
        if (const auto * obj = dyn_cast<ObjectKey>(kt)) {
          if (interner_.object_shape(obj->shape).empty()) return true;
        }
        break;
      default:
        break;
    }
    return fail_mismatch(why, source, target);
  }

  // ---------------------------------------------------------------------------
  // Intrinsic target
  // ---------------------------------------------------------------------------

  if (isa<IntrinsicKey>(kt)) {
    if (target == k_object) {
      if (is_object_like(ks)) return true;
      return fail_mismatch(why, source, target);
    }
    if (target == k_function) {
      if (isa<FunctionKey>(ks) || isa<ConstructorKey>(ks)) return true;
      return fail_mismatch(why, source, target);
    }
    if (interner_.widen_literal(source) == target) return true;
    if (target == k_string && (isa<TemplateLiteralKey>(ks) || isa<StringIntrinsicKey>(ks))) {
      return true;
    }
    return fail_mismatch(why, source, target);
  }

  // ---------------------------------------------------------------------------
  // Literal and template literal targets
  // ---------------------------------------------------------------------------

  if (isa<LiteralKey>(kt)) return fail_mismatch(why, source, target);

  if (const auto * tl = dyn_cast<TemplateLiteralKey>(kt)) {
    if (const LiteralValue * v = interner_.literal_value(source)) {
      if (v->kind == LiteralKind::String &&
          match_template(interner_, v->text, interner_.span_list(tl->spans))) {
        return true;
      }
    }
    return fail_mismatch(why, source, target);
  }

  // ---------------------------------------------------------------------------
  // Object target
  // ---------------------------------------------------------------------------

  if (const auto * tobj = dyn_cast<ObjectKey>(kt)) {
    const ObjectShape & tshape = interner_.object_shape(tobj->shape);
    if (const auto * sobj = dyn_cast<ObjectKey>(ks)) {
      return relate_object(
        source, interner_.object_shape(sobj->shape), target, tshape, ctx, why);
    }
    if (is_object_like(ks)) {
      if (tshape.empty()) return true;
      if (ctx.reducer) {
        const TypeId apparent = ctx.reducer->apparent_type(source, ctx);
        if (apparent != source) return relate(apparent, target, ctx, why);
      }
    }
    return fail_mismatch(why, source, target);
  }

  // ---------------------------------------------------------------------------
  // Array-like targets
  // ---------------------------------------------------------------------------

  if (const auto * tarr = dyn_cast<ArrayKey>(kt)) {
    if (isa<ReadonlyArrayKey>(ks)) return fail_mismatch(why, source, target);
    if (isa<ArrayKey>(ks) || isa<TupleKey>(ks)) {
      return relate_elements_to(source, tarr->element, ctx, why);
    }
    return fail_mismatch(why, source, target);
  }

  if (const auto * tro = dyn_cast<ReadonlyArrayKey>(kt)) {
    if (isa<ArrayKey>(ks) || isa<ReadonlyArrayKey>(ks) || isa<TupleKey>(ks)) {
      return relate_elements_to(source, tro->element, ctx, why);
    }
    return fail_mismatch(why, source, target);
  }

  if (const auto * ttup = dyn_cast<TupleKey>(kt)) {
    if (const auto * stup = dyn_cast<TupleKey>(ks)) {
      return relate_tuple(
        source, interner_.tuple_list(stup->elements), target,
        interner_.tuple_list(ttup->elements), ctx, why);
    }
    if (isa<ArrayKey>(ks) || isa<ReadonlyArrayKey>(ks)) {
      return fail(why, FailureReason::make(FailureKind::ArityMismatch, source, target));
    }
    return fail_mismatch(why, source, target);
  }

  // ---------------------------------------------------------------------------
  // Callable targets
  // ---------------------------------------------------------------------------

  if (const auto * tfn = dyn_cast<FunctionKey>(kt)) {
    if (const auto * sfn = dyn_cast<FunctionKey>(ks)) {
      return relate_signature(
        source, interner_.function_shape(sfn->shape), target,
        interner_.function_shape(tfn->shape), ctx, why);
    }
    return fail_mismatch(why, source, target);
  }

  if (const auto * tctor = dyn_cast<ConstructorKey>(kt)) {
    if (const auto * sctor = dyn_cast<ConstructorKey>(ks)) {
      return relate_signature(
        source, interner_.function_shape(sctor->shape), target,
        interner_.function_shape(tctor->shape), ctx, why);
    }
    return fail_mismatch(why, source, target);
  }

  // ---------------------------------------------------------------------------
  // Deferred generic applications with the same base compare argument-wise
  // ---------------------------------------------------------------------------

  if (const auto * tapp = dyn_cast<ApplicationKey>(kt)) {
    if (const auto * sapp = dyn_cast<ApplicationKey>(ks)) {
      const auto sargs = interner_.type_list(sapp->args);
      const auto targs = interner_.type_list(tapp->args);
      if (sapp->base == tapp->base && sargs.size() == targs.size()) {
        for (size_t i = 0; i < sargs.size(); ++i) {
          if (!relate(sargs[i], targs[i], ctx, why)) return false;
        }
        return true;
      }
    }
  }

  return fail_mismatch(why, source, target);
}

bool Judge::relate_intersection_source(
  TypeId source, gsl::span<const TypeId> members, TypeId target, QueryContext & ctx)
{
  for (TypeId m : members) {
    if (relate(m, target, ctx)) return true;
  }

  // No single member suffices; an intersection of object types still provides
  // the union of their properties.
  ObjectShape merged;
  for (TypeId m : members) {
    const TypeId nm = normalize(m, ctx);
    if (nm.is_intrinsic()) return false;
    const auto * obj = dyn_cast<ObjectKey>(interner_.lookup(nm));
    if (!obj) return false;
    const ObjectShape & shape = interner_.object_shape(obj->shape);
    for (const auto & p : shape.properties) {
      auto it = std::find_if(
        merged.properties.begin(), merged.properties.end(),
        [&](const PropertyInfo & q) { return q.name == p.name; });
      if (it == merged.properties.end()) {
        merged.properties.push_back(p);
      } else {
        it->read_type = interner_.intersection_of({it->read_type, p.read_type});
        it->write_type = interner_.intersection_of({it->write_type, p.write_type});
        it->optional = it->optional && p.optional;
        it->readonly = it->readonly && p.readonly;
      }
    }
    if (!merged.string_index) merged.string_index = shape.string_index;
    if (!merged.number_index) merged.number_index = shape.number_index;
  }
  const TypeId combined = interner_.object(std::move(merged));
  if (combined == source) return false;
  return relate(combined, target, ctx);
}

// ============================================================================
// Objects
// ============================================================================

TypeId Judge::optional_read_type(TypeId type, bool optional, const QueryContext & ctx)
{
  if (!optional) return type;
  if (ctx.hooks && !ctx.hooks->optional_includes_undefined()) return type;
  return interner_.union_of({type, k_undefined});
}

bool Judge::relate_object(
  TypeId source, const ObjectShape & s, TypeId target, const ObjectShape & t, QueryContext & ctx,
  FailureReason * why)
{
  for (const auto & tp : t.properties) {
    const PropertyInfo * sp = s.find(tp.name);

    if (!sp) {
      if (!tp.optional) {
        return fail(
          why,
          FailureReason::make(FailureKind::PropertyMissing, source, target).with_member(tp.name));
      }
      // An optional target member may be supplied by a source index signature.
      const auto & index =
        (is_numeric_literal_name(tp.name) && s.number_index) ? s.number_index : s.string_index;
      if (index) {
        FailureReason inner;
        if (!relate(
              optional_read_type(index->value_type, true, ctx),
              optional_read_type(tp.read_type, true, ctx), ctx, why ? &inner : nullptr)) {
          return fail(
            why, FailureReason::make(FailureKind::PropertyTypeMismatch, source, target)
                   .with_member(tp.name)
                   .with_nested(std::move(inner)));
        }
      }
      continue;
    }

    if (!tp.optional && sp->optional) {
      return fail(
        why, FailureReason::make(FailureKind::OptionalPropertyMismatch, source, target)
               .with_member(tp.name));
    }

    const bool readonly_lax =
      ctx.extends_check || (ctx.hooks && ctx.hooks->allow_readonly_to_mutable());
    if (!tp.readonly && sp->readonly && !readonly_lax) {
      return fail(
        why, FailureReason::make(FailureKind::ReadonlyPropertyMismatch, source, target)
               .with_member(tp.name));
    }

    FailureReason inner;
    const TypeId s_read = optional_read_type(sp->read_type, sp->optional, ctx);
    const TypeId t_read = optional_read_type(tp.read_type, tp.optional, ctx);
    if (!relate(s_read, t_read, ctx, why ? &inner : nullptr)) {
      return fail(
        why, FailureReason::make(FailureKind::PropertyTypeMismatch, source, target)
               .with_member(tp.name)
               .with_nested(std::move(inner)));
    }

    // Write side is contravariant; a readonly target never writes.
    if (!tp.readonly && (sp->has_split_accessors() || tp.has_split_accessors())) {
      if (!relate(tp.write_type, sp->write_type, ctx, why ? &inner : nullptr)) {
        return fail(
          why, FailureReason::make(FailureKind::PropertyTypeMismatch, source, target)
                 .with_member(tp.name)
                 .with_nested(std::move(inner)));
      }
    }
  }

  return relate_index_signatures(source, s, target, t, ctx, why);
}

bool Judge::relate_index_signatures(
  TypeId source, const ObjectShape & s, TypeId target, const ObjectShape & t, QueryContext & ctx,
  FailureReason * why)
{
  const auto index_fail = [&](const std::string & member, FailureReason inner) {
    return fail(
      why, FailureReason::make(FailureKind::IndexSignatureMismatch, source, target)
             .with_member(member)
             .with_nested(std::move(inner)));
  };

  if (t.string_index) {
    const TypeId tv = t.string_index->value_type;
    for (const auto & sp : s.properties) {
      FailureReason inner;
      if (!relate(optional_read_type(sp.read_type, sp.optional, ctx), tv, ctx, why ? &inner : nullptr)) {
        return index_fail(sp.name, std::move(inner));
      }
    }
    for (const auto * idx : {&s.string_index, &s.number_index}) {
      if (!*idx) continue;
      FailureReason inner;
      if (!relate((*idx)->value_type, tv, ctx, why ? &inner : nullptr)) {
        return index_fail(std::string(), std::move(inner));
      }
    }
  }

  if (t.number_index) {
    const TypeId tv = t.number_index->value_type;
    const auto & sidx = s.number_index ? s.number_index : s.string_index;
    if (sidx) {
      FailureReason inner;
      if (!relate(sidx->value_type, tv, ctx, why ? &inner : nullptr)) {
        return index_fail(std::string(), std::move(inner));
      }
    }
    for (const auto & sp : s.properties) {
      if (!is_numeric_literal_name(sp.name)) continue;
      FailureReason inner;
      if (!relate(optional_read_type(sp.read_type, sp.optional, ctx), tv, ctx, why ? &inner : nullptr)) {
        return index_fail(sp.name, std::move(inner));
      }
    }
  }
  return true;
}

// ============================================================================
// Signatures
// ============================================================================

bool Judge::relate_signature(
  TypeId source, const FunctionShape & s, TypeId target, const FunctionShape & t,
  QueryContext & ctx, FailureReason * why)
{
  auto sparams = std::vector<ParamInfo>(
    interner_.param_list(s.params).begin(), interner_.param_list(s.params).end());
  TypeId s_return = s.return_type;
  TypeId s_this = s.this_type;

  // A generic source is compared with its parameters renamed to the target's
  // (same arity) or erased to their constraints.
  if (!s.type_params.empty() && ctx.reducer) {
    Substitution subst;
    const bool rename = s.type_params.size() == t.type_params.size();
    for (size_t i = 0; i < s.type_params.size(); ++i) {
      const TypeParamInfo & sp = s.type_params[i];
      if (rename) {
        subst[sp.def] = interner_.type_parameter(t.type_params[i]);
      } else {
        subst[sp.def] = sp.constraint.is_valid() ? sp.constraint : k_unknown;
      }
    }
    for (auto & p : sparams) p.type = ctx.reducer->substitute(p.type, subst, ctx);
    s_return = ctx.reducer->substitute(s_return, subst, ctx);
    if (s_this.is_valid()) s_this = ctx.reducer->substitute(s_this, subst, ctx);
  }

  const auto tparams = interner_.param_list(t.params);
  const bool method_like = s.is_method || t.is_method;

  const auto required = static_cast<size_t>(std::count_if(
    sparams.begin(), sparams.end(), [](const ParamInfo & p) { return !p.optional && !p.rest; }));
  const bool target_has_rest = !tparams.empty() && tparams.back().rest;
  if (!target_has_rest && required > tparams.size()) {
    return fail(
      why, FailureReason::make(FailureKind::ArityMismatch, source, target)
             .with_index(static_cast<uint32_t>(tparams.size())));
  }

  if (s_this.is_valid() && t.this_type.is_valid()) {
    FailureReason inner;
    if (!relate(t.this_type, s_this, ctx, why ? &inner : nullptr)) {
      return fail(
        why, FailureReason::make(FailureKind::ParameterIncompatible, source, target)
               .with_member("this")
               .with_nested(std::move(inner)));
    }
  }

  const TypeId s_rest =
    (!sparams.empty() && sparams.back().rest) ? rest_element_type(sparams.back().type)
                                               : k_invalid_type;
  const TypeId t_rest = target_has_rest ? rest_element_type(tparams.back().type) : k_invalid_type;

  // `(...args: any) => R` accepts every parameter list in an extends check.
  const bool rest_is_top = ctx.extends_check && (t_rest == k_any || t_rest == k_unknown);
  const size_t positions = std::max(sparams.size(), tparams.size());

  for (size_t i = 0; i < positions; ++i) {
    if (rest_is_top && i + 1 >= tparams.size()) break;
    const TypeId sp = param_type_at(sparams, i, s_rest);
    const TypeId tp = param_type_at(tparams, i, t_rest);
    if (!sp.is_valid() || !tp.is_valid()) break;

    FailureReason inner;
    FailureReason * inner_ptr = why ? &inner : nullptr;
    const bool ok = ctx.hooks
                      ? ctx.hooks->relate_parameter(*this, sp, tp, method_like, ctx, inner_ptr)
                      : relate(tp, sp, ctx, inner_ptr);
    if (!ok) {
      return fail(
        why, FailureReason::make(FailureKind::ParameterIncompatible, source, target)
               .with_index(static_cast<uint32_t>(i))
               .with_nested(std::move(inner)));
    }
  }

  if (t.return_type.is_valid()) {
    FailureReason inner;
    FailureReason * inner_ptr = why ? &inner : nullptr;
    const bool ok = ctx.hooks
                      ? ctx.hooks->relate_return(*this, s_return, t.return_type, ctx, inner_ptr)
                      : relate(s_return, t.return_type, ctx, inner_ptr);
    if (!ok) {
      FailureReason reason = FailureReason::make(FailureKind::ReturnIncompatible, s_return, t.return_type);
      return fail(why, std::move(reason.with_nested(std::move(inner))));
    }
  }
  return true;
}

// ============================================================================
// Arrays and Tuples
// ============================================================================

TypeId Judge::rest_element_type(TypeId rest_type)
{
  if (rest_type.is_intrinsic()) return rest_type;
  const TypeKey & key = interner_.lookup(rest_type);
  if (const auto * arr = dyn_cast<ArrayKey>(key)) return arr->element;
  if (const auto * ro = dyn_cast<ReadonlyArrayKey>(key)) return ro->element;
  if (const auto * tup = dyn_cast<TupleKey>(key)) {
    std::vector<TypeId> members;
    for (const auto & e : interner_.tuple_list(tup->elements)) {
      members.push_back(e.rest ? rest_element_type(e.type) : e.type);
    }
    return interner_.union_of(std::move(members));
  }
  return rest_type;
}

bool Judge::relate_elements_to(
  TypeId source, TypeId element_target, QueryContext & ctx, FailureReason * why)
{
  const TypeKey & key = interner_.lookup(source);
  if (const auto * arr = dyn_cast<ArrayKey>(key)) return relate(arr->element, element_target, ctx, why);
  if (const auto * ro = dyn_cast<ReadonlyArrayKey>(key)) {
    return relate(ro->element, element_target, ctx, why);
  }
  if (const auto * tup = dyn_cast<TupleKey>(key)) {
    uint32_t index = 0;
    for (const auto & e : interner_.tuple_list(tup->elements)) {
      const TypeId et = e.rest ? rest_element_type(e.type) : e.type;
      FailureReason inner;
      if (!relate(et, element_target, ctx, why ? &inner : nullptr)) {
        return fail(
          why, FailureReason::make(FailureKind::PropertyTypeMismatch, source, element_target)
                 .with_member(std::to_string(index))
                 .with_nested(std::move(inner)));
      }
      ++index;
    }
    return true;
  }
  return fail_mismatch(why, source, element_target);
}

bool Judge::relate_tuple(
  TypeId source, gsl::span<const TupleElement> s, TypeId target, gsl::span<const TupleElement> t,
  QueryContext & ctx, FailureReason * why)
{
  const bool s_has_rest = !s.empty() && s.back().rest;
  const bool t_has_rest = !t.empty() && t.back().rest;
  const size_t s_fixed = s_has_rest ? s.size() - 1 : s.size();
  const size_t t_fixed = t_has_rest ? t.size() - 1 : t.size();

  const auto arity = [&](size_t index) {
    return fail(
      why, FailureReason::make(FailureKind::ArityMismatch, source, target)
             .with_index(static_cast<uint32_t>(index)));
  };

  if (s_has_rest && !t_has_rest) return arity(s_fixed);
  if (!t_has_rest && s_fixed > t_fixed) return arity(t_fixed);

  // Target positions the source does not provide must be optional; a source
  // rest may be empty, so it never covers a required position.
  for (size_t i = s_fixed; i < t_fixed; ++i) {
    if (!t[i].optional) return arity(i);
  }

  const TypeId t_rest = t_has_rest ? rest_element_type(t.back().type) : k_invalid_type;
  const auto element_fail = [&](size_t index, FailureReason inner) {
    return fail(
      why, FailureReason::make(FailureKind::PropertyTypeMismatch, source, target)
             .with_member(std::to_string(index))
             .with_nested(std::move(inner)));
  };

  for (size_t i = 0; i < s_fixed; ++i) {
    const bool in_fixed = i < t_fixed;
    if (in_fixed && s[i].optional && !t[i].optional) return arity(i);
    const TypeId te = in_fixed ? t[i].type : t_rest;
    FailureReason inner;
    if (!relate(s[i].type, te, ctx, why ? &inner : nullptr)) {
      return element_fail(i, std::move(inner));
    }
  }

  if (s_has_rest) {
    const TypeId s_rest = rest_element_type(s.back().type);
    for (size_t i = s_fixed; i < t_fixed; ++i) {
      FailureReason inner;
      if (!relate(s_rest, t[i].type, ctx, why ? &inner : nullptr)) {
        return element_fail(i, std::move(inner));
      }
    }
    FailureReason inner;
    if (!relate(s_rest, t_rest, ctx, why ? &inner : nullptr)) {
      return element_fail(s_fixed, std::move(inner));
    }
  }
  return true;
}

}  // namespace tscore

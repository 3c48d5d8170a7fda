// tscore/eval/evaluator.cpp - Evaluation dispatch and generic instantiation
//
#include "tscore/eval/evaluator.hpp"

#include <utility>

#include "tscore/basic/casting.hpp"

namespace tscore
{

Evaluator::Evaluator(Environment & env, Judge & judge)
: env_(env), interner_(env.interner()), judge_(judge)
{
}

const ObjectShape * object_shape_of(const TypeInterner & interner, TypeId id)
{
  if (!id.is_valid() || id.is_intrinsic()) return nullptr;
  if (const auto * obj = dyn_cast<ObjectKey>(interner.lookup(id))) {
    return &interner.object_shape(obj->shape);
  }
  return nullptr;
}

// ============================================================================
// Entry Points
// ============================================================================

TypeId Evaluator::reduce(TypeId id, QueryContext & ctx) { return evaluate(id, ctx); }

TypeId Evaluator::evaluate(TypeId id, QueryContext & ctx)
{
  if (!id.is_valid() || id.is_intrinsic()) return id;
  if (auto it = ctx.evaluations.find(id); it != ctx.evaluations.end()) return it->second;

  QueryGuard::DepthScope depth(ctx.guard, BudgetKind::EvaluationDepth);
  if (!depth.ok()) return k_unknown;

  const TypeId result = evaluate_key(id, interner_.lookup(id), ctx);

  // A truncated result is only valid for this path; do not let it leak into
  // other parts of the query through the memo.
  if (!ctx.truncated()) ctx.evaluations.emplace(id, result);
  return result;
}

TypeId Evaluator::evaluate_key(TypeId id, const TypeKey & key, QueryContext & ctx)
{
  if (const auto * lazy = dyn_cast<LazyKey>(key)) return evaluate_lazy(id, lazy->def, ctx);

  if (const auto * query = dyn_cast<TypeQueryKey>(key)) {
    const Resolution r = env_.resolve(query->def, ctx.resolution, ctx.diagnostics());
    if (!r.info || !r.info->value_type.is_valid()) return k_unresolved;
    return evaluate(r.info->value_type, ctx);
  }

  if (const auto * app = dyn_cast<ApplicationKey>(key)) {
    const auto args = interner_.type_list(app->args);
    std::vector<TypeId> evaluated;
    evaluated.reserve(args.size());
    for (TypeId a : args) evaluated.push_back(evaluate(a, ctx));
    if (is_generic(app->base)) return id;
    for (TypeId a : evaluated) {
      if (is_generic(a)) return interner_.application(app->base, std::move(evaluated));
    }
    return instantiate(app->base, evaluated, ctx);
  }

  if (const auto * cond = dyn_cast<ConditionalKey>(key)) return evaluate_conditional(*cond, ctx);
  if (const auto * mapped = dyn_cast<MappedKey>(key)) return evaluate_mapped(id, *mapped, ctx);
  if (const auto * tl = dyn_cast<TemplateLiteralKey>(key)) {
    return evaluate_template(id, interner_.span_list(tl->spans), ctx);
  }
  if (const auto * k = dyn_cast<KeyOfKey>(key)) return keyof(k->operand, ctx);
  if (const auto * ia = dyn_cast<IndexAccessKey>(key)) return index_access(ia->object, ia->index, ctx);
  if (const auto * si = dyn_cast<StringIntrinsicKey>(key)) {
    return string_intrinsic(si->kind, si->operand, ctx);
  }
  if (const auto * u = dyn_cast<UnionKey>(key)) {
    return evaluate_members(id, interner_.type_list(u->members), true, ctx);
  }
  if (const auto * i = dyn_cast<IntersectionKey>(key)) {
    return evaluate_members(id, interner_.type_list(i->members), false, ctx);
  }
  return id;
}

TypeId Evaluator::evaluate_members(
  TypeId id, gsl::span<const TypeId> members, bool is_union, QueryContext & ctx)
{
  std::vector<TypeId> out;
  out.reserve(members.size());
  bool changed = false;
  for (TypeId m : members) {
    const TypeId e = evaluate(m, ctx);
    changed = changed || e != m;
    out.push_back(e);
  }
  if (!changed) return id;
  return is_union ? interner_.union_of(std::move(out)) : interner_.intersection_of(std::move(out));
}

TypeId Evaluator::evaluate_lazy(TypeId id, DefId def, QueryContext & ctx)
{
  const Resolution r = env_.resolve(def, ctx.resolution, ctx.diagnostics());
  if (r.status == ResolveStatus::Missing) return k_unresolved;
  if (r.status == ResolveStatus::InProgress) return id;

  // Interfaces, classes and enums keep their nominal Lazy identity; generic
  // aliases are only expanded through an Application.
  if (!r.info->is_transparent() || !r.info->type_params.empty()) return id;

  ResolutionStack::Scope scope(ctx.resolution, def);
  return evaluate(r.type, ctx);
}

// ============================================================================
// Instantiation
// ============================================================================

TypeId Evaluator::instantiate(TypeId generic, gsl::span<const TypeId> args, QueryContext & ctx)
{
  if (!generic.is_valid() || generic.is_intrinsic()) return generic;

  const TypeKey & key = interner_.lookup(generic);
  if (const auto * lazy = dyn_cast<LazyKey>(key)) {
    return instantiate_def(generic, lazy->def, args, ctx);
  }

  const FunctionShape * shape = nullptr;
  if (const auto * fn = dyn_cast<FunctionKey>(key)) shape = &interner_.function_shape(fn->shape);
  if (const auto * ctor = dyn_cast<ConstructorKey>(key)) {
    shape = &interner_.function_shape(ctor->shape);
  }
  if (!shape || shape->type_params.empty()) return evaluate(generic, ctx);

  // Generic signature: bind its own parameters and drop them.
  Substitution subst;
  for (size_t i = 0; i < shape->type_params.size(); ++i) {
    const TypeParamInfo & param = shape->type_params[i];
    if (i < args.size()) {
      subst[param.def] = args[i];
    } else if (param.default_type.is_valid()) {
      subst[param.def] = substitute(param.default_type, subst, ctx);
    } else {
      subst[param.def] = k_unknown;
    }
  }

  SignatureSpec spec;
  for (const auto & p : interner_.param_list(shape->params)) {
    ParamInfo copy = p;
    copy.type = substitute(p.type, subst, ctx);
    spec.params.push_back(std::move(copy));
  }
  spec.this_type = shape->this_type.is_valid() ? substitute(shape->this_type, subst, ctx)
                                               : k_invalid_type;
  spec.return_type = substitute(shape->return_type, subst, ctx);
  spec.is_method = shape->is_method;
  return isa<ConstructorKey>(key) ? interner_.constructor(std::move(spec))
                                  : interner_.function(std::move(spec));
}

TypeId Evaluator::instantiate_def(
  TypeId generic, DefId def, gsl::span<const TypeId> args, QueryContext & ctx)
{
  const InstantiationKey memo_key{generic, interner_.intern_type_list({args.begin(), args.end()})};
  if (auto it = ctx.instantiations.find(memo_key); it != ctx.instantiations.end()) {
    return it->second;
  }

  QueryGuard::DepthScope depth(ctx.guard, BudgetKind::Instantiation);
  if (!depth.ok()) return k_unknown;

  // Instantiation does not consult the resolution stack: recursion through
  // applications is bounded by the instantiation budget instead.
  const ResolutionStack detached;
  const Resolution r = env_.resolve(def, detached, ctx.diagnostics());
  if (!r.info) return k_unresolved;

  Substitution subst;
  const auto & params = r.info->type_params;
  for (size_t i = 0; i < params.size(); ++i) {
    if (i < args.size()) {
      subst[params[i].def] = args[i];
    } else if (params[i].default_type.is_valid()) {
      subst[params[i].def] = substitute(params[i].default_type, subst, ctx);
    } else {
      subst[params[i].def] = k_unknown;
    }
  }

  TypeId result;
  if (r.info->is_transparent()) {
    result = evaluate(substitute(r.type, subst, ctx), ctx);
  } else if (params.empty()) {
    result = generic;
  } else {
    result = substitute(r.type, subst, ctx);
  }

  if (!ctx.truncated()) ctx.instantiations.emplace(memo_key, result);
  return result;
}

}  // namespace tscore

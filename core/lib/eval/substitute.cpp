// tscore/eval/substitute.cpp - Type parameter substitution
//
#include <algorithm>
#include <string>
#include <utility>

#include "tscore/basic/casting.hpp"
#include "tscore/eval/evaluator.hpp"

namespace tscore
{

// ============================================================================
// Substituter
// ============================================================================

/**
 * One substitution pass.
 *
 * Rebuilds every key that mentions a substituted parameter. Lazy references
 * are not entered, so the walk is finite even over recursive declarations;
 * nested applications stay unreduced until something evaluates them.
 */
class Evaluator::Substituter
{
public:
  Substituter(Evaluator & ev, const Substitution & subst, QueryContext & ctx)
  : ev_(ev), interner_(ev.interner_), subst_(subst), ctx_(ctx)
  {
  }

  TypeId run(TypeId id)
  {
    if (!id.is_valid() || id.is_intrinsic() || subst_.empty()) return id;
    if (auto it = memo_.find(id); it != memo_.end()) return it->second;

    const TypeId result = std::visit([&](const auto & key) { return apply(id, key); }, interner_.lookup(id));
    memo_.emplace(id, result);
    return result;
  }

private:
  Evaluator & ev_;
  TypeInterner & interner_;
  const Substitution & subst_;
  QueryContext & ctx_;
  std::unordered_map<TypeId, TypeId> memo_;

  /// Same pass with `params` shadowed (a nested generic rebinds them).
  template <typename Params, typename Fn>
  TypeId shadowed(const Params & params, Fn && body)
  {
    const bool shadows = std::any_of(params.begin(), params.end(), [&](const TypeParamInfo & p) {
      return subst_.count(p.def) > 0;
    });
    if (!shadows) return body(*this);

    Substitution inner = subst_;
    for (const auto & p : params) inner.erase(p.def);
    Substituter nested(ev_, inner, ctx_);
    return body(nested);
  }

  TypeParamInfo param(const TypeParamInfo & p)
  {
    TypeParamInfo copy = p;
    copy.constraint = run(p.constraint);
    copy.default_type = run(p.default_type);
    return copy;
  }

  std::vector<TypeId> list(gsl::span<const TypeId> ids)
  {
    std::vector<TypeId> out;
    out.reserve(ids.size());
    for (TypeId t : ids) out.push_back(run(t));
    return out;
  }

  // ---------------------------------------------------------------------------

  TypeId apply(TypeId id, const IntrinsicKey &) { return id; }
  TypeId apply(TypeId id, const LiteralKey &) { return id; }
  TypeId apply(TypeId id, const EnumKey &) { return id; }
  TypeId apply(TypeId id, const LazyKey &) { return id; }
  TypeId apply(TypeId id, const TypeQueryKey &) { return id; }
  TypeId apply(TypeId id, const ThisTypeKey &) { return id; }

  TypeId apply(TypeId id, const TypeParameterKey & k)
  {
    auto it = subst_.find(k.info.def);
    return it == subst_.end() ? id : it->second;
  }

  TypeId apply(TypeId id, const InferKey & k)
  {
    auto it = subst_.find(k.info.def);
    return it == subst_.end() ? id : it->second;
  }

  TypeId apply(TypeId, const ObjectKey & k)
  {
    ObjectShape shape = interner_.object_shape(k.shape);
    for (auto & p : shape.properties) {
      p.read_type = run(p.read_type);
      p.write_type = run(p.write_type);
    }
    if (shape.string_index) shape.string_index->value_type = run(shape.string_index->value_type);
    if (shape.number_index) shape.number_index->value_type = run(shape.number_index->value_type);
    return interner_.object(std::move(shape));
  }

  TypeId apply(TypeId, const ArrayKey & k) { return interner_.array_of(run(k.element)); }

  TypeId apply(TypeId, const ReadonlyArrayKey & k)
  {
    return interner_.readonly_array_of(run(k.element));
  }

  TypeId apply(TypeId, const TupleKey & k)
  {
    std::vector<TupleElement> out;
    for (const auto & e : interner_.tuple_list(k.elements)) {
      TupleElement copy = e;
      copy.type = run(e.type);
      // A variadic element bound to a tuple spreads into the enclosing tuple.
      if (e.rest && copy.type.is_valid() && !copy.type.is_intrinsic()) {
        if (const auto * inner = dyn_cast<TupleKey>(interner_.lookup(copy.type))) {
          const auto spread = interner_.tuple_list(inner->elements);
          out.insert(out.end(), spread.begin(), spread.end());
          continue;
        }
      }
      out.push_back(std::move(copy));
    }
    return interner_.tuple(std::move(out));
  }

  TypeId apply(TypeId, const UnionKey & k)
  {
    return interner_.union_of(list(interner_.type_list(k.members)));
  }

  TypeId apply(TypeId, const IntersectionKey & k)
  {
    return interner_.intersection_of(list(interner_.type_list(k.members)));
  }

  TypeId signature(const FunctionShape & shape, bool is_constructor)
  {
    return shadowed(shape.type_params, [&](Substituter & s) {
      SignatureSpec spec;
      for (const auto & tp : shape.type_params) spec.type_params.push_back(s.param(tp));
      for (const auto & p : s.interner_.param_list(shape.params)) {
        ParamInfo copy = p;
        copy.type = s.run(p.type);
        spec.params.push_back(std::move(copy));
      }
      spec.this_type = s.run(shape.this_type);
      spec.return_type = s.run(shape.return_type);
      spec.is_method = shape.is_method;
      return is_constructor ? s.interner_.constructor(std::move(spec))
                            : s.interner_.function(std::move(spec));
    });
  }

  TypeId apply(TypeId, const FunctionKey & k)
  {
    return signature(interner_.function_shape(k.shape), false);
  }

  TypeId apply(TypeId, const ConstructorKey & k)
  {
    return signature(interner_.function_shape(k.shape), true);
  }

  TypeId apply(TypeId, const ApplicationKey & k)
  {
    return interner_.application(run(k.base), list(interner_.type_list(k.args)));
  }

  TypeId apply(TypeId, const ConditionalKey & k)
  {
    if (k.distributive && !k.check.is_intrinsic()) {
      if (const auto * tp = dyn_cast<TypeParameterKey>(interner_.lookup(k.check))) {
        auto it = subst_.find(tp->info.def);
        if (it != subst_.end()) return distribute(k, tp->info.def, it->second);
      }
    }
    return interner_.conditional(
      run(k.check), run(k.extends), run(k.true_type), run(k.false_type), k.distributive);
  }

  /// Instantiate a distributive conditional once per member of the check argument.
  TypeId distribute(const ConditionalKey & k, DefId check_param, TypeId argument)
  {
    const TypeId evaluated = ev_.evaluate(argument, ctx_);
    if (evaluated == k_never) return k_never;

    const auto members = interner_.union_members(evaluated);
    if (members.size() <= 1) {
      return interner_.conditional(
        evaluated, run(k.extends), run(k.true_type), run(k.false_type), k.distributive);
    }
    if (members.size() > ctx_.guard.limits().max_distribution_size) {
      ctx_.guard.record_truncation(
        BudgetKind::Distribution, std::to_string(members.size()) + " union members");
      return k_unknown;
    }

    std::vector<TypeId> results;
    results.reserve(members.size());
    for (TypeId m : members) {
      Substitution per_member = subst_;
      per_member[check_param] = m;
      Substituter s(ev_, per_member, ctx_);
      results.push_back(interner_.conditional(
        m, s.run(k.extends), s.run(k.true_type), s.run(k.false_type), k.distributive));
    }
    return interner_.union_of(std::move(results));
  }

  TypeId apply(TypeId, const MappedKey & k)
  {
    const std::vector<TypeParamInfo> params{k.param};
    return shadowed(params, [&](Substituter & s) {
      MappedKey copy = k;
      copy.constraint = run(k.constraint);
      copy.name_type = s.run(k.name_type);
      copy.template_type = s.run(k.template_type);
      return s.interner_.mapped(std::move(copy));
    });
  }

  TypeId apply(TypeId, const TemplateLiteralKey & k)
  {
    std::vector<TemplateSpan> spans;
    for (const auto & span : interner_.span_list(k.spans)) {
      TemplateSpan copy = span;
      if (!span.is_text()) copy.type = run(span.type);
      spans.push_back(std::move(copy));
    }
    return interner_.template_literal(std::move(spans));
  }

  TypeId apply(TypeId, const KeyOfKey & k) { return interner_.keyof(run(k.operand)); }

  TypeId apply(TypeId, const IndexAccessKey & k)
  {
    return interner_.index_access(run(k.object), run(k.index));
  }

  TypeId apply(TypeId, const StringIntrinsicKey & k)
  {
    return interner_.string_intrinsic(k.kind, run(k.operand));
  }
};

TypeId Evaluator::substitute(TypeId id, const Substitution & subst, QueryContext & ctx)
{
  Substituter s(*this, subst, ctx);
  return s.run(id);
}

// ============================================================================
// Genericity
// ============================================================================

bool Evaluator::is_generic(TypeId id) const
{
  std::vector<DefId> bound;
  std::unordered_set<TypeId> visited;
  return is_generic_rec(id, bound, visited);
}

bool Evaluator::is_generic_rec(
  TypeId id, std::vector<DefId> & bound, std::unordered_set<TypeId> & visited) const
{
  if (!id.is_valid() || id.is_intrinsic()) return false;
  // An answer found under binders does not hold outside them, so only free
  // visits are recorded.
  if (bound.empty() && !visited.insert(id).second) return false;

  const auto any_of = [&](gsl::span<const TypeId> ids) {
    return std::any_of(ids.begin(), ids.end(), [&](TypeId t) {
      return is_generic_rec(t, bound, visited);
    });
  };
  const auto signature = [&](const FunctionShape & shape) {
    const size_t mark = bound.size();
    for (const auto & tp : shape.type_params) bound.push_back(tp.def);
    bool found = is_generic_rec(shape.this_type, bound, visited) ||
                 is_generic_rec(shape.return_type, bound, visited);
    for (const auto & p : interner_.param_list(shape.params)) {
      found = found || is_generic_rec(p.type, bound, visited);
    }
    bound.resize(mark);
    return found;
  };

  const TypeKey & key = interner_.lookup(id);
  if (const auto * tp = dyn_cast<TypeParameterKey>(key)) {
    return std::find(bound.begin(), bound.end(), tp->info.def) == bound.end();
  }
  if (isa<ThisTypeKey>(key)) return true;
  if (const auto * obj = dyn_cast<ObjectKey>(key)) {
    const ObjectShape & shape = interner_.object_shape(obj->shape);
    for (const auto & p : shape.properties) {
      if (is_generic_rec(p.read_type, bound, visited) || is_generic_rec(p.write_type, bound, visited)) {
        return true;
      }
    }
    return (shape.string_index && is_generic_rec(shape.string_index->value_type, bound, visited)) ||
           (shape.number_index && is_generic_rec(shape.number_index->value_type, bound, visited));
  }
  if (const auto * a = dyn_cast<ArrayKey>(key)) return is_generic_rec(a->element, bound, visited);
  if (const auto * a = dyn_cast<ReadonlyArrayKey>(key)) {
    return is_generic_rec(a->element, bound, visited);
  }
  if (const auto * t = dyn_cast<TupleKey>(key)) {
    for (const auto & e : interner_.tuple_list(t->elements)) {
      if (is_generic_rec(e.type, bound, visited)) return true;
    }
    return false;
  }
  if (const auto * u = dyn_cast<UnionKey>(key)) return any_of(interner_.type_list(u->members));
  if (const auto * i = dyn_cast<IntersectionKey>(key)) return any_of(interner_.type_list(i->members));
  if (const auto * fn = dyn_cast<FunctionKey>(key)) return signature(interner_.function_shape(fn->shape));
  if (const auto * ctor = dyn_cast<ConstructorKey>(key)) {
    return signature(interner_.function_shape(ctor->shape));
  }
  if (const auto * app = dyn_cast<ApplicationKey>(key)) {
    return is_generic_rec(app->base, bound, visited) || any_of(interner_.type_list(app->args));
  }
  if (const auto * c = dyn_cast<ConditionalKey>(key)) {
    return is_generic_rec(c->check, bound, visited) || is_generic_rec(c->extends, bound, visited) ||
           is_generic_rec(c->true_type, bound, visited) ||
           is_generic_rec(c->false_type, bound, visited);
  }
  if (const auto * m = dyn_cast<MappedKey>(key)) {
    if (is_generic_rec(m->constraint, bound, visited)) return true;
    bound.push_back(m->param.def);
    const bool found = is_generic_rec(m->name_type, bound, visited) ||
                       is_generic_rec(m->template_type, bound, visited);
    bound.pop_back();
    return found;
  }
  if (const auto * tl = dyn_cast<TemplateLiteralKey>(key)) {
    for (const auto & span : interner_.span_list(tl->spans)) {
      if (!span.is_text() && is_generic_rec(span.type, bound, visited)) return true;
    }
    return false;
  }
  if (const auto * k = dyn_cast<KeyOfKey>(key)) return is_generic_rec(k->operand, bound, visited);
  if (const auto * ia = dyn_cast<IndexAccessKey>(key)) {
    return is_generic_rec(ia->object, bound, visited) || is_generic_rec(ia->index, bound, visited);
  }
  if (const auto * si = dyn_cast<StringIntrinsicKey>(key)) {
    return is_generic_rec(si->operand, bound, visited);
  }
  return false;
}

}  // namespace tscore

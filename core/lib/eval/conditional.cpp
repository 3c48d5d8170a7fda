// tscore/eval/conditional.cpp - Conditional types and infer pattern matching
//
#include <algorithm>
#include <string>
#include <unordered_set>
#include <utility>

#include "tscore/basic/casting.hpp"
#include "tscore/basic/number_format.hpp"
#include "tscore/eval/evaluator.hpp"
#include "tscore/judge/template_match.hpp"

namespace tscore
{

namespace
{

/// Direct operands of a key, in no particular order. Lazy references are leaves.
std::vector<TypeId> children_of(const TypeInterner & interner, const TypeKey & key)
{
  std::vector<TypeId> out;
  const auto signature = [&](const FunctionShape & shape) {
    for (const auto & p : interner.param_list(shape.params)) out.push_back(p.type);
    out.push_back(shape.this_type);
    out.push_back(shape.return_type);
  };

  std::visit(
    Overloaded{
      [&](const ObjectKey & k) {
        const ObjectShape & shape = interner.object_shape(k.shape);
        for (const auto & p : shape.properties) {
          out.push_back(p.read_type);
          if (p.has_split_accessors()) out.push_back(p.write_type);
        }
        if (shape.string_index) out.push_back(shape.string_index->value_type);
        if (shape.number_index) out.push_back(shape.number_index->value_type);
      },
      [&](const ArrayKey & k) { out.push_back(k.element); },
      [&](const ReadonlyArrayKey & k) { out.push_back(k.element); },
      [&](const TupleKey & k) {
        for (const auto & e : interner.tuple_list(k.elements)) out.push_back(e.type);
      },
      [&](const UnionKey & k) {
        const auto m = interner.type_list(k.members);
        out.insert(out.end(), m.begin(), m.end());
      },
      [&](const IntersectionKey & k) {
        const auto m = interner.type_list(k.members);
        out.insert(out.end(), m.begin(), m.end());
      },
      [&](const FunctionKey & k) { signature(interner.function_shape(k.shape)); },
      [&](const ConstructorKey & k) { signature(interner.function_shape(k.shape)); },
      [&](const ApplicationKey & k) {
        const auto a = interner.type_list(k.args);
        out.insert(out.end(), a.begin(), a.end());
      },
      [&](const ConditionalKey & k) {
        out.insert(out.end(), {k.check, k.extends, k.true_type, k.false_type});
      },
      [&](const MappedKey & k) {
        out.insert(out.end(), {k.constraint, k.name_type, k.template_type});
      },
      [&](const TemplateLiteralKey & k) {
        for (const auto & s : interner.span_list(k.spans)) {
          if (!s.is_text()) out.push_back(s.type);
        }
      },
      [&](const KeyOfKey & k) { out.push_back(k.operand); },
      [&](const IndexAccessKey & k) { out.insert(out.end(), {k.object, k.index}); },
      [&](const StringIntrinsicKey & k) { out.push_back(k.operand); },
      [&](const auto &) {},
    },
    key);
  return out;
}

}  // namespace

// ============================================================================
// Conditional Types
// ============================================================================

TypeId Evaluator::evaluate_conditional(const ConditionalKey & key, QueryContext & ctx)
{
  const TypeId check = evaluate(key.check, ctx);
  const TypeId extends = evaluate(key.extends, ctx);

  // Still depends on unbound parameters: keep it deferred.
  if (is_generic(check) || is_generic(extends)) {
    return interner_.conditional(check, extends, key.true_type, key.false_type, key.distributive);
  }

  if (key.distributive) {
    if (check == k_never) return k_never;

    const auto members = interner_.union_members(check);
    if (members.size() > 1) {
      if (members.size() > ctx.guard.limits().max_distribution_size) {
        ctx.guard.record_truncation(
          BudgetKind::Distribution, std::to_string(members.size()) + " union members");
        return k_unknown;
      }
      std::vector<TypeId> results;
      results.reserve(members.size());
      for (TypeId m : members) {
        results.push_back(resolve_conditional(m, extends, key.true_type, key.false_type, ctx));
      }
      return interner_.union_of(std::move(results));
    }
  }

  return resolve_conditional(check, extends, key.true_type, key.false_type, ctx);
}

TypeId Evaluator::resolve_conditional(
  TypeId check, TypeId extends, TypeId true_type, TypeId false_type, QueryContext & ctx)
{
  std::vector<TypeParamInfo> infers;
  collect_infers(extends, infers);

  Substitution subst;
  if (!infers.empty()) {
    InferBindings bindings;
    if (!infer_from(check, extends, bindings, ctx)) return evaluate(false_type, ctx);
    for (const auto & p : infers) {
      auto it = bindings.find(p.def);
      if (it != bindings.end()) {
        subst[p.def] = it->second;
      } else {
        subst[p.def] = p.constraint.is_valid() ? p.constraint : k_unknown;
      }
    }
  }

  const TypeId pattern = subst.empty() ? extends : substitute(extends, subst, ctx);
  const TypeId chosen_true = subst.empty() ? true_type : substitute(true_type, subst, ctx);

  // `any` takes both branches.
  if (check == k_any) {
    return interner_.union_of({evaluate(chosen_true, ctx), evaluate(false_type, ctx)});
  }

  bool holds = false;
  {
    ExtendsScope extends_relation(ctx);
    holds = judge_.relate(check, pattern, ctx);
  }
  return evaluate(holds ? chosen_true : false_type, ctx);
}

void Evaluator::collect_infers(TypeId pattern, std::vector<TypeParamInfo> & out) const
{
  std::unordered_set<TypeId> visited;
  std::vector<TypeId> work{pattern};
  while (!work.empty()) {
    const TypeId id = work.back();
    work.pop_back();
    if (!id.is_valid() || id.is_intrinsic() || !visited.insert(id).second) continue;

    const TypeKey & key = interner_.lookup(id);
    if (const auto * inf = dyn_cast<InferKey>(key)) {
      const bool seen = std::any_of(out.begin(), out.end(), [&](const TypeParamInfo & p) {
        return p.def == inf->info.def;
      });
      if (!seen) out.push_back(inf->info);
      continue;
    }
    // Infer positions of a nested conditional belong to that conditional.
    if (const auto * c = dyn_cast<ConditionalKey>(key)) {
      work.insert(work.end(), {c->check, c->true_type, c->false_type});
      continue;
    }
    const auto children = children_of(interner_, key);
    work.insert(work.end(), children.begin(), children.end());
  }
}

// ============================================================================
// Infer Pattern Matching
// ============================================================================

bool Evaluator::infer_from(
  TypeId source, TypeId pattern, InferBindings & bindings, QueryContext & ctx)
{
  if (!pattern.is_valid() || pattern.is_intrinsic()) return true;

  const TypeKey & pk = interner_.lookup(pattern);
  if (const auto * inf = dyn_cast<InferKey>(pk)) {
    auto [it, inserted] = bindings.try_emplace(inf->info.def, source);
    if (!inserted) it->second = interner_.union_of({it->second, source});
    return true;
  }

  std::vector<TypeParamInfo> infers;
  collect_infers(pattern, infers);
  if (infers.empty()) return true;

  if (source == k_any) {
    for (const auto & p : infers) bindings.try_emplace(p.def, k_any);
    return true;
  }

  QueryGuard::DepthScope depth(ctx.guard, BudgetKind::EvaluationDepth);
  if (!depth.ok()) return false;

  TypeId src = judge_.normalize(source, ctx);

  // -- Unions and intersections in the pattern ----------------------------
  if (const auto * u = dyn_cast<UnionKey>(pk)) {
    for (TypeId m : interner_.type_list(u->members)) {
      InferBindings attempt = bindings;
      if (infer_from(src, m, attempt, ctx)) bindings = std::move(attempt);
    }
    return true;
  }
  if (const auto * i = dyn_cast<IntersectionKey>(pk)) {
    for (TypeId m : interner_.type_list(i->members)) {
      if (!infer_from(src, m, bindings, ctx)) return false;
    }
    return true;
  }

  // -- Template literal pattern against a string literal ------------------
  if (const auto * tl = dyn_cast<TemplateLiteralKey>(pk)) {
    const LiteralValue * v = interner_.literal_value(src);
    if (!v || v->kind != LiteralKind::String) return false;
    const auto spans = interner_.span_list(tl->spans);
    const auto captures = match_template(interner_, v->text, spans);
    if (!captures) return false;
    size_t c = 0;
    for (const auto & span : spans) {
      if (span.is_text()) continue;
      const std::string & piece = (*captures)[c++];
      if (span.type.is_intrinsic()) continue;
      const auto * placeholder = dyn_cast<InferKey>(interner_.lookup(span.type));
      if (!placeholder) continue;
      TypeId captured = interner_.literal_string(piece);
      // `infer N extends number` captures the numeric literal.
      if (placeholder->info.constraint == k_number) {
        if (auto n = parse_number(piece)) captured = interner_.literal_number(*n);
      }
      infer_from(captured, span.type, bindings, ctx);
    }
    return true;
  }

  if (src.is_intrinsic() && !isa<ObjectKey>(pk)) return false;

  // -- Object pattern -------------------------------------------------------
  if (const auto * pobj = dyn_cast<ObjectKey>(pk)) {
    const ObjectShape * sshape = object_shape_of(interner_, src);
    if (!sshape) sshape = object_shape_of(interner_, judge_.normalize(apparent_type(src, ctx), ctx));
    if (!sshape) return false;
    const ObjectShape & pshape = interner_.object_shape(pobj->shape);
    for (const auto & pp : pshape.properties) {
      const PropertyInfo * sp = sshape->find(pp.name);
      if (!sp) {
        if (pp.optional) continue;
        if (!sshape->string_index) return false;
        if (!infer_from(sshape->string_index->value_type, pp.read_type, bindings, ctx)) return false;
        continue;
      }
      if (!infer_from(sp->read_type, pp.read_type, bindings, ctx)) return false;
    }
    if (pshape.string_index && sshape->string_index) {
      infer_from(sshape->string_index->value_type, pshape.string_index->value_type, bindings, ctx);
    }
    if (pshape.number_index) {
      const auto & idx = sshape->number_index ? sshape->number_index : sshape->string_index;
      if (idx) infer_from(idx->value_type, pshape.number_index->value_type, bindings, ctx);
    }
    return true;
  }

  const TypeKey & sk = interner_.lookup(src);

  // -- Array patterns ---------------------------------------------------------
  const auto element_of = [&]() -> TypeId {
    if (const auto * a = dyn_cast<ArrayKey>(sk)) return a->element;
    if (const auto * a = dyn_cast<ReadonlyArrayKey>(sk)) return a->element;
    if (const auto * t = dyn_cast<TupleKey>(sk)) {
      std::vector<TypeId> members;
      for (const auto & e : interner_.tuple_list(t->elements)) members.push_back(e.type);
      return interner_.union_of(std::move(members));
    }
    return k_invalid_type;
  };
  if (const auto * pa = dyn_cast<ArrayKey>(pk)) {
    if (isa<ReadonlyArrayKey>(sk)) return false;
    const TypeId element = element_of();
    return element.is_valid() && infer_from(element, pa->element, bindings, ctx);
  }
  if (const auto * pa = dyn_cast<ReadonlyArrayKey>(pk)) {
    const TypeId element = element_of();
    return element.is_valid() && infer_from(element, pa->element, bindings, ctx);
  }

  // -- Tuple pattern ----------------------------------------------------------
  if (const auto * pt = dyn_cast<TupleKey>(pk)) {
    const auto * st = dyn_cast<TupleKey>(sk);
    if (!st) return false;
    const auto ps = interner_.tuple_list(pt->elements);
    const auto ss = interner_.tuple_list(st->elements);
    const bool p_rest = !ps.empty() && ps.back().rest;
    const bool s_rest = !ss.empty() && ss.back().rest;
    const size_t p_fixed = p_rest ? ps.size() - 1 : ps.size();
    const size_t s_fixed = s_rest ? ss.size() - 1 : ss.size();

    if (s_rest && !p_rest) return false;
    if (!p_rest && s_fixed > p_fixed) return false;

    for (size_t i = 0; i < p_fixed; ++i) {
      if (i >= s_fixed) {
        if (!ps[i].optional) return false;
        continue;
      }
      if (!infer_from(ss[i].type, ps[i].type, bindings, ctx)) return false;
    }
    if (p_rest) {
      std::vector<TupleElement> remaining(
        ss.begin() + static_cast<std::ptrdiff_t>(std::min(p_fixed, ss.size())), ss.end());
      const TypeId rest_pattern = ps.back().type;
      if (!rest_pattern.is_intrinsic() && isa<InferKey>(interner_.lookup(rest_pattern))) {
        return infer_from(interner_.tuple(std::move(remaining)), rest_pattern, bindings, ctx);
      }
      std::vector<TypeId> members;
      for (const auto & e : remaining) members.push_back(e.type);
      infer_from(interner_.union_of(std::move(members)), rest_pattern, bindings, ctx);
    }
    return true;
  }

  // -- Signatures ---------------------------------------------------------------
  const auto infer_signature = [&](const FunctionShape & s, const FunctionShape & p) {
    const auto sparams = interner_.param_list(s.params);
    const auto pparams = interner_.param_list(p.params);
    for (size_t i = 0; i < pparams.size(); ++i) {
      if (pparams[i].rest) {
        // `...args: infer P` captures the remaining source parameters as a tuple.
        std::vector<TupleElement> rest;
        for (size_t j = i; j < sparams.size(); ++j) {
          rest.push_back(TupleElement{sparams[j].type, sparams[j].name, sparams[j].optional, sparams[j].rest});
        }
        infer_from(interner_.tuple(std::move(rest)), pparams[i].type, bindings, ctx);
        break;
      }
      if (i < sparams.size()) infer_from(sparams[i].type, pparams[i].type, bindings, ctx);
    }
    return infer_from(s.return_type, p.return_type, bindings, ctx);
  };
  if (const auto * pf = dyn_cast<FunctionKey>(pk)) {
    const auto * sf = dyn_cast<FunctionKey>(sk);
    if (!sf) return false;
    return infer_signature(interner_.function_shape(sf->shape), interner_.function_shape(pf->shape));
  }
  if (const auto * pc = dyn_cast<ConstructorKey>(pk)) {
    const auto * sc = dyn_cast<ConstructorKey>(sk);
    if (!sc) return false;
    return infer_signature(interner_.function_shape(sc->shape), interner_.function_shape(pc->shape));
  }

  // -- Deferred applications of the same generic ---------------------------------
  if (const auto * papp = dyn_cast<ApplicationKey>(pk)) {
    const auto * sapp = dyn_cast<ApplicationKey>(sk);
    if (!sapp || sapp->base != papp->base) return false;
    const auto sargs = interner_.type_list(sapp->args);
    const auto pargs = interner_.type_list(papp->args);
    for (size_t i = 0; i < std::min(sargs.size(), pargs.size()); ++i) {
      if (!infer_from(sargs[i], pargs[i], bindings, ctx)) return false;
    }
    return true;
  }

  return true;
}

}  // namespace tscore

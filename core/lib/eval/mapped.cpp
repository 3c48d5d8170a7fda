// tscore/eval/mapped.cpp - Mapped type evaluation
//
#include <optional>
#include <string>
#include <utility>

#include "tscore/basic/casting.hpp"
#include "tscore/eval/evaluator.hpp"

namespace tscore
{

namespace
{

bool apply_modifier(MappedModifier modifier, bool inherited)
{
  switch (modifier) {
    case MappedModifier::Add:
      return true;
    case MappedModifier::Remove:
      return false;
    case MappedModifier::Preserve:
      return inherited;
  }
  return inherited;
}

TypeId without_undefined(TypeInterner & interner, TypeId type)
{
  std::vector<TypeId> kept;
  for (TypeId m : interner.union_members(type)) {
    if (m != k_undefined) kept.push_back(m);
  }
  return interner.union_of(std::move(kept));
}

}  // namespace

TypeId Evaluator::evaluate_mapped(TypeId id, const MappedKey & key, QueryContext & ctx)
{
  // Homomorphic form `[P in keyof S]` keeps S's per-property modifiers.
  TypeId source;
  if (!key.constraint.is_intrinsic()) {
    if (const auto * ko = dyn_cast<KeyOfKey>(interner_.lookup(key.constraint))) {
      source = evaluate(ko->operand, ctx);
    }
  }

  const ObjectShape * source_shape = nullptr;
  if (source.is_valid()) {
    if (is_generic(source)) return id;

    const TypeId structural = judge_.normalize(source, ctx);
    const auto members = interner_.union_members(structural);
    if (members.size() > 1) {
      // Homomorphic mapped types distribute over a union source.
      std::vector<TypeId> results;
      for (TypeId m : members) {
        MappedKey per_member = key;
        per_member.constraint = interner_.keyof(m);
        results.push_back(evaluate(interner_.mapped(std::move(per_member)), ctx));
      }
      return interner_.union_of(std::move(results));
    }

    if (!structural.is_intrinsic() && !key.name_type.is_valid()) {
      const TypeKey & sk = interner_.lookup(structural);
      if (isa<ArrayKey>(sk) || isa<ReadonlyArrayKey>(sk) || isa<TupleKey>(sk)) {
        return map_array_like(structural, key, ctx);
      }
    }

    source_shape = object_shape_of(interner_, structural);
    if (!source_shape) {
      // Primitives are mapped through their apparent interface.
      source_shape = object_shape_of(interner_, judge_.normalize(apparent_type(structural, ctx), ctx));
    }
  }

  const TypeId keys = evaluate(key.constraint, ctx);
  if (is_generic(keys)) return id;

  ObjectShape out;
  uint32_t count = 0;
  for (TypeId k : interner_.union_members(keys)) {
    if (++count > ctx.guard.limits().max_mapped_keys) {
      ctx.guard.record_truncation(
        BudgetKind::MappedKeys, "limit " + std::to_string(ctx.guard.limits().max_mapped_keys));
      return k_unknown;
    }

    const Substitution per_key{{key.param.def, k}};
    const TypeId names = key.name_type.is_valid()
                           ? evaluate(substitute(key.name_type, per_key, ctx), ctx)
                           : k;
    if (names == k_never) continue;

    TypeId value = evaluate(substitute(key.template_type, per_key, ctx), ctx);

    const std::optional<std::string> source_name = property_name_of(interner_, k);
    const PropertyInfo * sp =
      (source_shape && source_name) ? source_shape->find(*source_name) : nullptr;
    const bool optional = apply_modifier(key.optional_modifier, sp && sp->optional);
    const bool readonly = apply_modifier(key.readonly_modifier, sp && sp->readonly);
    if (key.optional_modifier == MappedModifier::Remove && sp && sp->optional) {
      value = without_undefined(interner_, value);
    }

    for (TypeId name : interner_.union_members(names)) {
      if (name == k_string) {
        out.string_index = IndexSignature{k_string, value, readonly};
        continue;
      }
      if (name == k_number) {
        out.number_index = IndexSignature{k_number, value, readonly};
        continue;
      }
      const std::optional<std::string> text = property_name_of(interner_, name);
      if (!text) continue;

      PropertyInfo prop;
      prop.name = *text;
      prop.read_type = value;
      prop.write_type = value;
      prop.optional = optional;
      prop.readonly = readonly;
      prop.is_method = sp && sp->is_method && !key.name_type.is_valid();
      out.properties.push_back(std::move(prop));
    }
  }
  return interner_.object(std::move(out));
}

TypeId Evaluator::map_array_like(TypeId source, const MappedKey & key, QueryContext & ctx)
{
  const auto map_element = [&](TypeId index_key) {
    return evaluate(substitute(key.template_type, Substitution{{key.param.def, index_key}}, ctx), ctx);
  };

  const TypeKey & sk = interner_.lookup(source);
  if (const auto * tup = dyn_cast<TupleKey>(sk)) {
    std::vector<TupleElement> out;
    size_t index = 0;
    for (const auto & e : interner_.tuple_list(tup->elements)) {
      TupleElement mapped = e;
      if (e.rest) {
        mapped.type = interner_.array_of(map_element(k_number));
      } else {
        mapped.type = map_element(interner_.literal_string(std::to_string(index)));
        mapped.optional = apply_modifier(key.optional_modifier, e.optional);
        if (key.optional_modifier == MappedModifier::Remove && e.optional) {
          mapped.type = without_undefined(interner_, mapped.type);
        }
      }
      out.push_back(std::move(mapped));
      ++index;
    }
    return interner_.tuple(std::move(out));
  }

  const bool was_readonly = isa<ReadonlyArrayKey>(sk);
  const TypeId element = map_element(k_number);
  return apply_modifier(key.readonly_modifier, was_readonly) ? interner_.readonly_array_of(element)
                                                             : interner_.array_of(element);
}

}  // namespace tscore

// tscore/eval/type_operators.cpp - keyof, indexed access and string intrinsics
//
#include <algorithm>
#include <cctype>
#include <string>
#include <utility>

#include "tscore/basic/casting.hpp"
#include "tscore/basic/number_format.hpp"
#include "tscore/eval/evaluator.hpp"

namespace tscore
{

std::optional<std::string> property_name_of(const TypeInterner & interner, TypeId key)
{
  const LiteralValue * v = interner.literal_value(key);
  if (!v) return std::nullopt;
  if (v->kind == LiteralKind::String) return v->text;
  if (v->kind == LiteralKind::Number) return format_number(v->number);
  return std::nullopt;
}

// ============================================================================
// keyof
// ============================================================================

TypeId Evaluator::keys_of_shape(const ObjectShape & shape)
{
  std::vector<TypeId> keys;
  keys.reserve(shape.properties.size() + 2);
  for (const auto & p : shape.properties) keys.push_back(interner_.literal_string(p.name));
  if (shape.string_index) {
    keys.push_back(k_string);
    keys.push_back(k_number);
  }
  if (shape.number_index) keys.push_back(k_number);
  return interner_.union_of(std::move(keys));
}

TypeId Evaluator::keyof(TypeId operand, QueryContext & ctx)
{
  const TypeId t = evaluate(operand, ctx);
  if (t == k_any || t == k_never) return interner_.union_of({k_string, k_number, k_symbol});
  if (t == k_unknown || t == k_null || t == k_undefined || t == k_void) return k_never;
  if (is_generic(t)) return interner_.keyof(t);

  const TypeId s = judge_.normalize(t, ctx);
  if (s.is_valid() && !s.is_intrinsic()) {
    const TypeKey & key = interner_.lookup(s);

    if (isa<LazyKey>(key)) return interner_.keyof(s);

    // Keys of a union are the keys common to every member.
    if (const auto * u = dyn_cast<UnionKey>(key)) {
      std::vector<std::vector<TypeId>> sets;
      for (TypeId m : interner_.type_list(u->members)) {
        sets.push_back(interner_.union_members(keyof(m, ctx)));
      }
      const auto covered = [&](TypeId k, const std::vector<TypeId> & set) {
        return std::find(set.begin(), set.end(), k) != set.end() ||
               std::find(set.begin(), set.end(), interner_.widen_literal(k)) != set.end();
      };
      std::vector<TypeId> common;
      for (const auto & set : sets) {
        for (TypeId k : set) {
          const bool everywhere = std::all_of(
            sets.begin(), sets.end(), [&](const std::vector<TypeId> & other) { return covered(k, other); });
          if (everywhere) common.push_back(k);
        }
      }
      return interner_.union_of(std::move(common));
    }

    if (const auto * i = dyn_cast<IntersectionKey>(key)) {
      std::vector<TypeId> all;
      for (TypeId m : interner_.type_list(i->members)) all.push_back(keyof(m, ctx));
      return interner_.union_of(std::move(all));
    }

    if (const auto * obj = dyn_cast<ObjectKey>(key)) {
      return keys_of_shape(interner_.object_shape(obj->shape));
    }
  }

  // Primitives, arrays, tuples and functions: keys of the apparent interface.
  const TypeId apparent = judge_.normalize(apparent_type(s, ctx), ctx);
  if (const ObjectShape * shape = object_shape_of(interner_, apparent)) return keys_of_shape(*shape);
  return k_never;
}

// ============================================================================
// Indexed Access
// ============================================================================

TypeId Evaluator::index_access(TypeId object, TypeId index, QueryContext & ctx)
{
  const TypeId obj = evaluate(object, ctx);
  const TypeId idx = evaluate(index, ctx);
  if (is_generic(obj) || is_generic(idx)) return interner_.index_access(obj, idx);
  if (obj == k_any) return k_any;
  if (idx == k_never) return k_never;

  const auto keys = interner_.union_members(idx);
  if (keys.size() > 1) {
    std::vector<TypeId> results;
    results.reserve(keys.size());
    for (TypeId k : keys) results.push_back(property_type(obj, k, ctx));
    return interner_.union_of(std::move(results));
  }
  return property_type(obj, idx, ctx);
}

TypeId Evaluator::property_type(TypeId object, TypeId key, QueryContext & ctx)
{
  const TypeId s = judge_.normalize(object, ctx);
  if (s == k_any) return k_any;

  const auto members = interner_.union_members(s);
  if (members.size() > 1) {
    std::vector<TypeId> results;
    for (TypeId m : members) results.push_back(property_type(m, key, ctx));
    return interner_.union_of(std::move(results));
  }

  const TypeKey & sk = interner_.lookup(s);
  if (const auto * i = dyn_cast<IntersectionKey>(sk)) {
    std::vector<TypeId> found;
    for (TypeId m : interner_.type_list(i->members)) {
      const TypeId t = property_type(m, key, ctx);
      if (t != k_unknown) found.push_back(t);
    }
    return found.empty() ? k_unknown : interner_.intersection_of(std::move(found));
  }
  if (const auto * obj = dyn_cast<ObjectKey>(sk)) {
    const TypeId t = lookup_in_shape(interner_.object_shape(obj->shape), key);
    return t.is_valid() ? t : k_unknown;
  }
  if (const auto * tup = dyn_cast<TupleKey>(sk)) {
    const TypeId t = lookup_in_tuple(interner_.tuple_list(tup->elements), key);
    if (t.is_valid()) return t;
  }

  TypeId element;
  if (const auto * arr = dyn_cast<ArrayKey>(sk)) element = arr->element;
  if (const auto * arr = dyn_cast<ReadonlyArrayKey>(sk)) element = arr->element;
  if (element.is_valid()) {
    const auto name = property_name_of(interner_, key);
    if (key == k_number || (name && is_numeric_literal_name(*name))) return element;
  }

  const TypeId apparent = apparent_type(s, ctx);
  if (apparent == s) return k_unknown;
  return property_type(apparent, key, ctx);
}

TypeId Evaluator::lookup_in_shape(const ObjectShape & shape, TypeId key)
{
  if (key == k_string) {
    return shape.string_index ? shape.string_index->value_type : k_invalid_type;
  }
  if (key == k_number) {
    if (shape.number_index) return shape.number_index->value_type;
    return shape.string_index ? shape.string_index->value_type : k_invalid_type;
  }

  const auto name = property_name_of(interner_, key);
  if (!name) return k_invalid_type;
  if (const PropertyInfo * p = shape.find(*name)) {
    return p->optional ? interner_.union_of({p->read_type, k_undefined}) : p->read_type;
  }
  if (shape.number_index && is_numeric_literal_name(*name)) return shape.number_index->value_type;
  if (shape.string_index) return shape.string_index->value_type;
  return k_invalid_type;
}

TypeId Evaluator::lookup_in_tuple(gsl::span<const TupleElement> elements, TypeId key)
{
  const auto element_type = [&](const TupleElement & e) -> TypeId {
    if (!e.rest) return e.type;
    if (!e.type.is_intrinsic()) {
      if (const auto * arr = dyn_cast<ArrayKey>(interner_.lookup(e.type))) return arr->element;
    }
    return e.type;
  };

  if (key == k_number) {
    std::vector<TypeId> all;
    for (const auto & e : elements) all.push_back(element_type(e));
    return interner_.union_of(std::move(all));
  }

  const auto name = property_name_of(interner_, key);
  if (!name) return k_invalid_type;

  const bool has_rest = !elements.empty() && elements.back().rest;
  const size_t fixed = has_rest ? elements.size() - 1 : elements.size();

  if (*name == "length") {
    const bool variable = has_rest || std::any_of(elements.begin(), elements.end(), [](const TupleElement & e) {
      return e.optional;
    });
    return variable ? k_number : interner_.literal_number(static_cast<double>(fixed));
  }

  if (!is_numeric_literal_name(*name)) return k_invalid_type;
  const auto n = parse_number(*name);
  if (!n || *n < 0) return k_invalid_type;
  const auto position = static_cast<size_t>(*n);
  if (position < fixed) {
    const TupleElement & e = elements[position];
    return e.optional ? interner_.union_of({e.type, k_undefined}) : e.type;
  }
  return has_rest ? element_type(elements.back()) : k_undefined;
}

// ============================================================================
// String Intrinsics
// ============================================================================

TypeId Evaluator::string_intrinsic(StringIntrinsicKind kind, TypeId operand, QueryContext & ctx)
{
  const TypeId t = evaluate(operand, ctx);
  if (t == k_any || t == k_never) return t;
  if (is_generic(t)) return interner_.string_intrinsic(kind, t);

  const auto members = interner_.union_members(t);
  if (members.size() > 1) {
    std::vector<TypeId> results;
    for (TypeId m : members) results.push_back(string_intrinsic(kind, m, ctx));
    return interner_.union_of(std::move(results));
  }

  const LiteralValue * v = interner_.literal_value(t);
  if (!v || v->kind != LiteralKind::String) return interner_.string_intrinsic(kind, t);

  std::string text = v->text;
  const auto upper = [](char c) { return static_cast<char>(std::toupper(static_cast<unsigned char>(c))); };
  const auto lower = [](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); };
  switch (kind) {
    case StringIntrinsicKind::Uppercase:
      std::transform(text.begin(), text.end(), text.begin(), upper);
      break;
    case StringIntrinsicKind::Lowercase:
      std::transform(text.begin(), text.end(), text.begin(), lower);
      break;
    case StringIntrinsicKind::Capitalize:
      if (!text.empty()) text.front() = upper(text.front());
      break;
    case StringIntrinsicKind::Uncapitalize:
      if (!text.empty()) text.front() = lower(text.front());
      break;
  }
  return interner_.literal_string(std::move(text));
}

}  // namespace tscore

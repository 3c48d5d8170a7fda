// tscore/types/interner.cpp - TypeInterner implementation
//
#include "tscore/types/interner.hpp"

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <utility>

#include "tscore/basic/casting.hpp"
#include "tscore/basic/number_format.hpp"

namespace tscore
{

namespace
{

const std::vector<TypeKey> & intrinsic_keys()
{
  static const std::vector<TypeKey> keys = [] {
    std::vector<TypeKey> out;
    out.reserve(k_intrinsic_count);
    for (uint32_t i = 0; i < k_intrinsic_count; ++i) {
      out.emplace_back(IntrinsicKey{static_cast<IntrinsicKind>(i)});
    }
    return out;
  }();
  return keys;
}

void sort_unique(std::vector<TypeId> & ids)
{
  std::sort(ids.begin(), ids.end());
  ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
}

[[nodiscard]] TypeId literal_base(const LiteralValue & v) noexcept
{
  switch (v.kind) {
    case LiteralKind::String:
      return k_string;
    case LiteralKind::Number:
      return k_number;
    case LiteralKind::BigInt:
      return k_bigint;
    case LiteralKind::Boolean:
      return k_boolean;
  }
  return k_invalid_type;
}

/// Primitive "class" a member belongs to, for intersection disjointness.
[[nodiscard]] std::optional<IntrinsicKind> primitive_class(const TypeKey & key)
{
  if (const auto * intr = dyn_cast<IntrinsicKey>(key)) {
    switch (intr->kind) {
      case IntrinsicKind::String:
      case IntrinsicKind::Number:
      case IntrinsicKind::Boolean:
      case IntrinsicKind::BigInt:
      case IntrinsicKind::Symbol:
      case IntrinsicKind::Null:
      case IntrinsicKind::Undefined:
        return intr->kind;
      default:
        return std::nullopt;
    }
  }
  if (const auto * lit = dyn_cast<LiteralKey>(key)) {
    switch (lit->value.kind) {
      case LiteralKind::String:
        return IntrinsicKind::String;
      case LiteralKind::Number:
        return IntrinsicKind::Number;
      case LiteralKind::BigInt:
        return IntrinsicKind::BigInt;
      case LiteralKind::Boolean:
        return IntrinsicKind::Boolean;
    }
  }
  return std::nullopt;
}

}  // namespace

// ============================================================================
// Raw Interning
// ============================================================================

TypeId TypeInterner::intern(TypeKey key)
{
  if (const auto * intr = dyn_cast<IntrinsicKey>(key)) {
    return intrinsic_type_id(intr->kind);
  }
  return TypeId{types_.intern(std::move(key))};
}

const TypeKey & TypeInterner::lookup(TypeId id) const
{
  if (id.is_intrinsic()) {
    return intrinsic_keys()[id.value - 1];
  }
  if (id.value < k_first_user_type_id) {
    throw std::out_of_range("unknown type id " + std::to_string(id.value));
  }
  return types_.get(id.value);
}

bool TypeInterner::contains(TypeId id) const
{
  if (id.is_intrinsic()) return true;
  if (id.value < k_first_user_type_id) return false;
  return types_.contains(id.value);
}

// ============================================================================
// Member Lists
// ============================================================================

TypeListId TypeInterner::intern_type_list(std::vector<TypeId> list)
{
  return TypeListId{type_lists_.intern(std::move(list))};
}

gsl::span<const TypeId> TypeInterner::type_list(TypeListId id) const
{
  const auto & list = type_lists_.get(id.value);
  return {list.data(), list.size()};
}

TupleListId TypeInterner::intern_tuple_list(std::vector<TupleElement> list)
{
  return TupleListId{tuple_lists_.intern(std::move(list))};
}

gsl::span<const TupleElement> TypeInterner::tuple_list(TupleListId id) const
{
  const auto & list = tuple_lists_.get(id.value);
  return {list.data(), list.size()};
}

ParamListId TypeInterner::intern_param_list(std::vector<ParamInfo> list)
{
  return ParamListId{param_lists_.intern(std::move(list))};
}

gsl::span<const ParamInfo> TypeInterner::param_list(ParamListId id) const
{
  const auto & list = param_lists_.get(id.value);
  return {list.data(), list.size()};
}

ObjectShapeId TypeInterner::intern_object_shape(ObjectShape shape)
{
  return ObjectShapeId{object_shapes_.intern(std::move(shape))};
}

const ObjectShape & TypeInterner::object_shape(ObjectShapeId id) const
{
  return object_shapes_.get(id.value);
}

FunctionShapeId TypeInterner::intern_function_shape(FunctionShape shape)
{
  return FunctionShapeId{function_shapes_.intern(std::move(shape))};
}

const FunctionShape & TypeInterner::function_shape(FunctionShapeId id) const
{
  return function_shapes_.get(id.value);
}

TemplateSpanListId TypeInterner::intern_span_list(std::vector<TemplateSpan> list)
{
  return TemplateSpanListId{span_lists_.intern(std::move(list))};
}

gsl::span<const TemplateSpan> TypeInterner::span_list(TemplateSpanListId id) const
{
  const auto & list = span_lists_.get(id.value);
  return {list.data(), list.size()};
}

// ============================================================================
// Literal Constructors
// ============================================================================

TypeId TypeInterner::literal(LiteralValue value) { return intern(LiteralKey{std::move(value)}); }

TypeId TypeInterner::literal_string(std::string text)
{
  return literal(LiteralValue::of_string(std::move(text)));
}

TypeId TypeInterner::literal_number(double value)
{
  return literal(LiteralValue::of_number(value));
}

TypeId TypeInterner::literal_bigint(std::string digits)
{
  return literal(LiteralValue::of_bigint(std::move(digits)));
}

TypeId TypeInterner::literal_boolean(bool value)
{
  return literal(LiteralValue::of_boolean(value));
}

// ============================================================================
// Union / Intersection
// ============================================================================

TypeId TypeInterner::union_of(std::vector<TypeId> members)
{
  std::vector<TypeId> flat;
  flat.reserve(members.size());
  bool has_unknown = false;

  for (TypeId m : members) {
    if (!m.is_valid() || m == k_never) continue;
    if (m == k_any) return k_any;
    if (m == k_unknown) {
      has_unknown = true;
      continue;
    }
    if (const auto * u = dyn_cast<UnionKey>(lookup(m))) {
      // Interned unions are already flat and free of any/unknown/never.
      for (TypeId inner : type_list(u->members)) flat.push_back(inner);
    } else {
      flat.push_back(m);
    }
  }
  if (has_unknown) return k_unknown;

  sort_unique(flat);

  const auto present = [&](TypeId t) { return std::binary_search(flat.begin(), flat.end(), t); };
  const TypeId lit_true = literal_boolean(true);
  const TypeId lit_false = literal_boolean(false);
  const bool collapse_boolean = present(lit_true) && present(lit_false);

  std::vector<TypeId> out;
  out.reserve(flat.size() + 1);
  for (TypeId m : flat) {
    if (const LiteralValue * v = literal_value(m)) {
      if (present(literal_base(*v))) continue;
      if (collapse_boolean && v->kind == LiteralKind::Boolean) continue;
    }
    out.push_back(m);
  }
  if (collapse_boolean) {
    out.push_back(k_boolean);
    sort_unique(out);
  }

  if (out.empty()) return k_never;
  if (out.size() == 1) return out.front();
  return intern(UnionKey{intern_type_list(std::move(out))});
}

TypeId TypeInterner::intersection_of(std::vector<TypeId> members)
{
  std::vector<TypeId> flat;
  flat.reserve(members.size());
  bool has_any = false;

  for (TypeId m : members) {
    if (!m.is_valid() || m == k_unknown) continue;
    if (m == k_never) return k_never;
    if (m == k_any) {
      has_any = true;
      continue;
    }
    if (const auto * i = dyn_cast<IntersectionKey>(lookup(m))) {
      for (TypeId inner : type_list(i->members)) flat.push_back(inner);
    } else {
      flat.push_back(m);
    }
  }
  if (has_any) return k_any;

  sort_unique(flat);

  // Disjoint primitives and distinct literals of one primitive are empty.
  std::optional<IntrinsicKind> cls;
  TypeId lit = k_invalid_type;
  for (TypeId m : flat) {
    const auto c = primitive_class(lookup(m));
    if (!c) continue;
    if (cls && *cls != c) return k_never;
    cls = c;
    if (literal_value(m) != nullptr) {
      if (lit.is_valid() && lit != m) return k_never;
      lit = m;
    }
  }
  if (lit.is_valid()) {
    const TypeId base = widen_literal(lit);
    flat.erase(std::remove(flat.begin(), flat.end(), base), flat.end());
  }

  if (flat.empty()) return k_unknown;
  if (flat.size() == 1) return flat.front();
  return intern(IntersectionKey{intern_type_list(std::move(flat))});
}

// ============================================================================
// Other Composite Constructors
// ============================================================================

TypeId TypeInterner::array_of(TypeId element) { return intern(ArrayKey{element}); }

TypeId TypeInterner::readonly_array_of(TypeId element)
{
  return intern(ReadonlyArrayKey{element});
}

TypeId TypeInterner::tuple(std::vector<TupleElement> elements)
{
  return intern(TupleKey{intern_tuple_list(std::move(elements))});
}

TypeId TypeInterner::object(ObjectShape shape)
{
  std::vector<PropertyInfo> props;
  props.reserve(shape.properties.size());
  for (auto & p : shape.properties) {
    auto it = std::find_if(
      props.begin(), props.end(), [&](const PropertyInfo & q) { return q.name == p.name; });
    if (!p.write_type.is_valid()) p.write_type = p.read_type;
    if (it != props.end()) {
      *it = std::move(p);
    } else {
      props.push_back(std::move(p));
    }
  }
  shape.properties = std::move(props);
  return intern(ObjectKey{intern_object_shape(std::move(shape))});
}

TypeId TypeInterner::make_signature(SignatureSpec sig, bool is_constructor)
{
  FunctionShape shape;
  shape.type_params = std::move(sig.type_params);
  shape.params = intern_param_list(std::move(sig.params));
  shape.this_type = sig.this_type;
  shape.return_type = sig.return_type;
  shape.is_method = sig.is_method;
  const FunctionShapeId id = intern_function_shape(std::move(shape));
  if (is_constructor) return intern(ConstructorKey{id});
  return intern(FunctionKey{id});
}

TypeId TypeInterner::function(SignatureSpec sig) { return make_signature(std::move(sig), false); }

TypeId TypeInterner::constructor(SignatureSpec sig)
{
  return make_signature(std::move(sig), true);
}

TypeId TypeInterner::type_parameter(TypeParamInfo info)
{
  return intern(TypeParameterKey{std::move(info)});
}

TypeId TypeInterner::infer(TypeParamInfo info) { return intern(InferKey{std::move(info)}); }

TypeId TypeInterner::application(TypeId base, std::vector<TypeId> args)
{
  return intern(ApplicationKey{base, intern_type_list(std::move(args))});
}

TypeId TypeInterner::conditional(TypeId check, TypeId extends, TypeId true_type, TypeId false_type)
{
  const bool distributive = isa<TypeParameterKey>(lookup(check));
  return conditional(check, extends, true_type, false_type, distributive);
}

TypeId TypeInterner::conditional(
  TypeId check, TypeId extends, TypeId true_type, TypeId false_type, bool distributive)
{
  return intern(ConditionalKey{check, extends, true_type, false_type, distributive});
}

TypeId TypeInterner::mapped(MappedKey key) { return intern(std::move(key)); }

TypeId TypeInterner::template_literal(std::vector<TemplateSpan> spans)
{
  std::vector<TemplateSpan> out;
  out.reserve(spans.size());

  const auto push_text = [&](const std::string & text) {
    if (text.empty()) return;
    if (!out.empty() && out.back().is_text()) {
      out.back().text += text;
    } else {
      out.push_back(TemplateSpan{text, k_invalid_type});
    }
  };

  for (auto & span : spans) {
    if (span.is_text()) {
      push_text(span.text);
      continue;
    }
    const TypeId t = span.type;
    if (t == k_never) return k_never;

    if (const LiteralValue * v = literal_value(t)) {
      switch (v->kind) {
        case LiteralKind::String:
        case LiteralKind::BigInt:
          push_text(v->text);
          break;
        case LiteralKind::Number:
          push_text(format_number(v->number));
          break;
        case LiteralKind::Boolean:
          push_text(v->boolean ? "true" : "false");
          break;
      }
      continue;
    }
    if (const auto * inner = dyn_cast<TemplateLiteralKey>(lookup(t))) {
      for (const auto & s : span_list(inner->spans)) {
        if (s.is_text()) {
          push_text(s.text);
        } else {
          out.push_back(s);
        }
      }
      continue;
    }
    out.push_back(TemplateSpan{std::string(), t});
  }

  if (out.empty()) return literal_string("");
  if (out.size() == 1 && out.front().is_text()) return literal_string(out.front().text);
  if (out.size() == 1 && out.front().type == k_string) return k_string;
  return intern(TemplateLiteralKey{intern_span_list(std::move(out))});
}

TypeId TypeInterner::enum_type(DefId def, std::vector<TypeId> members, EnumKind kind)
{
  return intern(EnumKey{def, intern_type_list(std::move(members)), kind});
}

TypeId TypeInterner::lazy(DefId def) { return intern(LazyKey{def}); }

TypeId TypeInterner::type_query(DefId def) { return intern(TypeQueryKey{def}); }

TypeId TypeInterner::keyof(TypeId operand) { return intern(KeyOfKey{operand}); }

TypeId TypeInterner::index_access(TypeId object, TypeId index)
{
  return intern(IndexAccessKey{object, index});
}

TypeId TypeInterner::this_type() { return intern(ThisTypeKey{}); }

TypeId TypeInterner::string_intrinsic(StringIntrinsicKind kind, TypeId operand)
{
  return intern(StringIntrinsicKey{kind, operand});
}

TypeId TypeInterner::widen_freshness(TypeId id)
{
  if (id.is_intrinsic()) return id;
  const TypeKey & key = lookup(id);
  if (const auto * obj = dyn_cast<ObjectKey>(key)) {
    const ObjectShape & shape = object_shape(obj->shape);
    if (!shape.is_fresh) return id;
    ObjectShape widened = shape;
    widened.is_fresh = false;
    return object(std::move(widened));
  }
  if (const auto * u = dyn_cast<UnionKey>(key)) {
    std::vector<TypeId> members;
    for (TypeId m : type_list(u->members)) members.push_back(widen_freshness(m));
    return union_of(std::move(members));
  }
  return id;
}

// ============================================================================
// Queries
// ============================================================================

const LiteralValue * TypeInterner::literal_value(TypeId id) const
{
  if (id.is_intrinsic() || !id.is_valid()) return nullptr;
  if (const auto * lit = dyn_cast<LiteralKey>(lookup(id))) return &lit->value;
  return nullptr;
}

TypeId TypeInterner::widen_literal(TypeId id) const
{
  if (const LiteralValue * v = literal_value(id)) return literal_base(*v);
  return id;
}

std::vector<TypeId> TypeInterner::union_members(TypeId id) const
{
  if (!id.is_intrinsic() && id.is_valid()) {
    if (const auto * u = dyn_cast<UnionKey>(lookup(id))) {
      const auto members = type_list(u->members);
      return {members.begin(), members.end()};
    }
  }
  return {id};
}

}  // namespace tscore

// tscore/types/type_key.cpp - TypeKey equality and hashing
//
#include "tscore/types/type_key.hpp"

#include <cstring>
#include <iterator>
#include <utility>

#include "tscore/basic/casting.hpp"
#include "tscore/basic/hash.hpp"

namespace tscore
{

const char * intrinsic_name(IntrinsicKind kind) noexcept
{
  switch (kind) {
    case IntrinsicKind::Any:
      return "any";
    case IntrinsicKind::Unknown:
      return "unknown";
    case IntrinsicKind::Never:
      return "never";
    case IntrinsicKind::Void:
      return "void";
    case IntrinsicKind::Null:
      return "null";
    case IntrinsicKind::Undefined:
      return "undefined";
    case IntrinsicKind::Boolean:
      return "boolean";
    case IntrinsicKind::Number:
      return "number";
    case IntrinsicKind::String:
      return "string";
    case IntrinsicKind::BigInt:
      return "bigint";
    case IntrinsicKind::Symbol:
      return "symbol";
    case IntrinsicKind::Object:
      return "object";
    case IntrinsicKind::Function:
      return "Function";
    case IntrinsicKind::Unresolved:
      return "<unresolved>";
  }
  return "<intrinsic>";
}

// ============================================================================
// LiteralValue
// ============================================================================

LiteralValue LiteralValue::of_string(std::string s)
{
  LiteralValue v;
  v.kind = LiteralKind::String;
  v.text = std::move(s);
  return v;
}

LiteralValue LiteralValue::of_number(double n)
{
  LiteralValue v;
  v.kind = LiteralKind::Number;
  v.number = n;
  return v;
}

LiteralValue LiteralValue::of_bigint(std::string digits)
{
  LiteralValue v;
  v.kind = LiteralKind::BigInt;
  v.text = std::move(digits);
  return v;
}

LiteralValue LiteralValue::of_boolean(bool b)
{
  LiteralValue v;
  v.kind = LiteralKind::Boolean;
  v.boolean = b;
  return v;
}

namespace
{

[[nodiscard]] uint64_t double_bits(double d) noexcept
{
  uint64_t bits = 0;
  std::memcpy(&bits, &d, sizeof(bits));
  return bits;
}

}  // namespace

bool operator==(const LiteralValue & a, const LiteralValue & b) noexcept
{
  if (a.kind != b.kind) return false;
  switch (a.kind) {
    case LiteralKind::String:
    case LiteralKind::BigInt:
      return a.text == b.text;
    case LiteralKind::Number:
      return double_bits(a.number) == double_bits(b.number);
    case LiteralKind::Boolean:
      return a.boolean == b.boolean;
  }
  return false;
}

size_t LiteralValueHash::operator()(const LiteralValue & v) const noexcept
{
  size_t seed = static_cast<size_t>(v.kind);
  switch (v.kind) {
    case LiteralKind::String:
    case LiteralKind::BigInt:
      hash_field(seed, v.text);
      break;
    case LiteralKind::Number:
      hash_field(seed, double_bits(v.number));
      break;
    case LiteralKind::Boolean:
      hash_field(seed, v.boolean);
      break;
  }
  return seed;
}

// ============================================================================
// ObjectShape
// ============================================================================

const PropertyInfo * ObjectShape::find(std::string_view name) const noexcept
{
  for (const auto & p : properties) {
    if (p.name == name) return &p;
  }
  return nullptr;
}

bool operator==(const ObjectShape & a, const ObjectShape & b) noexcept
{
  if (a.is_fresh != b.is_fresh) return false;
  if (a.string_index != b.string_index || a.number_index != b.number_index) return false;
  if (a.properties.size() != b.properties.size()) return false;

  // Order-insensitive: every property of `a` has an equal counterpart in `b`.
  // Names are unique within a shape, so equal sizes make this a bijection.
  for (const auto & p : a.properties) {
    const PropertyInfo * q = b.find(p.name);
    if (!q || *q != p) return false;
  }
  return true;
}

namespace
{

[[nodiscard]] size_t hash_type_param(const TypeParamInfo & p) noexcept
{
  size_t seed = 0;
  hash_field(seed, p.def);
  hash_field(seed, p.name);
  hash_field(seed, p.constraint);
  hash_field(seed, p.default_type);
  return seed;
}

[[nodiscard]] size_t hash_property(const PropertyInfo & p) noexcept
{
  size_t seed = 0;
  hash_field(seed, p.name);
  hash_field(seed, p.read_type);
  hash_field(seed, p.write_type);
  hash_field(seed, p.optional);
  hash_field(seed, p.readonly);
  hash_field(seed, p.is_method);
  return seed;
}

[[nodiscard]] size_t hash_index(const std::optional<IndexSignature> & sig) noexcept
{
  if (!sig) return 0x51ed27;
  size_t seed = 1;
  hash_field(seed, sig->key_type);
  hash_field(seed, sig->value_type);
  hash_field(seed, sig->readonly);
  return seed;
}

}  // namespace

size_t ObjectShapeHash::operator()(const ObjectShape & shape) const noexcept
{
  // Property hashes are summed so that insertion order does not matter.
  size_t props = 0;
  for (const auto & p : shape.properties) {
    props += hash_property(p);
  }
  size_t seed = props;
  hash_combine(seed, hash_index(shape.string_index));
  hash_combine(seed, hash_index(shape.number_index));
  hash_field(seed, shape.is_fresh);
  return seed;
}

size_t FunctionShapeHash::operator()(const FunctionShape & shape) const noexcept
{
  size_t seed = shape.type_params.size();
  for (const auto & tp : shape.type_params) {
    hash_combine(seed, hash_type_param(tp));
  }
  hash_field(seed, shape.params.value);
  hash_field(seed, shape.this_type);
  hash_field(seed, shape.return_type);
  hash_field(seed, shape.is_method);
  return seed;
}

size_t TypeListHash::operator()(const std::vector<TypeId> & list) const noexcept
{
  size_t seed = list.size();
  for (TypeId t : list) {
    hash_field(seed, t);
  }
  return seed;
}

size_t TupleListHash::operator()(const std::vector<TupleElement> & list) const noexcept
{
  size_t seed = list.size();
  for (const auto & e : list) {
    hash_field(seed, e.type);
    hash_field(seed, e.label);
    hash_field(seed, e.optional);
    hash_field(seed, e.rest);
  }
  return seed;
}

size_t ParamListHash::operator()(const std::vector<ParamInfo> & list) const noexcept
{
  size_t seed = list.size();
  for (const auto & p : list) {
    hash_field(seed, p.name);
    hash_field(seed, p.type);
    hash_field(seed, p.optional);
    hash_field(seed, p.rest);
  }
  return seed;
}

size_t TemplateSpanListHash::operator()(const std::vector<TemplateSpan> & list) const noexcept
{
  size_t seed = list.size();
  for (const auto & s : list) {
    hash_field(seed, s.text);
    hash_field(seed, s.type);
  }
  return seed;
}

// ============================================================================
// Key Equality
// ============================================================================

bool operator==(const IntrinsicKey & a, const IntrinsicKey & b) noexcept
{
  return a.kind == b.kind;
}
bool operator==(const LiteralKey & a, const LiteralKey & b) noexcept { return a.value == b.value; }
bool operator==(const ObjectKey & a, const ObjectKey & b) noexcept { return a.shape == b.shape; }
bool operator==(const ArrayKey & a, const ArrayKey & b) noexcept { return a.element == b.element; }
bool operator==(const ReadonlyArrayKey & a, const ReadonlyArrayKey & b) noexcept
{
  return a.element == b.element;
}
bool operator==(const TupleKey & a, const TupleKey & b) noexcept
{
  return a.elements == b.elements;
}
bool operator==(const UnionKey & a, const UnionKey & b) noexcept { return a.members == b.members; }
bool operator==(const IntersectionKey & a, const IntersectionKey & b) noexcept
{
  return a.members == b.members;
}
bool operator==(const FunctionKey & a, const FunctionKey & b) noexcept
{
  return a.shape == b.shape;
}
bool operator==(const ConstructorKey & a, const ConstructorKey & b) noexcept
{
  return a.shape == b.shape;
}
bool operator==(const TypeParameterKey & a, const TypeParameterKey & b) noexcept
{
  return a.info == b.info;
}
bool operator==(const InferKey & a, const InferKey & b) noexcept { return a.info == b.info; }
bool operator==(const ApplicationKey & a, const ApplicationKey & b) noexcept
{
  return a.base == b.base && a.args == b.args;
}
bool operator==(const ConditionalKey & a, const ConditionalKey & b) noexcept
{
  return a.check == b.check && a.extends == b.extends && a.true_type == b.true_type &&
         a.false_type == b.false_type && a.distributive == b.distributive;
}
bool operator==(const MappedKey & a, const MappedKey & b) noexcept
{
  return a.param == b.param && a.constraint == b.constraint && a.name_type == b.name_type &&
         a.template_type == b.template_type && a.readonly_modifier == b.readonly_modifier &&
         a.optional_modifier == b.optional_modifier;
}
bool operator==(const TemplateLiteralKey & a, const TemplateLiteralKey & b) noexcept
{
  return a.spans == b.spans;
}
bool operator==(const EnumKey & a, const EnumKey & b) noexcept
{
  return a.def == b.def && a.members == b.members && a.kind == b.kind;
}
bool operator==(const LazyKey & a, const LazyKey & b) noexcept { return a.def == b.def; }
bool operator==(const TypeQueryKey & a, const TypeQueryKey & b) noexcept
{
  return a.def == b.def;
}
bool operator==(const KeyOfKey & a, const KeyOfKey & b) noexcept
{
  return a.operand == b.operand;
}
bool operator==(const IndexAccessKey & a, const IndexAccessKey & b) noexcept
{
  return a.object == b.object && a.index == b.index;
}
bool operator==(const ThisTypeKey &, const ThisTypeKey &) noexcept { return true; }
bool operator==(const StringIntrinsicKey & a, const StringIntrinsicKey & b) noexcept
{
  return a.kind == b.kind && a.operand == b.operand;
}

// ============================================================================
// Key Hashing
// ============================================================================

size_t TypeKeyHash::operator()(const TypeKey & key) const noexcept
{
  size_t seed = key.index();
  std::visit(
    Overloaded{
      [&](const IntrinsicKey & k) { hash_field(seed, static_cast<int>(k.kind)); },
      [&](const LiteralKey & k) { hash_combine(seed, LiteralValueHash{}(k.value)); },
      [&](const ObjectKey & k) { hash_field(seed, k.shape.value); },
      [&](const ArrayKey & k) { hash_field(seed, k.element); },
      [&](const ReadonlyArrayKey & k) { hash_field(seed, k.element); },
      [&](const TupleKey & k) { hash_field(seed, k.elements.value); },
      [&](const UnionKey & k) { hash_field(seed, k.members.value); },
      [&](const IntersectionKey & k) { hash_field(seed, k.members.value); },
      [&](const FunctionKey & k) { hash_field(seed, k.shape.value); },
      [&](const ConstructorKey & k) { hash_field(seed, k.shape.value); },
      [&](const TypeParameterKey & k) { hash_combine(seed, hash_type_param(k.info)); },
      [&](const InferKey & k) { hash_combine(seed, hash_type_param(k.info)); },
      [&](const ApplicationKey & k) {
        hash_field(seed, k.base);
        hash_field(seed, k.args.value);
      },
      [&](const ConditionalKey & k) {
        hash_field(seed, k.check);
        hash_field(seed, k.extends);
        hash_field(seed, k.true_type);
        hash_field(seed, k.false_type);
        hash_field(seed, k.distributive);
      },
      [&](const MappedKey & k) {
        hash_combine(seed, hash_type_param(k.param));
        hash_field(seed, k.constraint);
        hash_field(seed, k.name_type);
        hash_field(seed, k.template_type);
        hash_field(seed, static_cast<int>(k.readonly_modifier));
        hash_field(seed, static_cast<int>(k.optional_modifier));
      },
      [&](const TemplateLiteralKey & k) { hash_field(seed, k.spans.value); },
      [&](const EnumKey & k) {
        hash_field(seed, k.def);
        hash_field(seed, k.members.value);
        hash_field(seed, static_cast<int>(k.kind));
      },
      [&](const LazyKey & k) { hash_field(seed, k.def); },
      [&](const TypeQueryKey & k) { hash_field(seed, k.def); },
      [&](const KeyOfKey & k) { hash_field(seed, k.operand); },
      [&](const IndexAccessKey & k) {
        hash_field(seed, k.object);
        hash_field(seed, k.index);
      },
      [&](const ThisTypeKey &) {},
      [&](const StringIntrinsicKey & k) {
        hash_field(seed, static_cast<int>(k.kind));
        hash_field(seed, k.operand);
      },
    },
    key);
  return seed;
}

const char * key_kind_name(const TypeKey & key) noexcept
{
  static constexpr const char * k_names[] = {
    "Intrinsic",   "Literal",     "Object",      "Array",          "ReadonlyArray",
    "Tuple",       "Union",       "Intersection", "Function",      "Constructor",
    "TypeParameter", "Infer",     "Application", "Conditional",    "Mapped",
    "TemplateLiteral", "Enum",    "Lazy",        "TypeQuery",      "KeyOf",
    "IndexAccess", "ThisType",    "StringIntrinsic",
  };
  static_assert(std::size(k_names) == std::variant_size_v<TypeKey>);
  return k_names[key.index()];
}

}  // namespace tscore

// tscore/types/type_key.hpp - Structural description of one type shape
//
// TypeKey is a closed tagged variant. Variants hold only TypeId / DefId /
// list handles, never other keys, so every consumer matches exhaustively
// over a flat set of shapes.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "tscore/types/type_id.hpp"

namespace tscore
{

// ============================================================================
// Interned List Handles
// ============================================================================

/**
 * Handle to an interned member sequence (type list, tuple list, parameter
 * list, object shape, function shape, template span list).
 *
 * The tag parameter keeps the handle kinds from mixing.
 */
template <typename Tag>
struct ListHandle
{
  uint32_t value = 0;

  constexpr ListHandle() noexcept = default;
  explicit constexpr ListHandle(uint32_t v) noexcept : value(v) {}

  friend constexpr bool operator==(ListHandle a, ListHandle b) noexcept
  {
    return a.value == b.value;
  }
  friend constexpr bool operator!=(ListHandle a, ListHandle b) noexcept
  {
    return a.value != b.value;
  }
};

struct TypeListTag;
struct TupleListTag;
struct ParamListTag;
struct ObjectShapeTag;
struct FunctionShapeTag;
struct TemplateSpanTag;

using TypeListId = ListHandle<TypeListTag>;
using TupleListId = ListHandle<TupleListTag>;
using ParamListId = ListHandle<ParamListTag>;
using ObjectShapeId = ListHandle<ObjectShapeTag>;
using FunctionShapeId = ListHandle<FunctionShapeTag>;
using TemplateSpanListId = ListHandle<TemplateSpanTag>;

// ============================================================================
// Literal Values
// ============================================================================

enum class LiteralKind : uint8_t {
  String,
  Number,
  BigInt,
  Boolean,
};

/**
 * Value of a literal type.
 *
 * Numbers compare by bit pattern, so NaN literals intern consistently and
 * 0 / -0 remain distinct keys.
 */
struct LiteralValue
{
  LiteralKind kind = LiteralKind::String;
  std::string text;  ///< String contents or BigInt decimal digits
  double number = 0.0;
  bool boolean = false;

  [[nodiscard]] static LiteralValue of_string(std::string s);
  [[nodiscard]] static LiteralValue of_number(double n);
  [[nodiscard]] static LiteralValue of_bigint(std::string digits);
  [[nodiscard]] static LiteralValue of_boolean(bool b);

  friend bool operator==(const LiteralValue & a, const LiteralValue & b) noexcept;
  friend bool operator!=(const LiteralValue & a, const LiteralValue & b) noexcept
  {
    return !(a == b);
  }
};

// ============================================================================
// Member Descriptors
// ============================================================================

/**
 * A type parameter declaration.
 *
 * `def` is the parameter's stable identity; substitution maps are keyed by it.
 * Absent constraint / default are k_invalid_type.
 */
struct TypeParamInfo
{
  DefId def;
  std::string name;
  TypeId constraint;
  TypeId default_type;

  friend bool operator==(const TypeParamInfo & a, const TypeParamInfo & b) noexcept
  {
    return a.def == b.def && a.name == b.name && a.constraint == b.constraint &&
           a.default_type == b.default_type;
  }
  friend bool operator!=(const TypeParamInfo & a, const TypeParamInfo & b) noexcept
  {
    return !(a == b);
  }
};

/**
 * Property of an object shape.
 *
 * For plain properties read_type == write_type. Split accessors carry an
 * independent write type (getter covariant, setter contravariant).
 */
struct PropertyInfo
{
  std::string name;
  TypeId read_type;
  TypeId write_type;
  bool optional = false;
  bool readonly = false;
  bool is_method = false;

  [[nodiscard]] bool has_split_accessors() const noexcept { return read_type != write_type; }

  friend bool operator==(const PropertyInfo & a, const PropertyInfo & b) noexcept
  {
    return a.name == b.name && a.read_type == b.read_type && a.write_type == b.write_type &&
           a.optional == b.optional && a.readonly == b.readonly && a.is_method == b.is_method;
  }
  friend bool operator!=(const PropertyInfo & a, const PropertyInfo & b) noexcept
  {
    return !(a == b);
  }
};

struct IndexSignature
{
  TypeId key_type;
  TypeId value_type;
  bool readonly = false;

  friend bool operator==(const IndexSignature & a, const IndexSignature & b) noexcept
  {
    return a.key_type == b.key_type && a.value_type == b.value_type && a.readonly == b.readonly;
  }
  friend bool operator!=(const IndexSignature & a, const IndexSignature & b) noexcept
  {
    return !(a == b);
  }
};

/**
 * Members of an object type.
 *
 * Properties keep insertion order for display; identity ignores that order,
 * so `{a; b}` and `{b; a}` intern to the same shape. `is_fresh` marks an
 * object literal expression's type (subject to excess-property checks).
 */
struct ObjectShape
{
  std::vector<PropertyInfo> properties;
  std::optional<IndexSignature> string_index;
  std::optional<IndexSignature> number_index;
  bool is_fresh = false;

  [[nodiscard]] const PropertyInfo * find(std::string_view name) const noexcept;
  [[nodiscard]] bool empty() const noexcept
  {
    return properties.empty() && !string_index && !number_index;
  }

  friend bool operator==(const ObjectShape & a, const ObjectShape & b) noexcept;
  friend bool operator!=(const ObjectShape & a, const ObjectShape & b) noexcept
  {
    return !(a == b);
  }
};

struct TupleElement
{
  TypeId type;
  std::string label;
  bool optional = false;
  bool rest = false;

  friend bool operator==(const TupleElement & a, const TupleElement & b) noexcept
  {
    return a.type == b.type && a.label == b.label && a.optional == b.optional &&
           a.rest == b.rest;
  }
  friend bool operator!=(const TupleElement & a, const TupleElement & b) noexcept
  {
    return !(a == b);
  }
};

struct ParamInfo
{
  std::string name;
  TypeId type;
  bool optional = false;
  bool rest = false;

  friend bool operator==(const ParamInfo & a, const ParamInfo & b) noexcept
  {
    return a.name == b.name && a.type == b.type && a.optional == b.optional && a.rest == b.rest;
  }
  friend bool operator!=(const ParamInfo & a, const ParamInfo & b) noexcept { return !(a == b); }
};

/**
 * Signature shared by Function and Constructor keys.
 *
 * `is_method` is the variance flag: parameters of method-style members may be
 * compared bivariantly by the compatibility layer.
 */
struct FunctionShape
{
  std::vector<TypeParamInfo> type_params;
  ParamListId params;
  TypeId this_type;  ///< k_invalid_type when undeclared
  TypeId return_type;
  bool is_method = false;

  friend bool operator==(const FunctionShape & a, const FunctionShape & b) noexcept
  {
    return a.type_params == b.type_params && a.params == b.params &&
           a.this_type == b.this_type && a.return_type == b.return_type &&
           a.is_method == b.is_method;
  }
  friend bool operator!=(const FunctionShape & a, const FunctionShape & b) noexcept
  {
    return !(a == b);
  }
};

/// One span of a template literal: literal text, or an interpolated type.
struct TemplateSpan
{
  std::string text;
  TypeId type;  ///< k_invalid_type for a text span

  [[nodiscard]] bool is_text() const noexcept { return !type.is_valid(); }

  friend bool operator==(const TemplateSpan & a, const TemplateSpan & b) noexcept
  {
    return a.text == b.text && a.type == b.type;
  }
  friend bool operator!=(const TemplateSpan & a, const TemplateSpan & b) noexcept
  {
    return !(a == b);
  }
};

enum class EnumKind : uint8_t {
  Numeric,
  String,
  Heterogeneous,
};

/// Mapped type modifier (`+readonly`, `-?`, or inherited).
enum class MappedModifier : uint8_t {
  Preserve,
  Add,
  Remove,
};

enum class StringIntrinsicKind : uint8_t {
  Uppercase,
  Lowercase,
  Capitalize,
  Uncapitalize,
};

// ============================================================================
// Type Key Variants
// ============================================================================

struct IntrinsicKey
{
  IntrinsicKind kind;
};

struct LiteralKey
{
  LiteralValue value;
};

struct ObjectKey
{
  ObjectShapeId shape;
};

struct ArrayKey
{
  TypeId element;
};

struct ReadonlyArrayKey
{
  TypeId element;
};

struct TupleKey
{
  TupleListId elements;
};

struct UnionKey
{
  TypeListId members;
};

struct IntersectionKey
{
  TypeListId members;
};

struct FunctionKey
{
  FunctionShapeId shape;
};

struct ConstructorKey
{
  FunctionShapeId shape;
};

struct TypeParameterKey
{
  TypeParamInfo info;
};

/// `infer X` binding position inside a conditional's extends clause.
struct InferKey
{
  TypeParamInfo info;
};

/// Still-unreduced generic instantiation `Base<Args>`.
struct ApplicationKey
{
  TypeId base;
  TypeListId args;
};

struct ConditionalKey
{
  TypeId check;
  TypeId extends;
  TypeId true_type;
  TypeId false_type;
  bool distributive = false;
};

/**
 * `{ [K in Constraint as NameType]: Template }` with modifiers.
 *
 * `name_type` is k_invalid_type when there is no `as` clause.
 */
struct MappedKey
{
  TypeParamInfo param;
  TypeId constraint;
  TypeId name_type;
  TypeId template_type;
  MappedModifier readonly_modifier = MappedModifier::Preserve;
  MappedModifier optional_modifier = MappedModifier::Preserve;
};

struct TemplateLiteralKey
{
  TemplateSpanListId spans;
};

/**
 * Enum type or enum member type.
 *
 * For the enum itself `members` lists every member's literal; for a single
 * member it holds one literal and `def` is the member's DefId.
 */
struct EnumKey
{
  DefId def;
  TypeListId members;
  EnumKind kind = EnumKind::Numeric;
};

struct LazyKey
{
  DefId def;
};

struct TypeQueryKey
{
  DefId def;
};

struct KeyOfKey
{
  TypeId operand;
};

struct IndexAccessKey
{
  TypeId object;
  TypeId index;
};

struct ThisTypeKey
{
};

struct StringIntrinsicKey
{
  StringIntrinsicKind kind;
  TypeId operand;
};

using TypeKey = std::variant<
  IntrinsicKey, LiteralKey, ObjectKey, ArrayKey, ReadonlyArrayKey, TupleKey, UnionKey,
  IntersectionKey, FunctionKey, ConstructorKey, TypeParameterKey, InferKey, ApplicationKey,
  ConditionalKey, MappedKey, TemplateLiteralKey, EnumKey, LazyKey, TypeQueryKey, KeyOfKey,
  IndexAccessKey, ThisTypeKey, StringIntrinsicKey>;

// ============================================================================
// Equality
// ============================================================================

bool operator==(const IntrinsicKey & a, const IntrinsicKey & b) noexcept;
bool operator==(const LiteralKey & a, const LiteralKey & b) noexcept;
bool operator==(const ObjectKey & a, const ObjectKey & b) noexcept;
bool operator==(const ArrayKey & a, const ArrayKey & b) noexcept;
bool operator==(const ReadonlyArrayKey & a, const ReadonlyArrayKey & b) noexcept;
bool operator==(const TupleKey & a, const TupleKey & b) noexcept;
bool operator==(const UnionKey & a, const UnionKey & b) noexcept;
bool operator==(const IntersectionKey & a, const IntersectionKey & b) noexcept;
bool operator==(const FunctionKey & a, const FunctionKey & b) noexcept;
bool operator==(const ConstructorKey & a, const ConstructorKey & b) noexcept;
bool operator==(const TypeParameterKey & a, const TypeParameterKey & b) noexcept;
bool operator==(const InferKey & a, const InferKey & b) noexcept;
bool operator==(const ApplicationKey & a, const ApplicationKey & b) noexcept;
bool operator==(const ConditionalKey & a, const ConditionalKey & b) noexcept;
bool operator==(const MappedKey & a, const MappedKey & b) noexcept;
bool operator==(const TemplateLiteralKey & a, const TemplateLiteralKey & b) noexcept;
bool operator==(const EnumKey & a, const EnumKey & b) noexcept;
bool operator==(const LazyKey & a, const LazyKey & b) noexcept;
bool operator==(const TypeQueryKey & a, const TypeQueryKey & b) noexcept;
bool operator==(const KeyOfKey & a, const KeyOfKey & b) noexcept;
bool operator==(const IndexAccessKey & a, const IndexAccessKey & b) noexcept;
bool operator==(const ThisTypeKey & a, const ThisTypeKey & b) noexcept;
bool operator==(const StringIntrinsicKey & a, const StringIntrinsicKey & b) noexcept;

// ============================================================================
// Hashing
// ============================================================================

struct TypeKeyHash
{
  size_t operator()(const TypeKey & key) const noexcept;
};

struct LiteralValueHash
{
  size_t operator()(const LiteralValue & v) const noexcept;
};

struct ObjectShapeHash
{
  size_t operator()(const ObjectShape & shape) const noexcept;
};

struct FunctionShapeHash
{
  size_t operator()(const FunctionShape & shape) const noexcept;
};

struct TypeListHash
{
  size_t operator()(const std::vector<TypeId> & list) const noexcept;
};

struct TupleListHash
{
  size_t operator()(const std::vector<TupleElement> & list) const noexcept;
};

struct ParamListHash
{
  size_t operator()(const std::vector<ParamInfo> & list) const noexcept;
};

struct TemplateSpanListHash
{
  size_t operator()(const std::vector<TemplateSpan> & list) const noexcept;
};

// ============================================================================
// Key Queries
// ============================================================================

/// Kind name of a key, for debug dumps ("Union", "Object", ...).
[[nodiscard]] const char * key_kind_name(const TypeKey & key) noexcept;

}  // namespace tscore

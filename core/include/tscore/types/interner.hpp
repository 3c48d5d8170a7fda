// tscore/types/interner.hpp - Canonical storage of type shapes
//
// TypeInterner is shared by every worker of a checking session. All methods
// are safe to call concurrently; interned entries are immutable.
//
#pragma once

#include <gsl/span>
#include <string>
#include <vector>

#include "tscore/types/sharded_store.hpp"
#include "tscore/types/type_id.hpp"
#include "tscore/types/type_key.hpp"

namespace tscore
{

/**
 * Everything needed to build a Function or Constructor key.
 *
 * Parameters are interned as a separate list so overloads that share a
 * parameter list store it once.
 */
struct SignatureSpec
{
  std::vector<TypeParamInfo> type_params;
  std::vector<ParamInfo> params;
  TypeId this_type;
  TypeId return_type = k_void;
  bool is_method = false;
};

/**
 * Type interner.
 *
 * `intern` is the raw, idempotent entry point. The named constructors below
 * apply canonicalization first (union flattening, literal absorption, ...),
 * and are what callers should normally use.
 */
class TypeInterner
{
public:
  TypeInterner() = default;

  TypeInterner(const TypeInterner &) = delete;
  TypeInterner & operator=(const TypeInterner &) = delete;

  // ===========================================================================
  // Raw Interning
  // ===========================================================================

  /// Intern a key as-is. Intrinsic keys map to their fixed ids.
  TypeId intern(TypeKey key);

  /**
   * Key of an issued id.
   *
   * @throws std::out_of_range if `id` was never issued by this interner
   */
  [[nodiscard]] const TypeKey & lookup(TypeId id) const;

  [[nodiscard]] bool contains(TypeId id) const;

  /// Number of non-intrinsic types interned so far.
  [[nodiscard]] size_t size() const { return types_.size(); }

  // ===========================================================================
  // Member Lists
  // ===========================================================================

  TypeListId intern_type_list(std::vector<TypeId> list);
  [[nodiscard]] gsl::span<const TypeId> type_list(TypeListId id) const;

  TupleListId intern_tuple_list(std::vector<TupleElement> list);
  [[nodiscard]] gsl::span<const TupleElement> tuple_list(TupleListId id) const;

  ParamListId intern_param_list(std::vector<ParamInfo> list);
  [[nodiscard]] gsl::span<const ParamInfo> param_list(ParamListId id) const;

  ObjectShapeId intern_object_shape(ObjectShape shape);
  [[nodiscard]] const ObjectShape & object_shape(ObjectShapeId id) const;

  FunctionShapeId intern_function_shape(FunctionShape shape);
  [[nodiscard]] const FunctionShape & function_shape(FunctionShapeId id) const;

  TemplateSpanListId intern_span_list(std::vector<TemplateSpan> list);
  [[nodiscard]] gsl::span<const TemplateSpan> span_list(TemplateSpanListId id) const;

  // ===========================================================================
  // Literal Constructors
  // ===========================================================================

  TypeId literal(LiteralValue value);
  TypeId literal_string(std::string text);
  TypeId literal_number(double value);
  TypeId literal_bigint(std::string digits);
  TypeId literal_boolean(bool value);

  // ===========================================================================
  // Composite Constructors (canonicalizing)
  // ===========================================================================

  TypeId union_of(std::vector<TypeId> members);
  TypeId intersection_of(std::vector<TypeId> members);

  TypeId array_of(TypeId element);
  TypeId readonly_array_of(TypeId element);
  TypeId tuple(std::vector<TupleElement> elements);

  /// Object type. Duplicate property names keep the last declaration.
  TypeId object(ObjectShape shape);

  TypeId function(SignatureSpec sig);
  TypeId constructor(SignatureSpec sig);

  TypeId type_parameter(TypeParamInfo info);
  TypeId infer(TypeParamInfo info);

  TypeId application(TypeId base, std::vector<TypeId> args);

  /// Conditional type; distributive iff `check` is a naked type parameter.
  TypeId conditional(TypeId check, TypeId extends, TypeId true_type, TypeId false_type);

  /// Conditional type with an explicit distributive flag.
  TypeId conditional(
    TypeId check, TypeId extends, TypeId true_type, TypeId false_type, bool distributive);

  TypeId mapped(MappedKey key);

  /**
   * Template literal type.
   *
   * Adjacent text spans merge, literal placeholders fold into text, a
   * `never` placeholder yields `never`, and an all-text template becomes a
   * string literal.
   */
  TypeId template_literal(std::vector<TemplateSpan> spans);

  TypeId enum_type(DefId def, std::vector<TypeId> members, EnumKind kind);

  TypeId lazy(DefId def);
  TypeId type_query(DefId def);
  TypeId keyof(TypeId operand);
  TypeId index_access(TypeId object, TypeId index);
  TypeId this_type();
  TypeId string_intrinsic(StringIntrinsicKind kind, TypeId operand);

  /// Non-fresh twin of a fresh object literal type (unions are widened member-wise).
  TypeId widen_freshness(TypeId id);

  // ===========================================================================
  // Queries
  // ===========================================================================

  /// Literal value of a literal type, nullptr for anything else.
  [[nodiscard]] const LiteralValue * literal_value(TypeId id) const;

  /// Base primitive of a literal (`"a"` -> string); `id` itself otherwise.
  [[nodiscard]] TypeId widen_literal(TypeId id) const;

  /// Members of a union, or `{id}` for any other type.
  [[nodiscard]] std::vector<TypeId> union_members(TypeId id) const;

private:
  ShardedStore<TypeKey, TypeKeyHash> types_;
  ShardedStore<std::vector<TypeId>, TypeListHash> type_lists_;
  ShardedStore<std::vector<TupleElement>, TupleListHash> tuple_lists_;
  ShardedStore<std::vector<ParamInfo>, ParamListHash> param_lists_;
  ShardedStore<ObjectShape, ObjectShapeHash> object_shapes_;
  ShardedStore<FunctionShape, FunctionShapeHash> function_shapes_;
  ShardedStore<std::vector<TemplateSpan>, TemplateSpanListHash> span_lists_;

  TypeId make_signature(SignatureSpec sig, bool is_constructor);
};

}  // namespace tscore

// tscore/eval/evaluator.hpp - Reduction of derived type expressions
//
// The Evaluator turns Application / Conditional / Mapped / TemplateLiteral /
// KeyOf / IndexAccess / StringIntrinsic keys into concrete types. It is the
// TypeReducer the Judge consults, and it calls back into the Judge for the
// `extends` checks of conditional types.
//
// Implementation is split by concern:
//   evaluator.cpp         dispatch, Lazy expansion, instantiation
//   substitute.cpp        type parameter substitution, genericity
//   conditional.cpp       conditional types and `infer` pattern matching
//   mapped.cpp            mapped types
//   template_literal.cpp  template literal expansion
//   type_operators.cpp    keyof, T[K], string intrinsics
//   apparent.cpp          apparent (member) types of non-object types
//
#pragma once

#include <gsl/span>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "tscore/env/environment.hpp"
#include "tscore/eval/type_reducer.hpp"
#include "tscore/guard/query_context.hpp"
#include "tscore/judge/judge.hpp"
#include "tscore/types/interner.hpp"

namespace tscore
{

/// Types captured by `infer` positions, keyed by the infer parameter's DefId.
using InferBindings = std::unordered_map<DefId, TypeId>;

class Evaluator : public TypeReducer
{
public:
  Evaluator(Environment & env, Judge & judge);

  // ===========================================================================
  // Entry Points
  // ===========================================================================

  /**
   * Reduce `id` to a concrete type.
   *
   * Idempotent: an already-concrete id is returned unchanged. Types that
   * still depend on unbound type parameters stay in their deferred form.
   * Budget overflow yields `unknown` and marks the query truncated.
   */
  TypeId evaluate(TypeId id, QueryContext & ctx);

  /**
   * Apply a generic (alias, interface, class or generic signature) to
   * arguments. Missing arguments take their defaults, else `unknown`.
   */
  TypeId instantiate(TypeId generic, gsl::span<const TypeId> args, QueryContext & ctx);

  // TypeReducer
  TypeId reduce(TypeId id, QueryContext & ctx) override;
  TypeId apparent_type(TypeId id, QueryContext & ctx) override;
  TypeId substitute(TypeId id, const Substitution & subst, QueryContext & ctx) override;

  // ===========================================================================
  // Type Operators
  // ===========================================================================

  /// `keyof T`.
  TypeId keyof(TypeId operand, QueryContext & ctx);

  /// `T[K]`; optional properties read as `X | undefined`.
  TypeId index_access(TypeId object, TypeId index, QueryContext & ctx);

  /// `Uppercase<T>` and friends; ASCII case mapping over string literals.
  TypeId string_intrinsic(StringIntrinsicKind kind, TypeId operand, QueryContext & ctx);

  /**
   * Match `source` against an `extends` pattern, recording `infer` captures.
   *
   * @return false if the pattern's structure cannot match at all
   */
  bool infer_from(TypeId source, TypeId pattern, InferBindings & bindings, QueryContext & ctx);

  /// True if `id` mentions a type parameter not bound inside it (a generic signature's own
  /// parameters, a mapped type's key parameter).
  [[nodiscard]] bool is_generic(TypeId id) const;

  [[nodiscard]] Judge & judge() noexcept { return judge_; }

private:
  Environment & env_;
  TypeInterner & interner_;
  Judge & judge_;

  TypeId evaluate_key(TypeId id, const TypeKey & key, QueryContext & ctx);
  TypeId evaluate_lazy(TypeId id, DefId def, QueryContext & ctx);
  TypeId evaluate_members(TypeId id, gsl::span<const TypeId> members, bool is_union, QueryContext & ctx);
  TypeId instantiate_def(TypeId generic, DefId def, gsl::span<const TypeId> args, QueryContext & ctx);

  // conditional.cpp
  TypeId evaluate_conditional(const ConditionalKey & key, QueryContext & ctx);
  TypeId resolve_conditional(
    TypeId check, TypeId extends, TypeId true_type, TypeId false_type, QueryContext & ctx);
  void collect_infers(TypeId pattern, std::vector<TypeParamInfo> & out) const;

  // mapped.cpp
  TypeId evaluate_mapped(TypeId id, const MappedKey & key, QueryContext & ctx);
  TypeId map_array_like(TypeId source, const MappedKey & key, QueryContext & ctx);

  // template_literal.cpp
  TypeId evaluate_template(TypeId id, gsl::span<const TemplateSpan> spans, QueryContext & ctx);

  // type_operators.cpp
  TypeId keys_of_shape(const ObjectShape & shape);
  TypeId property_type(TypeId object, TypeId key, QueryContext & ctx);
  TypeId lookup_in_shape(const ObjectShape & shape, TypeId key);
  TypeId lookup_in_tuple(gsl::span<const TupleElement> elements, TypeId key);

  // apparent.cpp
  TypeId primitive_apparent(IntrinsicKind kind);
  TypeId array_apparent(TypeId element, bool readonly, QueryContext & ctx);

  // substitute.cpp
  class Substituter;
  bool is_generic_rec(
    TypeId id, std::vector<DefId> & bound, std::unordered_set<TypeId> & visited) const;
};

/// Object shape of a type's structural form, nullptr if it has none.
[[nodiscard]] const ObjectShape * object_shape_of(const TypeInterner & interner, TypeId id);

/// Property name denoted by a string or number literal key type.
[[nodiscard]] std::optional<std::string> property_name_of(const TypeInterner & interner, TypeId key);

}  // namespace tscore

// tscore/eval/type_reducer.hpp - Evaluation seam consumed by the Judge
//
// The Judge compares structural shapes only. Whenever it meets a derived
// type (application, conditional, mapped, ...) it asks the reducer attached
// to the query for the structural form.
//
#pragma once

#include <unordered_map>

#include "tscore/types/type_id.hpp"

namespace tscore
{

struct QueryContext;

/// Type-parameter DefId -> replacement type.
using Substitution = std::unordered_map<DefId, TypeId>;

class TypeReducer
{
public:
  virtual ~TypeReducer() = default;

  /// Evaluate a derived type to its concrete form; `id` itself if already concrete or deferred.
  virtual TypeId reduce(TypeId id, QueryContext & ctx) = 0;

  /// Object interface a value of type `id` is compared against for member access.
  virtual TypeId apparent_type(TypeId id, QueryContext & ctx) = 0;

  /// Replace type parameters in `id` according to `subst`.
  virtual TypeId substitute(TypeId id, const Substitution & subst, QueryContext & ctx) = 0;
};

}  // namespace tscore

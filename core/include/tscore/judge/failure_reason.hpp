// tscore/judge/failure_reason.hpp - Why a relation did not hold
//
// Closed taxonomy handed to the checker, which maps each kind to its own
// diagnostic code and wording.
//
#pragma once

#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

#include "tscore/types/type_id.hpp"

namespace tscore
{

class TypeInterner;

enum class FailureKind : uint8_t {
  TypeMismatch,  ///< leaf failure with no finer structure
  PropertyMissing,
  PropertyTypeMismatch,
  ExcessProperty,
  ParameterIncompatible,
  ReturnIncompatible,
  ArityMismatch,
  EnumOpacityViolation,
  BudgetExceeded,
  WeakTypeNoOverlap,
  OptionalPropertyMismatch,
  ReadonlyPropertyMismatch,
  IndexSignatureMismatch,
  UnresolvedReference,
};

[[nodiscard]] const char * failure_kind_name(FailureKind kind) noexcept;

/**
 * One step of a failed relation, with at most one nested cause.
 *
 * `member` names the property for member-level kinds; `index` is the
 * parameter or tuple position for positional kinds.
 */
struct FailureReason
{
  FailureKind kind = FailureKind::TypeMismatch;
  TypeId source;
  TypeId target;
  std::string member;
  uint32_t index = 0;
  std::shared_ptr<const FailureReason> nested;

  [[nodiscard]] static FailureReason make(FailureKind kind, TypeId source, TypeId target)
  {
    FailureReason r;
    r.kind = kind;
    r.source = source;
    r.target = target;
    return r;
  }

  FailureReason & with_member(std::string name)
  {
    member = std::move(name);
    return *this;
  }

  FailureReason & with_index(uint32_t i)
  {
    index = i;
    return *this;
  }

  FailureReason & with_nested(FailureReason inner)
  {
    nested = std::make_shared<const FailureReason>(std::move(inner));
    return *this;
  }

  /// Deepest reason in the chain.
  [[nodiscard]] const FailureReason & innermost() const noexcept;

  /// Number of reasons in the chain, this one included.
  [[nodiscard]] size_t chain_length() const noexcept;
};

/// One-line description of a single step ("property 'a' is missing").
[[nodiscard]] std::string describe(const TypeInterner & interner, const FailureReason & reason);

[[nodiscard]] nlohmann::json to_json(const FailureReason & reason);

}  // namespace tscore

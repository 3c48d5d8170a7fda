// tscore/judge/failure_reason.cpp - FailureReason helpers
//
#include "tscore/judge/failure_reason.hpp"

#include <nlohmann/json.hpp>
#include <string>

#include "tscore/types/interner.hpp"
#include "tscore/types/type_printer.hpp"

namespace tscore
{

const char * failure_kind_name(FailureKind kind) noexcept
{
  switch (kind) {
    case FailureKind::TypeMismatch:
      return "TypeMismatch";
    case FailureKind::PropertyMissing:
      return "PropertyMissing";
    case FailureKind::PropertyTypeMismatch:
      return "PropertyTypeMismatch";
    case FailureKind::ExcessProperty:
      return "ExcessProperty";
    case FailureKind::ParameterIncompatible:
      return "ParameterIncompatible";
    case FailureKind::ReturnIncompatible:
      return "ReturnIncompatible";
    case FailureKind::ArityMismatch:
      return "ArityMismatch";
    case FailureKind::EnumOpacityViolation:
      return "EnumOpacityViolation";
    case FailureKind::BudgetExceeded:
      return "BudgetExceeded";
    case FailureKind::WeakTypeNoOverlap:
      return "WeakTypeNoOverlap";
    case FailureKind::OptionalPropertyMismatch:
      return "OptionalPropertyMismatch";
    case FailureKind::ReadonlyPropertyMismatch:
      return "ReadonlyPropertyMismatch";
    case FailureKind::IndexSignatureMismatch:
      return "IndexSignatureMismatch";
    case FailureKind::UnresolvedReference:
      return "UnresolvedReference";
  }
  return "TypeMismatch";
}

const FailureReason & FailureReason::innermost() const noexcept
{
  const FailureReason * r = this;
  while (r->nested) r = r->nested.get();
  return *r;
}

size_t FailureReason::chain_length() const noexcept
{
  size_t n = 1;
  for (const FailureReason * r = nested.get(); r; r = r->nested.get()) ++n;
  return n;
}

std::string describe(const TypeInterner & interner, const FailureReason & reason)
{
  const auto src = [&] { return "'" + to_string(interner, reason.source) + "'"; };
  const auto tgt = [&] { return "'" + to_string(interner, reason.target) + "'"; };
  const std::string member = "'" + reason.member + "'";

  switch (reason.kind) {
    case FailureKind::TypeMismatch:
      return "type " + src() + " is not assignable to type " + tgt();
    case FailureKind::PropertyMissing:
      return "property " + member + " is missing in type " + src() + " but required in type " +
             tgt();
    case FailureKind::PropertyTypeMismatch:
      return "types of property " + member + " are incompatible";
    case FailureKind::ExcessProperty:
      return "object literal may only specify known properties, and " + member +
             " does not exist in type " + tgt();
    case FailureKind::ParameterIncompatible:
      return "types of parameters at position " + std::to_string(reason.index) +
             " are incompatible";
    case FailureKind::ReturnIncompatible:
      return "return types " + src() + " and " + tgt() + " are incompatible";
    case FailureKind::ArityMismatch:
      return "target accepts too few arguments or elements for source " + src();
    case FailureKind::EnumOpacityViolation:
      return "enum type " + src() + " is not interchangeable with " + tgt();
    case FailureKind::BudgetExceeded:
      return "relation between " + src() + " and " + tgt() + " is too deep to be decided";
    case FailureKind::WeakTypeNoOverlap:
      return "type " + src() + " has no properties in common with type " + tgt();
    case FailureKind::OptionalPropertyMismatch:
      return "property " + member + " is optional in type " + src() + " but required in type " +
             tgt();
    case FailureKind::ReadonlyPropertyMismatch:
      return "property " + member + " is readonly in type " + src() + " but mutable in type " +
             tgt();
    case FailureKind::IndexSignatureMismatch:
      if (reason.member.empty()) return "index signatures are incompatible";
      return "property " + member + " is incompatible with index signature";
    case FailureKind::UnresolvedReference:
      return "type " + src() + " refers to a declaration that could not be resolved";
  }
  return "types are incompatible";
}

nlohmann::json to_json(const FailureReason & reason)
{
  nlohmann::json j{
    {"kind", failure_kind_name(reason.kind)},
    {"source", reason.source.value},
    {"target", reason.target.value}};
  if (!reason.member.empty()) j["member"] = reason.member;
  if (reason.kind == FailureKind::ParameterIncompatible || reason.kind == FailureKind::ArityMismatch) {
    j["index"] = reason.index;
  }
  if (reason.nested) j["nested"] = to_json(*reason.nested);
  return j;
}

}  // namespace tscore

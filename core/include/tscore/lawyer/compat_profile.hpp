// tscore/lawyer/compat_profile.hpp - Options parameterizing the compatibility layer
//
#pragma once

#include <set>
#include <string>
#include <string_view>

namespace tscore
{

/**
 * Named compatibility options.
 *
 * Defaults reproduce the reference language's default checking behavior.
 * Each toggle enables one named rule (or one hook behavior) of the Lawyer;
 * `disabled_rules` switches off rules by name regardless of their toggle.
 */
struct CompatProfile
{
  bool strict_null_checks = true;
  bool strict_function_types = true;
  bool exact_optional_property_types = false;
  bool bivariant_method_check = true;
  bool any_propagation = true;
  bool weak_type_detection = true;
  bool excess_property_check = true;
  bool enum_nominality = true;
  bool string_enum_opacity = true;
  bool void_return_exception = true;
  bool root_object_accepts_all = true;
  bool apparent_primitive_members = true;
  bool base_constraint_assignability = true;
  bool global_function_type = true;
  bool readonly_property_laxity = true;

  std::set<std::string, std::less<>> disabled_rules;

  [[nodiscard]] static CompatProfile reference_default() { return CompatProfile{}; }

  /// Sound-as-possible settings: no method bivariance, exact optional properties,
  /// readonly properties are not writable through a mutable alias.
  [[nodiscard]] static CompatProfile strict();

  /// Pre-strict settings: null / undefined everywhere, bivariant parameters.
  [[nodiscard]] static CompatProfile legacy();

  [[nodiscard]] bool is_disabled(std::string_view rule) const
  {
    return disabled_rules.find(rule) != disabled_rules.end();
  }
};

}  // namespace tscore

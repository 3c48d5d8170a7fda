// tscore/lawyer/compat_profile.cpp - Compatibility profile presets
//
#include "tscore/lawyer/compat_profile.hpp"

namespace tscore
{

CompatProfile CompatProfile::strict()
{
  CompatProfile p;
  p.exact_optional_property_types = true;
  p.bivariant_method_check = false;
  p.readonly_property_laxity = false;
  return p;
}

CompatProfile CompatProfile::legacy()
{
  CompatProfile p;
  p.strict_null_checks = false;
  p.strict_function_types = false;
  return p;
}

}  // namespace tscore

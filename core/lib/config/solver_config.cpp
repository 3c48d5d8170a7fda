// tscore/config/solver_config.cpp - Solver configuration implementation
//
#include "tscore/config/solver_config.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <utility>

#include "tscore/basic/diagnostic.hpp"

namespace tscore
{

namespace
{

struct ToggleEntry
{
  const char * key;
  bool CompatProfile::*field;
};

// clang-format off
const ToggleEntry k_toggles[] = {
  {"strict_null_checks", &CompatProfile::strict_null_checks},
  {"strict_function_types", &CompatProfile::strict_function_types},
  {"exact_optional_property_types", &CompatProfile::exact_optional_property_types},
  {"bivariant_method_check", &CompatProfile::bivariant_method_check},
  {"any_propagation", &CompatProfile::any_propagation},
  {"weak_type_detection", &CompatProfile::weak_type_detection},
  {"excess_property_check", &CompatProfile::excess_property_check},
  {"enum_nominality", &CompatProfile::enum_nominality},
  {"string_enum_opacity", &CompatProfile::string_enum_opacity},
  {"void_return_exception", &CompatProfile::void_return_exception},
  {"root_object_accepts_all", &CompatProfile::root_object_accepts_all},
  {"apparent_primitive_members", &CompatProfile::apparent_primitive_members},
  {"base_constraint_assignability", &CompatProfile::base_constraint_assignability},
  {"global_function_type", &CompatProfile::global_function_type},
  {"readonly_property_laxity", &CompatProfile::readonly_property_laxity},
};

struct LimitEntry
{
  const char * key;
  uint32_t GuardLimits::*field;
};

const LimitEntry k_limits[] = {
  {"max_subtype_depth", &GuardLimits::max_subtype_depth},
  {"max_total_checks", &GuardLimits::max_total_checks},
  {"max_in_progress_pairs", &GuardLimits::max_in_progress_pairs},
  {"max_evaluation_depth", &GuardLimits::max_evaluation_depth},
  {"max_instantiation_depth", &GuardLimits::max_instantiation_depth},
  {"template_expansion_limit", &GuardLimits::template_expansion_limit},
  {"max_distribution_size", &GuardLimits::max_distribution_size},
  {"max_mapped_keys", &GuardLimits::max_mapped_keys},
};
// clang-format on

void warn_unknown_key(DiagnosticBag * diags, const std::string & section, const std::string & key)
{
  if (!diags) return;
  diags->report_warning("unknown configuration key '" + section + key + "'").with_code("W0020");
}

/// Parse the 'compat' section
bool parse_compat(
  const YAML::Node & node, CompatProfile & out, DiagnosticBag * diags, std::string & error)
{
  if (!node.IsMap()) {
    error = "compat must be a map";
    return false;
  }

  // The preset is the base the other keys override.
  if (node["preset"]) {
    const auto preset = node["preset"].as<std::string>();
    if (preset == "default") {
      out = CompatProfile::reference_default();
    } else if (preset == "strict") {
      out = CompatProfile::strict();
    } else if (preset == "legacy") {
      out = CompatProfile::legacy();
    } else {
      error = "invalid compat.preset: '" + preset + "' (must be 'default', 'strict' or 'legacy')";
      return false;
    }
  }

  for (const auto & kv : node) {
    const auto key = kv.first.as<std::string>();
    if (key == "preset") continue;

    if (key == "disabled_rules") {
      if (!kv.second.IsSequence()) {
        error = "compat.disabled_rules must be a list";
        return false;
      }
      for (const auto & rule : kv.second) out.disabled_rules.insert(rule.as<std::string>());
      continue;
    }

    bool known = false;
    for (const auto & t : k_toggles) {
      if (key != t.key) continue;
      out.*(t.field) = kv.second.as<bool>();
      known = true;
      break;
    }
    if (!known) warn_unknown_key(diags, "compat.", key);
  }
  return true;
}

/// Parse the 'limits' section
bool parse_limits(
  const YAML::Node & node, GuardLimits & out, DiagnosticBag * diags, std::string & error)
{
  if (!node.IsMap()) {
    error = "limits must be a map";
    return false;
  }

  for (const auto & kv : node) {
    const auto key = kv.first.as<std::string>();
    bool known = false;
    for (const auto & l : k_limits) {
      if (key != l.key) continue;
      const auto value = kv.second.as<int64_t>();
      if (value <= 0 || value > UINT32_MAX) {
        error = "limits." + key + " must be a positive 32-bit integer";
        return false;
      }
      out.*(l.field) = static_cast<uint32_t>(value);
      known = true;
      break;
    }
    if (!known) warn_unknown_key(diags, "limits.", key);
  }
  return true;
}

ConfigLoadResult parse_root(const YAML::Node & root, SolverConfig config, DiagnosticBag * diags)
{
  if (root.IsNull()) return ConfigLoadResult::ok(std::move(config));
  if (!root.IsMap()) return ConfigLoadResult::fail("configuration root must be a map");

  std::string error;
  try {
    for (const auto & kv : root) {
      const auto key = kv.first.as<std::string>();
      if (key == "compat") {
        if (!parse_compat(kv.second, config.compat, diags, error)) {
          return ConfigLoadResult::fail(error);
        }
      } else if (key == "limits") {
        if (!parse_limits(kv.second, config.limits, diags, error)) {
          return ConfigLoadResult::fail(error);
        }
      } else {
        warn_unknown_key(diags, "", key);
      }
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration value: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult load_solver_config(const std::filesystem::path & config_path, DiagnosticBag * diags)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  SolverConfig config;
  config.config_root = fs::absolute(config_path).parent_path();
  return parse_root(root, std::move(config), diags);
}

ConfigLoadResult parse_solver_config(std::string_view yaml, DiagnosticBag * diags)
{
  YAML::Node root;
  try {
    root = YAML::Load(std::string(yaml));
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
  return parse_root(root, SolverConfig{}, diags);
}

std::optional<std::filesystem::path> find_solver_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_solver_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace tscore

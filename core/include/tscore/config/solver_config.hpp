// tscore/config/solver_config.hpp - Solver configuration (tscore.yaml)
//
// Parses the compatibility profile and guard budgets from a YAML file:
//
//   compat:
//     preset: strict            # default | strict | legacy
//     exact_optional_property_types: true
//     disabled_rules: [weak-type]
//   limits:
//     max_subtype_depth: 200
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "tscore/guard/guard_limits.hpp"
#include "tscore/lawyer/compat_profile.hpp"

namespace tscore
{

class DiagnosticBag;

// ============================================================================
// Configuration Structures
// ============================================================================

struct SolverConfig
{
  CompatProfile compat;
  GuardLimits limits;

  /// Directory containing tscore.yaml (empty for in-memory configs)
  std::filesystem::path config_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a solver configuration.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  SolverConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(SolverConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a solver configuration from a tscore.yaml file.
 *
 * Unknown keys are not errors; they are reported as W0020 warnings when
 * `diags` is given.
 *
 * @param config_path Path to tscore.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_solver_config(
  const std::filesystem::path & config_path, DiagnosticBag * diags = nullptr);

/// Same as load_solver_config, from YAML text.
[[nodiscard]] ConfigLoadResult parse_solver_config(
  std::string_view yaml, DiagnosticBag * diags = nullptr);

/**
 * Find tscore.yaml by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to tscore.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_solver_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_solver_config_file_name = "tscore.yaml";

}  // namespace tscore

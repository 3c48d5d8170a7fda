// tests/unit/config/test_solver_config.cpp - Unit tests for tscore.yaml loading
//
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

#include "tscore/basic/diagnostic.hpp"
#include "tscore/config/solver_config.hpp"

using namespace tscore;

namespace
{

struct TempDir
{
  std::filesystem::path path;
  explicit TempDir(std::filesystem::path p) : path(std::move(p))
  {
    std::filesystem::create_directories(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;
};

}  // namespace

// ============================================================================
// Parsing
// ============================================================================

TEST(ConfigSolverConfig, EmptyDocumentGivesDefaults)
{
  const ConfigLoadResult result = parse_solver_config("");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_TRUE(result.config.compat.strict_null_checks);
  EXPECT_EQ(result.config.limits.max_subtype_depth, GuardLimits{}.max_subtype_depth);
  EXPECT_TRUE(result.config.config_root.empty());
}

TEST(ConfigSolverConfig, CompatToggles)
{
  const ConfigLoadResult result = parse_solver_config(
    "compat:\n"
    "  exact_optional_property_types: true\n"
    "  weak_type_detection: false\n"
    "  disabled_rules: [excess-property, void-return]\n");
  ASSERT_TRUE(result.success) << result.error;

  const CompatProfile & compat = result.config.compat;
  EXPECT_TRUE(compat.exact_optional_property_types);
  EXPECT_FALSE(compat.weak_type_detection);
  EXPECT_TRUE(compat.is_disabled("excess-property"));
  EXPECT_TRUE(compat.is_disabled("void-return"));
  EXPECT_FALSE(compat.is_disabled("weak-type"));
}

TEST(ConfigSolverConfig, PresetIsTheBase)
{
  const ConfigLoadResult result = parse_solver_config(
    "compat:\n"
    "  bivariant_method_check: true\n"
    "  preset: strict\n");
  ASSERT_TRUE(result.success) << result.error;

  // Keys override the preset regardless of their order in the file.
  EXPECT_TRUE(result.config.compat.bivariant_method_check);
  EXPECT_TRUE(result.config.compat.exact_optional_property_types);
  EXPECT_FALSE(result.config.compat.readonly_property_laxity);
}

TEST(ConfigSolverConfig, LegacyPreset)
{
  const ConfigLoadResult result = parse_solver_config("compat: { preset: legacy }\n");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_FALSE(result.config.compat.strict_null_checks);
  EXPECT_FALSE(result.config.compat.strict_function_types);
}

TEST(ConfigSolverConfig, InvalidPreset)
{
  const ConfigLoadResult result = parse_solver_config("compat:\n  preset: loose\n");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("compat.preset"), std::string::npos);
}

TEST(ConfigSolverConfig, Limits)
{
  const ConfigLoadResult result = parse_solver_config(
    "limits:\n"
    "  max_subtype_depth: 200\n"
    "  template_expansion_limit: 5000\n");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.limits.max_subtype_depth, 200u);
  EXPECT_EQ(result.config.limits.template_expansion_limit, 5000u);
  EXPECT_EQ(result.config.limits.max_mapped_keys, GuardLimits{}.max_mapped_keys);
}

TEST(ConfigSolverConfig, LimitsMustBePositive)
{
  const ConfigLoadResult zero = parse_solver_config("limits:\n  max_total_checks: 0\n");
  EXPECT_FALSE(zero.success);
  EXPECT_NE(zero.error.find("limits.max_total_checks"), std::string::npos);

  const ConfigLoadResult text = parse_solver_config("limits:\n  max_total_checks: lots\n");
  EXPECT_FALSE(text.success);
}

TEST(ConfigSolverConfig, UnknownKeysWarn)
{
  DiagnosticBag diags;
  const ConfigLoadResult result = parse_solver_config(
    "compat:\n"
    "  strict_nul_checks: false\n"
    "output: json\n",
    &diags);
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(diags.size(), 2u);
  EXPECT_TRUE(diags.has_code("W0020"));
  EXPECT_FALSE(diags.has_errors());
  EXPECT_TRUE(result.config.compat.strict_null_checks);
}

TEST(ConfigSolverConfig, MalformedDocuments)
{
  EXPECT_FALSE(parse_solver_config("compat: [1, 2\n").success);
  EXPECT_FALSE(parse_solver_config("- just\n- a list\n").success);
  EXPECT_FALSE(parse_solver_config("compat: 3\n").success);
  EXPECT_FALSE(parse_solver_config("compat:\n  disabled_rules: weak-type\n").success);
}

// ============================================================================
// Files
// ============================================================================

TEST(ConfigSolverConfig, MissingFile)
{
  const ConfigLoadResult result =
    load_solver_config(std::filesystem::temp_directory_path() / "tscore_no_such" / "tscore.yaml");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("not found"), std::string::npos);
}

TEST(ConfigSolverConfig, LoadAndFindFromSubdirectory)
{
  const TempDir temp_dir(std::filesystem::temp_directory_path() / "tscore_config_test");
  const std::filesystem::path nested = temp_dir.path / "src" / "deep";
  std::filesystem::create_directories(nested);
  {
    std::ofstream f(temp_dir.path / k_solver_config_file_name);
    f << "compat:\n  preset: strict\nlimits:\n  max_evaluation_depth: 20\n";
  }

  const auto found = find_solver_config(nested);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->filename(), k_solver_config_file_name);

  const ConfigLoadResult result = load_solver_config(*found);
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.limits.max_evaluation_depth, 20u);
  EXPECT_TRUE(result.config.compat.exact_optional_property_types);
  EXPECT_EQ(
    std::filesystem::weakly_canonical(result.config.config_root),
    std::filesystem::weakly_canonical(temp_dir.path));
}

// tscore/guard/guard_limits.hpp - Budgets bounding every recursive path
//
#pragma once

#include <cstdint>

namespace tscore
{

/**
 * Recursion and expansion budgets.
 *
 * Reaching any of them yields the conservative answer (false for relations,
 * a widened type for evaluation) and marks the query as truncated.
 */
struct GuardLimits
{
  uint32_t max_subtype_depth = 100;
  uint32_t max_total_checks = 100000;
  uint32_t max_in_progress_pairs = 10000;
  uint32_t max_evaluation_depth = 50;
  uint32_t max_instantiation_depth = 50;
  uint32_t template_expansion_limit = 100000;
  uint32_t max_distribution_size = 1000;
  uint32_t max_mapped_keys = 10000;
};

}  // namespace tscore

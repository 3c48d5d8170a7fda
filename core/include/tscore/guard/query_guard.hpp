// tscore/guard/query_guard.hpp - Per-query depth counters and operation budget
//
#pragma once

#include <array>
#include <cstdint>
#include <string>

#include "tscore/basic/diagnostic.hpp"
#include "tscore/guard/guard_limits.hpp"

namespace tscore
{

enum class BudgetKind : uint8_t {
  RelationDepth,
  Operations,
  Instantiation,
  TemplateExpansion,
  Distribution,
  InProgressPairs,
  EvaluationDepth,
  MappedKeys,
};

inline constexpr size_t k_budget_kind_count = 8;

/// Diagnostic code recorded when a budget of this kind runs out ("W0001", ...).
[[nodiscard]] const char * budget_code(BudgetKind kind) noexcept;

[[nodiscard]] const char * budget_name(BudgetKind kind) noexcept;

/**
 * Budget bookkeeping for one top-level query.
 *
 * Not thread-safe; every query owns its guard.
 */
class QueryGuard
{
public:
  QueryGuard(const GuardLimits & limits, DiagnosticBag * diags) : limits_(limits), diags_(diags) {}

  /**
   * RAII depth counter for one recursive path.
   *
   * Check ok() right after construction; when it is false the caller must
   * return its conservative answer without recursing further.
   */
  class DepthScope
  {
  public:
    DepthScope(QueryGuard & guard, BudgetKind kind);
    ~DepthScope();

    DepthScope(const DepthScope &) = delete;
    DepthScope & operator=(const DepthScope &) = delete;

    [[nodiscard]] bool ok() const noexcept { return ok_; }

  private:
    QueryGuard & guard_;
    BudgetKind kind_;
    bool ok_;
  };

  /// Count one unit of work. false once the per-query operation budget is spent.
  [[nodiscard]] bool consume_operation();

  /// Mark the query truncated; reports a warning once per budget kind.
  void record_truncation(BudgetKind kind, const std::string & detail);

  [[nodiscard]] bool truncated() const noexcept { return truncated_; }
  /// Number of budget hits so far, counting repeats of the same kind.
  [[nodiscard]] uint32_t truncation_count() const noexcept { return truncation_count_; }
  [[nodiscard]] bool truncated_by(BudgetKind kind) const noexcept
  {
    return reported_[static_cast<size_t>(kind)];
  }

  [[nodiscard]] uint32_t depth(BudgetKind kind) const noexcept
  {
    return depths_[static_cast<size_t>(kind)];
  }
  [[nodiscard]] uint32_t operations() const noexcept { return operations_; }

  [[nodiscard]] const GuardLimits & limits() const noexcept { return limits_; }
  [[nodiscard]] DiagnosticBag * diagnostics() const noexcept { return diags_; }

  [[nodiscard]] uint32_t limit_for(BudgetKind kind) const noexcept;

private:
  const GuardLimits & limits_;
  DiagnosticBag * diags_;

  std::array<uint32_t, k_budget_kind_count> depths_{};
  std::array<bool, k_budget_kind_count> reported_{};
  uint32_t operations_ = 0;
  uint32_t truncation_count_ = 0;
  bool truncated_ = false;
};

}  // namespace tscore

// tscore/guard/query_guard.cpp - QueryGuard implementation
//
#include "tscore/guard/query_guard.hpp"

namespace tscore
{

const char * budget_code(BudgetKind kind) noexcept
{
  switch (kind) {
    case BudgetKind::RelationDepth:
    case BudgetKind::EvaluationDepth:
    case BudgetKind::InProgressPairs:
      return "W0001";
    case BudgetKind::Operations:
      return "W0002";
    case BudgetKind::Instantiation:
      return "W0003";
    case BudgetKind::TemplateExpansion:
      return "W0004";
    case BudgetKind::Distribution:
    case BudgetKind::MappedKeys:
      return "W0005";
  }
  return "W0000";
}

const char * budget_name(BudgetKind kind) noexcept
{
  switch (kind) {
    case BudgetKind::RelationDepth:
      return "relation depth";
    case BudgetKind::Operations:
      return "operation budget";
    case BudgetKind::Instantiation:
      return "instantiation depth";
    case BudgetKind::TemplateExpansion:
      return "template literal expansion";
    case BudgetKind::Distribution:
      return "union distribution size";
    case BudgetKind::InProgressPairs:
      return "in-progress relation pairs";
    case BudgetKind::EvaluationDepth:
      return "evaluation depth";
    case BudgetKind::MappedKeys:
      return "mapped type key count";
  }
  return "budget";
}

// ============================================================================
// DepthScope
// ============================================================================

QueryGuard::DepthScope::DepthScope(QueryGuard & guard, BudgetKind kind)
: guard_(guard), kind_(kind), ok_(true)
{
  uint32_t & depth = guard_.depths_[static_cast<size_t>(kind_)];
  ++depth;
  if (depth > guard_.limit_for(kind_)) {
    ok_ = false;
    guard_.record_truncation(kind_, "limit " + std::to_string(guard_.limit_for(kind_)));
  }
}

QueryGuard::DepthScope::~DepthScope() { --guard_.depths_[static_cast<size_t>(kind_)]; }

// ============================================================================
// QueryGuard
// ============================================================================

bool QueryGuard::consume_operation()
{
  if (operations_ >= limits_.max_total_checks) {
    record_truncation(BudgetKind::Operations, "limit " + std::to_string(limits_.max_total_checks));
    return false;
  }
  ++operations_;
  return true;
}

void QueryGuard::record_truncation(BudgetKind kind, const std::string & detail)
{
  truncated_ = true;
  ++truncation_count_;
  bool & reported = reported_[static_cast<size_t>(kind)];
  if (reported) return;
  reported = true;

  if (diags_) {
    diags_->report_warning(std::string(budget_name(kind)) + " exceeded; result is conservative")
      .with_code(budget_code(kind))
      .with_note(detail);
  }
}

uint32_t QueryGuard::limit_for(BudgetKind kind) const noexcept
{
  switch (kind) {
    case BudgetKind::RelationDepth:
      return limits_.max_subtype_depth;
    case BudgetKind::Operations:
      return limits_.max_total_checks;
    case BudgetKind::Instantiation:
      return limits_.max_instantiation_depth;
    case BudgetKind::TemplateExpansion:
      return limits_.template_expansion_limit;
    case BudgetKind::Distribution:
      return limits_.max_distribution_size;
    case BudgetKind::InProgressPairs:
      return limits_.max_in_progress_pairs;
    case BudgetKind::EvaluationDepth:
      return limits_.max_evaluation_depth;
    case BudgetKind::MappedKeys:
      return limits_.max_mapped_keys;
  }
  return 0;
}

}  // namespace tscore

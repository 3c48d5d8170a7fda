// tscore/eval/template_literal.cpp - Template literal expansion
//
#include <string>
#include <utility>

#include "tscore/eval/evaluator.hpp"

namespace tscore
{

/**
 * Expand a template literal over the unions in its placeholders.
 *
 * `${"a" | "b"}-${1 | 2}` becomes `"a-1" | "a-2" | "b-1" | "b-2"`. Members
 * that are not literals (string, number, type parameters) stay as
 * placeholders of the resulting templates. The number of combinations is
 * capped by the template expansion budget; beyond it the result is `string`.
 */
TypeId Evaluator::evaluate_template(
  TypeId id, gsl::span<const TemplateSpan> spans, QueryContext & ctx)
{
  std::vector<std::vector<TemplateSpan>> combos(1);
  bool changed = false;

  for (const auto & span : spans) {
    if (span.is_text()) {
      for (auto & combo : combos) combo.push_back(span);
      continue;
    }

    const TypeId t = evaluate(span.type, ctx);
    changed = changed || t != span.type;
    if (t == k_any) return k_string;
    if (t == k_never) return k_never;

    std::vector<TypeId> members;
    for (TypeId m : interner_.union_members(t)) {
      if (m == k_boolean) {
        members.push_back(interner_.literal_boolean(false));
        members.push_back(interner_.literal_boolean(true));
      } else {
        members.push_back(m);
      }
    }
    if (members.size() > 1) changed = true;

    const uint64_t expanded = static_cast<uint64_t>(combos.size()) * members.size();
    if (expanded > ctx.guard.limits().template_expansion_limit) {
      ctx.guard.record_truncation(
        BudgetKind::TemplateExpansion, std::to_string(expanded) + " combinations");
      return k_string;
    }

    std::vector<std::vector<TemplateSpan>> next;
    next.reserve(static_cast<size_t>(expanded));
    for (const auto & combo : combos) {
      for (TypeId m : members) {
        auto extended = combo;
        extended.push_back(TemplateSpan{std::string(), m});
        next.push_back(std::move(extended));
      }
    }
    combos = std::move(next);
  }

  if (!changed) return id;

  std::vector<TypeId> results;
  results.reserve(combos.size());
  for (auto & combo : combos) results.push_back(interner_.template_literal(std::move(combo)));
  return interner_.union_of(std::move(results));
}

}  // namespace tscore

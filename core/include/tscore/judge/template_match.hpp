// tscore/judge/template_match.hpp - Matching strings against template literal spans
//
#pragma once

#include <gsl/span>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "tscore/types/type_key.hpp"

namespace tscore
{

class TypeInterner;

/**
 * Match `text` against a template literal's spans.
 *
 * Placeholders take the shortest piece that lets the rest of the pattern
 * match. `infer` placeholders and `string` accept any piece; `number`
 * accepts numeric strings; literal and union placeholders accept their
 * members' text.
 *
 * @return one captured piece per placeholder span, or nullopt on no match
 */
[[nodiscard]] std::optional<std::vector<std::string>> match_template(
  const TypeInterner & interner, std::string_view text, gsl::span<const TemplateSpan> spans);

/// Whether a single placeholder type admits `piece`.
[[nodiscard]] bool placeholder_accepts(
  const TypeInterner & interner, TypeId placeholder, std::string_view piece);

}  // namespace tscore

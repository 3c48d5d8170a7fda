// tscore/judge/template_match.cpp - Template literal pattern matching
//
#include "tscore/judge/template_match.hpp"

#include <cctype>

#include "tscore/basic/casting.hpp"
#include "tscore/basic/number_format.hpp"
#include "tscore/types/interner.hpp"

namespace tscore
{

namespace
{

bool is_bigint_text(std::string_view piece)
{
  size_t i = (!piece.empty() && piece.front() == '-') ? 1 : 0;
  if (i >= piece.size()) return false;
  for (; i < piece.size(); ++i) {
    if (!std::isdigit(static_cast<unsigned char>(piece[i]))) return false;
  }
  return true;
}

bool match_from(
  const TypeInterner & interner, std::string_view text, size_t pos,
  gsl::span<const TemplateSpan> spans, size_t index, std::vector<std::string> & captures)
{
  if (index == spans.size()) return pos == text.size();

  const TemplateSpan & span = spans[index];
  if (span.is_text()) {
    if (text.substr(pos, span.text.size()) != span.text) return false;
    return match_from(interner, text, pos + span.text.size(), spans, index + 1, captures);
  }

  const bool last = index + 1 == spans.size();
  for (size_t end = last ? text.size() : pos; end <= text.size(); ++end) {
    const std::string_view piece = text.substr(pos, end - pos);
    if (!placeholder_accepts(interner, span.type, piece)) continue;
    captures.emplace_back(piece);
    if (match_from(interner, text, end, spans, index + 1, captures)) return true;
    captures.pop_back();
  }
  return false;
}

}  // namespace

bool placeholder_accepts(const TypeInterner & interner, TypeId placeholder, std::string_view piece)
{
  if (placeholder == k_string || placeholder == k_any || placeholder == k_unknown) return true;
  if (placeholder == k_number) return parse_number(piece).has_value();
  if (placeholder == k_bigint) return is_bigint_text(piece);
  if (placeholder == k_boolean) return piece == "true" || piece == "false";
  if (placeholder == k_null) return piece == "null";
  if (placeholder == k_undefined) return piece == "undefined";
  if (placeholder.is_intrinsic()) return false;

  const TypeKey & key = interner.lookup(placeholder);
  if (isa<InferKey>(key) || isa<TypeParameterKey>(key)) return true;
  if (const auto * lit = dyn_cast<LiteralKey>(key)) {
    switch (lit->value.kind) {
      case LiteralKind::String:
      case LiteralKind::BigInt:
        return piece == lit->value.text;
      case LiteralKind::Number:
        return piece == format_number(lit->value.number);
      case LiteralKind::Boolean:
        return piece == (lit->value.boolean ? "true" : "false");
    }
  }
  if (const auto * u = dyn_cast<UnionKey>(key)) {
    for (TypeId m : interner.type_list(u->members)) {
      if (placeholder_accepts(interner, m, piece)) return true;
    }
    return false;
  }
  if (const auto * tl = dyn_cast<TemplateLiteralKey>(key)) {
    return match_template(interner, piece, interner.span_list(tl->spans)).has_value();
  }
  return false;
}

std::optional<std::vector<std::string>> match_template(
  const TypeInterner & interner, std::string_view text, gsl::span<const TemplateSpan> spans)
{
  std::vector<std::string> captures;
  if (!match_from(interner, text, 0, spans, 0, captures)) return std::nullopt;
  return captures;
}

}  // namespace tscore

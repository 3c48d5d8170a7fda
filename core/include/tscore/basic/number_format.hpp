// tscore/basic/number_format.hpp - ECMAScript number <-> string conversion
//
#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace tscore
{

/**
 * Format a double the way ECMAScript `Number.prototype.toString()` does.
 *
 * Shortest round-trip digits; exponent form for magnitudes >= 1e21 or
 * < 1e-6; "NaN", "Infinity", "-Infinity"; -0 prints as "0".
 */
[[nodiscard]] std::string format_number(double value);

/**
 * Parse a numeric string (decimal, exponent, "Infinity", "NaN").
 *
 * Leading or trailing whitespace and empty input are rejected.
 */
[[nodiscard]] std::optional<double> parse_number(std::string_view text);

/// True if `name` is the canonical string form of some number ("1", "1.5", not "01").
[[nodiscard]] bool is_numeric_literal_name(std::string_view name);

}  // namespace tscore

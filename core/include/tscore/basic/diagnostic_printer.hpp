// tscore/basic/diagnostic_printer.hpp
//
// Prints solver diagnostics in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "tscore/basic/diagnostic.hpp"

namespace tscore
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[E2322]: Type '{ a: string; }' is not assignable to type '{ a: number; }'.
 *         |
 *         = note: property 'a' is incompatible
 *         = note: 'string' is not assignable to 'number'
 *         = help: ...
 */
class DiagnosticPrinter
{
public:
  /**
   * Create a diagnostic printer.
   *
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag);

  /// Print every diagnostic of the bag, errors first, otherwise in report order.
  void print_all(const DiagnosticBag & diags);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_note(std::string_view message);
  void print_help(std::string_view message);

  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace tscore

// codegraph/validate/violation_printer.hpp
//
// Prints violations and report summaries for terminals.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "codegraph/validate/conservation_validator.hpp"
#include "codegraph/validate/violation.hpp"

namespace codegraph
{

/**
 * Prints violations in a compiler-like format.
 *
 * Produces output like:
 *   error[signature_mismatch]: Function calc expects 2 arguments but is called with 3
 *     --> app/main.py:7:4
 *         |
 *         = law: signature_conservation
 *         = expected_args: 2
 *         = actual_args: 3
 *         = help: Update the call to calc to provide 2 arguments
 */
class ViolationPrinter
{
public:
  /**
   * Create a violation printer.
   *
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit ViolationPrinter(std::ostream & os, bool use_color = true);

  void print(const Violation & violation);

  /// Every violation followed by the summary line
  void print_report(const ValidationReport & report);

  /// "3 errors, 1 warning, 0 infos" plus per-law counts
  void print_summary(const ValidationReport & report);

private:
  void print_severity_header(const Violation & violation);
  void print_line(std::string_view label, std::string_view text);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace codegraph

// pks/check/violation_printer.hpp
//
// Prints check results, fatal errors and diagnostics.
//
#pragma once

#include <iosfwd>
#include <string_view>
#include <vector>

#include "pks/basic/diagnostic.hpp"
#include "pks/check/checker.hpp"

namespace pks
{

/**
 * Prints user-facing output in the CLI's format.
 *
 * Check results:
 *   3 violation(s) detected:
 *   dependency: packs/foo/app/services/foo.rb:3 references ::Bar from ...
 *
 * Fatal errors and diagnostics:
 *   error: No root pack found. ...
 *      = help: ...
 */
class ViolationPrinter
{
public:
  /**
   * @param os Output stream
   * @param use_color Whether to use terminal colors
   */
  explicit ViolationPrinter(std::ostream & os, bool use_color = true);

  /// "No violations detected!" or the count followed by one message per line
  void print_summary(const std::vector<Violation> & violations);

  void print_fatal(const FatalError & error);

  void print(const Diagnostic & diag);
  void print_all(const DiagnosticBag & diags);

  /// "No validation errors detected!" or the count followed by each diagnostic
  void print_validation(const DiagnosticBag & diags);

private:
  void print_severity_header(Severity severity, std::string_view code, std::string_view message);
  void print_help(std::string_view message);

  std::ostream & os_;
  bool use_color_;
};

}  // namespace pks

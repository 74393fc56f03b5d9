// pks/check/violation_printer.cpp - Check results and error output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "pks/check/violation_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <ostream>
#include <rang.hpp>
#include <string>

namespace pks
{

ViolationPrinter::ViolationPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void ViolationPrinter::print_summary(const std::vector<Violation> & violations)
{
  if (violations.empty()) {
    if (use_color_) os_ << rang::fg::green;
    fmt::print(os_, "No violations detected!");
    if (use_color_) os_ << rang::fg::reset;
    fmt::print(os_, "\n");
    return;
  }

  if (use_color_) os_ << rang::style::bold << rang::fg::red;
  fmt::print(os_, "{} violation(s) detected:", violations.size());
  if (use_color_) os_ << rang::fg::reset << rang::style::reset;
  fmt::print(os_, "\n");

  for (const auto & v : violations) {
    fmt::print(os_, "{}\n", v.message);
  }
}

void ViolationPrinter::print_fatal(const FatalError & error)
{
  print_severity_header(Severity::Error, {}, error.message);
  if (error.help) {
    print_help(*error.help);
  }
}

void ViolationPrinter::print(const Diagnostic & diag)
{
  if (diag.file.empty()) {
    print_severity_header(diag.severity, diag.code, diag.message);
  } else {
    print_severity_header(
      diag.severity, diag.code, fmt::format("{}: {}", diag.file.generic_string(), diag.message));
  }
  if (diag.help_message) {
    print_help(*diag.help_message);
  }
}

void ViolationPrinter::print_all(const DiagnosticBag & diags)
{
  for (const auto & diag : diags) {
    print(diag);
  }
}

void ViolationPrinter::print_validation(const DiagnosticBag & diags)
{
  if (diags.empty()) {
    if (use_color_) os_ << rang::fg::green;
    fmt::print(os_, "No validation errors detected!");
    if (use_color_) os_ << rang::fg::reset;
    fmt::print(os_, "\n");
    return;
  }

  if (use_color_) os_ << rang::style::bold << rang::fg::red;
  fmt::print(os_, "{} validation error(s) detected:", diags.size());
  if (use_color_) os_ << rang::fg::reset << rang::style::reset;
  fmt::print(os_, "\n");

  print_all(diags);
}

// =============================================================================
// Private helpers
// =============================================================================

void ViolationPrinter::print_severity_header(
  Severity severity, std::string_view code, std::string_view message)
{
  std::string severity_str;
  switch (severity) {
    case Severity::Error:
      severity_str = "error";
      break;
    case Severity::Warning:
      severity_str = "warning";
      break;
  }

  if (use_color_) {
    os_ << rang::style::bold;
    switch (severity) {
      case Severity::Error:
        os_ << rang::fg::red;
        break;
      case Severity::Warning:
        os_ << rang::fg::yellow;
        break;
    }
    os_ << severity_str;
    if (!code.empty()) {
      os_ << "[" << code << "]";
    }
    os_ << rang::fg::reset << ": " << message << rang::style::reset << "\n";
    return;
  }

  if (!code.empty()) {
    fmt::print(os_, "{}[{}]: {}\n", severity_str, code, message);
  } else {
    fmt::print(os_, "{}: {}\n", severity_str, message);
  }
}

void ViolationPrinter::print_help(std::string_view message)
{
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "help: {}\n", message);
  } else {
    fmt::print(os_, "   = help: {}\n", message);
  }
}

}  // namespace pks

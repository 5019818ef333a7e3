// codegraph/validate/violation_printer.cpp - Terminal output for violations
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "codegraph/validate/violation_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <ostream>
#include <rang.hpp>

namespace codegraph
{

namespace
{

std::string plural(size_t n, std::string_view word)
{
  return fmt::format("{} {}{}", n, word, n == 1 ? "" : "s");
}

}  // namespace

ViolationPrinter::ViolationPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void ViolationPrinter::print(const Violation & violation)
{
  print_severity_header(violation);

  if (!violation.location.empty()) {
    fmt::print(os_, "{} {}\n", gutter_arrow(), violation.location);
  } else {
    fmt::print(os_, "{} {}\n", gutter_arrow(), violation.anchor());
  }
  fmt::print(os_, "{}\n", gutter_pipe());

  print_line("law", to_string(violation.law));
  for (const auto & [key, value] : violation.details) {
    print_line(key, to_display_string(value));
  }
  if (violation.suggested_fix) {
    print_line("help", *violation.suggested_fix);
  }
  fmt::print(os_, "\n");
}

void ViolationPrinter::print_report(const ValidationReport & report)
{
  for (const auto & v : report.violations) {
    print(v);
  }
  print_summary(report);
}

void ViolationPrinter::print_summary(const ValidationReport & report)
{
  if (report.cancelled) {
    fmt::print(os_, "validation cancelled\n");
    return;
  }

  const size_t errors = report.count(Severity::Error);
  const std::string counts = fmt::format(
    "{}, {}, {}", plural(errors, "error"), plural(report.count(Severity::Warning), "warning"),
    plural(report.count(Severity::Info), "info"));

  if (use_color_) {
    os_ << rang::style::bold << (errors > 0 ? rang::fg::red : rang::fg::green) << counts
        << rang::fg::reset << rang::style::reset;
  } else {
    fmt::print(os_, "{}", counts);
  }
  fmt::print(os_, " ({} of scope)\n", plural(report.scope_size, "node"));

  for (const Law law : k_all_laws) {
    if (const size_t n = report.count(law); n > 0) {
      fmt::print(os_, "  {}: {}\n", to_string(law), n);
    }
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void ViolationPrinter::print_severity_header(const Violation & violation)
{
  if (use_color_) {
    os_ << rang::style::bold;
    switch (violation.severity) {
      case Severity::Error:
        os_ << rang::fg::red << "error";
        break;
      case Severity::Warning:
        os_ << rang::fg::yellow << "warning";
        break;
      case Severity::Info:
        os_ << rang::fg::cyan << "info";
        break;
    }
    os_ << "[" << violation.type << "]";
    os_ << rang::fg::reset << ": " << violation.message << rang::style::reset << "\n";
  } else {
    fmt::print(
      os_, "{}[{}]: {}\n", to_string(violation.severity), violation.type, violation.message);
  }
}

void ViolationPrinter::print_line(std::string_view label, std::string_view text)
{
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "        = " << rang::style::reset
        << rang::fg::reset;
    fmt::print(os_, "{}: {}\n", label, text);
  } else {
    fmt::print(os_, "        = {}: {}\n", label, text);
  }
}

std::string ViolationPrinter::gutter_arrow() const
{
  if (use_color_) {
    return fmt::format("{}  -->{}", "\033[1;36m", "\033[0m");
  }
  return "  -->";
}

std::string ViolationPrinter::gutter_pipe() const
{
  if (use_color_) {
    return fmt::format("{}        |{}", "\033[1;36m", "\033[0m");
  }
  return "        |";
}

}  // namespace codegraph

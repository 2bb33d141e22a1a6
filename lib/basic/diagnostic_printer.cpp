// iapi/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "iapi/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <ostream>
#include <rang.hpp>
#include <string>

namespace iapi
{

namespace
{

const char * severity_name(Severity severity)
{
  switch (severity) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Info:
      return "info";
    case Severity::Hint:
      return "hint";
  }
  return "error";
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag, std::string_view document_name)
{
  // === Header line: error[CODE]: message ===
  print_severity_header(diag);

  // === Location line: --> file: path ===
  const Label * primary = diag.primary_label();
  if (primary != nullptr) {
    print_location(*primary, document_name);
  } else {
    fmt::print(os_, "{} {}\n", gutter_arrow(), document_name.empty() ? "<document>" : document_name);
  }

  fmt::print(os_, "{}\n", gutter_pipe());

  // === Related elements ===
  for (const auto & label : diag.labels) {
    if (&label == primary) continue;
    print_secondary(label);
  }

  if (diag.help_message) {
    print_help(*diag.help_message);
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, std::string_view document_name)
{
  for (const auto & d : diags) {
    print(d, document_name);
  }
  print_summary(diags);
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  if (use_color_) {
    os_ << rang::style::bold;
    switch (diag.severity) {
      case Severity::Error:
        os_ << rang::fg::red;
        break;
      case Severity::Warning:
        os_ << rang::fg::yellow;
        break;
      case Severity::Info:
        os_ << rang::fg::cyan;
        break;
      case Severity::Hint:
        os_ << rang::fg::green;
        break;
    }
    os_ << severity_name(diag.severity);
    if (!diag.code.empty()) {
      os_ << "[" << diag.code << "]";
    }
    os_ << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
    return;
  }

  if (!diag.code.empty()) {
    fmt::print(os_, "{}[{}]: {}\n", severity_name(diag.severity), diag.code, diag.message);
  } else {
    fmt::print(os_, "{}: {}\n", severity_name(diag.severity), diag.message);
  }
}

void DiagnosticPrinter::print_location(const Label & label, std::string_view document_name)
{
  const std::string where = document_name.empty()
                              ? label.path.to_string()
                              : fmt::format("{}: {}", document_name, label.path.to_string());
  fmt::print(os_, "{} {}\n", gutter_arrow(), where);
  if (!label.message.empty()) {
    print_note(label.message);
  }
}

void DiagnosticPrinter::print_secondary(const Label & label)
{
  if (label.message.empty()) {
    print_note(label.path.to_string());
    return;
  }
  print_note(fmt::format("{}: {}", label.path.to_string(), label.message));
}

void DiagnosticPrinter::print_help(std::string_view message)
{
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "      = " << rang::style::reset
        << rang::fg::reset;
    fmt::print(os_, "help: {}\n", message);
  } else {
    fmt::print(os_, "      = help: {}\n", message);
  }
}

void DiagnosticPrinter::print_note(std::string_view message)
{
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "      = " << rang::style::reset
        << rang::fg::reset;
    fmt::print(os_, "note: {}\n", message);
  } else {
    fmt::print(os_, "      = note: {}\n", message);
  }
}

void DiagnosticPrinter::print_summary(const DiagnosticBag & diags)
{
  const size_t errors = diags.errors().size();
  const size_t warnings = diags.warnings().size();
  if (errors == 0 && warnings == 0) {
    return;
  }
  fmt::print(
    os_, "{} error{}, {} warning{} emitted\n", errors, errors == 1 ? "" : "s", warnings,
    warnings == 1 ? "" : "s");
}

// =============================================================================
// Gutter helpers (Rust-style)
// =============================================================================

std::string DiagnosticPrinter::gutter_arrow() const
{
  if (use_color_) {
    return fmt::format("{}{} -->{}", "\033[1;36m", " ", "\033[0m");
  }
  return "  -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  if (use_color_) {
    return fmt::format("{}      |{}", "\033[1;36m", "\033[0m");
  }
  return "      |";
}

}  // namespace iapi

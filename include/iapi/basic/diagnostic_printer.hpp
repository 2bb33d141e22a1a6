// iapi/basic/diagnostic_printer.hpp
//
// Prints diagnostics with their document path, related elements,
// and help text in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "iapi/basic/diagnostic.hpp"

namespace iapi
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[E0005]: duplicate index 0 in struct 'structItem'
 *     --> kv.json: types.structItem.content.b
 *      |
 *      = note: types.structItem.content.a: first declared here
 *      = help: indices are never reused; pick an unused index
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

  /**
   * Print a single diagnostic.
   *
   * @param document_name Name shown before the path (file name, or empty)
   */
  void print(const Diagnostic & diag, std::string_view document_name = {});

  /**
   * Print all diagnostics from a DiagnosticBag, followed by a summary line.
   */
  void print_all(const DiagnosticBag & diags, std::string_view document_name = {});

private:
  void print_severity_header(const Diagnostic & diag);
  void print_location(const Label & label, std::string_view document_name);
  void print_secondary(const Label & label);
  void print_help(std::string_view message);
  void print_note(std::string_view message);
  void print_summary(const DiagnosticBag & diags);

  // Gutter elements for Rust-style output
  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace iapi

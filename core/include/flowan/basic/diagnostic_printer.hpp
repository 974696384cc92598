// flowan/basic/diagnostic_printer.hpp
//
// Renders diagnostics with source context in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "flowan/basic/diagnostic.hpp"
#include "flowan/basic/source_manager.hpp"

namespace flowan
{

/**
 * Prints diagnostics like:
 *
 *   error[F001]: 'x' is read before it is definitely assigned
 *     --> unit.dart:5:12
 *      |
 *    5 |   print(x);
 *      |         ^ possibly unassigned here
 *      |
 *      = help: assign 'x' on every path before this read
 *
 * When the SourceManager has no text, only the header and the location
 * line are printed.
 */
class DiagnosticPrinter
{
public:
  /**
   * @param os Output stream (typically std::cerr)
   * @param use_color Emit terminal colors through rang
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag, const SourceManager & source);

  /// Print every diagnostic, ordered by primary location
  void print_all(const DiagnosticBag & diags, const SourceManager & source);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_label(const Label & label, const SourceManager & source);
  void print_help(std::string_view message);
  void print_note(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace flowan

// kdlnum/basic/diagnostic_printer.hpp
//
// Prints diagnostics with source context, line/column information,
// and position markers in Rust-style format.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "kdlnum/basic/diagnostic.hpp"
#include "kdlnum/basic/source_file.hpp"

namespace kdlnum
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   error[E001]: malformed numeric literal '0x1G'
 *     --> values.kdl:3:5
 *      |
 *    3 | 1 2 0x1G
 *      |     ^^^^ not a valid base-16 number
 *      |
 *      = help: hexadecimal digits are 0-9, a-f and A-F
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

  void print(const Diagnostic & diag, const SourceFile & source);

  /**
   * Print all diagnostics from a DiagnosticBag, ordered by position.
   */
  void print_all(const DiagnosticBag & diags, const SourceFile & source);

private:
  void print_severity_header(const Diagnostic & diag);

  void print_source_line(
    const SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
    std::string_view label);

  void print_help(std::string_view message);

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;
  [[nodiscard]] std::string gutter_pipe_only() const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace kdlnum

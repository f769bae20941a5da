// kdlnum/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "kdlnum/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace kdlnum
{

namespace
{

std::string_view severity_name(Severity severity)
{
  switch (severity) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Note:
      return "note";
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

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceFile & source)
{
  const std::string filename = source.path().empty() ? "<input>" : source.path().string();
  const FullSourceRange fr = source.get_full_range(diag.range);

  // === Header line: error[CODE]: message ===
  print_severity_header(diag);

  // === Location line: --> file:line:col ===
  if (fr.is_valid()) {
    fmt::print(
      os_, "{} {}\n", gutter_arrow(),
      fmt::format("{}:{}:{}", filename, fr.start_line, fr.start_column));
  } else {
    fmt::print(os_, "{} {}\n", gutter_arrow(), filename);
  }

  fmt::print(os_, "{}\n", gutter_pipe());

  // === Source snippet ===
  if (fr.is_valid()) {
    const uint32_t end_col = (fr.end_line == fr.start_line && fr.end_column > fr.start_column)
                               ? fr.end_column
                               : (fr.start_column + 1);
    print_source_line(source, fr.start_line - 1, fr.start_column, end_col, diag.label);
  }

  if (diag.help_message) {
    print_help(*diag.help_message);
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceFile & source)
{
  std::vector<Diagnostic> sorted_diags(diags.begin(), diags.end());

  std::stable_sort(
    sorted_diags.begin(), sorted_diags.end(), [](const Diagnostic & a, const Diagnostic & b) {
      return a.range.begin() < b.range.begin();
    });

  for (const auto & d : sorted_diags) {
    print(d, source);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  const std::string_view name = severity_name(diag.severity);
  if (use_color_) {
    os_ << rang::style::bold;
    switch (diag.severity) {
      case Severity::Error:
        os_ << rang::fg::red;
        break;
      case Severity::Warning:
        os_ << rang::fg::yellow;
        break;
      case Severity::Note:
        os_ << rang::fg::cyan;
        break;
    }
    os_ << name;
    if (!diag.code.empty()) {
      os_ << "[" << diag.code << "]";
    }
    os_ << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
    return;
  }

  if (!diag.code.empty()) {
    fmt::print(os_, "{}[{}]: {}\n", name, diag.code, diag.message);
  } else {
    fmt::print(os_, "{}: {}\n", name, diag.message);
  }
}

void DiagnosticPrinter::print_source_line(
  const SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
  std::string_view label)
{
  const std::string_view line = source.get_line(line_index);
  if (line.empty()) {
    return;
  }

  const uint32_t line_num = line_index + 1;

  // tabs -> spaces
  std::string cleaned_line;
  cleaned_line.reserve(line.size());
  for (const char c : line) {
    if (c == '\t') {
      cleaned_line += "    ";
    } else {
      cleaned_line += c;
    }
  }

  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", line_num);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", line_num);
  }
  fmt::print(os_, "{}\n", cleaned_line);

  fmt::print(os_, "      {} ", gutter_pipe_only());

  std::string marker_prefix;
  uint32_t visual_col = 1;
  for (size_t i = 0; visual_col < start_col && i < line.size(); ++i, ++visual_col) {
    marker_prefix += (line[i] == '\t') ? "    " : " ";
  }

  const size_t marker_len = (end_col > start_col) ? (end_col - start_col) : 1;
  fmt::print(os_, "{}", marker_prefix);

  if (use_color_) {
    os_ << rang::fg::red << rang::style::bold;
  }
  fmt::print(os_, "{}", std::string(marker_len, '^'));
  if (!label.empty()) {
    fmt::print(os_, " {}", label);
  }
  if (use_color_) {
    os_ << rang::style::reset << rang::fg::reset;
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_help(std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());

  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "help: {}\n", message);
  } else {
    fmt::print(os_, "   = help: {}\n", message);
  }
}

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

std::string DiagnosticPrinter::gutter_pipe_only() const
{
  if (use_color_) {
    return fmt::format("{}|{}", "\033[1;36m", "\033[0m");
  }
  return "|";
}

}  // namespace kdlnum

// kdlnum/basic/diagnostic.cpp - Diagnostic implementation
#include "kdlnum/basic/diagnostic.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace kdlnum
{

namespace
{

Diagnostic make_diagnostic(Severity severity, SourceRange range, std::string message)
{
  Diagnostic d;
  d.severity = severity;
  d.range = range;
  d.message = std::move(message);
  return d;
}

}  // namespace

// ============================================================================
// DiagnosticBuilder
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(other.bag_), diagnostic_(std::move(other.diagnostic_)), active_(other.active_)
{
  other.active_ = false;
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (active_) {
    bag_.add(std::move(diagnostic_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::with_code(std::string code)
{
  diagnostic_.code = std::move(code);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_label(std::string label)
{
  diagnostic_.label = std::move(label);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_help(std::string help_msg)
{
  diagnostic_.help_message = std::move(help_msg);
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

DiagnosticBuilder DiagnosticBag::report_error(SourceRange range, std::string message)
{
  return {*this, make_diagnostic(Severity::Error, range, std::move(message))};
}

DiagnosticBuilder DiagnosticBag::report_warning(SourceRange range, std::string message)
{
  return {*this, make_diagnostic(Severity::Warning, range, std::move(message))};
}

DiagnosticBuilder DiagnosticBag::report_note(SourceRange range, std::string message)
{
  return {*this, make_diagnostic(Severity::Note, range, std::move(message))};
}

void DiagnosticBag::add(Diagnostic && diag) { diagnostics_.push_back(std::move(diag)); }

std::vector<Diagnostic> DiagnosticBag::errors() const
{
  std::vector<Diagnostic> result;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(result),
    [](const Diagnostic & d) { return d.severity == Severity::Error; });
  return result;
}

std::vector<Diagnostic> DiagnosticBag::warnings() const
{
  std::vector<Diagnostic> result;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(result),
    [](const Diagnostic & d) { return d.severity == Severity::Warning; });
  return result;
}

bool DiagnosticBag::has_errors() const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
    return d.severity == Severity::Error;
  });
}

bool DiagnosticBag::has_warnings() const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
    return d.severity == Severity::Warning;
  });
}

}  // namespace kdlnum

// flowan/basic/diagnostic.cpp - Diagnostic implementation
#include "flowan/basic/diagnostic.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

namespace flowan
{

std::string_view to_string(DiagCode code) noexcept
{
  switch (code) {
    case DiagCode::PossiblyUnassigned:
      return "F001";
    case DiagCode::MissingReturn:
      return "F002";
    case DiagCode::DeadCode:
      return "F003";
    case DiagCode::MalformedInput:
      return "I001";
    case DiagCode::UnresolvedName:
      return "I002";
    case DiagCode::InvalidJumpTarget:
      return "I003";
    case DiagCode::UnknownType:
      return "I004";
  }
  return "";
}

Severity default_severity(DiagCode code) noexcept
{
  return code == DiagCode::DeadCode ? Severity::Info : Severity::Error;
}

const Label * Diagnostic::primary_label() const noexcept
{
  for (const auto & l : labels) {
    if (l.style == LabelStyle::Primary) {
      return &l;
    }
  }
  return labels.empty() ? nullptr : &labels.front();
}

SourceRange Diagnostic::primary_range() const noexcept
{
  const Label * l = primary_label();
  return l == nullptr ? SourceRange{} : l->range;
}

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

DiagnosticBuilder & DiagnosticBuilder::with_label(
  SourceRange range, std::string msg, LabelStyle style)
{
  diagnostic_.labels.push_back(Label{range, std::move(msg), style});
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_secondary_label(SourceRange range, std::string msg)
{
  return with_label(range, std::move(msg), LabelStyle::Secondary);
}

DiagnosticBuilder & DiagnosticBuilder::with_help(std::string help_msg)
{
  diagnostic_.help_message = std::move(help_msg);
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

namespace
{

Diagnostic make_diagnostic(
  Severity severity, SourceRange range, std::string message, std::string label_message)
{
  Diagnostic d;
  d.severity = severity;
  d.message = std::move(message);
  d.labels.push_back(Label{range, std::move(label_message), LabelStyle::Primary});
  return d;
}

}  // namespace

DiagnosticBuilder DiagnosticBag::report(
  DiagCode code, SourceRange range, std::string message, std::string label_message)
{
  Diagnostic d =
    make_diagnostic(default_severity(code), range, std::move(message), std::move(label_message));
  d.code = std::string(to_string(code));
  return {*this, std::move(d)};
}

DiagnosticBuilder DiagnosticBag::report_error(
  SourceRange range, std::string message, std::string label_message)
{
  return {
    *this, make_diagnostic(Severity::Error, range, std::move(message), std::move(label_message))};
}

DiagnosticBuilder DiagnosticBag::report_warning(
  SourceRange range, std::string message, std::string label_message)
{
  return {
    *this, make_diagnostic(Severity::Warning, range, std::move(message), std::move(label_message))};
}

void DiagnosticBag::add(Diagnostic && diag) { diagnostics_.push_back(std::move(diag)); }

std::vector<Diagnostic> DiagnosticBag::with_code(DiagCode code) const
{
  const std::string_view wanted = to_string(code);
  std::vector<Diagnostic> result;
  std::copy_if(
    diagnostics_.begin(), diagnostics_.end(), std::back_inserter(result),
    [wanted](const Diagnostic & d) { return d.code == wanted; });
  return result;
}

bool DiagnosticBag::has_errors() const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
    return d.severity == Severity::Error;
  });
}

}  // namespace flowan

// flowan/basic/diagnostic.hpp - Diagnostics produced by the front end and flow analysis
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "flowan/basic/source_manager.hpp"

namespace flowan
{

// ============================================================================
// Core Structures
// ============================================================================

/**
 * Severity level for diagnostics.
 */
enum class Severity : uint8_t {
  Error,
  Warning,
  Info,
  Hint,
};

/**
 * Stable diagnostic codes.
 *
 * F-codes come from flow analysis, I-codes from reading an input unit.
 */
enum class DiagCode : uint8_t {
  PossiblyUnassigned,  ///< F001: read of a variable that is not definitely assigned
  MissingReturn,       ///< F002: end of a non-nullable-returning body is reachable
  DeadCode,            ///< F003: statement cannot be reached from function entry
  MalformedInput,      ///< I001: input structure is not a valid unit
  UnresolvedName,      ///< I002: variable name without a declaration in scope
  InvalidJumpTarget,   ///< I003: break/continue outside of a matching statement
  UnknownType,         ///< I004: type name that cannot be parsed
};

[[nodiscard]] std::string_view to_string(DiagCode code) noexcept;
[[nodiscard]] Severity default_severity(DiagCode code) noexcept;

enum class LabelStyle {
  Primary,    ///< Location of the finding itself
  Secondary,  ///< Related location
};

struct Label
{
  SourceRange range;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;  ///< e.g. "F001"
  std::string message;

  std::vector<Label> labels;
  std::optional<std::string> help_message;

  [[nodiscard]] const Label * primary_label() const noexcept;
  [[nodiscard]] SourceRange primary_range() const noexcept;
};

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Fluent builder that adds its diagnostic to the bag when destroyed.
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_label(
    SourceRange range, std::string msg, LabelStyle style = LabelStyle::Primary);

  DiagnosticBuilder & with_secondary_label(SourceRange range, std::string msg);

  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  /// Start a diagnostic whose code and severity come from @p code
  DiagnosticBuilder report(
    DiagCode code, SourceRange range, std::string message, std::string label_message = "");

  DiagnosticBuilder report_error(
    SourceRange range, std::string message, std::string label_message = "");
  DiagnosticBuilder report_warning(
    SourceRange range, std::string message, std::string label_message = "");

  void add(Diagnostic && diag);

  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] std::vector<Diagnostic> with_code(DiagCode code) const;
  [[nodiscard]] bool has_errors() const;

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace flowan

// flowan/driver/checker.hpp - Analysis driver
//
// Single entry point for the check pipeline: load a JSON unit, run flow
// analysis over every function and collect diagnostics. Used by the CLI
// and by tests.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "flowan/basic/diagnostic.hpp"
#include "flowan/basic/source_manager.hpp"
#include "flowan/sema/flow/flow_options.hpp"

namespace flowan
{

// ============================================================================
// Check Options
// ============================================================================

struct CheckOptions
{
  FlowOptions flow;

  /// Collect a JSON dump of every function's flow results
  bool dump_flow = false;

  /// Program text for snippets (overrides the unit's "source" entry)
  std::optional<std::filesystem::path> source_path;

  /// Print progress to stderr
  bool verbose = false;
};

// ============================================================================
// Check Result
// ============================================================================

struct CheckResult
{
  /// No load failure and no error diagnostics
  bool success = false;

  DiagnosticBag diagnostics;

  /// Text and path the diagnostic ranges refer to
  SourceManager source;

  /// `[{"function": ..., ...}, ...]` when dump_flow was requested
  nlohmann::json flow_dump = nlohmann::json::array();

  /// Number of functions analyzed
  size_t function_count = 0;
};

// ============================================================================
// Checker
// ============================================================================

class Checker
{
public:
  /**
   * Check a unit stored in a JSON file.
   *
   * Unreadable files and invalid JSON are reported as error diagnostics
   * with an empty range.
   */
  [[nodiscard]] static CheckResult check_file(
    const std::filesystem::path & file, const CheckOptions & options);

  /// Check a unit given as JSON text; @p name is used for messages only.
  [[nodiscard]] static CheckResult check_text(
    std::string_view text, const CheckOptions & options, std::string_view name = "<input>");
};

}  // namespace flowan

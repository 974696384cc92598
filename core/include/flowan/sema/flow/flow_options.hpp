// flowan/sema/flow/flow_options.hpp - Switches for one flow analysis run
//
#pragma once

namespace flowan
{

/**
 * Behavior toggles for FlowAnalyzer. Defaults match the language rules;
 * the `report_*` flags only silence diagnostics, never change models.
 */
struct FlowOptions
{
  /// `var x;` takes the type of its first assignment
  bool initialization_promotion = true;

  /// Assignments may promote to a recorded type of interest
  bool assignment_promotion = true;

  /// `e == null` with a non-nullable `e` makes the "is null" branch unreachable
  bool null_comparison_reachability = true;

  bool report_dead_code = true;
  bool report_unassigned_reads = true;
  bool report_missing_returns = true;
};

}  // namespace flowan

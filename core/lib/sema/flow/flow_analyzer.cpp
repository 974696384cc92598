// flowan/sema/flow/flow_analyzer.cpp - Driver and shared plumbing
//
// Expression rules live in flow_expr.cpp, statement rules in flow_stmt.cpp.
//
#include "flowan/sema/flow/flow_analyzer.hpp"

#include <string>
#include <utility>

#include "flowan/sema/types/type_utils.hpp"

namespace flowan
{

FlowAnalyzer::FlowAnalyzer(
  const TypeOperations & ops, FlowOptions options, DiagnosticBag * diags, FlowObserver * observer)
: ops_(ops), options_(options), diags_(diags), observer_(observer)
{
}

// ============================================================================
// Entry Point
// ============================================================================

FlowResults FlowAnalyzer::analyze(const FunctionDecl & fn)
{
  FlowResults results;

  // Pass 1 must complete before any model is computed.
  const AssignedVariables assigned = AssignedVariables::compute(fn);

  assigned_ = &assigned;
  results_ = &results;
  functions_.clear();
  in_dead_code_ = false;

  const FlowModel exit_model = analyze_body(
    &fn, fn.params, fn.body, fn.exprBody, fn.returnType, fn.bodyKind, FlowModel::entry());

  results.exit_model = exit_model;
  results.exit_reachable = exit_model.is_reachable();

  assigned_ = nullptr;
  results_ = nullptr;
  return results;
}

FlowModel FlowAnalyzer::analyze_body(
  const AstNode * owner, gsl::span<VariableDecl * const> params, const BlockStmt * body,
  const Expr * expr_body, const Type * return_type, FunctionBodyKind body_kind,
  const FlowModel & entry)
{
  functions_.push_back(FunctionContext{owner, return_type, body_kind, {}});

  FlowModel model = entry;
  for (const VariableDecl * param : params) {
    model = declare(param, model, /*initialized=*/true);
  }

  FlowModel exit_model;
  if (expr_body != nullptr) {
    // `=> e` behaves as `{ return e; }`
    const ExpressionFlow & flow = visit_expr(expr_body, model);
    results_->exits.push_back(ExitContribution{
      ExitKind::Return, expr_body, owner, type_of(expr_body), flow.after.is_reachable()});
    exit_model = flow.after.exit();
  } else if (body != nullptr) {
    exit_model = visit_stmt(body, model);
  } else {
    // Bodiless (external) declaration
    exit_model = model.exit();
  }

  const bool missing = check_missing_return(owner, exit_model, return_type, body_kind);
  results_->functions.push_back(
    FunctionFlow{owner, exit_model, exit_model.is_reachable(), missing});

  functions_.pop_back();
  return exit_model;
}

bool FlowAnalyzer::check_missing_return(
  const AstNode * owner, const FlowModel & exit_model, const Type * return_type,
  FunctionBodyKind body_kind)
{
  if (is_generator(body_kind) || !exit_model.is_reachable()) {
    return false;
  }

  TypeContext & types = ops_.types();
  const Type * declared = return_type != nullptr ? return_type : types.dynamic_type();
  const Type * value_type = declared;
  if (body_kind == FunctionBodyKind::Async) {
    value_type = types.future_value_type(declared);
  }
  if (value_type == nullptr || ops_.is_nullable(value_type)) {
    return false;
  }

  if (options_.report_missing_returns) {
    std::string what = "closure";
    if (const auto * fn = dyn_cast<FunctionDecl>(owner)) {
      what = "function '" + std::string(fn->name) + "'";
    }
    report(
      DiagCode::MissingReturn, owner->get_range(),
      "The body of " + what + " can complete normally, but its return type '" +
        to_string(declared) + "' does not allow null",
      std::nullopt,
      "add a return or throw at the end of the body, or make the return type nullable");
  }
  return true;
}

// ============================================================================
// Jump Targets
// ============================================================================

FlowAnalyzer::JumpTarget & FlowAnalyzer::push_target(
  const Stmt * stmt, const FlowModel & split_model)
{
  auto & targets = functions_.back().targets;
  targets.push_back(JumpTarget{stmt, split_model.depth(), std::nullopt, std::nullopt});
  return targets.back();
}

FlowAnalyzer::JumpTarget FlowAnalyzer::pop_target()
{
  auto & targets = functions_.back().targets;
  JumpTarget target = std::move(targets.back());
  targets.pop_back();
  return target;
}

FlowAnalyzer::JumpTarget * FlowAnalyzer::find_target(const Stmt * stmt)
{
  if (stmt == nullptr || functions_.empty()) {
    return nullptr;
  }
  auto & targets = functions_.back().targets;
  for (auto it = targets.rbegin(); it != targets.rend(); ++it) {
    if (it->stmt == stmt) {
      return &*it;
    }
  }
  return nullptr;
}

// ============================================================================
// Diagnostics
// ============================================================================

void FlowAnalyzer::report(
  DiagCode code, SourceRange range, std::string message, std::optional<Label> related,
  std::optional<std::string> help)
{
  if (default_severity(code) == Severity::Error) {
    has_errors_ = true;
  }
  if (diags_ == nullptr) {
    return;
  }
  DiagnosticBuilder builder = diags_->report(code, range, std::move(message));
  if (related && related->range.is_valid()) {
    builder.with_secondary_label(related->range, std::move(related->message));
  }
  if (help) {
    builder.with_help(std::move(*help));
  }
}

void FlowAnalyzer::report_dead_code(const Stmt * stmt)
{
  if (!options_.report_dead_code) {
    return;
  }
  report(DiagCode::DeadCode, stmt->get_range(), "Dead code");
}

}  // namespace flowan

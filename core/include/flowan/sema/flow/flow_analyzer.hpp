// flowan/sema/flow/flow_analyzer.hpp - Flow analysis of one function body
//
// Pass 2 of flow analysis: a single recursive descent that pushes the
// `before` model into each node and computes the `after` model (and the
// models conditioned on a boolean or null outcome) from its children.
// Loops are handled in one pass: the pre-pass index tells which variables
// a back edge may change, and the loop head starts from a conservative
// model.
//
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "flowan/ast/ast.hpp"
#include "flowan/basic/diagnostic.hpp"
#include "flowan/sema/flow/assigned_variables.hpp"
#include "flowan/sema/flow/flow_model.hpp"
#include "flowan/sema/flow/flow_options.hpp"
#include "flowan/sema/flow/flow_results.hpp"
#include "flowan/sema/types/type_operations.hpp"

namespace flowan
{

/**
 * Computes FlowResults for function bodies and reports
 * possibly-unassigned reads (F001), missing returns (F002) and dead code
 * (F003).
 *
 * ## Usage
 * ```cpp
 * SubtypeOracle oracle(types, classes);
 * FlowAnalyzer analyzer(oracle, FlowOptions{}, &diags);
 * FlowResults results = analyzer.analyze(*fn);
 * ```
 *
 * One analyzer may run many functions; each call is independent.
 */
class FlowAnalyzer
{
public:
  FlowAnalyzer(
    const TypeOperations & ops, FlowOptions options = {}, DiagnosticBag * diags = nullptr,
    FlowObserver * observer = nullptr);

  /// Analyze @p fn from a fresh entry model.
  [[nodiscard]] FlowResults analyze(const FunctionDecl & fn);

  [[nodiscard]] bool has_errors() const noexcept { return has_errors_; }
  [[nodiscard]] const FlowOptions & options() const noexcept { return options_; }

private:
  // ===========================================================================
  // Function contexts and jump targets
  // ===========================================================================

  struct JumpTarget
  {
    const Stmt * stmt = nullptr;
    size_t depth = 0;  ///< Depth jumps are brought to before joining
    std::optional<FlowModel> breaks;
    std::optional<FlowModel> continues;
  };

  struct FunctionContext
  {
    const AstNode * owner = nullptr;
    const Type * return_type = nullptr;
    FunctionBodyKind body_kind = FunctionBodyKind::Sync;
    std::vector<JumpTarget> targets;
  };

  /// Shared body walk for functions and closures; returns the model at the end of the body
  FlowModel analyze_body(
    const AstNode * owner, gsl::span<VariableDecl * const> params, const BlockStmt * body,
    const Expr * expr_body, const Type * return_type, FunctionBodyKind body_kind,
    const FlowModel & entry);

  /// F002 check; true when the body can complete normally without a value
  bool check_missing_return(
    const AstNode * owner, const FlowModel & exit_model, const Type * return_type,
    FunctionBodyKind body_kind);

  JumpTarget & push_target(const Stmt * stmt, const FlowModel & split_model);
  JumpTarget pop_target();
  JumpTarget * find_target(const Stmt * stmt);

  // ===========================================================================
  // Expressions (flow_expr.cpp)
  // ===========================================================================

  ExpressionFlow visit_expr(const Expr * expr, const FlowModel & before);

  ExpressionFlow visit_var_ref(const VarRefExpr * expr, const FlowModel & before);
  ExpressionFlow visit_assign(const AssignExpr * expr, const FlowModel & before);
  ExpressionFlow visit_if_null_assign(const AssignExpr * expr, const FlowModel & before);
  ExpressionFlow visit_binary(const BinaryExpr * expr, const FlowModel & before);
  ExpressionFlow visit_logical(const BinaryExpr * expr, const FlowModel & before);
  ExpressionFlow visit_if_null(const BinaryExpr * expr, const FlowModel & before);
  ExpressionFlow visit_equality(const BinaryExpr * expr, const FlowModel & before);
  ExpressionFlow visit_unary(const UnaryExpr * expr, const FlowModel & before);
  ExpressionFlow visit_conditional(const ConditionalExpr * expr, const FlowModel & before);
  ExpressionFlow visit_is(const IsExpr * expr, const FlowModel & before);
  ExpressionFlow visit_as(const AsExpr * expr, const FlowModel & before);
  ExpressionFlow visit_null_check(const NullCheckExpr * expr, const FlowModel & before);
  ExpressionFlow visit_call(const CallExpr * expr, const FlowModel & before);
  ExpressionFlow visit_function_expr(const FunctionExpr * expr, const FlowModel & before);

  /// Publish a finished expression and apply rules that hold for every form
  const ExpressionFlow & finish(const Expr * expr, ExpressionFlow flow);

  /// Read of a variable: F001 check and read info
  void record_read(const Expr * expr, const VariableDecl * var, const FlowModel & model);

  /// Variable behind @p expr when it is a promotable read
  [[nodiscard]] const VariableDecl * promotable_variable(
    const Expr * expr, const FlowModel & model) const;

  /// Static type of @p expr, falling back to what flow knows
  [[nodiscard]] const Type * type_of(const Expr * expr) const;

  // ===========================================================================
  // Statements (flow_stmt.cpp)
  // ===========================================================================

  /// Returns the model after @p stmt (same depth as @p before)
  FlowModel visit_stmt(const Stmt * stmt, const FlowModel & before);

  FlowModel visit_block(const BlockStmt * stmt, const FlowModel & before);
  FlowModel visit_statements(gsl::span<Stmt * const> stmts, const FlowModel & before);
  FlowModel visit_var_decl(const VarDeclStmt * stmt, const FlowModel & before);
  FlowModel visit_if(const IfStmt * stmt, const FlowModel & before);
  FlowModel visit_while(const WhileStmt * stmt, const FlowModel & before);
  FlowModel visit_do_while(const DoWhileStmt * stmt, const FlowModel & before);
  FlowModel visit_for(const ForStmt * stmt, const FlowModel & before);
  FlowModel visit_break(const BreakStmt * stmt, const FlowModel & before);
  FlowModel visit_continue(const ContinueStmt * stmt, const FlowModel & before);
  FlowModel visit_return(const ReturnStmt * stmt, const FlowModel & before);
  FlowModel visit_yield(const YieldStmt * stmt, const FlowModel & before);
  FlowModel visit_switch(const SwitchStmt * stmt, const FlowModel & before);
  FlowModel visit_labeled(const LabeledStmt * stmt, const FlowModel & before);
  FlowModel visit_try(const TryStmt * stmt, const FlowModel & before);

  /// Bring a variable declaration into scope
  FlowModel declare(const VariableDecl * var, const FlowModel & before, bool initialized);

  void report_dead_code(const Stmt * stmt);
  void report(
    DiagCode code, SourceRange range, std::string message,
    std::optional<Label> related = std::nullopt, std::optional<std::string> help = std::nullopt);

  // ===========================================================================
  // State
  // ===========================================================================

  const TypeOperations & ops_;
  FlowOptions options_;
  DiagnosticBag * diags_;
  FlowObserver * observer_;

  /// Valid during analyze()
  const AssignedVariables * assigned_ = nullptr;
  FlowResults * results_ = nullptr;
  std::vector<FunctionContext> functions_;

  /// Inside a dead region whose first statement has been reported
  bool in_dead_code_ = false;
  bool has_errors_ = false;
};

}  // namespace flowan

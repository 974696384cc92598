// flowan/sema/flow/flow_results.hpp - Output tables of one analysis run
//
// Results are owned by the run that produced them and keyed by node
// address. Nothing here is global.
//
#pragma once

#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

#include "flowan/ast/ast.hpp"
#include "flowan/sema/flow/flow_model.hpp"

namespace flowan
{

/// Models around one expression
struct ExpressionFlow
{
  FlowModel before;
  FlowModel after;
  FlowModel when_true;
  FlowModel when_false;
  FlowModel when_null;
  FlowModel when_not_null;
};

/// Models around one statement
struct StatementFlow
{
  FlowModel before;
  FlowModel after;
  std::optional<FlowModel> break_model;     ///< Join of all `break`s targeting the statement
  std::optional<FlowModel> continue_model;  ///< Join of all `continue`s targeting the loop
};

/// What the analysis knew when a variable was read
struct VariableReadInfo
{
  const VariableDecl * variable = nullptr;
  const Type * current_type = nullptr;   ///< Promoted or declared type
  const Type * promoted_type = nullptr;  ///< nullptr when not promoted
  bool assigned = false;
  bool unassigned = false;
  bool write_captured = false;
  bool reachable = true;
};

enum class ExitKind : uint8_t {
  Return,  ///< `return`, or an expression body
  Yield,   ///< `yield` / `yield*`; control continues
};

/// A point contributing a value to the enclosing function's result
struct ExitContribution
{
  ExitKind kind = ExitKind::Return;
  const AstNode * node = nullptr;      ///< ReturnStmt, YieldStmt or the expression body
  const AstNode * function = nullptr;  ///< FunctionDecl or FunctionExpr it belongs to
  const Type * type = nullptr;         ///< Contributed type; nullptr for a bare `return;`
  bool reachable = true;
};

/// Per-function summary (the analyzed function and every closure inside it)
struct FunctionFlow
{
  const AstNode * function = nullptr;
  FlowModel exit_model;  ///< Model when control falls off the end of the body
  bool exit_reachable = false;
  bool missing_return = false;
};

class FlowResults
{
public:
  [[nodiscard]] const ExpressionFlow * expression(const Expr * expr) const
  {
    auto it = expressions.find(expr);
    return it != expressions.end() ? &it->second : nullptr;
  }

  [[nodiscard]] const StatementFlow * statement(const Stmt * stmt) const
  {
    auto it = statements.find(stmt);
    return it != statements.end() ? &it->second : nullptr;
  }

  [[nodiscard]] const VariableReadInfo * read(const Expr * expr) const
  {
    auto it = reads.find(expr);
    return it != reads.end() ? &it->second : nullptr;
  }

  [[nodiscard]] const FunctionFlow * function(const AstNode * fn) const
  {
    for (const auto & f : functions) {
      if (f.function == fn) return &f;
    }
    return nullptr;
  }

  std::unordered_map<const Expr *, ExpressionFlow> expressions;
  std::unordered_map<const Stmt *, StatementFlow> statements;
  std::unordered_map<const Expr *, VariableReadInfo> reads;  ///< VarRefExpr and `??=` reads
  std::vector<ExitContribution> exits;                      ///< In traversal order
  std::vector<FunctionFlow> functions;                      ///< Closures first, analyzed function last

  /// End of the analyzed function's body is reachable
  bool exit_reachable = false;
  FlowModel exit_model;
};

/**
 * Receives models as soon as a node is finished, before its parent is.
 * An inferencer hooks in here to read promoted types mid-traversal.
 */
class FlowObserver
{
public:
  virtual ~FlowObserver() = default;

  virtual void on_expression(const Expr & /*expr*/, const ExpressionFlow & /*flow*/) {}
  virtual void on_statement(const Stmt & /*stmt*/, const StatementFlow & /*flow*/) {}
  virtual void on_read(const Expr & /*expr*/, const VariableReadInfo & /*info*/) {}
};

}  // namespace flowan

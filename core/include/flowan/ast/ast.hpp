// flowan/ast/ast.hpp - AST node class definitions
//
// Resolved function bodies as the flow analysis consumes them. Nodes follow
// the LLVM/Clang style with classof() for RTTI. Name resolution and static
// types are already applied: variable uses point at their VariableDecl and
// expressions carry the type the inferencer assigned.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <string_view>

#include "flowan/ast/ast_enums.hpp"
#include "flowan/basic/casting.hpp"
#include "flowan/basic/source_manager.hpp"

namespace flowan
{

struct Type;

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all AST nodes.
 *
 * Nodes are non-copyable, trivially destructible and owned by AstContext.
 * Node addresses are the identity used by flow results.
 */
class AstNode
{
public:
  const NodeKind kind;
  SourceRange range_;  ///< Byte offsets only; line/column come from SourceManager

  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }
  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }

protected:
  explicit AstNode(NodeKind k, SourceRange r = {}) : kind(k), range_(r) {}
  ~AstNode() = default;  // Non-virtual, protected: prevents polymorphic delete
};

/**
 * CRTP base class that implements classof() for a concrete node.
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(SourceRange r = {}) : Base(K, r) {}
};

/**
 * Base class for expressions.
 */
class Expr : public AstNode
{
public:
  /// Static type from the inferencer (nullptr when not inferred; treated as dynamic)
  const Type * staticType = nullptr;

  static bool classof(const AstNode * node) { return is_expr_kind(node->kind); }

protected:
  explicit Expr(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

/**
 * Base class for statements.
 */
class Stmt : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_stmt_kind(node->kind); }

protected:
  explicit Stmt(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

/**
 * Base class for declarations.
 */
class Decl : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_decl_kind(node->kind); }

protected:
  explicit Decl(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class BlockStmt;

// ============================================================================
// Supporting Nodes
// ============================================================================

/**
 * A local variable or parameter.
 *
 * `declaredType` is nullptr for `var x;` and for `var x = e;` until the
 * inferencer fills it in; in the latter case the initializer's type is
 * used as the declared type.
 */
class VariableDecl : public NodeBase<VariableDecl, AstNode, NodeKind::VariableDecl>
{
public:
  std::string_view name;
  const Type * declaredType = nullptr;
  Expr * initializer = nullptr;
  bool isFinal = false;
  bool isLate = false;

  explicit VariableDecl(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}

  VariableDecl(std::string_view n, const Type * t, Expr * init, SourceRange r = {})
  : NodeBase(r), name(n), declaredType(t), initializer(init)
  {
  }

  /// Neither a written type nor an initializer
  [[nodiscard]] bool is_implicitly_typed() const noexcept
  {
    return declaredType == nullptr && initializer == nullptr;
  }
};

/// One `case`/`default` group of a switch statement.
class SwitchCase : public NodeBase<SwitchCase, AstNode, NodeKind::SwitchCase>
{
public:
  gsl::span<Expr *> heads;  ///< Constant case expressions, in order
  bool hasDefault = false;  ///< Group contains a `default:` label
  gsl::span<Stmt *> body;

  explicit SwitchCase(SourceRange r = {}) : NodeBase(r) {}
};

/// `on T catch (e, st) { ... }`
class CatchClause : public NodeBase<CatchClause, AstNode, NodeKind::CatchClause>
{
public:
  const Type * exceptionType = nullptr;  ///< `on` type, nullptr for a bare catch
  VariableDecl * exception = nullptr;
  VariableDecl * stackTrace = nullptr;
  BlockStmt * body = nullptr;

  explicit CatchClause(SourceRange r = {}) : NodeBase(r) {}
};

// ============================================================================
// Expression Nodes
// ============================================================================

/// `null`
class NullLiteralExpr : public NodeBase<NullLiteralExpr, Expr, NodeKind::NullLiteral>
{
public:
  explicit NullLiteralExpr(SourceRange r = {}) : NodeBase(r) {}
};

/// `true` / `false`
class BoolLiteralExpr : public NodeBase<BoolLiteralExpr, Expr, NodeKind::BoolLiteral>
{
public:
  bool value;

  explicit BoolLiteralExpr(bool v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// Integer literal.
class IntLiteralExpr : public NodeBase<IntLiteralExpr, Expr, NodeKind::IntLiteral>
{
public:
  int64_t value;

  explicit IntLiteralExpr(int64_t v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// String literal.
class StringLiteralExpr : public NodeBase<StringLiteralExpr, Expr, NodeKind::StringLiteral>
{
public:
  std::string_view value;

  explicit StringLiteralExpr(std::string_view v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// Read of a local variable or parameter.
class VarRefExpr : public NodeBase<VarRefExpr, Expr, NodeKind::VarRef>
{
public:
  std::string_view name;
  const VariableDecl * variable = nullptr;  ///< Resolved declaration

  explicit VarRefExpr(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}

  VarRefExpr(const VariableDecl * v, SourceRange r = {}) : NodeBase(r), name(v->name), variable(v)
  {
  }
};

/// `x = e` / `x ??= e` on a local variable.
class AssignExpr : public NodeBase<AssignExpr, Expr, NodeKind::AssignExpr>
{
public:
  std::string_view name;
  const VariableDecl * variable = nullptr;  ///< Resolved assignment target
  AssignOp op;
  Expr * value;

  AssignExpr(const VariableDecl * v, AssignOp o, Expr * val, SourceRange r = {})
  : NodeBase(r), name(v != nullptr ? v->name : std::string_view{}), variable(v), op(o), value(val)
  {
  }
};

/// Binary expression, including `&&`, `||` and `??`.
class BinaryExpr : public NodeBase<BinaryExpr, Expr, NodeKind::BinaryExpr>
{
public:
  Expr * lhs;
  BinaryOp op;
  Expr * rhs;

  BinaryExpr(Expr * l, BinaryOp o, Expr * r, SourceRange range = {})
  : NodeBase(range), lhs(l), op(o), rhs(r)
  {
  }
};

/// Unary expression.
class UnaryExpr : public NodeBase<UnaryExpr, Expr, NodeKind::UnaryExpr>
{
public:
  UnaryOp op;
  Expr * operand;

  UnaryExpr(UnaryOp o, Expr * e, SourceRange r = {}) : NodeBase(r), op(o), operand(e) {}
};

/// `c ? a : b`
class ConditionalExpr : public NodeBase<ConditionalExpr, Expr, NodeKind::ConditionalExpr>
{
public:
  Expr * condition;
  Expr * thenExpr;
  Expr * elseExpr;

  ConditionalExpr(Expr * c, Expr * t, Expr * e, SourceRange r = {})
  : NodeBase(r), condition(c), thenExpr(t), elseExpr(e)
  {
  }
};

/// `e is T` / `e is! T`
class IsExpr : public NodeBase<IsExpr, Expr, NodeKind::IsExpr>
{
public:
  Expr * expr;
  const Type * testedType;
  bool negated;

  IsExpr(Expr * e, const Type * t, bool neg, SourceRange r = {})
  : NodeBase(r), expr(e), testedType(t), negated(neg)
  {
  }
};

/// `e as T`
class AsExpr : public NodeBase<AsExpr, Expr, NodeKind::AsExpr>
{
public:
  Expr * expr;
  const Type * targetType;

  AsExpr(Expr * e, const Type * t, SourceRange r = {}) : NodeBase(r), expr(e), targetType(t) {}
};

/// `e!`
class NullCheckExpr : public NodeBase<NullCheckExpr, Expr, NodeKind::NullCheckExpr>
{
public:
  Expr * expr;

  explicit NullCheckExpr(Expr * e, SourceRange r = {}) : NodeBase(r), expr(e) {}
};

/// `throw e`
class ThrowExpr : public NodeBase<ThrowExpr, Expr, NodeKind::ThrowExpr>
{
public:
  Expr * expr;

  explicit ThrowExpr(Expr * e, SourceRange r = {}) : NodeBase(r), expr(e) {}
};

/**
 * Invocation: `name(args)`, `target.name(args)` or `callee(args)` where
 * callee is an expression (e.g. a local closure).
 */
class CallExpr : public NodeBase<CallExpr, Expr, NodeKind::CallExpr>
{
public:
  std::string_view name;
  Expr * target = nullptr;  ///< Receiver or callee expression, nullptr for a top-level function
  gsl::span<Expr *> args;

  explicit CallExpr(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// `target.name`
class PropertyGetExpr : public NodeBase<PropertyGetExpr, Expr, NodeKind::PropertyGetExpr>
{
public:
  Expr * target;
  std::string_view name;

  PropertyGetExpr(Expr * t, std::string_view n, SourceRange r = {})
  : NodeBase(r), target(t), name(n)
  {
  }
};

/// Closure: `(params) { body }` or `(params) => expr`.
class FunctionExpr : public NodeBase<FunctionExpr, Expr, NodeKind::FunctionExpr>
{
public:
  gsl::span<VariableDecl *> params;
  const Type * returnType = nullptr;
  FunctionBodyKind bodyKind = FunctionBodyKind::Sync;
  BlockStmt * body = nullptr;
  Expr * exprBody = nullptr;

  explicit FunctionExpr(SourceRange r = {}) : NodeBase(r) {}
};

// ============================================================================
// Statement Nodes
// ============================================================================

/// `{ ... }`
class BlockStmt : public NodeBase<BlockStmt, Stmt, NodeKind::BlockStmt>
{
public:
  gsl::span<Stmt *> stmts;

  explicit BlockStmt(SourceRange r = {}) : NodeBase(r) {}
  explicit BlockStmt(gsl::span<Stmt *> s, SourceRange r = {}) : NodeBase(r), stmts(s) {}
};

/// `e;`
class ExprStmt : public NodeBase<ExprStmt, Stmt, NodeKind::ExprStmt>
{
public:
  Expr * expr;

  explicit ExprStmt(Expr * e, SourceRange r = {}) : NodeBase(r), expr(e) {}
};

/// `var a = 1, b;`
class VarDeclStmt : public NodeBase<VarDeclStmt, Stmt, NodeKind::VarDeclStmt>
{
public:
  gsl::span<VariableDecl *> vars;

  explicit VarDeclStmt(gsl::span<VariableDecl *> v, SourceRange r = {}) : NodeBase(r), vars(v) {}
};

/// `if (c) s1 else s2`
class IfStmt : public NodeBase<IfStmt, Stmt, NodeKind::IfStmt>
{
public:
  Expr * condition;
  Stmt * thenBranch;
  Stmt * elseBranch = nullptr;

  IfStmt(Expr * c, Stmt * t, Stmt * e = nullptr, SourceRange r = {})
  : NodeBase(r), condition(c), thenBranch(t), elseBranch(e)
  {
  }
};

/// `while (c) s`
class WhileStmt : public NodeBase<WhileStmt, Stmt, NodeKind::WhileStmt>
{
public:
  Expr * condition = nullptr;
  Stmt * body = nullptr;

  explicit WhileStmt(SourceRange r = {}) : NodeBase(r) {}
};

/// `do s while (c);`
class DoWhileStmt : public NodeBase<DoWhileStmt, Stmt, NodeKind::DoWhileStmt>
{
public:
  Stmt * body = nullptr;
  Expr * condition = nullptr;

  explicit DoWhileStmt(SourceRange r = {}) : NodeBase(r) {}
};

/// `for (init; cond; updaters) s`
class ForStmt : public NodeBase<ForStmt, Stmt, NodeKind::ForStmt>
{
public:
  Stmt * init = nullptr;         ///< VarDeclStmt or ExprStmt, optional
  Expr * condition = nullptr;    ///< nullptr means `true`
  gsl::span<Expr *> updaters;
  Stmt * body = nullptr;

  explicit ForStmt(SourceRange r = {}) : NodeBase(r) {}
};

/// `break;` / `break label;`
class BreakStmt : public NodeBase<BreakStmt, Stmt, NodeKind::BreakStmt>
{
public:
  std::string_view label;
  const Stmt * target = nullptr;  ///< Resolved loop, switch or labeled statement

  explicit BreakStmt(SourceRange r = {}) : NodeBase(r) {}
};

/// `continue;` / `continue label;`
class ContinueStmt : public NodeBase<ContinueStmt, Stmt, NodeKind::ContinueStmt>
{
public:
  std::string_view label;
  const Stmt * target = nullptr;  ///< Resolved loop

  explicit ContinueStmt(SourceRange r = {}) : NodeBase(r) {}
};

/// `return;` / `return e;`
class ReturnStmt : public NodeBase<ReturnStmt, Stmt, NodeKind::ReturnStmt>
{
public:
  Expr * value = nullptr;

  explicit ReturnStmt(Expr * v = nullptr, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// `yield e;` / `yield* e;`
class YieldStmt : public NodeBase<YieldStmt, Stmt, NodeKind::YieldStmt>
{
public:
  Expr * value;
  bool isStar = false;

  explicit YieldStmt(Expr * v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// `switch (e) { case ...: ... }`
class SwitchStmt : public NodeBase<SwitchStmt, Stmt, NodeKind::SwitchStmt>
{
public:
  Expr * scrutinee = nullptr;
  gsl::span<SwitchCase *> cases;
  bool isExhaustive = false;  ///< Decided by the exhaustiveness checker

  explicit SwitchStmt(SourceRange r = {}) : NodeBase(r) {}
};

/// `label: s`
class LabeledStmt : public NodeBase<LabeledStmt, Stmt, NodeKind::LabeledStmt>
{
public:
  std::string_view label;
  Stmt * body = nullptr;

  explicit LabeledStmt(std::string_view l, SourceRange r = {}) : NodeBase(r), label(l) {}
};

/// `try { } on T catch (e) { } finally { }`
class TryStmt : public NodeBase<TryStmt, Stmt, NodeKind::TryStmt>
{
public:
  BlockStmt * body = nullptr;
  gsl::span<CatchClause *> catches;
  BlockStmt * finallyBlock = nullptr;

  explicit TryStmt(SourceRange r = {}) : NodeBase(r) {}
};

// ============================================================================
// Declaration Nodes
// ============================================================================

/// Top-level function or method body to analyze.
class FunctionDecl : public NodeBase<FunctionDecl, Decl, NodeKind::FunctionDecl>
{
public:
  std::string_view name;
  gsl::span<VariableDecl *> params;
  const Type * returnType = nullptr;  ///< nullptr means dynamic
  FunctionBodyKind bodyKind = FunctionBodyKind::Sync;
  BlockStmt * body = nullptr;
  Expr * exprBody = nullptr;  ///< `=> e`

  explicit FunctionDecl(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

// ============================================================================
// CompilationUnit (Root Node)
// ============================================================================

class CompilationUnit : public NodeBase<CompilationUnit, AstNode, NodeKind::CompilationUnit>
{
public:
  gsl::span<FunctionDecl *> functions;

  explicit CompilationUnit(SourceRange r = {}) : NodeBase(r) {}
};

// ============================================================================
// Helper Functions
// ============================================================================

[[nodiscard]] inline SourceRange get_range(const AstNode * node) noexcept
{
  return node ? node->get_range() : SourceRange{};
}

}  // namespace flowan

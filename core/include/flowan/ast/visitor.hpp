// flowan/ast/visitor.hpp - CRTP visitors for AST traversal
//
// AstVisitor dispatches on NodeKind without virtual calls.
// RecursiveAstVisitor walks all children in source order.
//
#pragma once

#include <type_traits>

#include "flowan/ast/ast.hpp"
#include "flowan/ast/ast_enums.hpp"
#include "flowan/basic/casting.hpp"

namespace flowan
{

namespace detail
{

/// Propagate the constness of NodePtrT to a derived node pointer
template <typename NodePtrT, typename DerivedNode>
struct PropagateConst
{
  using type = std::conditional_t<
    std::is_const_v<std::remove_pointer_t<NodePtrT>>, const DerivedNode *, DerivedNode *>;
};

template <typename NodePtrT, typename DerivedNode>
using propagate_const_t = typename PropagateConst<NodePtrT, DerivedNode>::type;

}  // namespace detail

// ============================================================================
// AstVisitor - CRTP Base Class
// ============================================================================

/**
 * CRTP visitor. The derived class overrides `visit_<snake_name>` for the
 * nodes it cares about; unhandled nodes fall back to visit_expr /
 * visit_stmt / visit_decl and finally visit_node.
 *
 * @code
 *   class Counter : public ConstAstVisitor<Counter> {
 *   public:
 *     int reads = 0;
 *     void visit_var_ref_expr(const VarRefExpr *) { ++reads; }
 *   };
 * @endcode
 */
template <typename Derived, typename ReturnType = void, typename NodePtrT = AstNode *>
class AstVisitor
{
public:
  using node_ptr_type = NodePtrT;

  [[nodiscard]] Derived & get_derived() { return static_cast<Derived &>(*this); }
  [[nodiscard]] const Derived & get_derived() const { return static_cast<const Derived &>(*this); }

  /// Dispatch to the visit method for node's kind. A null node yields ReturnType().
  ReturnType visit(NodePtrT node)
  {
    if (!node) {
      return ReturnType();
    }

    switch (node->kind) {
#define FLOWAN_VISIT_CASE(Class, Kind, Snake) \
  case NodeKind::Kind:                        \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_EXPR(Class, Kind, Snake) FLOWAN_VISIT_CASE(Class, Kind, Snake)
#define AST_NODE_STMT(Class, Kind, Snake) FLOWAN_VISIT_CASE(Class, Kind, Snake)
#define AST_NODE_DECL(Class, Kind, Snake) FLOWAN_VISIT_CASE(Class, Kind, Snake)
#define AST_NODE_SUPPORT(Class, Kind, Snake) FLOWAN_VISIT_CASE(Class, Kind, Snake)
#define AST_NODE_TOP(Class, Kind, Snake) FLOWAN_VISIT_CASE(Class, Kind, Snake)
#include "flowan/ast/ast_nodes.def"
#undef FLOWAN_VISIT_CASE
    }

    return ReturnType();
  }

#define AST_NODE_EXPR(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_expr(node);                                  \
  }
#include "flowan/ast/ast_nodes.def"

#define AST_NODE_STMT(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_stmt(node);                                  \
  }
#include "flowan/ast/ast_nodes.def"

#define AST_NODE_DECL(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_decl(node);                                  \
  }
#include "flowan/ast/ast_nodes.def"

#define AST_NODE_SUPPORT(Class, Kind, Snake)                                \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#define AST_NODE_TOP(Class, Kind, Snake)                                    \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#include "flowan/ast/ast_nodes.def"

  ReturnType visit_expr(detail::propagate_const_t<NodePtrT, Expr> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_stmt(detail::propagate_const_t<NodePtrT, Stmt> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_decl(detail::propagate_const_t<NodePtrT, Decl> node)
  {
    return get_derived().visit_node(node);
  }

  ReturnType visit_node(NodePtrT /*node*/) { return ReturnType(); }
};

template <typename Derived, typename ReturnType = void>
using ConstAstVisitor = AstVisitor<Derived, ReturnType, const AstNode *>;

// ============================================================================
// RecursiveAstVisitor - Traverses children automatically
// ============================================================================

/**
 * Visitor that descends into every child in evaluation order.
 *
 * Override a visit method to observe a node; call the base method to keep
 * descending or skip it to prune the subtree. Returning false stops the
 * whole traversal. Optional children are skipped when null.
 */
template <typename Derived, typename NodePtrT = AstNode *>
class RecursiveAstVisitor : public AstVisitor<Derived, bool, NodePtrT>
{
  using Base = AstVisitor<Derived, bool, NodePtrT>;

public:
  using Base::get_derived;

  template <typename T>
  using NodePtr = detail::propagate_const_t<NodePtrT, T>;

  /// Visit an optional child; absent children do not stop traversal.
  bool traverse(NodePtrT node) { return node == nullptr || get_derived().visit(node); }

  template <typename Range>
  bool traverse_all(const Range & nodes)
  {
    for (auto * n : nodes) {
      if (!traverse(n)) return false;
    }
    return true;
  }

  // Expressions

  bool visit_assign_expr(NodePtr<AssignExpr> node) { return traverse(node->value); }

  bool visit_binary_expr(NodePtr<BinaryExpr> node)
  {
    return traverse(node->lhs) && traverse(node->rhs);
  }

  bool visit_unary_expr(NodePtr<UnaryExpr> node) { return traverse(node->operand); }

  bool visit_conditional_expr(NodePtr<ConditionalExpr> node)
  {
    return traverse(node->condition) && traverse(node->thenExpr) && traverse(node->elseExpr);
  }

  bool visit_is_expr(NodePtr<IsExpr> node) { return traverse(node->expr); }
  bool visit_as_expr(NodePtr<AsExpr> node) { return traverse(node->expr); }
  bool visit_null_check_expr(NodePtr<NullCheckExpr> node) { return traverse(node->expr); }
  bool visit_throw_expr(NodePtr<ThrowExpr> node) { return traverse(node->expr); }

  bool visit_call_expr(NodePtr<CallExpr> node)
  {
    return traverse(node->target) && traverse_all(node->args);
  }

  bool visit_property_get_expr(NodePtr<PropertyGetExpr> node) { return traverse(node->target); }

  bool visit_function_expr(NodePtr<FunctionExpr> node)
  {
    return traverse_all(node->params) && traverse(node->body) && traverse(node->exprBody);
  }

  // Statements

  bool visit_block_stmt(NodePtr<BlockStmt> node) { return traverse_all(node->stmts); }
  bool visit_expr_stmt(NodePtr<ExprStmt> node) { return traverse(node->expr); }
  bool visit_var_decl_stmt(NodePtr<VarDeclStmt> node) { return traverse_all(node->vars); }

  bool visit_if_stmt(NodePtr<IfStmt> node)
  {
    return traverse(node->condition) && traverse(node->thenBranch) && traverse(node->elseBranch);
  }

  bool visit_while_stmt(NodePtr<WhileStmt> node)
  {
    return traverse(node->condition) && traverse(node->body);
  }

  bool visit_do_while_stmt(NodePtr<DoWhileStmt> node)
  {
    return traverse(node->body) && traverse(node->condition);
  }

  bool visit_for_stmt(NodePtr<ForStmt> node)
  {
    return traverse(node->init) && traverse(node->condition) && traverse(node->body) &&
           traverse_all(node->updaters);
  }

  bool visit_return_stmt(NodePtr<ReturnStmt> node) { return traverse(node->value); }
  bool visit_yield_stmt(NodePtr<YieldStmt> node) { return traverse(node->value); }

  bool visit_switch_stmt(NodePtr<SwitchStmt> node)
  {
    return traverse(node->scrutinee) && traverse_all(node->cases);
  }

  bool visit_labeled_stmt(NodePtr<LabeledStmt> node) { return traverse(node->body); }

  bool visit_try_stmt(NodePtr<TryStmt> node)
  {
    return traverse(node->body) && traverse_all(node->catches) && traverse(node->finallyBlock);
  }

  // Declarations and supporting nodes

  bool visit_function_decl(NodePtr<FunctionDecl> node)
  {
    return traverse_all(node->params) && traverse(node->body) && traverse(node->exprBody);
  }

  bool visit_variable_decl(NodePtr<VariableDecl> node) { return traverse(node->initializer); }

  bool visit_switch_case(NodePtr<SwitchCase> node)
  {
    return traverse_all(node->heads) && traverse_all(node->body);
  }

  bool visit_catch_clause(NodePtr<CatchClause> node)
  {
    return traverse(node->exception) && traverse(node->stackTrace) && traverse(node->body);
  }

  bool visit_compilation_unit(NodePtr<CompilationUnit> node)
  {
    return traverse_all(node->functions);
  }

  // Leaves
  bool visit_null_literal_expr(NodePtr<NullLiteralExpr> /*node*/) { return true; }
  bool visit_bool_literal_expr(NodePtr<BoolLiteralExpr> /*node*/) { return true; }
  bool visit_int_literal_expr(NodePtr<IntLiteralExpr> /*node*/) { return true; }
  bool visit_string_literal_expr(NodePtr<StringLiteralExpr> /*node*/) { return true; }
  bool visit_var_ref_expr(NodePtr<VarRefExpr> /*node*/) { return true; }
  bool visit_break_stmt(NodePtr<BreakStmt> /*node*/) { return true; }
  bool visit_continue_stmt(NodePtr<ContinueStmt> /*node*/) { return true; }
};

template <typename Derived>
using ConstRecursiveAstVisitor = RecursiveAstVisitor<Derived, const AstNode *>;

}  // namespace flowan

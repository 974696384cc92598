// flowan/ast/ast_enums.hpp - AST enumeration definitions
//
// Node kinds, operators and function body kinds.
//
#pragma once

#include <cstdint>
#include <string_view>

namespace flowan
{

// ============================================================================
// NodeKind - Identifies all AST node types
// ============================================================================

/**
 * Node kind enumeration for LLVM-style RTTI.
 * Nodes are grouped by category for range-based classof checks.
 * Generated from ast_nodes.def.
 */
enum class NodeKind : uint8_t {
// === Expressions ===
#define AST_NODE_EXPR(Class, Kind, Snake) Kind,
#include "flowan/ast/ast_nodes.def"

// === Statements ===
#define AST_NODE_STMT(Class, Kind, Snake) Kind,
#include "flowan/ast/ast_nodes.def"

// === Declarations ===
#define AST_NODE_DECL(Class, Kind, Snake) Kind,
#include "flowan/ast/ast_nodes.def"

// === Supporting nodes ===
#define AST_NODE_SUPPORT(Class, Kind, Snake) Kind,
#include "flowan/ast/ast_nodes.def"

// === Top-level ===
#define AST_NODE_TOP(Class, Kind, Snake) Kind,
#include "flowan/ast/ast_nodes.def"
};

// ============================================================================
// Operators
// ============================================================================

/**
 * Binary operators.
 *
 * Equality operators get dedicated flow rules when one side is `null`;
 * the remaining non-logical operators are ordinary method invocations.
 */
enum class BinaryOp : uint8_t {
  // Arithmetic
  Add,  ///< +
  Sub,  ///< -
  Mul,  ///< *
  Div,  ///< /
  Mod,  ///< %
  // Comparison
  Eq,  ///< ==
  Ne,  ///< !=
  Lt,  ///< <
  Le,  ///< <=
  Gt,  ///< >
  Ge,  ///< >=
  // Short-circuit
  And,     ///< &&
  Or,      ///< ||
  IfNull,  ///< ??
};

enum class UnaryOp : uint8_t {
  Not,  ///< !
  Neg,  ///< -
};

enum class AssignOp : uint8_t {
  Assign,        ///< =
  IfNullAssign,  ///< ??=
};

/**
 * Synchronous/asynchronous and generator flavour of a function body.
 */
enum class FunctionBodyKind : uint8_t {
  Sync,       ///< { ... } or => e
  Async,      ///< async
  SyncStar,   ///< sync*
  AsyncStar,  ///< async*
};

// ============================================================================
// to_string() / from_string() Helpers
// ============================================================================

[[nodiscard]] constexpr std::string_view to_string(BinaryOp op) noexcept
{
  switch (op) {
    case BinaryOp::Add:
      return "+";
    case BinaryOp::Sub:
      return "-";
    case BinaryOp::Mul:
      return "*";
    case BinaryOp::Div:
      return "/";
    case BinaryOp::Mod:
      return "%";
    case BinaryOp::Eq:
      return "==";
    case BinaryOp::Ne:
      return "!=";
    case BinaryOp::Lt:
      return "<";
    case BinaryOp::Le:
      return "<=";
    case BinaryOp::Gt:
      return ">";
    case BinaryOp::Ge:
      return ">=";
    case BinaryOp::And:
      return "&&";
    case BinaryOp::Or:
      return "||";
    case BinaryOp::IfNull:
      return "??";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(UnaryOp op) noexcept
{
  switch (op) {
    case UnaryOp::Not:
      return "!";
    case UnaryOp::Neg:
      return "-";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(AssignOp op) noexcept
{
  switch (op) {
    case AssignOp::Assign:
      return "=";
    case AssignOp::IfNullAssign:
      return "??=";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(FunctionBodyKind kind) noexcept
{
  switch (kind) {
    case FunctionBodyKind::Sync:
      return "sync";
    case FunctionBodyKind::Async:
      return "async";
    case FunctionBodyKind::SyncStar:
      return "sync*";
    case FunctionBodyKind::AsyncStar:
      return "async*";
  }
  return "";
}

[[nodiscard]] constexpr bool is_generator(FunctionBodyKind kind) noexcept
{
  return kind == FunctionBodyKind::SyncStar || kind == FunctionBodyKind::AsyncStar;
}

/// Snake-case node name, as used in JSON dumps
[[nodiscard]] constexpr std::string_view to_string(NodeKind kind) noexcept
{
  switch (kind) {
#define FLOWAN_KIND_NAME(Class, Kind, Snake) \
  case NodeKind::Kind:                       \
    return #Snake;
#define AST_NODE_EXPR(Class, Kind, Snake) FLOWAN_KIND_NAME(Class, Kind, Snake)
#define AST_NODE_STMT(Class, Kind, Snake) FLOWAN_KIND_NAME(Class, Kind, Snake)
#define AST_NODE_DECL(Class, Kind, Snake) FLOWAN_KIND_NAME(Class, Kind, Snake)
#define AST_NODE_SUPPORT(Class, Kind, Snake) FLOWAN_KIND_NAME(Class, Kind, Snake)
#define AST_NODE_TOP(Class, Kind, Snake) FLOWAN_KIND_NAME(Class, Kind, Snake)
#include "flowan/ast/ast_nodes.def"
#undef FLOWAN_KIND_NAME
  }
  return "";
}

// ============================================================================
// NodeKind Range Helpers
// ============================================================================

namespace detail
{

inline constexpr NodeKind k_first_expr_kind = NodeKind::NullLiteral;
inline constexpr NodeKind k_last_expr_kind = NodeKind::FunctionExpr;

inline constexpr NodeKind k_first_stmt_kind = NodeKind::BlockStmt;
inline constexpr NodeKind k_last_stmt_kind = NodeKind::TryStmt;

inline constexpr NodeKind k_first_decl_kind = NodeKind::FunctionDecl;
inline constexpr NodeKind k_last_decl_kind = NodeKind::FunctionDecl;

}  // namespace detail

/// Check if a NodeKind is an expression
[[nodiscard]] constexpr bool is_expr_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_expr_kind && kind <= detail::k_last_expr_kind;
}

/// Check if a NodeKind is a statement
[[nodiscard]] constexpr bool is_stmt_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_stmt_kind && kind <= detail::k_last_stmt_kind;
}

/// Check if a NodeKind is a declaration
[[nodiscard]] constexpr bool is_decl_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_decl_kind && kind <= detail::k_last_decl_kind;
}

}  // namespace flowan

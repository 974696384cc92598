// flowan/ast/json_reader.hpp - Build resolved function bodies from JSON
//
// The JSON unit format is the tool's input language: a list of class
// declarations (for the subtype oracle) and functions whose bodies are
// statement and expression trees. The reader resolves variable names
// against lexical scopes and `break`/`continue` against their targets, so
// the produced AST is ready for flow analysis.
//
// Example:
//   {
//     "classes": [{"name": "B", "supertypes": ["A"]}],
//     "functions": [{
//       "name": "f", "return_type": "int",
//       "params": [{"name": "x", "type": "int?"}],
//       "body": {"kind": "block", "statements": [
//         {"kind": "if",
//          "condition": {"kind": "binary", "op": "==",
//                        "lhs": {"kind": "var", "name": "x"}, "rhs": {"kind": "null"}},
//          "then": {"kind": "return", "value": {"kind": "int", "value": 0}}},
//         {"kind": "return", "value": {"kind": "var", "name": "x"}}]}
//     }]
//   }
//
#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "flowan/ast/ast.hpp"
#include "flowan/ast/ast_context.hpp"
#include "flowan/basic/diagnostic.hpp"
#include "flowan/sema/types/subtype_oracle.hpp"
#include "flowan/sema/types/type_utils.hpp"

namespace flowan
{

// ============================================================================
// Load Result
// ============================================================================

struct UnitLoadResult
{
  /// Built unit (only valid if success == true)
  CompilationUnit * unit = nullptr;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  /// `"source"` entry of the document: the program text the ranges refer to
  std::string source_path;

  static UnitLoadResult ok(CompilationUnit * u, std::string source)
  {
    UnitLoadResult r;
    r.unit = u;
    r.success = true;
    r.source_path = std::move(source);
    return r;
  }

  static UnitLoadResult fail(std::string msg)
  {
    UnitLoadResult r;
    r.error = std::move(msg);
    return r;
  }
};

// ============================================================================
// Reader
// ============================================================================

/**
 * Converts a JSON document into a CompilationUnit.
 *
 * Structural problems are reported as diagnostics (I001-I004) and the
 * reader substitutes a placeholder, so one bad node does not hide the
 * problems in the rest of the document.
 */
class JsonUnitReader
{
public:
  JsonUnitReader(
    AstContext & ast, TypeContext & types, ClassHierarchy & classes, DiagnosticBag & diags);

  /**
   * Build a unit from a parsed document.
   *
   * @return nullptr when the document is not an object
   */
  CompilationUnit * read(const nlohmann::json & doc);

private:
  struct JumpEntry
  {
    Stmt * stmt = nullptr;
    std::string_view label;       ///< Label of a LabeledStmt entry
    std::string_view loop_label;  ///< Label written directly before a loop
    bool is_loop = false;
    bool is_switch = false;
  };

  using Scope = std::unordered_map<std::string_view, VariableDecl *>;

  // Declarations
  void read_class(const nlohmann::json & j);
  FunctionDecl * read_function(const nlohmann::json & j);
  FunctionExpr * read_closure(const nlohmann::json & j);
  gsl::span<VariableDecl *> read_params(const nlohmann::json & j);
  void read_type_parameters(const nlohmann::json & j);
  VariableDecl * read_variable(const nlohmann::json & j);

  // Statements
  Stmt * read_stmt(const nlohmann::json & j);
  BlockStmt * read_block(const nlohmann::json & j);
  gsl::span<Stmt *> read_stmt_list(const nlohmann::json & j);
  Stmt * read_var_decl(const nlohmann::json & j);
  Stmt * read_loop(const nlohmann::json & j, std::string_view kind, std::string_view label);
  Stmt * read_jump(const nlohmann::json & j, bool is_break);
  Stmt * read_switch(const nlohmann::json & j);
  Stmt * read_labeled(const nlohmann::json & j);
  Stmt * read_try(const nlohmann::json & j);

  // Expressions
  Expr * read_expr(const nlohmann::json & j);
  Expr * read_expr_kind(const nlohmann::json & j, std::string_view kind);
  gsl::span<Expr *> read_expr_list(const nlohmann::json & j);
  Expr * placeholder_expr(SourceRange range);

  // Helpers
  const Type * read_type(const nlohmann::json & j, const char * key);
  const Type * parse_type_text(std::string_view text, SourceRange range);
  std::string_view str(const nlohmann::json & j, const char * key);
  bool flag(const nlohmann::json & j, const char * key);
  static SourceRange range_of(const nlohmann::json & j);

  void push_scope() { scopes_.emplace_back(); }
  void pop_scope() { scopes_.pop_back(); }
  void define(VariableDecl * var);
  VariableDecl * lookup(std::string_view name) const;

  void malformed(const nlohmann::json & j, const std::string & message);

  AstContext & ast_;
  TypeContext & types_;
  ClassHierarchy & classes_;
  DiagnosticBag & diags_;

  std::vector<Scope> scopes_;
  std::vector<JumpEntry> targets_;
  TypeParameterScope type_params_;
};

// ============================================================================
// Loading API
// ============================================================================

/// Parse @p text and build a unit. Invalid JSON is a load failure.
[[nodiscard]] UnitLoadResult load_unit_text(
  std::string_view text, AstContext & ast, TypeContext & types, ClassHierarchy & classes,
  DiagnosticBag & diags);

/**
 * Read and build a unit from a file. A relative `"source"` entry is
 * resolved against the file's directory.
 */
[[nodiscard]] UnitLoadResult load_unit_file(
  const std::filesystem::path & path, AstContext & ast, TypeContext & types,
  ClassHierarchy & classes, DiagnosticBag & diags);

}  // namespace flowan

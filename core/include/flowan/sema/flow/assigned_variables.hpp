// flowan/sema/flow/assigned_variables.hpp - Pre-pass assignment index
//
// Pass 1 of flow analysis. For every statement, closure and catch clause
// it records which local variables are assigned inside it and which are
// assigned from within a nested closure (write-captured). Pass 2 reads the
// index to build conservative models at loop heads, closures and catch
// clauses without iterating to a fixed point.
//
#pragma once

#include <set>
#include <unordered_map>

#include "flowan/ast/ast.hpp"

namespace flowan
{

/// Set of local variables; ordering is irrelevant to analysis results
using VariableSet = std::set<const VariableDecl *>;

class AssignedVariables
{
public:
  /// Build the index for a function body rooted at @p root.
  [[nodiscard]] static AssignedVariables compute(const AstNode & root);

  /// Variables assigned anywhere inside @p node (closures included)
  [[nodiscard]] const VariableSet & written(const AstNode * node) const;

  /// Variables assigned inside a closure within @p node and declared outside that closure
  [[nodiscard]] const VariableSet & captured(const AstNode * node) const;

  [[nodiscard]] bool is_assigned(const AstNode * node, const VariableDecl * var) const
  {
    return written(node).count(var) != 0;
  }

  [[nodiscard]] bool is_captured(const AstNode * node, const VariableDecl * var) const
  {
    return captured(node).count(var) != 0;
  }

  /// Everything written in the analyzed body
  [[nodiscard]] const VariableSet & written_anywhere() const noexcept { return anywhere_written_; }

  /// Everything write-captured in the analyzed body
  [[nodiscard]] const VariableSet & captured_anywhere() const noexcept
  {
    return anywhere_captured_;
  }

private:
  friend class AssignedVariablesBuilder;

  std::unordered_map<const AstNode *, VariableSet> written_;
  std::unordered_map<const AstNode *, VariableSet> captured_;
  VariableSet anywhere_written_;
  VariableSet anywhere_captured_;
};

}  // namespace flowan

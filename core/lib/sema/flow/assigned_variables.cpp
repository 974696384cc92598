// flowan/sema/flow/assigned_variables.cpp - Pre-pass assignment index
#include "flowan/sema/flow/assigned_variables.hpp"

#include <unordered_map>
#include <vector>

#include "flowan/ast/visitor.hpp"

namespace flowan
{

namespace
{

const VariableSet & empty_set()
{
  static const VariableSet k_empty;
  return k_empty;
}

/// Nodes the flow analyzer asks the index about
bool is_tracked(const AstNode * node)
{
  return isa<Stmt>(node) || isa<FunctionExpr>(node) || isa<FunctionDecl>(node) ||
         isa<CatchClause>(node) || isa<SwitchCase>(node);
}

}  // namespace

// ============================================================================
// Builder
// ============================================================================

class AssignedVariablesBuilder : public ConstRecursiveAstVisitor<AssignedVariablesBuilder>
{
  using Base = ConstRecursiveAstVisitor<AssignedVariablesBuilder>;

public:
  explicit AssignedVariablesBuilder(AssignedVariables & out) : out_(out) {}

  /// Wraps dispatch so every tracked node gets a frame while its subtree is walked
  bool visit(const AstNode * node)
  {
    if (node == nullptr) return true;
    const bool tracked = is_tracked(node);
    if (tracked) {
      frames_.push_back(Frame{node, isa<FunctionExpr>(node)});
      if (frames_.back().is_closure) ++closure_level_;
    }
    const bool result = Base::visit(node);
    if (tracked) {
      if (frames_.back().is_closure) --closure_level_;
      frames_.pop_back();
    }
    return result;
  }

  bool visit_variable_decl(const VariableDecl * node)
  {
    decl_level_[node] = closure_level_;
    return Base::visit_variable_decl(node);
  }

  bool visit_assign_expr(const AssignExpr * node)
  {
    if (node->variable != nullptr) {
      record_write(node->variable);
    }
    return Base::visit_assign_expr(node);
  }

private:
  struct Frame
  {
    const AstNode * node;
    bool is_closure;
  };

  void record_write(const VariableDecl * var)
  {
    for (const auto & frame : frames_) {
      out_.written_[frame.node].insert(var);
    }
    out_.anywhere_written_.insert(var);

    auto it = decl_level_.find(var);
    const int declared_at = it != decl_level_.end() ? it->second : 0;
    if (declared_at >= closure_level_) {
      return;
    }

    // Captured by the innermost closure, hence by every node enclosing it.
    size_t innermost = frames_.size();
    for (size_t i = frames_.size(); i-- > 0;) {
      if (frames_[i].is_closure) {
        innermost = i;
        break;
      }
    }
    for (size_t i = 0; i <= innermost && i < frames_.size(); ++i) {
      out_.captured_[frames_[i].node].insert(var);
    }
    out_.anywhere_captured_.insert(var);
  }

  AssignedVariables & out_;
  std::vector<Frame> frames_;
  std::unordered_map<const VariableDecl *, int> decl_level_;
  int closure_level_ = 0;
};

// ============================================================================
// AssignedVariables
// ============================================================================

AssignedVariables AssignedVariables::compute(const AstNode & root)
{
  AssignedVariables result;
  AssignedVariablesBuilder builder(result);
  builder.visit(&root);
  return result;
}

const VariableSet & AssignedVariables::written(const AstNode * node) const
{
  auto it = written_.find(node);
  return it != written_.end() ? it->second : empty_set();
}

const VariableSet & AssignedVariables::captured(const AstNode * node) const
{
  auto it = captured_.find(node);
  return it != captured_.end() ? it->second : empty_set();
}

}  // namespace flowan

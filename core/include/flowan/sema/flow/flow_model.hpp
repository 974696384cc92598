// flowan/sema/flow/flow_model.hpp - Flow knowledge at one program point
//
// A FlowModel pairs a reachability stack with the Variable Models of the
// variables in scope. The stack has one entry per open control-flow split;
// the bottom entry is reachability from function entry. Keeping inner
// entries separate lets promotions be computed inside code that is dead
// only because of an outer construct.
//
#pragma once

#include <map>
#include <vector>

#include "flowan/ast/ast.hpp"
#include "flowan/sema/flow/assigned_variables.hpp"
#include "flowan/sema/flow/flow_options.hpp"
#include "flowan/sema/flow/variable_model.hpp"
#include "flowan/sema/types/type_operations.hpp"

namespace flowan
{

class FlowModel
{
public:
  using VariableMap = std::map<const VariableDecl *, VariableModel>;

  /// Function entry: `reachable = [true]`, no variables
  [[nodiscard]] static FlowModel entry();

  // ===========================================================================
  // Reachability
  // ===========================================================================

  /// Reachable from function entry: every stack entry is true
  [[nodiscard]] bool is_reachable() const noexcept;

  /// Reachable from the innermost open split
  [[nodiscard]] bool is_locally_reachable() const noexcept
  {
    return !reachable_.empty() && reachable_.back();
  }

  [[nodiscard]] size_t depth() const noexcept { return reachable_.size(); }
  [[nodiscard]] const std::vector<bool> & reachability() const noexcept { return reachable_; }

  /// Open a split: push `true`
  [[nodiscard]] FlowModel split() const;

  /// Close a split: pop the top and AND it into the new top
  [[nodiscard]] FlowModel drop() const;

  /// Drop until @p target_depth entries remain
  [[nodiscard]] FlowModel unsplit_to(size_t target_depth) const;

  /// Control cannot continue: top becomes false
  [[nodiscard]] FlowModel exit() const;

  // ===========================================================================
  // Variables
  // ===========================================================================

  [[nodiscard]] const VariableMap & variables() const noexcept { return variables_; }

  /// Model of @p var, nullptr when it is not in scope here
  [[nodiscard]] const VariableModel * lookup(const VariableDecl * var) const;

  [[nodiscard]] FlowModel with_variable(const VariableDecl * var, VariableModel model) const;
  [[nodiscard]] FlowModel without_variable(const VariableDecl * var) const;

  /// `var = value` with a value of @p written_type; no-op for unknown variables
  [[nodiscard]] FlowModel assign(
    const TypeOperations & ops, const FlowOptions & options, const VariableDecl * var,
    const Type * written_type) const;

  /**
   * Entry model for code that may run after arbitrary writes: variables in
   * @p written lose their promotions and definite unassignment, variables
   * in @p captured become write-captured.
   */
  [[nodiscard]] FlowModel conservative_join(
    const VariableSet & written, const VariableSet & captured) const;

  // ===========================================================================
  // Lattice
  // ===========================================================================

  /**
   * Join of two models at the same depth.
   *
   * When exactly one side is locally reachable it wins outright; otherwise
   * the top is OR-ed and the variables are joined key-wise over the keys
   * both sides share.
   */
  [[nodiscard]] static FlowModel join(const FlowModel & a, const FlowModel & b);

  /// drop(join(a, b)): the merge point that closes a split
  [[nodiscard]] static FlowModel merge(const FlowModel & a, const FlowModel & b);

  /**
   * Model after `try { ... } finally { ... }`.
   *
   * @param after_try_catch Model after the body and catch clauses
   * @param after_finally Model at the end of the finally block
   * @param written_in_finally Variables the finally block assigns
   */
  [[nodiscard]] static FlowModel attach_finally(
    const TypeOperations & ops, const FlowModel & after_try_catch,
    const FlowModel & after_finally, const VariableSet & written_in_finally);

  bool operator==(const FlowModel & other) const
  {
    return reachable_ == other.reachable_ && variables_ == other.variables_;
  }
  bool operator!=(const FlowModel & other) const { return !(*this == other); }

private:
  std::vector<bool> reachable_;
  VariableMap variables_;
};

}  // namespace flowan

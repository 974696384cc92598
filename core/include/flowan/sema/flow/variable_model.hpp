// flowan/sema/flow/variable_model.hpp - Per-variable flow knowledge
//
#pragma once

#include <vector>

#include "flowan/sema/flow/flow_options.hpp"
#include "flowan/sema/types/type.hpp"
#include "flowan/sema/types/type_operations.hpp"

namespace flowan
{

/**
 * What is known about one local variable at one program point.
 *
 * Values are immutable in practice: every operation returns a new model.
 *
 * Invariants:
 * - each entry of `promoted_types` is a strict subtype of every earlier
 *   entry and of `declared_type`
 * - `tested_types` is sorted by Type::id without duplicates
 * - `assigned` and `unassigned` are never both true
 * - a write-captured variable has no promotions and no tested types
 */
struct VariableModel
{
  const Type * declared_type = nullptr;
  std::vector<const Type *> promoted_types;
  std::vector<const Type *> tested_types;
  bool assigned = false;
  bool unassigned = true;
  bool write_captured = false;
  bool implicitly_typed = false;  ///< `var x;` with neither type nor initializer

  /// Model for a variable entering scope
  [[nodiscard]] static VariableModel fresh(
    const Type * declared, bool initialized, bool implicitly_typed = false);

  /// Last promotion, or the declared type
  [[nodiscard]] const Type * current_type() const noexcept
  {
    return promoted_types.empty() ? declared_type : promoted_types.back();
  }

  [[nodiscard]] bool is_promoted() const noexcept { return !promoted_types.empty(); }

  [[nodiscard]] bool is_tested(const Type * type) const;

  // ===========================================================================
  // Transitions
  // ===========================================================================

  /// Record @p type as a type of interest
  [[nodiscard]] VariableModel with_tested(const Type * type) const;

  /**
   * Promotion by a type test against @p tested (`x is T`, `x != null`).
   *
   * Promotes to @p tested, or to `X & tested` when the current type is a
   * type parameter X whose bound admits it, provided the target is a
   * strict subtype of the current type. Otherwise returns *this.
   */
  [[nodiscard]] VariableModel try_promote(const TypeOperations & ops, const Type * tested) const;

  /// Effect of `x = e` where e has type @p written_type
  [[nodiscard]] VariableModel write(
    const TypeOperations & ops, const FlowOptions & options, const Type * written_type) const;

  /// Loop head / catch entry for a variable that may be written in between
  [[nodiscard]] VariableModel discard_promotions_and_mark_not_unassigned() const;

  /// Variable assigned by a closure: promotion is no longer sound
  [[nodiscard]] VariableModel write_capture() const;

  /// Lattice join of two models of the same variable
  [[nodiscard]] static VariableModel join(const VariableModel & a, const VariableModel & b);

  bool operator==(const VariableModel & other) const;
  bool operator!=(const VariableModel & other) const { return !(*this == other); }

private:
  [[nodiscard]] const Type * choose_type_of_interest(
    const TypeOperations & ops, const Type * written_type, const Type * current) const;
};

}  // namespace flowan

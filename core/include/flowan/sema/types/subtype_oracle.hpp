// flowan/sema/types/subtype_oracle.hpp - Reference null-safe subtype relation
//
// Used by the command-line tool and by tests. Embedders with a full type
// system supply their own TypeOperations instead.
//
#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "flowan/sema/types/type.hpp"
#include "flowan/sema/types/type_operations.hpp"

namespace flowan
{

// ============================================================================
// Class Hierarchy
// ============================================================================

/**
 * Declared direct supertypes of interface types, by class name.
 *
 * Supertypes are recorded as written; class type parameters are not
 * substituted. A class with no entry extends Object.
 */
class ClassHierarchy
{
public:
  /// Hierarchy with num/int/double/String/bool/Future already declared
  static ClassHierarchy with_core_library(TypeContext & types);

  void declare(std::string_view name, std::vector<const Type *> supertypes);

  [[nodiscard]] bool is_declared(std::string_view name) const;

  /// Direct supertypes (empty for undeclared classes)
  [[nodiscard]] const std::vector<const Type *> & supertypes_of(std::string_view name) const;

private:
  std::unordered_map<std::string, std::vector<const Type *>> supertypes_;
};

// ============================================================================
// Subtype Oracle
// ============================================================================

/**
 * TypeOperations over TypeContext types and a ClassHierarchy, following
 * the null-safety subtype rules: top and bottom types, Null, nullable and
 * legacy types, FutureOr, type parameters with intersections, interface
 * types with covariant arguments and function types.
 */
class SubtypeOracle : public TypeOperations
{
public:
  SubtypeOracle(TypeContext & types, const ClassHierarchy & classes);

  [[nodiscard]] TypeContext & types() const override { return types_; }

  [[nodiscard]] bool is_subtype_of(const Type * sub, const Type * super) const override;

  [[nodiscard]] const Type * promote_to_non_null(const Type * type) const override;

private:
  [[nodiscard]] bool is_interface_subtype(const Type * sub, const Type * super, int depth) const;

  TypeContext & types_;
  const ClassHierarchy & classes_;
};

}  // namespace flowan

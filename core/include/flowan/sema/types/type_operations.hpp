// flowan/sema/types/type_operations.hpp - Type queries consumed by flow analysis
//
// Flow analysis never decides subtyping itself. It asks an implementation
// of TypeOperations, which the embedding type system provides.
//
#pragma once

#include "flowan/sema/types/type.hpp"

namespace flowan
{

/**
 * Subtype oracle used by the promotion policy.
 *
 * Implementations must be deterministic and side-effect free for the
 * duration of an analysis run.
 */
class TypeOperations
{
public:
  virtual ~TypeOperations() = default;

  /// The context that interned every type handed to this oracle
  [[nodiscard]] virtual TypeContext & types() const = 0;

  /// Whether @p sub is a subtype of @p super
  [[nodiscard]] virtual bool is_subtype_of(const Type * sub, const Type * super) const = 0;

  /// NonNull(T): the type of a T value known not to be null
  [[nodiscard]] virtual const Type * promote_to_non_null(const Type * type) const = 0;

  /// Whether a value of @p type may be null (Null <: type)
  [[nodiscard]] bool is_nullable(const Type * type) const
  {
    return is_subtype_of(types().null_type(), type);
  }

  /// Strict narrowing: sub <: super and not super <: sub
  [[nodiscard]] bool is_strict_subtype_of(const Type * sub, const Type * super) const
  {
    return is_subtype_of(sub, super) && !is_subtype_of(super, sub);
  }
};

}  // namespace flowan

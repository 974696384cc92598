// flowan/sema/types/subtype_oracle.cpp - Reference subtype relation
//
#include "flowan/sema/types/subtype_oracle.hpp"

namespace flowan
{

namespace
{

/// Guards the supertype walk against cyclic declarations
constexpr int k_max_hierarchy_depth = 64;

}  // namespace

// ============================================================================
// ClassHierarchy
// ============================================================================

ClassHierarchy ClassHierarchy::with_core_library(TypeContext & types)
{
  ClassHierarchy h;
  h.declare("num", {types.object_type()});
  h.declare("int", {types.num_type()});
  h.declare("double", {types.num_type()});
  h.declare("String", {types.object_type()});
  h.declare("bool", {types.object_type()});
  h.declare("Future", {types.object_type()});
  return h;
}

void ClassHierarchy::declare(std::string_view name, std::vector<const Type *> supertypes)
{
  supertypes_[std::string(name)] = std::move(supertypes);
}

bool ClassHierarchy::is_declared(std::string_view name) const
{
  return supertypes_.find(std::string(name)) != supertypes_.end();
}

const std::vector<const Type *> & ClassHierarchy::supertypes_of(std::string_view name) const
{
  static const std::vector<const Type *> k_none;
  const auto it = supertypes_.find(std::string(name));
  return it == supertypes_.end() ? k_none : it->second;
}

// ============================================================================
// SubtypeOracle
// ============================================================================

SubtypeOracle::SubtypeOracle(TypeContext & types, const ClassHierarchy & classes)
: types_(types), classes_(classes)
{
}

bool SubtypeOracle::is_subtype_of(const Type * sub, const Type * super) const
{
  if (sub == super) return true;
  if (sub == nullptr || super == nullptr) return false;
  if (sub->is_invalid() || super->is_invalid()) return true;

  if (super->is_top()) return true;
  if (sub->is_never()) return true;

  if (sub->kind == TypeKind::Legacy) return is_subtype_of(sub->inner, super);
  if (super->kind == TypeKind::Legacy) {
    return is_subtype_of(sub, types_.nullable_type(super->inner));
  }

  // Right Object: everything non-nullable
  if (super->kind == TypeKind::Object) {
    switch (sub->kind) {
      case TypeKind::Null:
      case TypeKind::Nullable:
      case TypeKind::Dynamic:
      case TypeKind::Void:
        return false;
      case TypeKind::TypeParameter:
        return is_subtype_of(sub->inner, super);
      case TypeKind::PromotedTypeParameter:
        return is_subtype_of(sub->inner, super) || is_subtype_of(sub->promoted, super);
      case TypeKind::FutureOr:
        return is_subtype_of(sub->inner, super);
      default:
        return true;
    }
  }

  // Left Null
  if (sub->kind == TypeKind::Null) {
    if (super->kind == TypeKind::Nullable) return true;
    if (super->kind == TypeKind::FutureOr) return is_subtype_of(sub, super->inner);
    return false;
  }

  // Left FutureOr<S0>: Future<S0> <: T and S0 <: T
  if (sub->kind == TypeKind::FutureOr) {
    return is_subtype_of(types_.future_type(sub->inner), super) &&
           is_subtype_of(sub->inner, super);
  }

  // Left S0?: S0 <: T and Null <: T
  if (sub->kind == TypeKind::Nullable) {
    return is_subtype_of(sub->inner, super) && is_subtype_of(types_.null_type(), super);
  }

  // Right FutureOr<T0>
  if (super->kind == TypeKind::FutureOr) {
    if (is_subtype_of(sub, types_.future_type(super->inner))) return true;
    if (is_subtype_of(sub, super->inner)) return true;
    if (!sub->is_type_parameter()) return false;
  }

  // Right T0?
  if (super->kind == TypeKind::Nullable) {
    if (is_subtype_of(sub, super->inner)) return true;
    if (!sub->is_type_parameter()) return false;
  }

  // Left X & S1
  if (sub->kind == TypeKind::PromotedTypeParameter) {
    return is_subtype_of(sub->inner, super) || is_subtype_of(sub->promoted, super);
  }

  // Right X & T1: S <: X and S <: T1
  if (super->kind == TypeKind::PromotedTypeParameter) {
    return is_subtype_of(sub, super->inner) && is_subtype_of(sub, super->promoted);
  }

  // Left type parameter: through its bound
  if (sub->kind == TypeKind::TypeParameter) {
    return is_subtype_of(sub->inner, super);
  }

  if (super->kind == TypeKind::TypeParameter) return false;

  // Functions
  if (sub->kind == TypeKind::Function) {
    if (super->kind == TypeKind::Interface) {
      return super->name == "Function" && super->args.empty();
    }
    if (super->kind != TypeKind::Function) return false;
    if (sub->args.size() != super->args.size()) return false;
    for (size_t i = 0; i < sub->args.size(); ++i) {
      if (!is_subtype_of(super->args[i], sub->args[i])) return false;
    }
    return is_subtype_of(sub->inner, super->inner);
  }

  if (sub->kind == TypeKind::Interface && super->kind == TypeKind::Interface) {
    return is_interface_subtype(sub, super, 0);
  }

  // Left Object, dynamic or void against anything narrower than top
  return false;
}

bool SubtypeOracle::is_interface_subtype(const Type * sub, const Type * super, int depth) const
{
  if (depth > k_max_hierarchy_depth) return false;

  if (sub->name == super->name) {
    // A raw reference matches any instantiation
    if (sub->args.size() != super->args.size()) return sub->args.empty() || super->args.empty();
    for (size_t i = 0; i < sub->args.size(); ++i) {
      if (!is_subtype_of(sub->args[i], super->args[i])) return false;
    }
    return true;
  }

  for (const Type * parent : classes_.supertypes_of(sub->name)) {
    if (parent == nullptr || parent->kind != TypeKind::Interface) continue;
    if (is_interface_subtype(parent, super, depth + 1)) return true;
  }
  return false;
}

const Type * SubtypeOracle::promote_to_non_null(const Type * type) const
{
  if (type == nullptr) return nullptr;

  switch (type->kind) {
    case TypeKind::Null:
      return types_.never_type();
    case TypeKind::Nullable:
    case TypeKind::Legacy:
      return promote_to_non_null(type->inner);
    case TypeKind::FutureOr:
      return types_.future_or_type(promote_to_non_null(type->inner));
    case TypeKind::TypeParameter:
      if (is_nullable(type->inner)) {
        return types_.promoted_type_parameter(type, promote_to_non_null(type->inner));
      }
      return type;
    case TypeKind::PromotedTypeParameter:
      return types_.promoted_type_parameter(type->inner, promote_to_non_null(type->promoted));
    default:
      return type;
  }
}

}  // namespace flowan

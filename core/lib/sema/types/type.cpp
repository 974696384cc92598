// flowan/sema/types/type.cpp - TypeContext implementation
//
#include "flowan/sema/types/type.hpp"

namespace flowan
{

TypeContext::TypeContext()
{
  never_ = &make(TypeKind::Never);
  null_ = &make(TypeKind::Null);
  dynamic_ = &make(TypeKind::Dynamic);
  void_ = &make(TypeKind::Void);
  object_ = &make(TypeKind::Object);
  invalid_ = &make(TypeKind::Invalid);

  Type & nullable_object = make(TypeKind::Nullable);
  nullable_object.inner = object_;
  nullable_object_ = &nullable_object;

  num_ = interface_type("num");
  int_ = interface_type("int");
  double_ = interface_type("double");
  bool_ = interface_type("bool");
  string_ = interface_type("String");
}

Type & TypeContext::make(TypeKind kind)
{
  types_.push_back(Type{kind});
  Type & t = types_.back();
  t.id = static_cast<uint32_t>(types_.size() - 1);
  return t;
}

std::string_view TypeContext::intern_name(std::string_view name)
{
  return *names_.emplace(name).first;
}

const Type * TypeContext::find_or_create(const Type & shape)
{
  for (const auto & t : types_) {
    if (
      t.kind == shape.kind && t.name == shape.name && t.inner == shape.inner &&
      t.promoted == shape.promoted && t.args == shape.args) {
      return &t;
    }
  }

  Type & created = make(shape.kind);
  created.name = shape.name;
  created.inner = shape.inner;
  created.promoted = shape.promoted;
  created.args = shape.args;
  return &created;
}

// ============================================================================
// Composite Types
// ============================================================================

const Type * TypeContext::interface_type(
  std::string_view name, const std::vector<const Type *> & args)
{
  Type shape{TypeKind::Interface};
  shape.name = intern_name(name);
  shape.args = args;
  return find_or_create(shape);
}

const Type * TypeContext::function_type(
  const Type * return_type, const std::vector<const Type *> & params)
{
  Type shape{TypeKind::Function};
  shape.inner = return_type;
  shape.args = params;
  return find_or_create(shape);
}

const Type * TypeContext::type_parameter(std::string_view name, const Type * bound)
{
  Type shape{TypeKind::TypeParameter};
  shape.name = intern_name(name);
  shape.inner = bound != nullptr ? bound : nullable_object_;
  return find_or_create(shape);
}

const Type * TypeContext::promoted_type_parameter(
  const Type * parameter, const Type * promoted_bound)
{
  // X & S over an already promoted X & T narrows the same parameter
  if (parameter->kind == TypeKind::PromotedTypeParameter) {
    parameter = parameter->inner;
  }
  Type shape{TypeKind::PromotedTypeParameter};
  shape.name = parameter->name;
  shape.inner = parameter;
  shape.promoted = promoted_bound;
  return find_or_create(shape);
}

const Type * TypeContext::nullable_type(const Type * base)
{
  switch (base->kind) {
    case TypeKind::Nullable:
    case TypeKind::Null:
    case TypeKind::Dynamic:
    case TypeKind::Void:
    case TypeKind::Invalid:
      return base;
    case TypeKind::Never:
      return null_;
    case TypeKind::Legacy:
      return nullable_type(base->inner);
    default:
      break;
  }
  Type shape{TypeKind::Nullable};
  shape.inner = base;
  return find_or_create(shape);
}

const Type * TypeContext::legacy_type(const Type * base)
{
  switch (base->kind) {
    case TypeKind::Legacy:
    case TypeKind::Nullable:
    case TypeKind::Null:
    case TypeKind::Dynamic:
    case TypeKind::Void:
    case TypeKind::Invalid:
      return base;
    default:
      break;
  }
  Type shape{TypeKind::Legacy};
  shape.inner = base;
  return find_or_create(shape);
}

const Type * TypeContext::future_type(const Type * value_type)
{
  return interface_type("Future", {value_type});
}

const Type * TypeContext::future_or_type(const Type * value_type)
{
  Type shape{TypeKind::FutureOr};
  shape.inner = value_type;
  return find_or_create(shape);
}

// ============================================================================
// Deconstructors
// ============================================================================

const Type * TypeContext::future_argument(const Type * type) noexcept
{
  if (type == nullptr || type->kind != TypeKind::Interface) return nullptr;
  if (type->name != "Future" || type->args.size() != 1) return nullptr;
  return type->args.front();
}

const Type * TypeContext::future_or_argument(const Type * type) noexcept
{
  if (type == nullptr || type->kind != TypeKind::FutureOr) return nullptr;
  return type->inner;
}

const Type * TypeContext::future_value_type(const Type * declared_return) const noexcept
{
  if (declared_return == nullptr) return dynamic_;

  if (declared_return->kind == TypeKind::Nullable) {
    return future_value_type(declared_return->inner);
  }
  if (const Type * arg = future_argument(declared_return)) return arg;
  if (const Type * arg = future_or_argument(declared_return)) return arg;

  switch (declared_return->kind) {
    case TypeKind::Void:
    case TypeKind::Dynamic:
    case TypeKind::Invalid:
      return declared_return;
    default:
      return nullable_object_;
  }
}

}  // namespace flowan

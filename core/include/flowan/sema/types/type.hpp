// flowan/sema/types/type.hpp - Semantic type representation
//
// Closed tagged representation of the null-safe type language the flow
// analysis reasons about. Types are interned by TypeContext, so two types
// are equal exactly when their pointers are equal.
//
#pragma once

#include <cstdint>
#include <deque>
#include <memory_resource>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace flowan
{

// ============================================================================
// Type Kind
// ============================================================================

/**
 * Kind of semantic type.
 */
enum class TypeKind : uint8_t {
  Interface,              ///< C<T1, ..., Tn> (Future<T> included)
  Function,               ///< R Function(P1, ..., Pn)
  TypeParameter,          ///< X with a bound
  PromotedTypeParameter,  ///< X & S
  Nullable,               ///< T?
  Legacy,                 ///< T* (pre-null-safety)
  FutureOr,               ///< FutureOr<T>

  // Sentinels
  Never,
  Null,
  Dynamic,
  Void,
  Object,

  Invalid,  ///< Error recovery placeholder
};

// ============================================================================
// Type
// ============================================================================

/**
 * Semantic type.
 *
 * Field use by kind:
 * - Interface: name, args
 * - Function: inner (return type), args (parameter types)
 * - TypeParameter: name, inner (bound)
 * - PromotedTypeParameter: inner (the TypeParameter), promoted (the bound S)
 * - Nullable / Legacy / FutureOr: inner
 */
struct Type
{
  TypeKind kind;

  /// Creation index inside the owning TypeContext; gives a run-independent order
  uint32_t id = 0;

  std::string_view name;
  const Type * inner = nullptr;
  const Type * promoted = nullptr;
  std::vector<const Type *> args;

  [[nodiscard]] bool is_interface() const noexcept { return kind == TypeKind::Interface; }
  [[nodiscard]] bool is_nullable() const noexcept { return kind == TypeKind::Nullable; }
  [[nodiscard]] bool is_never() const noexcept { return kind == TypeKind::Never; }
  [[nodiscard]] bool is_null() const noexcept { return kind == TypeKind::Null; }
  [[nodiscard]] bool is_dynamic() const noexcept { return kind == TypeKind::Dynamic; }
  [[nodiscard]] bool is_invalid() const noexcept { return kind == TypeKind::Invalid; }

  [[nodiscard]] bool is_type_parameter() const noexcept
  {
    return kind == TypeKind::TypeParameter || kind == TypeKind::PromotedTypeParameter;
  }

  /// dynamic, void and Object? accept every value
  [[nodiscard]] bool is_top() const noexcept
  {
    return kind == TypeKind::Dynamic || kind == TypeKind::Void ||
           (kind == TypeKind::Nullable && inner != nullptr && inner->kind == TypeKind::Object);
  }
};

/// Orders types by creation id
struct TypeIdLess
{
  bool operator()(const Type * a, const Type * b) const noexcept { return a->id < b->id; }
};

// ============================================================================
// Type Context
// ============================================================================

/**
 * Owns and interns semantic types.
 *
 * Sentinels are created eagerly; composite types are created on demand
 * and normalized (for instance `T??` is `T?` and `Never?` is `Null`).
 */
class TypeContext
{
public:
  TypeContext();

  TypeContext(const TypeContext &) = delete;
  TypeContext & operator=(const TypeContext &) = delete;

  // ===========================================================================
  // Sentinels
  // ===========================================================================

  [[nodiscard]] const Type * never_type() const noexcept { return never_; }
  [[nodiscard]] const Type * null_type() const noexcept { return null_; }
  [[nodiscard]] const Type * dynamic_type() const noexcept { return dynamic_; }
  [[nodiscard]] const Type * void_type() const noexcept { return void_; }
  [[nodiscard]] const Type * object_type() const noexcept { return object_; }
  [[nodiscard]] const Type * nullable_object_type() const noexcept { return nullable_object_; }
  [[nodiscard]] const Type * invalid_type() const noexcept { return invalid_; }

  // Core library interfaces used for literal types
  [[nodiscard]] const Type * bool_type() const noexcept { return bool_; }
  [[nodiscard]] const Type * int_type() const noexcept { return int_; }
  [[nodiscard]] const Type * num_type() const noexcept { return num_; }
  [[nodiscard]] const Type * double_type() const noexcept { return double_; }
  [[nodiscard]] const Type * string_type() const noexcept { return string_; }

  // ===========================================================================
  // Composite Types (Interned)
  // ===========================================================================

  const Type * interface_type(std::string_view name, const std::vector<const Type *> & args = {});
  const Type * function_type(const Type * return_type, const std::vector<const Type *> & params);
  const Type * type_parameter(std::string_view name, const Type * bound);
  const Type * promoted_type_parameter(const Type * parameter, const Type * promoted_bound);
  const Type * nullable_type(const Type * base);
  const Type * legacy_type(const Type * base);
  const Type * future_type(const Type * value_type);
  const Type * future_or_type(const Type * value_type);

  // ===========================================================================
  // Deconstructors
  // ===========================================================================

  /// T for Future<T>, nullptr otherwise
  [[nodiscard]] static const Type * future_argument(const Type * type) noexcept;

  /// T for FutureOr<T>, nullptr otherwise
  [[nodiscard]] static const Type * future_or_argument(const Type * type) noexcept;

  /// The value type an async body's `return` must produce for @p declared_return
  [[nodiscard]] const Type * future_value_type(const Type * declared_return) const noexcept;

  /// Number of interned types (sentinels included)
  [[nodiscard]] size_t size() const noexcept { return types_.size(); }

private:
  Type & make(TypeKind kind);
  std::string_view intern_name(std::string_view name);
  const Type * find_or_create(const Type & shape);

  std::pmr::monotonic_buffer_resource arena_{4096};
  // Pointers to interned types are handed out widely; the container must
  // keep element addresses stable.
  std::pmr::deque<Type> types_{&arena_};
  std::unordered_set<std::string> names_;

  const Type * never_ = nullptr;
  const Type * null_ = nullptr;
  const Type * dynamic_ = nullptr;
  const Type * void_ = nullptr;
  const Type * object_ = nullptr;
  const Type * nullable_object_ = nullptr;
  const Type * invalid_ = nullptr;
  const Type * bool_ = nullptr;
  const Type * int_ = nullptr;
  const Type * num_ = nullptr;
  const Type * double_ = nullptr;
  const Type * string_ = nullptr;
};

}  // namespace flowan

// flowan/basic/casting.hpp - LLVM-style RTTI casting utilities
//
// Shared by the AST node hierarchy and the semantic Type representation.
// Any class hierarchy that provides a static `classof` predicate works.
//
//   if (isa<BinaryExpr>(node)) { ... }
//   auto * bin = cast<BinaryExpr>(node);              // asserts on mismatch
//   if (auto * bin = dyn_cast<BinaryExpr>(node)) { }  // nullptr on mismatch
//
#pragma once

#include <cassert>
#include <type_traits>

namespace flowan
{

namespace detail
{

/// Detects `T::classof(const From *)`
template <typename T, typename From, typename = void>
struct HasClassof : std::false_type
{
};

template <typename T, typename From>
struct HasClassof<T, From, std::void_t<decltype(T::classof(std::declval<const From *>()))>>
: std::true_type
{
};

template <typename T, typename From>
inline constexpr bool has_classof_v = HasClassof<T, From>::value;

}  // namespace detail

// ============================================================================
// isa<T>
// ============================================================================

/**
 * Check whether @p node is a T. A null pointer is never a T.
 */
template <typename T, typename From>
[[nodiscard]] inline bool isa(const From * node) noexcept
{
  static_assert(detail::has_classof_v<T, From>, "Target type must have a classof() static method");
  return node != nullptr && T::classof(node);
}

template <typename T, typename From>
[[nodiscard]] inline bool isa(From * node) noexcept
{
  return isa<T>(static_cast<const From *>(node));
}

// ============================================================================
// cast<T>
// ============================================================================

/**
 * Downcast that the caller has already proven valid.
 *
 * @note Asserts on nullptr or kind mismatch; use dyn_cast when unsure.
 */
template <typename T, typename From>
[[nodiscard]] inline T * cast(From * node) noexcept
{
  assert(node != nullptr && "cast<T>() called with nullptr");
  assert(isa<T>(node) && "Invalid cast");
  return static_cast<T *>(node);
}

template <typename T, typename From>
[[nodiscard]] inline const T * cast(const From * node) noexcept
{
  assert(node != nullptr && "cast<T>() called with nullptr");
  assert(isa<T>(node) && "Invalid cast");
  return static_cast<const T *>(node);
}

// ============================================================================
// dyn_cast<T>
// ============================================================================

/**
 * Checked downcast. Returns nullptr when @p node is null or not a T.
 */
template <typename T, typename From>
[[nodiscard]] inline T * dyn_cast(From * node) noexcept
{
  return isa<T>(node) ? static_cast<T *>(node) : nullptr;
}

template <typename T, typename From>
[[nodiscard]] inline const T * dyn_cast(const From * node) noexcept
{
  return isa<T>(node) ? static_cast<const T *>(node) : nullptr;
}

}  // namespace flowan

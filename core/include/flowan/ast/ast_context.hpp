// flowan/ast/ast_context.hpp - Arena that owns AST nodes and names
//
// Every node of a compilation unit lives in one monotonic arena and is
// released together with the context. Identifiers are interned so the
// string_view fields of nodes stay valid for the context's lifetime.
//
#pragma once

#include <cstddef>
#include <cstring>
#include <gsl/span>
#include <memory>
#include <memory_resource>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

namespace flowan
{

class AstNode;

/**
 * Owner of all nodes, arrays and interned strings of one unit.
 *
 * @code
 *   AstContext ctx;
 *   auto * x = ctx.create<VariableDecl>(ctx.intern("x"));
 *   auto * ref = ctx.create<VarRefExpr>(x);
 * @endcode
 */
class AstContext
{
public:
  static constexpr size_t k_default_buffer_size = size_t{64} * size_t{1024};

  explicit AstContext(size_t initial_buffer_size = k_default_buffer_size)
  : arena_(initial_buffer_size), names_(&arena_)
  {
  }

  ~AstContext() = default;

  AstContext(const AstContext &) = delete;
  AstContext & operator=(const AstContext &) = delete;
  AstContext(AstContext &&) = delete;
  AstContext & operator=(AstContext &&) = delete;

  /**
   * Construct a node of type T in the arena.
   *
   * Nodes are never destroyed individually, so T must be trivially
   * destructible (string_view and gsl::span members only).
   */
  template <typename T, typename... Args>
  T * create(Args &&... args)
  {
    static_assert(std::is_base_of_v<AstNode, T>, "T must derive from AstNode");
    static_assert(
      std::is_trivially_destructible_v<T>,
      "AST nodes live in the arena and must be trivially destructible");

    void * const mem = arena_.allocate(sizeof(T), alignof(T));
    return new (mem) T(std::forward<Args>(args)...);
  }

  /// Intern a string; equal inputs return views of the same storage.
  [[nodiscard]] std::string_view intern(std::string_view s)
  {
    auto it = names_.find(s);
    if (it != names_.end()) {
      return *it;
    }
    char * const ptr = static_cast<char *>(arena_.allocate(s.size() == 0 ? 1 : s.size(), 1));
    std::memcpy(ptr, s.data(), s.size());
    const std::string_view stored(ptr, s.size());
    names_.insert(stored);
    return stored;
  }

  [[nodiscard]] bool is_interned(std::string_view s) const
  {
    return names_.find(s) != names_.end();
  }

  /// Value-initialized array in the arena.
  template <typename T>
  [[nodiscard]] gsl::span<T> allocate_array(size_t size)
  {
    if (size == 0) return {};
    T * const ptr = static_cast<T *>(
      arena_.allocate(sizeof(T) * size, alignof(T)));  // NOLINT(bugprone-sizeof-expression)
    std::uninitialized_value_construct_n(ptr, size);
    return gsl::span<T>(ptr, size);
  }

  /// Copy a builder vector into arena storage.
  template <typename T>
  [[nodiscard]] gsl::span<T> copy_to_arena(const std::vector<T> & vec)
  {
    auto span = allocate_array<T>(vec.size());
    std::copy(vec.begin(), vec.end(), span.begin());
    return span;
  }

  [[nodiscard]] size_t get_string_count() const noexcept { return names_.size(); }

private:
  std::pmr::monotonic_buffer_resource arena_;
  std::pmr::unordered_set<std::string_view> names_;
};

}  // namespace flowan

// neko_ui/ast/ast_context.hpp - AST arena allocator and string pool
//
// AstContext owns every AST node and interned string of one parse. It is
// backed by std::pmr::monotonic_buffer_resource: nodes are never freed
// individually, the whole arena goes away with the context.
//
#pragma once

#include <algorithm>
#include <cstddef>
#include <gsl/span>
#include <memory>
#include <memory_resource>
#include <string_view>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

namespace neko_ui
{

class AstNode;

// ============================================================================
// AstContext - PMR Arena Allocator and String Pool
// ============================================================================

/**
 * Context that owns all AST nodes and interned strings.
 *
 * Everything created here stays valid while the context is alive. Token text
 * views into the source buffer, so the parser interns every string it keeps
 * and the AST outlives any later edit of the source.
 *
 * @code
 *   AstContext ctx;
 *   auto * lit = ctx.create<IntLiteralExpr>(42);
 *   std::string_view name = ctx.intern("width");
 * @endcode
 */
class AstContext
{
public:
  /// Default initial buffer size (16KB); UI documents are small
  static constexpr size_t k_default_buffer_size = size_t{16} * size_t{1024};

  explicit AstContext(size_t initial_buffer_size = k_default_buffer_size)
  : arena_(initial_buffer_size), string_pool_(&arena_)
  {
  }

  ~AstContext() = default;

  // Non-copyable and non-movable (PMR resources are not movable)
  AstContext(const AstContext &) = delete;
  AstContext & operator=(const AstContext &) = delete;
  AstContext(AstContext &&) = delete;
  AstContext & operator=(AstContext &&) = delete;

  // ===========================================================================
  // Node Creation
  // ===========================================================================

  /**
   * Create a new AST node of type T in the arena.
   *
   * @return Non-owning pointer, valid until the context is destroyed
   */
  template <typename T, typename... Args>
  T * create(Args &&... args)
  {
    static_assert(std::is_base_of_v<AstNode, T>, "T must derive from AstNode");
    static_assert(
      std::is_trivially_destructible_v<T>,
      "AST Node must be trivially destructible to be managed by Arena! "
      "Use std::string_view instead of std::string, gsl::span instead of std::vector.");

    void * const mem = arena_.allocate(sizeof(T), alignof(T));
    return new (mem) T(std::forward<Args>(args)...);
  }

  // ===========================================================================
  // Strings and arrays
  // ===========================================================================

  /// Copy `s` into the arena once; equal inputs share storage.
  [[nodiscard]] std::string_view intern(std::string_view s)
  {
    if (s.empty()) {
      return {};
    }
    if (const auto it = string_pool_.find(s); it != string_pool_.end()) {
      return *it;
    }
    auto * const chars = static_cast<char *>(arena_.allocate(s.size(), 1));
    std::copy(s.begin(), s.end(), chars);
    return *string_pool_.emplace(chars, s.size()).first;
  }

  /// Number of distinct interned strings
  [[nodiscard]] size_t interned_count() const noexcept { return string_pool_.size(); }

  /// Arena copy of the parser's scratch vector; node children are spans into it.
  template <typename T>
  [[nodiscard]] gsl::span<T> copy_to_arena(const std::vector<T> & items)
  {
    static_assert(std::is_trivially_copyable_v<T>, "arena arrays hold pointers or PODs");
    if (items.empty()) {
      return {};
    }
    auto * const data = static_cast<T *>(arena_.allocate(sizeof(T) * items.size(), alignof(T)));
    std::uninitialized_copy(items.begin(), items.end(), data);
    return gsl::span<T>(data, items.size());
  }

private:
  std::pmr::monotonic_buffer_resource arena_;
  std::pmr::unordered_set<std::string_view> string_pool_;
};

}  // namespace neko_ui

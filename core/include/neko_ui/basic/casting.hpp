// neko_ui/basic/casting.hpp - Kind-checked downcasts over the AST
//
//   for (const auto * decl : program->decls) {
//     if (const auto * layout = dyn_cast<LayoutDecl>(decl)) { ... }
//   }
//
// Each node class provides `static bool classof(const AstNode *)`.
//
#pragma once

#include <cassert>
#include <type_traits>

namespace neko_ui
{

namespace detail
{

/// `T *` or `const T *`, following the constness of `From`
template <typename T, typename From>
using cast_result_t = std::conditional_t<std::is_const_v<From>, const T *, T *>;

}  // namespace detail

/// True if `node` is non-null and one of the kinds `Ts`.
template <typename... Ts, typename From>
[[nodiscard]] inline bool isa(const From * node) noexcept
{
  static_assert(sizeof...(Ts) > 0, "isa<> needs at least one target kind");
  return node != nullptr && (Ts::classof(node) || ...);
}

/// Downcast a node whose kind the caller has already established.
template <typename T, typename From>
[[nodiscard]] inline detail::cast_result_t<T, From> cast(From * node) noexcept
{
  assert(isa<T>(node) && "cast<T>() on a node of another kind");
  return static_cast<detail::cast_result_t<T, From>>(node);
}

/// Downcast, or nullptr when `node` is null or of another kind.
template <typename T, typename From>
[[nodiscard]] inline detail::cast_result_t<T, From> dyn_cast(From * node) noexcept
{
  return isa<T>(node) ? static_cast<detail::cast_result_t<T, From>>(node) : nullptr;
}

}  // namespace neko_ui

// neko_ui/ast/ast_enums.hpp - AST enumeration definitions
//
// Node kinds are generated from ast_nodes.def and grouped by category so
// classof() checks are simple range tests.
//
#pragma once

#include <cstdint>
#include <string_view>

namespace neko_ui
{

// ============================================================================
// NodeKind - Identifies all AST node types
// ============================================================================

enum class NodeKind : uint8_t {
// === Expressions ===
#define AST_NODE_EXPR(Class, Kind, Snake) Kind,
#include "neko_ui/ast/ast_nodes.def"

// === Declarations ===
#define AST_NODE_DECL(Class, Kind, Snake) Kind,
#include "neko_ui/ast/ast_nodes.def"

// === Supporting nodes ===
#define AST_NODE_SUPPORT(Class, Kind, Snake) Kind,
#include "neko_ui/ast/ast_nodes.def"

// === Top-level ===
#define AST_NODE_TOP(Class, Kind, Snake) Kind,
#include "neko_ui/ast/ast_nodes.def"
};

/// Class name of the node kind, e.g. "LayoutDecl"
[[nodiscard]] constexpr std::string_view to_string(NodeKind kind) noexcept
{
  switch (kind) {
#define AST_NODE_EXPR(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Class;
#define AST_NODE_DECL(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return #Class;
#define AST_NODE_SUPPORT(Class, Kind, Snake) \
  case NodeKind::Kind:                       \
    return #Class;
#define AST_NODE_TOP(Class, Kind, Snake) \
  case NodeKind::Kind:                   \
    return #Class;
#include "neko_ui/ast/ast_nodes.def"
  }
  return "";
}

// ============================================================================
// NodeKind Range Helpers
// ============================================================================

namespace detail
{

inline constexpr NodeKind k_first_expr_kind = NodeKind::StringLiteral;
inline constexpr NodeKind k_last_expr_kind = NodeKind::VarRef;

inline constexpr NodeKind k_first_decl_kind = NodeKind::ImportDecl;
inline constexpr NodeKind k_last_decl_kind = NodeKind::LayoutDecl;

}  // namespace detail

/// Check if a NodeKind is an expression
[[nodiscard]] constexpr bool is_expr_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_expr_kind && kind <= detail::k_last_expr_kind;
}

/// Check if a NodeKind is a declaration
[[nodiscard]] constexpr bool is_decl_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_decl_kind && kind <= detail::k_last_decl_kind;
}

}  // namespace neko_ui

// neko_ui/ast/ast.hpp - AST node class definitions for NekoMaid UI
//
// Nodes follow the LLVM/Clang style: a NodeKind tag plus classof() for
// isa/cast/dyn_cast. All nodes live in an AstContext arena, hold only
// string_views and spans, and are trivially destructible.
//
#pragma once

#include <cstdint>
#include <gsl/span>
#include <string_view>

#include "neko_ui/ast/ast_enums.hpp"
#include "neko_ui/basic/casting.hpp"
#include "neko_ui/basic/source_manager.hpp"

namespace neko_ui
{

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all AST nodes.
 *
 * Every node has a NodeKind for RTTI and a SourceRange. Nodes are
 * non-copyable and managed by AstContext.
 */
class AstNode
{
public:
  const NodeKind kind;
  SourceRange range_;  ///< Byte offsets only. Line/col computed via SourceRegistry.

  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }
  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }

protected:
  explicit AstNode(NodeKind k, SourceRange r = {}) : kind(k), range_(r) {}
  ~AstNode() = default;  // Non-virtual, protected: prevents polymorphic delete
};

// ============================================================================
// CRTP Base for Automatic classof()
// ============================================================================

template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(SourceRange r = {}) : Base(K, r) {}
};

// ============================================================================
// Category Base Classes
// ============================================================================

/// Base class for property values.
class Expr : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_expr_kind(node->kind); }

protected:
  explicit Expr(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

/// Base class for declarations (top level and inside layout blocks).
class Decl : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_decl_kind(node->kind); }

protected:
  explicit Decl(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

// ============================================================================
// Expression Nodes
// ============================================================================

/// String literal; `value` is the interior without delimiters.
class StringLiteralExpr : public NodeBase<StringLiteralExpr, Expr, NodeKind::StringLiteral>
{
public:
  std::string_view value;

  explicit StringLiteralExpr(std::string_view v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

class IntLiteralExpr : public NodeBase<IntLiteralExpr, Expr, NodeKind::IntLiteral>
{
public:
  int64_t value;

  explicit IntLiteralExpr(int64_t v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

class FloatLiteralExpr : public NodeBase<FloatLiteralExpr, Expr, NodeKind::FloatLiteral>
{
public:
  double value;

  explicit FloatLiteralExpr(double v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// `50%`; value is the number as written (50.0).
class PercentLiteralExpr : public NodeBase<PercentLiteralExpr, Expr, NodeKind::PercentLiteral>
{
public:
  double value;

  explicit PercentLiteralExpr(double v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// `100px`
class PixelLiteralExpr : public NodeBase<PixelLiteralExpr, Expr, NodeKind::PixelLiteral>
{
public:
  double value;

  explicit PixelLiteralExpr(double v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

class BoolLiteralExpr : public NodeBase<BoolLiteralExpr, Expr, NodeKind::BoolLiteral>
{
public:
  bool value;

  explicit BoolLiteralExpr(bool v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// Decoded `#rgb[a]` / `#rrggbb[aa]` literal.
class ColorLiteralExpr : public NodeBase<ColorLiteralExpr, Expr, NodeKind::ColorLiteral>
{
public:
  uint8_t r;
  uint8_t g;
  uint8_t b;
  uint8_t a;

  ColorLiteralExpr(uint8_t r_, uint8_t g_, uint8_t b_, uint8_t a_, SourceRange range = {})
  : NodeBase(range), r(r_), g(g_), b(b_), a(a_)
  {
  }
};

/// List literal: [a, b, c]
class ListExpr : public NodeBase<ListExpr, Expr, NodeKind::ListExpr>
{
public:
  gsl::span<Expr *> elements;

  explicit ListExpr(gsl::span<Expr *> elems, SourceRange r = {}) : NodeBase(r), elements(elems) {}
};

class DictEntry;

/// Dict literal: {key: value, ...}; keys are unique.
class DictExpr : public NodeBase<DictExpr, Expr, NodeKind::DictExpr>
{
public:
  gsl::span<DictEntry *> entries;

  explicit DictExpr(gsl::span<DictEntry *> e, SourceRange r = {}) : NodeBase(r), entries(e) {}
};

/// `$name`
class VarRefExpr : public NodeBase<VarRefExpr, Expr, NodeKind::VarRef>
{
public:
  std::string_view name;

  explicit VarRefExpr(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

// ============================================================================
// Supporting Nodes
// ============================================================================

/// One `key: value` pair of a DictExpr.
class DictEntry : public NodeBase<DictEntry, AstNode, NodeKind::DictEntry>
{
public:
  std::string_view key;
  SourceRange keyRange;
  Expr * value;

  DictEntry(std::string_view k, SourceRange kr, Expr * v, SourceRange r = {})
  : NodeBase(r), key(k), keyRange(kr), value(v)
  {
  }
};

/// `name: value;` inside a layout or style block.
class PropertyAssign : public NodeBase<PropertyAssign, AstNode, NodeKind::PropertyAssign>
{
public:
  std::string_view name;
  SourceRange nameRange;
  Expr * value;

  PropertyAssign(std::string_view n, SourceRange nr, Expr * v, SourceRange r = {})
  : NodeBase(r), name(n), nameRange(nr), value(v)
  {
  }
};

/// `class name;` inside a layout block.
class ClassAttr : public NodeBase<ClassAttr, AstNode, NodeKind::ClassAttr>
{
public:
  std::string_view name;

  explicit ClassAttr(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// `widget +required !excluded`, one level of a style selector.
class SelectorStep : public NodeBase<SelectorStep, AstNode, NodeKind::SelectorStep>
{
public:
  std::string_view widget;
  gsl::span<std::string_view> required;
  gsl::span<std::string_view> excluded;

  explicit SelectorStep(std::string_view w, SourceRange r = {}) : NodeBase(r), widget(w) {}
};

/// `with step { ... }` inside a style block; selects descendants.
class NestedStyle : public NodeBase<NestedStyle, AstNode, NodeKind::NestedStyle>
{
public:
  SelectorStep * step;
  gsl::span<AstNode *> body;  ///< PropertyAssign or NestedStyle

  explicit NestedStyle(SelectorStep * s, SourceRange r = {}) : NodeBase(r), step(s) {}
};

// ============================================================================
// Declaration Nodes
// ============================================================================

/// `import "path";`
class ImportDecl : public NodeBase<ImportDecl, Decl, NodeKind::ImportDecl>
{
public:
  std::string_view path;

  explicit ImportDecl(std::string_view p, SourceRange r = {}) : NodeBase(r), path(p) {}
};

/// `var name = value;` at top level or inside a layout block.
class VarDecl : public NodeBase<VarDecl, Decl, NodeKind::VarDecl>
{
public:
  std::string_view name;
  SourceRange nameRange;
  Expr * value;

  VarDecl(std::string_view n, SourceRange nr, Expr * v, SourceRange r = {})
  : NodeBase(r), name(n), nameRange(nr), value(v)
  {
  }
};

/// `style step { ... }`
class StyleDecl : public NodeBase<StyleDecl, Decl, NodeKind::StyleDecl>
{
public:
  SelectorStep * step;
  gsl::span<AstNode *> body;  ///< PropertyAssign or NestedStyle

  explicit StyleDecl(SelectorStep * s, SourceRange r = {}) : NodeBase(r), step(s) {}
};

/// `layout widget;` or `layout widget { ... }` (also `with widget` in a block).
class LayoutDecl : public NodeBase<LayoutDecl, Decl, NodeKind::LayoutDecl>
{
public:
  std::string_view widget;
  SourceRange widgetRange;
  /// PropertyAssign, VarDecl, ClassAttr or LayoutDecl in source order
  gsl::span<AstNode *> body;
  bool hasBlock = false;

  LayoutDecl(std::string_view w, SourceRange wr, SourceRange r = {})
  : NodeBase(r), widget(w), widgetRange(wr)
  {
  }
};

// ============================================================================
// Program (Root Node)
// ============================================================================

class Program : public NodeBase<Program, AstNode, NodeKind::Program>
{
public:
  /// Top-level declarations in source order
  gsl::span<Decl *> decls;

  explicit Program(SourceRange r = {}) : NodeBase(r) {}
};

// ============================================================================
// Helper Functions
// ============================================================================

[[nodiscard]] inline SourceRange get_range(const AstNode * node) noexcept
{
  return node ? node->get_range() : SourceRange{};
}

}  // namespace neko_ui

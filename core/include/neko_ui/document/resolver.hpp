// neko_ui/document/resolver.hpp - Variable resolution and style cascade
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "neko_ui/ast/ast.hpp"
#include "neko_ui/basic/diagnostic.hpp"
#include "neko_ui/document/document.hpp"
#include "neko_ui/document/widget_registry.hpp"
#include "neko_ui/value/value.hpp"

namespace neko_ui
{

// ============================================================================
// ModuleSet
// ============================================================================

/**
 * Already-resolved documents that `import "path";` can refer to, keyed by the
 * path exactly as written in the import.
 */
class ModuleSet
{
public:
  void add(std::string import_path, DocumentPtr document);

  [[nodiscard]] const DocumentPtr * find(std::string_view import_path) const;
  [[nodiscard]] bool contains(std::string_view import_path) const
  {
    return find(import_path) != nullptr;
  }
  [[nodiscard]] size_t size() const noexcept { return modules_.size(); }

private:
  std::unordered_map<std::string, DocumentPtr> modules_;
};

// ============================================================================
// Resolver
// ============================================================================

struct ResolveOptions
{
  /// Accept `class x;` even when no style in scope mentions `x`
  bool allow_undeclared_classes = false;
  /// When set, unknown widgets are errors and defaults start each cascade
  const WidgetRegistry * widgets = nullptr;
  /// Modules available to `import`; without it every import is unknown
  const ModuleSet * modules = nullptr;
};

/**
 * Turns a parsed Program into an immutable Document.
 *
 * Variables live in a stack of scopes (imports, document, then one per
 * layout block). Each node's properties cascade from widget defaults through
 * every matching style guide to the node's own assignments. Resolution keeps
 * going after an error so that all problems are reported, but any error
 * means no Document is produced. The AST is never modified.
 */
class Resolver
{
public:
  Resolver(DiagnosticBag & diags, ResolveOptions options = {});

  /**
   * Resolve a program.
   *
   * @param program Parsed program (must have parsed without errors)
   * @param styles External style sheet, lowest precedence after defaults
   * @return The document, or nullptr with Resolve-phase errors in the bag
   */
  [[nodiscard]] DocumentPtr resolve(const Program * program, const StyleSheet & styles = {});

private:
  using Scope = std::unordered_map<std::string_view, Value>;

  // Scopes
  void push_scope() { scopes_.emplace_back(); }
  void pop_scope() { scopes_.pop_back(); }
  [[nodiscard]] const Value * lookup(std::string_view name) const;
  void bind(const VarDecl * decl);

  // Values
  [[nodiscard]] std::optional<Value> evaluate(const Expr * expr);
  [[nodiscard]] std::optional<PropertyMap> evaluate_properties(gsl::span<AstNode *> body);

  // Declarations
  void resolve_imports(const Program * program, PropertyMap & variables);
  void resolve_style(
    const Selector & parent, const SelectorStep * step, gsl::span<AstNode *> body);
  [[nodiscard]] std::optional<LayoutNode> resolve_layout(const LayoutDecl * layout);

  void check_widget(std::string_view widget, SourceRange range);

  DiagnosticBag & diags_;
  ResolveOptions options_;

  std::vector<Scope> scopes_;
  StyleSheet sheet_;
  std::vector<LayoutNode> imported_roots_;
  std::vector<ClassPathEntry> path_;
  size_t base_errors_ = 0;
};

/// Convert a literal AST value to a Value; `$name` becomes a VariableRef.
[[nodiscard]] Value to_value(const Expr * expr);

}  // namespace neko_ui

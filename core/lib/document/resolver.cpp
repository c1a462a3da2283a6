// neko_ui/document/resolver.cpp - Variable resolution and style cascade
#include "neko_ui/document/resolver.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <utility>

#include "neko_ui/basic/casting.hpp"

namespace neko_ui
{
namespace
{

/// Build a Value from an AST value; `on_ref` decides what `$name` becomes.
template <typename RefFn>
std::optional<Value> build_value(const Expr * expr, RefFn && on_ref)
{
  if (expr == nullptr) {
    return std::nullopt;
  }
  if (const auto * lit = dyn_cast<StringLiteralExpr>(expr)) {
    return Value::make_string(std::string(lit->value));
  }
  if (const auto * lit = dyn_cast<IntLiteralExpr>(expr)) {
    return Value::make_integer(lit->value);
  }
  if (const auto * lit = dyn_cast<FloatLiteralExpr>(expr)) {
    return Value::make_float(lit->value);
  }
  if (const auto * lit = dyn_cast<PercentLiteralExpr>(expr)) {
    return Value::make_percentage(lit->value);
  }
  if (const auto * lit = dyn_cast<PixelLiteralExpr>(expr)) {
    return Value::make_pixels(lit->value);
  }
  if (const auto * lit = dyn_cast<BoolLiteralExpr>(expr)) {
    return Value::make_bool(lit->value);
  }
  if (const auto * lit = dyn_cast<ColorLiteralExpr>(expr)) {
    return Value::make_color(Color{lit->r, lit->g, lit->b, lit->a});
  }
  if (const auto * ref = dyn_cast<VarRefExpr>(expr)) {
    return on_ref(ref);
  }
  if (const auto * list = dyn_cast<ListExpr>(expr)) {
    Value::List elems;
    bool ok = true;
    for (const auto * el : list->elements) {
      auto v = build_value(el, on_ref);
      if (v) {
        elems.push_back(std::move(*v));
      } else {
        ok = false;
      }
    }
    return ok ? std::optional<Value>(Value::make_list(std::move(elems))) : std::nullopt;
  }
  if (const auto * dict = dyn_cast<DictExpr>(expr)) {
    PropertyMap entries;
    bool ok = true;
    for (const auto * entry : dict->entries) {
      auto v = build_value(entry->value, on_ref);
      if (v) {
        entries.insert(entry->key, std::move(*v));
      } else {
        ok = false;
      }
    }
    return ok ? std::optional<Value>(Value::make_dict(std::move(entries))) : std::nullopt;
  }
  return std::nullopt;
}

std::string join_names(const std::vector<std::string> & names)
{
  std::string out;
  for (const auto & name : names) {
    out += out.empty() ? name : ", " + name;
  }
  return out;
}

}  // namespace

Value to_value(const Expr * expr)
{
  auto v = build_value(
    expr, [](const VarRefExpr * ref) { return Value::make_variable_ref(std::string(ref->name)); });
  return v ? std::move(*v) : Value{};
}

// ============================================================================
// ModuleSet
// ============================================================================

void ModuleSet::add(std::string import_path, DocumentPtr document)
{
  modules_[std::move(import_path)] = std::move(document);
}

const DocumentPtr * ModuleSet::find(std::string_view import_path) const
{
  const auto it = modules_.find(std::string(import_path));
  return it != modules_.end() ? &it->second : nullptr;
}

// ============================================================================
// Resolver
// ============================================================================

Resolver::Resolver(DiagnosticBag & diags, ResolveOptions options)
: diags_(diags), options_(options)
{
}

DocumentPtr Resolver::resolve(const Program * program, const StyleSheet & styles)
{
  scopes_.clear();
  sheet_ = styles;
  imported_roots_.clear();
  path_.clear();
  base_errors_ = diags_.error_count();

  if (program == nullptr) {
    diags_.report_error({}, "no program to resolve")
      .with_phase(DiagnosticPhase::Resolve)
      .with_help("the source failed to parse; fix the parse errors first");
    return nullptr;
  }

  PropertyMap variables;

  // Scope 0 holds imported bindings so local declarations override them quietly
  push_scope();
  resolve_imports(program, variables);

  push_scope();
  for (const auto * decl : program->decls) {
    if (const auto * var = dyn_cast<VarDecl>(decl)) {
      bind(var);
      if (const Value * v = lookup(var->name)) {
        variables.set(var->name, *v);
      }
    }
  }

  for (const auto * decl : program->decls) {
    if (const auto * style = dyn_cast<StyleDecl>(decl)) {
      resolve_style(Selector{}, style->step, style->body);
    }
  }

  std::vector<LayoutNode> roots = std::move(imported_roots_);
  imported_roots_.clear();
  for (const auto * decl : program->decls) {
    if (const auto * layout = dyn_cast<LayoutDecl>(decl)) {
      if (auto node = resolve_layout(layout)) {
        roots.push_back(std::move(*node));
      }
    }
  }

  scopes_.clear();

  if (diags_.error_count() > base_errors_) {
    return nullptr;
  }
  return std::make_shared<const Document>(
    std::move(roots), std::move(variables), std::move(sheet_));
}

// ============================================================================
// Scopes
// ============================================================================

const Value * Resolver::lookup(std::string_view name) const
{
  for (auto it = scopes_.rbegin(); it != scopes_.rend(); ++it) {
    if (const auto found = it->find(name); found != it->end()) {
      return &found->second;
    }
  }
  return nullptr;
}

void Resolver::bind(const VarDecl * decl)
{
  auto value = evaluate(decl->value);
  if (!value) {
    return;
  }

  Scope & scope = scopes_.back();
  if (scope.find(decl->name) != scope.end()) {
    diags_
      .report_warning(
        decl->nameRange,
        fmt::format("variable '${}' is redeclared in the same scope; the later binding wins",
                    decl->name),
        "redeclared here")
      .with_code(diag_code::k_redeclared_variable);
  }
  scope[decl->name] = std::move(*value);
}

// ============================================================================
// Values
// ============================================================================

std::optional<Value> Resolver::evaluate(const Expr * expr)
{
  return build_value(expr, [this](const VarRefExpr * ref) -> std::optional<Value> {
    if (const Value * bound = lookup(ref->name)) {
      return *bound;
    }
    diags_
      .report_error(
        ref->get_range(), fmt::format("unresolved variable '${}'", ref->name),
        "not bound in any enclosing scope")
      .with_code(diag_code::k_unresolved_variable);
    return std::nullopt;
  });
}

std::optional<PropertyMap> Resolver::evaluate_properties(gsl::span<AstNode *> body)
{
  PropertyMap out;
  bool ok = true;
  for (const auto * item : body) {
    const auto * prop = dyn_cast<PropertyAssign>(item);
    if (prop == nullptr) {
      continue;
    }
    if (auto v = evaluate(prop->value)) {
      out.set(prop->name, std::move(*v));
    } else {
      ok = false;
    }
  }
  if (!ok) {
    return std::nullopt;
  }
  return out;
}

// ============================================================================
// Declarations
// ============================================================================

void Resolver::resolve_imports(const Program * program, PropertyMap & variables)
{
  for (const auto * decl : program->decls) {
    const auto * imp = dyn_cast<ImportDecl>(decl);
    if (imp == nullptr) {
      continue;
    }

    const DocumentPtr * module =
      options_.modules != nullptr ? options_.modules->find(imp->path) : nullptr;
    if (module == nullptr || *module == nullptr) {
      diags_
        .report_error(
          imp->get_range(), fmt::format("unknown module \"{}\"", imp->path), "imported here")
        .with_code(diag_code::k_unknown_module);
      continue;
    }

    const Document & doc = **module;
    for (const auto & [name, value] : doc.variables()) {
      scopes_.back()[name] = value;
      variables.set(name, value);
    }
    sheet_.append(doc.styles());
    imported_roots_.insert(imported_roots_.end(), doc.roots().begin(), doc.roots().end());
  }
}

void Resolver::check_widget(std::string_view widget, SourceRange range)
{
  if (options_.widgets == nullptr || options_.widgets->contains(widget)) {
    return;
  }
  diags_.report_error(range, fmt::format("unknown widget '{}'", widget), "not a registered widget")
    .with_code(diag_code::k_unknown_widget)
    .with_help(fmt::format("registered widgets: {}", join_names(options_.widgets->names())));
}

void Resolver::resolve_style(
  const Selector & parent, const SelectorStep * step, gsl::span<AstNode *> body)
{
  check_widget(step->widget, step->get_range());

  Selector::Step s;
  s.widget = std::string(step->widget);
  for (const auto cls : step->required) s.required.emplace_back(cls);
  for (const auto cls : step->excluded) s.excluded.emplace_back(cls);
  const Selector selector = parent.descend(std::move(s));

  auto props = evaluate_properties(body);
  if (props) {
    sheet_.add(StyleGuide{selector, std::move(*props)});
  }

  for (const auto * item : body) {
    if (const auto * nested = dyn_cast<NestedStyle>(item)) {
      resolve_style(selector, nested->step, nested->body);
    }
  }
}

std::optional<LayoutNode> Resolver::resolve_layout(const LayoutDecl * layout)
{
  check_widget(layout->widget, layout->widgetRange);

  push_scope();
  for (const auto * item : layout->body) {
    if (const auto * var = dyn_cast<VarDecl>(item)) {
      bind(var);
    }
  }

  std::vector<std::string> classes;
  for (const auto * item : layout->body) {
    const auto * cls = dyn_cast<ClassAttr>(item);
    if (cls == nullptr) {
      continue;
    }
    if (!options_.allow_undeclared_classes && !sheet_.mentions_class(cls->name)) {
      diags_
        .report_error(
          cls->get_range(), fmt::format("undefined style class '{}'", cls->name),
          "no style in scope mentions this class")
        .with_code(diag_code::k_undefined_style)
        .with_help(fmt::format(
          "declare a style such as `style {} +{} {{ ... }}`", layout->widget, cls->name));
    }
    if (std::find(classes.begin(), classes.end(), cls->name) == classes.end()) {
      classes.emplace_back(cls->name);
    }
  }

  auto explicit_props = evaluate_properties(layout->body);

  path_.push_back(ClassPathEntry{layout->widget, &classes});

  PropertyMap effective;
  if (options_.widgets != nullptr) {
    if (const PropertyMap * defaults = options_.widgets->defaults(layout->widget)) {
      effective = *defaults;
    }
  }
  sheet_.apply(path_, effective);
  if (explicit_props) {
    effective.overlay(*explicit_props);
  }

  std::vector<LayoutNode> children;
  for (const auto * item : layout->body) {
    if (const auto * child = dyn_cast<LayoutDecl>(item)) {
      if (auto node = resolve_layout(child)) {
        children.push_back(std::move(*node));
      }
    }
  }

  path_.pop_back();
  pop_scope();

  if (!explicit_props) {
    return std::nullopt;
  }
  return LayoutNode(
    std::string(layout->widget), std::move(classes), std::move(effective), std::move(children));
}

}  // namespace neko_ui

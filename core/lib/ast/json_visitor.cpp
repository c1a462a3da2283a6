// neko_ui/ast/json_visitor.cpp - JSON serialization implementation
//
#include "neko_ui/ast/json_visitor.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

#include "neko_ui/ast/ast.hpp"
#include "neko_ui/basic/casting.hpp"
#include "neko_ui/value/value.hpp"

namespace neko_ui
{
namespace
{

using nlohmann::json;

// ============================================================================
// Helper functions
// ============================================================================

json j_range(SourceRange r)
{
  if (r.is_invalid()) {
    return json{{"start", nullptr}, {"end", nullptr}};
  }
  return json{{"start", r.begin()}, {"end", r.end()}};
}

json j_node_head(const AstNode * n)
{
  return json{{"type", std::string(to_string(n->get_kind()))}, {"range", j_range(n->get_range())}};
}

json j_names(gsl::span<std::string_view> names)
{
  json out = json::array();
  for (const auto name : names) out.push_back(std::string(name));
  return out;
}

json j_expr(const Expr * e);
json j_item(const AstNode * n);

json j_items(gsl::span<AstNode *> items)
{
  json out = json::array();
  for (const auto * item : items) out.push_back(j_item(item));
  return out;
}

// ============================================================================
// Expression serialization
// ============================================================================

json j_expr(const Expr * e)
{
  if (!e) return json{{"type", "MissingExpr"}, {"range", j_range({})}};

  json j = j_node_head(e);

  if (const auto * lit = dyn_cast<StringLiteralExpr>(e)) {
    j["value"] = std::string(lit->value);
  } else if (const auto * lit = dyn_cast<IntLiteralExpr>(e)) {
    j["value"] = lit->value;
  } else if (const auto * lit = dyn_cast<FloatLiteralExpr>(e)) {
    j["value"] = lit->value;
  } else if (const auto * lit = dyn_cast<PercentLiteralExpr>(e)) {
    j["value"] = lit->value;
  } else if (const auto * lit = dyn_cast<PixelLiteralExpr>(e)) {
    j["value"] = lit->value;
  } else if (const auto * lit = dyn_cast<BoolLiteralExpr>(e)) {
    j["value"] = lit->value;
  } else if (const auto * lit = dyn_cast<ColorLiteralExpr>(e)) {
    j["value"] = to_string(Color{lit->r, lit->g, lit->b, lit->a});
  } else if (const auto * list = dyn_cast<ListExpr>(e)) {
    json elems = json::array();
    for (const auto * el : list->elements) elems.push_back(j_expr(el));
    j["elements"] = std::move(elems);
  } else if (const auto * dict = dyn_cast<DictExpr>(e)) {
    json entries = json::array();
    for (const auto * entry : dict->entries) {
      entries.push_back(
        json{
          {"range", j_range(entry->get_range())},
          {"key", std::string(entry->key)},
          {"value", j_expr(entry->value)}});
    }
    j["entries"] = std::move(entries);
  } else if (const auto * ref = dyn_cast<VarRefExpr>(e)) {
    j["name"] = std::string(ref->name);
  }
  return j;
}

// ============================================================================
// Block items and declarations
// ============================================================================

json j_step(const SelectorStep * step)
{
  if (!step) return json{{"type", "MissingSelector"}, {"range", j_range({})}};
  json j = j_node_head(step);
  j["widget"] = std::string(step->widget);
  j["required"] = j_names(step->required);
  j["excluded"] = j_names(step->excluded);
  return j;
}

json j_item(const AstNode * n)
{
  if (!n) return json{{"type", "null"}, {"range", j_range({})}};

  json j = j_node_head(n);

  if (const auto * prop = dyn_cast<PropertyAssign>(n)) {
    j["name"] = std::string(prop->name);
    j["value"] = j_expr(prop->value);
  } else if (const auto * cls = dyn_cast<ClassAttr>(n)) {
    j["name"] = std::string(cls->name);
  } else if (const auto * var = dyn_cast<VarDecl>(n)) {
    j["name"] = std::string(var->name);
    j["value"] = j_expr(var->value);
  } else if (const auto * layout = dyn_cast<LayoutDecl>(n)) {
    j["widget"] = std::string(layout->widget);
    j["hasBlock"] = layout->hasBlock;
    j["body"] = j_items(layout->body);
  } else if (const auto * style = dyn_cast<StyleDecl>(n)) {
    j["selector"] = j_step(style->step);
    j["body"] = j_items(style->body);
  } else if (const auto * nested = dyn_cast<NestedStyle>(n)) {
    j["selector"] = j_step(nested->step);
    j["body"] = j_items(nested->body);
  } else if (const auto * imp = dyn_cast<ImportDecl>(n)) {
    j["path"] = std::string(imp->path);
  } else if (const auto * step = dyn_cast<SelectorStep>(n)) {
    return j_step(step);
  }
  return j;
}

}  // namespace

// ============================================================================
// Public API
// ============================================================================

nlohmann::json to_json(const AstNode * node)
{
  if (!node) return nlohmann::json{{"type", "null"}, {"range", j_range({})}};

  if (isa<Program>(node)) {
    return to_json(cast<Program>(node));
  }
  if (isa<Expr>(node)) {
    return j_expr(cast<Expr>(node));
  }
  if (const auto * entry = dyn_cast<DictEntry>(node)) {
    return nlohmann::json{
      {"type", "DictEntry"},
      {"range", j_range(entry->get_range())},
      {"key", std::string(entry->key)},
      {"value", j_expr(entry->value)}};
  }
  return j_item(node);
}

nlohmann::json to_json(const Program * program)
{
  if (!program)
    return nlohmann::json{
      {"type", "Program"}, {"range", j_range({})}, {"decls", nlohmann::json::array()}};

  nlohmann::json decls = nlohmann::json::array();

  for (const auto * d : program->decls) decls.push_back(j_item(d));

  return nlohmann::json{
    {"type", "Program"}, {"range", j_range(program->get_range())}, {"decls", decls}};
}

}  // namespace neko_ui

// neko_ui/project/project_config.cpp - Project configuration implementation
//
#include "neko_ui/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

#include <utility>

#include "neko_ui/ast/ast_context.hpp"
#include "neko_ui/basic/diagnostic.hpp"
#include "neko_ui/basic/source_manager.hpp"
#include "neko_ui/document/resolver.hpp"
#include "neko_ui/syntax/lexer.hpp"
#include "neko_ui/syntax/parser.hpp"

namespace neko_ui
{

namespace
{

/// Parse one entry of the `widgets` map
std::optional<WidgetConfig> parse_widget(
  const std::string & name, const YAML::Node & node, std::string & error)
{
  WidgetConfig widget;
  widget.name = name;

  if (!node || node.IsNull()) {
    return widget;
  }
  if (!node.IsMap()) {
    error = "widget '" + name + "' must be a map";
    return std::nullopt;
  }

  const auto & defaults = node["defaults"];
  if (!defaults) {
    return widget;
  }
  if (!defaults.IsMap()) {
    error = "widgets." + name + ".defaults must be a map";
    return std::nullopt;
  }

  for (const auto & entry : defaults) {
    const auto prop = entry.first.as<std::string>();
    std::string value_error;
    auto value = parse_value_literal(entry.second.as<std::string>(), value_error);
    if (!value) {
      error = "widgets." + name + ".defaults." + prop + ": " + value_error;
      return std::nullopt;
    }
    widget.defaults.set(prop, std::move(*value));
  }
  return widget;
}

ConfigLoadResult parse_root(const YAML::Node & root, const std::filesystem::path & project_root)
{
  ProjectConfig config;
  config.project_root = project_root;

  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  // Parse 'package' section
  if (root["package"]) {
    const auto & pkg = root["package"];
    if (pkg["name"]) {
      config.package.name = pkg["name"].as<std::string>();
    }
    if (pkg["version"]) {
      config.package.version = pkg["version"].as<std::string>();
    }
  }

  // Parse 'ui' section
  if (root["ui"]) {
    const auto & ui = root["ui"];

    if (ui["entry_points"]) {
      if (!ui["entry_points"].IsSequence()) {
        return ConfigLoadResult::fail("ui.entry_points must be a list");
      }
      for (const auto & ep : ui["entry_points"]) {
        config.ui.entry_points.emplace_back(ep.as<std::string>());
      }
    }
    if (ui["recover"]) {
      config.ui.recover = ui["recover"].as<bool>();
    }
    if (ui["max_errors"]) {
      const auto max_errors = ui["max_errors"].as<long long>();
      if (max_errors <= 0) {
        return ConfigLoadResult::fail("ui.max_errors must be positive");
      }
      config.ui.max_errors = static_cast<size_t>(max_errors);
    }
    if (ui["allow_undeclared_classes"]) {
      config.ui.allow_undeclared_classes = ui["allow_undeclared_classes"].as<bool>();
    }
  }

  // Parse 'widgets' section
  if (root["widgets"]) {
    if (!root["widgets"].IsMap()) {
      return ConfigLoadResult::fail("widgets must be a map");
    }
    for (const auto & entry : root["widgets"]) {
      std::string widget_error;
      auto widget = parse_widget(entry.first.as<std::string>(), entry.second, widget_error);
      if (!widget) {
        return ConfigLoadResult::fail("invalid widget: " + widget_error);
      }
      config.widgets.push_back(std::move(*widget));
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

std::optional<Value> parse_value_literal(std::string_view text, std::string & error)
{
  SourceRegistry sources;
  const FileId file_id = sources.register_file("<default>", std::string(text));
  const SourceFile * file = sources.get_file(file_id);

  AstContext ast;
  DiagnosticBag diags;
  syntax::Lexer lexer(file_id, file->content(), &diags);
  syntax::Parser parser(ast, file_id, file->content(), diags, lexer);
  const Expr * expr = parser.parse_standalone_value();

  if (expr == nullptr || diags.has_errors()) {
    const Diagnostic * first = diags.first_error();
    error = first != nullptr ? first->message : "expected a value";
    return std::nullopt;
  }
  Value value = to_value(expr);
  if (value.contains_variable_ref()) {
    error = "variables are not allowed in widget defaults";
    return std::nullopt;
  }
  return value;
}

ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root)
{
  try {
    return parse_root(YAML::Load(yaml_text), project_root);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::exists(config_path, ec)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  const fs::path project_root = fs::absolute(config_path, ec).parent_path();
  try {
    return parse_root(root, ec ? config_path.parent_path() : project_root);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration: " + std::string(e.what()));
  }
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  fs::path current = fs::absolute(start_dir, ec);
  if (ec) {
    return std::nullopt;
  }

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current, ec)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate, ec)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

WidgetRegistry build_widget_registry(const ProjectConfig & config)
{
  WidgetRegistry registry = WidgetRegistry::with_native_widgets();
  for (const auto & widget : config.widgets) {
    registry.register_widget(widget.name, widget.defaults);
  }
  return registry;
}

}  // namespace neko_ui

// neko_ui/project/project_config.hpp - Project configuration (nekoui.yaml)
//
// Parses and validates nekoui.yaml project files for the CLI and for hosts
// that embed the front-end.
//
#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "neko_ui/document/widget_registry.hpp"
#include "neko_ui/value/value.hpp"

namespace neko_ui
{

// ============================================================================
// Configuration Structures
// ============================================================================

struct PackageConfig
{
  std::string name;
  std::string version;
};

/**
 * `ui` section: entry files and front-end settings.
 */
struct UiConfig
{
  /// Entry files, relative to the project root
  std::vector<std::filesystem::path> entry_points;

  /// Panic-mode parser recovery
  bool recover = false;

  /// Error cap in recovery mode
  size_t max_errors = 32;

  /// Accept classes that no style mentions
  bool allow_undeclared_classes = false;
};

/// One entry of the `widgets` section
struct WidgetConfig
{
  std::string name;
  PropertyMap defaults;
};

/**
 * Complete project configuration (nekoui.yaml).
 */
struct ProjectConfig
{
  PackageConfig package;
  UiConfig ui;

  /// Host widgets in file order, registered after the native ones
  std::vector<WidgetConfig> widgets;

  /// Directory containing nekoui.yaml (for resolving relative paths)
  std::filesystem::path project_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a nekoui.yaml file.
 *
 * Widget defaults are written as value literals (`14px`, `"#000"`,
 * `[1, 2]`) and parsed with the source parser; a malformed default fails
 * the whole load.
 *
 * @param config_path Path to nekoui.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/// Same as load_project_config, from YAML text already in memory.
[[nodiscard]] ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to nekoui.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/// Native widgets plus every widget of the configuration.
[[nodiscard]] WidgetRegistry build_widget_registry(const ProjectConfig & config);

/**
 * Parse one value literal, e.g. a widget default.
 *
 * @param text Literal text such as `14px` or `{a: 1}`
 * @param error Set to the first diagnostic message on failure
 */
[[nodiscard]] std::optional<Value> parse_value_literal(std::string_view text, std::string & error);

inline constexpr const char * k_project_config_file_name = "nekoui.yaml";

}  // namespace neko_ui

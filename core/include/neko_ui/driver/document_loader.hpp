// neko_ui/driver/document_loader.hpp - File loading and import graph
//
// Loads an entry .nui file together with every module it imports, resolving
// each module once, and produces the entry Document. Used by the CLI and by
// ReloadController::reload_file.
//
#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "neko_ui/basic/diagnostic.hpp"
#include "neko_ui/basic/source_manager.hpp"
#include "neko_ui/document/document.hpp"
#include "neko_ui/document/resolver.hpp"
#include "neko_ui/syntax/parser.hpp"

namespace neko_ui
{

/// Extension used for sources and added to extension-less import paths
inline constexpr const char * k_source_extension = ".nui";

// ============================================================================
// Load Options / Result
// ============================================================================

struct LoadOptions
{
  syntax::ParseOptions parse;

  /// Resolver settings; `modules` is ignored, the loader supplies its own
  ResolveOptions resolve;

  /// External style sheet applied to the entry document only
  StyleSheet styles;
};

struct LoadResult
{
  /// Whether the entry document was produced (no errors anywhere)
  bool success = false;

  /// Resolved entry document, nullptr on failure
  DocumentPtr document;

  /// Diagnostics of every file touched by the load
  DiagnosticBag diagnostics;

  /// Source buffers the diagnostics refer to
  SourceRegistry sources;

  /// Files that were parsed, in completion order (imports before importers)
  std::vector<std::filesystem::path> files;
};

// ============================================================================
// DocumentLoader
// ============================================================================

/**
 * Driver that turns files into Documents.
 *
 * Import paths are relative to the importing file; `.nui` is appended when
 * the path has no extension. Each file is parsed and resolved at most once
 * per load, and import cycles are reported instead of followed. A module
 * whose imports failed is not resolved, so a missing file yields a single
 * diagnostic.
 */
class DocumentLoader
{
public:
  explicit DocumentLoader(LoadOptions options = {});

  /**
   * Load a file and everything it imports.
   *
   * @param path Entry file
   * @return LoadResult with the entry document and all diagnostics
   */
  [[nodiscard]] LoadResult load_file(const std::filesystem::path & path) const;

  /**
   * Load in-memory text as the entry document.
   *
   * Imports are resolved relative to the directory of `virtual_path`.
   */
  [[nodiscard]] LoadResult load_source(
    const std::filesystem::path & virtual_path, std::string text) const;

  [[nodiscard]] const LoadOptions & options() const noexcept { return options_; }

private:
  LoadOptions options_;
};

}  // namespace neko_ui

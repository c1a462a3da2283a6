// neko_ui/reload/reload_controller.hpp - Hot reload of UI sources
#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <string>

#include "neko_ui/basic/diagnostic.hpp"
#include "neko_ui/basic/source_manager.hpp"
#include "neko_ui/document/document.hpp"
#include "neko_ui/document/resolver.hpp"
#include "neko_ui/reload/document_handle.hpp"
#include "neko_ui/syntax/parser.hpp"

namespace neko_ui
{

struct ReloadOptions
{
  syntax::ParseOptions parse;
  ResolveOptions resolve;
  StyleSheet styles;

  /// Path under which reload(text) registers the buffer in diagnostics
  std::filesystem::path virtual_path = "<reload>.nui";
};

struct ReloadOutcome
{
  /// A new Document was published
  bool success = false;

  /// The published document on success, otherwise the one still current
  DocumentPtr document;

  DiagnosticBag diagnostics;
  SourceRegistry sources;
};

/**
 * Re-parses UI text and swaps the result into a DocumentHandle.
 *
 * A reload either publishes a complete new Document or leaves the handle
 * untouched; readers never observe a partial state. Failures are counted,
 * and printed to the log sink when one was given.
 */
class ReloadController
{
public:
  /**
   * @param handle Handle to publish into (must outlive the controller)
   * @param options Parse, resolve and style settings for every reload
   * @param log Optional sink for failure reports
   * @param use_color Colour the failure reports
   */
  ReloadController(
    DocumentHandle & handle, ReloadOptions options = {}, std::ostream * log = nullptr,
    bool use_color = false);

  /// Parse and resolve `text`; publish it on success.
  ReloadOutcome reload(std::string text);

  /// Load `path` with its imports; publish the result on success.
  ReloadOutcome reload_file(const std::filesystem::path & path);

  [[nodiscard]] uint64_t success_count() const noexcept { return successes_.load(); }
  [[nodiscard]] uint64_t failure_count() const noexcept { return failures_.load(); }

  [[nodiscard]] const ReloadOptions & options() const noexcept { return options_; }

private:
  ReloadOutcome finish(
    DocumentPtr document, DiagnosticBag diagnostics, SourceRegistry sources,
    const std::filesystem::path & origin);

  DocumentHandle & handle_;
  ReloadOptions options_;
  std::ostream * log_;
  bool use_color_;

  std::atomic<uint64_t> successes_{0};
  std::atomic<uint64_t> failures_{0};
};

}  // namespace neko_ui

// neko_ui/reload/reload_controller.cpp - Hot reload of UI sources
#include "neko_ui/reload/reload_controller.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <ostream>
#include <utility>

#include "neko_ui/basic/diagnostic_printer.hpp"
#include "neko_ui/driver/document_loader.hpp"

namespace neko_ui
{
namespace
{

DocumentLoader make_loader(const ReloadOptions & options)
{
  LoadOptions load_options;
  load_options.parse = options.parse;
  load_options.resolve = options.resolve;
  load_options.styles = options.styles;
  return DocumentLoader(std::move(load_options));
}

}  // namespace

ReloadController::ReloadController(
  DocumentHandle & handle, ReloadOptions options, std::ostream * log, bool use_color)
: handle_(handle), options_(std::move(options)), log_(log), use_color_(use_color)
{
}

ReloadOutcome ReloadController::reload(std::string text)
{
  LoadResult loaded = make_loader(options_).load_source(options_.virtual_path, std::move(text));
  return finish(
    std::move(loaded.document), std::move(loaded.diagnostics), std::move(loaded.sources),
    options_.virtual_path);
}

ReloadOutcome ReloadController::reload_file(const std::filesystem::path & path)
{
  LoadResult loaded = make_loader(options_).load_file(path);
  return finish(
    std::move(loaded.document), std::move(loaded.diagnostics), std::move(loaded.sources), path);
}

ReloadOutcome ReloadController::finish(
  DocumentPtr document, DiagnosticBag diagnostics, SourceRegistry sources,
  const std::filesystem::path & origin)
{
  ReloadOutcome outcome;
  outcome.success = document != nullptr && !diagnostics.has_errors();

  if (outcome.success) {
    handle_.store(document);
    outcome.document = std::move(document);
    successes_.fetch_add(1);
  } else {
    outcome.document = handle_.load();
    const uint64_t failures = failures_.fetch_add(1) + 1;
    if (log_ != nullptr) {
      DiagnosticPrinter printer(*log_, use_color_);
      printer.print_all(diagnostics, sources);
      printer.print_summary(diagnostics);
      fmt::print(
        *log_, "reload of {} failed ({} so far); keeping the current document\n",
        origin.string(), failures);
    }
  }

  outcome.diagnostics = std::move(diagnostics);
  outcome.sources = std::move(sources);
  return outcome;
}

}  // namespace neko_ui

// neko_ui/driver/document_loader.cpp - File loading and import graph
#include "neko_ui/driver/document_loader.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <fstream>
#include <optional>
#include <sstream>
#include <system_error>
#include <unordered_map>
#include <utility>

#include "neko_ui/ast/ast_context.hpp"
#include "neko_ui/basic/casting.hpp"
#include "neko_ui/syntax/frontend.hpp"

namespace fs = std::filesystem;

namespace neko_ui
{
namespace
{

std::string module_key(const fs::path & path)
{
  std::error_code ec;
  fs::path canonical = fs::weakly_canonical(path, ec);
  if (ec) {
    canonical = path.lexically_normal();
  }
  return canonical.generic_string();
}

std::optional<std::string> read_file(const fs::path & path)
{
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return std::nullopt;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    return std::nullopt;
  }
  return buffer.str();
}

fs::path resolve_import_path(const fs::path & importer, std::string_view import_path)
{
  fs::path target(std::string{import_path});
  if (!target.has_extension()) {
    target += k_source_extension;
  }
  if (target.is_relative()) {
    target = importer.parent_path() / target;
  }
  return target.lexically_normal();
}

// ============================================================================
// LoadSession - state of one load_file / load_source call
// ============================================================================

class LoadSession
{
public:
  LoadSession(const LoadOptions & options, LoadResult & result)
  : options_(options), result_(result)
  {
  }

  /// Parse and resolve `path` (with `text` if given, else read from disk).
  DocumentPtr load_module(
    const fs::path & path, std::optional<std::string> text, bool is_entry, SourceRange from);

private:
  [[nodiscard]] std::string cycle_description(const std::string & key) const;

  const LoadOptions & options_;
  LoadResult & result_;

  // key -> document (nullptr: the module failed)
  std::unordered_map<std::string, DocumentPtr> done_;
  // keys of modules currently being loaded, outermost first
  std::vector<std::string> in_progress_;
};

std::string LoadSession::cycle_description(const std::string & key) const
{
  std::string out;
  auto it = std::find(in_progress_.begin(), in_progress_.end(), key);
  for (; it != in_progress_.end(); ++it) {
    out += fs::path(*it).filename().string() + " -> ";
  }
  return out + fs::path(key).filename().string();
}

DocumentPtr LoadSession::load_module(
  const fs::path & path, std::optional<std::string> text, bool is_entry, SourceRange from)
{
  const std::string key = module_key(path);
  if (const auto it = done_.find(key); it != done_.end()) {
    return it->second;
  }

  if (!text) {
    text = read_file(path);
    if (!text) {
      result_.diagnostics
        .report_error(from, fmt::format("cannot read file '{}'", path.string()))
        .with_code(diag_code::k_unreadable_file);
      done_[key] = nullptr;
      return nullptr;
    }
  }

  // The Document copies everything it needs, so the arena is per module
  AstContext ast;
  const ParseOutput parsed =
    parse_source(result_.sources, path, std::move(*text), ast, result_.diagnostics, options_.parse);
  if (!parsed.success) {
    done_[key] = nullptr;
    return nullptr;
  }

  ModuleSet modules;
  bool imports_ok = true;

  in_progress_.push_back(key);
  for (const auto * decl : parsed.program->decls) {
    const auto * imp = dyn_cast<ImportDecl>(decl);
    if (imp == nullptr) {
      continue;
    }

    const fs::path target = resolve_import_path(path, imp->path);
    const std::string target_key = module_key(target);

    if (std::find(in_progress_.begin(), in_progress_.end(), target_key) != in_progress_.end()) {
      result_.diagnostics
        .report_error(
          imp->get_range(), fmt::format("import cycle: {}", cycle_description(target_key)),
          "imported here")
        .with_code(diag_code::k_import_cycle);
      imports_ok = false;
      continue;
    }

    std::error_code ec;
    if (done_.count(target_key) == 0 && !fs::is_regular_file(target, ec)) {
      result_.diagnostics
        .report_error(
          imp->get_range(), fmt::format("imported file not found: {}", target.string()),
          "imported here")
        .with_code(diag_code::k_import_not_found)
        .with_help("import paths are relative to the importing file");
      imports_ok = false;
      continue;
    }

    DocumentPtr doc = load_module(target, std::nullopt, false, imp->get_range());
    if (doc == nullptr) {
      imports_ok = false;
      continue;
    }
    modules.add(std::string(imp->path), std::move(doc));
  }
  in_progress_.pop_back();

  DocumentPtr document;
  if (imports_ok) {
    ResolveOptions resolve_options = options_.resolve;
    resolve_options.modules = &modules;
    Resolver resolver(result_.diagnostics, resolve_options);
    document = resolver.resolve(parsed.program, is_entry ? options_.styles : StyleSheet{});
  }

  result_.files.push_back(path);
  done_[key] = document;
  return document;
}

void finish(LoadResult & result, DocumentPtr document)
{
  result.success = document != nullptr && !result.diagnostics.has_errors();
  result.document = result.success ? std::move(document) : nullptr;
}

}  // namespace

// ============================================================================
// DocumentLoader
// ============================================================================

DocumentLoader::DocumentLoader(LoadOptions options) : options_(std::move(options)) {}

LoadResult DocumentLoader::load_file(const fs::path & path) const
{
  LoadResult result;
  LoadSession session(options_, result);
  finish(result, session.load_module(path, std::nullopt, true, {}));
  return result;
}

LoadResult DocumentLoader::load_source(const fs::path & virtual_path, std::string text) const
{
  LoadResult result;
  LoadSession session(options_, result);
  finish(result, session.load_module(virtual_path, std::move(text), true, {}));
  return result;
}

}  // namespace neko_ui

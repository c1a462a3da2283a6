// neko_ui/syntax/frontend.hpp - High-level parse pipeline entry point
#pragma once

#include <filesystem>
#include <string>

#include "neko_ui/ast/ast.hpp"
#include "neko_ui/ast/ast_context.hpp"
#include "neko_ui/basic/diagnostic.hpp"
#include "neko_ui/basic/source_manager.hpp"
#include "neko_ui/syntax/parser.hpp"

namespace neko_ui
{

struct ParseOutput
{
  FileId file_id = FileId::invalid();
  /// nullptr when parsing stopped at an error (default mode)
  Program * program = nullptr;
  /// No lex or parse errors were reported for this file
  bool success = false;
};

// Parse pipeline:
// source -> lexer (lazy token stream) -> recursive-descent parser (AST) -> diagnostics
//
// The text is registered in (or replaces the content of) `sources` under
// `path`; tokens and diagnostics refer to that FileId.
[[nodiscard]] ParseOutput parse_source(
  SourceRegistry & sources, const std::filesystem::path & path, std::string source_text,
  AstContext & ast, DiagnosticBag & diags, const syntax::ParseOptions & options = {});

}  // namespace neko_ui

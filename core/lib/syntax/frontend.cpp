// neko_ui/syntax/frontend.cpp - High-level parse pipeline
#include "neko_ui/syntax/frontend.hpp"

#include <utility>

#include "neko_ui/syntax/lexer.hpp"

namespace neko_ui
{

ParseOutput parse_source(
  SourceRegistry & sources, const std::filesystem::path & path, std::string source_text,
  AstContext & ast, DiagnosticBag & diags, const syntax::ParseOptions & options)
{
  ParseOutput out;

  // Re-parsing a path replaces its buffer in place and keeps the FileId
  out.file_id = sources.register_file(path, std::move(source_text));
  const SourceFile * file = sources.get_file(out.file_id);
  if (file == nullptr) {
    diags.report_error({}, "too many source files registered")
      .with_code(diag_code::k_unreadable_file);
    return out;
  }

  const size_t errors_before = diags.error_count();

  syntax::Lexer lexer(out.file_id, file->content(), &diags);
  syntax::Parser parser(ast, out.file_id, file->content(), diags, lexer, options);
  out.program = parser.parse_program();
  out.success = out.program != nullptr && diags.error_count() == errors_before;
  return out;
}

}  // namespace neko_ui

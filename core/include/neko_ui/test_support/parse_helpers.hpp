// neko_ui/test_support/parse_helpers.hpp - helpers for unit tests
//
// A single-file parse (and optionally resolve) pipeline that owns its
// SourceRegistry, AstContext and DiagnosticBag.
//
#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <utility>

#include "neko_ui/ast/ast_context.hpp"
#include "neko_ui/basic/diagnostic.hpp"
#include "neko_ui/basic/source_manager.hpp"
#include "neko_ui/document/resolver.hpp"
#include "neko_ui/syntax/frontend.hpp"

namespace neko_ui::test_support
{

struct TestParseUnit
{
  SourceRegistry sources;
  FileId file_id = FileId::invalid();
  std::unique_ptr<AstContext> ast;
  DiagnosticBag diags;
  Program * program = nullptr;
  bool success = false;

  [[nodiscard]] const SourceFile * source_file() const noexcept
  {
    return sources.get_file(file_id);
  }

  [[nodiscard]] std::string_view slice(SourceRange r) const noexcept
  {
    return sources.slice(r);
  }

  [[nodiscard]] FullSourceRange full_range(SourceRange r) const noexcept
  {
    return sources.full_range(r);
  }
};

[[nodiscard]] inline TestParseUnit parse(
  std::string src, const syntax::ParseOptions & options = {},
  const std::filesystem::path & virtual_path = "<test>.nui")
{
  TestParseUnit out;
  out.ast = std::make_unique<AstContext>();

  const ParseOutput parsed =
    parse_source(out.sources, virtual_path, std::move(src), *out.ast, out.diags, options);
  out.file_id = parsed.file_id;
  out.program = parsed.program;
  out.success = parsed.success;
  return out;
}

/// Parse result plus the resolved document (nullptr on any error)
struct TestResolveUnit : TestParseUnit
{
  DocumentPtr document;
};

[[nodiscard]] inline TestResolveUnit resolve(
  std::string src, const ResolveOptions & options = {}, const StyleSheet & styles = {})
{
  TestResolveUnit out;
  static_cast<TestParseUnit &>(out) = parse(std::move(src));
  if (out.success) {
    Resolver resolver(out.diags, options);
    out.document = resolver.resolve(out.program, styles);
  }
  return out;
}

}  // namespace neko_ui::test_support

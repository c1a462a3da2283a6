// neko_ui/syntax/parser.hpp - Recursive-descent parser over the lazy token stream
#pragma once

#include <cstddef>
#include <deque>
#include <string_view>
#include <vector>

#include "neko_ui/ast/ast.hpp"
#include "neko_ui/ast/ast_context.hpp"
#include "neko_ui/basic/diagnostic.hpp"
#include "neko_ui/basic/source_manager.hpp"
#include "neko_ui/syntax/lexer.hpp"
#include "neko_ui/syntax/token.hpp"

namespace neko_ui::syntax
{

struct ParseOptions
{
  /// Panic-mode recovery: skip to `;`, `}` or the next keyword and continue
  bool recover = false;
  /// Stop collecting once this many errors were reported (recovery mode only)
  size_t max_errors = 32;
  /// Deepest allowed nesting of blocks, lists and dicts (P006 beyond it)
  size_t max_depth = 256;
};

/**
 * Parser for one source buffer.
 *
 * Tokens are pulled from the Lexer on demand with at most two tokens of
 * lookahead. In the default mode the first error (lexical or syntactic)
 * halts the parse and parse_program() returns nullptr. With
 * ParseOptions::recover the parser resynchronizes after each error and
 * returns the partial program; callers must still check the bag before
 * using it.
 */
class Parser
{
public:
  Parser(
    AstContext & ast, FileId file_id, std::string_view source, DiagnosticBag & diags,
    Lexer & lexer, ParseOptions options = {});

  [[nodiscard]] Program * parse_program();

  /// Parse input that must consist of exactly one value (e.g. a widget default).
  [[nodiscard]] Expr * parse_standalone_value();

private:
  // Token helpers
  [[nodiscard]] const Token & cur(size_t lookahead = 0);
  [[nodiscard]] bool at(TokenKind k) { return cur().kind == k; }
  [[nodiscard]] bool at_eof() { return at(TokenKind::Eof); }
  [[nodiscard]] bool at_property_start();

  Token advance();
  bool match(TokenKind k);
  bool expect(TokenKind k, std::string_view what);
  bool expect_identifier(std::string_view what);

  // Error reporting
  void error_at(const Token & t, std::string_view what, const char * code = nullptr);
  [[nodiscard]] bool halted() const;
  [[nodiscard]] size_t errors_so_far() const;
  void synchronize(bool top_level);
  /// Reports P006 at `t` when one more level would exceed max_depth.
  [[nodiscard]] bool too_deep(const Token & t);

  [[nodiscard]] static bool is_kw(std::string_view kw, const Token & t);
  [[nodiscard]] bool at_item_start(bool top_level);

  // Declarations
  [[nodiscard]] Decl * parse_top_level_decl();
  [[nodiscard]] ImportDecl * parse_import_decl();
  [[nodiscard]] VarDecl * parse_var_decl();
  [[nodiscard]] LayoutDecl * parse_layout_decl();
  [[nodiscard]] StyleDecl * parse_style_decl();

  // Blocks
  bool parse_layout_block(LayoutDecl * layout);
  bool parse_style_block(gsl::span<AstNode *> & body);
  [[nodiscard]] PropertyAssign * parse_property_assign();
  [[nodiscard]] ClassAttr * parse_class_attr();
  [[nodiscard]] SelectorStep * parse_selector_step();
  void check_duplicate_property(
    std::vector<const PropertyAssign *> & seen, const PropertyAssign * prop);

  // Values
  [[nodiscard]] Expr * parse_value();
  [[nodiscard]] Expr * parse_number(const Token & t);
  [[nodiscard]] Expr * parse_color(const Token & t);
  [[nodiscard]] ListExpr * parse_list();
  [[nodiscard]] DictExpr * parse_dict();

  AstContext & ast_;
  FileId file_id_;
  std::string_view source_;
  DiagnosticBag & diags_;
  Lexer & lexer_;
  ParseOptions options_;

  std::deque<Token> lookahead_;
  Token prev_;
  size_t base_errors_ = 0;
  size_t depth_ = 0;
};

}  // namespace neko_ui::syntax

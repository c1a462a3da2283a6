// neko_ui/syntax/parser.cpp - Recursive-descent parser implementation
#include "neko_ui/syntax/parser.hpp"

#include <fmt/core.h>

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <system_error>

namespace neko_ui::syntax
{
namespace
{

int hex_nibble(char c) noexcept
{
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return 0;
}

/// Number part of a literal, without its `px` / `%` suffix.
std::string_view strip_unit(std::string_view text, TokenKind kind) noexcept
{
  if (kind == TokenKind::PixelLiteral) return text.substr(0, text.size() - 2);
  if (kind == TokenKind::PercentLiteral) return text.substr(0, text.size() - 1);
  return text;
}

/// Holds one level of nesting for the enclosing scope.
class DepthScope
{
public:
  explicit DepthScope(size_t & depth) noexcept : depth_(depth) { ++depth_; }
  ~DepthScope() { --depth_; }

  DepthScope(const DepthScope &) = delete;
  DepthScope & operator=(const DepthScope &) = delete;

private:
  size_t & depth_;
};

}  // namespace

Parser::Parser(
  AstContext & ast, FileId file_id, std::string_view source, DiagnosticBag & diags, Lexer & lexer,
  ParseOptions options)
: ast_(ast),
  file_id_(file_id),
  source_(source),
  diags_(diags),
  lexer_(lexer),
  options_(options),
  base_errors_(diags.error_count())
{
}

// ============================================================================
// Token helpers
// ============================================================================

const Token & Parser::cur(size_t lookahead)
{
  while (lookahead_.size() <= lookahead) {
    if (!lookahead_.empty() && lookahead_.back().is(TokenKind::Eof)) {
      return lookahead_.back();
    }
    lookahead_.push_back(lexer_.next_token());
  }
  return lookahead_[lookahead];
}

bool Parser::at_property_start()
{
  return at(TokenKind::Identifier) && cur(1).is(TokenKind::Colon);
}

Token Parser::advance()
{
  const Token t = cur();
  if (!t.is(TokenKind::Eof)) {
    lookahead_.pop_front();
  }
  prev_ = t;
  return t;
}

bool Parser::match(TokenKind k)
{
  if (at(k)) {
    advance();
    return true;
  }
  return false;
}

bool Parser::expect(TokenKind k, std::string_view what)
{
  if (match(k)) {
    return true;
  }

  const Token found = cur();
  if (k == TokenKind::Semicolon && found.kind != TokenKind::Unknown) {
    // A `;` forgotten at the end of a line is reported at the end of that line
    const bool next_line = prev_.range.is_valid() && found.loc.line > prev_.loc.line;
    const SourceRange at_range = next_line ? prev_.range : found.range;
    const SourceRange insert_at(file_id_, prev_.end(), prev_.end());
    diags_
      .report_error(
        at_range, fmt::format("expected {}, found {}", what, describe(found)), "expected `;`")
      .with_code(diag_code::k_missing_semicolon)
      .with_expectation("';'", describe(found))
      .with_fixit(insert_at, ";");
    return false;
  }

  error_at(found, what);
  return false;
}

bool Parser::expect_identifier(std::string_view what)
{
  return expect(TokenKind::Identifier, what);
}

bool Parser::is_kw(std::string_view kw, const Token & t)
{
  return t.kind == TokenKind::Identifier && t.text == kw;
}

bool Parser::at_item_start(bool top_level)
{
  const Token & t = cur();
  if (is_kw("layout", t) || is_kw("var", t)) {
    return true;
  }
  if (top_level) {
    return is_kw("style", t) || is_kw("import", t);
  }
  return is_kw("with", t) || is_kw("class", t) || at_property_start();
}

// ============================================================================
// Error reporting
// ============================================================================

void Parser::error_at(const Token & t, std::string_view what, const char * code)
{
  // The lexer has already reported malformed input
  if (t.kind == TokenKind::Unknown) {
    return;
  }
  diags_.report_error(t.range, fmt::format("expected {}, found {}", what, describe(t)))
    .with_code(code != nullptr ? code : diag_code::k_unexpected_token)
    .with_expectation(std::string(what), describe(t));
}

bool Parser::too_deep(const Token & t)
{
  if (depth_ < options_.max_depth) {
    return false;
  }
  diags_
    .report_error(
      t.range, fmt::format("nesting is deeper than {} levels", options_.max_depth),
      "too deeply nested")
    .with_code(diag_code::k_nesting_too_deep)
    .with_help("move the inner part into a variable or a separate layout");
  return true;
}

size_t Parser::errors_so_far() const { return diags_.error_count() - base_errors_; }

bool Parser::halted() const
{
  const size_t errors = errors_so_far();
  if (!options_.recover) {
    return errors > 0;
  }
  return errors >= options_.max_errors;
}

void Parser::synchronize(bool top_level)
{
  // Skip balanced {} blocks so one bad item does not cascade
  int brace_depth = 0;
  while (!at_eof()) {
    if (at(TokenKind::LBrace)) {
      ++brace_depth;
      advance();
      continue;
    }
    if (at(TokenKind::RBrace)) {
      if (brace_depth > 0) {
        --brace_depth;
        advance();
        if (brace_depth == 0) {
          return;
        }
        continue;
      }
      if (!top_level) {
        return;  // closes the enclosing block
      }
      advance();  // stray '}' at top level
      continue;
    }
    if (brace_depth == 0) {
      if (match(TokenKind::Semicolon)) {
        return;
      }
      if (at_item_start(top_level)) {
        return;
      }
    }
    advance();
  }
}

// ============================================================================
// Top level
// ============================================================================

Program * Parser::parse_program()
{
  auto * prog =
    ast_.create<Program>(SourceRange(file_id_, 0, static_cast<uint32_t>(source_.size())));

  std::vector<Decl *> decls;

  while (!at_eof() && !halted()) {
    const Token start = cur();
    Decl * d = parse_top_level_decl();
    if (d != nullptr) {
      decls.push_back(d);
      continue;
    }
    if (halted()) {
      break;
    }
    // Always make progress before resynchronizing
    if (cur().range == start.range && !at_eof()) {
      advance();
    }
    synchronize(/*top_level=*/true);
  }

  prog->decls = ast_.copy_to_arena(decls);

  if (!options_.recover && errors_so_far() > 0) {
    return nullptr;
  }
  return prog;
}

Decl * Parser::parse_top_level_decl()
{
  const Token & t = cur();
  if (is_kw("layout", t)) {
    return parse_layout_decl();
  }
  if (is_kw("var", t)) {
    return parse_var_decl();
  }
  if (is_kw("style", t)) {
    return parse_style_decl();
  }
  if (is_kw("import", t)) {
    return parse_import_decl();
  }
  error_at(t, "'layout', 'var', 'style' or 'import'");
  return nullptr;
}

ImportDecl * Parser::parse_import_decl()
{
  const Token kw = advance();

  const Token path_tok = cur();
  if (!expect(TokenKind::StringLiteral, "string literal import path")) {
    return nullptr;
  }
  if (!expect(TokenKind::Semicolon, "';' after import")) {
    return nullptr;
  }
  return ast_.create<ImportDecl>(ast_.intern(path_tok.text), join_ranges(kw.range, prev_.range));
}

VarDecl * Parser::parse_var_decl()
{
  const Token kw = advance();

  const Token name_tok = cur();
  if (!expect_identifier("variable name after 'var'")) {
    return nullptr;
  }
  if (!expect(TokenKind::Eq, "'=' after variable name")) {
    return nullptr;
  }
  Expr * value = parse_value();
  if (value == nullptr) {
    return nullptr;
  }
  if (!expect(TokenKind::Semicolon, "';' after variable value")) {
    return nullptr;
  }
  return ast_.create<VarDecl>(
    ast_.intern(name_tok.text), name_tok.range, value, join_ranges(kw.range, prev_.range));
}

LayoutDecl * Parser::parse_layout_decl()
{
  const Token kw = advance();  // 'layout' or 'with'

  const Token name_tok = cur();
  if (!expect_identifier(fmt::format("widget name after '{}'", kw.text))) {
    return nullptr;
  }

  auto * layout = ast_.create<LayoutDecl>(ast_.intern(name_tok.text), name_tok.range);

  if (match(TokenKind::Semicolon)) {
    layout->range_ = join_ranges(kw.range, prev_.range);
    return layout;
  }
  if (!at(TokenKind::LBrace)) {
    error_at(cur(), "';' or '{' after widget name");
    return nullptr;
  }
  if (!parse_layout_block(layout)) {
    return nullptr;
  }
  layout->range_ = join_ranges(kw.range, prev_.range);
  return layout;
}

StyleDecl * Parser::parse_style_decl()
{
  const Token kw = advance();

  SelectorStep * step = parse_selector_step();
  if (step == nullptr) {
    return nullptr;
  }
  auto * style = ast_.create<StyleDecl>(step);
  if (!parse_style_block(style->body)) {
    return nullptr;
  }
  style->range_ = join_ranges(kw.range, prev_.range);
  return style;
}

// ============================================================================
// Blocks
// ============================================================================

void Parser::check_duplicate_property(
  std::vector<const PropertyAssign *> & seen, const PropertyAssign * prop)
{
  for (const auto * earlier : seen) {
    if (earlier->name == prop->name) {
      diags_
        .report_warning(
          prop->nameRange,
          fmt::format("property '{}' is assigned more than once; the last value wins", prop->name),
          "assigned again here")
        .with_code(diag_code::k_duplicate_property)
        .with_secondary_label(earlier->nameRange, "first assigned here");
      return;
    }
  }
  seen.push_back(prop);
}

bool Parser::parse_layout_block(LayoutDecl * layout)
{
  if (too_deep(cur())) {
    return false;
  }
  const DepthScope scope(depth_);
  if (!expect(TokenKind::LBrace, "'{'")) {
    return false;
  }
  layout->hasBlock = true;

  std::vector<AstNode *> items;
  std::vector<const PropertyAssign *> props;

  while (!at(TokenKind::RBrace) && !at_eof() && !halted()) {
    const Token start = cur();
    AstNode * item = nullptr;

    if (at_property_start()) {
      auto * prop = parse_property_assign();
      if (prop != nullptr) {
        check_duplicate_property(props, prop);
      }
      item = prop;
    } else if (is_kw("var", start)) {
      item = parse_var_decl();
    } else if (is_kw("class", start)) {
      item = parse_class_attr();
    } else if (is_kw("layout", start) || is_kw("with", start)) {
      item = parse_layout_decl();
    } else {
      error_at(start, "property, 'var', 'class', 'layout' or 'with'");
    }

    if (item != nullptr) {
      items.push_back(item);
      continue;
    }
    if (halted()) {
      return false;
    }
    if (cur().range == start.range && !at_eof() && !at(TokenKind::RBrace)) {
      advance();
    }
    synchronize(/*top_level=*/false);
  }

  layout->body = ast_.copy_to_arena(items);
  if (halted()) {
    return false;
  }
  return expect(TokenKind::RBrace, "'}' to close the layout block");
}

bool Parser::parse_style_block(gsl::span<AstNode *> & body)
{
  if (too_deep(cur())) {
    return false;
  }
  const DepthScope scope(depth_);
  if (!expect(TokenKind::LBrace, "'{' after style selector")) {
    return false;
  }

  std::vector<AstNode *> items;
  std::vector<const PropertyAssign *> props;

  while (!at(TokenKind::RBrace) && !at_eof() && !halted()) {
    const Token start = cur();
    AstNode * item = nullptr;

    if (at_property_start()) {
      auto * prop = parse_property_assign();
      if (prop != nullptr) {
        check_duplicate_property(props, prop);
      }
      item = prop;
    } else if (is_kw("with", start)) {
      advance();
      SelectorStep * step = parse_selector_step();
      if (step != nullptr) {
        auto * nested = ast_.create<NestedStyle>(step);
        if (parse_style_block(nested->body)) {
          nested->range_ = join_ranges(start.range, prev_.range);
          item = nested;
        }
      }
    } else {
      error_at(start, "property or 'with'");
    }

    if (item != nullptr) {
      items.push_back(item);
      continue;
    }
    if (halted()) {
      return false;
    }
    if (cur().range == start.range && !at_eof() && !at(TokenKind::RBrace)) {
      advance();
    }
    synchronize(/*top_level=*/false);
  }

  body = ast_.copy_to_arena(items);
  if (halted()) {
    return false;
  }
  return expect(TokenKind::RBrace, "'}' to close the style block");
}

PropertyAssign * Parser::parse_property_assign()
{
  const Token name_tok = advance();
  advance();  // ':'

  Expr * value = parse_value();
  if (value == nullptr) {
    return nullptr;
  }
  if (!expect(TokenKind::Semicolon, "';' after property value")) {
    return nullptr;
  }
  return ast_.create<PropertyAssign>(
    ast_.intern(name_tok.text), name_tok.range, value, join_ranges(name_tok.range, prev_.range));
}

ClassAttr * Parser::parse_class_attr()
{
  const Token kw = advance();

  const Token name_tok = cur();
  if (!expect_identifier("class name after 'class'")) {
    return nullptr;
  }
  if (!expect(TokenKind::Semicolon, "';' after class name")) {
    return nullptr;
  }
  return ast_.create<ClassAttr>(ast_.intern(name_tok.text), join_ranges(kw.range, prev_.range));
}

SelectorStep * Parser::parse_selector_step()
{
  const Token widget_tok = cur();
  if (!expect_identifier("widget name in style selector")) {
    return nullptr;
  }

  std::vector<std::string_view> required;
  std::vector<std::string_view> excluded;

  while (at(TokenKind::Plus) || at(TokenKind::Bang)) {
    const bool is_required = advance().is(TokenKind::Plus);
    const Token cls = cur();
    if (!expect_identifier(is_required ? "class name after '+'" : "class name after '!'")) {
      return nullptr;
    }
    (is_required ? required : excluded).push_back(ast_.intern(cls.text));
  }

  auto * step = ast_.create<SelectorStep>(
    ast_.intern(widget_tok.text), join_ranges(widget_tok.range, prev_.range));
  step->required = ast_.copy_to_arena(required);
  step->excluded = ast_.copy_to_arena(excluded);
  return step;
}

// ============================================================================
// Values
// ============================================================================

Expr * Parser::parse_value()
{
  const Token t = cur();
  switch (t.kind) {
    case TokenKind::StringLiteral:
    case TokenKind::Identifier:  // bare keywords such as `auto` or `bold` are strings
      advance();
      return ast_.create<StringLiteralExpr>(ast_.intern(t.text), t.range);
    case TokenKind::IntLiteral:
    case TokenKind::FloatLiteral:
    case TokenKind::PixelLiteral:
    case TokenKind::PercentLiteral:
      advance();
      return parse_number(t);
    case TokenKind::ColorLiteral:
      advance();
      return parse_color(t);
    case TokenKind::BoolLiteral:
      advance();
      return ast_.create<BoolLiteralExpr>(t.text == "true", t.range);
    case TokenKind::Variable:
      advance();
      return ast_.create<VarRefExpr>(ast_.intern(t.text), t.range);
    case TokenKind::LBracket:
      return parse_list();
    case TokenKind::LBrace:
      return parse_dict();
    default:
      error_at(t, "value");
      return nullptr;
  }
}

Expr * Parser::parse_number(const Token & t)
{
  const std::string_view digits = strip_unit(t.text, t.kind);

  if (t.kind == TokenKind::IntLiteral) {
    int64_t v = 0;
    const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), v);
    if (ec == std::errc::result_out_of_range || ptr != digits.data() + digits.size()) {
      diags_
        .report_error(
          t.range, fmt::format("integer literal '{}' does not fit in 64 bits", t.text),
          "out of range")
        .with_code(diag_code::k_integer_overflow)
        .with_help("use a float literal for values outside the 64-bit integer range");
      return nullptr;
    }
    return ast_.create<IntLiteralExpr>(v, t.range);
  }

  const std::string tmp(digits);
  const double v = std::strtod(tmp.c_str(), nullptr);
  switch (t.kind) {
    case TokenKind::PixelLiteral:
      return ast_.create<PixelLiteralExpr>(v, t.range);
    case TokenKind::PercentLiteral:
      return ast_.create<PercentLiteralExpr>(v, t.range);
    default:
      return ast_.create<FloatLiteralExpr>(v, t.range);
  }
}

Expr * Parser::parse_color(const Token & t)
{
  // The lexer guarantees '#' followed by 3, 4, 6 or 8 hex digits
  const std::string_view hex = t.text.substr(1);
  uint8_t channels[4] = {0, 0, 0, 255};

  if (hex.size() == 3 || hex.size() == 4) {
    for (size_t i = 0; i < hex.size(); ++i) {
      channels[i] = static_cast<uint8_t>(hex_nibble(hex[i]) * 17);
    }
  } else {
    for (size_t i = 0; i < hex.size() / 2; ++i) {
      const int hi = hex_nibble(hex[2 * i]);
      const int lo = hex_nibble(hex[2 * i + 1]);
      channels[i] = static_cast<uint8_t>(hi * 16 + lo);
    }
  }
  return ast_.create<ColorLiteralExpr>(
    channels[0], channels[1], channels[2], channels[3], t.range);
}

ListExpr * Parser::parse_list()
{
  if (too_deep(cur())) {
    return nullptr;
  }
  const DepthScope scope(depth_);
  const Token lb = advance();

  std::vector<Expr *> elems;
  while (!at(TokenKind::RBracket)) {
    Expr * e = parse_value();
    if (e == nullptr) {
      return nullptr;
    }
    elems.push_back(e);
    if (!match(TokenKind::Comma)) {
      break;
    }
  }

  if (!expect(TokenKind::RBracket, "',' or ']' in list")) {
    return nullptr;
  }
  return ast_.create<ListExpr>(ast_.copy_to_arena(elems), join_ranges(lb.range, prev_.range));
}

DictExpr * Parser::parse_dict()
{
  if (too_deep(cur())) {
    return nullptr;
  }
  const DepthScope scope(depth_);
  const Token lb = advance();

  std::vector<DictEntry *> entries;
  while (!at(TokenKind::RBrace)) {
    const Token key_tok = cur();
    if (!expect_identifier("dict key")) {
      return nullptr;
    }
    if (!expect(TokenKind::Colon, "':' after dict key")) {
      return nullptr;
    }
    Expr * value = parse_value();
    if (value == nullptr) {
      return nullptr;
    }

    for (const auto * earlier : entries) {
      if (earlier->key == key_tok.text) {
        diags_
          .report_error(
            key_tok.range, fmt::format("duplicate key '{}' in dict", key_tok.text),
            "duplicate key")
          .with_code(diag_code::k_duplicate_key)
          .with_secondary_label(earlier->keyRange, "first defined here");
        return nullptr;
      }
    }

    entries.push_back(ast_.create<DictEntry>(
      ast_.intern(key_tok.text), key_tok.range, value, join_ranges(key_tok.range, prev_.range)));

    if (!match(TokenKind::Comma)) {
      break;
    }
  }

  if (!expect(TokenKind::RBrace, "',' or '}' in dict")) {
    return nullptr;
  }
  return ast_.create<DictExpr>(ast_.copy_to_arena(entries), join_ranges(lb.range, prev_.range));
}

Expr * Parser::parse_standalone_value()
{
  Expr * e = parse_value();
  if (e == nullptr) {
    return nullptr;
  }
  if (!at_eof()) {
    error_at(cur(), "end of value");
    return nullptr;
  }
  return e;
}

}  // namespace neko_ui::syntax

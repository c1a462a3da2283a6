// neko_ui/syntax/lexer.cpp - Tokenizer implementation
#include "neko_ui/syntax/lexer.hpp"

#include <fmt/core.h>

#include <cctype>
#include <string>

namespace neko_ui::syntax
{
namespace
{

bool is_ident_start(unsigned char c) { return (std::isalpha(c) != 0) || c == '_'; }
bool is_ident_continue(unsigned char c) { return (std::isalnum(c) != 0) || c == '_' || c == '-'; }
bool is_digit(unsigned char c) { return std::isdigit(c) != 0; }
bool is_hex_digit(unsigned char c) { return std::isxdigit(c) != 0; }

/// Byte length of the UTF-8 sequence introduced by a lead byte.
size_t utf8_length(unsigned char lead)
{
  if (lead < 0x80) return 1;
  if ((lead >> 5) == 0x6) return 2;
  if ((lead >> 4) == 0xE) return 3;
  if ((lead >> 3) == 0x1E) return 4;
  return 1;
}

/// Offset of the first byte that does not start a well-formed UTF-8 sequence,
/// or npos. Overlong forms, surrogates and code points past U+10FFFF count
/// as malformed.
size_t find_invalid_utf8(std::string_view text) noexcept
{
  size_t i = 0;
  while (i < text.size()) {
    const auto lead = static_cast<unsigned char>(text[i]);
    if (lead < 0x80) {
      ++i;
      continue;
    }
    const size_t len = utf8_length(lead);
    if (len == 1 || lead == 0xC0 || lead == 0xC1 || lead > 0xF4 || i + len > text.size()) {
      return i;
    }
    // Bounds of the second byte; the rest are plain continuation bytes
    unsigned char lo = 0x80;
    unsigned char hi = 0xBF;
    if (lead == 0xE0) lo = 0xA0;
    if (lead == 0xED) hi = 0x9F;
    if (lead == 0xF0) lo = 0x90;
    if (lead == 0xF4) hi = 0x8F;
    const auto second = static_cast<unsigned char>(text[i + 1]);
    if (second < lo || second > hi) {
      return i;
    }
    for (size_t k = 2; k < len; ++k) {
      if ((static_cast<unsigned char>(text[i + k]) & 0xC0) != 0x80) {
        return i;
      }
    }
    i += len;
  }
  return std::string_view::npos;
}

}  // namespace

bool Lexer::starts_with(std::string_view s) const noexcept
{
  return src_.size() >= pos_ + s.size() && src_.substr(pos_, s.size()) == s;
}

void Lexer::advance(size_t n) noexcept
{
  for (; n > 0 && pos_ < src_.size(); --n) {
    if (src_[pos_] == '\n') {
      ++line_;
      line_start_ = pos_ + 1;
    }
    ++pos_;
  }
}

void Lexer::skip_whitespace_and_comments()
{
  while (!eof()) {
    const char c = peek();
    if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
      advance(1);
      continue;
    }
    if (starts_with("//")) {
      while (!eof() && peek() != '\n') {
        advance(1);
      }
      continue;
    }
    break;
  }
}

Token Lexer::make_token(TokenKind kind, uint32_t start, std::string_view text) const
{
  Token t;
  t.kind = kind;
  t.range = make_range(start, static_cast<uint32_t>(pos_));
  t.text = text;
  t.loc = token_loc_;
  return t;
}

Token Lexer::error_token(uint32_t start, const char * code, std::string message)
{
  const auto end = static_cast<uint32_t>(pos_);
  if (diags_ != nullptr) {
    diags_->report_error(make_range(start, end), std::move(message)).with_code(code);
  }
  return make_token(TokenKind::Unknown, start, src_.substr(start, end - start));
}

Token Lexer::lex_identifier_or_keyword()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(1);
  while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
    advance(1);
  }
  const std::string_view text = src_.substr(start, pos_ - start);
  const TokenKind kind =
    (text == "true" || text == "false") ? TokenKind::BoolLiteral : TokenKind::Identifier;
  return make_token(kind, start, text);
}

Token Lexer::lex_variable()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(1);  // '$'

  if (eof() || !is_ident_start(static_cast<unsigned char>(peek()))) {
    return error_token(start, diag_code::k_invalid_variable, "expected variable name after '$'");
  }

  const size_t name_start = pos_;
  while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
    advance(1);
  }
  return make_token(TokenKind::Variable, start, src_.substr(name_start, pos_ - name_start));
}

Token Lexer::lex_number()
{
  const auto start = static_cast<uint32_t>(pos_);

  if (peek() == '-') {
    advance(1);
    if (!is_digit(static_cast<unsigned char>(peek()))) {
      return error_token(start, diag_code::k_malformed_number, "expected digit after '-'");
    }
  }

  while (is_digit(static_cast<unsigned char>(peek()))) {
    advance(1);
  }

  bool is_float = false;
  if (peek() == '.') {
    if (!is_digit(static_cast<unsigned char>(peek(1)))) {
      advance(1);
      return error_token(
        start, diag_code::k_malformed_number, "expected digit after decimal point");
    }
    is_float = true;
    advance(1);
    while (is_digit(static_cast<unsigned char>(peek()))) {
      advance(1);
    }
  }

  TokenKind kind = is_float ? TokenKind::FloatLiteral : TokenKind::IntLiteral;
  if (starts_with("px")) {
    advance(2);
    kind = TokenKind::PixelLiteral;
  } else if (peek() == '%') {
    advance(1);
    kind = TokenKind::PercentLiteral;
  }

  // Anything word-like glued to the literal is a bad unit, e.g. `10em` or `5pxx`
  if (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
    size_t suffix_start = pos_;
    if (kind == TokenKind::PixelLiteral) {
      suffix_start -= 2;
    } else if (kind == TokenKind::PercentLiteral) {
      suffix_start -= 1;
    }
    while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
      advance(1);
    }
    const std::string_view suffix = src_.substr(suffix_start, pos_ - suffix_start);
    return error_token(
      start, diag_code::k_invalid_suffix,
      fmt::format("invalid suffix '{}' on number literal (expected 'px' or '%')", suffix));
  }

  return make_token(kind, start, src_.substr(start, pos_ - start));
}

Token Lexer::lex_string()
{
  const auto start = static_cast<uint32_t>(pos_);
  const char delim = peek();
  advance(1);

  const size_t payload_start = pos_;
  while (!eof() && peek() != delim) {
    // Raw newlines end the literal; the newline is left for the next token.
    if (peek() == '\n' || peek() == '\r') {
      break;
    }
    advance(1);
  }

  if (eof() || peek() != delim) {
    return error_token(
      start, diag_code::k_unterminated_string,
      fmt::format("unterminated string literal (missing closing {})", delim));
  }

  const std::string_view payload = src_.substr(payload_start, pos_ - payload_start);
  advance(1);
  if (const size_t bad = find_invalid_utf8(payload); bad != std::string_view::npos) {
    return error_token(
      start, diag_code::k_invalid_utf8,
      fmt::format(
        "string literal is not valid UTF-8 (byte 0x{:02X} at offset {})",
        static_cast<unsigned char>(payload[bad]), bad));
  }
  return make_token(TokenKind::StringLiteral, start, payload);
}

Token Lexer::lex_color()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(1);  // '#'

  size_t digits = 0;
  char bad_digit = '\0';
  while (!eof() && std::isalnum(static_cast<unsigned char>(peek())) != 0) {
    if (bad_digit == '\0' && !is_hex_digit(static_cast<unsigned char>(peek()))) {
      bad_digit = peek();
    }
    ++digits;
    advance(1);
  }

  if (bad_digit != '\0') {
    return error_token(
      start, diag_code::k_invalid_color,
      fmt::format("invalid hex digit '{}' in color literal", bad_digit));
  }
  if (digits != 3 && digits != 4 && digits != 6 && digits != 8) {
    return error_token(
      start, diag_code::k_invalid_color,
      fmt::format("color literal must have 3, 4, 6 or 8 hex digits, found {}", digits));
  }

  return make_token(TokenKind::ColorLiteral, start, src_.substr(start, pos_ - start));
}

Token Lexer::next_token()
{
  skip_whitespace_and_comments();

  const auto start = static_cast<uint32_t>(pos_);
  token_loc_ = LineColumn{line_, static_cast<uint32_t>(pos_ - line_start_ + 1)};

  if (eof()) {
    return make_token(TokenKind::Eof, start, {});
  }

  const auto c = static_cast<unsigned char>(peek());

  if (is_ident_start(c)) {
    return lex_identifier_or_keyword();
  }
  if (is_digit(c) || c == '-') {
    return lex_number();
  }
  if (c == '"' || c == '\'' || c == '`') {
    return lex_string();
  }
  if (c == '#') {
    return lex_color();
  }
  if (c == '$') {
    return lex_variable();
  }
  if (c == '.' && is_digit(static_cast<unsigned char>(peek(1)))) {
    advance(1);
    while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
      advance(1);
    }
    return error_token(
      start, diag_code::k_malformed_number,
      "number literal must have a digit before '.' (write 0.5, not .5)");
  }

  advance(1);
  switch (c) {
    case '(':
      return make_token(TokenKind::LParen, start, "(");
    case ')':
      return make_token(TokenKind::RParen, start, ")");
    case '{':
      return make_token(TokenKind::LBrace, start, "{");
    case '}':
      return make_token(TokenKind::RBrace, start, "}");
    case '[':
      return make_token(TokenKind::LBracket, start, "[");
    case ']':
      return make_token(TokenKind::RBracket, start, "]");
    case ',':
      return make_token(TokenKind::Comma, start, ",");
    case ':':
      return make_token(TokenKind::Colon, start, ":");
    case ';':
      return make_token(TokenKind::Semicolon, start, ";");
    case '=':
      return make_token(TokenKind::Eq, start, "=");
    case '+':
      return make_token(TokenKind::Plus, start, "+");
    case '!':
      return make_token(TokenKind::Bang, start, "!");
    default:
      break;
  }

  // Report the whole code point, not a dangling UTF-8 byte
  advance(utf8_length(c) - 1);
  const std::string_view bad = src_.substr(start, pos_ - start);
  return error_token(
    start, diag_code::k_unexpected_char, fmt::format("unexpected character '{}'", bad));
}

std::vector<Token> Lexer::lex_all()
{
  std::vector<Token> out;
  while (true) {
    const Token t = next_token();
    out.push_back(t);
    if (t.kind == TokenKind::Eof) {
      break;
    }
  }
  return out;
}

}  // namespace neko_ui::syntax

// neko_ui/syntax/token.hpp - Token kinds produced by the lexer
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "neko_ui/basic/source_manager.hpp"

namespace neko_ui::syntax
{

enum class TokenKind : uint8_t {
  Eof,
  Unknown,  // malformed input; the lexer has already reported it

  Identifier,
  Variable,  // $name, text is the name without '$'

  StringLiteral,   // text is the contents without delimiters
  IntLiteral,      // -?[0-9]+
  FloatLiteral,    // -?[0-9]+.[0-9]+
  PixelLiteral,    // number followed by px, text includes the suffix
  PercentLiteral,  // number followed by %, text includes the suffix
  ColorLiteral,    // #rgb, #rgba, #rrggbb, #rrggbbaa, text includes '#'
  BoolLiteral,     // true / false

  // Punctuation
  LParen,
  RParen,
  LBrace,
  RBrace,
  LBracket,
  RBracket,

  Comma,
  Colon,
  Semicolon,
  Eq,
  Plus,
  Bang,
};

struct Token
{
  TokenKind kind = TokenKind::Unknown;
  SourceRange range;      // byte range in the original source (including delimiters)
  std::string_view text;  // slice view (for StringLiteral: interior)
  LineColumn loc;         // position of the first byte

  [[nodiscard]] uint32_t begin() const noexcept { return range.begin(); }
  [[nodiscard]] uint32_t end() const noexcept { return range.end(); }

  [[nodiscard]] bool is(TokenKind k) const noexcept { return kind == k; }
};

[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eof:
      return "end of input";
    case TokenKind::Unknown:
      return "invalid token";
    case TokenKind::Identifier:
      return "identifier";
    case TokenKind::Variable:
      return "variable";
    case TokenKind::StringLiteral:
      return "string";
    case TokenKind::IntLiteral:
      return "integer";
    case TokenKind::FloatLiteral:
      return "float";
    case TokenKind::PixelLiteral:
      return "pixels";
    case TokenKind::PercentLiteral:
      return "percentage";
    case TokenKind::ColorLiteral:
      return "color";
    case TokenKind::BoolLiteral:
      return "boolean";
    case TokenKind::LParen:
      return "'('";
    case TokenKind::RParen:
      return "')'";
    case TokenKind::LBrace:
      return "'{'";
    case TokenKind::RBrace:
      return "'}'";
    case TokenKind::LBracket:
      return "'['";
    case TokenKind::RBracket:
      return "']'";
    case TokenKind::Comma:
      return "','";
    case TokenKind::Colon:
      return "':'";
    case TokenKind::Semicolon:
      return "';'";
    case TokenKind::Eq:
      return "'='";
    case TokenKind::Plus:
      return "'+'";
    case TokenKind::Bang:
      return "'!'";
  }
  return "";
}

/// Short description of a concrete token for "found ..." messages.
[[nodiscard]] inline std::string describe(const Token & t)
{
  switch (t.kind) {
    case TokenKind::Identifier:
    case TokenKind::IntLiteral:
    case TokenKind::FloatLiteral:
    case TokenKind::PixelLiteral:
    case TokenKind::PercentLiteral:
    case TokenKind::ColorLiteral:
    case TokenKind::BoolLiteral:
      return "'" + std::string(t.text) + "'";
    case TokenKind::Variable:
      return "'$" + std::string(t.text) + "'";
    case TokenKind::StringLiteral:
      return "string \"" + std::string(t.text) + "\"";
    default:
      return std::string(to_string(t.kind));
  }
}

}  // namespace neko_ui::syntax

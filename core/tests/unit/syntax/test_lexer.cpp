#include <gtest/gtest.h>

#include <string_view>
#include <vector>

#include "neko_ui/basic/diagnostic.hpp"
#include "neko_ui/syntax/lexer.hpp"
#include "neko_ui/syntax/token.hpp"

using neko_ui::DiagnosticBag;
using neko_ui::DiagnosticPhase;
using neko_ui::FileId;
using neko_ui::syntax::Lexer;
using neko_ui::syntax::Token;
using neko_ui::syntax::TokenKind;

namespace
{

std::vector<Token> lex(std::string_view src, DiagnosticBag * diags = nullptr)
{
  Lexer lexer(FileId{0}, src, diags);
  return lexer.lex_all();
}

std::vector<TokenKind> kinds(const std::vector<Token> & toks)
{
  std::vector<TokenKind> out;
  for (const auto & t : toks) {
    out.push_back(t.kind);
  }
  return out;
}

}  // namespace

TEST(SyntaxLexer, PunctuationAndIdentifiers)
{
  const auto toks = lex("layout div { class panel; with p +a !b; }");
  const std::vector<TokenKind> expected = {
    TokenKind::Identifier, TokenKind::Identifier, TokenKind::LBrace,     TokenKind::Identifier,
    TokenKind::Identifier, TokenKind::Semicolon,  TokenKind::Identifier, TokenKind::Identifier,
    TokenKind::Plus,       TokenKind::Identifier, TokenKind::Bang,       TokenKind::Identifier,
    TokenKind::Semicolon,  TokenKind::RBrace,     TokenKind::Eof,
  };
  EXPECT_EQ(kinds(toks), expected);
  EXPECT_EQ(toks[0].text, "layout");
  EXPECT_EQ(toks[1].text, "div");
}

TEST(SyntaxLexer, IdentifiersMayContainDashes)
{
  const auto toks = lex("font-size: 12px;");
  ASSERT_GE(toks.size(), 2U);
  EXPECT_EQ(toks[0].kind, TokenKind::Identifier);
  EXPECT_EQ(toks[0].text, "font-size");
  EXPECT_EQ(toks[1].kind, TokenKind::Colon);
}

TEST(SyntaxLexer, SkipsLineComments)
{
  const auto toks = lex("// header\nvar x = 1; // trailing\n");
  ASSERT_EQ(toks.size(), 6U);
  EXPECT_EQ(toks[0].text, "var");
  EXPECT_EQ(toks.back().kind, TokenKind::Eof);
}

TEST(SyntaxLexer, NumericLiterals)
{
  const auto toks = lex("42 -7 3.25 100px 50% 1.5px -2.5%");
  const std::vector<TokenKind> expected = {
    TokenKind::IntLiteral,   TokenKind::IntLiteral,     TokenKind::FloatLiteral,
    TokenKind::PixelLiteral, TokenKind::PercentLiteral, TokenKind::PixelLiteral,
    TokenKind::PercentLiteral, TokenKind::Eof,
  };
  EXPECT_EQ(kinds(toks), expected);
  EXPECT_EQ(toks[1].text, "-7");
  EXPECT_EQ(toks[3].text, "100px");
  EXPECT_EQ(toks[6].text, "-2.5%");
}

TEST(SyntaxLexer, LeadingDotNumberIsLexError)
{
  DiagnosticBag diags;
  const auto toks = lex(".1", &diags);
  ASSERT_TRUE(diags.has_errors());
  EXPECT_TRUE(diags.has_errors_in(DiagnosticPhase::Lex));
  EXPECT_EQ(diags.all()[0].code, "L003");
  EXPECT_EQ(toks[0].kind, TokenKind::Unknown);
}

TEST(SyntaxLexer, TrailingDotNumberIsLexError)
{
  DiagnosticBag diags;
  (void)lex("1.", &diags);
  ASSERT_EQ(diags.error_count(), 1U);
  EXPECT_EQ(diags.all()[0].code, "L003");
}

TEST(SyntaxLexer, InvalidUnitSuffix)
{
  DiagnosticBag diags;
  const auto toks = lex("10em", &diags);
  ASSERT_EQ(diags.error_count(), 1U);
  EXPECT_EQ(diags.all()[0].code, "L004");
  EXPECT_NE(diags.all()[0].message.find("'em'"), std::string::npos);
  // The bad literal is consumed as a single token
  EXPECT_EQ(toks.size(), 2U);
}

TEST(SyntaxLexer, StringDelimiters)
{
  const auto toks = lex(R"("double" 'single' `back` "it's")");
  ASSERT_EQ(toks.size(), 5U);
  EXPECT_EQ(toks[0].text, "double");
  EXPECT_EQ(toks[1].text, "single");
  EXPECT_EQ(toks[2].text, "back");
  EXPECT_EQ(toks[3].text, "it's");
  for (size_t i = 0; i < 4; ++i) {
    EXPECT_EQ(toks[i].kind, TokenKind::StringLiteral);
  }
}

TEST(SyntaxLexer, UnterminatedString)
{
  DiagnosticBag diags;
  (void)lex("\"open\nlayout div;", &diags);
  ASSERT_EQ(diags.error_count(), 1U);
  EXPECT_EQ(diags.all()[0].code, "L002");
}

TEST(SyntaxLexer, StringsMustBeValidUtf8)
{
  DiagnosticBag ok;
  const auto good = lex("\"caf\xC3\xA9 \xE2\x9C\x93 \xF0\x9F\x90\xB1\"", &ok);
  EXPECT_TRUE(ok.empty());
  EXPECT_EQ(good[0].kind, TokenKind::StringLiteral);

  // Stray byte, truncated sequence, overlong '/', UTF-16 surrogate
  for (const std::string_view src :
       {"\"\xFF\"", "'ab\xE2\x9C'", "\"\xC0\xAF\"", "`\xED\xA0\x80`"}) {
    DiagnosticBag diags;
    const auto toks = lex(src, &diags);
    EXPECT_EQ(toks[0].kind, TokenKind::Unknown) << src.size();
    ASSERT_EQ(diags.error_count(), 1U);
    EXPECT_EQ(diags.all()[0].code, "L007");
    EXPECT_EQ(diags.all()[0].phase, DiagnosticPhase::Lex);
  }

  // Lexing goes on after the bad literal
  DiagnosticBag diags;
  const auto toks = lex("a: \"\xFF\"; b", &diags);
  EXPECT_EQ(toks.back().kind, TokenKind::Eof);
  EXPECT_EQ(toks[toks.size() - 2].text, "b");
}

TEST(SyntaxLexer, ColorLiterals)
{
  DiagnosticBag diags;
  const auto toks = lex("#abc #abcd #aabbcc #aabbccdd", &diags);
  EXPECT_FALSE(diags.has_errors());
  ASSERT_EQ(toks.size(), 5U);
  for (size_t i = 0; i < 4; ++i) {
    EXPECT_EQ(toks[i].kind, TokenKind::ColorLiteral);
  }
  EXPECT_EQ(toks[2].text, "#aabbcc");
}

TEST(SyntaxLexer, InvalidColorLiterals)
{
  {
    DiagnosticBag diags;
    (void)lex("#abcde", &diags);
    ASSERT_EQ(diags.error_count(), 1U);
    EXPECT_EQ(diags.all()[0].code, "L005");
  }
  {
    DiagnosticBag diags;
    (void)lex("#12g", &diags);
    ASSERT_EQ(diags.error_count(), 1U);
    EXPECT_NE(diags.all()[0].message.find("'g'"), std::string::npos);
  }
}

TEST(SyntaxLexer, VariablesAndBooleans)
{
  DiagnosticBag diags;
  const auto toks = lex("$accent true false $ x", &diags);
  ASSERT_GE(toks.size(), 4U);
  EXPECT_EQ(toks[0].kind, TokenKind::Variable);
  EXPECT_EQ(toks[0].text, "accent");
  EXPECT_EQ(toks[1].kind, TokenKind::BoolLiteral);
  EXPECT_EQ(toks[2].kind, TokenKind::BoolLiteral);
  EXPECT_EQ(toks[3].kind, TokenKind::Unknown);
  ASSERT_EQ(diags.error_count(), 1U);
  EXPECT_EQ(diags.all()[0].code, "L006");
}

TEST(SyntaxLexer, UnexpectedCharacterKeepsLexing)
{
  DiagnosticBag diags;
  const auto toks = lex("a @ b", &diags);
  EXPECT_EQ(diags.error_count(), 1U);
  EXPECT_EQ(diags.all()[0].code, "L001");
  ASSERT_EQ(toks.size(), 4U);
  EXPECT_EQ(toks[2].text, "b");
}

TEST(SyntaxLexer, TracksLineAndColumn)
{
  const auto toks = lex("var x = 1;\n  layout div;");
  ASSERT_GE(toks.size(), 6U);
  EXPECT_EQ(toks[0].loc.line, 1U);
  EXPECT_EQ(toks[0].loc.column, 1U);
  EXPECT_EQ(toks[5].text, "layout");
  EXPECT_EQ(toks[5].loc.line, 2U);
  EXPECT_EQ(toks[5].loc.column, 3U);
}

TEST(SyntaxLexer, EofRepeats)
{
  Lexer lexer(FileId{0}, "");
  EXPECT_EQ(lexer.next_token().kind, TokenKind::Eof);
  EXPECT_EQ(lexer.next_token().kind, TokenKind::Eof);
}

// neko_ui/syntax/lexer.hpp - On-demand tokenizer for NekoMaid UI source
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "neko_ui/basic/diagnostic.hpp"
#include "neko_ui/syntax/token.hpp"

namespace neko_ui::syntax
{

/**
 * Converts source text into tokens one at a time.
 *
 * Whitespace and `//` comments are skipped. Malformed input is reported to
 * the DiagnosticBag (phase Lex) and surfaces as a TokenKind::Unknown token,
 * after which lexing continues with the next character. The lexer never
 * copies the source; tokens view into it.
 */
class Lexer
{
public:
  Lexer(FileId file_id, std::string_view src, DiagnosticBag * diags = nullptr)
  : file_id_(file_id), src_(src), diags_(diags)
  {
  }

  /// Produce the next token; returns Eof forever once the input is exhausted.
  [[nodiscard]] Token next_token();

  /// Drain the remaining input, including the trailing Eof token.
  [[nodiscard]] std::vector<Token> lex_all();

  /// Restart from the beginning of the source.
  void reset() noexcept
  {
    pos_ = 0;
    line_ = 1;
    line_start_ = 0;
  }

  [[nodiscard]] FileId file_id() const noexcept { return file_id_; }

private:
  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept;

  void advance(size_t n = 1) noexcept;

  void skip_whitespace_and_comments();

  [[nodiscard]] Token lex_identifier_or_keyword();
  [[nodiscard]] Token lex_variable();
  [[nodiscard]] Token lex_number();
  [[nodiscard]] Token lex_string();
  [[nodiscard]] Token lex_color();

  [[nodiscard]] Token make_token(TokenKind kind, uint32_t start, std::string_view text) const;
  [[nodiscard]] Token error_token(uint32_t start, const char * code, std::string message);

  [[nodiscard]] SourceRange make_range(uint32_t start, uint32_t end) const noexcept
  {
    return {file_id_, start, end};
  }

  FileId file_id_;
  std::string_view src_;
  DiagnosticBag * diags_;

  size_t pos_ = 0;
  uint32_t line_ = 1;
  size_t line_start_ = 0;
  LineColumn token_loc_;
};

}  // namespace neko_ui::syntax

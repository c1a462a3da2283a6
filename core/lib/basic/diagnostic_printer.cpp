// neko_ui/basic/diagnostic_printer.cpp - Terminal rendering of diagnostics
//
// fmt does the layout, rang the colours.
//
#include "neko_ui/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <ostream>
#include <rang.hpp>
#include <string>

namespace neko_ui
{

namespace
{

// Width of the line-number column, e.g. "   12 "
constexpr size_t k_number_width = 5;

/// Tabs become four spaces so markers line up with what the terminal shows.
std::string expand_tabs(std::string_view text)
{
  std::string out;
  out.reserve(text.size());
  for (const char c : text) {
    out += c == '\t' ? std::string(4, ' ') : std::string(1, c);
  }
  return out;
}

/// Visual width of the first `bytes` bytes of `line`
size_t visual_width(std::string_view line, size_t bytes)
{
  bytes = std::min(bytes, line.size());
  const auto tabs = static_cast<size_t>(std::count(line.begin(), line.begin() + bytes, '\t'));
  return bytes + tabs * 3;
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  rang::setControlMode(use_color_ ? rang::control::Auto : rang::control::Off);
}

void DiagnosticPrinter::paint(std::string_view text, Tone tone, bool bold)
{
  if (!use_color_) {
    os_ << text;
    return;
  }
  switch (tone) {
    case Tone::Error:
      os_ << rang::fg::red;
      break;
    case Tone::Warning:
      os_ << rang::fg::yellow;
      break;
    case Tone::Gutter:
      os_ << rang::fg::cyan;
      break;
    case Tone::Insert:
      os_ << rang::fg::green;
      break;
  }
  if (bold) {
    os_ << rang::style::bold;
  }
  os_ << text << rang::style::reset << rang::fg::reset;
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceRegistry & sources)
{
  emit_header(diag);

  const SourceRange primary = diag.primary_range();
  const SourceFile * file = sources.get_file(primary.file_id());
  if (file != nullptr) {
    const FullSourceRange at = file->full_range(primary);
    paint(std::string(k_number_width - 2, ' ') + "-->", Tone::Gutter);
    fmt::print(os_, " {}", sources.display_path(primary.file_id()));
    if (at.is_valid()) {
      fmt::print(os_, ":{}:{}", at.start_line, at.start_column);
    }
    os_ << '\n';
    emit_blank_gutter();
  }

  for (const auto & label : diag.labels) {
    const SourceFile * source = sources.get_file(label.range.file_id());
    if (source != nullptr) {
      emit_snippet(*source, label);
    } else if (!label.message.empty()) {
      emit_footer("note", label.message);
    }
  }

  for (const auto & fixit : diag.fixits) {
    if (const SourceFile * source = sources.get_file(fixit.range.file_id())) {
      emit_fixit(*source, fixit);
    } else {
      emit_footer("fix", fmt::format("insert \"{}\"", fixit.replacement_text));
    }
  }

  if (diag.help_message) {
    emit_footer("help", *diag.help_message);
  }
  os_ << '\n';
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceRegistry & sources)
{
  for (const Diagnostic * d : diags.in_source_order()) {
    print(*d, sources);
  }
}

void DiagnosticPrinter::print_summary(const DiagnosticBag & diags)
{
  const size_t errors = diags.error_count();
  const size_t warnings = diags.warning_count();
  if (errors == 0 && warnings == 0) {
    return;
  }
  paint(
    fmt::format(
      "{} error{}, {} warning{}", errors, errors == 1 ? "" : "s", warnings,
      warnings == 1 ? "" : "s"),
    errors > 0 ? Tone::Error : Tone::Warning);
  os_ << '\n';
}

// ============================================================================
// Pieces
// ============================================================================

void DiagnosticPrinter::emit_header(const Diagnostic & diag)
{
  const bool error = diag.is_error();
  std::string head = error ? "error" : "warning";
  if (!diag.code.empty()) {
    head += fmt::format("[{}]", diag.code);
  }
  paint(head, error ? Tone::Error : Tone::Warning);
  fmt::print(os_, ": {}\n", diag.message);
}

void DiagnosticPrinter::emit_line_number(uint32_t line)
{
  paint(fmt::format(" {:>{}} | ", line, k_number_width - 1), Tone::Gutter);
}

void DiagnosticPrinter::emit_blank_gutter()
{
  paint(std::string(k_number_width + 1, ' ') + "|", Tone::Gutter);
  os_ << '\n';
}

void DiagnosticPrinter::emit_snippet(const SourceFile & source, const Label & label)
{
  const FullSourceRange at = source.full_range(label.range);
  if (!at.is_valid()) {
    return;
  }
  const std::string_view line = source.line_text(at.start_line - 1);

  emit_line_number(at.start_line);
  fmt::print(os_, "{}\n", expand_tabs(line));

  // A range running past its first line is underlined to the end of that line
  const size_t from = at.start_column - 1;
  const size_t to = at.end_line == at.start_line ? at.end_column - 1 : line.size();
  const size_t indent = visual_width(line, from);
  const size_t width = std::max<size_t>(visual_width(line, to) - indent, 1);

  paint(std::string(k_number_width + 1, ' ') + "| ", Tone::Gutter);
  os_ << std::string(indent, ' ');
  const bool primary = label.style == LabelStyle::Primary;
  std::string marks(width, primary ? '^' : '-');
  if (!label.message.empty()) {
    marks += ' ' + label.message;
  }
  paint(marks, primary ? Tone::Error : Tone::Gutter, primary);
  os_ << '\n';
}

void DiagnosticPrinter::emit_fixit(const SourceFile & source, const FixIt & fixit)
{
  const FullSourceRange at = source.full_range(fixit.range);
  if (!at.is_valid()) {
    emit_footer("fix", fmt::format("insert \"{}\"", fixit.replacement_text));
    return;
  }

  emit_blank_gutter();
  paint("help", Tone::Gutter);
  fmt::print(os_, ": add '{}' here\n", fixit.replacement_text);
  emit_blank_gutter();

  // Preview the line with the text inserted after the range
  const std::string_view line = source.line_text(at.end_line - 1);
  const size_t split = std::min<size_t>(at.end_column - 1, line.size());
  const std::string before = expand_tabs(line.substr(0, split));

  emit_line_number(at.end_line);
  fmt::print(
    os_, "{}{}{}\n", before, fixit.replacement_text, expand_tabs(line.substr(split)));

  paint(std::string(k_number_width + 1, ' ') + "| ", Tone::Gutter);
  os_ << std::string(before.size(), ' ');
  paint(std::string(std::max<size_t>(fixit.replacement_text.size(), 1), '+'), Tone::Insert);
  os_ << '\n';
}

void DiagnosticPrinter::emit_footer(std::string_view kind, std::string_view message)
{
  emit_blank_gutter();
  paint(std::string(k_number_width + 1, ' ') + "= ", Tone::Gutter);
  fmt::print(os_, "{}: {}\n", kind, message);
}

}  // namespace neko_ui

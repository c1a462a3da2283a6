// neko_ui/basic/diagnostic_printer.hpp - Terminal rendering of diagnostics
#pragma once

#include <cstdint>
#include <iosfwd>
#include <string_view>

#include "neko_ui/basic/diagnostic.hpp"
#include "neko_ui/basic/source_manager.hpp"

namespace neko_ui
{

/**
 * Renders diagnostics with their source context:
 *
 *   error[R001]: unresolved variable '$accent'
 *     --> ui/main.nui:5:12
 *      |
 *    5 |   color: $accent;
 *      |          ^^^^^^^ not bound in any enclosing scope
 *      |
 *      = help: declare it with 'var accent = ...;'
 *
 * Diagnostics without a location (a file that cannot be read) print the
 * header and footers only.
 */
class DiagnosticPrinter
{
public:
  /**
   * @param os Output stream (std::cerr for tools, a log sink for reloads)
   * @param use_color Emit terminal colours when the stream is a terminal
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag, const SourceRegistry & sources);

  /// Every diagnostic of the bag, in source order.
  void print_all(const DiagnosticBag & diags, const SourceRegistry & sources);

  /// "N errors, M warnings" line; nothing for an empty bag.
  void print_summary(const DiagnosticBag & diags);

private:
  enum class Tone : uint8_t {
    Error,
    Warning,
    Gutter,
    Insert,
  };

  void paint(std::string_view text, Tone tone, bool bold = true);

  void emit_header(const Diagnostic & diag);
  void emit_snippet(const SourceFile & source, const Label & label);
  void emit_fixit(const SourceFile & source, const FixIt & fixit);
  void emit_footer(std::string_view kind, std::string_view message);
  void emit_line_number(uint32_t line);
  void emit_blank_gutter();

  std::ostream & os_;
  bool use_color_;
};

}  // namespace neko_ui

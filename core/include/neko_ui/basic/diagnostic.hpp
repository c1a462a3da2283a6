// neko_ui/basic/diagnostic.hpp - Diagnostics for lexing, parsing, resolution and loading
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "neko_ui/basic/source_manager.hpp"

namespace neko_ui
{

enum class Severity : uint8_t {
  Error,
  Warning,
};

/**
 * Pipeline stage that produced a diagnostic.
 *
 * Lex, Parse and Resolve map to LexError, ParseError and ResolutionError.
 * Load covers file access and import graph problems in the driver.
 */
enum class DiagnosticPhase : uint8_t {
  Lex,
  Parse,
  Resolve,
  Load,
};

[[nodiscard]] constexpr std::string_view to_string(DiagnosticPhase p) noexcept
{
  switch (p) {
    case DiagnosticPhase::Lex:
      return "lex";
    case DiagnosticPhase::Parse:
      return "parse";
    case DiagnosticPhase::Resolve:
      return "resolve";
    case DiagnosticPhase::Load:
      return "load";
  }
  return "";
}

enum class LabelStyle {
  Primary,    // direct cause
  Secondary,  // related location
};

struct Label
{
  SourceRange range;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

/// Text to insert at the end of `range`
struct FixIt
{
  SourceRange range;
  std::string replacement_text;
};

struct Diagnostic
{
  Severity severity = Severity::Error;
  DiagnosticPhase phase = DiagnosticPhase::Parse;
  std::string code;  // e.g. "P001"
  std::string message;

  /// What the parser wanted and what it saw (ParseError only)
  std::string expected;
  std::string found;

  std::vector<Label> labels;
  std::vector<FixIt> fixits;
  std::optional<std::string> help_message;

  [[nodiscard]] bool is_error() const noexcept { return severity == Severity::Error; }

  /// First Primary label, else the first label, else nullptr
  [[nodiscard]] const Label * primary_label() const noexcept;
  [[nodiscard]] SourceRange primary_range() const noexcept;
};

// ============================================================================
// Diagnostic codes
// ============================================================================

// The letter of a code names its phase: L lex, P parse, R resolve, D load.
namespace diag_code
{

inline constexpr const char * k_unexpected_char = "L001";
inline constexpr const char * k_unterminated_string = "L002";
inline constexpr const char * k_malformed_number = "L003";
inline constexpr const char * k_invalid_suffix = "L004";
inline constexpr const char * k_invalid_color = "L005";
inline constexpr const char * k_invalid_variable = "L006";
inline constexpr const char * k_invalid_utf8 = "L007";

inline constexpr const char * k_unexpected_token = "P001";
inline constexpr const char * k_missing_semicolon = "P002";
inline constexpr const char * k_duplicate_key = "P003";
inline constexpr const char * k_duplicate_property = "P004";
inline constexpr const char * k_integer_overflow = "P005";
inline constexpr const char * k_nesting_too_deep = "P006";

inline constexpr const char * k_unresolved_variable = "R001";
inline constexpr const char * k_undefined_style = "R002";
inline constexpr const char * k_unknown_widget = "R003";
inline constexpr const char * k_unknown_module = "R004";
inline constexpr const char * k_redeclared_variable = "R005";

inline constexpr const char * k_unreadable_file = "D001";
inline constexpr const char * k_import_not_found = "D002";
inline constexpr const char * k_import_cycle = "D003";

}  // namespace diag_code

/// Phase named by the first letter of `code`, if it is one of L/P/R/D
[[nodiscard]] std::optional<DiagnosticPhase> phase_of_code(std::string_view code) noexcept;

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Fluent builder that adds the diagnostic to its bag when destroyed.
 *
 *   diags.report_error(range, "unknown widget 'x'", "not a registered widget")
 *     .with_code(diag_code::k_unknown_widget)
 *     .with_help("registered widgets: div, img, p, span");
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  /// Also sets the phase when the code's letter names one.
  DiagnosticBuilder & with_code(std::string code);
  DiagnosticBuilder & with_phase(DiagnosticPhase phase);
  DiagnosticBuilder & with_expectation(std::string expected, std::string found);
  DiagnosticBuilder & with_secondary_label(SourceRange range, std::string msg);
  DiagnosticBuilder & with_fixit(SourceRange range, std::string replacement);
  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag * bag_;
  Diagnostic diagnostic_;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

/// Diagnostics in report order, with running error and warning counts.
class DiagnosticBag
{
public:
  DiagnosticBuilder report_error(
    SourceRange range, std::string message, std::string label_message = "");
  DiagnosticBuilder report_warning(
    SourceRange range, std::string message, std::string label_message = "");

  void add(Diagnostic diag);

  [[nodiscard]] const std::vector<Diagnostic> & all() const noexcept { return diagnostics_; }
  [[nodiscard]] bool empty() const noexcept { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const noexcept { return diagnostics_.size(); }

  [[nodiscard]] size_t error_count() const noexcept { return errors_; }
  [[nodiscard]] size_t warning_count() const noexcept { return warnings_; }
  [[nodiscard]] bool has_errors() const noexcept { return errors_ > 0; }
  [[nodiscard]] bool has_warnings() const noexcept { return warnings_ > 0; }

  /// True if an error of the given phase was reported
  [[nodiscard]] bool has_errors_in(DiagnosticPhase phase) const;

  /// First error in report order, or nullptr
  [[nodiscard]] const Diagnostic * first_error() const;

  /// Diagnostics ordered by primary location (file, then offset); ties keep
  /// report order and location-less diagnostics come first.
  [[nodiscard]] std::vector<const Diagnostic *> in_source_order() const;

  void merge(const DiagnosticBag & other);
  void clear() noexcept;

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
  size_t errors_ = 0;
  size_t warnings_ = 0;
};

}  // namespace neko_ui

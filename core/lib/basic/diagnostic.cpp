// neko_ui/basic/diagnostic.cpp - Diagnostic builder and bag
#include "neko_ui/basic/diagnostic.hpp"

#include <algorithm>
#include <utility>

namespace neko_ui
{

namespace
{

Diagnostic with_primary(
  Severity severity, SourceRange range, std::string message, std::string label_message)
{
  Diagnostic d;
  d.severity = severity;
  d.message = std::move(message);
  d.labels.push_back(Label{range, std::move(label_message), LabelStyle::Primary});
  return d;
}

}  // namespace

std::optional<DiagnosticPhase> phase_of_code(std::string_view code) noexcept
{
  if (code.empty()) {
    return std::nullopt;
  }
  switch (code.front()) {
    case 'L':
      return DiagnosticPhase::Lex;
    case 'P':
      return DiagnosticPhase::Parse;
    case 'R':
      return DiagnosticPhase::Resolve;
    case 'D':
      return DiagnosticPhase::Load;
    default:
      return std::nullopt;
  }
}

const Label * Diagnostic::primary_label() const noexcept
{
  const auto it = std::find_if(labels.begin(), labels.end(), [](const Label & l) {
    return l.style == LabelStyle::Primary;
  });
  if (it != labels.end()) {
    return &*it;
  }
  return labels.empty() ? nullptr : &labels.front();
}

SourceRange Diagnostic::primary_range() const noexcept
{
  const Label * l = primary_label();
  return l != nullptr ? l->range : SourceRange{};
}

// ============================================================================
// DiagnosticBuilder
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(&bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(std::exchange(other.bag_, nullptr)), diagnostic_(std::move(other.diagnostic_))
{
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (bag_ != nullptr) {
    bag_->add(std::move(diagnostic_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::with_code(std::string code)
{
  if (const auto phase = phase_of_code(code)) {
    diagnostic_.phase = *phase;
  }
  diagnostic_.code = std::move(code);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_phase(DiagnosticPhase phase)
{
  diagnostic_.phase = phase;
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_expectation(std::string expected, std::string found)
{
  diagnostic_.expected = std::move(expected);
  diagnostic_.found = std::move(found);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_secondary_label(SourceRange range, std::string msg)
{
  diagnostic_.labels.push_back(Label{range, std::move(msg), LabelStyle::Secondary});
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_fixit(SourceRange range, std::string replacement)
{
  diagnostic_.fixits.push_back(FixIt{range, std::move(replacement)});
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_help(std::string help_msg)
{
  diagnostic_.help_message = std::move(help_msg);
  return *this;
}

// ============================================================================
// DiagnosticBag
// ============================================================================

DiagnosticBuilder DiagnosticBag::report_error(
  SourceRange range, std::string message, std::string label_message)
{
  return {
    *this, with_primary(Severity::Error, range, std::move(message), std::move(label_message))};
}

DiagnosticBuilder DiagnosticBag::report_warning(
  SourceRange range, std::string message, std::string label_message)
{
  return {
    *this, with_primary(Severity::Warning, range, std::move(message), std::move(label_message))};
}

void DiagnosticBag::add(Diagnostic diag)
{
  if (diag.is_error()) {
    ++errors_;
  } else {
    ++warnings_;
  }
  diagnostics_.push_back(std::move(diag));
}

bool DiagnosticBag::has_errors_in(DiagnosticPhase phase) const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [phase](const Diagnostic & d) {
    return d.is_error() && d.phase == phase;
  });
}

const Diagnostic * DiagnosticBag::first_error() const
{
  const auto it = std::find_if(
    diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) { return d.is_error(); });
  return it == diagnostics_.end() ? nullptr : &*it;
}

std::vector<const Diagnostic *> DiagnosticBag::in_source_order() const
{
  std::vector<const Diagnostic *> ordered;
  ordered.reserve(diagnostics_.size());
  for (const auto & d : diagnostics_) {
    ordered.push_back(&d);
  }
  std::stable_sort(ordered.begin(), ordered.end(), [](const Diagnostic * a, const Diagnostic * b) {
    return a->primary_range() < b->primary_range();
  });
  return ordered;
}

void DiagnosticBag::merge(const DiagnosticBag & other)
{
  for (const auto & d : other.diagnostics_) {
    add(d);
  }
}

void DiagnosticBag::clear() noexcept
{
  diagnostics_.clear();
  errors_ = 0;
  warnings_ = 0;
}

}  // namespace neko_ui

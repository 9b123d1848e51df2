// an_lex/basic/diagnostic.cpp - Diagnostic implementation
#include "an_lex/basic/diagnostic.hpp"

#include <utility>

namespace an_lex
{

namespace
{

Diagnostic make_diagnostic(SourceRange range, std::string message, std::string label_message)
{
  Diagnostic d;
  d.message = std::move(message);
  d.labels.push_back(Label{range, std::move(label_message), LabelStyle::Primary});
  return d;
}

}  // namespace

const Label * Diagnostic::primary_label() const noexcept
{
  for (const auto & l : labels) {
    if (l.style == LabelStyle::Primary) {
      return &l;
    }
  }
  if (!labels.empty()) {
    return &labels.front();
  }
  return nullptr;
}

SourceRange Diagnostic::primary_range() const noexcept
{
  const Label * l = primary_label();
  if (l == nullptr) {
    return {};
  }
  return l->range;
}

// ============================================================================
// DiagnosticBuilder
// ============================================================================

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag)
: bag_(bag), diagnostic_(std::move(diag))
{
}

DiagnosticBuilder::DiagnosticBuilder(DiagnosticBuilder && other) noexcept
: bag_(other.bag_), diagnostic_(std::move(other.diagnostic_)), active_(other.active_)
{
  other.active_ = false;
}

DiagnosticBuilder::~DiagnosticBuilder()
{
  if (active_) {
    bag_.add(std::move(diagnostic_));
  }
}

DiagnosticBuilder & DiagnosticBuilder::with_code(std::string code)
{
  diagnostic_.code = std::move(code);
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_label(
  SourceRange range, std::string msg, LabelStyle style)
{
  diagnostic_.labels.push_back(Label{range, std::move(msg), style});
  return *this;
}

DiagnosticBuilder & DiagnosticBuilder::with_secondary_label(SourceRange range, std::string msg)
{
  return with_label(range, std::move(msg), LabelStyle::Secondary);
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
  return {*this, make_diagnostic(range, std::move(message), std::move(label_message))};
}

void DiagnosticBag::add(Diagnostic && diag) { diagnostics_.push_back(std::move(diag)); }

}  // namespace an_lex

// an_lex/basic/diagnostic.hpp - Diagnostic types for lexing failures
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "an_lex/basic/source_manager.hpp"

namespace an_lex
{

// ============================================================================
// Core Structures
// ============================================================================

enum class LabelStyle {
  Primary,    // where the failure happened
  Secondary,  // related location, e.g. the opening delimiter
};

struct Label
{
  SourceRange range;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

struct Diagnostic
{
  std::string code;  // e.g., "L0004"
  std::string message;

  std::vector<Label> labels;
  std::optional<std::string> help_message;

  [[nodiscard]] const Label * primary_label() const noexcept;
  [[nodiscard]] SourceRange primary_range() const noexcept;
};

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Fluent builder; the finished diagnostic is added to the bag on destruction.
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);

  DiagnosticBuilder & with_label(
    SourceRange range, std::string msg, LabelStyle style = LabelStyle::Primary);

  DiagnosticBuilder & with_secondary_label(SourceRange range, std::string msg);

  DiagnosticBuilder & with_help(std::string help_msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  DiagnosticBuilder report_error(
    SourceRange range, std::string message, std::string label_message = "");

  void add(Diagnostic && diag);

  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }


  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace an_lex

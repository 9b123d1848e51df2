// an_lex/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "an_lex/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace an_lex
{

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceFile & source)
{
  const FullSourceRange primary_fr = source.get_full_range(diag.primary_range());

  print_header(diag);

  // --> file:line:col
  if (primary_fr.is_valid()) {
    fmt::print(
      os_, "{} {}:{}:{}\n", gutter_arrow(), source.display_name(), primary_fr.start_line,
      primary_fr.start_column);
  } else {
    fmt::print(os_, "{} {}\n", gutter_arrow(), source.display_name());
  }

  fmt::print(os_, "{}\n", gutter_pipe());

  for (const auto & label : diag.labels) {
    print_label_context(label, source);
  }

  if (diag.help_message) {
    print_help(*diag.help_message);
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceFile & source)
{
  std::vector<const Diagnostic *> sorted;
  sorted.reserve(diags.size());
  for (const auto & d : diags) {
    sorted.push_back(&d);
  }

  std::stable_sort(sorted.begin(), sorted.end(), [](const Diagnostic * a, const Diagnostic * b) {
    return a->primary_range().get_begin() < b->primary_range().get_begin();
  });

  for (const auto * d : sorted) {
    print(*d, source);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_header(const Diagnostic & diag)
{
  if (use_color_) {
    os_ << rang::style::bold << rang::fg::red << "error";
    if (!diag.code.empty()) {
      os_ << "[" << diag.code << "]";
    }
    os_ << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
    return;
  }

  if (!diag.code.empty()) {
    fmt::print(os_, "error[{}]: {}\n", diag.code, diag.message);
  } else {
    fmt::print(os_, "error: {}\n", diag.message);
  }
}

void DiagnosticPrinter::print_label_context(const Label & label, const SourceFile & source)
{
  if (!label.range.is_valid()) {
    if (!label.message.empty()) {
      print_note(label.message);
    }
    return;
  }

  const FullSourceRange fr = source.get_full_range(label.range);
  if (!fr.is_valid()) {
    return;
  }

  // Multi-line ranges are marked at their first byte only
  const uint32_t end_col = (fr.end_line == fr.start_line && fr.end_column > fr.start_column)
                             ? fr.end_column
                             : (fr.start_column + 1);

  print_source_line(
    source, fr.start_line - 1, fr.start_column, end_col, label.style, label.message);
}

void DiagnosticPrinter::print_source_line(
  const SourceFile & source, uint32_t line_index, uint32_t start_col, uint32_t end_col,
  LabelStyle style, std::string_view label_message)
{
  const std::string_view line = source.get_line(line_index);
  const uint32_t line_num = line_index + 1;

  std::string cleaned_line;
  cleaned_line.reserve(line.size());
  for (const char c : line) {
    if (c == '\t') {
      cleaned_line += "    ";
    } else {
      cleaned_line += c;
    }
  }

  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", line_num);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", line_num);
  }
  fmt::print(os_, "{}\n", cleaned_line);

  fmt::print(os_, "      {} ", gutter_pipe_only());

  // Columns are byte based; a tab expands to four cells like the echoed line
  std::string marker_prefix;
  uint32_t col = 1;
  for (size_t i = 0; col < start_col && i < line.size(); ++i, ++col) {
    marker_prefix += (line[i] == '\t') ? "    " : " ";
  }
  // Positions at or past the line end (e.g. end of input) still get a marker
  for (; col < start_col; ++col) {
    marker_prefix += ' ';
  }

  const size_t marker_len = (end_col > start_col) ? (end_col - start_col) : 1;
  const char marker_char = (style == LabelStyle::Primary) ? '^' : '-';

  fmt::print(os_, "{}", marker_prefix);
  if (use_color_) {
    if (style == LabelStyle::Primary) {
      os_ << rang::fg::red << rang::style::bold;
    } else {
      os_ << rang::fg::cyan;
    }
  }
  fmt::print(os_, "{}", std::string(marker_len, marker_char));
  if (!label_message.empty()) {
    fmt::print(os_, " {}", label_message);
  }
  if (use_color_) {
    os_ << rang::style::reset << rang::fg::reset;
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_help(std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());

  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "help: {}\n", message);
  } else {
    fmt::print(os_, "   = help: {}\n", message);
  }
}

void DiagnosticPrinter::print_note(std::string_view message)
{
  fmt::print(os_, "{}\n", gutter_pipe());

  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "note: {}\n", message);
  } else {
    fmt::print(os_, "   = note: {}\n", message);
  }
}

// =============================================================================
// Gutter helpers
// =============================================================================

std::string DiagnosticPrinter::gutter_arrow() const
{
  if (use_color_) {
    return fmt::format("{} -->{}", "\033[1;36m", "\033[0m");
  }
  return "  -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  if (use_color_) {
    return fmt::format("{}      |{}", "\033[1;36m", "\033[0m");
  }
  return "      |";
}

std::string DiagnosticPrinter::gutter_pipe_only() const
{
  if (use_color_) {
    return fmt::format("{}|{}", "\033[1;36m", "\033[0m");
  }
  return "|";
}

}  // namespace an_lex

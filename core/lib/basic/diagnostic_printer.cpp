// flowan/basic/diagnostic_printer.cpp - Rust-style diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "flowan/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace flowan
{

namespace
{

std::string_view severity_name(Severity severity)
{
  switch (severity) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Info:
      return "info";
    case Severity::Hint:
      return "hint";
  }
  return "error";
}

rang::fg severity_color(Severity severity)
{
  switch (severity) {
    case Severity::Error:
      return rang::fg::red;
    case Severity::Warning:
      return rang::fg::yellow;
    case Severity::Info:
      return rang::fg::cyan;
    case Severity::Hint:
      return rang::fg::green;
  }
  return rang::fg::red;
}

/// Tabs become four spaces so markers line up
std::string expand_tabs(std::string_view line)
{
  std::string out;
  out.reserve(line.size());
  for (const char c : line) {
    if (c == '\t') {
      out += "    ";
    } else {
      out += c;
    }
  }
  return out;
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceManager & source)
{
  std::string filename = source.get_file_path().empty() ? std::string("<input>")
                                                        : source.get_file_path().string();
  const FullSourceRange primary = source.get_full_range(diag.primary_range());

  print_severity_header(diag);

  if (primary.is_valid()) {
    fmt::print(
      os_, "{} {}:{}:{}\n", gutter_arrow(), filename, primary.start_line, primary.start_column);
  } else if (diag.primary_range().is_valid()) {
    // No text loaded: fall back to byte offsets
    fmt::print(
      os_, "{} {}@{}\n", gutter_arrow(), filename,
      diag.primary_range().get_begin().get_offset());
  } else {
    fmt::print(os_, "{} {}\n", gutter_arrow(), filename);
  }

  if (source.has_source()) {
    fmt::print(os_, "{}\n", gutter_pipe());
    for (const auto & label : diag.labels) {
      print_label(label, source);
    }
  }

  if (diag.help_message) {
    print_help(*diag.help_message);
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceManager & source)
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

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  const std::string_view name = severity_name(diag.severity);
  if (use_color_) {
    os_ << rang::style::bold << severity_color(diag.severity) << name;
    if (!diag.code.empty()) {
      os_ << "[" << diag.code << "]";
    }
    os_ << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
    return;
  }

  if (!diag.code.empty()) {
    fmt::print(os_, "{}[{}]: {}\n", name, diag.code, diag.message);
  } else {
    fmt::print(os_, "{}: {}\n", name, diag.message);
  }
}

void DiagnosticPrinter::print_label(const Label & label, const SourceManager & source)
{
  const FullSourceRange fr = source.get_full_range(label.range);
  if (!fr.is_valid()) {
    if (!label.message.empty()) {
      print_note(label.message);
    }
    return;
  }

  const std::string_view raw_line = source.get_line(fr.start_line - 1);
  const std::string line = expand_tabs(raw_line);

  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", fr.start_line);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", fr.start_line);
  }
  fmt::print(os_, "{}\n", line);

  // Marker column in expanded coordinates
  size_t prefix = 0;
  for (uint32_t i = 0; i + 1 < fr.start_column && i < raw_line.size(); ++i) {
    prefix += raw_line[i] == '\t' ? 4 : 1;
  }
  size_t width = 1;
  if (fr.end_line == fr.start_line && fr.end_column > fr.start_column) {
    width = fr.end_column - fr.start_column;
  } else if (line.size() > prefix) {
    width = line.size() - prefix;
  }

  const char marker = label.style == LabelStyle::Primary ? '^' : '-';
  fmt::print(os_, "      | {}", std::string(prefix, ' '));
  if (use_color_) {
    os_ << (label.style == LabelStyle::Primary ? rang::fg::red : rang::fg::cyan)
        << rang::style::bold;
  }
  fmt::print(os_, "{}", std::string(width, marker));
  if (!label.message.empty()) {
    fmt::print(os_, " {}", label.message);
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

std::string DiagnosticPrinter::gutter_arrow() const
{
  return use_color_ ? std::string("\033[1;36m  -->\033[0m") : std::string("  -->");
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  return use_color_ ? std::string("\033[1;36m      |\033[0m") : std::string("      |");
}

}  // namespace flowan

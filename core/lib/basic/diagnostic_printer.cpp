// galaxy_ast/basic/diagnostic_printer.cpp - Diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "galaxy_ast/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <filesystem>
#include <ostream>
#include <rang.hpp>
#include <string>

namespace galaxy_ast
{

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

std::string_view DiagnosticPrinter::severity_name(Severity severity) noexcept
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

void DiagnosticPrinter::print_severity(Severity severity)
{
  if (!use_color_) {
    os_ << severity_name(severity);
    return;
  }
  os_ << rang::style::bold;
  switch (severity) {
    case Severity::Error:
      os_ << rang::fg::red;
      break;
    case Severity::Warning:
      os_ << rang::fg::yellow;
      break;
    case Severity::Info:
      os_ << rang::fg::cyan;
      break;
    case Severity::Hint:
      os_ << rang::fg::green;
      break;
  }
  os_ << severity_name(severity) << rang::fg::reset << rang::style::reset;
}

void DiagnosticPrinter::print(const Diagnostic & diag)
{
  if (!diag.file.empty()) {
    // Relative paths read better when the run is inside the scanned tree.
    std::error_code ec;
    auto rel = std::filesystem::relative(diag.file, std::filesystem::current_path(), ec);
    const std::string shown = (ec || rel.empty()) ? diag.file.string() : rel.string();
    if (diag.line) {
      fmt::print(os_, "{}:{}: ", shown, *diag.line);
    } else {
      fmt::print(os_, "{}: ", shown);
    }
  }

  print_severity(diag.severity);
  if (!diag.code.empty()) {
    fmt::print(os_, "[{}]", diag.code);
  }
  fmt::print(os_, ": {}\n", diag.message);

  if (diag.help_message) {
    fmt::print(os_, "  = help: {}\n", *diag.help_message);
  }
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, Severity min_severity)
{
  // Severity enumerators are ordered from most to least severe.
  for (const auto & d : diags) {
    if (static_cast<uint8_t>(d.severity) <= static_cast<uint8_t>(min_severity)) {
      print(d);
    }
  }
}

}  // namespace galaxy_ast

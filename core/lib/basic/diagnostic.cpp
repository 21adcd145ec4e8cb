// galaxy_ast/basic/diagnostic.cpp - Diagnostic implementation
#include "galaxy_ast/basic/diagnostic.hpp"

#include <algorithm>
#include <utility>

namespace galaxy_ast
{

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

DiagnosticBuilder & DiagnosticBuilder::with_line(uint32_t line)
{
  diagnostic_.line = line;
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

DiagnosticBuilder DiagnosticBag::report(
  Severity severity, std::filesystem::path file, std::string message)
{
  Diagnostic d;
  d.severity = severity;
  d.message = std::move(message);
  d.file = std::move(file);
  return {*this, std::move(d)};
}

DiagnosticBuilder DiagnosticBag::report_error(std::filesystem::path file, std::string message)
{
  return report(Severity::Error, std::move(file), std::move(message));
}

DiagnosticBuilder DiagnosticBag::report_warning(std::filesystem::path file, std::string message)
{
  return report(Severity::Warning, std::move(file), std::move(message));
}

DiagnosticBuilder DiagnosticBag::report_info(std::filesystem::path file, std::string message)
{
  return report(Severity::Info, std::move(file), std::move(message));
}

void DiagnosticBag::add(Diagnostic && diag) { diagnostics_.push_back(std::move(diag)); }

bool DiagnosticBag::has_errors() const
{
  return std::any_of(diagnostics_.begin(), diagnostics_.end(), [](const Diagnostic & d) {
    return d.severity == Severity::Error;
  });
}

bool DiagnosticBag::has_code(std::string_view code) const
{
  return std::any_of(
    diagnostics_.begin(), diagnostics_.end(), [&](const Diagnostic & d) { return d.code == code; });
}

}  // namespace galaxy_ast

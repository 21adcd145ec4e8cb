// galaxy_ast/basic/diagnostic_printer.hpp
//
// Prints run diagnostics as:
//   src/model.py:12: warning[W0001]: failed to process file
//     = help: parser unavailable: no tree-sitter grammar for 'python'
//
#pragma once

#include <iosfwd>
#include <string_view>

#include "galaxy_ast/basic/diagnostic.hpp"

namespace galaxy_ast
{

class DiagnosticPrinter
{
public:
  /**
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag);

  /// Print all diagnostics, at or above `min_severity`, in report order.
  void print_all(const DiagnosticBag & diags, Severity min_severity = Severity::Hint);

private:
  void print_severity(Severity severity);
  [[nodiscard]] static std::string_view severity_name(Severity severity) noexcept;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace galaxy_ast

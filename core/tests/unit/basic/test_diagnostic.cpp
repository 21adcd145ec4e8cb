// test_diagnostic.cpp - Unit tests for DiagnosticBag and DiagnosticPrinter
//
#include <gtest/gtest.h>

#include <iterator>
#include <optional>
#include <sstream>
#include <string>

#include "galaxy_ast/basic/diagnostic.hpp"
#include "galaxy_ast/basic/diagnostic_printer.hpp"

namespace galaxy_ast
{

TEST(DiagnosticTest, BuilderRegistersOnDestruction)
{
  DiagnosticBag bag;
  {
    auto builder = bag.report_warning("a.py", "failed to process file");
    builder.with_code(diag_codes::k_file_failed);
    EXPECT_TRUE(bag.empty());
  }
  ASSERT_EQ(bag.size(), 1U);
  EXPECT_TRUE(bag.has_code("W0001"));
  EXPECT_FALSE(bag.has_errors());

  bag.report_error("galaxy.yaml", "bad value").with_code(diag_codes::k_config_invalid).with_line(4);
  EXPECT_TRUE(bag.has_errors());

  const Diagnostic & last = *std::prev(bag.end());
  EXPECT_EQ(last.severity, Severity::Error);
  EXPECT_EQ(last.line, std::optional<uint32_t>(4));
}

TEST(DiagnosticTest, PrinterFormat)
{
  DiagnosticBag bag;
  bag.report_error("cfg/galaxy.yaml", "bad value").with_code("E0001").with_line(3);
  bag.report_info({}, "grammar missing")
    .with_code(diag_codes::k_grammar_unavailable)
    .with_help("pass --grammar-dir");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(bag);

  const std::string text = out.str();
  EXPECT_NE(text.find("galaxy.yaml:3: error[E0001]: bad value\n"), std::string::npos);
  EXPECT_NE(text.find("info[I0001]: grammar missing\n  = help: pass --grammar-dir\n"), std::string::npos);
}

TEST(DiagnosticTest, PrinterFiltersBySeverity)
{
  DiagnosticBag bag;
  bag.report_warning({}, "kept");
  bag.report_info({}, "dropped");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false);
  printer.print_all(bag, Severity::Warning);

  EXPECT_NE(out.str().find("warning: kept"), std::string::npos);
  EXPECT_EQ(out.str().find("dropped"), std::string::npos);
}

}  // namespace galaxy_ast

// galaxy_ast/basic/diagnostic.hpp - Run-level diagnostics (walk, registry, config)
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace galaxy_ast
{

// ============================================================================
// Core Structures
// ============================================================================

enum class Severity : uint8_t {
  Error,
  Warning,
  Info,
  Hint,
};

/// Stable diagnostic codes emitted by the library.
namespace diag_codes
{
inline constexpr const char * k_config_invalid = "E0001";
inline constexpr const char * k_file_failed = "W0001";
inline constexpr const char * k_dir_unreadable = "W0002";
inline constexpr const char * k_symlink_dir_skipped = "W0003";
inline constexpr const char * k_grammar_unavailable = "I0001";
}  // namespace diag_codes

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;     // e.g., "W0001"
  std::string message;

  /// File the diagnostic refers to (may be empty for run-wide messages)
  std::filesystem::path file;
  /// 1-based line inside `file`, when known
  std::optional<uint32_t> line;

  std::optional<std::string> help_message;
};

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Fluent builder that registers the diagnostic into its bag on destruction (RAII).
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
  DiagnosticBuilder & with_line(uint32_t line);
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

  DiagnosticBuilder report_error(std::filesystem::path file, std::string message);
  DiagnosticBuilder report_warning(std::filesystem::path file, std::string message);
  DiagnosticBuilder report_info(std::filesystem::path file, std::string message);

  void add(Diagnostic && diag);

  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] bool has_errors() const;
  [[nodiscard]] bool has_code(std::string_view code) const;

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  DiagnosticBuilder report(Severity severity, std::filesystem::path file, std::string message);

  std::vector<Diagnostic> diagnostics_;
};

}  // namespace galaxy_ast

// galaxy_ast/language/language.hpp - Language identifiers and extension table
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace galaxy_ast
{

enum class Language : uint8_t {
  Python,
  JavaScript,
  TypeScript,
  Java,
  Metta,  // the DSL, parsed by the hand-written front-end
};

inline constexpr size_t k_language_count = 5;

enum class ParserKind : uint8_t {
  External,  // tree-sitter grammar
  Dsl,       // hand-written DSL front-end
};

struct LanguageInfo
{
  Language language;
  std::string_view id;            // e.g. "python"
  ParserKind parser;
  std::string_view grammar_name;  // tree_sitter_<grammar_name>; empty for the DSL
};

[[nodiscard]] const LanguageInfo & language_info(Language lang) noexcept;

[[nodiscard]] std::string_view to_string(Language lang) noexcept;
[[nodiscard]] std::optional<Language> language_from_string(std::string_view id) noexcept;

[[nodiscard]] std::string_view to_string(ParserKind kind) noexcept;
[[nodiscard]] std::optional<ParserKind> parser_kind_from_string(std::string_view s) noexcept;

/**
 * Detect a language from the file extension (case-insensitive exact match).
 * Returns nullopt for files no parser handles.
 */
[[nodiscard]] std::optional<Language> detect_language(const std::filesystem::path & path);

[[nodiscard]] bool is_dsl(Language lang) noexcept;

/// Every language in the table, in declaration order.
[[nodiscard]] std::vector<Language> available_languages();

}  // namespace galaxy_ast

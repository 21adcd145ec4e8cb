// galaxy_ast/language/language.cpp - Static language tables
#include "galaxy_ast/language/language.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>

namespace galaxy_ast
{
namespace
{

constexpr std::array<LanguageInfo, k_language_count> k_languages = {{
  {Language::Python, "python", ParserKind::External, "python"},
  {Language::JavaScript, "javascript", ParserKind::External, "javascript"},
  {Language::TypeScript, "typescript", ParserKind::External, "typescript"},
  {Language::Java, "java", ParserKind::External, "java"},
  {Language::Metta, "metta", ParserKind::Dsl, ""},
}};

struct ExtensionEntry
{
  std::string_view extension;
  Language language;
};

constexpr ExtensionEntry k_extensions[] = {
  {".py", Language::Python},      {".js", Language::JavaScript}, {".mjs", Language::JavaScript},
  {".cjs", Language::JavaScript}, {".ts", Language::TypeScript}, {".java", Language::Java},
  {".metta", Language::Metta},    {".mta", Language::Metta},
};

}  // namespace

const LanguageInfo & language_info(Language lang) noexcept
{
  return k_languages[static_cast<size_t>(lang)];
}

std::string_view to_string(Language lang) noexcept { return language_info(lang).id; }

std::optional<Language> language_from_string(std::string_view id) noexcept
{
  for (const auto & info : k_languages) {
    if (info.id == id) {
      return info.language;
    }
  }
  return std::nullopt;
}

std::string_view to_string(ParserKind kind) noexcept
{
  return kind == ParserKind::Dsl ? "dsl" : "external";
}

std::optional<ParserKind> parser_kind_from_string(std::string_view s) noexcept
{
  if (s == "dsl") return ParserKind::Dsl;
  if (s == "external") return ParserKind::External;
  return std::nullopt;
}

std::optional<Language> detect_language(const std::filesystem::path & path)
{
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  for (const auto & e : k_extensions) {
    if (e.extension == ext) {
      return e.language;
    }
  }
  return std::nullopt;
}

bool is_dsl(Language lang) noexcept { return language_info(lang).parser == ParserKind::Dsl; }

std::vector<Language> available_languages()
{
  std::vector<Language> out;
  out.reserve(k_languages.size());
  for (const auto & info : k_languages) {
    out.push_back(info.language);
  }
  return out;
}

}  // namespace galaxy_ast

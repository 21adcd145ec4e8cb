// galaxy_ast/language/grammar_registry.hpp - Tree-sitter grammar loading and parser dispatch
#pragma once

#include <tree_sitter/api.h>

#include <array>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "galaxy_ast/language/language.hpp"

namespace galaxy_ast
{

class DiagnosticBag;

struct GrammarOptions
{
  /// Directories searched for libtree-sitter-<lang>.so and friends.
  std::vector<std::filesystem::path> search_dirs;
  /// Shared objects exporting several tree_sitter_<lang> symbols.
  std::vector<std::filesystem::path> bundles;
  /// Also ask the dynamic loader's default search path.
  bool use_system_loader = true;
};

/**
 * What to run for one language: either the DSL front-end or a tree-sitter
 * grammar. `grammar` is null for the DSL.
 */
struct ParserHandle
{
  ParserKind kind = ParserKind::Dsl;
  const TSLanguage * grammar = nullptr;

  [[nodiscard]] bool is_dsl() const noexcept { return kind == ParserKind::Dsl; }
};

/**
 * Process-wide table of parser capabilities.
 *
 * All grammars are resolved in the constructor; afterwards the registry is a
 * read-only lookup table that may be shared by const reference across walks.
 * Loaded shared objects stay open for the lifetime of the registry.
 */
class GrammarRegistry
{
public:
  explicit GrammarRegistry(GrammarOptions options = {});
  ~GrammarRegistry();

  GrammarRegistry(const GrammarRegistry &) = delete;
  GrammarRegistry & operator=(const GrammarRegistry &) = delete;
  GrammarRegistry(GrammarRegistry &&) noexcept;
  GrammarRegistry & operator=(GrammarRegistry &&) noexcept;

  /// Supply a statically linked grammar. Replaces whatever was loaded.
  void register_grammar(Language lang, const TSLanguage * grammar);

  [[nodiscard]] bool is_available(Language lang) const noexcept;

  /// Why an external grammar is missing; empty when it is available.
  [[nodiscard]] const std::string & unavailable_reason(Language lang) const noexcept;

  /**
   * @throws ParserUnavailable when `lang` needs a grammar that is not loaded
   */
  [[nodiscard]] ParserHandle resolve_parser(Language lang) const;

  /// "abi <n>" for a loaded grammar, the front-end version for the DSL, or "".
  [[nodiscard]] std::string language_version(Language lang) const;

  /// One I0001 entry per external language without a grammar.
  void report_unavailable(DiagnosticBag & diags) const;

private:
  struct LibraryCloser
  {
    void operator()(void * handle) const noexcept;
  };
  using LibraryHandle = std::unique_ptr<void, LibraryCloser>;

  struct Slot
  {
    const TSLanguage * grammar = nullptr;
    std::string reason;
  };

  void load_bundles();
  void load_language(Language lang);
  [[nodiscard]] bool try_library(void * handle, const std::string & symbol, Slot & slot);

  GrammarOptions options_;
  std::vector<LibraryHandle> libraries_;
  std::array<Slot, k_language_count> slots_{};
};

}  // namespace galaxy_ast

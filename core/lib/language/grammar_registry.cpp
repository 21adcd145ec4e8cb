// galaxy_ast/language/grammar_registry.cpp - Tree-sitter grammar loading via the dynamic loader
#include "galaxy_ast/language/grammar_registry.hpp"

#include <dlfcn.h>

#include <system_error>

#include "galaxy_ast/basic/diagnostic.hpp"
#include "galaxy_ast/basic/error.hpp"
#include "galaxy_ast/syntax/frontend.hpp"

namespace galaxy_ast
{

namespace fs = std::filesystem;

namespace
{

using LanguageFn = const TSLanguage * (*)();

std::string last_loader_error()
{
  const char * err = dlerror();
  return err ? std::string(err) : std::string("unknown dynamic loader error");
}

std::vector<std::string> library_candidates(std::string_view grammar_name)
{
  const std::string name(grammar_name);
  return {"libtree-sitter-" + name + ".so", "tree-sitter-" + name + ".so", name + ".so"};
}

}  // namespace

void GrammarRegistry::LibraryCloser::operator()(void * handle) const noexcept
{
  if (handle) dlclose(handle);
}

GrammarRegistry::GrammarRegistry(GrammarOptions options) : options_(std::move(options))
{
  load_bundles();
  for (Language lang : available_languages()) {
    if (!is_dsl(lang)) {
      load_language(lang);
    }
  }
}

GrammarRegistry::~GrammarRegistry() = default;
GrammarRegistry::GrammarRegistry(GrammarRegistry &&) noexcept = default;
GrammarRegistry & GrammarRegistry::operator=(GrammarRegistry &&) noexcept = default;

// ============================================================================
// Loading
// ============================================================================

void GrammarRegistry::load_bundles()
{
  for (const auto & bundle : options_.bundles) {
    void * handle = dlopen(bundle.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (handle) {
      libraries_.emplace_back(handle);
    }
  }
}

bool GrammarRegistry::try_library(void * handle, const std::string & symbol, Slot & slot)
{
  void * sym = dlsym(handle, symbol.c_str());
  if (sym == nullptr) {
    return false;
  }

  const auto fn = reinterpret_cast<LanguageFn>(sym);
  const TSLanguage * grammar = fn();
  if (grammar == nullptr) {
    slot.reason = symbol + "() returned no grammar";
    return false;
  }

  const uint32_t abi = ts_language_version(grammar);
  if (abi < TREE_SITTER_MIN_COMPATIBLE_LANGUAGE_VERSION || abi > TREE_SITTER_LANGUAGE_VERSION) {
    slot.reason = symbol + " has ABI version " + std::to_string(abi) +
                  ", runtime supports " +
                  std::to_string(TREE_SITTER_MIN_COMPATIBLE_LANGUAGE_VERSION) + ".." +
                  std::to_string(TREE_SITTER_LANGUAGE_VERSION);
    return false;
  }

  slot.grammar = grammar;
  slot.reason.clear();
  return true;
}

void GrammarRegistry::load_language(Language lang)
{
  const LanguageInfo & info = language_info(lang);
  const std::string symbol = "tree_sitter_" + std::string(info.grammar_name);
  Slot & slot = slots_[static_cast<size_t>(lang)];

  // 1. Already-open bundles
  for (const auto & lib : libraries_) {
    if (try_library(lib.get(), symbol, slot)) {
      return;
    }
  }

  const auto candidates = library_candidates(info.grammar_name);

  auto try_open = [&](const std::string & file) -> bool {
    void * handle = dlopen(file.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (handle == nullptr) {
      if (slot.reason.empty()) slot.reason = last_loader_error();
      return false;
    }
    if (try_library(handle, symbol, slot)) {
      libraries_.emplace_back(handle);
      return true;
    }
    dlclose(handle);
    return false;
  };

  // 2. Grammar directories
  for (const auto & dir : options_.search_dirs) {
    for (const auto & cand : candidates) {
      const fs::path p = dir / cand;
      std::error_code ec;
      if (!fs::is_regular_file(p, ec)) continue;
      if (try_open(p.string())) return;
    }
  }

  // 3. Default loader search path (LD_LIBRARY_PATH, ld.so.cache)
  if (options_.use_system_loader) {
    // Bare "<lang>.so" is only meaningful inside an explicit directory.
    for (size_t i = 0; i + 1 < candidates.size(); ++i) {
      if (try_open(candidates[i])) return;
    }
  }

  if (slot.reason.empty()) {
    slot.reason = "no shared library exports " + symbol;
  }
}

// ============================================================================
// Queries
// ============================================================================

void GrammarRegistry::register_grammar(Language lang, const TSLanguage * grammar)
{
  if (is_dsl(lang)) {
    throw std::invalid_argument(
      "cannot register a tree-sitter grammar for '" + std::string(to_string(lang)) + "'");
  }
  Slot & slot = slots_[static_cast<size_t>(lang)];
  slot.grammar = grammar;
  slot.reason = grammar ? std::string() : std::string("grammar was unregistered");
}

bool GrammarRegistry::is_available(Language lang) const noexcept
{
  return is_dsl(lang) || slots_[static_cast<size_t>(lang)].grammar != nullptr;
}

const std::string & GrammarRegistry::unavailable_reason(Language lang) const noexcept
{
  static const std::string k_none;
  if (is_available(lang)) return k_none;
  return slots_[static_cast<size_t>(lang)].reason;
}

ParserHandle GrammarRegistry::resolve_parser(Language lang) const
{
  if (is_dsl(lang)) {
    return ParserHandle{ParserKind::Dsl, nullptr};
  }

  const Slot & slot = slots_[static_cast<size_t>(lang)];
  if (slot.grammar == nullptr) {
    throw ParserUnavailable(
      "no tree-sitter grammar for '" + std::string(to_string(lang)) + "' (" + slot.reason + ")");
  }
  return ParserHandle{ParserKind::External, slot.grammar};
}

std::string GrammarRegistry::language_version(Language lang) const
{
  if (is_dsl(lang)) {
    return std::string(k_dsl_frontend_version);
  }
  const Slot & slot = slots_[static_cast<size_t>(lang)];
  if (slot.grammar == nullptr) return {};
  return "abi " + std::to_string(ts_language_version(slot.grammar));
}

void GrammarRegistry::report_unavailable(DiagnosticBag & diags) const
{
  for (Language lang : available_languages()) {
    if (is_available(lang)) continue;
    diags.report_info({}, "tree-sitter grammar for '" + std::string(to_string(lang)) +
                            "' is unavailable; its files will carry a parse error")
      .with_code(diag_codes::k_grammar_unavailable)
      .with_help(unavailable_reason(lang));
  }
}

}  // namespace galaxy_ast

// galaxy_ast/tree/walker.cpp - Directory walk with per-file parse and extraction
#include "galaxy_ast/tree/walker.hpp"

#include <algorithm>
#include <ostream>
#include <system_error>
#include <vector>

#include "galaxy_ast/basic/diagnostic.hpp"
#include "galaxy_ast/basic/error.hpp"
#include "galaxy_ast/basic/source_file.hpp"
#include "galaxy_ast/extract/dsl_extractor.hpp"
#include "galaxy_ast/extract/generic_extractor.hpp"
#include "galaxy_ast/language/grammar_registry.hpp"
#include "galaxy_ast/syntax/frontend.hpp"
#include "galaxy_ast/syntax/ts_ll.hpp"

namespace galaxy_ast
{

namespace fs = std::filesystem;

namespace
{

struct Entry
{
  std::string name;
  fs::path path;
  bool is_dir = false;
  bool is_symlink = false;
};

std::string display_name(const fs::path & p)
{
  std::string name = p.filename().string();
  return name.empty() ? p.string() : name;
}

}  // namespace

fs::path normalize_root(const fs::path & root)
{
  fs::path p = fs::absolute(root).lexically_normal();
  if (!p.has_filename() && p != p.root_path()) {
    p = p.parent_path();
  }
  return p;
}

DirectoryWalker::DirectoryWalker(
  const GrammarRegistry & registry, DiagnosticBag & diags, WalkOptions options)
: registry_(registry), diags_(diags), options_(options)
{
}

std::unique_ptr<TreeNode> DirectoryWalker::walk(const fs::path & root)
{
  const fs::path abs = normalize_root(root);
  std::error_code ec;
  const auto status = fs::status(abs, ec);
  if (ec || !fs::exists(status)) {
    throw IoError("root path does not exist: " + abs.string());
  }
  return visit(abs, fs::is_directory(status));
}

std::unique_ptr<TreeNode> DirectoryWalker::visit(const fs::path & path, bool is_dir)
{
  if (is_dir) {
    return visit_folder(path);
  }
  return visit_file(path);
}

// ============================================================================
// Folders
// ============================================================================

std::unique_ptr<FolderNode> DirectoryWalker::visit_folder(const fs::path & path)
{
  auto folder = std::make_unique<FolderNode>(display_name(path), path.string());

  std::vector<Entry> entries;
  std::error_code ec;
  fs::directory_iterator it(path, ec);
  const fs::directory_iterator end;
  while (!ec && it != end) {
    const fs::directory_entry & de = *it;
    std::string name = de.path().filename().string();
    if (!name.empty() && name.front() != '.') {
      std::error_code type_ec;
      Entry e;
      e.name = std::move(name);
      e.path = de.path();
      e.is_symlink = de.is_symlink(type_ec);
      e.is_dir = de.is_directory(type_ec);  // follows symlinks
      entries.push_back(std::move(e));
    }
    it.increment(ec);
  }

  if (ec) {
    diags_.report_warning(path, "cannot list directory: " + ec.message())
      .with_code(diag_codes::k_dir_unreadable);
    // Whatever was listed before the failure is still reported.
  }

  std::sort(entries.begin(), entries.end(), [](const Entry & a, const Entry & b) {
    return a.name < b.name;
  });

  for (const auto & e : entries) {
    if (e.is_dir && e.is_symlink) {
      diags_.report_warning(e.path, "symlinked directory not descended")
        .with_code(diag_codes::k_symlink_dir_skipped)
        .with_help("scan the link target directly to include it");
      continue;
    }
    folder->children.push_back(visit(e.path, e.is_dir));
  }

  return folder;
}

// ============================================================================
// Files
// ============================================================================

std::unique_ptr<FileNode> DirectoryWalker::visit_file(const fs::path & path)
{
  auto file = std::make_unique<FileNode>(display_name(path), path.string());

  const auto lang = detect_language(path);
  if (!lang) {
    return file;
  }

  if (options_.progress) {
    *options_.progress << "parsing " << path.string() << " (" << to_string(*lang) << ")\n";
  }

  file->language = std::string(to_string(*lang));
  FileParseResult result = process_file(path, *lang);
  if (result.success) {
    file->definitions = std::move(result.definitions);
    file->parser_kind = result.parser_kind;
  } else {
    diags_.report_warning(path, "failed to process file: " + result.error)
      .with_code(diag_codes::k_file_failed);
    file->parse_error = std::move(result.error);
  }
  return file;
}

FileParseResult DirectoryWalker::process_file(const fs::path & path, Language lang) const
{
  try {
    const SourceFile source = load_source_file(path);
    const ParserHandle handle = registry_.resolve_parser(lang);

    if (handle.is_dsl()) {
      const auto ast = parse_dsl(source.bytes());
      return FileParseResult::ok(extract_dsl_definitions(*ast), ParserKind::Dsl);
    }

    if (!is_valid_utf8(source.bytes())) {
      throw DecodeError("'" + path.string() + "' is not valid UTF-8");
    }

    const ts_ll::Parser parser(handle.grammar);
    const ts_ll::Tree tree = parser.parse(source.bytes());
    if (tree.is_null()) {
      throw ExtractionError("tree-sitter produced no tree for '" + path.string() + "'");
    }
    return FileParseResult::ok(extract_definitions(tree, source, lang), ParserKind::External);
  } catch (const std::exception & e) {
    return FileParseResult::fail(e.what());
  }
}

}  // namespace galaxy_ast

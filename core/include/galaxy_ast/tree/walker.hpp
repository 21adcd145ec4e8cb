// galaxy_ast/tree/walker.hpp - Directory walk with per-file parse and extraction
#pragma once

#include <filesystem>
#include <iosfwd>
#include <memory>
#include <string>

#include "galaxy_ast/extract/definitions.hpp"
#include "galaxy_ast/language/language.hpp"
#include "galaxy_ast/tree/source_tree.hpp"

namespace galaxy_ast
{

class DiagnosticBag;
class GrammarRegistry;

struct WalkOptions
{
  /// When set, one line per processed file is written here.
  std::ostream * progress = nullptr;
};

/**
 * Outcome of processing one file: a definitions record, or the reason it
 * could not be produced.
 */
struct FileParseResult
{
  /// Only valid if success == true
  Definitions definitions;
  ParserKind parser_kind = ParserKind::External;

  bool success = false;
  std::string error;

  static FileParseResult ok(Definitions defs, ParserKind kind)
  {
    FileParseResult r;
    r.definitions = std::move(defs);
    r.parser_kind = kind;
    r.success = true;
    return r;
  }

  static FileParseResult fail(std::string msg)
  {
    FileParseResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

/**
 * Builds the folder/file tree below a root path.
 *
 * - Entries whose name starts with '.' are excluded; children are sorted by name.
 * - Symlinked directories are not descended (W0003).
 * - An unreadable directory yields an empty folder (W0002).
 * - Any failure while reading, parsing or extracting one file is recorded as
 *   that file's parse_error (W0001); the walk always completes.
 */
class DirectoryWalker
{
public:
  DirectoryWalker(const GrammarRegistry & registry, DiagnosticBag & diags, WalkOptions options = {});

  /**
   * @throws IoError if `root` does not exist
   */
  [[nodiscard]] std::unique_ptr<TreeNode> walk(const std::filesystem::path & root);

  /// Read, parse and extract one file. Never throws.
  [[nodiscard]] FileParseResult process_file(const std::filesystem::path & path, Language lang) const;

private:
  std::unique_ptr<TreeNode> visit(const std::filesystem::path & path, bool is_dir);
  std::unique_ptr<FolderNode> visit_folder(const std::filesystem::path & path);
  std::unique_ptr<FileNode> visit_file(const std::filesystem::path & path);

  const GrammarRegistry & registry_;
  DiagnosticBag & diags_;
  WalkOptions options_;
};

/// Absolute, lexically normal, without a trailing separator.
[[nodiscard]] std::filesystem::path normalize_root(const std::filesystem::path & root);

}  // namespace galaxy_ast

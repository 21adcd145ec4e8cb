// galaxy_ast/basic/source_file.hpp - Raw source bytes and text decoding
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace galaxy_ast
{

/**
 * The raw bytes of one source file.
 *
 * Bytes are kept undecoded: tree-sitter consumes them directly and reports
 * byte offsets into them, while the DSL front-end decodes them leniently.
 */
class SourceFile
{
public:
  SourceFile() = default;

  SourceFile(std::filesystem::path path, std::string bytes)
  : path_(std::move(path)), bytes_(std::move(bytes))
  {
  }

  [[nodiscard]] const std::filesystem::path & path() const noexcept { return path_; }
  [[nodiscard]] std::string_view bytes() const noexcept { return bytes_; }
  [[nodiscard]] size_t size() const noexcept { return bytes_.size(); }

  /// Slice of the raw bytes in [start, end), clamped to the buffer.
  [[nodiscard]] std::string_view slice(uint32_t start, uint32_t end) const noexcept
  {
    if (start >= bytes_.size() || end <= start) return {};
    if (end > bytes_.size()) end = static_cast<uint32_t>(bytes_.size());
    return std::string_view(bytes_).substr(start, end - start);
  }

private:
  std::filesystem::path path_;
  std::string bytes_;
};

/**
 * Read a whole file as bytes.
 *
 * @throws IoError if the file cannot be opened or read
 */
[[nodiscard]] SourceFile load_source_file(const std::filesystem::path & path);

/// True when `bytes` is well-formed UTF-8 (no overlongs, no surrogates).
[[nodiscard]] bool is_valid_utf8(std::string_view bytes) noexcept;

/// Decode UTF-8, dropping every byte that is not part of a well-formed sequence.
[[nodiscard]] std::string decode_utf8_lossy(std::string_view bytes);

}  // namespace galaxy_ast

// galaxy_ast/basic/source_file.cpp - Source loading and UTF-8 helpers
#include "galaxy_ast/basic/source_file.hpp"

#include <fstream>
#include <iterator>

#include "galaxy_ast/basic/error.hpp"

namespace galaxy_ast
{

namespace
{

// Length of the well-formed UTF-8 sequence starting at `i`, or 0 if malformed.
size_t utf8_sequence_length(std::string_view s, size_t i) noexcept
{
  const auto b0 = static_cast<unsigned char>(s[i]);
  if (b0 < 0x80) return 1;

  size_t len = 0;
  unsigned char lo = 0x80;
  unsigned char hi = 0xBF;
  if (b0 >= 0xC2 && b0 <= 0xDF) {
    len = 2;
  } else if (b0 >= 0xE0 && b0 <= 0xEF) {
    len = 3;
    if (b0 == 0xE0) lo = 0xA0;  // overlong
    if (b0 == 0xED) hi = 0x9F;  // surrogates
  } else if (b0 >= 0xF0 && b0 <= 0xF4) {
    len = 4;
    if (b0 == 0xF0) lo = 0x90;
    if (b0 == 0xF4) hi = 0x8F;
  } else {
    return 0;
  }

  if (i + len > s.size()) return 0;

  const auto b1 = static_cast<unsigned char>(s[i + 1]);
  if (b1 < lo || b1 > hi) return 0;
  for (size_t k = 2; k < len; ++k) {
    const auto b = static_cast<unsigned char>(s[i + k]);
    if (b < 0x80 || b > 0xBF) return 0;
  }
  return len;
}

}  // namespace

SourceFile load_source_file(const std::filesystem::path & path)
{
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    throw IoError("failed to open file: " + path.string());
  }

  std::string bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    throw IoError("failed to read file: " + path.string());
  }
  return {path, std::move(bytes)};
}

bool is_valid_utf8(std::string_view bytes) noexcept
{
  size_t i = 0;
  while (i < bytes.size()) {
    const size_t n = utf8_sequence_length(bytes, i);
    if (n == 0) return false;
    i += n;
  }
  return true;
}

std::string decode_utf8_lossy(std::string_view bytes)
{
  std::string out;
  out.reserve(bytes.size());
  size_t i = 0;
  while (i < bytes.size()) {
    const size_t n = utf8_sequence_length(bytes, i);
    if (n == 0) {
      ++i;
      continue;
    }
    out.append(bytes.substr(i, n));
    i += n;
  }
  return out;
}

}  // namespace galaxy_ast

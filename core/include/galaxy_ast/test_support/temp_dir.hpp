// galaxy_ast/test_support/temp_dir.hpp - filesystem fixtures for unit tests
//
// A scratch directory under the system temp dir, removed on destruction.
//
#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <system_error>

namespace galaxy_ast::test_support
{

class TempDir
{
public:
  explicit TempDir(std::string_view tag)
  {
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path_ = std::filesystem::temp_directory_path() /
            ("galaxy_ast_" + std::string(tag) + "_" + std::to_string(stamp));
    std::filesystem::create_directories(path_);
  }

  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;

  [[nodiscard]] const std::filesystem::path & path() const noexcept { return path_; }

  /// Write `content` to `relative`, creating intermediate directories.
  std::filesystem::path write(const std::filesystem::path & relative, std::string_view content) const
  {
    const std::filesystem::path full = path_ / relative;
    std::filesystem::create_directories(full.parent_path());
    std::ofstream out(full, std::ios::binary);
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    return full;
  }

  std::filesystem::path mkdir(const std::filesystem::path & relative) const
  {
    const std::filesystem::path full = path_ / relative;
    std::filesystem::create_directories(full);
    return full;
  }

private:
  std::filesystem::path path_;
};

}  // namespace galaxy_ast::test_support

// galaxy_ast/basic/error.hpp - Error taxonomy for per-file processing
//
// Every error raised while one file is read, parsed or extracted derives from
// ProcessingError. The directory walker catches them at the file boundary and
// records the message on the file node.
//
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace galaxy_ast
{

enum class ErrorKind : uint8_t {
  ParserUnavailable,  // a required tree-sitter grammar cannot be loaded
  DecodeError,        // bytes are not valid text for a parser that needs UTF-8
  ExtractionError,    // a syntax tree has an unexpected shape
  IoError,            // the file could not be read
};

[[nodiscard]] constexpr std::string_view to_string(ErrorKind k) noexcept
{
  switch (k) {
    case ErrorKind::ParserUnavailable:
      return "parser unavailable";
    case ErrorKind::DecodeError:
      return "decode error";
    case ErrorKind::ExtractionError:
      return "extraction error";
    case ErrorKind::IoError:
      return "I/O error";
  }
  return "error";
}

class ProcessingError : public std::runtime_error
{
public:
  ProcessingError(ErrorKind kind, const std::string & message)
  : std::runtime_error(std::string(to_string(kind)) + ": " + message), kind_(kind)
  {
  }

  [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
  ErrorKind kind_;
};

class ParserUnavailable : public ProcessingError
{
public:
  explicit ParserUnavailable(const std::string & message)
  : ProcessingError(ErrorKind::ParserUnavailable, message)
  {
  }
};

class DecodeError : public ProcessingError
{
public:
  explicit DecodeError(const std::string & message)
  : ProcessingError(ErrorKind::DecodeError, message)
  {
  }
};

class ExtractionError : public ProcessingError
{
public:
  explicit ExtractionError(const std::string & message)
  : ProcessingError(ErrorKind::ExtractionError, message)
  {
  }
};

class IoError : public ProcessingError
{
public:
  explicit IoError(const std::string & message) : ProcessingError(ErrorKind::IoError, message) {}
};

}  // namespace galaxy_ast

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace ebeflow {

// Fatal input errors. None of them is recoverable mid-stream: a corrupted
// physics record cannot be guessed, so the run stops at the first one.
class ReadError : public std::runtime_error {
public:
  ReadError(const std::string& kind, const std::string& source, std::size_t line, const std::string& msg)
  : std::runtime_error(kind + ": " + source + ":" + std::to_string(line) + ": " + msg),
    source_(source),
    line_(line) {}

  const std::string& source() const { return source_; }
  std::size_t line() const { return line_; }

private:
  std::string source_;
  std::size_t line_ = 0;
};

// Unparseable line or column, wrong field count.
class FormatError : public ReadError {
public:
  FormatError(const std::string& source, std::size_t line, const std::string& msg)
  : ReadError("FormatError", source, line, msg) {}
};

// UrQMD event block declares more particles than the input provides.
class TruncationError : public ReadError {
public:
  TruncationError(const std::string& source, std::size_t line, const std::string& msg)
  : ReadError("TruncationError", source, line, msg) {}
};

// UrQMD (ityp, 2*I3) pair with no Monte Carlo id.
class UnknownSpeciesError : public ReadError {
public:
  UnknownSpeciesError(const std::string& source, std::size_t line, const std::string& msg)
  : ReadError("UnknownSpeciesError", source, line, msg) {}
};

} // namespace ebeflow

#pragma once

#include <optional>
#include <string>

namespace ebeflow {

enum class InputFormat {
  Auto = 0,
  Std = 1,
  Urqmd = 2,
};

// Token that marks UrQMD output files in a filename.
inline constexpr const char* kUrqmdFileToken = ".f13";

// Name used in configs and logs for standard input.
inline constexpr const char* kStdinName = "-";

// auto|std|urqmd (case-insensitive). Throws std::runtime_error otherwise.
InputFormat parse_input_format(std::string s);

std::string input_format_name(InputFormat f);

// Decide which parser reads a source.
// - an explicit std/urqmd override always wins
// - auto with a filename: urqmd when the name contains ".f13", std otherwise
// - auto without a filename (piped stream): std
// Never fails; the result is never InputFormat::Auto.
InputFormat resolve_input_format(InputFormat requested, const std::optional<std::string>& filename);

} // namespace ebeflow

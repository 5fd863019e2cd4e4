#include "ebeflow/io/InputFormat.hpp"

#include <cctype>
#include <stdexcept>

namespace ebeflow {

InputFormat parse_input_format(std::string s) {
  for (auto& c : s) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
  if (s.empty() || s == "auto") return InputFormat::Auto;
  if (s == "std") return InputFormat::Std;
  if (s == "urqmd") return InputFormat::Urqmd;
  throw std::runtime_error("invalid input format: '" + s + "' (use auto|std|urqmd)");
}

std::string input_format_name(InputFormat f) {
  switch (f) {
    case InputFormat::Auto: return "auto";
    case InputFormat::Std: return "std";
    case InputFormat::Urqmd: return "urqmd";
  }
  return "auto";
}

InputFormat resolve_input_format(InputFormat requested, const std::optional<std::string>& filename) {
  switch (requested) {
    case InputFormat::Std:
    case InputFormat::Urqmd:
      return requested;
    case InputFormat::Auto:
      break;
  }
  if (!filename || filename->empty() || *filename == kStdinName) return InputFormat::Std;
  if (filename->find(kUrqmdFileToken) != std::string::npos) return InputFormat::Urqmd;
  return InputFormat::Std;
}

} // namespace ebeflow

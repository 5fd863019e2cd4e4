#pragma once

#include <filesystem>
#include <fstream>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>

namespace ebeflow::output {
namespace fs = std::filesystem;

// Where a measure writes: "-" is the console stream, anything else a file.
struct OutputTarget {
  std::string spec = "-";          // as written in the config
  fs::path path;                   // resolved file path (empty for the console)
  std::ostream* console = nullptr; // stream used for "-"
  bool dry_run = false;            // validate only: never touch the filesystem

  bool is_console() const { return spec == "-"; }
  std::string display() const { return is_console() ? std::string("<stdout>") : path.string(); }
};

// Line-oriented result writer.
// File output goes to "<path>.tmp" and is renamed over <path> by commit(), so an
// aborted run never leaves a half-written result file behind.
class LineWriter {
public:
  explicit LineWriter(OutputTarget target);
  ~LineWriter();

  LineWriter(const LineWriter&) = delete;
  LineWriter& operator=(const LineWriter&) = delete;

  const OutputTarget& target() const { return target_; }

  void open();
  void write_line(std::string_view line);
  void commit();

  std::size_t lines_written() const { return lines_; }

private:
  OutputTarget target_;
  std::unique_ptr<std::ofstream> file_;
  std::ostream* os_ = nullptr;
  bool committed_ = false;
  std::size_t lines_ = 0;
};

} // namespace ebeflow::output

#include "ebeflow/output/LineWriter.hpp"

#include <iostream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include "ebeflow/util/AtomicFile.hpp"

namespace ebeflow::output {

LineWriter::LineWriter(OutputTarget target) : target_(std::move(target)) {
  if (!target_.console) target_.console = &std::cout;
}

LineWriter::~LineWriter() {
  if (file_ && !committed_) {
    file_.reset();
    std::error_code ec;
    fs::remove(util::make_tmp_path(target_.path), ec);
  }
}

void LineWriter::open() {
  if (target_.dry_run || os_) return;
  if (target_.is_console()) {
    os_ = target_.console;
    return;
  }
  util::ensure_parent_dir(target_.path);
  const fs::path tmp = util::make_tmp_path(target_.path);
  file_ = std::make_unique<std::ofstream>(tmp);
  if (!*file_) {
    throw std::runtime_error("LineWriter: failed to open " + tmp.string());
  }
  os_ = file_.get();
}

void LineWriter::write_line(std::string_view line) {
  if (target_.dry_run) return;
  if (!os_) open();
  os_->write(line.data(), static_cast<std::streamsize>(line.size()));
  os_->put('\n');
  ++lines_;
}

void LineWriter::commit() {
  if (target_.dry_run || committed_) return;
  if (!os_) open();
  os_->flush();
  if (!*os_) {
    throw std::runtime_error("LineWriter: write failed: " + target_.display());
  }
  if (file_) {
    file_->close();
    if (!*file_) {
      throw std::runtime_error("LineWriter: close failed: " + target_.path.string());
    }
    util::atomic_rename_over(util::make_tmp_path(target_.path), target_.path);
  }
  committed_ = true;
}

} // namespace ebeflow::output

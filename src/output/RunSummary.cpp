#include "ebeflow/output/RunSummary.hpp"

#include <chrono>
#include <cmath>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <system_error>

#include "ebeflow/util/AtomicFile.hpp"
#include "ebeflow/util/Hash.hpp"
#include "ebeflow/util/Parse.hpp"

namespace ebeflow::output {

namespace {

std::int64_t file_time_to_epoch_seconds(fs::file_time_type t) {
  using namespace std::chrono;
  const auto now_fs = fs::file_time_type::clock::now();
  const auto now_sys = system_clock::now();
  const auto sys_time = time_point_cast<system_clock::duration>(t - now_fs + now_sys);
  return duration_cast<seconds>(sys_time.time_since_epoch()).count();
}

std::string q(const std::string& s) {
  return std::string("\"") + json_escape(s) + "\"";
}

// Shortest round-trip text; JSON has no inf/nan.
std::string num(double x) {
  if (!std::isfinite(x)) return "null";
  return format_double(x);
}

void write_fingerprint(std::ostream& ofs, const FileFingerprint& fp, int indent) {
  const std::string pad(indent, ' ');
  ofs << "{\n";
  ofs << pad << "  \"path\": " << q(fp.path) << ",\n";
  ofs << pad << "  \"size_bytes\": " << fp.size_bytes << ",\n";
  ofs << pad << "  \"mtime_epoch_s\": " << fp.mtime_epoch_s << ",\n";
  ofs << pad << "  \"hash_kind\": " << q(fp.hash_kind) << ",\n";
  ofs << pad << "  \"hash_computed\": " << (fp.hash_computed ? "true" : "false") << ",\n";
  ofs << pad << "  \"hash_fnv1a64\": " << q(fp.hash_fnv1a64_hex) << "\n";
  ofs << pad << "}";
}

} // namespace

FileFingerprint make_fingerprint(const fs::path& p, bool compute_hash) {
  FileFingerprint fp;
  fp.path = p.string();

  std::error_code ec;
  const bool exists = fs::exists(p, ec);
  if (exists) {
    const auto sz = fs::file_size(p, ec);
    fp.size_bytes = ec ? 0ull : static_cast<std::uint64_t>(sz);
    ec.clear();
    const auto mt = fs::last_write_time(p, ec);
    fp.mtime_epoch_s = ec ? 0 : file_time_to_epoch_seconds(mt);
  }

  if (compute_hash && exists) {
    fp.hash_kind = "fnv1a64";
    fp.hash_fnv1a64_hex = hex_u64(fnv1a64_file(p.string()));
    fp.hash_computed = true;
  } else {
    fp.hash_kind = "none";
    fp.hash_computed = false;
  }
  return fp;
}

std::string json_escape(const std::string& s) {
  std::ostringstream oss;
  for (unsigned char c : s) {
    switch (c) {
      case '\\': oss << "\\\\"; break;
      case '"':  oss << "\\\""; break;
      case '\b': oss << "\\b"; break;
      case '\f': oss << "\\f"; break;
      case '\n': oss << "\\n"; break;
      case '\r': oss << "\\r"; break;
      case '\t': oss << "\\t"; break;
      default:
        if (c < 0x20) {
          oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << (int)c << std::dec;
        } else {
          oss << c;
        }
    }
  }
  return oss.str();
}

void write_run_summary_json(const fs::path& out_path, const RunSummary& rs) {
  util::atomic_write_text(out_path, [&](std::ostream& ofs) {
    ofs << "{\n";
    ofs << "  \"schema_version\": " << q(rs.schema_version) << ",\n";
    ofs << "  \"ebeflow_version\": " << q(rs.ebeflow_version) << ",\n";
    ofs << "  \"run\": {\n";
    ofs << "    \"config_path\": " << q(rs.config_path) << ",\n";
    ofs << "    \"config_hash_fnv1a64\": " << q(rs.config_hash_fnv1a64_hex) << ",\n";
    ofs << "    \"filter\": " << q(rs.filter) << ",\n";
    ofs << "    \"keep_empty\": " << (rs.keep_empty ? "true" : "false") << ",\n";
    ofs << "    \"sources\": [\n";
    for (std::size_t i = 0; i < rs.sources.size(); ++i) {
      const auto& s = rs.sources[i];
      ofs << "      {\n";
      ofs << "        \"name\": " << q(s.name) << ",\n";
      ofs << "        \"format\": " << q(s.format) << ",\n";
      ofs << "        \"fingerprint\": ";
      write_fingerprint(ofs, s.fingerprint, 8);
      ofs << "\n      }";
      if (i + 1 < rs.sources.size()) ofs << ",";
      ofs << "\n";
    }
    ofs << "    ]\n";
    ofs << "  },\n";

    ofs << "  \"counters\": {\n";
    ofs << "    \"events\": " << rs.events << ",\n";
    ofs << "    \"raw_particles\": " << rs.raw_particles << ",\n";
    ofs << "    \"accepted_particles\": " << rs.accepted_particles << ",\n";
    ofs << "    \"empty_groups_dropped\": " << rs.empty_groups_dropped << "\n";
    ofs << "  },\n";

    ofs << "  \"profiling\": {\n";
    ofs << "    \"wall_seconds\": " << num(rs.wall_seconds) << ",\n";
    ofs << "    \"reader_seconds\": " << num(rs.reader_seconds) << ",\n";
    ofs << "    \"measures\": {\n";
    for (std::size_t i = 0; i < rs.measure_profiling.size(); ++i) {
      const auto& [name, mp] = rs.measure_profiling[i];
      ofs << "      " << q(name) << ": {"
          << "\"on_start_s\": " << num(mp.on_start_s) << ", "
          << "\"on_event_s\": " << num(mp.on_event_s) << ", "
          << "\"finalize_s\": " << num(mp.finalize_s) << ", "
          << "\"events\": " << mp.events
          << "}";
      if (i + 1 < rs.measure_profiling.size()) ofs << ",";
      ofs << "\n";
    }
    ofs << "    }\n";
    ofs << "  },\n";

    ofs << "  \"measures\": [\n";
    for (std::size_t mi = 0; mi < rs.measures.size(); ++mi) {
      const auto& md = rs.measures[mi];
      ofs << "    {\n";
      ofs << "      \"instance\": " << q(md.instance) << ",\n";
      ofs << "      \"type\": " << q(md.type) << ",\n";
      ofs << "      \"output\": " << q(md.output) << ",\n";
      ofs << "      \"columns\": [";
      for (std::size_t ci = 0; ci < md.columns.size(); ++ci) {
        ofs << q(md.columns[ci]);
        if (ci + 1 < md.columns.size()) ofs << ", ";
      }
      ofs << "],\n";
      ofs << "      \"params\": {\n";
      std::size_t pk = 0;
      for (const auto& kv : md.params) {
        ofs << "        " << q(kv.first) << ": " << q(kv.second);
        if (++pk < md.params.size()) ofs << ",";
        ofs << "\n";
      }
      ofs << "      }\n";
      ofs << "    }";
      if (mi + 1 < rs.measures.size()) ofs << ",";
      ofs << "\n";
    }
    ofs << "  ]\n";
    ofs << "}\n";
  });
}

} // namespace ebeflow::output

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace ebeflow::output {
namespace fs = std::filesystem;

// Bump when the JSON layout changes incompatibly.
inline constexpr const char* RUN_SUMMARY_SCHEMA_VERSION = "1.0";

struct FileFingerprint {
  std::string path;
  std::uint64_t size_bytes = 0;
  std::int64_t mtime_epoch_s = 0;

  // Standard input cannot be hashed; hash_kind is then "none".
  bool hash_computed = false;
  std::string hash_fnv1a64_hex;
  std::string hash_kind = "fnv1a64";
};

// Size, mtime and (optionally) FNV-1a hash of a file. Missing files give zeros.
FileFingerprint make_fingerprint(const fs::path& p, bool compute_hash);

struct SourceAudit {
  std::string name;
  std::string format; // resolved format
  FileFingerprint fingerprint;
};

struct MeasureDescriptor {
  std::string instance;
  std::string type;
  std::string output;                        // "<stdout>" or file path
  std::vector<std::string> columns;          // column names in order
  std::map<std::string, std::string> params; // key -> value (as text)
};

struct MeasureProfiling {
  double on_start_s = 0.0;
  double on_event_s = 0.0;
  double finalize_s = 0.0;
  std::size_t events = 0;
};

struct RunSummary {
  std::string schema_version = RUN_SUMMARY_SCHEMA_VERSION;
  std::string ebeflow_version;

  std::string config_path;
  std::string config_hash_fnv1a64_hex;

  std::vector<SourceAudit> sources;
  std::string filter;
  bool keep_empty = false;

  std::size_t events = 0;
  std::size_t raw_particles = 0;
  std::size_t accepted_particles = 0;
  std::size_t empty_groups_dropped = 0;

  double wall_seconds = 0.0;
  double reader_seconds = 0.0;

  std::vector<MeasureDescriptor> measures;
  std::vector<std::pair<std::string, MeasureProfiling>> measure_profiling; // instance -> timings
};

std::string json_escape(const std::string& s);

// Written to a temporary file first and renamed into place.
void write_run_summary_json(const fs::path& out_path, const RunSummary& rs);

} // namespace ebeflow::output

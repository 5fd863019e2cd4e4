#include "ebeflow/app/Runner.hpp"

#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "ebeflow/core/Event.hpp"
#include "ebeflow/io/EventStream.hpp"
#include "ebeflow/io/InputFormat.hpp"
#include "ebeflow/measures/IMeasure.hpp"
#include "ebeflow/measures/MeasureRegistry.hpp"
#include "ebeflow/output/RunSummary.hpp"
#include "ebeflow/select/ParticleFilter.hpp"
#include "ebeflow/util/Hash.hpp"
#include "ebeflow/util/Timer.hpp"

namespace fs = std::filesystem;

namespace {

fs::path resolve_path(const fs::path& base_dir, const std::string& p) {
  fs::path path(p);
  if (path.is_absolute()) return path;
  return (base_dir / path).lexically_normal();
}

std::vector<ebeflow::InputSource> input_sources_from_config(const ebeflow::IniConfig& cfg) {
  const auto format = ebeflow::parse_input_format(cfg.get_string("input", "format", std::optional<std::string>("auto")));

  std::vector<std::string> files = cfg.get_list("input", "files", std::optional<std::string>(ebeflow::kStdinName));
  if (files.empty()) files.push_back(ebeflow::kStdinName);

  std::vector<ebeflow::InputSource> out;
  out.reserve(files.size());
  bool have_stdin = false;
  for (const auto& f : files) {
    ebeflow::InputSource src;
    src.format = format;
    if (f == ebeflow::kStdinName) {
      if (have_stdin) throw std::runtime_error("input.files lists standard input ('-') more than once");
      have_stdin = true;
      src.name = f;
    } else {
      src.name = resolve_path(cfg.base_dir(), f).string();
    }
    out.push_back(std::move(src));
  }
  return out;
}

} // namespace

namespace ebeflow {

Runner::Runner(const IniConfig& cfg) : cfg_(cfg) {}

int Runner::run() {
  return run_impl_(false);
}

int Runner::validate_config() {
  return run_impl_(true);
}

int Runner::run_impl_(bool validate_only) {
  WallTimer total_timer;
  summary_ = output::RunSummary{};

  // --- General ---
  const fs::path cfg_path = cfg_.file_path();
  const fs::path cfg_dir = cfg_.base_dir();

  cfg_.require_known_keys("general", {"profile", "run_summary", "hash_inputs"});
  cfg_.require_known_keys("input", {"files", "format"});
  cfg_.require_known_keys("events", {"keep_empty"});

  const bool print_profile = cfg_.get_bool("general", "profile", std::optional<bool>(true));
  const std::string run_summary_s = cfg_.get_string("general", "run_summary", std::optional<std::string>(""));
  const bool hash_inputs = cfg_.get_bool("general", "hash_inputs", std::optional<bool>(true));
  const bool keep_empty = cfg_.get_bool("events", "keep_empty", std::optional<bool>(false));

  fs::path run_summary_path;
  if (!run_summary_s.empty()) run_summary_path = resolve_path(cfg_dir, run_summary_s);

  // --- Inputs + filter ---
  std::vector<InputSource> sources = input_sources_from_config(cfg_);
  const FilterSpec filter_spec = filter_spec_from_config(cfg_);

  // --- Scan + plan measures ---
  struct MeasureInstance {
    std::string section;
    std::string instance;
    std::string type;
    MeasureCapabilities caps;
  };

  MeasureBuildEnv env;
  env.cfg_dir = cfg_dir;
  env.console = console_;
  env.dry_run = validate_only;

  std::vector<MeasureInstance> planned;
  {
    const auto secs = cfg_.section_names();
    for (const auto& sec : secs) {
      if (!starts_with(sec, "measure.")) continue;
      const std::string instance = sec.substr(std::string("measure.").size());
      if (instance.empty()) {
        throw std::runtime_error("invalid measure section name: [" + sec + "]");
      }

      const bool enabled = cfg_.get_bool(sec, "enabled", std::optional<bool>(true));
      if (!enabled) continue;

      const std::string type = cfg_.get_string(sec, "type", std::optional<std::string>(instance));
      const auto& factory = MeasureRegistry::instance().require(type);
      MeasureCapabilities caps = factory.caps(cfg_, sec, instance, env);
      planned.push_back(MeasureInstance{sec, instance, type, std::move(caps)});
    }
  }

  if (planned.empty()) {
    std::cerr << "[ebeflow] no enabled measures; nothing to do.\n";
    return 0;
  }

  // --- Output conflicts: one measure per file, at most one on stdout ---
  {
    std::string stdout_owner;
    std::set<fs::path> files;
    for (const auto& mi : planned) {
      for (const auto& o : mi.caps.outputs) {
        if (o == "-") {
          if (!stdout_owner.empty()) {
            throw std::runtime_error("measures '" + stdout_owner + "' and '" + mi.instance +
                                     "' both write to stdout; give one of them an output file");
          }
          stdout_owner = mi.instance;
          continue;
        }
        const fs::path p = resolve_path(cfg_dir, o);
        if (!files.insert(p).second) {
          throw std::runtime_error("measure '" + mi.instance + "' writes to '" + p.string() +
                                   "', which another measure already writes to");
        }
        if (!run_summary_path.empty() && p == run_summary_path) {
          throw std::runtime_error("measure '" + mi.instance + "' output collides with general.run_summary");
        }
      }
    }
  }

  // --- Inputs must exist before any output is touched ---
  for (const auto& src : sources) {
    if (src.name == kStdinName) continue;
    if (!fs::exists(src.name)) {
      throw std::runtime_error("input file not found: " + src.name);
    }
  }

  // --- Instantiate measures ---
  std::vector<std::unique_ptr<IMeasure>> measures;
  std::vector<output::MeasureProfiling> mp;
  measures.reserve(planned.size());
  mp.assign(planned.size(), output::MeasureProfiling{});

  for (const auto& mi : planned) {
    const auto& factory = MeasureRegistry::instance().require(mi.type);
    measures.emplace_back(factory.create(cfg_, mi.section, mi.instance, env));
  }

  const InputFormat requested_format =
      parse_input_format(cfg_.get_string("input", "format", std::optional<std::string>("auto")));

  if (validate_only) {
    std::cerr << "[ebeflow] validation OK (no events processed)\n"
              << "         sources=" << sources.size() << " format=" << input_format_name(requested_format) << "\n"
              << "         filter: " << filter_spec.describe() << "\n"
              << "         measures=" << measures.size() << "\n";
    for (const auto& m : measures) {
      const auto d = m->describe();
      std::cerr << "           " << d.instance << " (type=" << d.type << ") -> " << d.output << "\n";
    }
    return 0;
  }

  std::cerr << "[ebeflow] run: sources=" << sources.size() << " format=" << input_format_name(requested_format)
            << " measures=" << measures.size() << "\n"
            << "[ebeflow] filter: " << filter_spec.describe() << (keep_empty ? " keep_empty" : "") << "\n";

  for (std::size_t i = 0; i < measures.size(); ++i) {
    ScopedTimer tm(mp[i].on_start_s);
    measures[i]->on_start();
  }

  // --- Main event loop ---
  EventStream stream(sources, ParticleFilter(filter_spec), keep_empty);
  double t_reader = 0.0;
  Event ev;
  while (true) {
    bool ok = false;
    {
      ScopedTimer tt(t_reader);
      ok = stream.next(ev);
    }
    if (!ok) break;

    for (std::size_t i = 0; i < measures.size(); ++i) {
      ScopedTimer tm(mp[i].on_event_s);
      measures[i]->on_event(ev, ev.index);
      mp[i].events += 1;
    }
  }

  for (std::size_t i = 0; i < measures.size(); ++i) {
    ScopedTimer tm(mp[i].finalize_s);
    measures[i]->finalize();
  }

  // --- Summary ---
  const auto& counters = stream.counters();
  summary_.ebeflow_version = EBEFLOW_VERSION_STR;
  summary_.config_path = cfg_path.string();
  summary_.filter = filter_spec.describe();
  summary_.keep_empty = keep_empty;
  summary_.events = counters.events;
  summary_.raw_particles = counters.raw_particles;
  summary_.accepted_particles = counters.accepted_particles;
  summary_.empty_groups_dropped = counters.empty_groups_dropped;
  summary_.reader_seconds = t_reader;

  const auto& formats = stream.resolved_formats();
  for (std::size_t i = 0; i < sources.size(); ++i) {
    output::SourceAudit sa;
    sa.name = sources[i].name;
    sa.format = (i < formats.size()) ? input_format_name(formats[i]) : "unread";
    sa.fingerprint.path = sa.name;
    sa.fingerprint.hash_kind = "none";
    summary_.sources.push_back(std::move(sa));
  }
  for (std::size_t i = 0; i < measures.size(); ++i) {
    summary_.measures.push_back(measures[i]->describe());
    summary_.measure_profiling.emplace_back(measures[i]->instance_name(), mp[i]);
  }
  summary_.wall_seconds = total_timer.elapsed_seconds();

  if (!run_summary_path.empty()) {
    std::error_code ec;
    if (fs::is_regular_file(cfg_path, ec)) {
      summary_.config_hash_fnv1a64_hex = hex_u64(fnv1a64_file(cfg_path.string()));
    }
    for (auto& sa : summary_.sources) {
      if (sa.name == kStdinName) continue;
      sa.fingerprint = output::make_fingerprint(sa.name, hash_inputs);
    }
    output::write_run_summary_json(run_summary_path, summary_);
  }

  if (print_profile) {
    std::cerr << "[ebeflow] profiling\n";
    std::cerr << "  wall_seconds: " << std::setprecision(6) << summary_.wall_seconds << "\n";
    std::cerr << "  reader_seconds: " << summary_.reader_seconds << "\n";
    std::cerr << "  sources_opened: " << counters.sources_opened << "\n";
    std::cerr << "  events: " << counters.events;
    if (counters.empty_groups_dropped > 0) std::cerr << " (fully filtered groups dropped: " << counters.empty_groups_dropped << ")";
    std::cerr << "\n";
    std::cerr << "  particles: read=" << counters.raw_particles << " accepted=" << counters.accepted_particles << "\n";
    for (std::size_t i = 0; i < measures.size(); ++i) {
      std::cerr << "  measure." << measures[i]->instance_name() << " (type=" << measures[i]->type() << ")"
                << ": on_start=" << mp[i].on_start_s
                << " on_event=" << mp[i].on_event_s
                << " finalize=" << mp[i].finalize_s
                << " events=" << mp[i].events << "\n";
    }
    if (!run_summary_path.empty()) {
      std::cerr << "  run_summary: " << run_summary_path.string() << "\n";
    }
  }

  return 0;
}

} // namespace ebeflow

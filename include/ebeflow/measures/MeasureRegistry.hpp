#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "ebeflow/config/IniConfig.hpp"
#include "ebeflow/measures/IMeasure.hpp"

namespace ebeflow {

// What the Runner checks before any measure is instantiated.
struct MeasureCapabilities {
  // Output targets as written in the config ("-" = stdout). The Runner rejects
  // two measures on stdout and two measures on the same file.
  std::vector<std::string> outputs;
};

// Context used by measure factories.
struct MeasureBuildEnv {
  std::filesystem::path cfg_dir;   // relative output paths resolve against this
  std::ostream* console = nullptr; // stream behind output "-" (null = std::cout)

  // When true, factories must not create files or directories (--validate-config).
  bool dry_run = false;
};

struct MeasureFactoryEntry {
  using CapsFn = MeasureCapabilities (*)(const IniConfig&, const std::string& section,
                                         const std::string& instance,
                                         const MeasureBuildEnv& env);

  using CreateFn = std::unique_ptr<IMeasure> (*)(const IniConfig&, const std::string& section,
                                                 const std::string& instance,
                                                 const MeasureBuildEnv& env);

  std::string type;
  std::string summary; // one line for --list-measures
  CapsFn caps = nullptr;
  CreateFn create = nullptr;
};

// Process-wide table of measure types, filled by static MeasureRegistrars
// before main() runs. Types are kept sorted for --list-measures.
class MeasureRegistry {
public:
  static MeasureRegistry& instance() {
    static MeasureRegistry registry;
    return registry;
  }

  void register_factory(MeasureFactoryEntry entry) {
    if (entry.type.empty() || !entry.caps || !entry.create) {
      throw std::runtime_error("MeasureRegistry: incomplete factory entry '" + entry.type + "'");
    }
    const std::string key = entry.type;
    if (!by_type_.emplace(key, std::move(entry)).second) {
      throw std::runtime_error("MeasureRegistry: measure type '" + key + "' registered twice");
    }
  }

  bool has(const std::string& type) const { return by_type_.count(type) != 0; }

  // Throws with the list of known types when `type` is not registered.
  const MeasureFactoryEntry& require(const std::string& type) const {
    if (auto it = by_type_.find(type); it != by_type_.end()) return it->second;
    std::string known;
    for (const auto& [name, entry] : by_type_) known += " " + name;
    throw std::runtime_error("unknown measure type '" + type + "' (available:" + known + ")");
  }

  std::vector<std::string> registered_types() const {
    std::vector<std::string> types;
    for (const auto& [name, entry] : by_type_) types.push_back(name);
    return types;
  }

private:
  std::map<std::string, MeasureFactoryEntry> by_type_;
};

// Registers a factory from the measure's own translation unit:
//
//   static MeasureRegistrar reg("flow", "per-event flow coefficients", &caps_fn, &create_fn);
//
// CMake compiles every file under src/measures/, so adding a measure is adding one file.
class MeasureRegistrar {
public:
  MeasureRegistrar(const char* type,
                   const char* summary,
                   MeasureFactoryEntry::CapsFn caps,
                   MeasureFactoryEntry::CreateFn create) {
    MeasureRegistry::instance().register_factory(MeasureFactoryEntry{type, summary, caps, create});
  }
};

inline bool starts_with(std::string_view s, std::string_view pref) {
  return s.size() >= pref.size() && s.substr(0, pref.size()) == pref;
}

} // namespace ebeflow

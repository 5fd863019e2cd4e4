#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <istream>
#include <limits>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "ebeflow/util/Parse.hpp"

namespace ebeflow {

// INI run configuration:
// - Sections: [section] or [measure.name]
// - Key: key = value (keys are case-sensitive, e.g. pT_min)
// - Comments: lines starting with '#' or ';'; trailing " #..." comments are stripped
// - Values: raw strings; surrounding quotes (single/double) are stripped.
// An empty value counts as "not set" for the optional getters.
class IniConfig {
public:
  using Section = std::map<std::string, std::string>;

  explicit IniConfig(const std::filesystem::path& file) : file_(file) {
    std::ifstream ifs(file_);
    if (!ifs) fail_("failed to open config");
    load_(ifs);
  }

  // In-memory config (CLI defaults, tests). `origin` only names it in messages.
  static IniConfig from_string(const std::string& text, const std::filesystem::path& origin = "<memory>") {
    std::istringstream iss(text);
    return IniConfig(iss, origin);
  }

  const std::filesystem::path& file_path() const { return file_; }
  std::filesystem::path base_dir() const { return file_.parent_path(); }

  bool has_section(const std::string& section) const { return sections_.count(section) != 0; }

  std::vector<std::string> section_names() const {
    std::vector<std::string> names;
    names.reserve(sections_.size());
    for (const auto& [name, keys] : sections_) names.push_back(name);
    return names;
  }

  bool has_key(const std::string& section, const std::string& key) const { return find_(section, key) != nullptr; }

  // True when the key exists with a non-empty value.
  bool is_set(const std::string& section, const std::string& key) const {
    const std::string* v = find_(section, key);
    return v && !v->empty();
  }

  std::string get_string(const std::string& section, const std::string& key,
                         const std::optional<std::string>& def = std::nullopt) const {
    if (const std::string* v = find_(section, key)) return *v;
    if (!def) fail_("missing required key '" + key + "' in section [" + section + "]");
    return *def;
  }

  std::int64_t get_int64(const std::string& section, const std::string& key,
                         const std::optional<std::int64_t>& def = std::nullopt) const {
    const std::string* v = find_(section, key);
    if (!v) {
      if (!def) fail_("missing required key '" + key + "' in section [" + section + "]");
      return *def;
    }
    return to_int64_(section, key, *v);
  }

  int get_int(const std::string& section, const std::string& key,
              const std::optional<int>& def = std::nullopt) const {
    const std::int64_t v = get_int64(section, key, def ? std::optional<std::int64_t>(*def) : std::nullopt);
    return narrow_int_(section, key, v);
  }

  double get_double(const std::string& section, const std::string& key,
                    const std::optional<double>& def = std::nullopt) const {
    const std::string* v = find_(section, key);
    if (!v) {
      if (!def) fail_("missing required key '" + key + "' in section [" + section + "]");
      return *def;
    }
    return to_double_(section, key, *v);
  }

  bool get_bool(const std::string& section, const std::string& key,
                const std::optional<bool>& def = std::nullopt) const {
    const std::string* v = find_(section, key);
    if (!v) {
      if (!def) fail_("missing required key '" + key + "' in section [" + section + "]");
      return *def;
    }
    return to_bool_(section, key, *v);
  }

  // nullopt when the key is absent or empty; throws when present but malformed.
  std::optional<double> get_optional_double(const std::string& section, const std::string& key) const {
    if (!is_set(section, key)) return std::nullopt;
    return to_double_(section, key, *find_(section, key));
  }

  std::optional<bool> get_optional_bool(const std::string& section, const std::string& key) const {
    if (!is_set(section, key)) return std::nullopt;
    return to_bool_(section, key, *find_(section, key));
  }

  // Comma-separated items, trimmed; empty items are dropped.
  std::vector<std::string> get_list(const std::string& section, const std::string& key,
                                    const std::optional<std::string>& def = std::nullopt) const {
    const std::string s = get_string(section, key, def);
    std::vector<std::string> items;
    std::size_t b = 0;
    while (b <= s.size()) {
      std::size_t e = s.find(',', b);
      if (e == std::string::npos) e = s.size();
      const std::string_view item = trim_view(std::string_view(s).substr(b, e - b));
      if (!item.empty()) items.emplace_back(item);
      b = e + 1;
    }
    return items;
  }

  // Comma- or whitespace-separated integers, e.g. "211, -211 321". Absent key: empty list.
  std::vector<int> get_int_list(const std::string& section, const std::string& key) const {
    std::string s = get_string(section, key, std::optional<std::string>(""));
    std::replace(s.begin(), s.end(), ',', ' ');
    std::vector<std::string_view> tokens;
    split_ws(s, tokens);
    std::vector<int> out;
    out.reserve(tokens.size());
    for (const auto tok : tokens) {
      out.push_back(narrow_int_(section, key, to_int64_(section, key, std::string(tok))));
    }
    return out;
  }

  const Section& section(const std::string& section) const {
    auto it = sections_.find(section);
    if (it == sections_.end()) fail_("missing section [" + section + "]");
    return it->second;
  }

  // Fail fast on typos: every key in `section` must be listed in `allowed`.
  void require_known_keys(const std::string& section, const std::set<std::string>& allowed) const {
    auto it = sections_.find(section);
    if (it == sections_.end()) return;
    for (const auto& [key, value] : it->second) {
      if (allowed.count(key) != 0) continue;
      std::string known;
      for (const auto& k : allowed) known += " " + k;
      fail_("unknown key '" + key + "' in section [" + section + "]. Known keys:" + known);
    }
  }

  // Override or add a value (CLI flags take precedence over the file).
  void set(const std::string& section, const std::string& key, const std::string& value) {
    sections_[section][key] = value;
  }

private:
  std::filesystem::path file_;
  std::map<std::string, Section> sections_;

  IniConfig(std::istream& in, const std::filesystem::path& origin) : file_(origin) { load_(in); }

  [[noreturn]] void fail_(const std::string& what) const {
    throw std::runtime_error("IniConfig[" + file_.string() + "]: " + what);
  }

  const std::string* find_(const std::string& section, const std::string& key) const {
    auto sit = sections_.find(section);
    if (sit == sections_.end()) return nullptr;
    auto kit = sit->second.find(key);
    return kit == sit->second.end() ? nullptr : &kit->second;
  }

  std::int64_t to_int64_(const std::string& section, const std::string& key, const std::string& s) const {
    std::int64_t v = 0;
    if (!parse_int(trim_view(s), v)) fail_("failed to parse integer for " + section + "." + key + " from value: '" + s + "'");
    return v;
  }

  int narrow_int_(const std::string& section, const std::string& key, std::int64_t v) const {
    if (v < std::numeric_limits<int>::min() || v > std::numeric_limits<int>::max()) {
      fail_(section + "." + key + " out of int range: " + std::to_string(v));
    }
    return static_cast<int>(v);
  }

  double to_double_(const std::string& section, const std::string& key, const std::string& s) const {
    double v = 0.0;
    if (!parse_double(trim_view(s), v)) fail_("failed to parse double for " + section + "." + key + " from value: '" + s + "'");
    return v;
  }

  bool to_bool_(const std::string& section, const std::string& key, std::string s) const {
    for (auto& c : s) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    fail_("failed to parse bool for " + section + "." + key + " from value: '" + s + "'");
  }

  // "value   # note" -> "value". A '#' or ';' only starts a comment after whitespace.
  static std::string_view without_comment_(std::string_view s) {
    for (std::size_t i = 1; i < s.size(); ++i) {
      if ((s[i] == '#' || s[i] == ';') && (s[i - 1] == ' ' || s[i - 1] == '\t')) return s.substr(0, i);
    }
    return s;
  }

  static std::string_view unquote_(std::string_view s) {
    if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) {
      return s.substr(1, s.size() - 2);
    }
    return s;
  }

  void load_(std::istream& in) {
    std::string current;
    std::string raw;
    for (std::size_t lineno = 1; std::getline(in, raw); ++lineno) {
      const std::string_view line = trim_view(raw);
      if (line.empty() || line.front() == '#' || line.front() == ';') continue;
      const std::string at = " at line " + std::to_string(lineno);

      if (line.front() == '[') {
        const std::string_view header = trim_view(without_comment_(line));
        if (header.back() != ']') fail_("malformed section header" + at);
        current = std::string(trim_view(header.substr(1, header.size() - 2)));
        if (current.empty()) fail_("empty section header" + at);
        sections_[current];
        continue;
      }

      const std::size_t eq = line.find('=');
      if (eq == std::string_view::npos) fail_("expected key=value" + at + ": " + std::string(line));
      const std::string key(trim_view(line.substr(0, eq)));
      if (key.empty()) fail_("empty key" + at);
      if (current.empty()) fail_("key outside any section" + at + ": " + key);
      sections_[current][key] = std::string(unquote_(trim_view(without_comment_(line.substr(eq + 1)))));
    }
  }
};

} // namespace ebeflow

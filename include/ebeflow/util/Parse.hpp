#pragma once

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace ebeflow {

inline bool is_ws(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

inline std::string_view trim_view(std::string_view s) {
  std::size_t b = 0;
  while (b < s.size() && is_ws(s[b])) ++b;
  std::size_t e = s.size();
  while (e > b && is_ws(s[e - 1])) --e;
  return s.substr(b, e - b);
}

inline bool is_blank(std::string_view s) {
  for (char c : s) {
    if (!is_ws(c)) return false;
  }
  return true;
}

// Drop a trailing '\r' left behind by CRLF line endings.
inline std::string_view strip_cr(std::string_view s) {
  if (!s.empty() && s.back() == '\r') s.remove_suffix(1);
  return s;
}

inline void split_ws(std::string_view s, std::vector<std::string_view>& out) {
  out.clear();
  std::size_t i = 0;
  const std::size_t n = s.size();
  while (i < n) {
    while (i < n && is_ws(s[i])) ++i;
    if (i >= n) break;
    std::size_t j = i;
    while (j < n && !is_ws(s[j])) ++j;
    out.emplace_back(s.substr(i, j - i));
    i = j;
  }
}

// Full-token parse: trailing characters make the parse fail.
// A leading '+' is accepted (from_chars alone rejects it).
template <typename IntT>
inline bool parse_int(std::string_view tok, IntT& value) {
  if (!tok.empty() && tok.front() == '+') tok.remove_prefix(1);
  if (tok.empty()) return false;
  const char* b = tok.data();
  const char* e = tok.data() + tok.size();
  auto res = std::from_chars(b, e, value);
  return res.ec == std::errc{} && res.ptr == e;
}

inline bool parse_double(std::string_view tok, double& value) {
  if (!tok.empty() && tok.front() == '+') tok.remove_prefix(1);
  if (tok.empty()) return false;
  const char* b = tok.data();
  const char* e = tok.data() + tok.size();
  auto res = std::from_chars(b, e, value);
  return res.ec == std::errc{} && res.ptr == e;
}

// Fortran writes double precision exponents as 'D' (0.1D+01).
// Surrounding blanks of a fixed-width column are ignored.
inline bool parse_fortran_double(std::string_view field, double& value) {
  field = trim_view(field);
  if (field.empty() || field.size() > 64) return false;
  char buf[64];
  for (std::size_t i = 0; i < field.size(); ++i) {
    const char c = field[i];
    buf[i] = (c == 'D' || c == 'd') ? 'E' : c;
  }
  return parse_double(std::string_view(buf, field.size()), value);
}

template <typename IntT>
inline bool parse_fixed_int(std::string_view field, IntT& value) {
  return parse_int(trim_view(field), value);
}

// Shortest decimal text that reads back to exactly the same double.
inline void append_double(std::string& out, double x) {
  char buf[64];
  auto res = std::to_chars(buf, buf + sizeof(buf), x);
  out.append(buf, res.ptr);
}

inline std::string format_double(double x) {
  std::string s;
  append_double(s, x);
  return s;
}

} // namespace ebeflow

#pragma once

#include <cctype>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace lmputil {

inline bool is_ws(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n';
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

inline bool next_token(const char*& p, const char* end, std::string_view& tok) {
  while (p < end && is_ws(*p)) ++p;
  if (p >= end) {
    tok = std::string_view{};
    return false;
  }
  const char* start = p;
  while (p < end && !is_ws(*p)) ++p;
  tok = std::string_view(start, static_cast<std::size_t>(p - start));
  return true;
}

inline std::string_view trim(std::string_view s) {
  std::size_t b = 0;
  while (b < s.size() && is_ws(s[b])) ++b;
  std::size_t e = s.size();
  while (e > b && is_ws(s[e - 1])) --e;
  return s.substr(b, e - b);
}

// from_chars has no '+' sign; drop one when a digit or '.' follows it.
inline const char* skip_plus_sign(const char* b, const char* e) {
  if (e - b > 1 && *b == '+' && (std::isdigit(static_cast<unsigned char>(b[1])) || b[1] == '.')) {
    return b + 1;
  }
  return b;
}

// Whole-token parse: trailing garbage ("12abc") is rejected.
template <typename IntT>
inline bool parse_int(std::string_view tok, IntT& value) {
  const char* e = tok.data() + tok.size();
  const char* b = skip_plus_sign(tok.data(), e);
  auto res = std::from_chars(b, e, value);
  return res.ec == std::errc{} && res.ptr == e;
}

inline bool parse_double(std::string_view tok, double& value) {
  const char* e = tok.data() + tok.size();
  const char* b = skip_plus_sign(tok.data(), e);
  auto res = std::from_chars(b, e, value);
  return res.ec == std::errc{} && res.ptr == e;
}

// Shortest text that parses back to the same double.
inline void append_double(std::string& out, double v) {
  char buf[32];
  auto res = std::to_chars(buf, buf + sizeof(buf), v);
  out.append(buf, res.ptr);
}

inline std::string format_double(double v) {
  std::string s;
  append_double(s, v);
  return s;
}

} // namespace lmputil

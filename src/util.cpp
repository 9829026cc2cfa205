// Hex and string helpers shared by the store and the git adapter
#include "gitstack/util.hpp"

#include "gitstack/consts.hpp"

#include <algorithm>
#include <cctype>

namespace gitstack {

bool looks_hex40(std::string_view str) {
  if (str.size() != consts::kOidHexLen) {
    return false;
  }
  return std::ranges::all_of(str,
                             [](char c) { return std::isxdigit(static_cast<unsigned char>(c)); });
}

std::string short_hash(std::string_view hash) {
  return std::string(hash.substr(0, consts::kShortHashLen));
}

namespace strutil {

void rstrip_newlines(std::string &s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) {
    s.pop_back();
  }
}

std::string trim(std::string_view sv) {
  const auto is_ws = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
  while (!sv.empty() && is_ws(sv.front()))
    sv.remove_prefix(1);
  while (!sv.empty() && is_ws(sv.back()))
    sv.remove_suffix(1);
  return std::string(sv);
}

std::vector<std::string> split_lines(std::string_view text) {
  std::vector<std::string> out;
  std::size_t pos = 0;
  while (pos < text.size()) {
    const std::size_t nl = text.find('\n', pos);
    if (nl == std::string_view::npos) {
      out.emplace_back(text.substr(pos));
      break;
    }
    out.emplace_back(text.substr(pos, nl - pos));
    pos = nl + 1;
  }
  return out;
}

std::string join(const std::vector<std::string> &parts, std::string_view sep) {
  std::string out;
  for (std::size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      out.append(sep);
    }
    out.append(parts[i]);
  }
  return out;
}

} // namespace strutil

} // namespace gitstack

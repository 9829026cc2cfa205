#pragma once
#include <string>
#include <string_view>
#include <vector>

namespace gitstack {

// Validate 40-char lowercase/uppercase hex
auto looks_hex40(std::string_view str) -> bool;

// First seven characters of a commit hash, for log output.
auto short_hash(std::string_view hash) -> std::string;

// String helpers
namespace strutil {
  // Strip trailing CR/LF characters in place
  void rstrip_newlines(std::string &str);

  // Strip leading and trailing spaces, tabs, CR and LF
  auto trim(std::string_view sv) -> std::string;

  // Split on '\n'; a trailing newline does not produce an empty last element
  auto split_lines(std::string_view text) -> std::vector<std::string>;

  auto join(const std::vector<std::string> &parts, std::string_view sep) -> std::string;
} // namespace strutil

} // namespace gitstack

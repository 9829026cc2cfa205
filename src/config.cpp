#include "gitstack/config.hpp"

#include "gitstack/consts.hpp"
#include "gitstack/errors.hpp"
#include "gitstack/fs.hpp"
#include "gitstack/util.hpp"

#include <cstdlib>
#include <sstream>
#include <string_view>

namespace {

bool parse_bool(std::string_view key, const std::string &value) {
  if (value == "true" || value == "yes" || value == "1")
    return true;
  if (value == "false" || value == "no" || value == "0")
    return false;
  throw gitstack::Error("config: " + std::string(key) + ": expected a boolean, got '" + value +
                           "'");
}

} // namespace

namespace gitstack {

std::filesystem::path settings_path(const std::filesystem::path &git_dir) {
  return git_dir / consts::kStoreDir / consts::kConfigFile;
}

auto load_settings(const std::filesystem::path &git_dir) -> Settings {
  Settings out{};

  if (const auto text = fs::read_text(settings_path(git_dir))) {
    constexpr std::string_view k_log_level = "log-level:";
    constexpr std::string_view k_interactive = "interactive:";
    constexpr std::string_view k_remote = "remote:";

    std::istringstream iss(*text);
    std::string line;
    while (std::getline(iss, line)) {
      std::string_view sv{line};
      if (sv.empty() || sv[0] == '#')
        continue; // allow comments
      if (sv.rfind(k_log_level, 0) == 0) {
        out.log_level = strutil::trim(sv.substr(k_log_level.size()));
      } else if (sv.rfind(k_interactive, 0) == 0) {
        out.interactive = parse_bool(k_interactive, strutil::trim(sv.substr(k_interactive.size())));
      } else if (sv.rfind(k_remote, 0) == 0) {
        out.remote = strutil::trim(sv.substr(k_remote.size()));
      }
    }
  }

  if (const char *env = std::getenv("GITSTACK_LOG_LEVEL"); env != nullptr && *env != '\0') {
    out.log_level = env;
  }
  return out;
}

void save_settings(const std::filesystem::path &git_dir, const Settings &settings) {
  std::ostringstream os;
  os << "log-level: " << settings.log_level << '\n';
  if (settings.interactive) {
    os << "interactive: " << (*settings.interactive ? "true" : "false") << '\n';
  }
  if (!settings.remote.empty()) {
    os << "remote: " << settings.remote << '\n';
  }
  fs::write_text_atomic(settings_path(git_dir), os.str());
}

} // namespace gitstack

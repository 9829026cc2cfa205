#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace gitstack {

struct Settings {
  std::string log_level = "info";
  std::optional<bool> interactive; // unset: decide from whether stdin is a terminal
  std::string remote;              // empty: no remote configured
};

// Read settings from <git-dir>/gitstack/config. Missing file or keys leave defaults.
// GITSTACK_LOG_LEVEL, when set, overrides log-level.
Settings load_settings(const std::filesystem::path &git_dir);

// Overwrite <git-dir>/gitstack/config with the given settings
void save_settings(const std::filesystem::path &git_dir, const Settings &settings);

std::filesystem::path settings_path(const std::filesystem::path &git_dir);

} // namespace gitstack

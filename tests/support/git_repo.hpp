#pragma once
// Scratch git repository for tests that drive the real git executable.

#include "gitstack/process.hpp"

#include <filesystem>
#include <fstream>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace gitstack::testing {

// Exit status that marks a test as skipped.
constexpr int kSkipped = 77;

inline bool have_git() {
  try {
    return proc::run({"git", "--version"}).exit_code == 0;
  } catch (const std::exception &) {
    return false;
  }
}

class ScratchRepo {
public:
  explicit ScratchRepo(const std::string &prefix)
      : root_(std::filesystem::temp_directory_path() /
              (prefix + std::to_string(std::random_device{}()))) {
    std::filesystem::create_directories(root_);
    git({"init", "--quiet"});
    git({"symbolic-ref", "HEAD", "refs/heads/main"});
    git({"config", "user.name", "Test User"});
    git({"config", "user.email", "test@example.com"});
    git({"config", "commit.gpgsign", "false"});
    commit("README", "hello\n", "initial");
  }

  ~ScratchRepo() {
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
  }

  ScratchRepo(const ScratchRepo &) = delete;
  ScratchRepo &operator=(const ScratchRepo &) = delete;

  [[nodiscard]] const std::filesystem::path &root() const { return root_; }

  std::string git(const std::vector<std::string> &args) {
    std::vector<std::string> argv{"git"};
    argv.insert(argv.end(), args.begin(), args.end());
    auto res = proc::run(argv, proc::Options{.cwd = root_, .env = {}, .stop = {}});
    if (res.exit_code != 0) {
      throw std::runtime_error("git " + args.front() + " failed: " + res.err);
    }
    return res.out;
  }

  // Write `file` and commit it on the current branch.
  void commit(const std::string &file, const std::string &text, const std::string &message) {
    std::ofstream(root_ / file, std::ios::binary) << text;
    git({"add", file});
    git({"commit", "--quiet", "-m", message});
  }

  std::string rev(const std::string &ref) {
    auto out = git({"rev-parse", ref});
    return out.substr(0, out.find('\n'));
  }

private:
  std::filesystem::path root_;
};

} // namespace gitstack::testing

#include "cli/registry.hpp"
#include "cli/session.hpp"

#include "gitstack/config.hpp"

#include "support/git_repo.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using gitstack::cli::dispatch;
using gitstack::cli::Session;
using gitstack::testing::ScratchRepo;
using strings = std::vector<std::string>;

namespace {

bool run_ok(const strings &args) {
  if (const int rc = dispatch(args); rc != 0) {
    std::cerr << "gitstack " << args.front() << " exited with " << rc << "\n";
    return false;
  }
  return true;
}

int scenario(ScratchRepo &g) {
  g.git({"checkout", "--quiet", "-b", "a"});
  g.commit("a.txt", "a\n", "a work");
  g.git({"checkout", "--quiet", "-b", "b"});
  g.commit("b.txt", "b\n", "b work");
  g.git({"checkout", "--quiet", "main"});
  g.commit("main.txt", "main\n", "main work");

  if (dispatch({"ls"}) == 0) {
    std::cerr << "ls before init succeeded\n";
    return 1;
  }
  if (!run_ok({"init", "main"})) return 1;

  gitstack::Settings settings;
  settings.log_level = "warn";
  settings.interactive = false;
  gitstack::save_settings(g.root() / ".git", settings);

  if (!run_ok({"track-downstack", "b"})) return 1;
  {
    const auto s = Session::open();
    if (s->store().list_branches() != strings{"a", "b"} ||
        s->store().lookup_branch("b").base != "a") {
      std::cerr << "track-downstack did not record a and b\n";
      return 1;
    }
  }

  if (!run_ok({"restack-upstack", "a"})) return 1;
  {
    const auto s = Session::open();
    if (!s->repo().is_ancestor("main", "a") || !s->repo().is_ancestor("a", "b")) {
      std::cerr << "restack-upstack left a or b behind\n";
      return 1;
    }
  }

  if (!run_ok({"rename", "b", "c"})) return 1;
  if (!run_ok({"ls"}) || !run_ok({"ls", "c"})) return 1;

  // Conflict, resolve, continue.
  g.git({"checkout", "--quiet", "-b", "x", "main"});
  g.commit("README", "hello\nfrom x\n", "x work");
  if (!run_ok({"track", "--base", "main", "x"})) return 1;
  g.git({"checkout", "--quiet", "main"});
  g.commit("README", "hello\nfrom main\n", "main clash");

  if (dispatch({"restack", "x"}) == 0) {
    std::cerr << "conflicting restack succeeded\n";
    return 1;
  }
  {
    const auto s = Session::open();
    if (s->store().lookup_branch("x").base_hash == g.rev("main")) {
      std::cerr << "interrupted restack recorded the new base\n";
      return 1;
    }
  }

  std::ofstream(g.root() / "README", std::ios::binary) << "hello\nfrom both\n";
  g.git({"add", "README"});
  if (!run_ok({"rebase-continue"})) return 1;
  {
    const auto s = Session::open();
    if (!s->repo().is_ancestor("main", "x") ||
        s->store().lookup_branch("x").base_hash != g.rev("main")) {
      std::cerr << "continued restack not recorded\n";
      return 1;
    }
    if (!s->store().take_continuations("").empty()) {
      std::cerr << "continuations left behind\n";
      return 1;
    }
  }

  if (!run_ok({"untrack", "c"}) || !run_ok({"state-log"})) return 1;
  {
    const auto s = Session::open();
    if (s->store().list_branches() != strings{"a", "x"}) {
      std::cerr << "untrack did not remove c\n";
      return 1;
    }
  }
  return 0;
}

} // namespace

int main() {
  if (!gitstack::testing::have_git()) {
    std::cout << "git not found, skipping\n";
    return gitstack::testing::kSkipped;
  }
  gitstack::cli::register_all_commands();

  const auto cwd = std::filesystem::current_path();
  int rc = 1;
  try {
    ScratchRepo scratch{"gitstack_e2e_test_"};
    std::filesystem::current_path(scratch.root());
    rc = scenario(scratch);
    std::filesystem::current_path(cwd);
  } catch (const std::exception &e) {
    std::filesystem::current_path(cwd);
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }

  if (rc == 0) {
    std::cout << "OK\n";
  }
  return rc;
}

#include "support/fake_git.hpp"

#include "gitstack/config.hpp"
#include "gitstack/forge.hpp"
#include "gitstack/object_store.hpp"
#include "gitstack/service.hpp"
#include "gitstack/state.hpp"
#include "gitstack/state_backend.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using gitstack::state::ObjectBackend;
using gitstack::state::UpdateRequest;
using strings = std::vector<std::string>;

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("gitstack_backend_test_" + std::to_string(std::random_device{}()));

  try {
    // Objects are addressed like git's.
    {
      const gitstack::ObjectStore objects{root / "objects"};
      const auto id = objects.write("blob", std::string_view{"hello\n"});
      if (id != "ce013625030ba8dba906f756967f9e9ca394464a") {
        std::cerr << "blob id mismatch: " << id << "\n";
        return 1;
      }
      const auto obj = objects.read(id);
      if (obj.type != "blob" || std::string(obj.data.begin(), obj.data.end()) != "hello\n" ||
          !objects.contains(id) || objects.contains("not-a-hash")) {
        std::cerr << "blob read back mismatch\n";
        return 1;
      }
    }

    const auto store_root = ObjectBackend::root_for(root / ".git");
    if (store_root != root / ".git" / "gitstack") {
      std::cerr << "store root mismatch: " << store_root << "\n";
      return 1;
    }

    {
      ObjectBackend db{store_root};
      if (db.get("repo") || !db.keys("branches").empty() || !db.history().empty()) {
        std::cerr << "fresh backend not empty\n";
        return 1;
      }

      db.update(UpdateRequest{.sets = {{"repo", "trunk main\n"},
                                       {"branches/a", "base main\n"},
                                       {"branches/user/fix", "base a\n"},
                                       {"other", "x"}},
                              .message = "first"});
      db.update(UpdateRequest{.sets = {{"branches/b", "base a\n"}},
                              .deletes = {"other", "missing"},
                              .message = "second"});
    }

    // Everything survives a reopen.
    {
      ObjectBackend db{store_root};
      if (db.get("repo") != "trunk main\n" || db.get("other").has_value()) {
        std::cerr << "values not persisted\n";
        return 1;
      }
      if (db.keys("branches") != strings{"a", "b", "user/fix"} ||
          db.keys("branches/user") != strings{"fix"}) {
        std::cerr << "keys mismatch\n";
        return 1;
      }
      if (db.history() != strings{"second", "first"}) {
        std::cerr << "history mismatch\n";
        return 1;
      }

      db.clear("wipe");
      if (db.get("repo") || !db.keys("branches").empty() ||
          db.history() != strings{"wipe", "second", "first"}) {
        std::cerr << "clear mismatch\n";
        return 1;
      }
    }

    // The branch store runs unchanged on top of it.
    {
      auto backend = std::make_shared<ObjectBackend>(store_root);
      auto store = gitstack::state::Store::init({.backend = backend, .trunk = "main"});
      auto tx = store.begin_branch_tx();
      tx.upsert({.name = "feature", .base = "main", .base_hash = std::string(40, 'a')});
      tx.commit("track feature");

      const auto reopened =
          gitstack::state::Store::open(std::make_shared<ObjectBackend>(store_root));
      if (reopened.trunk() != "main" || reopened.lookup_branch("feature").base != "main") {
        std::cerr << "store over object backend mismatch\n";
        return 1;
      }
    }

    // A store that can no longer be written does not fail restack checks or loads.
    {
      const auto broken_root = root / "broken";
      gitstack::testing::FakeGit git;
      auto store = gitstack::state::Store::init(
          {.backend = std::make_shared<ObjectBackend>(broken_root), .trunk = "main"});
      auto forges = gitstack::forge::Registry::with_builtin();
      gitstack::Service service{git, store, forges};

      git.branch("a", "main");
      git.commit("a", "a work");
      service.track_branch("a", "main");
      git.branch("b", "a");
      git.commit("b", "b work");
      service.track_branch("b", "a");

      // a moved onto the new trunk by hand; its recorded hash is stale.
      const auto stale = store.lookup_branch("a").base_hash;
      git.commit("main", "trunk work");
      git.branch("scratch", "main");
      git.reset("a", git.commit("scratch", "a work"));

      const auto changes = store.history().size();
      fs::create_directories(broken_root / "DATA.lock");

      service.verify_restacked("a");
      if (store.lookup_branch("a").base_hash != stale || store.history().size() != changes) {
        std::cerr << "unwritable store changed on verify\n";
        return 1;
      }

      git.remove("a");
      const auto items = service.load_branches();
      if (items.size() != 1 || items[0].name != "b" || items[0].base != "main") {
        std::cerr << "load over unwritable store did not repair b\n";
        return 1;
      }
      if (store.list_branches() != strings{"a", "b"} || store.history().size() != changes) {
        std::cerr << "unwritable store changed on load\n";
        return 1;
      }
    }

    // Settings
    {
      const auto git_dir = root / ".git";
      const auto defaults = gitstack::load_settings(git_dir);
      if (defaults.log_level.empty() || defaults.interactive.has_value()) {
        std::cerr << "settings defaults mismatch\n";
        return 1;
      }
      gitstack::Settings s;
      s.log_level = "debug";
      s.interactive = false;
      s.remote = "origin";
      gitstack::save_settings(git_dir, s);
      const auto loaded = gitstack::load_settings(git_dir);
      if (loaded.interactive != false || loaded.remote != "origin") {
        std::cerr << "settings round trip mismatch\n";
        return 1;
      }
    }

    std::cout << "object backend test OK: " << root << "\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    std::error_code ec;
    fs::remove_all(root, ec);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}

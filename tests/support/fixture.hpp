#pragma once
// Service over a FakeGit and an in-memory store, trunk "main".

#include "fake_git.hpp"

#include "gitstack/forge.hpp"
#include "gitstack/service.hpp"
#include "gitstack/state.hpp"

#include <memory>
#include <string>

namespace gitstack::testing {

struct Fixture {
  FakeGit git;
  std::shared_ptr<state::MemoryBackend> backend = std::make_shared<state::MemoryBackend>();
  state::Store store = state::Store::init({.backend = backend, .trunk = "main"});
  forge::Registry forges = forge::Registry::with_builtin();
  Service service{git, store, forges};

  // New branch off `base` with one commit, tracked on `base`.
  void stack(const std::string &name, const std::string &base) {
    git.branch(name, base);
    git.commit(name, name + " work");
    service.track_branch(name, base);
  }
};

} // namespace gitstack::testing

#include "gitstack/discover.hpp"

#include "support/fixture.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using gitstack::BranchToTrack;
using gitstack::NonInteractiveSelector;
using gitstack::PromptSelector;
using gitstack::testing::Fixture;

// main <- a <- b <- c <- d, one commit each, nothing tracked.
static void chain(Fixture &f) {
  std::string base = "main";
  for (const char *name : {"a", "b", "c", "d"}) {
    f.git.branch(name, base);
    f.git.commit(name, std::string(name) + " work");
    base = name;
  }
}

static bool same(const std::vector<BranchToTrack> &got,
                 const std::vector<std::pair<std::string, std::string>> &want) {
  if (got.size() != want.size()) {
    return false;
  }
  for (std::size_t i = 0; i < got.size(); ++i) {
    if (got[i].name != want[i].first || got[i].base != want[i].second) {
      return false;
    }
  }
  return true;
}

int main() {
  try {
    // Whole chain down to trunk.
    {
      Fixture f;
      chain(f);
      NonInteractiveSelector selector;
      gitstack::DownstackDiscoverer discoverer{f.git, "main", {}, selector};
      const auto found = discoverer.discover("d");
      if (!same(found, {{"d", "c"}, {"c", "b"}, {"b", "a"}, {"a", "main"}})) {
        std::cerr << "discover(d) mismatch\n";
        return 1;
      }
      if (found[0].base_hash != f.git.head("c") || found[3].base_hash != f.git.head("main")) {
        std::cerr << "discovered base hashes mismatch\n";
        return 1;
      }

      const auto added = f.service.track_downstack("d", selector);
      if (!same(added, {{"a", "main"}, {"b", "a"}, {"c", "b"}, {"d", "c"}})) {
        std::cerr << "track_downstack order mismatch\n";
        return 1;
      }
      if (f.store.list_branches() != std::vector<std::string>{"a", "b", "c", "d"} ||
          f.store.lookup_branch("c").base_hash != f.git.head("b")) {
        std::cerr << "downstack not stored\n";
        return 1;
      }
      if (f.store.history().front() != "track downstack from d (4 branches)") {
        std::cerr << "unexpected message: " << f.store.history().front() << "\n";
        return 1;
      }

      // Already tracked: nothing to do.
      if (!f.service.track_downstack("d", selector).empty()) {
        std::cerr << "tracked branch discovered again\n";
        return 1;
      }
      try {
        (void)f.service.track_downstack("main", selector);
        std::cerr << "trunk accepted\n";
        return 1;
      } catch (const gitstack::TrunkError &) {
      }
    }

    // Discovery stops at the first tracked branch.
    {
      Fixture f;
      chain(f);
      f.service.track_branch("b", "");
      if (f.store.lookup_branch("b").base != "main") {
        std::cerr << "b should fall back to trunk with nothing tracked below\n";
        return 1;
      }

      NonInteractiveSelector selector;
      const auto added = f.service.track_downstack("d", selector);
      if (!same(added, {{"c", "b"}, {"d", "c"}})) {
        std::cerr << "discovery went past a tracked branch\n";
        return 1;
      }
    }

    // Two branches at one commit.
    {
      Fixture f;
      f.git.branch("a", "main");
      f.git.commit("a", "a work");
      f.git.branch("a2", "a");
      f.git.branch("d", "a");
      f.git.commit("d", "d work");

      NonInteractiveSelector strict;
      try {
        (void)f.service.track_downstack("d", strict);
        std::cerr << "ambiguous base accepted\n";
        return 1;
      } catch (const gitstack::AmbiguousBaseError &e) {
        if (e.branch() != "d" || e.commit() != f.git.head("a") ||
            e.candidates() != std::vector<std::string>{"a", "a2"}) {
          std::cerr << "ambiguous base error fields mismatch\n";
          return 1;
        }
      }
      if (!f.store.list_branches().empty()) {
        std::cerr << "failed discovery tracked something\n";
        return 1;
      }

      std::istringstream in("x\n9\n2\n0\n");
      std::ostringstream out;
      PromptSelector prompt{in, out};
      const auto added = f.service.track_downstack("d", prompt);
      if (!same(added, {{"a2", "main"}, {"d", "a2"}})) {
        std::cerr << "prompted discovery mismatch\n";
        return 1;
      }
      const auto text = out.str();
      for (const char *want : {"1) a\n", "2) a2\n", "0) None of these", "enter a number",
                               "already selected at this commit: a2"}) {
        if (text.find(want) == std::string::npos) {
          std::cerr << "prompt output lacks '" << want << "':\n" << text;
          return 1;
        }
      }

      std::istringstream eof("");
      PromptSelector closed{eof, out};
      f.git.branch("e", "d");
      f.git.branch("e2", "d");
      f.git.branch("top", "d");
      f.git.commit("top", "top work");
      try {
        (void)f.service.track_downstack("top", closed);
        std::cerr << "closed input accepted\n";
        return 1;
      } catch (const gitstack::Error &) {
      }
    }

    // Base guessing walks down to the nearest tracked head.
    {
      Fixture f;
      f.stack("a", "main");
      f.git.branch("b", "a");
      f.git.commit("b", "b one");
      f.git.commit("b", "b two");
      if (f.service.track_branch("b", "") != "a") {
        std::cerr << "guessed the wrong base for b\n";
        return 1;
      }
      f.git.branch("side", "main");
      f.git.commit("side", "side work");
      if (f.service.track_branch("side", "") != "main") {
        std::cerr << "guessed the wrong base for side\n";
        return 1;
      }
      try {
        (void)f.service.track_branch("ghost", "");
        std::cerr << "tracked a missing branch\n";
        return 1;
      } catch (const gitstack::NotExistError &) {
      }
      try {
        (void)f.service.track_branch("main", "");
        std::cerr << "tracked trunk\n";
        return 1;
      } catch (const gitstack::TrunkError &) {
      }
    }
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }

  std::cout << "OK\n";
  return 0;
}

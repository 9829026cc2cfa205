#include "support/fixture.hpp"

#include <iostream>
#include <string>
#include <vector>

using gitstack::testing::Fixture;
using strings = std::vector<std::string>;

static bool on_top(Fixture &f, const std::string &branch, const std::string &base) {
  return f.git.is_ancestor(f.git.head(base), f.git.head(branch));
}

int main() {
  try {
    {
      Fixture f;
      f.stack("a", "main");
      f.stack("b", "a");
      f.stack("c", "b");

      const auto stack = f.service.branch_graph().stack_linear("b");
      if (stack != strings{"a", "b", "c"}) {
        std::cerr << "linear stack mismatch\n";
        return 1;
      }

      const auto order = f.service.stack_edit(stack, {"c", "a", "b"});
      if (order != strings{"c", "a", "b"}) {
        std::cerr << "stack_edit returned the wrong order\n";
        return 1;
      }
      if (f.store.lookup_branch("c").base != "main" || f.store.lookup_branch("a").base != "c" ||
          f.store.lookup_branch("b").base != "a") {
        std::cerr << "bases not reordered\n";
        return 1;
      }
      if (!on_top(f, "c", "main") || !on_top(f, "a", "c") || !on_top(f, "b", "a")) {
        std::cerr << "commits not reordered\n";
        return 1;
      }
      if (f.git.info(f.git.head("c")).parents.front() != f.git.head("main")) {
        std::cerr << "c should sit directly on main\n";
        return 1;
      }
      if (f.service.list_stack("a") != strings{"c", "a", "b"}) {
        std::cerr << "graph does not match new order\n";
        return 1;
      }
    }

    // Merged history stays with the bottom of the stack.
    {
      Fixture f;
      f.stack("a", "main");
      f.stack("b", "a");
      {
        auto tx = f.store.begin_branch_tx();
        tx.upsert(gitstack::state::UpsertRequest{.name = "a", .merged_downstack = strings{"#1"}});
        tx.commit("merged");
      }

      (void)f.service.stack_edit({"a", "b"}, {"b", "a"});
      if (f.store.lookup_branch("b").merged_downstack != strings{"#1"} ||
          !f.store.lookup_branch("a").merged_downstack.empty()) {
        std::cerr << "merged downstack did not follow the bottom\n";
        return 1;
      }
    }

    // Bad edits are rejected before anything moves.
    {
      Fixture f;
      f.stack("a", "main");
      f.stack("b", "a");
      const auto changes = f.store.history().size();

      try {
        (void)f.service.stack_edit({"a", "b"}, {});
        std::cerr << "empty order accepted\n";
        return 1;
      } catch (const gitstack::StackEditAbortedError &) {
      }
      try {
        (void)f.service.stack_edit({}, {"a"});
        std::cerr << "empty stack accepted\n";
        return 1;
      } catch (const gitstack::Error &) {
      }
      try {
        (void)f.service.stack_edit({"main", "a"}, {"a", "main"});
        std::cerr << "trunk accepted\n";
        return 1;
      } catch (const gitstack::TrunkError &) {
      }
      for (const auto &order : {strings{"b", "x"}, strings{"b", "b"}}) {
        try {
          (void)f.service.stack_edit({"a", "b"}, order);
          std::cerr << "bad order accepted\n";
          return 1;
        } catch (const gitstack::Error &) {
        }
      }
      if (f.store.history().size() != changes || f.git.rebases.size() != 0) {
        std::cerr << "rejected edit changed something\n";
        return 1;
      }
    }
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }

  std::cout << "OK\n";
  return 0;
}

#include "cli/session.hpp"

#include "gitstack/branch_graph.hpp"
#include "gitstack/util.hpp"

#include <iostream>
#include <string>

using gitstack::BranchGraph;
using gitstack::cli::Session;

namespace {

struct Printer {
  Session &session;
  const BranchGraph &graph;
  std::string current;
  std::string trunk_hash;

  void line(const std::string &name, int depth) const {
    std::cout << std::string(static_cast<std::size_t>(depth) * 2, ' ') << name;
    if (const auto *item = graph.lookup(name)) {
      if (item->change) {
        std::cout << " (" << item->change->change_id() << ")";
      }
      const auto *base = graph.lookup(item->base);
      const auto &base_head = base != nullptr ? base->head : trunk_hash;
      if (!session.repo().is_ancestor(base_head, item->head)) {
        std::cout << " (needs restack)";
      }
    }
    if (name == current) {
      std::cout << " *";
    }
    std::cout << "\n";
  }

  void tree(const std::string &name, int depth) const {
    line(name, depth);
    for (const auto &above : graph.aboves(name)) {
      tree(above, depth + 1);
    }
  }
};

} // namespace

int cmd_ls(int argc, char **argv) {
  if (argc > 2) {
    std::cerr << "usage: gitstack ls [branch]\n";
    return 2;
  }
  const std::string branch = argc == 2 ? argv[1] : "";

  return gitstack::cli::run("ls", argc, argv, [&](Session &s) {
    const auto graph = s.service().branch_graph();
    std::string current;
    try {
      current = s.repo().current_branch();
    } catch (const gitstack::Error &e) {
      s.log()->debug("no current branch: {}", e.what());
    }
    const Printer p{.session = s,
                    .graph = graph,
                    .current = current,
                    .trunk_hash = s.repo().peel_to_commit(graph.trunk())};

    if (branch.empty()) {
      p.tree(graph.trunk(), 0);
      return 0;
    }
    // Only the stack of `branch`, bottom first.
    p.line(graph.trunk(), 0);
    int depth = 1;
    for (const auto &name : s.service().list_stack(branch)) {
      if (name == graph.trunk()) {
        continue;
      }
      p.line(name, depth++);
    }
    return 0;
  });
}

#include "cli/session.hpp"

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

using gitstack::RestackResponse;
using gitstack::RestackStatus;
using gitstack::cli::Session;

namespace {

void report(const RestackResponse &res) {
  if (res.status == RestackStatus::already_restacked) {
    std::cout << res.branch << ": branch does not need to be restacked\n";
  } else {
    std::cout << res.branch << ": restacked on " << res.base << "\n";
  }
}

} // namespace

int cmd_restack(int argc, char **argv) {
  if (argc != 2) {
    std::cerr << "usage: gitstack restack <branch>\n";
    return 2;
  }
  const std::string branch = argv[1];

  return gitstack::cli::run("restack", argc, argv, [&](Session &s) {
    report(s.service().restack(branch));
    return 0;
  });
}

int cmd_restack_upstack(int argc, char **argv) {
  if (argc != 2) {
    std::cerr << "usage: gitstack restack-upstack <branch>\n";
    return 2;
  }
  const std::string branch = argv[1];

  return gitstack::cli::run("restack-upstack", argc, argv, [&](Session &s) {
    for (const auto &res : s.service().restack_upstack(branch)) {
      report(res);
    }
    return 0;
  });
}

int cmd_onto(int argc, char **argv) {
  if (argc != 3) {
    std::cerr << "usage: gitstack onto <branch> <base>\n";
    return 2;
  }
  const std::string branch = argv[1];
  const std::string onto = argv[2];

  return gitstack::cli::run("onto", argc, argv, [&](Session &s) {
    s.service().branch_onto(gitstack::BranchOntoRequest{.branch = branch, .onto = onto});
    std::cout << branch << ": moved onto " << onto << "\n";
    return 0;
  });
}

// Branches are listed bottom first, in the order they should end up.
int cmd_reorder(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "usage: gitstack reorder <bottom>... <top>\n";
    return 2;
  }
  const std::vector<std::string> order(argv + 1, argv + argc);

  return gitstack::cli::run("reorder", argc, argv, [&](Session &s) {
    // The stack as it is today, trunk excluded.
    const auto graph = s.service().branch_graph();
    const auto stack = graph.stack_linear(order.front());
    std::vector<std::string> current;
    for (const auto &name : stack) {
      if (name != graph.trunk()) {
        current.push_back(name);
      }
    }
    std::vector<std::string> wanted;
    for (const auto &name : order) {
      if (std::find(current.begin(), current.end(), name) == current.end()) {
        throw gitstack::Error("branch " + name + " is not on the stack of " + order.front());
      }
      wanted.push_back(name);
    }

    // Listed branches are moved; the rest of the stack keeps its place above them.
    std::vector<std::string> slice;
    for (const auto &name : current) {
      if (std::find(wanted.begin(), wanted.end(), name) != wanted.end()) {
        slice.push_back(name);
      }
    }
    const auto result = s.service().stack_edit(slice, wanted);
    std::cout << "stack reordered:";
    for (const auto &name : result) {
      std::cout << " " << name;
    }
    std::cout << "\n";
    return 0;
  });
}

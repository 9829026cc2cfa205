#include "cli/session.hpp"

#include "gitstack/discover.hpp"

#include <iostream>
#include <memory>
#include <string>

using gitstack::cli::Session;

int cmd_track(int argc, char **argv) {
  std::string base;
  std::string branch;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--base" && i + 1 < argc) {
      base = argv[++i];
    } else if (arg.rfind("--base=", 0) == 0) {
      base = arg.substr(7);
    } else {
      branch = arg;
    }
  }
  if (branch.empty()) {
    std::cerr << "usage: gitstack track [--base <base>] <branch>\n";
    return 2;
  }

  return gitstack::cli::run("track", argc, argv, [&](Session &s) {
    const auto used = s.service().track_branch(branch, base);
    std::cout << branch << ": tracking with base " << used << "\n";
    return 0;
  });
}

int cmd_track_downstack(int argc, char **argv) {
  if (argc != 2) {
    std::cerr << "usage: gitstack track-downstack <branch>\n";
    return 2;
  }
  const std::string branch = argv[1];

  return gitstack::cli::run("track-downstack", argc, argv, [&](Session &s) {
    std::unique_ptr<gitstack::BaseSelector> selector;
    if (s.interactive()) {
      selector = std::make_unique<gitstack::PromptSelector>(std::cin, std::cout);
    } else {
      selector = std::make_unique<gitstack::NonInteractiveSelector>();
    }
    const auto added = s.service().track_downstack(branch, *selector);
    for (const auto &b : added) {
      std::cout << b.name << ": tracking with base " << b.base << "\n";
    }
    return 0;
  });
}

int cmd_untrack(int argc, char **argv) {
  if (argc != 2) {
    std::cerr << "usage: gitstack untrack <branch>\n";
    return 2;
  }
  const std::string branch = argv[1];

  return gitstack::cli::run("untrack", argc, argv, [&](Session &s) {
    s.service().forget_branch(branch);
    std::cout << branch << ": no longer tracked\n";
    return 0;
  });
}

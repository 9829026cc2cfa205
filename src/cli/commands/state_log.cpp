#include "cli/session.hpp"

#include <iostream>

int cmd_state_log(int argc, char **argv) {
  if (argc != 1) {
    std::cerr << "usage: gitstack state-log\n";
    return 2;
  }

  return gitstack::cli::run("state-log", argc, argv, [&](gitstack::cli::Session &s) {
    for (const auto &message : s.store().history()) {
      std::cout << message << "\n";
    }
    return 0;
  });
}

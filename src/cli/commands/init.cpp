#include "cli/session.hpp"

#include <iostream>
#include <string>

int cmd_init(int argc, char **argv) {
  std::string trunk;
  std::string remote;
  bool reset = false;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--reset") {
      reset = true;
    } else if (trunk.empty()) {
      trunk = arg;
    } else if (remote.empty()) {
      remote = arg;
    } else {
      trunk.clear();
      break;
    }
  }
  if (trunk.empty()) {
    std::cerr << "usage: gitstack init <trunk> [remote] [--reset]\n";
    return 2;
  }

  try {
    const auto session = gitstack::cli::Session::init(trunk, remote, reset);
    std::cout << "Initialized gitstack with trunk " << trunk;
    if (!remote.empty()) {
      std::cout << " and remote " << remote;
    }
    std::cout << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "init: " << e.what() << "\n";
    return 1;
  }
}

#include "cli/session.hpp"

#include <iostream>
#include <string>

int cmd_rename(int argc, char **argv) {
  if (argc != 3) {
    std::cerr << "usage: gitstack rename <old> <new>\n";
    return 2;
  }
  const std::string old_name = argv[1];
  const std::string new_name = argv[2];

  return gitstack::cli::run("rename", argc, argv, [&](gitstack::cli::Session &s) {
    s.service().rename_branch(old_name, new_name);
    std::cout << "renamed " << old_name << " to " << new_name << "\n";
    return 0;
  });
}

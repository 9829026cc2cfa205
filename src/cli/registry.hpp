#pragma once
#include "cli/command.hpp"

#include <string>
#include <vector>

namespace gitstack::cli {

void register_command(const std::string &name, command_fn fn, const std::string &help);
command_fn find_command(const std::string &name);
void print_usage();

// Run a registered command from an argument vector (args[0] is the command name).
// Returns 2 for unknown commands.
int dispatch(const std::vector<std::string> &args);

// implemented in register_commands.cpp
void register_all_commands();

} // namespace gitstack::cli

#include "cli/registry.hpp"

#include <iostream>
#include <map>

namespace gitstack::cli {

struct entry {
  command_fn fn;
  std::string help;
};
static std::map<std::string, entry> &table() {
  static std::map<std::string, entry> t;
  return t;
}

void register_command(const std::string &name, command_fn fn, const std::string &help) {
  table()[name] = entry{.fn = fn, .help = help};
}

command_fn find_command(const std::string &name) {
  const auto it = table().find(name);
  return it == table().end() ? nullptr : it->second.fn;
}

void print_usage() {
  std::cerr << "usage: gitstack <command> [args]\n\n";
  std::cerr << "commands:\n";
  for (auto &[name, e] : table()) {
    std::cerr << "  " << name << "  " << e.help << "\n";
  }
}

int dispatch(const std::vector<std::string> &args) {
  if (args.empty()) {
    print_usage();
    return 2;
  }
  const auto fn = find_command(args.front());
  if (!fn) {
    std::cerr << "unknown command: " << args.front() << "\n";
    return 2;
  }
  // Commands take a mutable argv like main() does.
  std::vector<std::string> storage(args);
  std::vector<char *> argv;
  argv.reserve(storage.size() + 1);
  for (auto &arg : storage) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);
  return fn(static_cast<int>(storage.size()), argv.data());
}

} // namespace gitstack::cli

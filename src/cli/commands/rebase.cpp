#include "cli/registry.hpp"
#include "cli/session.hpp"

#include "gitstack/util.hpp"

#include <iostream>
#include <string>
#include <vector>

using gitstack::cli::Session;

int cmd_rebase_continue(int argc, char **argv) {
  if (argc != 1) {
    std::cerr << "usage: gitstack rebase-continue\n";
    return 2;
  }

  return gitstack::cli::run("rebase-continue", argc, argv, [&](Session &s) {
    std::vector<gitstack::state::Continuation> conts;
    try {
      conts = s.service().rebase_continue();
    } catch (const gitstack::RebaseInterruptedError &) {
      s.log()->error("There are more conflicts to resolve.\n"
                     "Resolve them and run the following command again:\n"
                     "  gitstack rebase-continue\n"
                     "To abort the remaining operations run:\n"
                     "  gitstack rebase-abort");
      // Recorded continuations stay for the next attempt.
      return 1;
    }

    for (std::size_t idx = 0; idx < conts.size(); ++idx) {
      const auto &cont = conts[idx];
      s.log()->debug("resuming {} on {}", gitstack::strutil::join(cont.command, " "), cont.branch);
      (void)s.repo().run({"checkout", "--quiet", cont.branch});

      if (const int rc = gitstack::cli::dispatch(cont.command); rc != 0) {
        // The failed command recorded its own continuation; keep the rest after it.
        s.store().append_continuations(
            "rebase continue",
            std::vector<gitstack::state::Continuation>(conts.begin() + static_cast<long>(idx) + 1,
                                                       conts.end()));
        return rc;
      }
    }
    return 0;
  });
}

int cmd_rebase_abort(int argc, char **argv) {
  if (argc != 1) {
    std::cerr << "usage: gitstack rebase-abort\n";
    return 2;
  }

  return gitstack::cli::run("rebase-abort", argc, argv, [&](Session &s) {
    s.service().rebase_abort();
    return 0;
  });
}

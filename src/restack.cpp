#include "gitstack/service.hpp"

#include "gitstack/util.hpp"

#include <algorithm>
#include <set>

namespace gitstack {

void Service::verify_restacked(std::string_view name) {
  const auto b = lookup_branch(name);

  std::string base_hash;
  try {
    base_hash = repo_.peel_to_commit(b.base);
  } catch (const NotExistError &) {
    throw Error("base branch " + b.base + " does not exist");
  }

  if (!repo_.is_ancestor(base_hash, b.head)) {
    throw NeedsRestackError(b.base, base_hash);
  }

  // Already on top of base, possibly with a stale recorded hash.
  if (b.base_hash == base_hash) {
    return;
  }
  log_->debug("{}: updating recorded hash of {}", name, b.base);
  try {
    auto tx = store_.begin_branch_tx();
    tx.upsert(state::UpsertRequest{.name = std::string(name), .base_hash = base_hash});
    tx.commit(std::string(name) + ": branch was restacked externally");
  } catch (const Error &e) {
    log_->warn("{}: failed to update recorded base hash: {}", name, e.what());
  }
}

RestackResponse Service::restack(std::string_view name) {
  const auto b = lookup_branch(name);

  std::string onto;
  try {
    verify_restacked(name);
    return RestackResponse{
        .branch = std::string(name),
        .base = b.base,
        .status = RestackStatus::already_restacked,
    };
  } catch (const NeedsRestackError &e) {
    onto = e.base_hash();
  }

  std::string upstream = b.base_hash;
  // The recorded hash is not below the branch when the branch was rewritten
  // elsewhere; fall back to where it forked from its base.
  if (upstream.empty() || !repo_.is_ancestor(upstream, b.head)) {
    try {
      auto fork = repo_.fork_point(b.base, name);
      if (fork != upstream) {
        log_->debug("{}: recorded base hash is out of date, restacking from fork point {}", name,
                    short_hash(fork));
      }
      upstream = std::move(fork);
    } catch (const GitError &e) {
      if (upstream.empty()) {
        throw;
      }
      log_->debug("{}: no fork point with {}: {}", name, b.base, e.what());
    }
  }

  repo_.rebase(RebaseRequest{
      .branch = std::string(name),
      .upstream = upstream,
      .onto = onto,
      .autostash = true,
      .quiet = true,
  });

  auto tx = store_.begin_branch_tx();
  tx.upsert(state::UpsertRequest{.name = std::string(name), .base_hash = onto});
  tx.commit(std::string(name) + ": restacked on " + b.base);

  return RestackResponse{.branch = std::string(name), .base = b.base};
}

std::vector<RestackResponse> Service::restack_upstack(std::string_view name) {
  std::vector<RestackResponse> out;
  for (const auto &branch : list_upstack(name)) {
    if (branch == store_.trunk()) {
      continue;
    }
    out.push_back(restack(branch));
  }
  return out;
}

void Service::branch_onto(const BranchOntoRequest &req) {
  if (req.branch == store_.trunk()) {
    throw TrunkError();
  }
  const auto branch = lookup_branch(req.branch);

  std::string onto_hash;
  if (req.onto == store_.trunk()) {
    onto_hash = repo_.peel_to_commit(req.onto);
  } else {
    // Non-trunk targets must be tracked.
    onto_hash = lookup_branch(req.onto).head;
  }

  // Commits base_hash..head move onto onto_hash. If base_hash is already
  // reachable from onto_hash, an earlier attempt stopped on a conflict that
  // was resolved since; replaying from onto_hash only updates the state.
  std::string from = branch.base_hash;
  if (repo_.is_ancestor(from, onto_hash)) {
    from = onto_hash;
  }
  log_->debug("{}: moving {}..{} from {} onto {}", req.branch, short_hash(from),
              short_hash(branch.head), branch.base, req.onto);

  auto tx = store_.begin_branch_tx();
  tx.upsert(state::UpsertRequest{
      .name = req.branch,
      .base = req.onto,
      .base_hash = onto_hash,
      .merged_downstack = req.merged_downstack,
  });

  repo_.rebase(RebaseRequest{
      .branch = req.branch,
      .upstream = from,
      .onto = onto_hash,
      .autostash = true,
      .quiet = true,
  });

  tx.commit(req.branch + ": onto " + req.onto);
}

std::vector<std::string> Service::stack_edit(const std::vector<std::string> &stack,
                                             const std::vector<std::string> &new_order) {
  if (stack.empty()) {
    throw Error("stack is empty");
  }
  if (std::ranges::find(stack, store_.trunk()) != stack.end()) {
    throw TrunkError();
  }
  if (new_order.empty()) {
    throw StackEditAbortedError();
  }

  std::set<std::string, std::less<>> originals(stack.begin(), stack.end());
  for (const auto &name : new_order) {
    if (originals.erase(name) == 0) {
      throw Error("branch " + name + " not in the original list, or is duplicated");
    }
  }

  const auto &bottom_name = stack.front();
  const auto bottom = lookup_branch(bottom_name);

  std::string base = bottom.base;
  for (std::size_t idx = 0; idx < new_order.size(); ++idx) {
    const auto &branch = new_order[idx];
    BranchOntoRequest req{.branch = branch, .onto = base};

    // Merged history belongs to whichever branch sits at the bottom.
    if (!bottom.merged_downstack.empty()) {
      if (idx == 0 && branch != bottom_name) {
        req.merged_downstack = bottom.merged_downstack;
      }
      if (idx > 0 && branch == bottom_name) {
        req.merged_downstack = std::vector<std::string>{};
      }
    }

    branch_onto(req);
    base = branch;
  }
  return new_order;
}

void Service::rebase_rescue(const RebaseInterruptedError &err, const RebaseRescueRequest &req) {
  switch (err.kind()) {
  case RebaseInterruptKind::conflict:
    log_->error("There was a conflict while rebasing {}.\n"
                "Resolve the conflict and run:\n"
                "  gitstack rebase-continue\n"
                "Or abort the operation with:\n"
                "  gitstack rebase-abort",
                err.branch());
    break;
  case RebaseInterruptKind::deliberate:
    log_->info("The rebase of {} stopped on an 'edit' or 'break' instruction.\n"
               "When you're ready to continue, run:\n"
               "  gitstack rebase-continue\n"
               "Or abort the operation with:\n"
               "  gitstack rebase-abort",
               err.branch());
    break;
  }

  if (req.command.empty()) {
    return;
  }
  const auto branch = req.branch.empty() ? err.branch() : req.branch;
  store_.append_continuations(
      req.message.empty() ? "interrupted: branch " + branch : req.message,
      {state::Continuation{.command = req.command, .branch = branch}});
}

std::vector<state::Continuation> Service::rebase_continue() {
  repo_.rebase_continue();
  // Grab the whole list; a continuation that is interrupted again
  // records its own continuation.
  return store_.take_continuations("rebase continue");
}

void Service::rebase_abort() {
  const auto dropped = store_.take_continuations("rebase abort");
  if (!dropped.empty()) {
    log_->debug("dropped {} pending continuations", dropped.size());
  }
  repo_.rebase_abort();
}

} // namespace gitstack

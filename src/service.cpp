#include "gitstack/service.hpp"

#include "gitstack/util.hpp"

#include <algorithm>
#include <map>

namespace gitstack {

Service::Service(GitRepository &repo, state::Store &store, const forge::Registry &forges,
                 log::logger_t logger)
    : repo_(repo), store_(store), forges_(forges), log_(log::or_null(std::move(logger))) {}

LookupBranchResponse Service::lookup_branch(std::string_view name) {
  std::optional<state::LookupResponse> stored;
  try {
    stored = store_.lookup_branch(name);
  } catch (const NotTrackedError &) {
    // handled below
  }

  std::optional<std::string> head;
  try {
    head = repo_.peel_to_commit(name);
  } catch (const NotExistError &) {
    // handled below
  }

  // stored | head | result
  // -------|------|-------
  // yes    | yes  | tracked branch
  // yes    | no   | deleted out of band
  // no     | yes  | not tracked
  // no     | no   | does not exist
  if (!head) {
    if (stored) {
      throw DeletedBranchError(std::string(name), stored->base, stored->base_hash);
    }
    throw NotExistError(std::string(name));
  }
  if (!stored) {
    throw NotTrackedError(std::string(name));
  }

  LookupBranchResponse out{
      .base = std::move(stored->base),
      .base_hash = std::move(stored->base_hash),
      .head = std::move(*head),
      .upstream = std::move(stored->upstream),
      .change = nullptr,
      .merged_downstack = std::move(stored->merged_downstack),
  };

  if (const auto &change = stored->change) {
    const auto *f = forges_.lookup(change->forge);
    if (f == nullptr) {
      log_->warn("{}: change metadata from unknown forge {} ignored", name, change->forge);
    } else {
      try {
        out.change = f->unmarshal_change_metadata(change->payload);
      } catch (const Error &e) {
        log_->warn("{}: corrupt change metadata '{}': {}", name, change->payload, e.what());
      }
    }
  }
  return out;
}

std::vector<LoadBranchItem> Service::load_branches() {
  std::vector<LoadBranchItem> items;
  std::map<std::string, DeletedBranchError> deleted;

  for (const auto &name : store_.list_branches()) {
    try {
      auto b = lookup_branch(name);
      items.push_back(LoadBranchItem{
          .name = name,
          .head = std::move(b.head),
          .base = std::move(b.base),
          .base_hash = std::move(b.base_hash),
          .change = std::move(b.change),
          .upstream = std::move(b.upstream),
          .merged_downstack = std::move(b.merged_downstack),
      });
    } catch (const DeletedBranchError &e) {
      log_->info("{}: removing...", e.what());
      deleted.emplace(name, e);
    }
  }

  std::ranges::sort(items, {}, &LoadBranchItem::name);
  if (deleted.empty()) {
    return items;
  }

  auto tx = store_.begin_branch_tx();

  // Point branches above deleted ones at the first base that still exists.
  for (auto &item : items) {
    std::string base = item.base;
    std::string base_hash = item.base_hash;
    for (auto it = deleted.find(base); it != deleted.end(); it = deleted.find(base)) {
      base = it->second.base();
      base_hash = it->second.base_hash();
    }
    if (base == item.base) {
      continue;
    }
    try {
      tx.upsert(state::UpsertRequest{.name = item.name, .base = base, .base_hash = base_hash});
    } catch (const Error &e) {
      log_->warn("{}: could not move onto {}: {}", item.name, base, e.what());
      continue;
    }
    item.base = std::move(base);
    item.base_hash = std::move(base_hash);
  }

  // Deleted branches may sit on each other; remove the upper ones first.
  std::vector<std::string> pending;
  for (const auto &[name, err] : deleted) {
    pending.push_back(name);
  }
  std::map<std::string, std::string> failures;
  for (bool progress = true; progress && !pending.empty();) {
    progress = false;
    std::vector<std::string> left;
    for (auto &name : pending) {
      try {
        tx.remove(name);
        progress = true;
        failures.erase(name);
      } catch (const Error &e) {
        failures[name] = e.what();
        left.push_back(std::move(name));
      }
    }
    pending = std::move(left);
  }
  for (const auto &[name, why] : failures) {
    log_->warn("{}: unable to stop tracking: {}", name, why);
  }

  try {
    tx.commit("clean up deleted branches");
  } catch (const Error &e) {
    log_->warn("error cleaning up after deleted branches: {}", e.what());
  }
  return items;
}

BranchGraph Service::branch_graph() { return BranchGraph{*this}; }

std::vector<std::string> Service::list_above(std::string_view base) {
  return branch_graph().aboves(base);
}

std::vector<std::string> Service::list_upstack(std::string_view start) {
  return branch_graph().upstack(start);
}

std::vector<std::string> Service::list_downstack(std::string_view start) {
  return branch_graph().downstack(start);
}

std::vector<std::string> Service::list_stack(std::string_view branch) {
  return branch_graph().stack(branch);
}

void Service::forget_branch(std::string_view name) {
  // The branch may already be gone from the repository; only the store matters here.
  std::optional<state::LookupResponse> branch;
  try {
    branch = store_.lookup_branch(name);
  } catch (const NotTrackedError &) {
    return;
  }

  auto tx = store_.begin_branch_tx();
  for (const auto &candidate : store_.list_branches()) {
    if (candidate == name) {
      continue;
    }
    if (store_.lookup_branch(candidate).base != name) {
      continue;
    }
    tx.upsert(state::UpsertRequest{
        .name = candidate,
        .base = branch->base,
        .base_hash = branch->base_hash,
    });
  }
  tx.remove(name);
  tx.commit("untrack branch " + std::string(name));
}

void Service::rename_branch(std::string_view old_name, std::string_view new_name) {
  auto old_branch = lookup_branch(old_name);

  bool taken = true;
  try {
    (void)repo_.peel_to_commit(new_name);
  } catch (const NotExistError &) {
    taken = false;
  }
  if (taken) {
    throw Error("branch " + std::string(new_name) + " already exists");
  }

  const auto aboves = list_above(old_name);

  std::optional<state::ChangeState> change;
  if (const auto &md = old_branch.change) {
    if (const auto *f = forges_.lookup(md->forge_id())) {
      change = state::ChangeState{.forge = f->id(), .payload = f->marshal_change_metadata(*md)};
    }
  }

  auto tx = store_.begin_branch_tx();
  tx.upsert(state::UpsertRequest{
      .name = std::string(new_name),
      .base = old_branch.base,
      .base_hash = old_branch.base_hash,
      .change = std::move(change),
      .upstream = old_branch.upstream,
      .merged_downstack = old_branch.merged_downstack,
  });
  for (const auto &above : aboves) {
    tx.upsert(state::UpsertRequest{.name = above, .base = std::string(new_name)});
  }
  tx.remove(old_name);

  // Everything is staged and validated; the store follows the repository.
  repo_.rename_branch(old_name, new_name);
  tx.commit("rename " + std::string(old_name) + " to " + std::string(new_name));
}

} // namespace gitstack

#include "gitstack/service.hpp"

#include "gitstack/util.hpp"

#include <algorithm>
#include <map>
#include <set>

namespace gitstack {

// First tracked branch whose head lies between `name` and trunk.
std::string Service::guess_base(std::string_view name) {
  const auto tracked = store_.list_branches();
  if (tracked.empty()) {
    return store_.trunk();
  }

  // Heads are resolved lazily; most walks stop after a few commits.
  std::map<std::string, std::optional<std::string>, std::less<>> heads;
  const auto head_of = [&](const std::string &branch) -> const std::optional<std::string> & {
    auto it = heads.find(branch);
    if (it == heads.end()) {
      std::optional<std::string> hash;
      try {
        hash = repo_.peel_to_commit(branch);
      } catch (const NotExistError &) {
        // deleted out of band; never matches
      }
      it = heads.emplace(branch, std::move(hash)).first;
    }
    return it->second;
  };

  const auto branch_hash = repo_.peel_to_commit(name);
  const auto trunk_hash = repo_.peel_to_commit(store_.trunk());

  auto commits = repo_.list_commits(branch_hash, trunk_hash);
  while (const auto commit = commits->next()) {
    for (const auto &candidate : tracked) {
      if (candidate == name) {
        continue;
      }
      if (const auto &h = head_of(candidate); h && *h == *commit) {
        return candidate;
      }
    }
  }
  return store_.trunk();
}

std::string Service::track_branch(std::string_view name, std::string_view base_name) {
  if (name.empty()) {
    throw Error("branch name is required");
  }
  if (name == store_.trunk()) {
    throw TrunkError();
  }
  // Throws NotExistError for unknown branches.
  (void)repo_.peel_to_commit(name);

  std::string base(base_name);
  if (base.empty()) {
    log_->debug("{}: looking for base branch", name);
    try {
      base = guess_base(name);
    } catch (const Error &e) {
      log_->warn("{}: could not guess base branch, using trunk: {}", name, e.what());
      base = store_.trunk();
    }
    log_->info("{}: using base branch: {}", name, base);
  }

  const auto base_hash = repo_.peel_to_commit(base);

  auto tx = store_.begin_branch_tx();
  tx.upsert(state::UpsertRequest{.name = std::string(name), .base = base, .base_hash = base_hash});
  tx.commit("track " + std::string(name) + " with base " + base);
  log_->info("{}: tracking with base {}", name, base);

  try {
    verify_restacked(name);
  } catch (const NeedsRestackError &) {
    log_->info("{}: branch is behind its base and needs to be restacked.", name);
    log_->info("{}: run 'gitstack restack {}' to restack it", name, name);
  } catch (const Error &e) {
    log_->warn("{}: stack state verification failed: {}", name, e.what());
  }
  return base;
}

std::vector<BranchToTrack> Service::track_downstack(std::string_view name,
                                                    BaseSelector &selector) {
  if (name.empty()) {
    throw Error("branch name is required");
  }
  if (name == store_.trunk()) {
    throw TrunkError();
  }

  const auto names = store_.list_branches();
  std::set<std::string, std::less<>> tracked(names.begin(), names.end());
  if (tracked.contains(name)) {
    log_->info("{}: branch is already tracked", name);
    return {};
  }

  DownstackDiscoverer discoverer{repo_, store_.trunk(), std::move(tracked), selector, log_};
  auto found = discoverer.discover(name);
  if (found.empty()) {
    throw Error("no branches to track found in downstack of " + std::string(name));
  }

  // Bases go in before the branches that sit on them.
  std::ranges::reverse(found);

  auto tx = store_.begin_branch_tx();
  for (const auto &b : found) {
    tx.upsert(state::UpsertRequest{.name = b.name, .base = b.base, .base_hash = b.base_hash});
    log_->info("{}: tracking with base {}", b.name, b.base);
  }
  tx.commit("track downstack from " + std::string(name) + " (" + std::to_string(found.size()) +
            " branches)");
  log_->info("{} branches added", found.size());
  return found;
}

} // namespace gitstack

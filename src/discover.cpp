#include "gitstack/discover.hpp"

#include "gitstack/errors.hpp"
#include "gitstack/util.hpp"

#include <algorithm>
#include <iostream>
#include <string>

namespace gitstack {

std::optional<std::string> NonInteractiveSelector::select_base(
    std::string_view branch, std::string_view commit, const std::vector<std::string> &candidates,
    const std::vector<std::string> & /*selected*/) {
  if (candidates.size() > 1) {
    throw AmbiguousBaseError(std::string(branch), std::string(commit), candidates);
  }
  if (candidates.empty()) {
    return std::nullopt;
  }
  return candidates.front();
}

std::optional<std::string> PromptSelector::select_base(std::string_view branch,
                                                       std::string_view commit,
                                                       const std::vector<std::string> &candidates,
                                                       const std::vector<std::string> &selected) {
  out_ << "Found branch " << candidates.front() << " at commit " << short_hash(commit)
       << " downstack from " << branch << ".\n";
  if (!selected.empty()) {
    out_ << "Branches already selected at this commit: " << strutil::join(selected, " -> ")
         << "\n";
  }
  out_ << "Track " << branch << " with base:\n";
  for (std::size_t i = 0; i < candidates.size(); ++i) {
    out_ << "  " << (i + 1) << ") " << candidates[i] << "\n";
  }
  out_ << "  0) None of these\n";

  for (;;) {
    out_ << "> " << std::flush;
    std::string line;
    if (!std::getline(in_, line)) {
      throw Error("no base selected for " + std::string(branch));
    }
    const auto answer = strutil::trim(line);
    std::size_t pos = 0;
    unsigned long choice = 0;
    try {
      choice = std::stoul(answer, &pos);
    } catch (const std::logic_error &) {
      pos = 0;
    }
    if (pos == 0 || pos != answer.size() || choice > candidates.size()) {
      out_ << "enter a number between 0 and " << candidates.size() << "\n";
      continue;
    }
    if (choice == 0) {
      return std::nullopt;
    }
    return candidates[choice - 1];
  }
}

DownstackDiscoverer::DownstackDiscoverer(GitRepository &repo, std::string trunk,
                                         std::set<std::string, std::less<>> tracked,
                                         BaseSelector &selector, log::logger_t logger)
    : repo_(repo), selector_(selector), log_(log::or_null(std::move(logger))),
      trunk_(std::move(trunk)), tracked_(std::move(tracked)) {
  for (auto &b : repo_.local_branches()) {
    branches_by_hash_[b.hash].push_back(b.name);
    branch_hashes_.emplace(std::move(b.name), std::move(b.hash));
  }
  const auto it = branch_hashes_.find(trunk_);
  if (it == branch_hashes_.end()) {
    throw NotExistError(trunk_);
  }
  trunk_hash_ = it->second;
}

bool DownstackDiscoverer::should_stop(std::string_view name) const {
  return name == trunk_ || tracked_.contains(name);
}

std::vector<std::string> DownstackDiscoverer::select_branches(std::vector<std::string> candidates,
                                                              const std::string &branch,
                                                              const std::string &commit) {
  std::vector<std::string> ordered;
  std::string head = branch;
  while (!candidates.empty()) {
    auto chosen = selector_.select_base(head, commit, candidates, ordered);
    if (!chosen) {
      break;
    }
    if (std::ranges::find(candidates, *chosen) == candidates.end()) {
      throw Error("selected base " + *chosen + " is not a candidate at " + short_hash(commit));
    }
    std::erase(candidates, *chosen);
    ordered.push_back(*chosen);
    head = std::move(*chosen);
    if (should_stop(head)) {
      break;
    }
  }
  return ordered;
}

std::vector<BranchToTrack> DownstackDiscoverer::discover(std::string_view branch) {
  const auto start = branch_hashes_.find(branch);
  if (start == branch_hashes_.end()) {
    throw NotExistError(std::string(branch));
  }

  std::vector<BranchToTrack> result;
  std::set<std::string, std::less<>> planned;
  std::string next(branch);

  auto commits = repo_.list_commits(start->second, trunk_hash_);
  while (auto commit = commits->next()) {
    std::vector<std::string> here;
    if (const auto it = branches_by_hash_.find(*commit); it != branches_by_hash_.end()) {
      for (const auto &name : it->second) {
        if (name != next) {
          here.push_back(name);
        }
      }
    }
    if (here.empty()) {
      continue;
    }
    std::ranges::sort(here);

    for (auto &base : select_branches(std::move(here), next, *commit)) {
      log_->debug("{}: base {} at {}", next, base, short_hash(*commit));
      result.push_back(BranchToTrack{.name = next, .base = base, .base_hash = *commit});
      planned.insert(next);
      if (should_stop(base)) {
        return result;
      }
      next = std::move(base);
    }
  }

  // Nothing below `next` before trunk.
  if (!planned.contains(next)) {
    result.push_back(BranchToTrack{.name = next, .base = trunk_, .base_hash = trunk_hash_});
  }
  return result;
}

} // namespace gitstack
